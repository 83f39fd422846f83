/* -*- c-basic-offset: 4 indent-tabs-mode: nil -*-  vi:set ts=8 sts=4 sw=4: */

/*
    Ontoquay

    A C++/Qt library for RDF graph pattern matching and rewriting.
    Copyright 2009-2026 Chris Cannam.
  
    Permission is hereby granted, free of charge, to any person
    obtaining a copy of this software and associated documentation
    files (the "Software"), to deal in the Software without
    restriction, including without limitation the rights to use, copy,
    modify, merge, publish, distribute, sublicense, and/or sell copies
    of the Software, and to permit persons to whom the Software is
    furnished to do so, subject to the following conditions:

    The above copyright notice and this permission notice shall be
    included in all copies or substantial portions of the Software.

    THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
    EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
    MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
    NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS BE LIABLE FOR
    ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF
    CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
    WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

    Except as contained in this notice, the name of Chris Cannam
    shall not be used in advertising or otherwise to promote the sale,
    use or other dealings in this Software without prior written
    authorization.
*/

#include "Expression.h"

namespace Ontoquay
{

namespace {

struct FunctionInfo {
    const char *name;
    Expression::Function function;
    int minArgs;
    int maxArgs;
};

const FunctionInfo functions[] = {
    { "regex",     Expression::Regex,     2, 3 },
    { "isblank",   Expression::IsBlank,   1, 1 },
    { "isuri",     Expression::IsUri,     1, 1 },
    { "isiri",     Expression::IsUri,     1, 1 },
    { "isliteral", Expression::IsLiteral, 1, 1 },
    { "bound",     Expression::Bound,     1, 1 },
    { "str",       Expression::Str,       1, 1 },
    { "concat",    Expression::Concat,    0, -1 },
    { "uri",       Expression::Iri,       1, 1 },
    { "iri",       Expression::Iri,       1, 1 },
    { "if",        Expression::If,        3, 3 },
    { "strafter",  Expression::StrAfter,  2, 2 },
    { "strbefore", Expression::StrBefore, 2, 2 },
    { "strstarts", Expression::StrStarts, 2, 2 },
    { "strends",   Expression::StrEnds,   2, 2 },
    { "contains",  Expression::Contains,  2, 2 },
    { "replace",   Expression::Replace,   3, 4 },
    { "lcase",     Expression::LCase,     1, 1 },
    { "ucase",     Expression::UCase,     1, 1 },
    { "strlen",    Expression::StrLen,    1, 1 },
    { "lang",      Expression::Lang,      1, 1 },
    { "datatype",  Expression::Datatype,  1, 1 },
    { "coalesce",  Expression::Coalesce,  1, -1 },
    { "sameterm",  Expression::SameTerm,  2, 2 },
};

const int functionCount = sizeof(functions) / sizeof(functions[0]);

const char *aggregateNames[] = {
    "count", "sum", "min", "max", "sample", "group_concat"
};

QString
functionName(Expression::Function f)
{
    for (int i = 0; i < functionCount; ++i) {
        if (functions[i].function == f) return functions[i].name;
    }
    return "?";
}

QString
operatorName(Expression::Type t)
{
    switch (t) {
    case Expression::Or: return "||";
    case Expression::And: return "&&";
    case Expression::Equal: return "=";
    case Expression::NotEqual: return "!=";
    case Expression::Less: return "<";
    case Expression::Greater: return ">";
    case Expression::LessOrEqual: return "<=";
    case Expression::GreaterOrEqual: return ">=";
    default: return "?";
    }
}

}

ExpressionPtr
Expression::variable(QString name)
{
    ExpressionPtr e(new Expression(Variable));
    e->m_variable = name;
    return e;
}

ExpressionPtr
Expression::constant(Node value)
{
    ExpressionPtr e(new Expression(Constant));
    e->m_constant = value;
    return e;
}

ExpressionPtr
Expression::unary(Type type, ExpressionPtr operand)
{
    ExpressionPtr e(new Expression(type));
    e->m_args.push_back(operand);
    return e;
}

ExpressionPtr
Expression::binary(Type type, ExpressionPtr left, ExpressionPtr right)
{
    ExpressionPtr e(new Expression(type));
    e->m_args.push_back(left);
    e->m_args.push_back(right);
    return e;
}

ExpressionPtr
Expression::function(Function f, ExpressionList args)
{
    ExpressionPtr e(new Expression(FunctionCall));
    e->m_function = f;
    e->m_args = args;
    return e;
}

ExpressionPtr
Expression::exists(GroupPatternPtr pattern, bool negated)
{
    ExpressionPtr e(new Expression(negated ? NotExists : Exists));
    e->m_pattern = pattern;
    return e;
}

ExpressionPtr
Expression::aggregate(AggregateFunction f, ExpressionPtr arg,
                      bool distinct, QString separator)
{
    ExpressionPtr e(new Expression(Aggregate));
    e->m_aggregate = f;
    if (arg) e->m_args.push_back(arg);
    e->m_distinct = distinct;
    e->m_separator = separator;
    return e;
}

bool
Expression::functionByName(QString name, Function &f)
{
    QString lc = name.toLower();
    for (int i = 0; i < functionCount; ++i) {
        if (lc == functions[i].name) {
            f = functions[i].function;
            return true;
        }
    }
    return false;
}

void
Expression::getArity(Function f, int &minArgs, int &maxArgs)
{
    for (int i = 0; i < functionCount; ++i) {
        if (functions[i].function == f) {
            minArgs = functions[i].minArgs;
            maxArgs = functions[i].maxArgs;
            return;
        }
    }
    minArgs = 0;
    maxArgs = -1;
}

bool
Expression::aggregateByName(QString name, AggregateFunction &f)
{
    QString lc = name.toLower();
    for (int i = 0; i <= int(GroupConcat); ++i) {
        if (lc == aggregateNames[i]) {
            f = AggregateFunction(i);
            return true;
        }
    }
    return false;
}

bool
Expression::containsAggregate() const
{
    if (m_type == Aggregate) return true;
    foreach (ExpressionPtr a, m_args) {
        if (a->containsAggregate()) return true;
    }
    return false;
}

void
Expression::collectAggregates(QList<const Expression *> &out) const
{
    if (m_type == Aggregate) {
        out.push_back(this);
        return;
    }
    foreach (ExpressionPtr a, m_args) {
        a->collectAggregates(out);
    }
}

void
Expression::collectVariables(QStringList &out) const
{
    if (m_type == Variable) {
        if (!out.contains(m_variable)) out.push_back(m_variable);
        return;
    }
    foreach (ExpressionPtr a, m_args) {
        a->collectVariables(out);
    }
}

QString
Expression::toString() const
{
    switch (m_type) {

    case Variable:
        return "?" + m_variable;

    case Constant: {
        const Node &n = m_constant;
        if (n.type == Node::URI) return "<" + n.value + ">";
        if (n.type == Node::Blank) return "_:" + n.value;
        QString s = "\"" + n.value + "\"";
        if (n.language != "") s += "@" + n.language;
        else if (!n.datatype.isEmpty()) s += "^^<" + n.datatype.toString() + ">";
        return s;
    }

    case Not:
        return "!" + m_args[0]->toString();

    case Or: case And: case Equal: case NotEqual:
    case Less: case Greater: case LessOrEqual: case GreaterOrEqual:
        return "(" + m_args[0]->toString() + " " + operatorName(m_type) +
            " " + m_args[1]->toString() + ")";

    case FunctionCall: {
        QStringList args;
        foreach (ExpressionPtr a, m_args) args << a->toString();
        return functionName(m_function) + "(" + args.join(", ") + ")";
    }

    case Exists:
        return "EXISTS {...}";

    case NotExists:
        return "NOT EXISTS {...}";

    case Aggregate: {
        QString s = QString(aggregateNames[m_aggregate]).toUpper() + "(";
        if (m_distinct) s += "DISTINCT ";
        if (m_args.empty()) s += "*";
        else s += m_args[0]->toString();
        if (m_aggregate == GroupConcat) {
            s += "; SEPARATOR=\"" + m_separator + "\"";
        }
        return s + ")";
    }
    }

    return QString();
}

}
