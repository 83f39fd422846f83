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

#ifndef _ONTOQUAY_EXPRESSION_H_
#define _ONTOQUAY_EXPRESSION_H_

#include "../Node.h"

#include <QSharedPointer>
#include <QList>
#include <QStringList>

namespace Ontoquay
{

class Expression;
typedef QSharedPointer<Expression> ExpressionPtr;
typedef QList<ExpressionPtr> ExpressionList;

class GroupPattern;
typedef QSharedPointer<GroupPattern> GroupPatternPtr;

/**
 * \class Expression Expression.h <ontoquay/query/Expression.h>
 *
 * Immutable expression tree, as found in FILTER, BIND, projections,
 * GROUP BY and ORDER BY.  Expressions are constructed through the
 * static factory functions and shared by pointer; they are evaluated
 * by ExpressionEvaluator.
 */
class Expression
{
public:
    enum Type {
        Variable,
        Constant,
        Or,
        And,
        Not,
        Equal,
        NotEqual,
        Less,
        Greater,
        LessOrEqual,
        GreaterOrEqual,
        FunctionCall,
        Exists,
        NotExists,
        Aggregate
    };

    enum Function {
        Regex,
        IsBlank,
        IsUri,
        IsLiteral,
        Bound,
        Str,
        Concat,
        Iri,
        If,
        StrAfter,
        StrBefore,
        StrStarts,
        StrEnds,
        Contains,
        Replace,
        LCase,
        UCase,
        StrLen,
        Lang,
        Datatype,
        Coalesce,
        SameTerm
    };

    enum AggregateFunction {
        Count,
        Sum,
        Min,
        Max,
        Sample,
        GroupConcat
    };

    static ExpressionPtr variable(QString name);
    static ExpressionPtr constant(Node value);
    static ExpressionPtr unary(Type type, ExpressionPtr operand);
    static ExpressionPtr binary(Type type, ExpressionPtr left, ExpressionPtr right);
    static ExpressionPtr function(Function f, ExpressionList args);
    static ExpressionPtr exists(GroupPatternPtr pattern, bool negated);

    /**
     * Construct an aggregate.  A null argument means COUNT(*).  The
     * separator is used only by GROUP_CONCAT.
     */
    static ExpressionPtr aggregate(AggregateFunction f, ExpressionPtr arg,
                                   bool distinct, QString separator = " ");

    /**
     * Look up a function by its (case-insensitive) name in query
     * text.  Return false if the name is not a known function.
     */
    static bool functionByName(QString name, Function &f);

    /**
     * Return the acceptable argument counts for a function.
     * A maximum of -1 means unlimited.
     */
    static void getArity(Function f, int &minArgs, int &maxArgs);

    static bool aggregateByName(QString name, AggregateFunction &f);

    Type getType() const { return m_type; }
    QString getVariable() const { return m_variable; }
    Node getConstant() const { return m_constant; }
    Function getFunction() const { return m_function; }
    AggregateFunction getAggregateFunction() const { return m_aggregate; }
    const ExpressionList &getArguments() const { return m_args; }
    GroupPatternPtr getPattern() const { return m_pattern; }
    bool isDistinct() const { return m_distinct; }
    QString getSeparator() const { return m_separator; }

    /**
     * Return true if this expression is or contains an aggregate.
     */
    bool containsAggregate() const;

    /**
     * Append every aggregate sub-expression, outermost first, to the
     * given list.  Aggregates are not nested.
     */
    void collectAggregates(QList<const Expression *> &out) const;

    /**
     * Append the names of the variables this expression refers to,
     * outside any EXISTS pattern, to the given list.
     */
    void collectVariables(QStringList &out) const;

    QString toString() const;

private:
    Expression(Type t) :
        m_type(t), m_function(Regex), m_aggregate(Count), m_distinct(false) { }

    Type m_type;
    QString m_variable;
    Node m_constant;
    Function m_function;
    AggregateFunction m_aggregate;
    ExpressionList m_args;
    GroupPatternPtr m_pattern;
    bool m_distinct;
    QString m_separator;
};

}

#endif
