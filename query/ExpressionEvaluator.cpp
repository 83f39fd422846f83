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

#include "ExpressionEvaluator.h"
#include "Pattern.h"

#include "../RDFException.h"
#include "../Debug.h"

#include <cmath>

namespace Ontoquay
{

static const QString rdfLangString
("http://www.w3.org/1999/02/22-rdf-syntax-ns#langString");

// A "string literal" here is a plain literal, with or without a
// language tag (xsd:string literals are normalised to plain ones)
static bool
isStringLiteral(const Node &n)
{
    return n.type == Node::Literal && n.datatype.isEmpty();
}

static Node
stringLike(const Node &like, QString value)
{
    if (like.language != "") return Node::languageLiteral(value, like.language);
    return Node(Node::Literal, value);
}

// Arguments of the two-string functions (STRSTARTS and friends) must
// be string literals, and the second must not carry a language tag
// that differs from the first's
static bool
argumentsCompatible(const Node &a, const Node &b)
{
    if (!isStringLiteral(a) || !isStringLiteral(b)) return false;
    if (b.language == "") return true;
    return a.language == b.language;
}

static QString
convertReplacement(QString s)
{
    // $n back-references become \n, as QString::replace expects
    QString out;
    for (int i = 0; i < s.length(); ++i) {
        QChar c = s[i];
        if (c == '$' && i + 1 < s.length() && s[i+1].isDigit()) {
            out += '\\';
            continue;
        }
        if (c == '\\' && i + 1 < s.length() &&
            (s[i+1] == '$' || s[i+1] == '\\')) {
            out += s[i+1];
            ++i;
            continue;
        }
        out += c;
    }
    return out;
}

ExpressionEvaluator::ExpressionEvaluator(const ExistsHandler *handler,
                                         const AggregateValues *aggregates) :
    m_handler(handler),
    m_aggregates(aggregates)
{
}

Node
ExpressionEvaluator::booleanNode(bool b)
{
    return Node(Node::Literal, b ? "true" : "false",
                Node::xsdDatatype("boolean"));
}

bool
ExpressionEvaluator::effectiveBooleanValue(const Node &n, bool &ok)
{
    ok = true;
    if (n.type != Node::Literal) {
        ok = false;
        return false;
    }
    if (n.datatype.isEmpty()) {
        return n.value != "";
    }
    if (n.datatype == Node::xsdDatatype("boolean")) {
        return n.value == "true" || n.value == "1";
    }
    if (n.isNumeric()) {
        bool numeric = false;
        double d = n.value.toDouble(&numeric);
        if (!numeric) return false;
        return d != 0.0 && !std::isnan(d);
    }
    ok = false;
    return false;
}

bool
ExpressionEvaluator::test(const Expression &e, const Dictionary &d) const
{
    Node n = evaluate(e, d);
    bool ok = false;
    bool result = effectiveBooleanValue(n, ok);
    return ok && result;
}

int
ExpressionEvaluator::compare(const Node &a, const Node &b)
{
    static const int rank[] = { 0, 2, 3, 1 }; // Nothing, URI, Literal, Blank

    if (a.type != b.type) {
        return rank[a.type] - rank[b.type];
    }

    if (a.type == Node::Literal && a.isNumeric() && b.isNumeric()) {
        double da = a.value.toDouble(), db = b.value.toDouble();
        if (da < db) return -1;
        if (da > db) return 1;
    }

    int c = QString::compare(a.value, b.value);
    if (c != 0) return c;
    c = QString::compare(a.datatype.toString(), b.datatype.toString());
    if (c != 0) return c;
    return QString::compare(a.language, b.language);
}

Node
ExpressionEvaluator::evaluate(const Expression &e, const Dictionary &d) const
{
    switch (e.getType()) {

    case Expression::Variable:
        return d.value(e.getVariable());

    case Expression::Constant:
        return e.getConstant();

    case Expression::Or: {
        bool lok = false, rok = false;
        bool l = effectiveBooleanValue(evaluate(*e.getArguments()[0], d), lok);
        if (lok && l) return booleanNode(true);
        bool r = effectiveBooleanValue(evaluate(*e.getArguments()[1], d), rok);
        if (rok && r) return booleanNode(true);
        if (lok && rok) return booleanNode(false);
        return Node();
    }

    case Expression::And: {
        bool lok = false, rok = false;
        bool l = effectiveBooleanValue(evaluate(*e.getArguments()[0], d), lok);
        if (lok && !l) return booleanNode(false);
        bool r = effectiveBooleanValue(evaluate(*e.getArguments()[1], d), rok);
        if (rok && !r) return booleanNode(false);
        if (lok && rok) return booleanNode(true);
        return Node();
    }

    case Expression::Not: {
        bool ok = false;
        bool v = effectiveBooleanValue(evaluate(*e.getArguments()[0], d), ok);
        if (!ok) return Node();
        return booleanNode(!v);
    }

    case Expression::Equal:
    case Expression::NotEqual:
    case Expression::Less:
    case Expression::Greater:
    case Expression::LessOrEqual:
    case Expression::GreaterOrEqual:
        return evaluateComparison(e, d);

    case Expression::FunctionCall:
        return evaluateFunction(e, d);

    case Expression::Exists:
    case Expression::NotExists: {
        if (!m_handler) {
            throw RDFInternalError("No pattern context for EXISTS expression");
        }
        bool found = m_handler->exists(*e.getPattern(), d);
        return booleanNode(e.getType() == Expression::Exists ? found : !found);
    }

    case Expression::Aggregate:
        if (!m_aggregates) return Node();
        return m_aggregates->value(&e);
    }

    return Node();
}

Node
ExpressionEvaluator::evaluateComparison(const Expression &e, const Dictionary &d) const
{
    Node a = evaluate(*e.getArguments()[0], d);
    Node b = evaluate(*e.getArguments()[1], d);
    if (a.type == Node::Nothing || b.type == Node::Nothing) return Node();

    Expression::Type t = e.getType();
    int c = 0;

    if (a.isNumeric() && b.isNumeric()) {
        bool aok = false, bok = false;
        double da = a.value.toDouble(&aok), db = b.value.toDouble(&bok);
        if (!aok || !bok) return Node();
        c = (da < db ? -1 : (da > db ? 1 : 0));
    } else if (t == Expression::Equal || t == Expression::NotEqual) {
        bool eq = (a == b);
        return booleanNode(t == Expression::Equal ? eq : !eq);
    } else if (a.type == Node::Literal && b.type == Node::Literal &&
               a.datatype == b.datatype && a.language == b.language) {
        c = QString::compare(a.value, b.value);
    } else {
        return Node();
    }

    switch (t) {
    case Expression::Equal: return booleanNode(c == 0);
    case Expression::NotEqual: return booleanNode(c != 0);
    case Expression::Less: return booleanNode(c < 0);
    case Expression::Greater: return booleanNode(c > 0);
    case Expression::LessOrEqual: return booleanNode(c <= 0);
    case Expression::GreaterOrEqual: return booleanNode(c >= 0);
    default: break;
    }
    return Node();
}

bool
ExpressionEvaluator::makeRegex(QString pattern, QString flags,
                               QRegularExpression &rx) const
{
    QString key = flags + "/" + pattern;
    if (m_regexCache.contains(key)) {
        rx = m_regexCache.value(key);
        return rx.isValid();
    }

    QRegularExpression::PatternOptions options =
        QRegularExpression::NoPatternOption;
    for (int i = 0; i < flags.length(); ++i) {
        switch (flags[i].toLatin1()) {
        case 'i': options |= QRegularExpression::CaseInsensitiveOption; break;
        case 's': options |= QRegularExpression::DotMatchesEverythingOption; break;
        case 'm': options |= QRegularExpression::MultilineOption; break;
        case 'x': options |= QRegularExpression::ExtendedPatternSyntaxOption; break;
        default:
            DEBUG << "ExpressionEvaluator: unknown regex flag '" << flags[i] << "'";
            return false;
        }
    }

    rx = QRegularExpression(pattern, options);
    if (!rx.isValid()) {
        DEBUG << "ExpressionEvaluator: invalid regex \"" << pattern
              << "\": " << rx.errorString();
    }
    m_regexCache.insert(key, rx);
    return rx.isValid();
}

Node
ExpressionEvaluator::evaluateFunction(const Expression &e, const Dictionary &d) const
{
    const ExpressionList &args = e.getArguments();

    switch (e.getFunction()) {

    case Expression::Bound: {
        if (args[0]->getType() != Expression::Variable) return Node();
        return booleanNode(d.value(args[0]->getVariable()).type != Node::Nothing);
    }

    case Expression::If: {
        bool ok = false;
        bool c = effectiveBooleanValue(evaluate(*args[0], d), ok);
        if (!ok) return Node();
        return evaluate(*args[c ? 1 : 2], d);
    }

    case Expression::Coalesce: {
        foreach (ExpressionPtr a, args) {
            Node n = evaluate(*a, d);
            if (n.type != Node::Nothing) return n;
        }
        return Node();
    }

    default:
        break;
    }

    // The remaining functions are strict: any argument in error makes
    // the call an error
    Nodes values;
    foreach (ExpressionPtr a, args) {
        Node n = evaluate(*a, d);
        if (n.type == Node::Nothing) return Node();
        values.push_back(n);
    }

    switch (e.getFunction()) {

    case Expression::Regex: {
        const Node &text = values[0];
        if (text.type != Node::Literal && text.type != Node::URI) return Node();
        if (!isStringLiteral(values[1])) return Node();
        QString flags;
        if (values.size() > 2) {
            if (!isStringLiteral(values[2])) return Node();
            flags = values[2].value;
        }
        QRegularExpression rx;
        if (!makeRegex(values[1].value, flags, rx)) return Node();
        return booleanNode(rx.match(text.value).hasMatch());
    }

    case Expression::Replace: {
        if (!isStringLiteral(values[0]) || !isStringLiteral(values[1]) ||
            !isStringLiteral(values[2])) return Node();
        QString flags;
        if (values.size() > 3) {
            if (!isStringLiteral(values[3])) return Node();
            flags = values[3].value;
        }
        QRegularExpression rx;
        if (!makeRegex(values[1].value, flags, rx)) return Node();
        QString s = values[0].value;
        s.replace(rx, convertReplacement(values[2].value));
        return stringLike(values[0], s);
    }

    case Expression::IsBlank:
        return booleanNode(values[0].type == Node::Blank);

    case Expression::IsUri:
        return booleanNode(values[0].type == Node::URI);

    case Expression::IsLiteral:
        return booleanNode(values[0].type == Node::Literal);

    case Expression::Str:
        if (values[0].type == Node::URI || values[0].type == Node::Literal) {
            return Node(Node::Literal, values[0].value);
        }
        return Node();

    case Expression::Concat: {
        QString s;
        QString lang;
        bool first = true;
        foreach (const Node &n, values) {
            if (!isStringLiteral(n)) return Node();
            if (first) lang = n.language;
            else if (lang != n.language) lang = "";
            first = false;
            s += n.value;
        }
        if (lang != "") return Node::languageLiteral(s, lang);
        return Node(Node::Literal, s);
    }

    case Expression::Iri:
        if (values[0].type == Node::URI) return values[0];
        if (isStringLiteral(values[0]) && values[0].value != "") {
            return Node(Uri(values[0].value));
        }
        return Node();

    case Expression::StrStarts:
        if (!argumentsCompatible(values[0], values[1])) return Node();
        return booleanNode(values[0].value.startsWith(values[1].value));

    case Expression::StrEnds:
        if (!argumentsCompatible(values[0], values[1])) return Node();
        return booleanNode(values[0].value.endsWith(values[1].value));

    case Expression::Contains:
        if (!argumentsCompatible(values[0], values[1])) return Node();
        return booleanNode(values[0].value.contains(values[1].value));

    case Expression::StrAfter: {
        if (!argumentsCompatible(values[0], values[1])) return Node();
        int ix = values[0].value.indexOf(values[1].value);
        if (ix < 0) return Node(Node::Literal, "");
        return stringLike(values[0], values[0].value.mid(ix + values[1].value.length()));
    }

    case Expression::StrBefore: {
        if (!argumentsCompatible(values[0], values[1])) return Node();
        int ix = values[0].value.indexOf(values[1].value);
        if (ix < 0) return Node(Node::Literal, "");
        return stringLike(values[0], values[0].value.left(ix));
    }

    case Expression::LCase:
        if (!isStringLiteral(values[0])) return Node();
        return stringLike(values[0], values[0].value.toLower());

    case Expression::UCase:
        if (!isStringLiteral(values[0])) return Node();
        return stringLike(values[0], values[0].value.toUpper());

    case Expression::StrLen:
        if (!isStringLiteral(values[0])) return Node();
        return Node::fromVariant(QVariant(values[0].value.length()));

    case Expression::Lang:
        if (values[0].type != Node::Literal) return Node();
        return Node(Node::Literal, values[0].language);

    case Expression::Datatype:
        if (values[0].type != Node::Literal) return Node();
        if (values[0].language != "") return Node(Uri(rdfLangString));
        if (values[0].datatype.isEmpty()) return Node(Node::xsdDatatype("string"));
        return Node(values[0].datatype);

    case Expression::SameTerm:
        return booleanNode(values[0] == values[1]);

    case Expression::Bound:
    case Expression::If:
    case Expression::Coalesce:
        break;
    }

    return Node();
}

}
