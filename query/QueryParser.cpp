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

#include "QueryParser.h"

#include "../RDFException.h"
#include "../Debug.h"

namespace Ontoquay
{

typedef QueryLexer L;

QueryParser::QueryParser(QString text, const PrefixTable &prefixes) :
    m_lexer(text),
    m_text(text),
    m_prefixes(prefixes),
    m_inTemplate(false),
    m_allowAggregates(false),
    m_anonCounter(0)
{
}

QueryParser::~QueryParser()
{
}

void
QueryParser::syntaxError(QString message) const
{
    throw RDFSyntaxError(message, m_lexer.getLine(), m_lexer.getColumn());
}

QString
QueryParser::describeCurrent(L::Token t) const
{
    QString d = L::describe(t);
    QString v = m_lexer.getTokenValue();
    if (v != "" && t != L::String) d += " \"" + v + "\"";
    return d;
}

void
QueryParser::expect(L::Token expected, QString context)
{
    L::Token t = m_lexer.getNext();
    if (t != expected) {
        syntaxError(QString("Expected \"%1\" %2, found %3")
                    .arg(L::describe(expected)).arg(context)
                    .arg(describeCurrent(t)));
    }
}

Query
QueryParser::parse()
{
    Query q;
    q.text = m_text;

    parsePrologue();

    L::Token t = m_lexer.getNext();
    if (t != L::Identifier) {
        syntaxError(QString("Expected SELECT, CONSTRUCT or INSERT, found %1")
                    .arg(describeCurrent(t)));
    }

    if (m_lexer.isKeyword("select")) {
        q.form = Query::SelectQuery;
        parseSelect(q);
    } else if (m_lexer.isKeyword("construct")) {
        q.form = Query::ConstructQuery;
        parseConstruct(q);
    } else if (m_lexer.isKeyword("insert")) {
        q.form = Query::InsertQuery;
        parseInsert(q);
    } else {
        syntaxError(QString("Unsupported query form \"%1\"")
                    .arg(m_lexer.getTokenValue()));
    }

    t = m_lexer.getNext();
    if (t != L::Eof) {
        syntaxError(QString("Unexpected %1 after end of query")
                    .arg(describeCurrent(t)));
    }

    DEBUG << "QueryParser::parse: parsed "
          << (q.form == Query::SelectQuery ? "SELECT" :
              q.form == Query::ConstructQuery ? "CONSTRUCT" : "INSERT")
          << " query with " << q.templateTriples.size()
          << " template triple(s)";

    return q;
}

void
QueryParser::parsePrologue()
{
    while (true) {
        L::Token t = m_lexer.getNext();
        if (t == L::Identifier && m_lexer.isKeyword("base")) {
            expect(L::IRI, "after BASE");
            m_prefixes.setBaseUri(Uri(m_lexer.getTokenValue()));
            continue;
        }
        if (t == L::Identifier && m_lexer.isKeyword("prefix")) {
            t = m_lexer.getNext();
            QString name = m_lexer.getTokenValue();
            if (t != L::PrefixedName || !name.endsWith(':') ||
                name.indexOf(':') != name.length() - 1) {
                syntaxError(QString("Expected prefix name after PREFIX, found %1")
                            .arg(describeCurrent(t)));
            }
            expect(L::IRI, "after prefix name");
            m_prefixes.addPrefix(name.left(name.length() - 1),
                                 resolveIri(m_lexer.getTokenValue()));
            continue;
        }
        m_lexer.unget(t);
        return;
    }
}

void
QueryParser::parseSelect(Query &q)
{
    L::Token t = m_lexer.getNext();
    if (t == L::Identifier &&
        (m_lexer.isKeyword("distinct") || m_lexer.isKeyword("reduced"))) {
        q.distinct = true;
        t = m_lexer.getNext();
    }

    if (t == L::Star) {
        q.selectAll = true;
    } else {
        m_allowAggregates = true;
        while (true) {
            if (t == L::Variable) {
                q.projections.push_back(Projection(m_lexer.getTokenValue()));
            } else if (t == L::LParen) {
                ExpressionPtr e = parseExpression();
                t = m_lexer.getNext();
                if (t != L::Identifier || !m_lexer.isKeyword("as")) {
                    syntaxError(QString("Expected AS in projection, found %1")
                                .arg(describeCurrent(t)));
                }
                QString v = parseVariableName();
                expect(L::RParen, "after projected expression");
                q.projections.push_back(Projection(v, e));
            } else {
                m_lexer.unget(t);
                break;
            }
            t = m_lexer.getNext();
        }
        m_allowAggregates = false;
        if (q.projections.empty()) {
            syntaxError("Expected variables or * after SELECT");
        }
    }

    parseWhere(q);
    parseSolutionModifiers(q, true);
}

void
QueryParser::parseConstruct(Query &q)
{
    q.templateTriples = parseTemplateBlock(PatternTerm());
    parseWhere(q);
    parseSolutionModifiers(q, false);
}

void
QueryParser::parseInsert(Query &q)
{
    L::Token t = m_lexer.getNext();
    bool data = (t == L::Identifier && m_lexer.isKeyword("data"));
    if (!data) m_lexer.unget(t);

    expect(L::LCurly, "to open INSERT template");

    while (true) {
        t = m_lexer.getNext();
        if (t == L::RCurly) break;
        if (t == L::Dot) continue;
        if (t == L::Identifier && m_lexer.isKeyword("graph")) {
            PatternTerm g = parseGraphTerm();
            q.templateTriples += parseTemplateBlock(g);
            continue;
        }
        if (t == L::Eof) {
            syntaxError("Unterminated INSERT template");
        }
        m_lexer.unget(t);
        TriplePatterns block;
        m_inTemplate = true;
        parseTriplesSameSubject(block);
        m_inTemplate = false;
        foreach (const TriplePattern &tp, block) {
            q.templateTriples.push_back
                (TemplateTriple(tp.subject, tp.predicate, tp.object));
        }
    }

    if (data) {
        foreach (const TemplateTriple &tt, q.templateTriples) {
            if (tt.subject.isVariable() || tt.predicate.isVariable() ||
                tt.object.isVariable() || tt.graph.isVariable()) {
                syntaxError("Variables are not permitted in INSERT DATA");
            }
        }
        q.where = GroupPatternPtr(new GroupPattern());
        return;
    }

    parseWhere(q);
}

TemplateTriples
QueryParser::parseTemplateBlock(PatternTerm graph)
{
    expect(L::LCurly, "to open template");

    TriplePatterns block;
    m_inTemplate = true;

    while (true) {
        L::Token t = m_lexer.getNext();
        if (t == L::RCurly) break;
        if (t == L::Dot) continue;
        if (t == L::Eof) syntaxError("Unterminated template");
        m_lexer.unget(t);
        parseTriplesSameSubject(block);
    }

    m_inTemplate = false;

    TemplateTriples result;
    foreach (const TriplePattern &tp, block) {
        result.push_back(TemplateTriple(tp.subject, tp.predicate, tp.object, graph));
    }
    return result;
}

void
QueryParser::parseWhere(Query &q)
{
    L::Token t = m_lexer.getNext();
    if (!(t == L::Identifier && m_lexer.isKeyword("where"))) {
        m_lexer.unget(t);
    }
    q.where = parseGroupGraphPattern();
}

void
QueryParser::parseSolutionModifiers(Query &q, bool allowGroupBy)
{
    L::Token t = m_lexer.getNext();

    if (allowGroupBy && t == L::Identifier && m_lexer.isKeyword("group")) {
        t = m_lexer.getNext();
        if (t != L::Identifier || !m_lexer.isKeyword("by")) {
            syntaxError("Expected BY after GROUP");
        }
        while (true) {
            t = m_lexer.getNext();
            if (t == L::Variable) {
                q.groupBy.push_back
                    (GroupCondition(Expression::variable(m_lexer.getTokenValue())));
            } else if (t == L::LParen) {
                ExpressionPtr e = parseExpression();
                QString alias;
                t = m_lexer.getNext();
                if (t == L::Identifier && m_lexer.isKeyword("as")) {
                    alias = parseVariableName();
                } else {
                    m_lexer.unget(t);
                }
                expect(L::RParen, "after GROUP BY expression");
                q.groupBy.push_back(GroupCondition(e, alias));
            } else if (t == L::Identifier &&
                       !m_lexer.isKeyword("order") &&
                       !m_lexer.isKeyword("limit") &&
                       !m_lexer.isKeyword("offset")) {
                q.groupBy.push_back(GroupCondition(parseCall(m_lexer.getTokenValue())));
            } else {
                break;
            }
        }
        if (q.groupBy.empty()) syntaxError("Expected condition after GROUP BY");
    }

    if (t == L::Identifier && m_lexer.isKeyword("order")) {
        t = m_lexer.getNext();
        if (t != L::Identifier || !m_lexer.isKeyword("by")) {
            syntaxError("Expected BY after ORDER");
        }
        m_allowAggregates = allowGroupBy;
        while (true) {
            t = m_lexer.getNext();
            if (t == L::Variable) {
                q.orderBy.push_back
                    (OrderCondition(Expression::variable(m_lexer.getTokenValue()), false));
            } else if (t == L::LParen) {
                ExpressionPtr e = parseExpression();
                expect(L::RParen, "after ORDER BY expression");
                q.orderBy.push_back(OrderCondition(e, false));
            } else if (t == L::Identifier &&
                       (m_lexer.isKeyword("asc") || m_lexer.isKeyword("desc"))) {
                bool desc = m_lexer.isKeyword("desc");
                expect(L::LParen, "after ASC or DESC");
                ExpressionPtr e = parseExpression();
                expect(L::RParen, "after ORDER BY expression");
                q.orderBy.push_back(OrderCondition(e, desc));
            } else if (t == L::Identifier &&
                       !m_lexer.isKeyword("limit") &&
                       !m_lexer.isKeyword("offset")) {
                q.orderBy.push_back
                    (OrderCondition(parseCall(m_lexer.getTokenValue()), false));
            } else {
                break;
            }
        }
        m_allowAggregates = false;
        if (q.orderBy.empty()) syntaxError("Expected condition after ORDER BY");
    }

    // LIMIT and OFFSET, in either order
    for (int i = 0; i < 2; ++i) {
        if (t == L::Identifier && m_lexer.isKeyword("limit")) {
            expect(L::Integer, "after LIMIT");
            q.limit = m_lexer.getTokenValue().toInt();
            t = m_lexer.getNext();
        } else if (t == L::Identifier && m_lexer.isKeyword("offset")) {
            expect(L::Integer, "after OFFSET");
            q.offset = m_lexer.getTokenValue().toInt();
            t = m_lexer.getNext();
        }
    }

    m_lexer.unget(t);
}

GroupPatternPtr
QueryParser::parseGroupGraphPattern()
{
    expect(L::LCurly, "to open group pattern");

    GroupPatternPtr group(new GroupPattern());
    PatternElement block(PatternElement::TriplesBlock);

    while (true) {

        L::Token t = m_lexer.getNext();

        if (t == L::RCurly) break;
        if (t == L::Dot) continue;
        if (t == L::Eof) syntaxError("Unterminated group pattern");

        bool flush = true;
        PatternElement e;

        if (t == L::LCurly) {
            m_lexer.unget(t);
            GroupPatternPtr first = parseGroupGraphPattern();
            e = PatternElement(PatternElement::Group);
            e.groups.push_back(first);
            while (true) {
                t = m_lexer.getNext();
                if (t == L::Identifier && m_lexer.isKeyword("union")) {
                    e.type = PatternElement::Union;
                    e.groups.push_back(parseGroupGraphPattern());
                } else {
                    m_lexer.unget(t);
                    break;
                }
            }
        } else if (t == L::Identifier && m_lexer.isKeyword("optional")) {
            e = PatternElement(PatternElement::Optional);
            e.groups.push_back(parseGroupGraphPattern());
        } else if (t == L::Identifier && m_lexer.isKeyword("graph")) {
            e = PatternElement(PatternElement::Graph);
            e.graph = parseGraphTerm();
            e.groups.push_back(parseGroupGraphPattern());
        } else if (t == L::Identifier && m_lexer.isKeyword("filter")) {
            e = PatternElement(PatternElement::Filter);
            e.expression = parseConstraint();
            flush = false;
        } else if (t == L::Identifier && m_lexer.isKeyword("bind")) {
            e = PatternElement(PatternElement::Bind);
            expect(L::LParen, "after BIND");
            e.expression = parseExpression();
            t = m_lexer.getNext();
            if (t != L::Identifier || !m_lexer.isKeyword("as")) {
                syntaxError(QString("Expected AS in BIND, found %1")
                            .arg(describeCurrent(t)));
            }
            e.variable = parseVariableName();
            expect(L::RParen, "after BIND");
        } else if (t == L::Identifier &&
                   (m_lexer.isKeyword("minus") || m_lexer.isKeyword("service") ||
                    m_lexer.isKeyword("values"))) {
            syntaxError(QString("%1 is not supported")
                        .arg(m_lexer.getTokenValue().toUpper()));
        } else {
            m_lexer.unget(t);
            parseTriplesSameSubject(block.triples);
            t = m_lexer.getNext();
            if (t != L::Dot && t != L::RCurly && t != L::LCurly &&
                t != L::Identifier) {
                syntaxError(QString("Expected \".\" after triple pattern, found %1")
                            .arg(describeCurrent(t)));
            }
            if (t != L::Dot) m_lexer.unget(t);
            continue;
        }

        if (flush && !block.triples.empty()) {
            group->addElement(block);
            block.triples.clear();
        }
        group->addElement(e);
    }

    if (!block.triples.empty()) group->addElement(block);
    return group;
}

bool
QueryParser::startsVerb(L::Token t) const
{
    if (t == L::Variable || t == L::IRI || t == L::PrefixedName) return true;
    if (t == L::Caret || t == L::LParen) return !m_inTemplate;
    if (t == L::Identifier && m_lexer.isKeyword("a")) return true;
    return false;
}

void
QueryParser::parseTriplesSameSubject(TriplePatterns &block)
{
    L::Token t = m_lexer.getNext();

    if (t == L::LBracket) {
        PatternTerm subject = makeAnonymous();
        parsePropertyList(subject, block);
        expect(L::RBracket, "to close blank node");
        // The property list after [ ... ] is optional
        t = m_lexer.getNext();
        m_lexer.unget(t);
        if (startsVerb(t)) parsePropertyList(subject, block);
        return;
    }

    m_lexer.unget(t);
    PatternTerm subject = parseGraphNode(block);
    if (!subject.isVariable() && subject.getNode().type == Node::Literal) {
        syntaxError("A literal cannot be the subject of a triple");
    }
    parsePropertyList(subject, block);
}

void
QueryParser::parsePropertyList(PatternTerm subject, TriplePatterns &block)
{
    while (true) {

        L::Token t = m_lexer.getNext();
        if (!startsVerb(t)) {
            syntaxError(QString("Expected predicate, found %1")
                        .arg(describeCurrent(t)));
        }

        PatternTerm predicate;
        PropertyPathPtr path;

        if (t == L::Variable) {
            predicate = PatternTerm::variable(m_lexer.getTokenValue());
        } else {
            m_lexer.unget(t);
            path = parsePath();
            if (path->getType() == PropertyPath::Atomic) {
                predicate = PatternTerm(Node(path->getPredicate()));
                path.clear();
            } else if (m_inTemplate) {
                syntaxError("Property paths are not permitted in templates");
            }
        }

        while (true) {
            PatternTerm object = parseGraphNode(block);
            if (path) block.push_back(TriplePattern(subject, path, object));
            else block.push_back(TriplePattern(subject, predicate, object));
            t = m_lexer.getNext();
            if (t != L::Comma) break;
        }

        if (t != L::Semicolon) {
            m_lexer.unget(t);
            return;
        }

        // Any number of semicolons, possibly with nothing after them
        while (t == L::Semicolon) t = m_lexer.getNext();
        m_lexer.unget(t);
        if (!startsVerb(t)) return;
    }
}

PatternTerm
QueryParser::makeAnonymous()
{
    QString label = QString("[]%1").arg(++m_anonCounter);
    if (m_inTemplate) return PatternTerm(Node(Node::Blank, label));
    return PatternTerm::variable("_:" + label);
}

PatternTerm
QueryParser::parseBlankNodePropertyList(TriplePatterns &block)
{
    PatternTerm node = makeAnonymous();
    parsePropertyList(node, block);
    expect(L::RBracket, "to close blank node");
    return node;
}

PatternTerm
QueryParser::parseGraphNode(TriplePatterns &block)
{
    L::Token t = m_lexer.getNext();

    switch (t) {

    case L::Variable:
        return PatternTerm::variable(m_lexer.getTokenValue());

    case L::IRI:
        return PatternTerm(Node(resolveIri(m_lexer.getTokenValue())));

    case L::PrefixedName:
        return PatternTerm(Node(expandName(m_lexer.getTokenValue())));

    case L::BlankLabel:
        if (m_inTemplate) {
            return PatternTerm(Node(Node::Blank, m_lexer.getTokenValue()));
        }
        return PatternTerm::variable("_:" + m_lexer.getTokenValue());

    case L::Anon:
        return makeAnonymous();

    case L::LBracket:
        return parseBlankNodePropertyList(block);

    case L::String:
    case L::Integer:
    case L::Decimal:
    case L::Double:
        return PatternTerm(parseLiteral(t));

    case L::Minus:
    case L::Plus: {
        bool negative = (t == L::Minus);
        L::Token n = m_lexer.getNext();
        if (n != L::Integer && n != L::Decimal && n != L::Double) {
            syntaxError(QString("Expected number after sign, found %1")
                        .arg(describeCurrent(n)));
        }
        return PatternTerm(parseNumber(n, negative));
    }

    case L::Identifier:
        if (m_lexer.isKeyword("true") || m_lexer.isKeyword("false")) {
            return PatternTerm(Node(Node::Literal,
                                    m_lexer.getTokenValue().toLower(),
                                    Node::xsdDatatype("boolean")));
        }
        break;

    case L::LParen:
        syntaxError("RDF collections are not supported");
        break;

    default:
        break;
    }

    syntaxError(QString("Expected RDF term, found %1").arg(describeCurrent(t)));
    return PatternTerm();
}

PatternTerm
QueryParser::parseGraphTerm()
{
    L::Token t = m_lexer.getNext();
    if (t == L::Variable) return PatternTerm::variable(m_lexer.getTokenValue());
    if (t == L::IRI) return PatternTerm(Node(resolveIri(m_lexer.getTokenValue())));
    if (t == L::PrefixedName) return PatternTerm(Node(expandName(m_lexer.getTokenValue())));
    syntaxError(QString("Expected graph IRI or variable after GRAPH, found %1")
                .arg(describeCurrent(t)));
    return PatternTerm();
}

PropertyPathPtr
QueryParser::parsePath()
{
    PropertyPathPtr p = parsePathSequence();
    while (true) {
        L::Token t = m_lexer.getNext();
        if (t != L::Bar) {
            m_lexer.unget(t);
            return p;
        }
        p = PropertyPath::alternation(p, parsePathSequence());
    }
}

PropertyPathPtr
QueryParser::parsePathSequence()
{
    PropertyPathPtr p = parsePathEltOrInverse();
    while (true) {
        L::Token t = m_lexer.getNext();
        if (t != L::Slash) {
            m_lexer.unget(t);
            return p;
        }
        p = PropertyPath::sequence(p, parsePathEltOrInverse());
    }
}

PropertyPathPtr
QueryParser::parsePathEltOrInverse()
{
    L::Token t = m_lexer.getNext();
    bool inverse = (t == L::Caret);
    if (!inverse) m_lexer.unget(t);

    PropertyPathPtr p = parsePathPrimary();

    t = m_lexer.getNext();
    switch (t) {
    case L::Star: p = PropertyPath::zeroOrMore(p); break;
    case L::Plus: p = PropertyPath::oneOrMore(p); break;
    case L::Question: p = PropertyPath::zeroOrOne(p); break;
    default: m_lexer.unget(t); break;
    }

    if (inverse) p = PropertyPath::inverse(p);
    return p;
}

PropertyPathPtr
QueryParser::parsePathPrimary()
{
    L::Token t = m_lexer.getNext();
    switch (t) {
    case L::IRI:
        return PropertyPath::atomic(resolveIri(m_lexer.getTokenValue()));
    case L::PrefixedName:
        return PropertyPath::atomic(expandName(m_lexer.getTokenValue()));
    case L::Identifier:
        if (m_lexer.isKeyword("a")) {
            return PropertyPath::atomic(m_prefixes.expand("a"));
        }
        break;
    case L::LParen: {
        PropertyPathPtr p = parsePath();
        expect(L::RParen, "to close property path");
        return p;
    }
    case L::Not:
        syntaxError("Negated property paths are not supported");
        break;
    default:
        break;
    }
    syntaxError(QString("Expected property path, found %1")
                .arg(describeCurrent(t)));
    return PropertyPathPtr();
}

ExpressionPtr
QueryParser::parseConstraint()
{
    L::Token t = m_lexer.getNext();
    if (t == L::LParen) {
        ExpressionPtr e = parseExpression();
        expect(L::RParen, "to close FILTER");
        return e;
    }
    if (t == L::Identifier) {
        return parseCall(m_lexer.getTokenValue());
    }
    syntaxError(QString("Expected constraint after FILTER, found %1")
                .arg(describeCurrent(t)));
    return ExpressionPtr();
}

ExpressionPtr
QueryParser::parseExpression()
{
    ExpressionPtr e = parseConditionalAnd();
    while (true) {
        L::Token t = m_lexer.getNext();
        if (t != L::Or) {
            m_lexer.unget(t);
            return e;
        }
        e = Expression::binary(Expression::Or, e, parseConditionalAnd());
    }
}

ExpressionPtr
QueryParser::parseConditionalAnd()
{
    ExpressionPtr e = parseRelational();
    while (true) {
        L::Token t = m_lexer.getNext();
        if (t != L::And) {
            m_lexer.unget(t);
            return e;
        }
        e = Expression::binary(Expression::And, e, parseRelational());
    }
}

ExpressionPtr
QueryParser::parseRelational()
{
    ExpressionPtr left = parseUnary();
    L::Token t = m_lexer.getNext();
    Expression::Type type;
    switch (t) {
    case L::Equal: type = Expression::Equal; break;
    case L::NotEqual: type = Expression::NotEqual; break;
    case L::Less: type = Expression::Less; break;
    case L::Greater: type = Expression::Greater; break;
    case L::LessOrEqual: type = Expression::LessOrEqual; break;
    case L::GreaterOrEqual: type = Expression::GreaterOrEqual; break;
    default:
        m_lexer.unget(t);
        return left;
    }
    return Expression::binary(type, left, parseUnary());
}

ExpressionPtr
QueryParser::parseUnary()
{
    L::Token t = m_lexer.getNext();
    if (t == L::Not) {
        return Expression::unary(Expression::Not, parseUnary());
    }
    if (t == L::Minus || t == L::Plus) {
        L::Token n = m_lexer.getNext();
        if (n != L::Integer && n != L::Decimal && n != L::Double) {
            syntaxError("Arithmetic expressions are not supported");
        }
        return Expression::constant(parseNumber(n, t == L::Minus));
    }
    m_lexer.unget(t);
    return parsePrimary();
}

ExpressionPtr
QueryParser::parsePrimary()
{
    L::Token t = m_lexer.getNext();

    switch (t) {

    case L::LParen: {
        ExpressionPtr e = parseExpression();
        expect(L::RParen, "to close expression");
        return e;
    }

    case L::Variable:
        return Expression::variable(m_lexer.getTokenValue());

    case L::IRI:
        return Expression::constant(Node(resolveIri(m_lexer.getTokenValue())));

    case L::PrefixedName:
        return Expression::constant(Node(expandName(m_lexer.getTokenValue())));

    case L::String:
    case L::Integer:
    case L::Decimal:
    case L::Double:
        return Expression::constant(parseLiteral(t));

    case L::Identifier:
        if (m_lexer.isKeyword("true") || m_lexer.isKeyword("false")) {
            return Expression::constant
                (Node(Node::Literal, m_lexer.getTokenValue().toLower(),
                      Node::xsdDatatype("boolean")));
        }
        return parseCall(m_lexer.getTokenValue());

    default:
        break;
    }

    syntaxError(QString("Expected expression, found %1").arg(describeCurrent(t)));
    return ExpressionPtr();
}

ExpressionPtr
QueryParser::parseCall(QString name)
{
    QString lc = name.toLower();

    if (lc == "exists" || lc == "not") {
        bool negated = false;
        if (lc == "not") {
            L::Token t = m_lexer.getNext();
            if (t != L::Identifier || !m_lexer.isKeyword("exists")) {
                syntaxError("Expected EXISTS after NOT");
            }
            negated = true;
        }
        return Expression::exists(parseGroupGraphPattern(), negated);
    }

    Expression::AggregateFunction af;
    if (Expression::aggregateByName(lc, af)) {
        if (!m_allowAggregates) {
            syntaxError(QString("Aggregate %1 is not permitted here").arg(name.toUpper()));
        }
        return parseAggregate(af);
    }

    Expression::Function f;
    if (!Expression::functionByName(lc, f)) {
        syntaxError(QString("Unknown function \"%1\"").arg(name));
    }

    ExpressionList args = parseArgumentList();

    int minArgs = 0, maxArgs = 0;
    Expression::getArity(f, minArgs, maxArgs);
    if (args.size() < minArgs || (maxArgs >= 0 && args.size() > maxArgs)) {
        syntaxError(QString("Wrong number of arguments (%1) for %2")
                    .arg(args.size()).arg(name.toUpper()));
    }
    if (f == Expression::Bound &&
        args[0]->getType() != Expression::Variable) {
        syntaxError("Argument to BOUND must be a variable");
    }

    return Expression::function(f, args);
}

ExpressionList
QueryParser::parseArgumentList()
{
    ExpressionList args;
    expect(L::LParen, "to open argument list");
    L::Token t = m_lexer.getNext();
    if (t == L::RParen) return args;
    m_lexer.unget(t);
    while (true) {
        args.push_back(parseExpression());
        t = m_lexer.getNext();
        if (t == L::RParen) return args;
        if (t != L::Comma) {
            syntaxError(QString("Expected \",\" or \")\" in argument list, found %1")
                        .arg(describeCurrent(t)));
        }
    }
}

ExpressionPtr
QueryParser::parseAggregate(Expression::AggregateFunction f)
{
    expect(L::LParen, "after aggregate");

    bool distinct = false;
    L::Token t = m_lexer.getNext();
    if (t == L::Identifier && m_lexer.isKeyword("distinct")) {
        distinct = true;
        t = m_lexer.getNext();
    }

    ExpressionPtr arg;
    if (t == L::Star) {
        if (f != Expression::Count) syntaxError("Only COUNT may take *");
    } else {
        m_lexer.unget(t);
        // Aggregates do not nest
        m_allowAggregates = false;
        arg = parseExpression();
        m_allowAggregates = true;
    }

    QString separator = " ";
    t = m_lexer.getNext();
    if (t == L::Semicolon && f == Expression::GroupConcat) {
        t = m_lexer.getNext();
        if (t != L::Identifier || !m_lexer.isKeyword("separator")) {
            syntaxError("Expected SEPARATOR in GROUP_CONCAT");
        }
        expect(L::Equal, "after SEPARATOR");
        expect(L::String, "after SEPARATOR=");
        separator = m_lexer.getTokenValue();
        t = m_lexer.getNext();
    }
    if (t != L::RParen) {
        syntaxError(QString("Expected \")\" to close aggregate, found %1")
                    .arg(describeCurrent(t)));
    }

    return Expression::aggregate(f, arg, distinct, separator);
}

Node
QueryParser::parseLiteral(L::Token t)
{
    if (t != L::String) return parseNumber(t, false);

    QString value = m_lexer.getTokenValue();

    L::Token n = m_lexer.getNext();
    if (n == L::LangTag) {
        return Node::languageLiteral(value, m_lexer.getTokenValue());
    }
    if (n == L::DoubleCaret) {
        n = m_lexer.getNext();
        if (n == L::IRI) {
            return Node(Node::Literal, value, resolveIri(m_lexer.getTokenValue()));
        }
        if (n == L::PrefixedName) {
            return Node(Node::Literal, value, expandName(m_lexer.getTokenValue()));
        }
        syntaxError(QString("Expected datatype after ^^, found %1")
                    .arg(describeCurrent(n)));
    }
    m_lexer.unget(n);
    return Node(Node::Literal, value);
}

Node
QueryParser::parseNumber(L::Token t, bool negative)
{
    QString value = m_lexer.getTokenValue();
    if (negative) value = "-" + value;
    switch (t) {
    case L::Integer: return Node(Node::Literal, value, Node::xsdDatatype("integer"));
    case L::Decimal: return Node(Node::Literal, value, Node::xsdDatatype("decimal"));
    case L::Double: return Node(Node::Literal, value, Node::xsdDatatype("double"));
    default: break;
    }
    syntaxError(QString("Expected number, found %1").arg(describeCurrent(t)));
    return Node();
}

Uri
QueryParser::resolveIri(QString iri) const
{
    if (iri.indexOf(':') < 0) {
        Uri base = m_prefixes.getBaseUri();
        if (!base.isEmpty()) return Uri(base.toString() + iri);
    }
    return Uri(iri);
}

Uri
QueryParser::expandName(QString name) const
{
    return m_prefixes.expand(name);
}

QString
QueryParser::parseVariableName()
{
    L::Token t = m_lexer.getNext();
    if (t != L::Variable) {
        syntaxError(QString("Expected variable, found %1").arg(describeCurrent(t)));
    }
    return m_lexer.getTokenValue();
}

}
