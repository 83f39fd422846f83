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

#ifndef _TEST_QUERY_PARSER_H_
#define _TEST_QUERY_PARSER_H_

#include <QObject>
#include <QtTest>

#include "../PrefixTable.h"
#include "../RDFException.h"
#include "../query/QueryLexer.h"
#include "../query/QueryParser.h"

namespace Ontoquay {

class TestQueryParser : public QObject
{
    Q_OBJECT

    Query parse(QString text) {
        QueryParser parser(text, prefixes);
        return parser.parse();
    }

    bool failsWithSyntaxError(QString text) {
        try {
            parse(text);
        } catch (RDFSyntaxError &) {
            return true;
        }
        return false;
    }

    const PatternElement &firstElement(const Query &q) {
        return q.where->getElements()[0];
    }

private slots:
    void initTestCase() {
        prefixes.addPrefix("ex", Uri("http://example.org/"));
    }

    void lexerTokens() {
        QueryLexer lexer("SELECT ?x WHERE { <http://a/b> ex:p \"s\"@en ; ^^ }");
        QCOMPARE(lexer.getNext(), QueryLexer::Identifier);
        QVERIFY(lexer.isKeyword("select"));
        QCOMPARE(lexer.getNext(), QueryLexer::Variable);
        QCOMPARE(lexer.getTokenValue(), QString("x"));
        QCOMPARE(lexer.getNext(), QueryLexer::Identifier);
        QCOMPARE(lexer.getNext(), QueryLexer::LCurly);
        QCOMPARE(lexer.getNext(), QueryLexer::IRI);
        QCOMPARE(lexer.getTokenValue(), QString("http://a/b"));
        QCOMPARE(lexer.getNext(), QueryLexer::PrefixedName);
        QCOMPARE(lexer.getTokenValue(), QString("ex:p"));
        QCOMPARE(lexer.getNext(), QueryLexer::String);
        QCOMPARE(lexer.getTokenValue(), QString("s"));
        QCOMPARE(lexer.getNext(), QueryLexer::LangTag);
        QCOMPARE(lexer.getTokenValue(), QString("en"));
        QCOMPARE(lexer.getNext(), QueryLexer::Semicolon);
        QCOMPARE(lexer.getNext(), QueryLexer::DoubleCaret);
        QCOMPARE(lexer.getNext(), QueryLexer::RCurly);
        QCOMPARE(lexer.getNext(), QueryLexer::Eof);
    }

    void lexerLessThan() {
        QueryLexer lexer("?a < 3 && ?b <= ?c");
        QCOMPARE(lexer.getNext(), QueryLexer::Variable);
        QCOMPARE(lexer.getNext(), QueryLexer::Less);
        QCOMPARE(lexer.getNext(), QueryLexer::Integer);
        QCOMPARE(lexer.getNext(), QueryLexer::And);
        QCOMPARE(lexer.getNext(), QueryLexer::Variable);
        QCOMPARE(lexer.getNext(), QueryLexer::LessOrEqual);
        QCOMPARE(lexer.getNext(), QueryLexer::Variable);
    }

    void lexerStrings() {
        QueryLexer lexer("'a\\tb' \"\"\"long\nstring\"\"\" \"\\u00e9\"");
        QCOMPARE(lexer.getNext(), QueryLexer::String);
        QCOMPARE(lexer.getTokenValue(), QString("a\tb"));
        QCOMPARE(lexer.getNext(), QueryLexer::String);
        QCOMPARE(lexer.getTokenValue(), QString("long\nstring"));
        QCOMPARE(lexer.getNext(), QueryLexer::String);
        QCOMPARE(lexer.getTokenValue(), QString(QChar(0xe9)));
    }

    void selectForm() {
        Query q = parse("SELECT DISTINCT ?a (STR(?b) AS ?c) WHERE { ?a ex:p ?b } "
                        "ORDER BY DESC(?c) ?a LIMIT 5 OFFSET 2");
        QCOMPARE(q.form, Query::SelectQuery);
        QVERIFY(q.distinct);
        QCOMPARE(q.getColumnNames(), QStringList() << "a" << "c");
        QCOMPARE(q.orderBy.size(), 2);
        QVERIFY(q.orderBy[0].descending);
        QVERIFY(!q.orderBy[1].descending);
        QCOMPARE(q.limit, 5);
        QCOMPARE(q.offset, 2);
        QVERIFY(!q.isAggregate());
    }

    void selectAllColumns() {
        Query q = parse("SELECT * { ?a ex:p ?b . ?b ex:q ?c }");
        QVERIFY(q.selectAll);
        QCOMPARE(q.getColumnNames(), QStringList() << "a" << "b" << "c");
    }

    void prefixDeclarations() {
        Query q = parse("PREFIX ex: <http://other.org/> "
                        "SELECT ?a WHERE { ?a ex:p ?b }");
        const PatternElement &e = firstElement(q);
        QCOMPARE(e.type, PatternElement::TriplesBlock);
        QCOMPARE(e.triples[0].predicate.getNode(), Node(Uri("http://other.org/p")));
    }

    void baseIri() {
        Query q = parse("BASE <http://base.org/> SELECT ?a WHERE { ?a <p> :q }");
        const TriplePattern &t = firstElement(q).triples[0];
        QCOMPARE(t.predicate.getNode(), Node(Uri("http://base.org/p")));
        QCOMPARE(t.object.getNode(), Node(Uri("http://base.org/q")));
    }

    void unknownPrefix() {
        try {
            parse("SELECT ?a WHERE { ?a skos:broader ?b }");
            QFAIL("Expected RDFUnknownPrefix");
        } catch (RDFUnknownPrefix &e) {
            QCOMPARE(e.curie(), QString("skos:broader"));
        }
    }

    void syntaxErrors() {
        QVERIFY(failsWithSyntaxError("SELECT WHERE { ?a ?b ?c }"));
        QVERIFY(failsWithSyntaxError("SELECT ?a WHERE { ?a ?b }"));
        QVERIFY(failsWithSyntaxError("SELECT ?a WHERE { ?a ?b ?c "));
        QVERIFY(failsWithSyntaxError("SELECT ?a WHERE { ?a ?b ?c } garbage"));
        QVERIFY(failsWithSyntaxError("DESCRIBE ?a"));
        QVERIFY(failsWithSyntaxError("SELECT ?a WHERE { \"lit\" ex:p ?a }"));
        QVERIFY(failsWithSyntaxError("SELECT ?a WHERE { ?a ex:p ?b FILTER(NOSUCH(?b)) }"));
        QVERIFY(failsWithSyntaxError("SELECT ?a WHERE { ?a ex:p ?b FILTER(REGEX(?b)) }"));
        QVERIFY(failsWithSyntaxError("SELECT ?a WHERE { ?a ex:p ?b FILTER(COUNT(?b) > 1) }"));
        QVERIFY(failsWithSyntaxError("SELECT ?a WHERE { ?a ex:p ?b MINUS { ?a ex:q ?b } }"));
        QVERIFY(failsWithSyntaxError("INSERT DATA { ?a ex:p ex:b }"));
    }

    void syntaxErrorPosition() {
        try {
            parse("SELECT ?a\nWHERE { ?a ?b }");
            QFAIL("Expected RDFSyntaxError");
        } catch (RDFSyntaxError &e) {
            QCOMPARE(e.line(), 2);
            QCOMPARE(e.column(), 15);
        }
    }

    void propertyPaths() {
        Query q = parse("SELECT * WHERE { ?a ex:p/ex:q* | ^ex:r+ ?b . ?b (ex:s)? ?c }");
        const PatternElement &e = firstElement(q);
        QCOMPARE(e.triples.size(), 2);
        QVERIFY(e.triples[0].hasPath());
        PropertyPathPtr p = e.triples[0].path;
        QCOMPARE(p->getType(), PropertyPath::Alternation);
        QCOMPARE(p->getLeft()->getType(), PropertyPath::Sequence);
        QCOMPARE(p->getLeft()->getRight()->getType(), PropertyPath::ZeroOrMore);
        QCOMPARE(p->getRight()->getType(), PropertyPath::Inverse);
        QCOMPARE(p->getRight()->getLeft()->getType(), PropertyPath::OneOrMore);
        QCOMPARE(e.triples[1].path->getType(), PropertyPath::ZeroOrOne);
    }

    void plainPredicateIsNotPath() {
        Query q = parse("SELECT * WHERE { ?a ex:p ?b ; a ex:T }");
        const PatternElement &e = firstElement(q);
        QCOMPARE(e.triples.size(), 2);
        QVERIFY(!e.triples[0].hasPath());
        QCOMPARE(e.triples[1].predicate.getNode(),
                 Node(Uri("http://www.w3.org/1999/02/22-rdf-syntax-ns#type")));
    }

    void literals() {
        Query q = parse("SELECT * WHERE { ?a ex:p \"x\"@en, \"5\"^^ex:t, 42, -1.5, "
                        "2e3, true, 'y' }");
        const TriplePatterns &tt = firstElement(q).triples;
        QCOMPARE(tt.size(), 7);
        QCOMPARE(tt[0].object.getNode(), Node::languageLiteral("x", "en"));
        QCOMPARE(tt[1].object.getNode(),
                 Node(Node::Literal, "5", Uri("http://example.org/t")));
        QCOMPARE(tt[2].object.getNode(),
                 Node(Node::Literal, "42", Node::xsdDatatype("integer")));
        QCOMPARE(tt[3].object.getNode(),
                 Node(Node::Literal, "-1.5", Node::xsdDatatype("decimal")));
        QCOMPARE(tt[4].object.getNode(),
                 Node(Node::Literal, "2e3", Node::xsdDatatype("double")));
        QCOMPARE(tt[5].object.getNode(),
                 Node(Node::Literal, "true", Node::xsdDatatype("boolean")));
        QCOMPARE(tt[6].object.getNode(), Node(Node::Literal, "y"));
    }

    void groupStructure() {
        Query q = parse("SELECT * WHERE { ?a ex:p ?b "
                        "OPTIONAL { ?b ex:q ?c } "
                        "{ ?a ex:r ?d } UNION { ?a ex:s ?d } UNION { ?a ex:t ?d } "
                        "GRAPH ?g { ?a ex:u ?e } "
                        "BIND(STR(?a) AS ?f) "
                        "FILTER(BOUND(?c)) }");
        QList<PatternElement> ee = q.where->getElements();
        QCOMPARE(ee.size(), 6);
        QCOMPARE(ee[0].type, PatternElement::TriplesBlock);
        QCOMPARE(ee[1].type, PatternElement::Optional);
        QCOMPARE(ee[2].type, PatternElement::Union);
        QCOMPARE(ee[2].groups.size(), 3);
        QCOMPARE(ee[3].type, PatternElement::Graph);
        QVERIFY(ee[3].graph.isVariable());
        QCOMPARE(ee[4].type, PatternElement::Bind);
        QCOMPARE(ee[4].variable, QString("f"));
        QCOMPARE(ee[5].type, PatternElement::Filter);
        QCOMPARE(q.where->getFilters().size(), 1);
    }

    void blankNodesInPattern() {
        Query q = parse("SELECT * WHERE { _:x ex:p [ ex:q ?v ] . [] ex:r ?w }");
        const TriplePatterns &tt = firstElement(q).triples;
        QCOMPARE(tt.size(), 3);
        QVERIFY(tt[0].subject.isVariable());
        QVERIFY(tt[0].subject.isAnonymous());
        QCOMPARE(q.getColumnNames(), QStringList() << "v" << "w");
    }

    void aggregates() {
        Query q = parse("SELECT ?c (COUNT(DISTINCT ?x) AS ?n) "
                        "(GROUP_CONCAT(?x ; SEPARATOR=\"|\") AS ?all) "
                        "WHERE { ?x ex:in ?c } GROUP BY ?c ORDER BY DESC(COUNT(?x))");
        QVERIFY(q.isAggregate());
        QCOMPARE(q.groupBy.size(), 1);
        ExpressionPtr count = q.projections[1].expression;
        QCOMPARE(count->getType(), Expression::Aggregate);
        QCOMPARE(count->getAggregateFunction(), Expression::Count);
        QVERIFY(count->isDistinct());
        QCOMPARE(q.projections[2].expression->getSeparator(), QString("|"));
    }

    void constructTemplate() {
        Query q = parse("CONSTRUCT { ?a ex:p _:b . _:b ex:q ?c } "
                        "WHERE { ?a ex:r ?c } LIMIT 3");
        QCOMPARE(q.form, Query::ConstructQuery);
        QCOMPARE(q.templateTriples.size(), 2);
        QCOMPARE(q.templateTriples[0].object.getNode().type, Node::Blank);
        QCOMPARE(q.templateTriples[0].object.getNode(),
                 q.templateTriples[1].subject.getNode());
        QCOMPARE(q.limit, 3);
    }

    void insertTemplate() {
        Query q = parse("INSERT { ?a ex:p ?b . GRAPH ex:g { ?a ex:q ?b } "
                        "GRAPH ?h { ?a ex:r ?b } } WHERE { ?a ex:s ?b ; ex:t ?h }");
        QCOMPARE(q.form, Query::InsertQuery);
        QCOMPARE(q.templateTriples.size(), 3);
        QVERIFY(q.templateTriples[0].graph.getNode().isNothing());
        QCOMPARE(q.templateTriples[1].graph.getNode(), Node(Uri("http://example.org/g")));
        QVERIFY(q.templateTriples[2].graph.isVariable());
    }

    void insertData() {
        Query q = parse("INSERT DATA { ex:a ex:p \"x\" }");
        QCOMPARE(q.templateTriples.size(), 1);
        QVERIFY(q.where);
        QCOMPARE(q.where->getElements().size(), 0);
    }

private:
    PrefixTable prefixes;
};

}

#endif
