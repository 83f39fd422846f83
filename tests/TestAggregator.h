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

#ifndef _TEST_AGGREGATOR_H_
#define _TEST_AGGREGATOR_H_

#include <QObject>
#include <QtTest>

#include "../Dataset.h"
#include "../QueryEngine.h"
#include "../query/Aggregator.h"
#include "../query/ExpressionEvaluator.h"

namespace Ontoquay {

class TestAggregator : public QObject
{
    Q_OBJECT

    Node ex(QString name) { return Node(Uri("http://example.org/" + name)); }
    Node integer(int n) {
        return Node(Node::Literal, QString::number(n), Node::xsdDatatype("integer"));
    }

private slots:
    void initTestCase() {
        // three items in category X, two in Y, with sizes
        const char *cats[] = { "X", "Y", "X", "X", "Y" };
        int sizes[] = { 3, 10, 1, 2, 5 };
        for (int i = 0; i < 5; ++i) {
            Node item = ex(QString("item%1").arg(i + 1));
            dataset.addTriple(Uri(), Triple(item, ex("category"), ex(cats[i])));
            dataset.addTriple(Uri(), Triple(item, ex("size"), integer(sizes[i])));
        }
        engine = new QueryEngine(&dataset);
        engine->addPrefix("ex", Uri("http://example.org/"));
    }

    void cleanupTestCase() {
        delete engine;
        engine = 0;
    }

    void groupCount() {
        QueryResult r = engine->execute
            ("SELECT ?cat (COUNT(?item) AS ?n) "
             "WHERE { ?item ex:category ?cat } GROUP BY ?cat ORDER BY ?cat");
        QCOMPARE(r.columns, QStringList() << "cat" << "n");
        QCOMPARE(r.rows.size(), 2);
        QCOMPARE(r.rows[0].value("cat"), ex("X"));
        QCOMPARE(r.rows[0].value("n"), integer(3));
        QCOMPARE(r.rows[1].value("cat"), ex("Y"));
        QCOMPARE(r.rows[1].value("n"), integer(2));
    }

    void groupsInFirstAppearanceOrder() {
        ResultSet rows = engine->select(engine->prepare
            ("SELECT ?cat (COUNT(*) AS ?n) "
             "WHERE { ?item ex:category ?cat } GROUP BY ?cat"));
        QCOMPARE(rows.size(), 2);
        // item1 is in X, and is the first solution in triple order
        QCOMPARE(rows[0].value("cat"), ex("X"));
    }

    void countOverNothing() {
        ResultSet rows = engine->select(engine->prepare
            ("SELECT (COUNT(*) AS ?n) WHERE { ?item ex:colour ?c }"));
        QCOMPARE(rows.size(), 1);
        QCOMPARE(rows[0].value("n"), integer(0));
    }

    void countDistinct() {
        ResultSet rows = engine->select(engine->prepare
            ("SELECT (COUNT(DISTINCT ?cat) AS ?n) WHERE { ?item ex:category ?cat }"));
        QCOMPARE(rows.size(), 1);
        QCOMPARE(rows[0].value("n"), integer(2));
    }

    void sumMinMax() {
        ResultSet rows = engine->select(engine->prepare
            ("SELECT ?cat (SUM(?s) AS ?total) (MIN(?s) AS ?lo) (MAX(?s) AS ?hi) "
             "WHERE { ?item ex:category ?cat ; ex:size ?s } "
             "GROUP BY ?cat ORDER BY DESC(?total)"));
        QCOMPARE(rows.size(), 2);
        QCOMPARE(rows[0].value("cat"), ex("Y"));
        QCOMPARE(rows[0].value("total"), integer(15));
        QCOMPARE(rows[0].value("lo"), integer(5));
        QCOMPARE(rows[0].value("hi"), integer(10));
        QCOMPARE(rows[1].value("total"), integer(6));
    }

    void groupConcat() {
        ResultSet rows = engine->select(engine->prepare
            ("SELECT (GROUP_CONCAT(?s ; SEPARATOR=\",\") AS ?all) "
             "WHERE { ?item ex:category ex:Y ; ex:size ?s }"));
        QCOMPARE(rows.size(), 1);
        QStringList parts = rows[0].value("all").value.split(",");
        parts.sort();
        QCOMPARE(parts, QStringList() << "10" << "5");
    }

    void orderNumeric() {
        // numeric literals order by value, not lexically
        ResultSet rows = engine->select(engine->prepare
            ("SELECT ?s WHERE { ?item ex:size ?s } ORDER BY ?s"));
        QCOMPARE(rows.size(), 5);
        QCOMPARE(rows[0].value("s"), integer(1));
        QCOMPARE(rows[4].value("s"), integer(10));
    }

    void orderByAlias() {
        ResultSet rows = engine->select(engine->prepare
            ("SELECT ?item (STR(?s) AS ?t) WHERE { ?item ex:size ?s } "
             "ORDER BY DESC(?t)"));
        // lexical order on the plain string: "5" > "3" > "2" > "10" > "1"
        QCOMPARE(rows.size(), 5);
        QCOMPARE(rows[0].value("t").value, QString("5"));
        QCOMPARE(rows[4].value("t").value, QString("1"));
    }

    void orderKindRanking() {
        // unbound < blank < IRI < literal
        ResultSet rs;
        Dictionary d1, d2, d3, d4;
        d1["v"] = Node(Node::Literal, "x");
        d2["v"] = ex("a");
        d3["v"] = Node(Node::Blank, "b");
        rs << d1 << d2 << d3 << d4;
        OrderConditions conds;
        conds << OrderCondition(Expression::variable("v"), false);
        Aggregator aggregator;
        ResultSet sorted = aggregator.order(rs, conds);
        QCOMPARE(sorted[0], d4);
        QCOMPARE(sorted[1], d3);
        QCOMPARE(sorted[2], d2);
        QCOMPARE(sorted[3], d1);
    }

    void orderStable() {
        ResultSet rs;
        for (int i = 0; i < 6; ++i) {
            Dictionary d;
            d["k"] = integer(i % 2);
            d["i"] = integer(i);
            rs << d;
        }
        OrderConditions conds;
        conds << OrderCondition(Expression::variable("k"), false);
        ResultSet sorted = Aggregator().order(rs, conds);
        QCOMPARE(sorted[0].value("i"), integer(0));
        QCOMPARE(sorted[1].value("i"), integer(2));
        QCOMPARE(sorted[2].value("i"), integer(4));
        QCOMPARE(sorted[3].value("i"), integer(1));
    }

    void distinctLimitOffset() {
        ResultSet rows = engine->select(engine->prepare
            ("SELECT DISTINCT ?cat WHERE { ?item ex:category ?cat } ORDER BY ?cat"));
        QCOMPARE(rows.size(), 2);
        rows = engine->select(engine->prepare
            ("SELECT ?s WHERE { ?item ex:size ?s } ORDER BY ?s LIMIT 2 OFFSET 1"));
        QCOMPARE(rows.size(), 2);
        QCOMPARE(rows[0].value("s"), integer(2));
        QCOMPARE(rows[1].value("s"), integer(3));
        rows = engine->select(engine->prepare
            ("SELECT ?s WHERE { ?item ex:size ?s } OFFSET 10"));
        QCOMPARE(rows.size(), 0);
    }

    void compareNumericTypes() {
        Node a(Node::Literal, "2", Node::xsdDatatype("integer"));
        Node b(Node::Literal, "10.5", Node::xsdDatatype("decimal"));
        QVERIFY(ExpressionEvaluator::compare(a, b) < 0);
        QVERIFY(ExpressionEvaluator::compare(b, a) > 0);
        QCOMPARE(ExpressionEvaluator::compare(a, a), 0);
    }

private:
    Dataset dataset;
    QueryEngine *engine;
};

}

#endif
