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

#ifndef _TEST_GRAPH_H_
#define _TEST_GRAPH_H_

#include <QObject>
#include <QtTest>

#include "../Node.h"
#include "../Graph.h"
#include "../Dataset.h"
#include "../PrefixTable.h"
#include "../RDFException.h"

#include <type_traits>

namespace Ontoquay {

class TestGraph : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        base = "http://example.org/people/";
        foaf = "http://xmlns.com/foaf/0.1/";
        count = 0;
        fromFred = 0;
        toAlice = 0;
    }
    void simpleAdd() {
        // check triple can be added
        QVERIFY(graph.add
                (Triple(Node(Node::URI, base + "fred"),
                        Node(Node::URI, foaf + "name"),
                        Node(Node::Literal, "Fred Jenkins"))));
        ++count;
        ++fromFred;
    }
    void simpleLookup() {
        // check triple just added can be found again
        QVERIFY(graph.contains
                (Triple(Node(Node::URI, base + "fred"),
                        Node(Node::URI, foaf + "name"),
                        Node(Node::Literal, "Fred Jenkins"))));
    }
    void simpleAbsentLookup() {
        // check absent triple lookups are correctly handled
        QVERIFY(!graph.contains
                (Triple(Node(Node::URI, base + "fred"),
                        Node(Node::URI, foaf + "name"),
                        Node(Node::Literal, "Fred Johnson"))));
    }
    void addAlternative() {
        // alternative Triple constructor
        QVERIFY(graph.add
                (Triple(Uri(base + "fred"),
                        Uri(foaf + "knows"),
                        Node(Uri(base + "alice")))));
        ++count;
        ++fromFred;
        ++toAlice;
    }
    void addFromVariantInt() {
        QVERIFY(graph.add
                (Triple(Uri(base + "fred"),
                        Uri(base + "age"),
                        Node::fromVariant(QVariant(42)))));
        ++count;
        ++fromFred;
        Triples triples = graph.match
            (Triple(Node(Node::URI, base + "fred"),
                    Node(Node::URI, base + "age"),
                    Node()));
        QCOMPARE(triples.size(), 1);
        QCOMPARE(triples[0].c.toVariant().toInt(), 42);
        QVERIFY(triples[0].c.isNumeric());
    }
    void addFromVariantBool() {
        QVERIFY(graph.add
                (Triple(Uri(base + "fred"),
                        Uri(base + "is_sadly_deluded"),
                        Node::fromVariant(true))));
        ++count;
        ++fromFred;
        Triples triples = graph.match
            (Triple(Node(Node::URI, base + "fred"),
                    Node(Node::URI, base + "is_sadly_deluded"),
                    Node()));
        QCOMPARE(triples.size(), 1);
        QCOMPARE(triples[0].c.toVariant().toBool(), true);
    }
    void addDuplicate() {
        // adding a triple that is already present is ignored,
        // returning false, and we do not increment our count
        QVERIFY(!graph.add
                (Triple(Uri(base + "fred"),
                        Uri(foaf + "name"),
                        Node(Node::Literal, "Fred Jenkins"))));
    }
    void addLanguageLiteral() {
        // same lexical form, different language: a different triple
        QVERIFY(graph.add
                (Triple(Uri(base + "alice"),
                        Uri(foaf + "name"),
                        Node::languageLiteral("Alice Banquet", "en"))));
        QVERIFY(graph.add
                (Triple(Uri(base + "alice"),
                        Uri(foaf + "name"),
                        Node(Node::Literal, "Alice Banquet"))));
        count += 2;
    }
    void addStringTypedDuplicate() {
        // "x"^^xsd:string is the same term as "x"
        QVERIFY(!graph.add
                (Triple(Uri(base + "alice"),
                        Uri(foaf + "name"),
                        Node(Node::Literal, "Alice Banquet",
                             Node::xsdDatatype("string")))));
    }
    void addBlanks() {
        Node blankNode(Node::Blank, "b1");
        QVERIFY(graph.add
                (Triple(Node(Uri(base + "fred")),
                        Node(Uri(foaf + "maker")),
                        blankNode)));
        ++count;
        ++fromFred;
        QVERIFY(graph.add
                (Triple(blankNode,
                        Node(Uri(foaf + "name")),
                        Node(Node::Literal, "Omnipotent Being"))));
        ++count;
    }
    void addBlankPredicateFail() {
        // can't have a blank node as predicate
        try {
            graph.add(Triple(Node(Node::URI, base + "fred"),
                             Node(Node::Blank, "b2"),
                             Node(Node::Literal, "meaningless")));
            QFAIL("Expected RDFException for blank predicate");
        } catch (RDFException &) {
            QVERIFY(1);
        }
    }
    void addLiteralSubjectFail() {
        try {
            graph.add(Triple(Node(Node::Literal, "fred"),
                             Node(Uri(foaf + "name")),
                             Node(Node::Literal, "Fred")));
            QFAIL("Expected RDFException for literal subject");
        } catch (RDFException &) {
            QVERIFY(1);
        }
    }
    void matchCounts() {
        // must run after adds
        QCOMPARE(graph.size(), count);
        QCOMPARE(graph.match(Triple()).size(), count);
        QCOMPARE(graph.match
                 (Triple(Node(Node::URI, base + "fred"), Node(), Node())).size(),
                 fromFred);
        QCOMPARE(graph.count
                 (Triple(Node(Node::URI, base + "fred"), Node(), Node())),
                 fromFred);
        QCOMPARE(graph.match
                 (Triple(Node(), Node(), Node(Node::URI, base + "alice"))).size(),
                 toAlice);
    }
    void matchOrdered() {
        Triples all = graph.match(Triple());
        for (int i = 1; i < all.size(); ++i) {
            QVERIFY(all[i-1] < all[i]);
        }
    }
    void notCopyable() {
        // a graph owns its indexes and cannot be shared by copy
        QVERIFY(!std::is_copy_constructible<Graph>::value);
        QVERIFY(!std::is_copy_assignable<Graph>::value);
    }

    void mentions() {
        QVERIFY(graph.mentions(Node(Node::Blank, "b1")));
        QVERIFY(!graph.mentions(Node(Node::Blank, "b2")));
        QVERIFY(graph.getNodes().contains(Node(Uri(base + "alice"))));
    }
    void addAllAtomic() {
        // an invalid triple anywhere in the list means nothing is added
        Triples tt;
        tt << Triple(Uri(base + "carol"), Uri(foaf + "name"),
                     Node(Node::Literal, "Carol"));
        tt << Triple(Node(Node::Literal, "bad"), Node(Uri(foaf + "name")),
                     Node(Node::Literal, "Bad"));
        try {
            graph.addAll(tt);
            QFAIL("Expected RDFException from addAll");
        } catch (RDFException &) {
            QVERIFY(1);
        }
        QCOMPARE(graph.size(), count);
        QVERIFY(!graph.mentions(Node(Uri(base + "carol"))));
    }
    void changeAndRevert() {
        ChangeSet cs;
        cs << Change(AddTriple, Triple(Uri(base + "dave"), Uri(foaf + "name"),
                                       Node(Node::Literal, "Dave")));
        cs << Change(RemoveTriple, Triple(Uri(base + "fred"), Uri(foaf + "name"),
                                          Node(Node::Literal, "Fred Jenkins")));
        graph.change(cs);
        QCOMPARE(graph.size(), count);
        QVERIFY(graph.mentions(Node(Uri(base + "dave"))));
        graph.revert(cs);
        QCOMPARE(graph.size(), count);
        QVERIFY(!graph.mentions(Node(Uri(base + "dave"))));
        QVERIFY(graph.contains(Triple(Uri(base + "fred"), Uri(foaf + "name"),
                                      Node(Node::Literal, "Fred Jenkins"))));
    }
    void removeWildcard() {
        QVERIFY(graph.remove(Triple(Node(Uri(base + "fred")), Node(), Node())));
        QCOMPARE(graph.size(), count - fromFred);
        QVERIFY(!graph.remove(Triple(Node(Uri(base + "fred")), Node(), Node())));
    }

    void datasetGraphs() {
        Dataset ds;
        Uri g1(base + "g1"), g2(base + "g2");
        Triple t(Uri(base + "fred"), Uri(foaf + "name"),
                 Node(Node::Literal, "Fred"));
        QVERIFY(ds.addTriple(g2, t));
        QVERIFY(ds.addTriple(g1, t));
        QVERIFY(ds.addTriple(Uri(), t));
        QVERIFY(!ds.addTriple(g1, t));
        QCOMPARE(ds.size(), 3);
        QVERIFY(ds.hasGraph(g1));
        QVERIFY(!ds.hasGraph(Uri(base + "g3")));
        QVERIFY(ds.getGraph(Uri(base + "g3")) == 0);
        QCOMPARE(ds.match(Uri(base + "g3"), Triple()).size(), 0);
        UriList names = ds.getGraphNames();
        QCOMPARE(names.size(), 2);
        QCOMPARE(names[0], g1);
        QCOMPARE(names[1], g2);
        QCOMPARE(ds.getDefaultGraph()->size(), 1);
    }
    void datasetCommit() {
        Dataset ds;
        Uri g1(base + "g1");
        Triple t1(Uri(base + "fred"), Uri(foaf + "name"),
                  Node(Node::Literal, "Fred"));
        Triple t2(Uri(base + "alice"), Uri(foaf + "name"),
                  Node(Node::Literal, "Alice"));
        ds.addTriple(g1, t1);

        QMap<Uri, Triples> additions;
        additions[g1] << t1 << t2;
        additions[Uri()] << t2;
        QCOMPARE(ds.commit(additions), 2);
        QCOMPARE(ds.size(), 3);

        // committing the same again adds nothing
        QCOMPARE(ds.commit(additions), 0);
        QCOMPARE(ds.size(), 3);
    }
    void datasetCommitFailure() {
        Dataset ds;
        Triple good(Uri(base + "fred"), Uri(foaf + "name"),
                    Node(Node::Literal, "Fred"));
        Triple bad(Node(Node::Literal, "x"), Node(Uri(foaf + "name")),
                   Node(Node::Literal, "y"));
        QMap<Uri, Triples> additions;
        additions[Uri(base + "a")] << good;
        additions[Uri(base + "b")] << bad;
        try {
            ds.commit(additions);
            QFAIL("Expected RDFException from commit");
        } catch (RDFException &) {
            QVERIFY(1);
        }
        QCOMPARE(ds.size(), 0);
    }
    void datasetBlankNodes() {
        Dataset ds;
        Node b0 = ds.createBlankNode();
        ds.addTriple(Uri(), Triple(b0, Node(Uri(foaf + "name")),
                                   Node(Node::Literal, "x")));
        ds.addTriple(Uri(), Triple(Node(Node::Blank, "genid1"),
                                   Node(Uri(foaf + "name")),
                                   Node(Node::Literal, "y")));
        QSet<QString> seen;
        seen << b0.value << "genid1";
        for (int i = 0; i < 10; ++i) {
            Node b = ds.createBlankNode();
            QCOMPARE(b.type, Node::Blank);
            QVERIFY(!seen.contains(b.value));
            seen << b.value;
        }
    }
    void graphControl() {
        Dataset ds;
        Uri g1(base + "g1"), g2(base + "g2");
        ds.createGraph(g1);
        ds.createGraph(g2);
        BasicGraphControlSource source;
        source.addGraphTag(g1, "current");
        source.addGraphTag(g2, "archive");
        Uri pred(base + "graphTag");
        ds.setGraphControlSource(&source, pred);
        QVERIFY(ds.getGraphControlSource() == &source);
        QCOMPARE(ds.getGraphControlPredicate(), pred);
        UriList current = ds.listGraphs("current");
        QCOMPARE(current.size(), 1);
        QCOMPARE(current[0], g1);
        QCOMPARE(ds.listGraphs().size(), 2);
    }

    void prefixes() {
        PrefixTable pt;
        pt.addPrefix("foaf", Uri(foaf));
        QCOMPARE(pt.expand("foaf:name"), Uri(foaf + "name"));
        QCOMPARE(pt.expand("a"),
                 Uri("http://www.w3.org/1999/02/22-rdf-syntax-ns#type"));
        QCOMPARE(pt.compress(Uri(foaf + "knows")), QString("foaf:knows"));
        QCOMPARE(pt.compress(Uri(base + "fred")), QString("<" + base + "fred>"));
        try {
            pt.expand("skos:Concept");
            QFAIL("Expected RDFUnknownPrefix");
        } catch (RDFUnknownPrefix &e) {
            QCOMPARE(e.curie(), QString("skos:Concept"));
            QCOMPARE(QString(e.what()), QString("Missing prefix for 'skos:Concept'"));
        }
        pt.setBaseUri(Uri(base));
        QCOMPARE(pt.expand(":fred"), Uri(base + "fred"));
    }

private:
    Graph graph;
    QString base;
    QString foaf;
    int count;
    int fromFred;
    int toAlice;
};

}

#endif
