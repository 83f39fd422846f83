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

#ifndef _TEST_QUERY_ENGINE_H_
#define _TEST_QUERY_ENGINE_H_

#include <QObject>
#include <QtTest>

#include "../Dataset.h"
#include "../QueryEngine.h"
#include "../RDFException.h"

namespace Ontoquay {

class TestQueryEngine : public QObject
{
    Q_OBJECT

    static QString exNs() { return "http://example.org/"; }
    static QString skosNs() { return "http://www.w3.org/2004/02/skos/core#"; }

    Node ex(QString name) { return Node(Uri(exNs() + name)); }
    Node skos(QString name) { return Node(Uri(skosNs() + name)); }
    Node lit(QString s) { return Node(Node::Literal, s); }

    // A small thesaurus: c1 -> c2 -> c3 (broader), c4 deprecated,
    // plus an unlabelled blank node concept
    void populate(Dataset &ds) {
        Node type(Uri("http://www.w3.org/1999/02/22-rdf-syntax-ns#type"));
        ds.addTriple(Uri(), Triple(ex("c1"), type, skos("Concept")));
        ds.addTriple(Uri(), Triple(ex("c2"), type, skos("Concept")));
        ds.addTriple(Uri(), Triple(ex("c3"), type, skos("Concept")));
        ds.addTriple(Uri(), Triple(ex("c4"), type, skos("Concept")));
        ds.addTriple(Uri(), Triple(Node(Node::Blank, "anon"), type, skos("Concept")));
        ds.addTriple(Uri(), Triple(ex("c1"), skos("broader"), ex("c2")));
        ds.addTriple(Uri(), Triple(ex("c2"), skos("broader"), ex("c3")));
        ds.addTriple(Uri(), Triple(ex("c1"), skos("prefLabel"), lit("Apple")));
        ds.addTriple(Uri(), Triple(ex("c2"), skos("prefLabel"), lit("Fruit")));
        ds.addTriple(Uri(), Triple(ex("c3"), skos("prefLabel"), lit("Food")));
        ds.addTriple(Uri(), Triple(ex("c4"), skos("prefLabel"), lit("Old")));
        ds.addTriple(Uri(), Triple(ex("c4"), ex("deprecated"), Node::fromVariant(true)));
    }

    void configure(QueryEngine &engine) {
        engine.addPrefix("ex", Uri(exNs()));
        engine.addPrefix("skos", Uri(skosNs()));
    }

    Triples graphContents(const Dataset &ds, Uri name) {
        const Graph *g = ds.getGraph(name);
        if (!g) return Triples();
        return g->match(Triple());
    }

private slots:
    void insertIdempotent() {
        Dataset ds;
        populate(ds);
        QueryEngine engine(&ds);
        configure(engine);

        QString q = "INSERT { ?b skos:narrower ?a } WHERE { ?a skos:broader ?b }";
        InsertReport r1 = engine.execute(q).report;
        QCOMPARE(r1.instantiated, 2);
        QCOMPARE(r1.added, 2);
        Triples once = graphContents(ds, Uri());

        InsertReport r2 = engine.execute(q).report;
        QCOMPARE(r2.instantiated, 2);
        QCOMPARE(r2.added, 0);
        QCOMPARE(graphContents(ds, Uri()), once);
    }

    void insertIntoGraphs() {
        Dataset ds;
        populate(ds);
        QueryEngine engine(&ds);
        configure(engine);

        InsertReport r = engine.execute
            ("INSERT { GRAPH ex:labels { ?c skos:prefLabel ?l } } "
             "WHERE { ?c skos:prefLabel ?l FILTER(?l != \"Old\") }").report;
        QCOMPARE(r.added, 3);
        QVERIFY(ds.hasGraph(Uri(exNs() + "labels")));
        QCOMPARE(graphContents(ds, Uri(exNs() + "labels")).size(), 3);
    }

    void insertGraphVariable() {
        Dataset ds;
        populate(ds);
        QueryEngine engine(&ds);
        configure(engine);

        InsertReport r = engine.execute
            ("INSERT { GRAPH ?g { ?c a skos:Concept } } WHERE { "
             "?c skos:prefLabel ?l BIND(IRI(CONCAT(\"http://example.org/by/\", ?l)) AS ?g) }")
            .report;
        QCOMPARE(r.added, 4);
        QCOMPARE(ds.getGraphNames().size(), 4);
        QVERIFY(ds.hasGraph(Uri(exNs() + "by/Apple")));
    }

    void insertData() {
        Dataset ds;
        QueryEngine engine(&ds);
        configure(engine);
        InsertReport r = engine.execute
            ("INSERT DATA { ex:a skos:prefLabel \"A\" ; skos:broader ex:b }").report;
        QCOMPARE(r.added, 2);
        QCOMPARE(ds.size(), 2);
    }

    void insertDropsUnboundAndInvalid() {
        Dataset ds;
        populate(ds);
        QueryEngine engine(&ds);
        configure(engine);
        // ?x is never bound, and a literal cannot be a subject
        InsertReport r = engine.execute
            ("INSERT { ?c ex:tag ?x . ?l ex:of ?c . ?c ex:labelled ?l } "
             "WHERE { ?c skos:prefLabel ?l }").report;
        QCOMPARE(r.instantiated, 4);
        QCOMPARE(r.added, 4);
    }

    void constructIsSet() {
        Dataset ds;
        populate(ds);
        QueryEngine engine(&ds);
        configure(engine);

        // both branches produce the same triples
        Triples a = engine.execute
            ("CONSTRUCT { ?c a ex:Labelled } WHERE { "
             "{ ?c skos:prefLabel ?l } UNION { ?c skos:prefLabel ?l } }").triples;
        Triples b = engine.execute
            ("CONSTRUCT { ?c a ex:Labelled } WHERE { ?c skos:prefLabel ?l } "
             "ORDER BY DESC(?l)").triples;
        QCOMPARE(a.size(), 4);
        QCOMPARE(a, b);
        for (int i = 1; i < a.size(); ++i) QVERIFY(a[i-1] < a[i]);
        // and the dataset is untouched
        QCOMPARE(ds.size(), 12);
    }

    void constructBlankNodeArena() {
        Dataset ds;
        populate(ds);
        QueryEngine engine(&ds);
        configure(engine);

        Triples tt = engine.execute
            ("CONSTRUCT { _:n ex:about ?c ; ex:label ?l } "
             "WHERE { ?c skos:prefLabel ?l }").triples;
        QCOMPARE(tt.size(), 8);

        // within one solution the label maps to one node; across
        // solutions the nodes differ, and never clash with "anon"
        QHash<Node, Node> aboutOf;
        QSet<Node> blanks;
        foreach (const Triple &t, tt) {
            QCOMPARE(t.a.type, Node::Blank);
            QVERIFY(t.a.value != "anon");
            blanks.insert(t.a);
            if (t.b == ex("about")) aboutOf[t.a] = t.c;
        }
        QCOMPARE(blanks.size(), 4);
        QCOMPARE(aboutOf.size(), 4);
    }

    void noImplicitClosure() {
        Dataset ds;
        populate(ds);
        QueryEngine engine(&ds);
        configure(engine);

        ResultSet direct = engine.execute
            ("SELECT ?b WHERE { ex:c1 skos:broader ?b }").rows;
        QCOMPARE(direct.size(), 1);
        QCOMPARE(direct[0].value("b"), ex("c2"));

        ResultSet closure = engine.execute
            ("SELECT ?b WHERE { ex:c1 skos:broader* ?b }").rows;
        QCOMPARE(closure.size(), 3);

        ResultSet plus = engine.execute
            ("SELECT ?b WHERE { ex:c1 skos:broader+ ?b }").rows;
        QCOMPARE(plus.size(), 2);
    }

    void pathCycleTerminates() {
        Dataset ds;
        populate(ds);
        ds.addTriple(Uri(), Triple(ex("c3"), skos("broader"), ex("c1")));
        QueryEngine engine(&ds);
        configure(engine);
        ResultSet rows = engine.execute
            ("SELECT ?b WHERE { ex:c1 skos:broader* ?b }").rows;
        QCOMPARE(rows.size(), 3);
    }

    void notExistsExcludesDeprecated() {
        Dataset ds;
        populate(ds);
        QueryEngine engine(&ds);
        configure(engine);
        ResultSet rows = engine.execute
            ("SELECT ?c WHERE { ?c a skos:Concept "
             "FILTER NOT EXISTS { ?c ex:deprecated true } }").rows;
        QCOMPARE(rows.size(), 4);
        foreach (const Dictionary &d, rows) QVERIFY(d.value("c") != ex("c4"));
    }

    void kindTestsPartition() {
        Dataset ds;
        populate(ds);
        QueryEngine engine(&ds);
        configure(engine);
        int all = engine.execute("SELECT ?c WHERE { ?c a skos:Concept }").rows.size();
        int uris = engine.execute
            ("SELECT ?c WHERE { ?c a skos:Concept FILTER(isURI(?c)) }").rows.size();
        int blanks = engine.execute
            ("SELECT ?c WHERE { ?c a skos:Concept FILTER(isBlank(?c)) }").rows.size();
        int literals = engine.execute
            ("SELECT ?c WHERE { ?c a skos:Concept FILTER(isLiteral(?c)) }").rows.size();
        QCOMPARE(all, 5);
        QCOMPARE(uris, 4);
        QCOMPARE(blanks, 1);
        QCOMPARE(literals, 0);
    }

    void regexAndStringFunctions() {
        Dataset ds;
        populate(ds);
        QueryEngine engine(&ds);
        configure(engine);
        ResultSet rows = engine.execute
            ("SELECT ?l WHERE { ?c skos:prefLabel ?l FILTER(REGEX(?l, \"^f\", \"i\")) } "
             "ORDER BY ?l").rows;
        QCOMPARE(rows.size(), 2);
        QCOMPARE(rows[0].value("l"), lit("Food"));
        QCOMPARE(rows[1].value("l"), lit("Fruit"));

        Node n = engine.queryFirst
            ("SELECT (STRAFTER(STR(?c), \"example.org/\") AS ?local) "
             "WHERE { ?c skos:prefLabel \"Apple\" }", "local");
        QCOMPARE(n.value, QString("c1"));
    }

    void queryFirstUnbound() {
        Dataset ds;
        populate(ds);
        QueryEngine engine(&ds);
        configure(engine);
        Node n = engine.queryFirst
            ("SELECT ?l WHERE { ?c a skos:Concept OPTIONAL { ?c skos:prefLabel ?l } } "
             "ORDER BY ?l", "l");
        QCOMPARE(n, lit("Apple"));
        n = engine.queryFirst("SELECT ?x WHERE { ?x ex:nothing ?y }", "x");
        QVERIFY(n.isNothing());
    }

    void resourceExceededCommitsNothing() {
        Dataset ds;
        populate(ds);
        QueryEngine engine(&ds);
        configure(engine);
        engine.setStepLimit(5);
        try {
            engine.execute("INSERT { ?a ex:related ?b } "
                           "WHERE { ?a skos:broader* ?b }");
            QFAIL("Expected RDFResourceExceeded");
        } catch (RDFResourceExceeded &) {
            QVERIFY(1);
        }
        QCOMPARE(ds.size(), 12);

        engine.setStepLimit(0);
        InsertReport r = engine.execute
            ("INSERT { ?a ex:related ?b } WHERE { ?a skos:broader* ?b }").report;
        QVERIFY(r.added > 0);
    }

    void syntaxErrorBeforeEvaluation() {
        Dataset ds;
        populate(ds);
        QueryEngine engine(&ds);
        configure(engine);
        try {
            engine.execute("INSERT { ?a ex:p ?b } WHERE { ?a skos:broader ?b ");
            QFAIL("Expected RDFSyntaxError");
        } catch (RDFSyntaxError &) {
            QVERIFY(1);
        }
        try {
            engine.execute("INSERT { ?a ex:p ?b } WHERE { ?a dc:subject ?b }");
            QFAIL("Expected RDFUnknownPrefix");
        } catch (RDFUnknownPrefix &) {
            QVERIFY(1);
        }
        QCOMPARE(ds.size(), 12);
    }

    void wrongForm() {
        Dataset ds;
        QueryEngine engine(&ds);
        configure(engine);
        Query q = engine.prepare("SELECT ?a WHERE { ?a ?b ?c }");
        try {
            engine.construct(q);
            QFAIL("Expected RDFException");
        } catch (RDFException &) {
            QVERIFY(1);
        }
    }

    void parallelEqualsSequential() {
        Dataset ds;
        populate(ds);
        ds.addTriple(Uri(exNs() + "g1"), Triple(ex("c1"), skos("altLabel"), lit("Pomme")));
        ds.addTriple(Uri(exNs() + "g2"), Triple(ex("c2"), skos("altLabel"), lit("Obst")));
        ds.addTriple(Uri(exNs() + "g3"), Triple(ex("c1"), skos("altLabel"), lit("Apfel")));

        QueryEngine sequential(&ds, QueryEngine::SequentialEvaluation);
        QueryEngine parallel(&ds, QueryEngine::ParallelEvaluation);
        configure(sequential);
        configure(parallel);

        QString q = "SELECT ?c ?l ?g WHERE { "
            "{ ?c skos:prefLabel ?l } UNION "
            "{ GRAPH ?g { ?c skos:altLabel ?l } } UNION "
            "{ ?c skos:broader+ ?x . ?x skos:prefLabel ?l } }";

        for (int i = 0; i < 5; ++i) {
            ResultSet a = sequential.execute(q).rows;
            ResultSet b = parallel.execute(q).rows;
            QCOMPARE(a.size(), 10);
            QCOMPARE(a, b);
        }
    }

    void parallelResourceExceeded() {
        Dataset ds;
        populate(ds);
        QueryEngine engine(&ds, QueryEngine::ParallelEvaluation);
        configure(engine);
        engine.setStepLimit(3);
        try {
            engine.execute("SELECT * WHERE { { ?a skos:broader* ?b } UNION "
                           "{ ?a skos:broader* ?c } }");
            QFAIL("Expected RDFResourceExceeded");
        } catch (RDFResourceExceeded &) {
            QVERIFY(1);
        }
    }
};

}

#endif
