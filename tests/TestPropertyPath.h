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

#ifndef _TEST_PROPERTY_PATH_H_
#define _TEST_PROPERTY_PATH_H_

#include <QObject>
#include <QtTest>

#include "../Graph.h"
#include "../RDFException.h"
#include "../query/PropertyPath.h"
#include "../query/PathEvaluator.h"
#include "../query/EvaluationBudget.h"

namespace Ontoquay {

class TestPropertyPath : public QObject
{
    Q_OBJECT

    Node n(QString name) { return Node(Uri("http://example.org/" + name)); }
    Uri p(QString name) { return Uri("http://example.org/" + name); }

private slots:
    void initTestCase() {
        // a -next-> b -next-> c -next-> a, with c -other-> d
        graph.add(Triple(n("a"), Node(p("next")), n("b")));
        graph.add(Triple(n("b"), Node(p("next")), n("c")));
        graph.add(Triple(n("c"), Node(p("next")), n("a")));
        graph.add(Triple(n("c"), Node(p("other")), n("d")));
    }

    void atomic() {
        PathEvaluator pe(&graph, 0);
        Nodes r = pe.evaluate(*PropertyPath::atomic(p("next")), n("a"),
                              PathEvaluator::Forward);
        QCOMPARE(r.size(), 1);
        QCOMPARE(r[0], n("b"));
    }

    void zeroOrMoreCycleTerminates() {
        PathEvaluator pe(&graph, 0);
        PropertyPathPtr path = PropertyPath::zeroOrMore(PropertyPath::atomic(p("next")));
        Nodes r = pe.evaluate(*path, n("a"), PathEvaluator::Forward);
        // each reachable node exactly once, start included
        QCOMPARE(r.size(), 3);
        QCOMPARE(r.toSet().size(), 3);
        QVERIFY(r.contains(n("a")));
        QVERIFY(r.contains(n("b")));
        QVERIFY(r.contains(n("c")));
        QVERIFY(!r.contains(n("d")));
    }

    void zeroOrMoreIsolatedNode() {
        // zero-length match from a node with no edges
        PathEvaluator pe(&graph, 0);
        PropertyPathPtr path = PropertyPath::zeroOrMore(PropertyPath::atomic(p("next")));
        Nodes r = pe.evaluate(*path, n("d"), PathEvaluator::Forward);
        QCOMPARE(r.size(), 1);
        QCOMPARE(r[0], n("d"));
    }

    void oneOrMoreCycle() {
        PathEvaluator pe(&graph, 0);
        PropertyPathPtr path = PropertyPath::oneOrMore(PropertyPath::atomic(p("next")));
        Nodes r = pe.evaluate(*path, n("a"), PathEvaluator::Forward);
        // a is reached again round the cycle
        QCOMPARE(r.size(), 3);
        QVERIFY(r.contains(n("a")));
        r = pe.evaluate(*path, n("d"), PathEvaluator::Forward);
        QCOMPARE(r.size(), 0);
    }

    void zeroOrOne() {
        PathEvaluator pe(&graph, 0);
        PropertyPathPtr path = PropertyPath::zeroOrOne(PropertyPath::atomic(p("next")));
        Nodes r = pe.evaluate(*path, n("a"), PathEvaluator::Forward);
        QCOMPARE(r.size(), 2);
        QCOMPARE(r[0], n("a"));
        QCOMPARE(r[1], n("b"));
    }

    void inverse() {
        PathEvaluator pe(&graph, 0);
        PropertyPathPtr path = PropertyPath::inverse(PropertyPath::atomic(p("other")));
        Nodes r = pe.evaluate(*path, n("d"), PathEvaluator::Forward);
        QCOMPARE(r.size(), 1);
        QCOMPARE(r[0], n("c"));
    }

    void sequence() {
        PathEvaluator pe(&graph, 0);
        PropertyPathPtr path = PropertyPath::sequence
            (PropertyPath::atomic(p("next")),
             PropertyPath::sequence(PropertyPath::atomic(p("next")),
                                    PropertyPath::atomic(p("other"))));
        Nodes r = pe.evaluate(*path, n("a"), PathEvaluator::Forward);
        QCOMPARE(r.size(), 1);
        QCOMPARE(r[0], n("d"));
        r = pe.evaluate(*path, n("d"), PathEvaluator::Backward);
        QCOMPARE(r.size(), 1);
        QCOMPARE(r[0], n("a"));
    }

    void alternation() {
        PathEvaluator pe(&graph, 0);
        PropertyPathPtr path = PropertyPath::alternation
            (PropertyPath::atomic(p("next")), PropertyPath::atomic(p("other")));
        Nodes r = pe.evaluate(*path, n("c"), PathEvaluator::Forward);
        QCOMPARE(r.size(), 2);
        QCOMPARE(r[0], n("a"));
        QCOMPARE(r[1], n("d"));
    }

    void pairsBothUnbound() {
        PathEvaluator pe(&graph, 0);
        PropertyPathPtr path = PropertyPath::oneOrMore(PropertyPath::atomic(p("next")));
        NodePairs pairs = pe.evaluatePairs(*path, Node(), Node());
        // every node of the cycle reaches every node of the cycle
        QCOMPARE(pairs.size(), 9);
        QCOMPARE(pairs.toSet().size(), 9);
    }

    void pairsZeroLengthIncludesAllNodes() {
        PathEvaluator pe(&graph, 0);
        PropertyPathPtr path = PropertyPath::zeroOrMore(PropertyPath::atomic(p("other")));
        NodePairs pairs = pe.evaluatePairs(*path, Node(), Node());
        // four reflexive pairs plus c -> d
        QCOMPARE(pairs.size(), 5);
        QVERIFY(pairs.contains(NodePair(n("d"), n("d"))));
        QVERIFY(pairs.contains(NodePair(n("c"), n("d"))));
    }

    void pairsZeroLengthHeadSequence() {
        // the first edge of missing*/other comes from "other"
        PathEvaluator pe(&graph, 0);
        PropertyPathPtr path = PropertyPath::sequence
            (PropertyPath::zeroOrMore(PropertyPath::atomic(p("missing"))),
             PropertyPath::atomic(p("other")));
        NodePairs pairs = pe.evaluatePairs(*path, Node(), Node());
        QCOMPARE(pairs.size(), 1);
        QCOMPARE(pairs[0], NodePair(n("c"), n("d")));

        path = PropertyPath::sequence
            (PropertyPath::zeroOrOne(PropertyPath::atomic(p("missing"))),
             PropertyPath::atomic(p("other")));
        pairs = pe.evaluatePairs(*path, Node(), Node());
        QCOMPARE(pairs.size(), 1);
        QCOMPARE(pairs[0], NodePair(n("c"), n("d")));

        // and the same under inversion, where the walk runs backward
        path = PropertyPath::inverse
            (PropertyPath::sequence
             (PropertyPath::atomic(p("other")),
              PropertyPath::zeroOrMore(PropertyPath::atomic(p("missing")))));
        pairs = pe.evaluatePairs(*path, Node(), Node());
        QCOMPARE(pairs.size(), 1);
        QCOMPARE(pairs[0], NodePair(n("d"), n("c")));
    }

    void pairsObjectBound() {
        PathEvaluator pe(&graph, 0);
        PropertyPathPtr path = PropertyPath::oneOrMore(PropertyPath::atomic(p("next")));
        NodePairs pairs = pe.evaluatePairs(*path, Node(), n("b"));
        QCOMPARE(pairs.size(), 3);
        pairs = pe.evaluatePairs(*path, n("a"), n("d"));
        QCOMPARE(pairs.size(), 0);
    }

    void matchesZeroLength() {
        QVERIFY(PropertyPath::zeroOrMore(PropertyPath::atomic(p("next")))
                ->matchesZeroLength());
        QVERIFY(!PropertyPath::oneOrMore(PropertyPath::atomic(p("next")))
                ->matchesZeroLength());
        QVERIFY(!PropertyPath::atomic(p("next"))->matchesZeroLength());
    }

    void budgetExceeded() {
        EvaluationBudget budget(3);
        budget.start();
        PathEvaluator pe(&graph, &budget);
        PropertyPathPtr path = PropertyPath::zeroOrMore(PropertyPath::atomic(p("next")));
        try {
            pe.evaluatePairs(*path, Node(), Node());
            QFAIL("Expected RDFResourceExceeded");
        } catch (RDFResourceExceeded &) {
            QVERIFY(budget.getSteps() > 3);
        }
    }

    void budgetCancelled() {
        EvaluationBudget budget;
        budget.start();
        budget.cancel();
        QVERIFY(budget.isCancelled());
        PathEvaluator pe(&graph, &budget);
        try {
            pe.evaluate(*PropertyPath::atomic(p("next")), n("a"),
                        PathEvaluator::Forward);
            QFAIL("Expected RDFResourceExceeded");
        } catch (RDFResourceExceeded &) {
            QVERIFY(1);
        }
    }

private:
    Graph graph;
};

}

#endif
