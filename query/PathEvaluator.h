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

#ifndef _ONTOQUAY_PATH_EVALUATOR_H_
#define _ONTOQUAY_PATH_EVALUATOR_H_

#include "PropertyPath.h"
#include "../Node.h"

#include <QPair>
#include <QList>
#include <QSet>

namespace Ontoquay
{

class Graph;
class EvaluationBudget;

typedef QPair<Node, Node> NodePair;
typedef QList<NodePair> NodePairs;

/**
 * \class PathEvaluator PathEvaluator.h <ontoquay/query/PathEvaluator.h>
 *
 * Evaluates property paths against a single graph.
 *
 * All path forms go through one traversal function, parameterised by
 * the direction of travel.  Repetition is a breadth-first search in
 * which every node is expanded at most once, so traversal terminates
 * on cyclic graphs and reports each reachable node exactly once.
 * Every expansion is counted against the evaluation budget, which may
 * abort the traversal with RDFResourceExceeded.
 *
 * A null graph behaves as an empty one.
 */
class PathEvaluator
{
public:
    enum Direction {
        Forward,  ///< from subject towards object
        Backward  ///< from object towards subject
    };

    PathEvaluator(const Graph *graph, EvaluationBudget *budget);

    /**
     * Return the distinct nodes reachable from start by following
     * the path in the given direction, in order of discovery.
     */
    Nodes evaluate(const PropertyPath &path, Node start, Direction d) const;

    /**
     * Return the distinct (subject, object) pairs connected by the
     * path, where either or both of subject and object may be Nothing
     * to leave that end unconstrained.
     *
     * If both ends are unconstrained, every candidate start node is
     * enumerated (see getStartNodes) and traversed from in turn.
     */
    NodePairs evaluatePairs(const PropertyPath &path, Node subject, Node object) const;

    /**
     * Return the nodes from which a traversal of the path in the
     * given direction could produce any result, in node order.  For a
     * path that can match a zero-length route this is every node in
     * the graph.
     */
    Nodes getStartNodes(const PropertyPath &path, Direction d) const;

private:
    const Graph *m_graph;
    EvaluationBudget *m_budget;

    void traverse(const PropertyPath &path, const Node &from, Direction d,
                  Nodes &out, QSet<Node> &seen) const;

    void closure(const PropertyPath &path, const Node &from, Direction d,
                 bool includeStart, Nodes &out, QSet<Node> &seen) const;

    void startNodes(const PropertyPath &path, Direction d, QSet<Node> &out) const;

    static Direction flip(Direction d) {
        return d == Forward ? Backward : Forward;
    }
};

}

#endif
