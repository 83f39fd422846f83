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

#include "PathEvaluator.h"
#include "EvaluationBudget.h"

#include "../Graph.h"
#include "../Debug.h"

#include <algorithm>

namespace Ontoquay
{

PathEvaluator::PathEvaluator(const Graph *graph, EvaluationBudget *budget) :
    m_graph(graph),
    m_budget(budget)
{
}

Nodes
PathEvaluator::evaluate(const PropertyPath &path, Node start, Direction d) const
{
    Nodes out;
    QSet<Node> seen;
    traverse(path, start, d, out, seen);
    return out;
}

NodePairs
PathEvaluator::evaluatePairs(const PropertyPath &path, Node subject, Node object) const
{
    NodePairs pairs;

    if (subject.type != Node::Nothing) {
        Nodes targets = evaluate(path, subject, Forward);
        if (object.type != Node::Nothing) {
            if (targets.contains(object)) {
                pairs.push_back(NodePair(subject, object));
            }
        } else {
            for (int i = 0; i < targets.size(); ++i) {
                pairs.push_back(NodePair(subject, targets[i]));
            }
        }
        return pairs;
    }

    if (object.type != Node::Nothing) {
        Nodes sources = evaluate(path, object, Backward);
        for (int i = 0; i < sources.size(); ++i) {
            pairs.push_back(NodePair(sources[i], object));
        }
        return pairs;
    }

    // Neither end bound: walk from every possible start
    Nodes starts = getStartNodes(path, Forward);
    DEBUG << "PathEvaluator::evaluatePairs: unbound path " << path.toString()
          << " from " << starts.size() << " start node(s)";
    for (int i = 0; i < starts.size(); ++i) {
        if (m_budget) m_budget->tick();
        Nodes targets = evaluate(path, starts[i], Forward);
        for (int j = 0; j < targets.size(); ++j) {
            pairs.push_back(NodePair(starts[i], targets[j]));
        }
    }
    return pairs;
}

Nodes
PathEvaluator::getStartNodes(const PropertyPath &path, Direction d) const
{
    if (!m_graph) return Nodes();
    if (path.matchesZeroLength()) {
        return m_graph->getNodes();
    }
    QSet<Node> nodes;
    startNodes(path, d, nodes);
    Nodes result = nodes.toList();
    std::sort(result.begin(), result.end());
    return result;
}

void
PathEvaluator::startNodes(const PropertyPath &path, Direction d, QSet<Node> &out) const
{
    switch (path.getType()) {

    case PropertyPath::Atomic: {
        Triples tt = m_graph->match(Triple(Node(), Node(path.getPredicate()), Node()));
        for (int i = 0; i < tt.size(); ++i) {
            out.insert(d == Forward ? tt[i].a : tt[i].c);
        }
        break;
    }

    case PropertyPath::Inverse:
        startNodes(*path.getLeft(), flip(d), out);
        break;

    case PropertyPath::Sequence: {
        const PropertyPath &first =
            (d == Forward ? *path.getLeft() : *path.getRight());
        const PropertyPath &second =
            (d == Forward ? *path.getRight() : *path.getLeft());
        startNodes(first, d, out);
        // If the first operand can be skipped, the first edge may
        // come from the second one
        if (first.matchesZeroLength()) startNodes(second, d, out);
        break;
    }

    case PropertyPath::Alternation:
        startNodes(*path.getLeft(), d, out);
        startNodes(*path.getRight(), d, out);
        break;

    case PropertyPath::OneOrMore:
    case PropertyPath::ZeroOrMore:
    case PropertyPath::ZeroOrOne:
        // The zero-length forms are handled by the caller; for any
        // other route the first step is a step of the operand
        startNodes(*path.getLeft(), d, out);
        break;
    }
}

void
PathEvaluator::traverse(const PropertyPath &path, const Node &from, Direction d,
                        Nodes &out, QSet<Node> &seen) const
{
    if (m_budget) m_budget->tick();

    switch (path.getType()) {

    case PropertyPath::Atomic: {
        if (!m_graph) return;
        Node pred(path.getPredicate());
        Triples tt;
        if (d == Forward) {
            if (from.type == Node::Literal) return;
            tt = m_graph->match(Triple(from, pred, Node()));
        } else {
            tt = m_graph->match(Triple(Node(), pred, from));
        }
        for (int i = 0; i < tt.size(); ++i) {
            const Node &n = (d == Forward ? tt[i].c : tt[i].a);
            if (!seen.contains(n)) {
                seen.insert(n);
                out.push_back(n);
            }
        }
        break;
    }

    case PropertyPath::Inverse:
        traverse(*path.getLeft(), from, flip(d), out, seen);
        break;

    case PropertyPath::Sequence: {
        const PropertyPath &first =
            (d == Forward ? *path.getLeft() : *path.getRight());
        const PropertyPath &second =
            (d == Forward ? *path.getRight() : *path.getLeft());
        Nodes middle = evaluate(first, from, d);
        for (int i = 0; i < middle.size(); ++i) {
            traverse(second, middle[i], d, out, seen);
        }
        break;
    }

    case PropertyPath::Alternation:
        traverse(*path.getLeft(), from, d, out, seen);
        traverse(*path.getRight(), from, d, out, seen);
        break;

    case PropertyPath::ZeroOrMore:
        closure(*path.getLeft(), from, d, true, out, seen);
        break;

    case PropertyPath::OneOrMore:
        closure(*path.getLeft(), from, d, false, out, seen);
        break;

    case PropertyPath::ZeroOrOne:
        if (!seen.contains(from)) {
            seen.insert(from);
            out.push_back(from);
        }
        traverse(*path.getLeft(), from, d, out, seen);
        break;
    }
}

void
PathEvaluator::closure(const PropertyPath &path, const Node &from, Direction d,
                       bool includeStart, Nodes &out, QSet<Node> &seen) const
{
    // Breadth-first; "reached" holds every node emitted by this
    // closure and "expanded" every node whose successors we have
    // already taken, so each node is expanded at most once
    QSet<Node> reached;
    QSet<Node> expanded;
    Nodes queue;

    if (includeStart) {
        reached.insert(from);
        if (!seen.contains(from)) {
            seen.insert(from);
            out.push_back(from);
        }
    }
    queue.push_back(from);

    for (int qi = 0; qi < queue.size(); ++qi) {
        Node n = queue[qi];
        if (expanded.contains(n)) continue;
        expanded.insert(n);
        if (m_budget) m_budget->tick();
        Nodes next = evaluate(path, n, d);
        for (int i = 0; i < next.size(); ++i) {
            const Node &m = next[i];
            if (reached.contains(m)) continue;
            reached.insert(m);
            if (!seen.contains(m)) {
                seen.insert(m);
                out.push_back(m);
            }
            if (!expanded.contains(m)) queue.push_back(m);
        }
    }
}

}
