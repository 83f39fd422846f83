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

#include "PatternMatcher.h"
#include "PathEvaluator.h"
#include "ExpressionEvaluator.h"
#include "EvaluationBudget.h"
#include "Solution.h"

#include "../Dataset.h"
#include "../RDFException.h"
#include "../Debug.h"

#include <QtConcurrentRun>
#include <QFuture>
#include <QSet>

namespace Ontoquay
{

// Left inputs up to this size are matched by substituting their
// bindings into each pattern; larger ones are hash joined
static const int substitutionThreshold = 16;

struct PatternMatcher::BranchResult
{
    enum Status { OK, ResourceExceeded, Failed, InternalFailure };

    BranchResult() : status(OK) { }

    ResultSet results;
    Status status;
    QString message;
};

namespace {

class GraphExistsHandler : public ExistsHandler
{
public:
    GraphExistsHandler(const PatternMatcher *matcher,
                       const Graph *graph,
                       EvaluationBudget *budget) :
        m_matcher(matcher), m_graph(graph), m_budget(budget) { }
    virtual ~GraphExistsHandler() { }

    virtual bool exists(const GroupPattern &pattern,
                        const Dictionary &bindings) const {
        if (m_budget) m_budget->tick();
        ResultSet seed;
        seed.push_back(bindings);
        return !m_matcher->evaluate(pattern, m_graph, seed).empty();
    }

private:
    const PatternMatcher *m_matcher;
    const Graph *m_graph;
    EvaluationBudget *m_budget;
};

bool
bindTerm(Dictionary &d, const PatternTerm &t, const Node &n)
{
    if (!t.isVariable()) return true;
    Dictionary::iterator i = d.find(t.getVariable());
    if (i == d.end()) {
        d.insert(t.getVariable(), n);
        return true;
    }
    return i.value() == n;
}

}

PatternMatcher::PatternMatcher(const Dataset *dataset, EvaluationBudget *budget,
                               bool parallel) :
    m_dataset(dataset),
    m_budget(budget),
    m_parallel(parallel)
{
}

PatternMatcher::~PatternMatcher()
{
}

ResultSet
PatternMatcher::evaluate(const GroupPattern &pattern) const
{
    ResultSet seed;
    seed.push_back(Dictionary());
    ResultSet results = evaluateGroup(pattern, m_dataset->getDefaultGraph(),
                                      seed, true);
    DEBUG << "PatternMatcher::evaluate: " << results.size() << " solution(s)";
    return results;
}

ResultSet
PatternMatcher::evaluate(const GroupPattern &pattern, const Graph *graph,
                         const ResultSet &seed) const
{
    return evaluateGroup(pattern, graph, seed, true);
}

bool
PatternMatcher::exists(const GroupPattern &pattern,
                       const Dictionary &bindings) const
{
    GraphExistsHandler handler(this, m_dataset->getDefaultGraph(), m_budget);
    return handler.exists(pattern, bindings);
}

ResultSet
PatternMatcher::evaluateGroup(const GroupPattern &pattern, const Graph *graph,
                              const ResultSet &seed, bool applyFilters) const
{
    ResultSet current = seed;

    foreach (const PatternElement &e, pattern.getElements()) {

        if (current.empty()) break;

        switch (e.type) {

        case PatternElement::TriplesBlock:
            current = evaluateTriples(e.triples, graph, current);
            break;

        case PatternElement::Group: {
            ResultSet unit;
            unit.push_back(Dictionary());
            current = join(current,
                           evaluateGroup(*e.groups[0], graph, unit, true),
                           m_budget);
            break;
        }

        case PatternElement::Union:
            current = join(current, evaluateUnion(e.groups, graph), m_budget);
            break;

        case PatternElement::Optional:
            current = evaluateOptional(current, *e.groups[0], graph);
            break;

        case PatternElement::Graph:
            current = evaluateGraph(e, current);
            break;

        case PatternElement::Bind:
            current = evaluateBind(e, graph, current);
            break;

        case PatternElement::Filter:
            break;
        }
    }

    if (applyFilters && !current.empty()) {
        ExpressionList filters = pattern.getFilters();
        if (!filters.empty()) {
            current = filter(current, filters, graph);
        }
    }

    return current;
}

ResultSet
PatternMatcher::evaluateTriples(const TriplePatterns &patterns,
                                const Graph *graph,
                                const ResultSet &input) const
{
    ResultSet current = input;

    foreach (const TriplePattern &tp, patterns) {

        if (current.empty()) break;

        if (tp.hasPath() || current.size() <= substitutionThreshold) {
            ResultSet next;
            foreach (const Dictionary &d, current) {
                if (m_budget) m_budget->tick();
                next += matchTriple(tp, graph, d);
            }
            current = next;
        } else {
            current = join(current, matchTriple(tp, graph, Dictionary()),
                           m_budget);
        }
    }

    return current;
}

ResultSet
PatternMatcher::matchTriple(const TriplePattern &tp, const Graph *graph,
                            const Dictionary &bindings) const
{
    ResultSet results;

    Node s = tp.subject.resolve(bindings);
    Node o = tp.object.resolve(bindings);

    // Literals cannot be subjects
    if (s.type == Node::Literal) return results;

    if (tp.hasPath()) {
        PathEvaluator evaluator(graph, m_budget);
        NodePairs pairs = evaluator.evaluatePairs(*tp.path, s, o);
        foreach (const NodePair &p, pairs) {
            Dictionary d(bindings);
            if (bindTerm(d, tp.subject, p.first) &&
                bindTerm(d, tp.object, p.second)) {
                results.push_back(d);
            }
        }
        return results;
    }

    Node p = tp.predicate.resolve(bindings);
    if (p.type != Node::Nothing && p.type != Node::URI) return results;

    if (p.type == Node::URI &&
        m_dataset->getGraphControlSource() &&
        p.value == m_dataset->getGraphControlPredicate().toString()) {
        return matchGraphControl(tp, bindings);
    }

    if (!graph) return results;

    Triples tt = graph->match(Triple(s, p, o));
    foreach (const Triple &t, tt) {
        Dictionary d(bindings);
        if (bindTerm(d, tp.subject, t.a) &&
            bindTerm(d, tp.predicate, t.b) &&
            bindTerm(d, tp.object, t.c)) {
            results.push_back(d);
        }
    }

    return results;
}

ResultSet
PatternMatcher::matchGraphControl(const TriplePattern &tp,
                                  const Dictionary &bindings) const
{
    ResultSet results;

    Node s = tp.subject.resolve(bindings);
    Node o = tp.object.resolve(bindings);

    GraphTags tags = m_dataset->getGraphControlSource()->getGraphTags();

    foreach (const GraphTag &gt, tags) {
        Node graphNode(gt.graph);
        Node tagNode(Node::Literal, gt.tag);
        if (s.type != Node::Nothing && s != graphNode) continue;
        if (o.type != Node::Nothing && o != tagNode) continue;
        Dictionary d(bindings);
        if (bindTerm(d, tp.subject, graphNode) &&
            bindTerm(d, tp.object, tagNode)) {
            results.push_back(d);
        }
    }

    DEBUG << "PatternMatcher::matchGraphControl: " << results.size()
          << " of " << tags.size() << " graph tag(s) match";

    return results;
}

ResultSet
PatternMatcher::evaluateUnion(const QList<GroupPatternPtr> &branches,
                              const Graph *graph) const
{
    QList<const Graph *> graphs;
    for (int i = 0; i < branches.size(); ++i) graphs.push_back(graph);
    return evaluateBranches(branches, graphs, QString());
}

ResultSet
PatternMatcher::evaluateOptional(const ResultSet &left,
                                 const GroupPattern &pattern,
                                 const Graph *graph) const
{
    ResultSet unit;
    unit.push_back(Dictionary());
    ResultSet right = evaluateGroup(pattern, graph, unit, false);
    ExpressionList conditions = pattern.getFilters();

    GraphExistsHandler handler(this, graph, m_budget);
    ExpressionEvaluator evaluator(&handler);

    QSet<QString> lv = QSet<QString>::fromList(commonlyBound(left));
    QSet<QString> rv = QSet<QString>::fromList(commonlyBound(right));
    QStringList keyVars = lv.intersect(rv).toList();
    keyVars.sort();

    QHash<QString, QList<int> > buckets;
    for (int i = 0; i < right.size(); ++i) {
        buckets[solutionKey(right[i], keyVars)].push_back(i);
    }

    ResultSet result;

    foreach (const Dictionary &l, left) {

        if (m_budget) m_budget->tick();

        bool extended = false;
        QList<int> candidates = buckets.value(solutionKey(l, keyVars));

        foreach (int j, candidates) {
            if (!compatible(l, right[j])) continue;
            Dictionary m = merged(l, right[j]);
            bool accept = true;
            foreach (ExpressionPtr c, conditions) {
                if (!evaluator.test(*c, m)) {
                    accept = false;
                    break;
                }
            }
            if (accept) {
                result.push_back(m);
                extended = true;
            }
        }

        if (!extended) result.push_back(l);
    }

    return result;
}

ResultSet
PatternMatcher::evaluateGraph(const PatternElement &e,
                              const ResultSet &current) const
{
    if (!e.graph.isVariable()) {
        const Graph *g = m_dataset->getGraph(Uri(e.graph.getNode().value));
        if (!g) {
            DEBUG << "PatternMatcher::evaluateGraph: no graph named "
                  << e.graph.getNode() << ", matching nothing";
            return ResultSet();
        }
        ResultSet unit;
        unit.push_back(Dictionary());
        return join(current, evaluateGroup(*e.groups[0], g, unit, true),
                    m_budget);
    }

    QString var = e.graph.getVariable();

    // If every incoming solution already names its graph, only those
    // graphs need to be visited
    UriList names;
    bool allBound = true;
    QSet<Uri> boundNames;
    foreach (const Dictionary &d, current) {
        Node n = d.value(var);
        if (n.type == Node::Nothing) {
            allBound = false;
            break;
        }
        if (n.type == Node::URI) boundNames.insert(Uri(n.value));
    }
    if (allBound) {
        foreach (Uri u, m_dataset->getGraphNames()) {
            if (boundNames.contains(u)) names.push_back(u);
        }
    } else {
        names = m_dataset->getGraphNames();
    }

    QList<GroupPatternPtr> patterns;
    QList<const Graph *> graphs;
    foreach (Uri u, names) {
        const Graph *g = m_dataset->getGraph(u);
        if (!g) continue;
        patterns.push_back(e.groups[0]);
        graphs.push_back(g);
    }

    DEBUG << "PatternMatcher::evaluateGraph: iterating ?" << var
          << " over " << graphs.size() << " named graph(s)";

    return join(current, evaluateBranches(patterns, graphs, var), m_budget);
}

ResultSet
PatternMatcher::evaluateBind(const PatternElement &e, const Graph *graph,
                             const ResultSet &current) const
{
    GraphExistsHandler handler(this, graph, m_budget);
    ExpressionEvaluator evaluator(&handler);

    ResultSet result;
    foreach (const Dictionary &d, current) {
        if (d.value(e.variable).type != Node::Nothing) {
            result.push_back(d);
            continue;
        }
        Node v = evaluator.evaluate(*e.expression, d);
        Dictionary extended(d);
        if (v.type != Node::Nothing) extended.insert(e.variable, v);
        result.push_back(extended);
    }
    return result;
}

ResultSet
PatternMatcher::filter(const ResultSet &input, const ExpressionList &filters,
                       const Graph *graph) const
{
    GraphExistsHandler handler(this, graph, m_budget);
    ExpressionEvaluator evaluator(&handler);

    ResultSet result;
    foreach (const Dictionary &d, input) {
        bool accept = true;
        foreach (ExpressionPtr f, filters) {
            if (!evaluator.test(*f, d)) {
                accept = false;
                break;
            }
        }
        if (accept) result.push_back(d);
    }
    return result;
}

ResultSet
PatternMatcher::evaluateBranch(GroupPatternPtr pattern, const Graph *graph,
                               QString graphVariable) const
{
    ResultSet unit;
    unit.push_back(Dictionary());
    ResultSet rs = evaluateGroup(*pattern, graph, unit, true);
    if (graphVariable == "") return rs;

    ResultSet result;
    Node name(graph->getName());
    PatternTerm var = PatternTerm::variable(graphVariable);
    foreach (const Dictionary &d, rs) {
        Dictionary bound(d);
        if (bindTerm(bound, var, name)) result.push_back(bound);
    }
    return result;
}

PatternMatcher::BranchResult
PatternMatcher::runBranch(GroupPatternPtr pattern, const Graph *graph,
                          QString graphVariable) const
{
    BranchResult br;

    try {
        br.results = evaluateBranch(pattern, graph, graphVariable);
    } catch (const RDFResourceExceeded &e) {
        br.status = BranchResult::ResourceExceeded;
        br.message = e.message();
        if (m_budget) m_budget->cancel();
    } catch (const RDFInternalError &e) {
        br.status = BranchResult::InternalFailure;
        br.message = e.message();
    } catch (const RDFException &e) {
        br.status = BranchResult::Failed;
        br.message = e.message();
    } catch (const std::exception &e) {
        br.status = BranchResult::InternalFailure;
        br.message = QString::fromLocal8Bit(e.what());
    }

    return br;
}

ResultSet
PatternMatcher::evaluateBranches(const QList<GroupPatternPtr> &patterns,
                                 const QList<const Graph *> &graphs,
                                 QString graphVariable) const
{
    ResultSet result;

    if (!m_parallel || patterns.size() < 2) {
        for (int i = 0; i < patterns.size(); ++i) {
            result += evaluateBranch(patterns[i], graphs[i], graphVariable);
        }
        return result;
    }

    QList<QFuture<BranchResult> > futures;
    for (int i = 0; i < patterns.size(); ++i) {
        futures.push_back(QtConcurrent::run(this, &PatternMatcher::runBranch,
                                            patterns[i], graphs[i],
                                            graphVariable));
    }

    // Wait for every branch before reporting any failure, so that no
    // branch is still running against the dataset when we return
    QList<BranchResult> branchResults;
    for (int i = 0; i < futures.size(); ++i) {
        branchResults.push_back(futures[i].result());
    }

    for (int i = 0; i < branchResults.size(); ++i) {
        const BranchResult &br = branchResults[i];
        switch (br.status) {
        case BranchResult::OK:
            result += br.results;
            break;
        case BranchResult::ResourceExceeded:
            throw RDFResourceExceeded(br.message);
        case BranchResult::InternalFailure:
            throw RDFInternalError(br.message);
        case BranchResult::Failed:
            throw RDFException(br.message);
        }
    }

    DEBUG << "PatternMatcher::evaluateBranches: merged " << futures.size()
          << " parallel branch(es) into " << result.size() << " solution(s)";

    return result;
}

}
