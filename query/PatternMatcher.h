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

#ifndef _ONTOQUAY_PATTERN_MATCHER_H_
#define _ONTOQUAY_PATTERN_MATCHER_H_

#include "Pattern.h"
#include "ExpressionEvaluator.h"

namespace Ontoquay
{

class Dataset;
class Graph;
class EvaluationBudget;

/**
 * \class PatternMatcher PatternMatcher.h <ontoquay/query/PatternMatcher.h>
 *
 * Evaluates group graph patterns against a Dataset, producing
 * sequences of solutions.
 *
 * Evaluation is always relative to a graph context, initially the
 * dataset's default graph and changed by GRAPH elements.  The order
 * of the solutions returned is deterministic: triple matches are
 * produced in triple order, joins keep left-then-right order, UNION
 * branches and GRAPH iterations are concatenated in branch and graph
 * name order.
 *
 * In parallel mode, the branches of a UNION and the iterations of a
 * GRAPH ?var element are evaluated concurrently on the global
 * QThreadPool and merged in the same order as sequential evaluation
 * would produce, so the results are identical.
 *
 * The matcher never modifies the dataset.
 *
 * As an ExistsHandler, the matcher evaluates EXISTS patterns found
 * outside the WHERE clause (in projections and ORDER BY keys) against
 * the default graph.
 */
class PatternMatcher : public ExistsHandler
{
public:
    /**
     * Construct a matcher over the given dataset.  The budget is
     * ticked throughout evaluation and may be 0 for an unlimited
     * evaluation.
     */
    PatternMatcher(const Dataset *dataset, EvaluationBudget *budget,
                   bool parallel = false);
    virtual ~PatternMatcher();

    /**
     * Evaluate a pattern against the default graph.
     */
    ResultSet evaluate(const GroupPattern &pattern) const;

    /**
     * Evaluate a pattern against the given graph, extending each of
     * the seed solutions.  The pattern's FILTERs see the seed
     * bindings.
     */
    ResultSet evaluate(const GroupPattern &pattern, const Graph *graph,
                       const ResultSet &seed) const;

    /**
     * Return the extensions of the given bindings that match a single
     * triple or path pattern in the given graph.
     */
    ResultSet matchTriple(const TriplePattern &pattern, const Graph *graph,
                          const Dictionary &bindings) const;

    // ExistsHandler interface
    virtual bool exists(const GroupPattern &pattern,
                        const Dictionary &bindings) const;

private:
    const Dataset *m_dataset;
    EvaluationBudget *m_budget;
    bool m_parallel;

    struct BranchResult;

    ResultSet evaluateGroup(const GroupPattern &pattern, const Graph *graph,
                            const ResultSet &seed, bool applyFilters) const;

    ResultSet evaluateTriples(const TriplePatterns &patterns,
                              const Graph *graph,
                              const ResultSet &input) const;

    ResultSet evaluateUnion(const QList<GroupPatternPtr> &branches,
                            const Graph *graph) const;

    ResultSet evaluateOptional(const ResultSet &left,
                               const GroupPattern &pattern,
                               const Graph *graph) const;

    ResultSet evaluateGraph(const PatternElement &element,
                            const ResultSet &current) const;

    ResultSet evaluateBind(const PatternElement &element,
                           const Graph *graph,
                           const ResultSet &current) const;

    ResultSet filter(const ResultSet &input, const ExpressionList &filters,
                     const Graph *graph) const;

    ResultSet matchGraphControl(const TriplePattern &pattern,
                                const Dictionary &bindings) const;

    ResultSet evaluateBranch(GroupPatternPtr pattern, const Graph *graph,
                             QString graphVariable) const;

    BranchResult runBranch(GroupPatternPtr pattern, const Graph *graph,
                           QString graphVariable) const;

    ResultSet evaluateBranches(const QList<GroupPatternPtr> &patterns,
                               const QList<const Graph *> &graphs,
                               QString graphVariable) const;

    PatternMatcher(const PatternMatcher &);
    PatternMatcher &operator=(const PatternMatcher &);
};

}

#endif
