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

#ifndef _ONTOQUAY_AGGREGATOR_H_
#define _ONTOQUAY_AGGREGATOR_H_

#include "Query.h"
#include "ExpressionEvaluator.h"

namespace Ontoquay
{

/**
 * \class Aggregator Aggregator.h <ontoquay/query/Aggregator.h>
 *
 * Turns the solutions of a WHERE clause into SELECT result rows:
 * grouping and aggregation, projection, and ordering.
 *
 * Groups appear in order of the first solution belonging to each.  A
 * query with aggregates but no GROUP BY has exactly one group, even
 * if there are no solutions, so that COUNT over nothing gives 0.
 *
 * Sorting is stable, so rows with equal keys keep their prior order.
 * Keys are compared with ExpressionEvaluator::compare().
 */
class Aggregator
{
public:
    /**
     * Construct an aggregator.  The exists handler is used for any
     * EXISTS in projections or ordering keys, and may be 0.
     */
    Aggregator(const ExistsHandler *handler = 0);

    /**
     * Group the solutions of an aggregate query and return one
     * projected row per group, ordered by the query's ORDER BY.
     */
    ResultSet aggregate(const Query &query, const ResultSet &solutions) const;

    /**
     * Project the solutions of a non-aggregate query, ordered by the
     * query's ORDER BY.  ORDER BY keys may refer to projected
     * aliases.
     */
    ResultSet project(const Query &query, const ResultSet &solutions) const;

    /**
     * Return the solutions sorted by the given conditions.
     */
    ResultSet order(const ResultSet &solutions,
                    const OrderConditions &conditions) const;

    /**
     * Compute the value of one aggregate expression over a group of
     * solutions.  Return Nothing if it has no value (for example the
     * MIN of an empty group, or the SUM of a non-numeric value).
     */
    Node computeAggregate(const Expression &aggregate,
                          const ResultSet &group) const;

    /**
     * Return the rows with duplicates (by the given columns) removed,
     * keeping the first occurrence.
     */
    static ResultSet distinct(const ResultSet &rows, const QStringList &columns);

    /**
     * Return at most limit rows starting at offset.  A negative limit
     * means no limit.
     */
    static ResultSet slice(const ResultSet &rows, int offset, int limit);

private:
    const ExistsHandler *m_handler;

    QList<int> sortedIndex(const QList<Nodes> &keys,
                           const OrderConditions &conditions) const;
};

}

#endif
