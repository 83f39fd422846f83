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

#ifndef _ONTOQUAY_EXPRESSION_EVALUATOR_H_
#define _ONTOQUAY_EXPRESSION_EVALUATOR_H_

#include "Expression.h"

#include "../Store.h"

#include <QHash>
#include <QRegularExpression>

namespace Ontoquay
{

/**
 * \class ExistsHandler ExpressionEvaluator.h <ontoquay/query/ExpressionEvaluator.h>
 *
 * Interface through which an ExpressionEvaluator evaluates the
 * pattern of an EXISTS or NOT EXISTS expression.  The implementation
 * knows the graph context the expression appears in.
 */
class ExistsHandler
{
public:
    /**
     * Return true if the pattern has at least one solution when
     * evaluated with the given bindings.
     */
    virtual bool exists(const GroupPattern &pattern,
                        const Dictionary &bindings) const = 0;

protected:
    virtual ~ExistsHandler() { }
};

/// Values of the aggregates of one group, keyed by aggregate expression.
typedef QHash<const Expression *, Node> AggregateValues;

/**
 * \class ExpressionEvaluator ExpressionEvaluator.h <ontoquay/query/ExpressionEvaluator.h>
 *
 * Evaluates expressions against a solution.
 *
 * The result of evaluate() is a node; a Nothing node means that the
 * expression could not be evaluated (an unbound variable, an operand
 * of the wrong kind, an invalid regular expression and so on).  Such
 * errors never propagate as exceptions: a FILTER treats them as false
 * and a BIND leaves its variable unbound.  Only a budget failure
 * inside an EXISTS pattern escapes, as RDFResourceExceeded.
 *
 * An evaluator caches compiled regular expressions and is intended
 * for use from one thread at a time.
 */
class ExpressionEvaluator
{
public:
    /**
     * Construct an evaluator.  The exists handler may be 0 if the
     * expressions to be evaluated contain no EXISTS; the aggregate
     * values may be 0 if they contain no aggregates.
     */
    ExpressionEvaluator(const ExistsHandler *handler = 0,
                        const AggregateValues *aggregates = 0);

    /**
     * Evaluate the expression against the given solution.
     */
    Node evaluate(const Expression &e, const Dictionary &d) const;

    /**
     * Evaluate the expression and return its effective boolean
     * value, or false if it could not be evaluated.
     */
    bool test(const Expression &e, const Dictionary &d) const;

    /**
     * Return the effective boolean value of a node.  Set ok to false
     * if the node has none (it is Nothing, an IRI, a blank node, or a
     * literal of a type with no boolean value).
     */
    static bool effectiveBooleanValue(const Node &n, bool &ok);

    /**
     * Compare two nodes for ordering: return a negative, zero or
     * positive value as a sorts before, with or after b.  Nothing
     * sorts first, then blank nodes, IRIs and literals.  Numeric
     * literals compare by value, other literals by lexical form.
     */
    static int compare(const Node &a, const Node &b);

    static Node booleanNode(bool b);

private:
    const ExistsHandler *m_handler;
    const AggregateValues *m_aggregates;
    mutable QHash<QString, QRegularExpression> m_regexCache;

    Node evaluateFunction(const Expression &e, const Dictionary &d) const;
    Node evaluateComparison(const Expression &e, const Dictionary &d) const;
    bool makeRegex(QString pattern, QString flags, QRegularExpression &rx) const;
};

}

#endif
