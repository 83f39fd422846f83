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

#ifndef _ONTOQUAY_QUERY_H_
#define _ONTOQUAY_QUERY_H_

#include "Pattern.h"

namespace Ontoquay
{

/**
 * One column of a SELECT: a plain variable (expression null) or an
 * expression bound to a variable with AS.
 */
struct Projection
{
    Projection() { }
    Projection(QString v, ExpressionPtr e = ExpressionPtr()) :
        variable(v), expression(e) { }

    QString variable;
    ExpressionPtr expression;
};

/**
 * One GROUP BY condition, optionally aliased with AS.
 */
struct GroupCondition
{
    GroupCondition() { }
    GroupCondition(ExpressionPtr e, QString a = QString()) :
        expression(e), alias(a) { }

    ExpressionPtr expression;
    QString alias;
};

/**
 * One ORDER BY key.
 */
struct OrderCondition
{
    OrderCondition() : descending(false) { }
    OrderCondition(ExpressionPtr e, bool desc) :
        expression(e), descending(desc) { }

    ExpressionPtr expression;
    bool descending;
};

typedef QList<OrderCondition> OrderConditions;

/**
 * \class Query Query.h <ontoquay/query/Query.h>
 *
 * A parsed and bound query, ready to be executed by a QueryEngine.
 * All prefixed names have been expanded to full IRIs.  Queries are
 * produced by QueryParser (through QueryEngine::prepare) and are not
 * tied to any dataset, so one query may be executed many times.
 */
class Query
{
public:
    enum Form { SelectQuery, ConstructQuery, InsertQuery };

    Query() :
        form(SelectQuery), distinct(false), selectAll(false),
        limit(-1), offset(0) { }

    /**
     * Return the names of the result columns of a SELECT query, in
     * order.  For SELECT * these are the named variables of the WHERE
     * pattern in order of first appearance.
     */
    QStringList getColumnNames() const {
        QStringList names;
        if (selectAll) {
            if (where) names = where->getVariables();
        } else {
            foreach (const Projection &p, projections) names << p.variable;
        }
        return names;
    }

    /**
     * Return true if this query groups its solutions, either with an
     * explicit GROUP BY or by using aggregates in its projection or
     * ordering.
     */
    bool isAggregate() const {
        if (!groupBy.empty()) return true;
        foreach (const Projection &p, projections) {
            if (p.expression && p.expression->containsAggregate()) return true;
        }
        foreach (const OrderCondition &c, orderBy) {
            if (c.expression->containsAggregate()) return true;
        }
        return false;
    }

    Form form;
    bool distinct;
    bool selectAll;
    QList<Projection> projections;
    TemplateTriples templateTriples;
    GroupPatternPtr where;
    QList<GroupCondition> groupBy;
    OrderConditions orderBy;
    int limit;   ///< -1 for no limit
    int offset;
    QString text;
};

}

#endif
