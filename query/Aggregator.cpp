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

#include "Aggregator.h"
#include "Solution.h"

#include "../Debug.h"

#include <QSet>

#include <algorithm>

namespace Ontoquay
{

namespace {

class KeyOrder
{
public:
    KeyOrder(const QList<Nodes> &keys, const OrderConditions &conditions) :
        m_keys(keys), m_conditions(conditions) { }

    bool operator()(int a, int b) const {
        for (int i = 0; i < m_conditions.size(); ++i) {
            int c = ExpressionEvaluator::compare(m_keys[a][i], m_keys[b][i]);
            if (c == 0) continue;
            return m_conditions[i].descending ? (c > 0) : (c < 0);
        }
        return false;
    }

private:
    const QList<Nodes> &m_keys;
    const OrderConditions &m_conditions;
};

}

Aggregator::Aggregator(const ExistsHandler *handler) :
    m_handler(handler)
{
}

QList<int>
Aggregator::sortedIndex(const QList<Nodes> &keys,
                        const OrderConditions &conditions) const
{
    QList<int> index;
    for (int i = 0; i < keys.size(); ++i) index.push_back(i);
    if (!conditions.empty()) {
        std::stable_sort(index.begin(), index.end(), KeyOrder(keys, conditions));
    }
    return index;
}

ResultSet
Aggregator::order(const ResultSet &solutions,
                  const OrderConditions &conditions) const
{
    if (conditions.empty()) return solutions;

    ExpressionEvaluator evaluator(m_handler);

    QList<Nodes> keys;
    foreach (const Dictionary &d, solutions) {
        Nodes k;
        foreach (const OrderCondition &c, conditions) {
            k.push_back(evaluator.evaluate(*c.expression, d));
        }
        keys.push_back(k);
    }

    ResultSet sorted;
    foreach (int i, sortedIndex(keys, conditions)) {
        sorted.push_back(solutions[i]);
    }
    return sorted;
}

ResultSet
Aggregator::project(const Query &query, const ResultSet &solutions) const
{
    ExpressionEvaluator evaluator(m_handler);

    // Each working row holds the solution plus the projected aliases,
    // so that ORDER BY can see both
    ResultSet working;
    ResultSet rows;

    foreach (const Dictionary &d, solutions) {
        Dictionary w(d);
        Dictionary row;
        if (query.selectAll) {
            for (Dictionary::const_iterator i = d.begin(); i != d.end(); ++i) {
                if (!i.key().startsWith("_:")) row.insert(i.key(), i.value());
            }
        } else {
            foreach (const Projection &p, query.projections) {
                Node v;
                if (p.expression) v = evaluator.evaluate(*p.expression, w);
                else v = w.value(p.variable);
                if (v.type == Node::Nothing) continue;
                w.insert(p.variable, v);
                row.insert(p.variable, v);
            }
        }
        working.push_back(w);
        rows.push_back(row);
    }

    if (query.orderBy.empty()) return rows;

    QList<Nodes> keys;
    foreach (const Dictionary &w, working) {
        Nodes k;
        foreach (const OrderCondition &c, query.orderBy) {
            k.push_back(evaluator.evaluate(*c.expression, w));
        }
        keys.push_back(k);
    }

    ResultSet sorted;
    foreach (int i, sortedIndex(keys, query.orderBy)) {
        sorted.push_back(rows[i]);
    }
    return sorted;
}

ResultSet
Aggregator::aggregate(const Query &query, const ResultSet &solutions) const
{
    ExpressionEvaluator plain(m_handler);

    QList<ResultSet> groups;
    QList<Dictionary> groupBindings;

    if (query.groupBy.empty()) {
        groups.push_back(solutions);
        groupBindings.push_back(Dictionary());
    } else {
        QHash<QString, int> groupIndex;
        foreach (const Dictionary &d, solutions) {
            QString key;
            Dictionary bindings;
            foreach (const GroupCondition &c, query.groupBy) {
                Node v = plain.evaluate(*c.expression, d);
                key += nodeKey(v);
                key += QChar(0x1e);
                if (v.type == Node::Nothing) continue;
                if (c.alias != "") {
                    bindings.insert(c.alias, v);
                } else if (c.expression->getType() == Expression::Variable) {
                    bindings.insert(c.expression->getVariable(), v);
                }
            }
            QHash<QString, int>::const_iterator gi = groupIndex.find(key);
            if (gi == groupIndex.end()) {
                groupIndex.insert(key, groups.size());
                ResultSet g;
                g.push_back(d);
                groups.push_back(g);
                groupBindings.push_back(bindings);
            } else {
                groups[gi.value()].push_back(d);
            }
        }
    }

    DEBUG << "Aggregator::aggregate: " << solutions.size()
          << " solution(s) in " << groups.size() << " group(s)";

    QList<const Expression *> aggregates;
    foreach (const Projection &p, query.projections) {
        if (p.expression) p.expression->collectAggregates(aggregates);
    }
    foreach (const OrderCondition &c, query.orderBy) {
        c.expression->collectAggregates(aggregates);
    }

    ResultSet rows;
    QList<Nodes> keys;

    for (int g = 0; g < groups.size(); ++g) {

        AggregateValues values;
        foreach (const Expression *a, aggregates) {
            values.insert(a, computeAggregate(*a, groups[g]));
        }

        ExpressionEvaluator evaluator(m_handler, &values);
        Dictionary w(groupBindings[g]);
        Dictionary row;

        if (query.selectAll) {
            row = groupBindings[g];
        } else {
            foreach (const Projection &p, query.projections) {
                Node v;
                if (p.expression) v = evaluator.evaluate(*p.expression, w);
                else v = w.value(p.variable);
                if (v.type == Node::Nothing) continue;
                w.insert(p.variable, v);
                row.insert(p.variable, v);
            }
        }

        Nodes k;
        foreach (const OrderCondition &c, query.orderBy) {
            k.push_back(evaluator.evaluate(*c.expression, w));
        }

        rows.push_back(row);
        keys.push_back(k);
    }

    if (query.orderBy.empty()) return rows;

    ResultSet sorted;
    foreach (int i, sortedIndex(keys, query.orderBy)) {
        sorted.push_back(rows[i]);
    }
    return sorted;
}

Node
Aggregator::computeAggregate(const Expression &agg, const ResultSet &group) const
{
    ExpressionEvaluator evaluator(m_handler);
    bool star = agg.getArguments().empty();

    // Collect the values, skipping unbound ones and, for DISTINCT,
    // repeats
    Nodes values;
    QSet<QString> seen;
    foreach (const Dictionary &d, group) {
        Node v;
        QString key;
        if (star) {
            if (agg.isDistinct()) {
                QStringList vars = d.keys();
                vars.sort();
                key = vars.join(",") + "|" + solutionKey(d, vars);
            }
            v = Node(Node::Literal, "");
        } else {
            v = evaluator.evaluate(*agg.getArguments()[0], d);
            if (v.type == Node::Nothing) continue;
            if (agg.isDistinct()) key = nodeKey(v);
        }
        if (agg.isDistinct()) {
            if (seen.contains(key)) continue;
            seen.insert(key);
        }
        values.push_back(v);
    }

    switch (agg.getAggregateFunction()) {

    case Expression::Count:
        return Node::fromVariant(QVariant(qlonglong(values.size())));

    case Expression::Sum: {
        qlonglong isum = 0;
        double dsum = 0.0;
        bool integral = true;
        foreach (const Node &v, values) {
            if (!v.isNumeric()) return Node();
            QVariant var = v.toVariant();
            if (var.type() == QVariant::LongLong) {
                isum += var.toLongLong();
            } else {
                integral = false;
            }
            dsum += var.toDouble();
        }
        if (integral) return Node::fromVariant(QVariant(isum));
        return Node::fromVariant(QVariant(dsum));
    }

    case Expression::Min:
    case Expression::Max: {
        if (values.empty()) return Node();
        Node best = values[0];
        bool wantMin = (agg.getAggregateFunction() == Expression::Min);
        for (int i = 1; i < values.size(); ++i) {
            int c = ExpressionEvaluator::compare(values[i], best);
            if ((wantMin && c < 0) || (!wantMin && c > 0)) best = values[i];
        }
        return best;
    }

    case Expression::Sample:
        if (values.empty()) return Node();
        return values[0];

    case Expression::GroupConcat: {
        QStringList parts;
        foreach (const Node &v, values) parts << v.value;
        return Node(Node::Literal, parts.join(agg.getSeparator()));
    }
    }

    return Node();
}

ResultSet
Aggregator::distinct(const ResultSet &rows, const QStringList &columns)
{
    ResultSet result;
    QSet<QString> seen;
    foreach (const Dictionary &d, rows) {
        QString key = solutionKey(d, columns);
        if (seen.contains(key)) continue;
        seen.insert(key);
        result.push_back(d);
    }
    return result;
}

ResultSet
Aggregator::slice(const ResultSet &rows, int offset, int limit)
{
    if (offset <= 0 && limit < 0) return rows;
    if (offset < 0) offset = 0;
    if (offset >= rows.size()) return ResultSet();
    return rows.mid(offset, limit < 0 ? -1 : limit);
}

}
