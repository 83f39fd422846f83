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

#include "QueryEngine.h"

#include "Dataset.h"
#include "RDFException.h"
#include "Debug.h"

#include "query/QueryParser.h"
#include "query/PatternMatcher.h"
#include "query/Aggregator.h"
#include "query/EvaluationBudget.h"

namespace Ontoquay
{

QueryEngine::QueryEngine(Dataset *dataset, EvaluationMode mode) :
    m_dataset(dataset),
    m_mode(mode),
    m_stepLimit(0),
    m_timeLimit(0)
{
}

QueryEngine::~QueryEngine()
{
}

void
QueryEngine::addPrefix(QString prefix, Uri uri)
{
    m_prefixes.addPrefix(prefix, uri);
}

void
QueryEngine::setBaseUri(Uri uri)
{
    m_prefixes.setBaseUri(uri);
}

void
QueryEngine::setStepLimit(qint64 steps)
{
    m_stepLimit = steps;
}

void
QueryEngine::setTimeLimit(int msec)
{
    m_timeLimit = msec;
}

Query
QueryEngine::prepare(QString text) const
{
    DEBUG << "QueryEngine::prepare: " << text;
    QueryParser parser(text, m_prefixes);
    return parser.parse();
}

void
QueryEngine::checkForm(const Query &query, Query::Form form) const
{
    if (query.form != form) {
        throw RDFException("Query is of the wrong form for this operation",
                           query.text);
    }
    if (!query.where) {
        throw RDFException("Query has no WHERE pattern", query.text);
    }
}

ResultSet
QueryEngine::select(const Query &query) const
{
    checkForm(query, Query::SelectQuery);

    EvaluationBudget budget(m_stepLimit, m_timeLimit);
    budget.start();

    PatternMatcher matcher(m_dataset, &budget, m_mode == ParallelEvaluation);
    ResultSet solutions = matcher.evaluate(*query.where);

    Aggregator aggregator(&matcher);
    ResultSet rows;
    if (query.isAggregate()) {
        rows = aggregator.aggregate(query, solutions);
    } else {
        rows = aggregator.project(query, solutions);
    }

    if (query.distinct) {
        rows = Aggregator::distinct(rows, query.getColumnNames());
    }
    rows = Aggregator::slice(rows, query.offset, query.limit);

    DEBUG << "QueryEngine::select: " << solutions.size()
          << " solution(s), " << rows.size() << " row(s) in "
          << budget.getSteps() << " step(s)";

    return rows;
}

Triples
QueryEngine::construct(const Query &query) const
{
    checkForm(query, Query::ConstructQuery);

    EvaluationBudget budget(m_stepLimit, m_timeLimit);
    budget.start();

    PatternMatcher matcher(m_dataset, &budget, m_mode == ParallelEvaluation);
    ResultSet solutions = matcher.evaluate(*query.where);

    if (!query.orderBy.empty()) {
        Aggregator aggregator(&matcher);
        solutions = aggregator.order(solutions, query.orderBy);
    }
    solutions = Aggregator::slice(solutions, query.offset, query.limit);

    TemplateExecutor executor(m_dataset);
    return executor.construct(query.templateTriples, solutions);
}

InsertReport
QueryEngine::insert(const Query &query)
{
    checkForm(query, Query::InsertQuery);

    EvaluationBudget budget(m_stepLimit, m_timeLimit);
    budget.start();

    ResultSet solutions;
    {
        PatternMatcher matcher(m_dataset, &budget, m_mode == ParallelEvaluation);
        solutions = matcher.evaluate(*query.where);
    }

    DEBUG << "QueryEngine::insert: " << solutions.size()
          << " solution(s) in " << budget.getSteps() << " step(s)";

    TemplateExecutor executor(m_dataset);
    return executor.insert(query.templateTriples, solutions);
}

QueryResult
QueryEngine::execute(QString text)
{
    Query query = prepare(text);

    QueryResult result;
    result.form = query.form;

    switch (query.form) {
    case Query::SelectQuery:
        result.columns = query.getColumnNames();
        result.rows = select(query);
        break;
    case Query::ConstructQuery:
        result.triples = construct(query);
        break;
    case Query::InsertQuery:
        result.report = insert(query);
        break;
    }

    return result;
}

Node
QueryEngine::queryFirst(QString text, QString column) const
{
    Query query = prepare(text);
    ResultSet rows = select(query);
    foreach (const Dictionary &row, rows) {
        Dictionary::const_iterator i = row.find(column);
        if (i != row.end() && i.value().type != Node::Nothing) {
            return i.value();
        }
    }
    return Node();
}

}
