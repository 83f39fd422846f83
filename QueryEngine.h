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

#ifndef _ONTOQUAY_QUERY_ENGINE_H_
#define _ONTOQUAY_QUERY_ENGINE_H_

#include "PrefixTable.h"
#include "query/Query.h"
#include "query/TemplateExecutor.h"

namespace Ontoquay
{

class Dataset;

/**
 * The result of QueryEngine::execute.  Which fields are filled in
 * depends on the form of the query: triples for CONSTRUCT, the
 * report for INSERT, and the column names and rows for SELECT.
 */
struct QueryResult
{
    QueryResult() : form(Query::SelectQuery) { }

    Query::Form form;
    Triples triples;
    InsertReport report;
    QStringList columns;
    ResultSet rows;
};

/**
 * \class QueryEngine QueryEngine.h <ontoquay/QueryEngine.h>
 *
 * QueryEngine prepares and runs SELECT, CONSTRUCT and INSERT queries
 * against a Dataset.
 *
 * Query text is parsed by prepare(), using the engine's prefix table
 * together with any PREFIX declarations in the query itself.  A
 * prepared Query may then be run any number of times with select(),
 * construct() or insert() as appropriate to its form; execute()
 * does both in one step.
 *
 * Each run has its own evaluation budget, set up from the engine's
 * step and time limits.  If the budget is exceeded the run throws
 * RDFResourceExceeded; an INSERT that fails this way has not changed
 * the dataset.
 *
 * The dataset is not owned by the engine.  An engine may be used from
 * more than one thread provided its configuration is not changed
 * while queries are running.
 */
class QueryEngine
{
public:
    enum EvaluationMode {
        /// Evaluate everything on the calling thread.
        SequentialEvaluation,
        /// Evaluate UNION branches and GRAPH ?var iterations
        /// concurrently.  The results are identical to those of
        /// sequential evaluation.
        ParallelEvaluation
    };

    QueryEngine(Dataset *dataset,
                EvaluationMode mode = SequentialEvaluation);
    ~QueryEngine();

    Dataset *getDataset() { return m_dataset; }
    EvaluationMode getEvaluationMode() const { return m_mode; }

    /**
     * Add a prefix to the table used when preparing queries.  A
     * PREFIX declaration in a query overrides this for that query.
     */
    void addPrefix(QString prefix, Uri uri);

    /**
     * Set the base URI used to resolve relative IRIs and the empty
     * prefix.
     */
    void setBaseUri(Uri uri);

    PrefixTable &getPrefixTable() { return m_prefixes; }
    const PrefixTable &getPrefixTable() const { return m_prefixes; }

    /**
     * Set the maximum number of evaluation steps per query run.
     * Zero (the default) means no limit.
     */
    void setStepLimit(qint64 steps);
    qint64 getStepLimit() const { return m_stepLimit; }

    /**
     * Set the maximum wall-clock time per query run, in milliseconds.
     * Zero (the default) means no limit.
     */
    void setTimeLimit(int msec);
    int getTimeLimit() const { return m_timeLimit; }

    /**
     * Parse the given query text.  Throw RDFSyntaxError or
     * RDFUnknownPrefix if it cannot be parsed; nothing is evaluated
     * in that case.
     */
    Query prepare(QString text) const;

    /**
     * Run a prepared SELECT query and return its rows.  The columns
     * are those given by Query::getColumnNames().
     */
    ResultSet select(const Query &query) const;

    /**
     * Run a prepared CONSTRUCT query and return the distinct
     * constructed triples, sorted.  The dataset is not changed.
     */
    Triples construct(const Query &query) const;

    /**
     * Run a prepared INSERT query, adding the instantiated triples
     * to their target graphs.  The WHERE clause is evaluated fully
     * before anything is added.
     */
    InsertReport insert(const Query &query);

    /**
     * Prepare and run the given query text.
     */
    QueryResult execute(QString text);

    /**
     * Prepare and run the given SELECT query and return the value of
     * the given column in the first row that binds it, or Nothing if
     * there is none.
     */
    Node queryFirst(QString text, QString column) const;

private:
    Dataset *m_dataset;
    EvaluationMode m_mode;
    PrefixTable m_prefixes;
    qint64 m_stepLimit;
    int m_timeLimit;

    void checkForm(const Query &query, Query::Form form) const;

    QueryEngine(const QueryEngine &);
    QueryEngine &operator=(const QueryEngine &);
};

}

#endif
