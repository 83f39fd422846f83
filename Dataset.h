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

#ifndef _ONTOQUAY_DATASET_H_
#define _ONTOQUAY_DATASET_H_

#include "Graph.h"
#include "GraphControlSource.h"

#include <QMap>

namespace Ontoquay
{

/**
 * \class Dataset Dataset.h <ontoquay/Dataset.h>
 *
 * A default graph plus any number of named graphs, each identified
 * by a unique IRI.  Graphs are owned by the dataset and remain valid
 * for its lifetime.
 *
 * Throughout, the empty Uri (Dataset::defaultGraphName()) names the
 * default graph.
 *
 * The dataset may also carry a reference to an external
 * GraphControlSource, together with the predicate IRI through which
 * query patterns reach it.
 *
 * All operations are thread safe.
 */
class Dataset
{
public:
    Dataset();
    ~Dataset();

    /**
     * Return the name used for the default graph (the empty Uri).
     */
    static Uri defaultGraphName() { return Uri(); }

    /**
     * Return the default graph.
     */
    Graph *getDefaultGraph();
    const Graph *getDefaultGraph() const;

    /**
     * Return the graph with the given name, or 0 if there is no such
     * graph.  The empty Uri returns the default graph.
     */
    Graph *getGraph(Uri name);
    const Graph *getGraph(Uri name) const;

    /**
     * Return the graph with the given name, creating an empty one if
     * it does not exist yet.
     */
    Graph *createGraph(Uri name);

    /**
     * Return true if a graph of the given name exists.
     */
    bool hasGraph(Uri name) const;

    /**
     * Return the names of all named graphs (not including the
     * default graph), in name order.
     */
    UriList getGraphNames() const;

    /**
     * Return the names of the named graphs in the dataset that the
     * graph-control source tags with the given tag, in name order.
     * With an empty tag, return all named graphs.
     */
    UriList listGraphs(QString tagFilter = QString()) const;

    /**
     * Add a triple to the given graph, creating the graph if
     * necessary.  Return false if the triple was already present.
     * Throw RDFException if the triple is not a valid statement.
     */
    bool addTriple(Uri graph, Triple t);

    /**
     * Remove a triple from the given graph.  Wildcards are permitted
     * as for Store::remove.  Return false if nothing was removed.
     */
    bool removeTriple(Uri graph, Triple t);

    /**
     * Return the triples in the given graph that match the given
     * wildcard triple.  A graph that does not exist matches nothing.
     */
    Triples match(Uri graph, Triple t) const;

    /**
     * Return the total number of triples in all graphs.
     */
    int size() const;

    /**
     * Apply the given additions, keyed by target graph, and return
     * the number of triples actually added (i.e. not counting those
     * already present).  Each graph is updated in one atomic step.
     * If updating any graph fails, the changes already made to the
     * other graphs are reverted before the exception is rethrown, so
     * that the dataset is left as it was.
     */
    int commit(const QMap<Uri, Triples> &additions);

    /**
     * Return a new blank node whose identifier does not appear in any
     * graph of the dataset, nor has been returned by a previous call.
     * The node is not added to any graph.
     */
    Node createBlankNode() const;

    /**
     * Register an external graph-control source.  Triple patterns
     * whose predicate is the given IRI are answered from the source
     * (subject: graph IRI, object: tag as a plain literal) rather
     * than from the graphs.  The source is not owned by the dataset.
     * Pass 0 to remove a source.
     */
    void setGraphControlSource(const GraphControlSource *source,
                               Uri predicate);

    const GraphControlSource *getGraphControlSource() const;
    Uri getGraphControlPredicate() const;

private:
    class D;
    D *m_d;

    Dataset(const Dataset &);
    Dataset &operator=(const Dataset &);
};

}

#endif
