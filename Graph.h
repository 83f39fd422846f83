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

#ifndef _ONTOQUAY_GRAPH_H_
#define _ONTOQUAY_GRAPH_H_

#include "Store.h"

namespace Ontoquay
{

/**
 * \class Graph Graph.h <ontoquay/Graph.h>
 *
 * In-memory RDF graph implementing the Store interface, providing
 * add, remove and matching operations for RDF triples.  A Graph is a
 * set: adding a triple that is already present has no effect.
 *
 * Triples are indexed by subject, predicate and object, so a match
 * with any one of them bound does not scan the whole graph.
 *
 * All operations are thread safe.  Readers share the graph; each
 * mutating call (including a whole addAll or change) is exclusive, so
 * a reader observes the graph either before or after it, never part
 * way through.
 */
class Graph : public Store
{
public:
    /**
     * Construct an empty graph with the given name.  The empty Uri
     * names the default graph of a dataset.
     */
    Graph(Uri name = Uri());
    ~Graph();

    /**
     * Retrieve the name of the graph.
     */
    Uri getName() const;

    // Store interface

    bool add(Triple t);
    bool remove(Triple t);

    void change(ChangeSet changes);
    void revert(ChangeSet changes);

    bool contains(Triple t) const;
    Triples match(Triple t) const;
    int size() const;

    /**
     * Add all of the given triples that are not already present, as
     * a single atomic operation, and return the changes actually
     * made.  Every triple is checked before anything is added: if any
     * is not a valid statement, RDFException is thrown and the graph
     * is unchanged.
     */
    ChangeSet addAll(const Triples &triples);

    /**
     * Return every distinct node appearing as subject or object of
     * a triple in the graph, in node order.
     */
    Nodes getNodes() const;

    /**
     * Return true if the given node appears anywhere in the graph.
     */
    bool mentions(Node n) const;

private:
    class D;
    D *m_d;

    Graph(const Graph &);
    Graph &operator=(const Graph &);
};

}

#endif
