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

#ifndef _ONTOQUAY_STORE_H_
#define _ONTOQUAY_STORE_H_

#include "Triple.h"

#include <QList>
#include <QHash>
#include <QPair>

namespace Ontoquay
{

/// A list of RDF triples.
typedef QList<Triple> Triples;

/// A mapping from variable name to node: one solution of a pattern.
typedef QHash<QString, Node> Dictionary;

/// A list of Dictionary types, used to contain a sequence of solutions or result rows.
typedef QList<Dictionary> ResultSet;

enum ChangeType { AddTriple, RemoveTriple };

/// An add or remove operation specified by add/remove token and triple.
typedef QPair<ChangeType, Triple> Change;

/// A sequence of add/remove operations such as may be enacted by a commit.
typedef QList<Change> ChangeSet;


/**
 * \class Store Store.h <ontoquay/Store.h>
 *
 * Abstract interface for Ontoquay RDF triple stores.
 */
class Store
{
public:
    /**
     * Add a triple to the store.  Return false if the triple was
     * already in the store.  (Ontoquay does not permit duplicate
     * triples in a store.)  Throw RDFException if the triple is not a
     * valid statement.
     */
    virtual bool add(Triple t) = 0;

    /**
     * Remove a triple from the store.  If some nodes in the triple
     * are Nothing nodes, remove all matching triples.  Return false
     * if no matching triple was found in the store.
     */
    virtual bool remove(Triple t) = 0;

    /**
     * Atomically apply the sequence of add/remove changes described
     * in the given ChangeSet.  Throw RDFException if any operation
     * fails for any reason (including duplication etc), in which case
     * the store is left unchanged.
     */
    virtual void change(ChangeSet changes) = 0;

    /**
     * Atomically apply the sequence of add/remove changes described
     * in the given ChangeSet, in reverse (ie removing adds and
     * adding removes, in reverse order).  Throw RDFException if any
     * operation fails for any reason, in which case the store is left
     * unchanged.
     */
    virtual void revert(ChangeSet changes) = 0;

    /**
     * Return true if the store contains the given triple, false
     * otherwise.  Throw RDFException if the triple is not complete.
     */
    virtual bool contains(Triple t) const = 0;

    /**
     * Return all triples matching the given wildcard triple.  A node
     * of type Nothing in any part of the triple matches any node in
     * the store.  The result is in triple order.  Return an empty
     * list if there are no matches.
     */
    virtual Triples match(Triple t) const = 0;

    /**
     * Return the number of triples in the store.
     */
    virtual int size() const = 0;

protected:
    virtual ~Store() { }
};

}

#endif
