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

#include "Graph.h"
#include "RDFException.h"

#include <QReadWriteLock>
#include <QReadLocker>
#include <QWriteLocker>
#include <QMultiHash>
#include <QSet>

#include "Debug.h"

#include <algorithm>
#include <iostream>

namespace Ontoquay
{

class Graph::D
{
public:
    D(Uri name) : m_name(name) { }

    ~D() {
        // Make sure nobody still holds the lock
        QWriteLocker locker(&m_lock);
    }

    Uri getName() const {
        return m_name;
    }

    bool add(Triple t) {
        QWriteLocker locker(&m_lock);
        DEBUG << "Graph::add: " << t;
        checkStatement(t, "Failed to add triple");
        return doAdd(t);
    }

    bool remove(Triple t) {
        QWriteLocker locker(&m_lock);
        DEBUG << "Graph::remove: " << t;
        if (t.isWildcard()) {
            Triples tt = doMatch(t);
            if (tt.empty()) return false;
            DEBUG << "Graph::remove: Removing " << tt.size() << " triple(s)";
            for (int i = 0; i < tt.size(); ++i) {
                if (!doRemove(tt[i])) {
                    throw RDFInternalError
                        ("Failed to remove matched statement in remove() with wildcards");
                }
            }
            return true;
        } else {
            return doRemove(t);
        }
    }

    void change(ChangeSet cs) {
        QWriteLocker locker(&m_lock);
        DEBUG << "Graph::change: " << cs.size() << " changes";
        ChangeSet done;
        try {
            for (int i = 0; i < cs.size(); ++i) {
                ChangeType type = cs[i].first;
                switch (type) {
                case AddTriple:
                    checkStatement(cs[i].second, "Change add failed");
                    if (!doAdd(cs[i].second)) {
                        throw RDFException("Change add failed due to duplication");
                    }
                    break;
                case RemoveTriple:
                    if (!doRemove(cs[i].second)) {
                        throw RDFException("Change remove failed due to absence");
                    }
                    break;
                }
                done.push_back(cs[i]);
            }
        } catch (const RDFException &) {
            undo(done);
            throw;
        }
    }

    void revert(ChangeSet cs) {
        QWriteLocker locker(&m_lock);
        DEBUG << "Graph::revert: " << cs.size() << " changes";
        ChangeSet done;
        try {
            for (int i = cs.size()-1; i >= 0; --i) {
                ChangeType type = cs[i].first;
                switch (type) {
                case AddTriple:
                    if (!doRemove(cs[i].second)) {
                        throw RDFException("Change revert add failed due to absence");
                    }
                    done.push_back(Change(RemoveTriple, cs[i].second));
                    break;
                case RemoveTriple:
                    if (!doAdd(cs[i].second)) {
                        throw RDFException("Change revert remove failed due to duplication");
                    }
                    done.push_back(Change(AddTriple, cs[i].second));
                    break;
                }
            }
        } catch (const RDFException &) {
            undo(done);
            throw;
        }
    }

    ChangeSet addAll(const Triples &triples) {
        QWriteLocker locker(&m_lock);
        DEBUG << "Graph::addAll: " << triples.size() << " triple(s) to "
              << m_name;
        for (int i = 0; i < triples.size(); ++i) {
            checkStatement(triples[i], "Failed to add triple");
        }
        ChangeSet done;
        for (int i = 0; i < triples.size(); ++i) {
            if (doAdd(triples[i])) {
                done.push_back(Change(AddTriple, triples[i]));
            }
        }
        return done;
    }

    bool contains(Triple t) const {
        QReadLocker locker(&m_lock);
        if (t.isWildcard()) {
            throw RDFException("Failed to test for triple (statement is incomplete)");
        }
        return m_triples.contains(t);
    }

    Triples match(Triple t) const {
        QReadLocker locker(&m_lock);
        return doMatch(t);
    }

    int size() const {
        QReadLocker locker(&m_lock);
        return m_triples.size();
    }

    Nodes getNodes() const {
        QReadLocker locker(&m_lock);
        QSet<Node> nodes;
        for (QMultiHash<Node, Triple>::const_iterator i = m_subjects.begin();
             i != m_subjects.end(); ++i) {
            nodes.insert(i.key());
        }
        for (QMultiHash<Node, Triple>::const_iterator i = m_objects.begin();
             i != m_objects.end(); ++i) {
            nodes.insert(i.key());
        }
        Nodes result = nodes.toList();
        std::sort(result.begin(), result.end());
        return result;
    }

    bool mentions(Node n) const {
        QReadLocker locker(&m_lock);
        return m_subjects.contains(n) ||
            m_predicates.contains(n) ||
            m_objects.contains(n);
    }

private:
    Uri m_name;
    QSet<Triple> m_triples;
    QMultiHash<Node, Triple> m_subjects;
    QMultiHash<Node, Triple> m_predicates;
    QMultiHash<Node, Triple> m_objects;
    mutable QReadWriteLock m_lock;

    void checkStatement(const Triple &t, QString message) const {
        if (!t.isStatement()) {
            std::cerr << "Graph::checkStatement: WARNING: RDF statement is not valid: "
                      << t << std::endl;
            throw RDFException
                (message + " (statement is incomplete or malformed)");
        }
    }

    // All of these are called with m_lock held

    bool doAdd(const Triple &t) {
        if (m_triples.contains(t)) return false;
        m_triples.insert(t);
        m_subjects.insert(t.a, t);
        m_predicates.insert(t.b, t);
        m_objects.insert(t.c, t);
        return true;
    }

    bool doRemove(const Triple &t) {
        if (!m_triples.remove(t)) return false;
        m_subjects.remove(t.a, t);
        m_predicates.remove(t.b, t);
        m_objects.remove(t.c, t);
        return true;
    }

    void undo(const ChangeSet &done) {
        for (int i = done.size()-1; i >= 0; --i) {
            if (done[i].first == AddTriple) doRemove(done[i].second);
            else doAdd(done[i].second);
        }
    }

    static bool matches(const Triple &candidate, const Triple &t) {
        if (t.a.type != Node::Nothing && candidate.a != t.a) return false;
        if (t.b.type != Node::Nothing && candidate.b != t.b) return false;
        if (t.c.type != Node::Nothing && candidate.c != t.c) return false;
        return true;
    }

    const QMultiHash<Node, Triple> *chooseIndex(const Triple &t) const {
        // Use whichever bound position has the fewest candidates
        const QMultiHash<Node, Triple> *best = 0;
        int bestCount = 0;
        if (t.a.type != Node::Nothing) {
            best = &m_subjects;
            bestCount = m_subjects.count(t.a);
        }
        if (t.c.type != Node::Nothing) {
            int n = m_objects.count(t.c);
            if (!best || n < bestCount) {
                best = &m_objects;
                bestCount = n;
            }
        }
        if (t.b.type != Node::Nothing) {
            int n = m_predicates.count(t.b);
            if (!best || n < bestCount) {
                best = &m_predicates;
                bestCount = n;
            }
        }
        return best;
    }

    Node keyFor(const QMultiHash<Node, Triple> *index, const Triple &t) const {
        if (index == &m_subjects) return t.a;
        if (index == &m_predicates) return t.b;
        return t.c;
    }

    Triples doMatch(const Triple &t) const {
        // Any of a, b, and c in t that have Nothing as their node type
        // will contribute all matching nodes to the returned triples
        Triples results;
        if (!t.isWildcard()) {
            if (m_triples.contains(t)) results.push_back(t);
            return results;
        }
        const QMultiHash<Node, Triple> *index = chooseIndex(t);
        if (!index) {
            results = m_triples.toList();
        } else {
            QList<Triple> candidates = index->values(keyFor(index, t));
            for (int i = 0; i < candidates.size(); ++i) {
                if (matches(candidates[i], t)) {
                    results.push_back(candidates[i]);
                }
            }
        }
        std::sort(results.begin(), results.end());
        return results;
    }
};

Graph::Graph(Uri name) :
    m_d(new D(name))
{
}

Graph::~Graph()
{
    delete m_d;
}

Uri
Graph::getName() const
{
    return m_d->getName();
}

bool
Graph::add(Triple t)
{
    return m_d->add(t);
}

bool
Graph::remove(Triple t)
{
    return m_d->remove(t);
}

void
Graph::change(ChangeSet t)
{
    m_d->change(t);
}

void
Graph::revert(ChangeSet t)
{
    m_d->revert(t);
}

bool
Graph::contains(Triple t) const
{
    return m_d->contains(t);
}

Triples
Graph::match(Triple t) const
{
    return m_d->match(t);
}

int
Graph::size() const
{
    return m_d->size();
}

ChangeSet
Graph::addAll(const Triples &triples)
{
    return m_d->addAll(triples);
}

Nodes
Graph::getNodes() const
{
    return m_d->getNodes();
}

bool
Graph::mentions(Node n) const
{
    return m_d->mentions(n);
}

}
