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

#include "Dataset.h"
#include "RDFException.h"

#include <QReadWriteLock>
#include <QReadLocker>
#include <QWriteLocker>
#include <QAtomicInt>
#include <QSet>

#include "Debug.h"

#include <iostream>

namespace Ontoquay
{

class Dataset::D
{
public:
    D() : m_default(Uri()), m_source(0), m_counter(0) { }

    ~D() {
        QWriteLocker locker(&m_lock);
        for (GraphMap::iterator i = m_graphs.begin(); i != m_graphs.end(); ++i) {
            delete i.value();
        }
        m_graphs.clear();
    }

    Graph *getDefaultGraph() {
        return &m_default;
    }

    Graph *getGraph(Uri name) const {
        if (name.isEmpty()) return const_cast<Graph *>(&m_default);
        QReadLocker locker(&m_lock);
        GraphMap::const_iterator i = m_graphs.find(name);
        if (i == m_graphs.end()) return 0;
        return i.value();
    }

    Graph *createGraph(Uri name) {
        if (name.isEmpty()) return &m_default;
        QWriteLocker locker(&m_lock);
        GraphMap::iterator i = m_graphs.find(name);
        if (i != m_graphs.end()) return i.value();
        DEBUG << "Dataset::createGraph: " << name;
        Graph *g = new Graph(name);
        m_graphs[name] = g;
        return g;
    }

    UriList getGraphNames() const {
        QReadLocker locker(&m_lock);
        return m_graphs.keys();
    }

    QList<Graph *> getAllGraphs() const {
        QReadLocker locker(&m_lock);
        QList<Graph *> graphs;
        graphs.push_back(const_cast<Graph *>(&m_default));
        graphs += m_graphs.values();
        return graphs;
    }

    UriList listGraphs(QString tagFilter) const {
        UriList names = getGraphNames();
        if (tagFilter.isEmpty()) return names;
        const GraphControlSource *source = getGraphControlSource();
        if (!source) return UriList();
        QSet<Uri> tagged;
        GraphTags tags = source->getGraphTags();
        for (int i = 0; i < tags.size(); ++i) {
            if (tags[i].tag == tagFilter) tagged.insert(tags[i].graph);
        }
        UriList result;
        for (int i = 0; i < names.size(); ++i) {
            if (tagged.contains(names[i])) result.push_back(names[i]);
        }
        return result;
    }

    int commit(const QMap<Uri, Triples> &additions) {

        // Check everything before touching any graph, so that the
        // ordinary failure case leaves nothing to undo
        for (QMap<Uri, Triples>::const_iterator i = additions.begin();
             i != additions.end(); ++i) {
            const Triples &tt = i.value();
            for (int j = 0; j < tt.size(); ++j) {
                if (!tt[j].isStatement()) {
                    throw RDFException
                        ("Failed to commit triple (statement is incomplete or malformed)",
                         i.key());
                }
            }
        }

        QList<QPair<Graph *, ChangeSet> > applied;
        int added = 0;

        try {
            for (QMap<Uri, Triples>::const_iterator i = additions.begin();
                 i != additions.end(); ++i) {
                if (i.value().empty()) continue;
                Graph *g = createGraph(i.key());
                ChangeSet cs = g->addAll(i.value());
                applied.push_back(QPair<Graph *, ChangeSet>(g, cs));
                added += cs.size();
            }
        } catch (const RDFException &e) {
            std::cerr << "Dataset::commit: WARNING: Commit failed, rolling back "
                      << applied.size() << " graph(s): " << e.what() << std::endl;
            for (int i = applied.size() - 1; i >= 0; --i) {
                try {
                    applied[i].first->revert(applied[i].second);
                } catch (const RDFException &re) {
                    std::cerr << "Dataset::commit: WARNING: Failed to roll back graph <"
                              << applied[i].first->getName() << ">: "
                              << re.what() << std::endl;
                }
            }
            throw;
        }

        DEBUG << "Dataset::commit: added " << added << " triple(s) to "
              << applied.size() << " graph(s)";
        return added;
    }

    Node createBlankNode() const {
        QList<Graph *> graphs = getAllGraphs();
        while (true) {
            int n = m_counter.fetchAndAddOrdered(1) + 1;
            Node node(Node::Blank, QString("genid%1").arg(n));
            bool used = false;
            for (int i = 0; i < graphs.size(); ++i) {
                if (graphs[i]->mentions(node)) {
                    used = true;
                    break;
                }
            }
            if (!used) return node;
        }
    }

    void setGraphControlSource(const GraphControlSource *source, Uri predicate) {
        QWriteLocker locker(&m_lock);
        m_source = source;
        m_controlPredicate = predicate;
    }

    const GraphControlSource *getGraphControlSource() const {
        QReadLocker locker(&m_lock);
        return m_source;
    }

    Uri getGraphControlPredicate() const {
        QReadLocker locker(&m_lock);
        return m_controlPredicate;
    }

private:
    typedef QMap<Uri, Graph *> GraphMap;
    Graph m_default;
    GraphMap m_graphs;
    mutable QReadWriteLock m_lock; // protects m_graphs and the source
    const GraphControlSource *m_source;
    Uri m_controlPredicate;
    mutable QAtomicInt m_counter;
};

Dataset::Dataset() :
    m_d(new D())
{
}

Dataset::~Dataset()
{
    delete m_d;
}

Graph *
Dataset::getDefaultGraph()
{
    return m_d->getDefaultGraph();
}

const Graph *
Dataset::getDefaultGraph() const
{
    return m_d->getGraph(Uri());
}

Graph *
Dataset::getGraph(Uri name)
{
    return m_d->getGraph(name);
}

const Graph *
Dataset::getGraph(Uri name) const
{
    return m_d->getGraph(name);
}

Graph *
Dataset::createGraph(Uri name)
{
    return m_d->createGraph(name);
}

bool
Dataset::hasGraph(Uri name) const
{
    return m_d->getGraph(name) != 0;
}

UriList
Dataset::getGraphNames() const
{
    return m_d->getGraphNames();
}

UriList
Dataset::listGraphs(QString tagFilter) const
{
    return m_d->listGraphs(tagFilter);
}

bool
Dataset::addTriple(Uri graph, Triple t)
{
    return m_d->createGraph(graph)->add(t);
}

bool
Dataset::removeTriple(Uri graph, Triple t)
{
    Graph *g = m_d->getGraph(graph);
    if (!g) return false;
    return g->remove(t);
}

Triples
Dataset::match(Uri graph, Triple t) const
{
    const Graph *g = m_d->getGraph(graph);
    if (!g) return Triples();
    return g->match(t);
}

int
Dataset::size() const
{
    QList<Graph *> graphs = m_d->getAllGraphs();
    int n = 0;
    for (int i = 0; i < graphs.size(); ++i) n += graphs[i]->size();
    return n;
}

int
Dataset::commit(const QMap<Uri, Triples> &additions)
{
    return m_d->commit(additions);
}

Node
Dataset::createBlankNode() const
{
    return m_d->createBlankNode();
}

void
Dataset::setGraphControlSource(const GraphControlSource *source, Uri predicate)
{
    m_d->setGraphControlSource(source, predicate);
}

const GraphControlSource *
Dataset::getGraphControlSource() const
{
    return m_d->getGraphControlSource();
}

Uri
Dataset::getGraphControlPredicate() const
{
    return m_d->getGraphControlPredicate();
}

}
