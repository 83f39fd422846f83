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

#ifndef _ONTOQUAY_GRAPH_CONTROL_SOURCE_H_
#define _ONTOQUAY_GRAPH_CONTROL_SOURCE_H_

#include "Uri.h"

#include <QString>
#include <QList>
#include <QMutex>

namespace Ontoquay
{

/**
 * A named graph together with a tag attached to it by an external
 * graph-control registry (for example the team or domain model that
 * owns the graph).
 */
struct GraphTag
{
    GraphTag() { }
    GraphTag(Uri g, QString t) : graph(g), tag(t) { }

    Uri graph;
    QString tag;
};

typedef QList<GraphTag> GraphTags;

/**
 * \class GraphControlSource GraphControlSource.h <ontoquay/GraphControlSource.h>
 *
 * Abstract interface for an external registry of graphs under some
 * party's control.  The engine asks it for (graph, tag) pairs when a
 * pattern uses the graph-control predicate registered with the
 * Dataset, and when listing graphs by tag.  Tags are compared by
 * string equality only; the engine attaches no other meaning to them.
 *
 * Implementations must be safe to call from several threads at once.
 */
class GraphControlSource
{
public:
    virtual ~GraphControlSource() { }

    /**
     * Return every (graph, tag) pair known to the registry.
     */
    virtual GraphTags getGraphTags() const = 0;
};

/**
 * \class BasicGraphControlSource GraphControlSource.h <ontoquay/GraphControlSource.h>
 *
 * A GraphControlSource holding its pairs in memory.
 */
class BasicGraphControlSource : public GraphControlSource
{
public:
    BasicGraphControlSource() { }
    virtual ~BasicGraphControlSource() { }

    /**
     * Record that the given graph carries the given tag.  Adding the
     * same pair twice has no effect.
     */
    void addGraphTag(Uri graph, QString tag);

    virtual GraphTags getGraphTags() const;

private:
    GraphTags m_tags;
    mutable QMutex m_mutex;
};

}

#endif
