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

#include "GraphControlSource.h"

#include <QMutexLocker>

#include "Debug.h"

namespace Ontoquay
{

void
BasicGraphControlSource::addGraphTag(Uri graph, QString tag)
{
    QMutexLocker locker(&m_mutex);
    for (int i = 0; i < m_tags.size(); ++i) {
        if (m_tags[i].graph == graph && m_tags[i].tag == tag) return;
    }
    DEBUG << "BasicGraphControlSource::addGraphTag: " << graph
          << " tagged " << tag;
    m_tags.push_back(GraphTag(graph, tag));
}

GraphTags
BasicGraphControlSource::getGraphTags() const
{
    QMutexLocker locker(&m_mutex);
    return m_tags;
}

}
