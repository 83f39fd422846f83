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

#ifndef _ONTOQUAY_TRIPLE_H_
#define _ONTOQUAY_TRIPLE_H_

#include "Node.h"

namespace Ontoquay
{

/**
 * \class Triple Triple.h <ontoquay/Triple.h>
 *
 * Triple represents an RDF statement made up of three Node objects.
 */
class Triple
{
public:
    /**
     * Construct a triple of three Nothing nodes.
     */
    Triple() { }

    /**
     * Construct a triple of the three given nodes.
     *
     * Our triples may contain anything, including the Nothing node
     * type for undefined elements (used in wildcard matching, etc).
     *
     * However, in order to be inserted in a graph, a triple must
     * have either URI or Blank type for its first (or subject) node,
     * URI for its second (or predicate) node, and either URI, Blank,
     * or Literal type for its third (or object) node.  See
     * isStatement().
     */
    Triple(Node _a, Node _b, Node _c) :
        a(_a), b(_b), c(_c) { }

    /**
     * Construct a triple of two URIs and an arbitrary node.
     */
    Triple(Uri a_uri, Uri b_uri, Node _c) :
        a(a_uri), b(b_uri), c(_c) { }

    ~Triple() { }

    /**
     * Return true if this triple is a valid RDF statement, suitable
     * for storing in a graph.
     */
    bool isStatement() const {
        return (a.type == Node::URI || a.type == Node::Blank) &&
            b.type == Node::URI &&
            c.type != Node::Nothing;
    }

    /**
     * Return true if any of the three nodes is Nothing, i.e. if this
     * triple is a wildcard pattern.
     */
    bool isWildcard() const {
        return a.type == Node::Nothing ||
            b.type == Node::Nothing ||
            c.type == Node::Nothing;
    }

    bool operator<(const Triple &t) const {
        if (a != t.a) return a < t.a;
        if (b != t.b) return b < t.b;
        if (c != t.c) return c < t.c;
        return false;
    }

    Node a;
    Node b;
    Node c;
};

bool operator==(const Triple &a, const Triple &b);
bool operator!=(const Triple &a, const Triple &b);

uint qHash(const Triple &t);

std::ostream &operator<<(std::ostream &out, const Triple &);
QTextStream &operator<<(QTextStream &out, const Triple &);

}

#endif
