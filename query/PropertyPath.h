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

#ifndef _ONTOQUAY_PROPERTY_PATH_H_
#define _ONTOQUAY_PROPERTY_PATH_H_

#include "../Uri.h"

#include <QSharedPointer>
#include <QString>

namespace Ontoquay
{

class PropertyPath;
typedef QSharedPointer<PropertyPath> PropertyPathPtr;

/**
 * \class PropertyPath PropertyPath.h <ontoquay/query/PropertyPath.h>
 *
 * A property path expression: a predicate IRI, or a composition of
 * paths by sequence (p1/p2), alternation (p1|p2), inversion (^p) or
 * repetition (p*, p+, p?).
 *
 * Paths are immutable once built and are shared between the queries
 * that use them.  Construct them with the static factory functions.
 */
class PropertyPath
{
public:
    enum Type {
        Atomic,      ///< a single predicate
        Sequence,    ///< left then right
        Alternation, ///< left or right
        Inverse,     ///< left, traversed object to subject
        ZeroOrMore,  ///< left repeated zero or more times
        OneOrMore,   ///< left repeated one or more times
        ZeroOrOne    ///< left, optionally
    };

    static PropertyPathPtr atomic(Uri predicate);
    static PropertyPathPtr sequence(PropertyPathPtr first, PropertyPathPtr second);
    static PropertyPathPtr alternation(PropertyPathPtr first, PropertyPathPtr second);
    static PropertyPathPtr inverse(PropertyPathPtr path);
    static PropertyPathPtr zeroOrMore(PropertyPathPtr path);
    static PropertyPathPtr oneOrMore(PropertyPathPtr path);
    static PropertyPathPtr zeroOrOne(PropertyPathPtr path);

    Type getType() const { return m_type; }

    /// The predicate of an Atomic path
    Uri getPredicate() const { return m_predicate; }

    /// The operand of a unary path, or the first operand of a binary one
    PropertyPathPtr getLeft() const { return m_left; }

    /// The second operand of a Sequence or Alternation
    PropertyPathPtr getRight() const { return m_right; }

    bool isAtomic() const { return m_type == Atomic; }

    /**
     * Return true if the path can match a zero-length route, i.e. if
     * every node is connected to itself by it.
     */
    bool matchesZeroLength() const;

    /**
     * Return the path in query syntax, with full IRIs.
     */
    QString toString() const;

private:
    PropertyPath(Type type) : m_type(type) { }

    Type m_type;
    Uri m_predicate;
    PropertyPathPtr m_left;
    PropertyPathPtr m_right;
};

}

#endif
