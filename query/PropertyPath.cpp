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

#include "PropertyPath.h"

namespace Ontoquay
{

PropertyPathPtr
PropertyPath::atomic(Uri predicate)
{
    PropertyPathPtr p(new PropertyPath(Atomic));
    p->m_predicate = predicate;
    return p;
}

PropertyPathPtr
PropertyPath::sequence(PropertyPathPtr first, PropertyPathPtr second)
{
    PropertyPathPtr p(new PropertyPath(Sequence));
    p->m_left = first;
    p->m_right = second;
    return p;
}

PropertyPathPtr
PropertyPath::alternation(PropertyPathPtr first, PropertyPathPtr second)
{
    PropertyPathPtr p(new PropertyPath(Alternation));
    p->m_left = first;
    p->m_right = second;
    return p;
}

PropertyPathPtr
PropertyPath::inverse(PropertyPathPtr path)
{
    PropertyPathPtr p(new PropertyPath(Inverse));
    p->m_left = path;
    return p;
}

PropertyPathPtr
PropertyPath::zeroOrMore(PropertyPathPtr path)
{
    PropertyPathPtr p(new PropertyPath(ZeroOrMore));
    p->m_left = path;
    return p;
}

PropertyPathPtr
PropertyPath::oneOrMore(PropertyPathPtr path)
{
    PropertyPathPtr p(new PropertyPath(OneOrMore));
    p->m_left = path;
    return p;
}

PropertyPathPtr
PropertyPath::zeroOrOne(PropertyPathPtr path)
{
    PropertyPathPtr p(new PropertyPath(ZeroOrOne));
    p->m_left = path;
    return p;
}

bool
PropertyPath::matchesZeroLength() const
{
    switch (m_type) {
    case Atomic:
        return false;
    case OneOrMore:
        return m_left->matchesZeroLength();
    case Sequence:
        return m_left->matchesZeroLength() && m_right->matchesZeroLength();
    case Alternation:
        return m_left->matchesZeroLength() || m_right->matchesZeroLength();
    case Inverse:
        return m_left->matchesZeroLength();
    case ZeroOrMore:
    case ZeroOrOne:
        return true;
    }
    return false;
}

QString
PropertyPath::toString() const
{
    switch (m_type) {
    case Atomic:
        return "<" + m_predicate.toString() + ">";
    case Sequence:
        return "(" + m_left->toString() + "/" + m_right->toString() + ")";
    case Alternation:
        return "(" + m_left->toString() + "|" + m_right->toString() + ")";
    case Inverse:
        return "^" + m_left->toString();
    case ZeroOrMore:
        return m_left->toString() + "*";
    case OneOrMore:
        return m_left->toString() + "+";
    case ZeroOrOne:
        return m_left->toString() + "?";
    }
    return QString();
}

}
