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

#include "Uri.h"

#include <QTextStream>
#include <QHash>
#include <QRegularExpression>

#include <iostream>

namespace Ontoquay
{

void
Uri::makeHash()
{
    m_hash = ::qHash(m_uri);
}

void
Uri::checkComplete() const
{
#ifndef NDEBUG
    static const QRegularExpression schemeRx("^[a-zA-Z][a-zA-Z0-9+.-]*:");
    if (!m_uri.isEmpty() && m_uri[0] != '#' &&
        !schemeRx.match(m_uri).hasMatch()) {
        std::cerr << "WARNING: URI <" << m_uri.toStdString()
                  << "> is not complete; lacks scheme" << std::endl;
    }
#endif
}

uint
qHash(const Uri &u)
{
    return u.hash();
}

std::ostream &
operator<<(std::ostream &out, const Uri &u)
{
    return out << u.toString().toStdString();
}

QTextStream &
operator<<(QTextStream &out, const Uri &u)
{
    return out << u.toString();
}

}
