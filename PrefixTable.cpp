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

#include "PrefixTable.h"
#include "RDFException.h"

#include "Debug.h"

namespace Ontoquay
{

PrefixTable::PrefixTable()
{
    m_prefixes["rdf"] = "http://www.w3.org/1999/02/22-rdf-syntax-ns#";
    m_prefixes["xsd"] = "http://www.w3.org/2001/XMLSchema#";
}

void
PrefixTable::setBaseUri(Uri uri)
{
    m_baseUri = uri;
    m_prefixes[""] = uri.toString();
}

Uri
PrefixTable::getBaseUri() const
{
    return m_baseUri;
}

void
PrefixTable::addPrefix(QString prefix, Uri uri)
{
    m_prefixes[prefix] = uri.toString();
}

bool
PrefixTable::contains(QString prefix) const
{
    return m_prefixes.contains(prefix);
}

void
PrefixTable::merge(const PrefixTable &other)
{
    for (PrefixMap::const_iterator i = other.m_prefixes.begin();
         i != other.m_prefixes.end(); ++i) {
        m_prefixes[i.key()] = i.value();
    }
    if (!other.m_baseUri.isEmpty()) {
        m_baseUri = other.m_baseUri;
    }
}

Uri
PrefixTable::expand(QString curie) const
{
    if (curie == "a") curie = "rdf:type";

    int colon = curie.indexOf(':');
    if (colon < 0) {
        throw RDFUnknownPrefix(curie);
    }

    QString prefix = curie.left(colon);
    PrefixMap::const_iterator i = m_prefixes.find(prefix);
    if (i == m_prefixes.end()) {
        DEBUG << "PrefixTable::expand: unknown prefix \"" << prefix
              << "\" in " << curie;
        throw RDFUnknownPrefix(curie);
    }

    return Uri(i.value() + curie.mid(colon + 1));
}

QString
PrefixTable::compress(Uri uri) const
{
    QString s = uri.toString();
    QString bestPrefix;
    int bestLength = 0;
    for (PrefixMap::const_iterator i = m_prefixes.begin();
         i != m_prefixes.end(); ++i) {
        const QString &ns = i.value();
        if (ns.length() > bestLength && ns.length() < s.length() &&
            s.startsWith(ns)) {
            bestPrefix = i.key();
            bestLength = ns.length();
        }
    }
    if (bestLength == 0) {
        return "<" + s + ">";
    }
    return bestPrefix + ":" + s.mid(bestLength);
}

}
