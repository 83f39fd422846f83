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

#ifndef _ONTOQUAY_PREFIX_TABLE_H_
#define _ONTOQUAY_PREFIX_TABLE_H_

#include "Uri.h"

#include <QMap>
#include <QStringList>

namespace Ontoquay
{

/**
 * \class PrefixTable PrefixTable.h <ontoquay/PrefixTable.h>
 *
 * A mapping from short prefix names to namespace IRIs, used to expand
 * abbreviated IRIs (CURIEs) such as "skos:broader" when a query is
 * prepared, and to abbreviate full IRIs for display.
 *
 * The table always knows about the RDF and XSD namespaces.  The
 * empty prefix stands for the base URI, so that ":thing" expands to
 * the base URI followed by "thing".  The bare name "a" expands to
 * rdf:type.
 *
 * PrefixTable is a value type; it is not thread safe to modify one
 * that is being read elsewhere.
 */
class PrefixTable
{
public:
    PrefixTable();

    /**
     * Set the base URI, used to expand the empty prefix.
     */
    void setBaseUri(Uri uri);

    /**
     * Retrieve the base URI.  The default base URI is empty, in which
     * case the empty prefix is unknown unless added explicitly.
     */
    Uri getBaseUri() const;

    /**
     * Add a prefix/uri pair.  If the prefix has already been added,
     * this overrides any uri associated with it.
     *
     * Example: addPrefix("skos", Uri("http://www.w3.org/2004/02/skos/core#")).
     */
    void addPrefix(QString prefix, Uri uri);

    /**
     * Return true if the given prefix is known.
     */
    bool contains(QString prefix) const;

    /**
     * Add all prefixes from the given table to this one.  Prefixes in
     * the other table take precedence.  The base URI is taken from
     * the other table if it has one.
     */
    void merge(const PrefixTable &other);

    /**
     * Expand the given abbreviated IRI (prefix:local, :local, or a)
     * and return the full IRI.  Throw RDFUnknownPrefix if the prefix
     * is not known, or if the string has no prefix separator at all.
     */
    Uri expand(QString curie) const;

    /**
     * Abbreviate the given IRI using the longest matching namespace.
     * If no namespace matches, return the IRI in angle brackets.
     */
    QString compress(Uri uri) const;

private:
    typedef QMap<QString, QString> PrefixMap;
    PrefixMap m_prefixes;
    Uri m_baseUri;
};

}

#endif
