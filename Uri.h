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

#ifndef _ONTOQUAY_URI_H_
#define _ONTOQUAY_URI_H_

#include <QString>
#include <QUrl>
#include <QList>

#include <iostream>

class QTextStream;

namespace Ontoquay
{

/**
 * \class Uri Uri.h <ontoquay/Uri.h>
 *
 * Uri represents a single complete IRI.  It is a very thin immutable
 * wrapper around a string.  Its purpose is to allow us to distinguish
 * between abbreviated IRIs (CURIEs such as skos:broader) which are
 * subject to prefix expansion (represented by strings) and full IRIs
 * (represented by Uri).
 *
 * Never store an abbreviated form in a Uri object without expanding
 * it first using PrefixTable::expand().
 *
 * A default-constructed Uri is empty.  The empty Uri is also used to
 * name the default graph of a Dataset.
 */
class Uri
{
public:
    /**
     * Construct an empty (null) URI.
     */
    Uri() : m_hash(0) {
    }

    /**
     * Construct a URI from the given string, which is expected to
     * contain the text of a complete well-formed IRI.  This
     * constructor is intentionally marked explicit; no silent
     * conversion is available.
     */
    explicit Uri(const QString &s) : m_hash(0), m_uri(s) {
#ifndef NDEBUG
        checkComplete();
#endif
        makeHash();
    }

    /**
     * Construct a URI from the given QUrl, which is expected to
     * contain a complete well-formed URI.
     */
    explicit Uri(const QUrl &u) : m_hash(0), m_uri(u.toString()) {
#ifndef NDEBUG
        checkComplete();
#endif
        makeHash();
    }

    ~Uri() {
    }

    inline QString toString() const { return m_uri; }
    inline int length() const { return m_uri.length(); }
    inline bool isEmpty() const { return m_uri.isEmpty(); }
    inline uint hash() const { return m_hash; }

    inline bool operator==(const Uri &u) const {
        if (m_hash != u.m_hash) return false;
        else return m_uri == u.m_uri;
    }
    inline bool operator!=(const Uri &u) const { return !operator==(u); }
    inline bool operator<(const Uri &u) const { return m_uri < u.m_uri; }
    inline bool operator>(const Uri &u) const { return u < *this; }

private:
    void checkComplete() const;
    void makeHash();
    uint m_hash;
    QString m_uri;
};

typedef QList<Uri> UriList;

uint qHash(const Uri &u);

std::ostream &operator<<(std::ostream &out, const Uri &);
QTextStream &operator<<(QTextStream &out, const Uri &);

}

#endif
