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

#ifndef _ONTOQUAY_NODE_H_
#define _ONTOQUAY_NODE_H_

#include "Uri.h"

#include <QString>
#include <QVariant>
#include <QList>

class QTextStream;

namespace Ontoquay
{

/**
 * \class Node Node.h <ontoquay/Node.h>
 *
 * A single RDF term: an IRI, a blank node or a literal, or the
 * special Nothing value.
 *
 * Nothing is never stored in a graph.  It is used as a wildcard when
 * pattern matching a triple, to represent an unbound variable, and
 * as the result of an expression that could not be evaluated.
 *
 * A literal has a lexical form (value), a datatype and optionally a
 * language tag.  A literal with no datatype is a plain string; a
 * literal typed as xsd:string is normalised to a plain one on
 * construction, so that "x" and "x"^^xsd:string compare equal.
 */
class Node
{
public:
    /**
     * Node type.
     */
    enum Type { Nothing, URI, Literal, Blank };

    /**
     * Construct a node with no node type (used for example as an
     * undefined node when pattern matching a triple).
     */
    Node() : type(Nothing), value() { }

    /**
     * Construct a node with a URI node type and the given URI.
     */
    Node(Uri u) : type(URI), value(u.toString()) { }

    /**
     * Construct a node with the given node type and value, and with
     * no defined data type URI.
     */
    Node(Type t, QString v) : type(t), value(v) { }

    /**
     * Construct a node with the given node type, value, and data type
     * URI.
     */
    Node(Type t, QString v, Uri dt);

    ~Node() { }

    /**
     * Construct a literal node with the given lexical form and
     * language tag.
     */
    static Node languageLiteral(QString v, QString language);

    bool isNothing() const { return type == Nothing; }
    bool isURI() const { return type == URI; }
    bool isBlank() const { return type == Blank; }
    bool isLiteral() const { return type == Literal; }

    /**
     * Return true if this is a literal with one of the XSD numeric
     * datatypes.
     */
    bool isNumeric() const;

    /**
     * Convert a QVariant to a Node.
     *
     * Simple QVariant types (bool, integer, double) are converted to
     * literal Nodes whose values are encoded as XSD datatypes.
     * Strings become plain literals and QUrls become URI nodes.
     * Anything else converts to a Nothing node.
     */
    static Node fromVariant(const QVariant &v);

    /**
     * Convert a Node to a QVariant.  URI nodes are returned as QUrl
     * variants; literals of known XSD types as the corresponding
     * simple type; other literals as strings.  Blank and Nothing
     * nodes return an invalid QVariant.
     */
    QVariant toVariant() const;

    /**
     * Return the full URI of the XSD datatype with the given local
     * name, e.g. xsdDatatype("integer").
     */
    static Uri xsdDatatype(QString localName);

    Type type;
    QString value;
    Uri datatype;
    QString language;
};

/**
 * A list of node types.
 */
typedef QList<Node> Nodes;

bool operator==(const Node &a, const Node &b);
bool operator!=(const Node &a, const Node &b);
bool operator<(const Node &a, const Node &b);

uint qHash(const Node &n);

std::ostream &operator<<(std::ostream &out, const Node &);
QTextStream &operator<<(QTextStream &out, const Node &);

}

#endif
