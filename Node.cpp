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

#include "Node.h"

#include "Debug.h"

#include <QTextStream>
#include <QHash>
#include <QSet>
#include <QUrl>

namespace Ontoquay
{

static const QString xsdPrefix("http://www.w3.org/2001/XMLSchema#");

// Datatypes we treat as numeric.  Integral types convert to qlonglong
// variants and the rest to double.

static QSet<QString>
integralTypes()
{
    QSet<QString> s;
    s << "integer" << "int" << "long" << "short" << "byte"
      << "nonNegativeInteger" << "positiveInteger"
      << "negativeInteger" << "nonPositiveInteger"
      << "unsignedInt" << "unsignedLong" << "unsignedShort"
      << "unsignedByte";
    return s;
}

static QSet<QString>
floatingTypes()
{
    QSet<QString> s;
    s << "decimal" << "double" << "float";
    return s;
}

static QString
xsdLocalName(const Uri &datatype)
{
    QString dt = datatype.toString();
    if (!dt.startsWith(xsdPrefix)) return "";
    return dt.mid(xsdPrefix.length());
}

Node::Node(Type t, QString v, Uri dt) :
    type(t), value(v), datatype(dt)
{
    if (type == Literal && xsdLocalName(datatype) == "string") {
        datatype = Uri();
    }
}

Node
Node::languageLiteral(QString v, QString lang)
{
    Node n(Literal, v);
    n.language = lang.toLower();
    return n;
}

Uri
Node::xsdDatatype(QString localName)
{
    return Uri(xsdPrefix + localName);
}

bool
Node::isNumeric() const
{
    if (type != Literal || datatype.isEmpty()) return false;
    static const QSet<QString> integral(integralTypes());
    static const QSet<QString> floating(floatingTypes());
    QString local = xsdLocalName(datatype);
    return integral.contains(local) || floating.contains(local);
}

Node
Node::fromVariant(const QVariant &v)
{
    DEBUG << "Node::fromVariant: QVariant type is " << v.userType()
          << ", variant is " << v.toString();

    switch (int(v.type())) {
    case QVariant::Url:
        return Node(Uri(v.toUrl()));
    case QVariant::Bool:
        return Node(Literal, v.toBool() ? "true" : "false",
                    xsdDatatype("boolean"));
    case QVariant::Int:
    case QVariant::UInt:
    case QVariant::LongLong:
    case QVariant::ULongLong:
        return Node(Literal, v.toString(), xsdDatatype("integer"));
    case QMetaType::Float:
    case QVariant::Double:
        return Node(Literal, QString::number(v.toDouble()),
                    xsdDatatype("decimal"));
    case QVariant::String:
        return Node(Literal, v.toString());
    default:
        break;
    }

    return Node();
}

QVariant
Node::toVariant() const
{
    if (type == URI) {
        return QVariant::fromValue<QUrl>(QUrl(value));
    }

    if (type == Nothing || type == Blank) {
        return QVariant();
    }

    static const QSet<QString> integral(integralTypes());
    static const QSet<QString> floating(floatingTypes());

    QString local = xsdLocalName(datatype);
    if (local == "boolean") {
        return QVariant::fromValue<bool>(value == "true" || value == "1");
    }
    if (integral.contains(local)) {
        return QVariant::fromValue<qlonglong>(value.toLongLong());
    }
    if (floating.contains(local)) {
        return QVariant::fromValue<double>(value.toDouble());
    }
    return QVariant::fromValue<QString>(value);
}

bool
operator==(const Node &a, const Node &b)
{
    if (a.type == Node::Nothing &&
        b.type == Node::Nothing) return true;
    if (a.type == b.type &&
        a.value == b.value &&
        a.datatype == b.datatype &&
        a.language == b.language) return true;
    return false;
}

bool
operator!=(const Node &a, const Node &b)
{
    return !operator==(a, b);
}

bool
operator<(const Node &a, const Node &b)
{
    if (a.type != b.type) return a.type < b.type;
    if (a.value != b.value) return a.value < b.value;
    if (a.datatype != b.datatype) return a.datatype < b.datatype;
    return a.language < b.language;
}

uint
qHash(const Node &n)
{
    if (n.type == Node::Nothing) return 0;
    return ::qHash(n.value) ^ (uint(n.type) << 3) ^
        n.datatype.hash() ^ ::qHash(n.language);
}

static QString
escapeLiteral(QString s)
{
    s.replace("\\", "\\\\");
    s.replace("\"", "\\\"");
    s.replace("\n", "\\n");
    s.replace("\r", "\\r");
    s.replace("\t", "\\t");
    return s;
}

std::ostream &
operator<<(std::ostream &out, const Node &n)
{
    QString s;
    QTextStream ts(&s);
    ts << n;
    ts.flush();
    return out << s.toStdString();
}

QTextStream &
operator<<(QTextStream &out, const Node &n)
{
    switch (n.type) {
    case Node::Nothing:
        out << "[]";
        break;
    case Node::URI:
        if (n.value == "") {
            out << "[empty-uri]";
        } else {
            out << "<" << n.value << ">";
        }
        break;
    case Node::Literal:
        out << "\"" << escapeLiteral(n.value) << "\"";
        if (n.language != "") out << "@" << n.language;
        else if (!n.datatype.isEmpty()) out << "^^<" << n.datatype << ">";
        break;
    case Node::Blank:
        out << "_:" << n.value;
        break;
    }
    return out;
}

}
