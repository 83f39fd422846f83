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

#ifndef _ONTOQUAY_EXCEPTION_H_
#define _ONTOQUAY_EXCEPTION_H_

#include <QString>
#include <QByteArray>
#include <exception>

#include "Uri.h"

namespace Ontoquay
{

/**
 * \class RDFException RDFException.h <ontoquay/RDFException.h>
 *
 * RDFException is an exception that results from incorrect usage of
 * the RDF store or query interfaces or unsuitable data provided to a
 * function.  For example, this exception would be thrown in response
 * to trying to add an incomplete triple to a graph.
 */
class RDFException : virtual public std::exception
{
public:
    RDFException(QString message) throw() : m_message(message) {
        m_local = m_message.toLocal8Bit();
    }
    RDFException(QString message, QString data) throw() {
        m_message = QString("%1 [with string \"%2\"]").arg(message).arg(data);
        m_local = m_message.toLocal8Bit();
    }
    RDFException(QString message, Uri uri) throw() {
        m_message = QString("%1 [with URI <%2>]").arg(message).arg(uri.toString());
        m_local = m_message.toLocal8Bit();
    }
    virtual ~RDFException() throw() { }
    virtual const char *what() const throw() {
        return m_local.constData();
    }
    QString message() const { return m_message; }

protected:
    QString m_message;
    QByteArray m_local;
};

/**
 * \class RDFInternalError RDFException.h <ontoquay/RDFException.h>
 *
 * RDFInternalError is an exception that results from an internal
 * error in the store or query engine.
 */
class RDFInternalError : virtual public RDFException
{
public:
    RDFInternalError(QString message, QString data = "") throw() :
        RDFException(message, data) { }
    RDFInternalError(QString message, Uri data) throw() :
        RDFException(message, data) { }
};

/**
 * \class RDFSyntaxError RDFException.h <ontoquay/RDFException.h>
 *
 * RDFSyntaxError results from a malformed query, pattern or
 * template.  It is always thrown before any evaluation takes place.
 * The line and column of the offending token are available.
 */
class RDFSyntaxError : virtual public RDFException
{
public:
    RDFSyntaxError(QString message, int line, int column) throw() :
        RDFException(QString("%1 at line %2, column %3")
                     .arg(message).arg(line).arg(column)),
        m_line(line), m_column(column) { }
    virtual ~RDFSyntaxError() throw() { }

    int line() const { return m_line; }
    int column() const { return m_column; }

private:
    int m_line;
    int m_column;
};

/**
 * \class RDFUnknownPrefix RDFException.h <ontoquay/RDFException.h>
 *
 * RDFUnknownPrefix results from an abbreviated IRI whose prefix is
 * not known to the prefix table in use.  Like RDFSyntaxError it is
 * thrown when a query is prepared, before evaluation.
 */
class RDFUnknownPrefix : virtual public RDFException
{
public:
    RDFUnknownPrefix(QString curie) throw() :
        RDFException(QString("Missing prefix for '%1'").arg(curie)),
        m_curie(curie) { }
    virtual ~RDFUnknownPrefix() throw() { }

    QString curie() const { return m_curie; }

private:
    QString m_curie;
};

/**
 * \class RDFResourceExceeded RDFException.h <ontoquay/RDFException.h>
 *
 * RDFResourceExceeded results from a query evaluation that ran out of
 * its step or time budget, or was cancelled.  The query is abandoned
 * and, for an INSERT, nothing is committed.
 */
class RDFResourceExceeded : virtual public RDFException
{
public:
    RDFResourceExceeded(QString message) throw() :
        RDFException(message) { }
};

}

#endif
