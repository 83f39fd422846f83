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

#ifndef _ONTOQUAY_QUERY_LEXER_H_
#define _ONTOQUAY_QUERY_LEXER_H_

#include <QString>

namespace Ontoquay
{

/**
 * \class QueryLexer QueryLexer.h <ontoquay/query/QueryLexer.h>
 *
 * Splits query text into tokens for QueryParser.
 *
 * The value of the most recent token is available from
 * getTokenValue(): for an IRI it is the text between the angle
 * brackets, for a string the unescaped contents, for a variable the
 * name without ? or $, for a blank node label the label without _:,
 * and for a language tag the tag without @.  One token may be pushed
 * back with unget().
 */
class QueryLexer
{
public:
    enum Token {
        None, Error, Eof,
        IRI, PrefixedName, BlankLabel, Anon, Variable,
        String, Integer, Decimal, Double, LangTag, DoubleCaret,
        Identifier,
        LCurly, RCurly, LParen, RParen, LBracket, RBracket,
        Dot, Comma, Semicolon,
        Star, Plus, Minus, Slash, Bar, Caret, Question,
        Equal, NotEqual, Less, Greater, LessOrEqual, GreaterOrEqual,
        And, Or, Not
    };

    QueryLexer(QString input);
    ~QueryLexer();

    /**
     * Return the next token.
     */
    Token getNext();

    /**
     * Push the given token (which must be the one most recently
     * returned by getNext) back, so that getNext returns it again.
     */
    void unget(Token t) { m_putBack = t; }

    /**
     * Return the value of the most recent token.
     */
    QString getTokenValue() const { return m_value; }

    /**
     * Return true if the most recent token is an identifier matching
     * the given keyword, case-insensitively.
     */
    bool isKeyword(const char *keyword) const;

    /**
     * Return the line (from 1) of the start of the most recent token.
     */
    int getLine() const;

    /**
     * Return the column (from 1) of the start of the most recent token.
     */
    int getColumn() const;

    static QString describe(Token t);

private:
    QString m_input;
    int m_pos;
    int m_tokenStart;
    Token m_putBack;
    QString m_value;

    bool atEnd() const { return m_pos >= m_input.length(); }
    QChar peekChar(int offset = 0) const {
        int p = m_pos + offset;
        if (p >= m_input.length()) return QChar();
        return m_input[p];
    }

    Token readString(QChar quote);
    Token readNumber();
    Token readName();
    void readLocalName();
    bool readEscape(QString &out);

    static bool isNameStartChar(QChar c);
    static bool isNameChar(QChar c);
};

}

#endif
