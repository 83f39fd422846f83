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

#include "QueryLexer.h"

namespace Ontoquay
{

QueryLexer::QueryLexer(QString input) :
    m_input(input),
    m_pos(0),
    m_tokenStart(0),
    m_putBack(None)
{
}

QueryLexer::~QueryLexer()
{
}

bool
QueryLexer::isNameStartChar(QChar c)
{
    return c.isLetter() || c == '_';
}

bool
QueryLexer::isNameChar(QChar c)
{
    return c.isLetterOrNumber() || c == '_' || c == '-';
}

QueryLexer::Token
QueryLexer::getNext()
{
    // Do we have a token already?
    if (m_putBack != None) {
        Token t = m_putBack;
        m_putBack = None;
        return t;
    }

    m_value = "";

    while (!atEnd()) {

        m_tokenStart = m_pos;
        QChar c = m_input[m_pos++];

        switch (c.unicode()) {

            // Whitespace
        case ' ': case '\t': case '\n': case '\r': case '\f':
            continue;

            // Single line comment
        case '#':
            while (!atEnd() && peekChar() != '\n' && peekChar() != '\r') {
                ++m_pos;
            }
            continue;

            // Simple tokens
        case '{': return LCurly;
        case '}': return RCurly;
        case '(': return LParen;
        case ')': return RParen;
        case ']': return RBracket;
        case ',': return Comma;
        case ';': return Semicolon;
        case '*': return Star;
        case '+': return Plus;
        case '-': return Minus;
        case '/': return Slash;
        case '=': return Equal;

        case '.':
            if (peekChar().isDigit()) {
                --m_pos;
                return readNumber();
            }
            return Dot;

        case '|':
            if (peekChar() == '|') { ++m_pos; return Or; }
            return Bar;

        case '&':
            if (peekChar() == '&') { ++m_pos; return And; }
            m_value = "&";
            return Error;

        case '^':
            if (peekChar() == '^') { ++m_pos; return DoubleCaret; }
            return Caret;

        case '!':
            if (peekChar() == '=') { ++m_pos; return NotEqual; }
            return Not;

        case '>':
            if (peekChar() == '=') { ++m_pos; return GreaterOrEqual; }
            return Greater;

            // IRI reference, or a less-than operator if no well-formed
            // IRI follows
        case '<': {
            int p = m_pos;
            while (p < m_input.length()) {
                QChar d = m_input[p];
                if (d == '>') {
                    m_value = m_input.mid(m_pos, p - m_pos);
                    m_pos = p + 1;
                    return IRI;
                }
                if (d.isSpace() || d == '<' || d == '"' || d == '{' ||
                    d == '}' || d == '|' || d == '^' || d == '`' ||
                    d == '\\') {
                    break;
                }
                ++p;
            }
            if (peekChar() == '=') { ++m_pos; return LessOrEqual; }
            return Less;
        }

            // Brackets
        case '[': {
            int p = m_pos;
            while (p < m_input.length() && m_input[p].isSpace()) ++p;
            if (p < m_input.length() && m_input[p] == ']') {
                m_pos = p + 1;
                return Anon;
            }
            return LBracket;
        }

            // Strings
        case '"': case '\'':
            return readString(c);

            // Variables
        case '?': case '$': {
            if (!isNameStartChar(peekChar()) && !peekChar().isDigit()) {
                if (c == '?') return Question;
                m_value = c;
                return Error;
            }
            int start = m_pos;
            while (!atEnd() &&
                   (peekChar().isLetterOrNumber() || peekChar() == '_')) {
                ++m_pos;
            }
            m_value = m_input.mid(start, m_pos - start);
            return Variable;
        }

            // Language tag
        case '@': {
            int start = m_pos;
            while (!atEnd() &&
                   (peekChar().isLetterOrNumber() || peekChar() == '-')) {
                ++m_pos;
            }
            m_value = m_input.mid(start, m_pos - start);
            if (m_value == "") return Error;
            return LangTag;
        }

            // Blank node label, or a name starting with underscore
        case '_':
            if (peekChar() == ':') {
                ++m_pos;
                int start = m_pos;
                while (!atEnd() && isNameChar(peekChar())) ++m_pos;
                m_value = m_input.mid(start, m_pos - start);
                if (m_value == "") return Error;
                return BlankLabel;
            }
            --m_pos;
            return readName();

            // Prefixed name with the empty prefix
        case ':':
            --m_pos;
            return readName();

        default:
            if (c.isDigit()) {
                --m_pos;
                return readNumber();
            }
            if (isNameStartChar(c)) {
                --m_pos;
                return readName();
            }
            m_value = c;
            return Error;
        }
    }

    m_tokenStart = m_pos;
    return Eof;
}

QueryLexer::Token
QueryLexer::readName()
{
    int start = m_pos;
    while (!atEnd() && isNameChar(peekChar())) ++m_pos;
    m_value = m_input.mid(start, m_pos - start);

    if (peekChar() != ':') {
        return Identifier;
    }

    ++m_pos;
    m_value += ':';
    readLocalName();
    return PrefixedName;
}

void
QueryLexer::readLocalName()
{
    while (!atEnd()) {
        QChar c = peekChar();
        if (isNameChar(c) || c == ':' || c == '%') {
            m_value += c;
            ++m_pos;
        } else if (c == '.' && isNameChar(peekChar(1))) {
            // A dot may appear within a local name but not at its end
            m_value += c;
            ++m_pos;
        } else if (c == '\\' && m_pos + 1 < m_input.length()) {
            m_value += peekChar(1);
            m_pos += 2;
        } else {
            break;
        }
    }
}

QueryLexer::Token
QueryLexer::readNumber()
{
    int start = m_pos;
    Token t = Integer;

    while (!atEnd() && peekChar().isDigit()) ++m_pos;

    if (peekChar() == '.' && peekChar(1).isDigit()) {
        t = Decimal;
        ++m_pos;
        while (!atEnd() && peekChar().isDigit()) ++m_pos;
    }

    if (peekChar() == 'e' || peekChar() == 'E') {
        int p = m_pos + 1;
        if (p < m_input.length() && (m_input[p] == '+' || m_input[p] == '-')) ++p;
        if (p < m_input.length() && m_input[p].isDigit()) {
            t = Double;
            m_pos = p;
            while (!atEnd() && peekChar().isDigit()) ++m_pos;
        }
    }

    m_value = m_input.mid(start, m_pos - start);
    return t;
}

bool
QueryLexer::readEscape(QString &out)
{
    if (atEnd()) return false;
    QChar c = m_input[m_pos++];
    switch (c.unicode()) {
    case 't': out += '\t'; return true;
    case 'n': out += '\n'; return true;
    case 'r': out += '\r'; return true;
    case 'b': out += '\b'; return true;
    case 'f': out += '\f'; return true;
    case '"': out += '"'; return true;
    case '\'': out += '\''; return true;
    case '\\': out += '\\'; return true;
    case 'u': case 'U': {
        int digits = (c == 'u' ? 4 : 8);
        if (m_pos + digits > m_input.length()) return false;
        bool ok = false;
        uint code = m_input.mid(m_pos, digits).toUInt(&ok, 16);
        if (!ok) return false;
        m_pos += digits;
        out += QString::fromUcs4(&code, 1);
        return true;
    }
    default:
        return false;
    }
}

QueryLexer::Token
QueryLexer::readString(QChar quote)
{
    bool isLong = (peekChar() == quote && peekChar(1) == quote);
    if (isLong) m_pos += 2;

    QString s;

    while (!atEnd()) {
        QChar c = m_input[m_pos];
        if (c == '\\') {
            ++m_pos;
            if (!readEscape(s)) {
                m_value = "bad escape sequence";
                return Error;
            }
            continue;
        }
        if (c == quote) {
            if (!isLong) {
                ++m_pos;
                m_value = s;
                return String;
            }
            if (peekChar(1) == quote && peekChar(2) == quote) {
                m_pos += 3;
                m_value = s;
                return String;
            }
        }
        if (!isLong && (c == '\n' || c == '\r')) {
            m_value = "newline in string";
            return Error;
        }
        s += c;
        ++m_pos;
    }

    m_value = "unterminated string";
    return Error;
}

bool
QueryLexer::isKeyword(const char *keyword) const
{
    return m_value.compare(QString::fromLatin1(keyword), Qt::CaseInsensitive) == 0;
}

int
QueryLexer::getLine() const
{
    int line = 1;
    for (int i = 0; i < m_tokenStart && i < m_input.length(); ++i) {
        if (m_input[i] == '\n') ++line;
    }
    return line;
}

int
QueryLexer::getColumn() const
{
    int column = 1;
    for (int i = 0; i < m_tokenStart && i < m_input.length(); ++i) {
        if (m_input[i] == '\n') column = 1;
        else ++column;
    }
    return column;
}

QString
QueryLexer::describe(Token t)
{
    switch (t) {
    case None: return "nothing";
    case Error: return "invalid input";
    case Eof: return "end of query";
    case IRI: return "IRI";
    case PrefixedName: return "prefixed name";
    case BlankLabel: return "blank node label";
    case Anon: return "[]";
    case Variable: return "variable";
    case String: return "string";
    case Integer: return "integer";
    case Decimal: return "decimal";
    case Double: return "double";
    case LangTag: return "language tag";
    case DoubleCaret: return "^^";
    case Identifier: return "identifier";
    case LCurly: return "{";
    case RCurly: return "}";
    case LParen: return "(";
    case RParen: return ")";
    case LBracket: return "[";
    case RBracket: return "]";
    case Dot: return ".";
    case Comma: return ",";
    case Semicolon: return ";";
    case Star: return "*";
    case Plus: return "+";
    case Minus: return "-";
    case Slash: return "/";
    case Bar: return "|";
    case Caret: return "^";
    case Question: return "?";
    case Equal: return "=";
    case NotEqual: return "!=";
    case Less: return "<";
    case Greater: return ">";
    case LessOrEqual: return "<=";
    case GreaterOrEqual: return ">=";
    case And: return "&&";
    case Or: return "||";
    case Not: return "!";
    }
    return "?";
}

}
