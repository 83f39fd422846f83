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

#ifndef _ONTOQUAY_QUERY_PARSER_H_
#define _ONTOQUAY_QUERY_PARSER_H_

#include "Query.h"
#include "QueryLexer.h"

#include "../PrefixTable.h"

namespace Ontoquay
{

/**
 * \class QueryParser QueryParser.h <ontoquay/query/QueryParser.h>
 *
 * Recursive-descent parser for the query language: SELECT, CONSTRUCT
 * and INSERT queries with group graph patterns, property paths and
 * FILTER/BIND expressions.
 *
 * Prefixed names are expanded while parsing, using the given prefix
 * table together with the query's own PREFIX declarations (which take
 * precedence).  A syntax error throws RDFSyntaxError, and an
 * undeclared prefix throws RDFUnknownPrefix.
 */
class QueryParser
{
public:
    QueryParser(QString text, const PrefixTable &prefixes);
    ~QueryParser();

    /**
     * Parse the query text and return the bound query.
     */
    Query parse();

private:
    QueryLexer m_lexer;
    QString m_text;
    PrefixTable m_prefixes;
    bool m_inTemplate;
    bool m_allowAggregates;
    int m_anonCounter;

    void syntaxError(QString message) const;
    void expect(QueryLexer::Token expected, QString context);
    QString describeCurrent(QueryLexer::Token t) const;

    void parsePrologue();
    void parseSelect(Query &q);
    void parseConstruct(Query &q);
    void parseInsert(Query &q);
    void parseWhere(Query &q);
    void parseSolutionModifiers(Query &q, bool allowGroupBy);

    GroupPatternPtr parseGroupGraphPattern();
    void parseTriplesSameSubject(TriplePatterns &block);
    void parsePropertyList(PatternTerm subject, TriplePatterns &block);
    bool startsVerb(QueryLexer::Token t) const;
    PatternTerm parseGraphNode(TriplePatterns &block);
    PatternTerm parseBlankNodePropertyList(TriplePatterns &block);
    PatternTerm parseGraphTerm();
    PatternTerm makeAnonymous();

    PropertyPathPtr parsePath();
    PropertyPathPtr parsePathSequence();
    PropertyPathPtr parsePathEltOrInverse();
    PropertyPathPtr parsePathPrimary();

    TemplateTriples parseTemplateBlock(PatternTerm graph);

    ExpressionPtr parseConstraint();
    ExpressionPtr parseExpression();
    ExpressionPtr parseConditionalAnd();
    ExpressionPtr parseRelational();
    ExpressionPtr parseUnary();
    ExpressionPtr parsePrimary();
    ExpressionPtr parseCall(QString name);
    ExpressionPtr parseAggregate(Expression::AggregateFunction f);
    ExpressionList parseArgumentList();

    Node parseLiteral(QueryLexer::Token t);
    Node parseNumber(QueryLexer::Token t, bool negative);
    Uri resolveIri(QString iri) const;
    Uri expandName(QString name) const;
    QString parseVariableName();
};

}

#endif
