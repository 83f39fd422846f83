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

#ifndef _ONTOQUAY_PATTERN_H_
#define _ONTOQUAY_PATTERN_H_

#include "Expression.h"
#include "PropertyPath.h"

#include "../Store.h"

#include <QStringList>

namespace Ontoquay
{

/**
 * \class PatternTerm Pattern.h <ontoquay/query/Pattern.h>
 *
 * One position of a triple pattern or template: either a fixed node
 * or a variable.  A default-constructed PatternTerm holds the Nothing
 * node.
 *
 * Blank node labels in a WHERE pattern are represented as variables
 * whose names start with "_:"; such variables are never projected by
 * SELECT *.
 */
class PatternTerm
{
public:
    PatternTerm() : m_isVariable(false) { }
    PatternTerm(Node n) : m_isVariable(false), m_node(n) { }

    static PatternTerm variable(QString name) {
        PatternTerm t;
        t.m_isVariable = true;
        t.m_variable = name;
        return t;
    }

    bool isVariable() const { return m_isVariable; }
    QString getVariable() const { return m_variable; }
    Node getNode() const { return m_node; }

    /**
     * Return true if this is a variable standing for a blank node
     * label or anonymous node in a pattern.
     */
    bool isAnonymous() const {
        return m_isVariable && m_variable.startsWith("_:");
    }

    /**
     * Return the node this term denotes under the given bindings:
     * the fixed node, the variable's value, or Nothing for an unbound
     * variable.
     */
    Node resolve(const Dictionary &bindings) const {
        if (!m_isVariable) return m_node;
        return bindings.value(m_variable);
    }

    QString toString() const;

private:
    bool m_isVariable;
    QString m_variable;
    Node m_node;
};

/**
 * A triple pattern.  The predicate is either a PatternTerm (an IRI or
 * a variable) or, if path is non-null, a property path.
 */
struct TriplePattern
{
    TriplePattern() { }
    TriplePattern(PatternTerm s, PatternTerm p, PatternTerm o) :
        subject(s), predicate(p), object(o) { }
    TriplePattern(PatternTerm s, PropertyPathPtr pp, PatternTerm o) :
        subject(s), object(o), path(pp) { }

    bool hasPath() const { return !path.isNull(); }

    void collectVariables(QStringList &out) const;

    QString toString() const;

    PatternTerm subject;
    PatternTerm predicate;
    PatternTerm object;
    PropertyPathPtr path;
};

typedef QList<TriplePattern> TriplePatterns;

/**
 * A triple of a CONSTRUCT or INSERT template.  Blank nodes in the
 * template are held as Blank nodes (not variables) and are replaced
 * by fresh blank nodes for each solution.  The graph term is Nothing
 * for the default graph, an IRI, or a variable.
 */
struct TemplateTriple
{
    TemplateTriple() { }
    TemplateTriple(PatternTerm s, PatternTerm p, PatternTerm o,
                   PatternTerm g = PatternTerm()) :
        subject(s), predicate(p), object(o), graph(g) { }

    PatternTerm subject;
    PatternTerm predicate;
    PatternTerm object;
    PatternTerm graph;
};

typedef QList<TemplateTriple> TemplateTriples;

/**
 * One element of a group graph pattern.  Which members are used
 * depends on the type:
 *
 *  - TriplesBlock: triples
 *  - Group, Optional: groups[0]
 *  - Union: groups (two or more branches)
 *  - Graph: graph and groups[0]
 *  - Filter: expression
 *  - Bind: expression and variable
 */
struct PatternElement
{
    enum Type { TriplesBlock, Group, Union, Optional, Graph, Filter, Bind };

    PatternElement(Type t = TriplesBlock) : type(t) { }

    Type type;
    TriplePatterns triples;
    QList<GroupPatternPtr> groups;
    PatternTerm graph;
    ExpressionPtr expression;
    QString variable;
};

/**
 * \class GroupPattern Pattern.h <ontoquay/query/Pattern.h>
 *
 * A group graph pattern: the contents of one pair of braces in a
 * WHERE clause.  Elements are evaluated in order, except that the
 * FILTERs of a group constrain the whole group and are applied after
 * everything else.
 */
class GroupPattern
{
public:
    GroupPattern() { }

    void addElement(const PatternElement &e) { m_elements.push_back(e); }
    const QList<PatternElement> &getElements() const { return m_elements; }

    /**
     * Return the expressions of the FILTER elements at the top level
     * of this group.
     */
    ExpressionList getFilters() const;

    /**
     * Return the names of the variables that may be bound by this
     * pattern, in order of first appearance, excluding anonymous
     * ones.  Variables that appear only in FILTERs are not included.
     */
    QStringList getVariables() const;

private:
    QList<PatternElement> m_elements;

    void collectVariables(QStringList &out) const;
};

}

#endif
