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

#include "Pattern.h"

namespace Ontoquay
{

QString
PatternTerm::toString() const
{
    if (m_isVariable) {
        if (isAnonymous()) return m_variable;
        return "?" + m_variable;
    }
    return Expression::constant(m_node)->toString();
}

void
TriplePattern::collectVariables(QStringList &out) const
{
    if (subject.isVariable() && !out.contains(subject.getVariable())) {
        out.push_back(subject.getVariable());
    }
    if (!hasPath() && predicate.isVariable() &&
        !out.contains(predicate.getVariable())) {
        out.push_back(predicate.getVariable());
    }
    if (object.isVariable() && !out.contains(object.getVariable())) {
        out.push_back(object.getVariable());
    }
}

QString
TriplePattern::toString() const
{
    return subject.toString() + " " +
        (hasPath() ? path->toString() : predicate.toString()) + " " +
        object.toString();
}

ExpressionList
GroupPattern::getFilters() const
{
    ExpressionList filters;
    foreach (const PatternElement &e, m_elements) {
        if (e.type == PatternElement::Filter) {
            filters.push_back(e.expression);
        }
    }
    return filters;
}

QStringList
GroupPattern::getVariables() const
{
    QStringList all;
    collectVariables(all);
    QStringList named;
    foreach (QString v, all) {
        if (!v.startsWith("_:")) named.push_back(v);
    }
    return named;
}

void
GroupPattern::collectVariables(QStringList &out) const
{
    foreach (const PatternElement &e, m_elements) {
        switch (e.type) {
        case PatternElement::TriplesBlock:
            foreach (const TriplePattern &t, e.triples) {
                t.collectVariables(out);
            }
            break;
        case PatternElement::Graph:
            if (e.graph.isVariable() && !out.contains(e.graph.getVariable())) {
                out.push_back(e.graph.getVariable());
            }
            // fall through
        case PatternElement::Group:
        case PatternElement::Union:
        case PatternElement::Optional:
            foreach (GroupPatternPtr g, e.groups) {
                g->collectVariables(out);
            }
            break;
        case PatternElement::Bind:
            if (!out.contains(e.variable)) out.push_back(e.variable);
            break;
        case PatternElement::Filter:
            break;
        }
    }
}

}
