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

#include "TemplateExecutor.h"

#include "../Dataset.h"
#include "../Debug.h"

#include <QSet>
#include <QPair>

#include <algorithm>
#include <iostream>

namespace Ontoquay
{

namespace {

typedef QPair<int, QString> BlankKey;
typedef QHash<BlankKey, Node> BlankArena;

Node
instantiateTerm(const PatternTerm &term, const Dictionary &solution,
                int solutionIndex, BlankArena &arena, const Dataset *dataset)
{
    if (term.isVariable()) {
        return solution.value(term.getVariable());
    }
    Node n = term.getNode();
    if (n.type != Node::Blank) return n;

    BlankKey key(solutionIndex, n.value);
    BlankArena::const_iterator i = arena.find(key);
    if (i != arena.end()) return i.value();
    Node fresh = dataset->createBlankNode();
    arena.insert(key, fresh);
    return fresh;
}

}

TemplateExecutor::TemplateExecutor(Dataset *dataset) :
    m_dataset(dataset)
{
}

QMap<Uri, Triples>
TemplateExecutor::instantiate(const TemplateTriples &templ,
                              const ResultSet &solutions) const
{
    QMap<Uri, QSet<Triple> > sets;
    BlankArena arena;
    int unbound = 0;
    int invalid = 0;

    for (int i = 0; i < solutions.size(); ++i) {

        const Dictionary &solution = solutions[i];

        foreach (const TemplateTriple &tt, templ) {

            Uri graph;
            if (tt.graph.isVariable()) {
                Node g = solution.value(tt.graph.getVariable());
                if (g.type == Node::Nothing) {
                    ++unbound;
                    continue;
                }
                if (g.type != Node::URI) {
                    ++invalid;
                    continue;
                }
                graph = Uri(g.value);
            } else if (tt.graph.getNode().type == Node::URI) {
                graph = Uri(tt.graph.getNode().value);
            }

            Node s = instantiateTerm(tt.subject, solution, i, arena, m_dataset);
            Node p = instantiateTerm(tt.predicate, solution, i, arena, m_dataset);
            Node o = instantiateTerm(tt.object, solution, i, arena, m_dataset);

            if (s.type == Node::Nothing ||
                p.type == Node::Nothing ||
                o.type == Node::Nothing) {
                ++unbound;
                continue;
            }

            Triple t(s, p, o);
            if (!t.isStatement()) {
                ++invalid;
                continue;
            }

            sets[graph].insert(t);
        }
    }

    if (unbound > 0) {
        DEBUG << "TemplateExecutor::instantiate: dropped " << unbound
              << " triple(s) with unbound variables";
    }
    if (invalid > 0) {
        std::cerr << "WARNING: TemplateExecutor::instantiate: dropped "
                  << invalid << " instantiated triple(s) that are not "
                  << "valid statements" << std::endl;
    }

    QMap<Uri, Triples> result;
    for (QMap<Uri, QSet<Triple> >::const_iterator i = sets.begin();
         i != sets.end(); ++i) {
        Triples tt = i.value().toList();
        std::sort(tt.begin(), tt.end());
        result.insert(i.key(), tt);
    }
    return result;
}

Triples
TemplateExecutor::construct(const TemplateTriples &templ,
                            const ResultSet &solutions) const
{
    TemplateTriples defaultOnly;
    foreach (TemplateTriple tt, templ) {
        tt.graph = PatternTerm();
        defaultOnly.push_back(tt);
    }
    Triples result = instantiate(defaultOnly, solutions).value(Uri());
    DEBUG << "TemplateExecutor::construct: " << result.size()
          << " triple(s) from " << solutions.size() << " solution(s)";
    return result;
}

InsertReport
TemplateExecutor::insert(const TemplateTriples &templ,
                         const ResultSet &solutions)
{
    QMap<Uri, Triples> additions = instantiate(templ, solutions);

    InsertReport report;
    for (QMap<Uri, Triples>::const_iterator i = additions.begin();
         i != additions.end(); ++i) {
        report.instantiated += i.value().size();
    }

    report.added = m_dataset->commit(additions);

    DEBUG << "TemplateExecutor::insert: " << report.added << " of "
          << report.instantiated << " triple(s) added to "
          << additions.size() << " graph(s)";

    return report;
}

}
