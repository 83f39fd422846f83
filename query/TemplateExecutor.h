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

#ifndef _ONTOQUAY_TEMPLATE_EXECUTOR_H_
#define _ONTOQUAY_TEMPLATE_EXECUTOR_H_

#include "Pattern.h"

#include <QMap>

namespace Ontoquay
{

class Dataset;

/**
 * The outcome of an INSERT: the number of distinct triples produced
 * from the template, and the number of those actually added to the
 * dataset (that is, not already present).
 */
struct InsertReport
{
    InsertReport() : instantiated(0), added(0) { }

    int instantiated;
    int added;
};

/**
 * \class TemplateExecutor TemplateExecutor.h <ontoquay/query/TemplateExecutor.h>
 *
 * Instantiates CONSTRUCT and INSERT templates from a sequence of
 * solutions.
 *
 * A template triple with any variable unbound in a solution, or one
 * whose instantiation is not a valid statement (a literal subject,
 * for example), is dropped for that solution.
 *
 * Each blank node label in the template stands for a fresh blank node
 * per solution: the same label within one solution gives the same
 * node, different solutions give different nodes.  Fresh nodes come
 * from Dataset::createBlankNode() and so never collide with nodes
 * already in the dataset.
 */
class TemplateExecutor
{
public:
    TemplateExecutor(Dataset *dataset);

    /**
     * Return the distinct triples produced by instantiating the
     * template for every solution, grouped by target graph (the empty
     * Uri for the default graph) and sorted within each graph.  The
     * dataset is not changed.
     */
    QMap<Uri, Triples> instantiate(const TemplateTriples &templ,
                                   const ResultSet &solutions) const;

    /**
     * Return the distinct triples produced by instantiating the
     * template for every solution, sorted.  Any target graphs in the
     * template are ignored.  The dataset is not changed.
     */
    Triples construct(const TemplateTriples &templ,
                      const ResultSet &solutions) const;

    /**
     * Instantiate the template and add the results to their target
     * graphs in a single Dataset::commit.  Either all of the new
     * triples are added or, if the commit fails, none are and the
     * exception is propagated.
     */
    InsertReport insert(const TemplateTriples &templ,
                        const ResultSet &solutions);

private:
    Dataset *m_dataset;
};

}

#endif
