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

#ifndef _ONTOQUAY_SOLUTION_H_
#define _ONTOQUAY_SOLUTION_H_

#include "../Store.h"

#include <QStringList>

namespace Ontoquay
{

class EvaluationBudget;

/**
 * Return true if the two solutions agree on the value of every
 * variable bound in both.
 */
bool compatible(const Dictionary &a, const Dictionary &b);

/**
 * Return the union of two compatible solutions.
 */
Dictionary merged(const Dictionary &a, const Dictionary &b);

/**
 * Return a string uniquely identifying the given node, suitable for
 * use as (part of) a hash key.  Nothing has a key distinct from every
 * other node.
 */
QString nodeKey(const Node &n);

/**
 * Return a string uniquely identifying the values of the given
 * variables in a solution.  Two solutions have the same key exactly
 * when they bind (or fail to bind) each of the variables to equal
 * nodes.
 */
QString solutionKey(const Dictionary &d, const QStringList &variables);

/**
 * Return the names of the variables bound in every solution of the
 * sequence, in no particular order.  For an empty sequence, return
 * an empty list.
 */
QStringList commonlyBound(const ResultSet &rs);

/**
 * Join two solution sequences: return the merge of every compatible
 * pair, in left-then-right order.  Solutions are bucketed by their
 * values for the variables bound throughout both sequences, so that
 * each left solution is only compared with the right solutions that
 * could match it.  The budget, if given, is ticked once per left
 * solution.
 */
ResultSet join(const ResultSet &left, const ResultSet &right,
               EvaluationBudget *budget);

}

#endif
