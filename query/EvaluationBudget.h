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

#ifndef _ONTOQUAY_EVALUATION_BUDGET_H_
#define _ONTOQUAY_EVALUATION_BUDGET_H_

#include <QAtomicInteger>
#include <QAtomicInt>
#include <QElapsedTimer>

namespace Ontoquay
{

/**
 * \class EvaluationBudget EvaluationBudget.h <ontoquay/query/EvaluationBudget.h>
 *
 * Cooperative cancellation for query evaluation.  The potentially
 * unbounded parts of evaluation (property path traversal, EXISTS
 * sub-pattern evaluation, joins) call tick() as they go; once the
 * step limit or time limit is exceeded, or cancel() has been called,
 * tick() throws RDFResourceExceeded.
 *
 * A limit of zero means no limit.  tick() and cancel() may be called
 * from several threads at once.
 */
class EvaluationBudget
{
public:
    EvaluationBudget(qint64 stepLimit = 0, int timeLimitMsec = 0);

    /**
     * Reset the step count and restart the clock.
     */
    void start();

    /**
     * Count n evaluation steps, and throw RDFResourceExceeded if the
     * budget is exhausted or evaluation has been cancelled.
     */
    void tick(int n = 1);

    /**
     * Ask evaluation to stop at its next tick.
     */
    void cancel();

    bool isCancelled() const;
    qint64 getSteps() const;
    qint64 getStepLimit() const { return m_stepLimit; }
    int getTimeLimit() const { return m_timeLimit; }

private:
    qint64 m_stepLimit;
    int m_timeLimit;
    QAtomicInteger<qint64> m_steps;
    QAtomicInt m_cancelled;
    QElapsedTimer m_timer;
};

}

#endif
