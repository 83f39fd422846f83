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

#include "EvaluationBudget.h"

#include "../RDFException.h"
#include "../Debug.h"

namespace Ontoquay
{

// Reading the clock on every step would dominate the cost of
// cheap steps, so we only look at it this often
static const qint64 clockInterval = 1024;

EvaluationBudget::EvaluationBudget(qint64 stepLimit, int timeLimitMsec) :
    m_stepLimit(stepLimit),
    m_timeLimit(timeLimitMsec),
    m_steps(0),
    m_cancelled(0)
{
    m_timer.start();
}

void
EvaluationBudget::start()
{
    m_steps.store(0);
    m_cancelled.store(0);
    m_timer.restart();
}

void
EvaluationBudget::tick(int n)
{
    qint64 before = m_steps.fetchAndAddRelaxed(n);
    qint64 steps = before + n;

    if (m_cancelled.load()) {
        throw RDFResourceExceeded("Query evaluation cancelled");
    }

    if (m_stepLimit > 0 && steps > m_stepLimit) {
        DEBUG << "EvaluationBudget::tick: step limit " << m_stepLimit
              << " exceeded";
        throw RDFResourceExceeded
            (QString("Query evaluation exceeded step limit of %1")
             .arg(m_stepLimit));
    }

    if (m_timeLimit > 0 &&
        (before / clockInterval != steps / clockInterval || n > 1)) {
        if (m_timer.elapsed() > m_timeLimit) {
            DEBUG << "EvaluationBudget::tick: time limit " << m_timeLimit
                  << "ms exceeded after " << steps << " steps";
            throw RDFResourceExceeded
                (QString("Query evaluation exceeded time limit of %1 ms")
                 .arg(m_timeLimit));
        }
    }
}

void
EvaluationBudget::cancel()
{
    m_cancelled.store(1);
}

bool
EvaluationBudget::isCancelled() const
{
    return m_cancelled.load() != 0;
}

qint64
EvaluationBudget::getSteps() const
{
    return m_steps.load();
}

}
