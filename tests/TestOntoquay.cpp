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

#include "TestGraph.h"
#include "TestPropertyPath.h"
#include "TestPatternMatcher.h"
#include "TestAggregator.h"
#include "TestQueryParser.h"
#include "TestQueryEngine.h"

#include <QCoreApplication>

#include <iostream>

int
main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);

    int good = 0, bad = 0;

    Ontoquay::TestGraph tg;
    if (QTest::qExec(&tg, argc, argv) == 0) ++good;
    else ++bad;

    Ontoquay::TestPropertyPath tpp;
    if (QTest::qExec(&tpp, argc, argv) == 0) ++good;
    else ++bad;

    Ontoquay::TestPatternMatcher tpm;
    if (QTest::qExec(&tpm, argc, argv) == 0) ++good;
    else ++bad;

    Ontoquay::TestAggregator ta;
    if (QTest::qExec(&ta, argc, argv) == 0) ++good;
    else ++bad;

    Ontoquay::TestQueryParser tqp;
    if (QTest::qExec(&tqp, argc, argv) == 0) ++good;
    else ++bad;

    Ontoquay::TestQueryEngine tqe;
    if (QTest::qExec(&tqe, argc, argv) == 0) ++good;
    else ++bad;

    if (bad > 0) {
        std::cerr << "\n********* " << bad << " test suite(s) failed!\n" << std::endl;
        return 1;
    } else {
        std::cerr << "All tests passed" << std::endl;
        return 0;
    }
}
