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

#include "Solution.h"
#include "EvaluationBudget.h"

#include <QSet>

namespace Ontoquay
{

bool
compatible(const Dictionary &a, const Dictionary &b)
{
    const Dictionary &smaller = (a.size() <= b.size() ? a : b);
    const Dictionary &larger = (a.size() <= b.size() ? b : a);
    for (Dictionary::const_iterator i = smaller.begin(); i != smaller.end(); ++i) {
        Dictionary::const_iterator j = larger.find(i.key());
        if (j != larger.end() && j.value() != i.value()) return false;
    }
    return true;
}

Dictionary
merged(const Dictionary &a, const Dictionary &b)
{
    Dictionary d(a);
    for (Dictionary::const_iterator i = b.begin(); i != b.end(); ++i) {
        if (!d.contains(i.key())) d.insert(i.key(), i.value());
    }
    return d;
}

QString
nodeKey(const Node &n)
{
    switch (n.type) {
    case Node::Nothing: return "-";
    case Node::URI: return "U" + n.value;
    case Node::Blank: return "B" + n.value;
    case Node::Literal:
        return QString("L%1\x1f%2\x1f%3")
            .arg(n.datatype.toString()).arg(n.language).arg(n.value);
    }
    return QString();
}

QString
solutionKey(const Dictionary &d, const QStringList &variables)
{
    QString key;
    foreach (QString v, variables) {
        key += nodeKey(d.value(v));
        key += QChar(0x1e);
    }
    return key;
}

QStringList
commonlyBound(const ResultSet &rs)
{
    if (rs.empty()) return QStringList();
    QSet<QString> common = QSet<QString>::fromList(rs[0].keys());
    for (int i = 1; i < rs.size() && !common.empty(); ++i) {
        QSet<QString> here = QSet<QString>::fromList(rs[i].keys());
        common.intersect(here);
    }
    return common.toList();
}

ResultSet
join(const ResultSet &left, const ResultSet &right, EvaluationBudget *budget)
{
    ResultSet result;
    if (left.empty() || right.empty()) return result;

    QSet<QString> lv = QSet<QString>::fromList(commonlyBound(left));
    QSet<QString> rv = QSet<QString>::fromList(commonlyBound(right));
    QStringList keyVars = lv.intersect(rv).toList();
    keyVars.sort();

    QHash<QString, QList<int> > buckets;
    for (int i = 0; i < right.size(); ++i) {
        buckets[solutionKey(right[i], keyVars)].push_back(i);
    }

    for (int i = 0; i < left.size(); ++i) {
        if (budget) budget->tick();
        QHash<QString, QList<int> >::const_iterator bi =
            buckets.find(solutionKey(left[i], keyVars));
        if (bi == buckets.end()) continue;
        foreach (int j, bi.value()) {
            if (compatible(left[i], right[j])) {
                result.push_back(merged(left[i], right[j]));
            }
        }
    }

    return result;
}

}
