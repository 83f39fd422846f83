/* -*- c-basic-offset: 4 indent-tabs-mode: nil -*- vi:set ts=8 sts=4 sw=4: */

#ifndef _ONTOQUAY_INTERNAL_DEBUG_H_
#define _ONTOQUAY_INTERNAL_DEBUG_H_

#include <QDebug>
#include <QTextStream>

#ifndef NDEBUG

#define DEBUG QDebug(QtDebugMsg) << "[ontoquay] "

namespace Ontoquay {

template <typename T>
inline QDebug &operator<<(QDebug &d, const T &t) {
    QString s;
    QTextStream ts(&s);
    ts << t;
    ts.flush();
    d << s;
    return d;
}

}

#else

namespace Ontoquay {

class NoDebug
{
public:
    inline NoDebug() {}
    inline ~NoDebug(){}

    template <typename T>
    inline NoDebug &operator<<(const T &) { return *this; }
};

}

// For use only within Ontoquay namespace
#define DEBUG NoDebug()

#endif /* !NDEBUG */

#endif /* !_ONTOQUAY_INTERNAL_DEBUG_H_ */
