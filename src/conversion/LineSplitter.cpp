#include "LineSplitter.h"

QList<QByteArray> LineSplitter::feed(const QByteArray& chunk) {
    QList<QByteArray> lines;
    qsizetype start = 0;
    qsizetype nl = chunk.indexOf('\n', start);
    while (nl >= 0) {
        QByteArray line = m_pending;
        line.append(chunk.constData() + start, nl - start);
        m_pending.clear();
        lines.append(line);
        start = nl + 1;
        nl = chunk.indexOf('\n', start);
    }
    if (start < chunk.size()) {
        m_pending.append(chunk.constData() + start, chunk.size() - start);
    }
    return lines;
}

bool LineSplitter::flush(QByteArray& line) {
    if (m_pending.isEmpty()) return false;
    line = m_pending;
    m_pending.clear();
    return true;
}
