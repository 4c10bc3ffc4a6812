#pragma once

#include <QByteArray>
#include <QList>

// Splits an incremental byte stream on '\n'. A trailing partial line is held
// back and prefixed to the next chunk; joining every emitted line with '\n'
// reproduces the stream byte for byte.
class LineSplitter {
public:
    QList<QByteArray> feed(const QByteArray& chunk);

    // End of stream: returns the held partial line, if any, and resets.
    bool flush(QByteArray& line);

    bool hasPending() const { return !m_pending.isEmpty(); }

private:
    QByteArray m_pending;
};
