#include "ProgressRelay.h"
#include "ConversionLog.h"

void ProgressRelay::subscribe(EventSink sink) {
    m_sink = std::move(sink);
}

QStringList ProgressRelay::publishChunk(const QByteArray& chunk) {
    QStringList emitted;
    if (m_terminated) {
        m_linesDiscarded += chunk.count('\n');
        return emitted;
    }
    for (const QByteArray& raw : m_splitter.feed(chunk)) {
        emitLine(raw, emitted);
    }
    return emitted;
}

QStringList ProgressRelay::finishStream() {
    QStringList emitted;
    QByteArray raw;
    if (m_splitter.flush(raw) && !m_terminated) {
        emitLine(raw, emitted);
    }
    return emitted;
}

bool ProgressRelay::publishTerminal(const ConversionEvent& event) {
    if (m_terminated || !event.isTerminal()) {
        qCWarning(lcConversion) << "Dropping extra terminal event";
        return false;
    }
    m_terminated = true;
    if (m_sink) m_sink(event);
    if (m_linesDiscarded > 0) {
        qCDebug(lcConversion) << "Discarded" << m_linesDiscarded << "late lines";
    }
    return true;
}

void ProgressRelay::emitLine(const QByteArray& raw, QStringList& emitted) {
    const QString line = QString::fromUtf8(raw);
    emitted.append(line);
    ++m_linesPublished;
    if (m_sink) {
        m_sink(ConversionEvent::outputLine(line, raw));
    } else {
        qCWarning(lcConversion) << "Output line with no subscriber:" << line;
    }
}
