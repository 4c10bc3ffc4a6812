#pragma once

#include <QByteArray>
#include <QStringList>
#include <functional>
#include "ConversionTypes.h"
#include "LineSplitter.h"

using EventSink = std::function<void(const ConversionEvent&)>;

// Turns the engine's byte stream into OutputLine events for one job and
// guards the job's terminal event: exactly one is delivered, and nothing
// after it. Lives on the worker thread; the sink must be thread-safe.
// Event text is lossy for invalid UTF-8; the raw bytes ride along unchanged.
class ProgressRelay {
public:
    void subscribe(EventSink sink);

    // Returns the lines emitted for this chunk (empty once terminated).
    QStringList publishChunk(const QByteArray& chunk);

    // Emits a held partial line at end of stream.
    QStringList finishStream();

    // False if a terminal event was already delivered; the event is dropped.
    bool publishTerminal(const ConversionEvent& event);

    bool hasTerminated() const { return m_terminated; }
    int linesPublished() const { return m_linesPublished; }

private:
    void emitLine(const QByteArray& raw, QStringList& emitted);

    EventSink m_sink;
    LineSplitter m_splitter;
    bool m_terminated = false;
    int m_linesPublished = 0;
    int m_linesDiscarded = 0;
};
