#pragma once

#include <QStringList>
#include <deque>
#include "ConversionTypes.h"
#include "ProcessRunner.h"

// Keeps the tail of the engine's output and builds the single terminal event.
class ResultReporter {
public:
    explicit ResultReporter(int tailLineCount = AppConstants::DefaultTailLineCount)
        : m_tailLineCount(tailLineCount > 0 ? tailLineCount : 1) {}

    void observeLine(const QString& line);
    void observeLines(const QStringList& lines);
    QStringList tail() const;

    // Cancelled, Completed(success) or Completed(failure, exit code, tail).
    ConversionEvent report(const ExitStatus& status) const;

    // Terminal event for an engine that never started: no output, no tail.
    static ConversionEvent launchFailure(const LaunchResult& launch);

private:
    int m_tailLineCount;
    std::deque<QString> m_tail;
};
