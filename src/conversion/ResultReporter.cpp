#include "ResultReporter.h"

void ResultReporter::observeLine(const QString& line) {
    m_tail.push_back(line);
    while (static_cast<int>(m_tail.size()) > m_tailLineCount) {
        m_tail.pop_front();
    }
}

void ResultReporter::observeLines(const QStringList& lines) {
    for (const auto& line : lines) observeLine(line);
}

QStringList ResultReporter::tail() const {
    QStringList lines;
    for (const auto& line : m_tail) lines.append(line);
    return lines;
}

ConversionEvent ResultReporter::report(const ExitStatus& status) const {
    if (status.cancelled) {
        return ConversionEvent::cancelled();
    }
    if (status.crashed) {
        return ConversionEvent::completed(false, status.exitCode, FailureKind::Crashed, tail(),
                                          "Engine terminated abnormally");
    }
    if (status.exitCode != 0) {
        return ConversionEvent::completed(false, status.exitCode, FailureKind::NonZeroExit, tail(),
                                          QString("Engine failed with code %1").arg(status.exitCode));
    }
    return ConversionEvent::completed(true, 0, FailureKind::None, {}, "Audiobook created");
}

ConversionEvent ResultReporter::launchFailure(const LaunchResult& launch) {
    const FailureKind kind = (launch.error == LaunchError::EngineNotFound)
        ? FailureKind::EngineNotFound
        : FailureKind::SpawnFailed;
    return ConversionEvent::completed(false, -1, kind, {}, launch.message);
}
