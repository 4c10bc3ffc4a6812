#include "ConversionTypes.h"

const char* jobStateName(JobState state) {
    switch (state) {
        case JobState::Created:    return "Created";
        case JobState::Validating: return "Validating";
        case JobState::Invalid:    return "Invalid";
        case JobState::Running:    return "Running";
        case JobState::Completed:  return "Completed";
        case JobState::Failed:     return "Failed";
        case JobState::Cancelled:  return "Cancelled";
    }
    return "Unknown";
}

bool ConversionJob::isTerminal() const {
    return state == JobState::Invalid || state == JobState::Completed
        || state == JobState::Failed || state == JobState::Cancelled;
}

bool ConversionJob::transitionTo(JobState next) {
    bool allowed = false;
    switch (state) {
        case JobState::Created:
            allowed = (next == JobState::Validating);
            break;
        case JobState::Validating:
            allowed = (next == JobState::Invalid || next == JobState::Running);
            break;
        case JobState::Running:
            allowed = (next == JobState::Completed || next == JobState::Failed
                       || next == JobState::Cancelled);
            break;
        default:
            break;  // terminal
    }
    if (allowed) state = next;
    return allowed;
}

ConversionEvent ConversionEvent::outputLine(const QString& text, const QByteArray& raw) {
    ConversionEvent ev;
    ev.type = Type::OutputLine;
    ev.text = text;
    ev.raw = raw;
    return ev;
}

ConversionEvent ConversionEvent::completed(bool success, int exitCode, FailureKind failure,
                                           const QStringList& tailLines, const QString& message) {
    ConversionEvent ev;
    ev.type = Type::Completed;
    ev.success = success;
    ev.exitCode = exitCode;
    ev.failure = failure;
    ev.tailLines = tailLines;
    ev.message = message;
    return ev;
}

ConversionEvent ConversionEvent::cancelled() {
    ConversionEvent ev;
    ev.type = Type::Cancelled;
    ev.message = "Conversion cancelled";
    return ev;
}
