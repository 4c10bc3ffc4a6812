#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <vector>
#include "AppConstants.h"

struct SourceFile {
    QString path;       // absolute
    int position = 0;   // 0-based playback order
};

struct AudiobookMetadata {
    QString title;
    QString author;
};

// What the file picker, save dialog and text fields hand to the core
struct ExportRequest {
    QStringList files;
    QString title;
    QString author;
    QString destination;
    double totalDuration = 0.0;  // seconds across all files, 0 if any is unknown
};

struct ConversionSettings {
    QString enginePath = AppConstants::DefaultEngine;
    QString audioCodec = AppConstants::DefaultAudioCodec;
    QString audioBitrate = AppConstants::DefaultAudioBitrate;
    QStringList acceptedExtensions{"mp3"};
    int tailLineCount = AppConstants::DefaultTailLineCount;
    int pollIntervalMs = AppConstants::ReadPollIntervalMs;
    int terminateGraceMs = AppConstants::TerminateGraceMs;
    int spawnTimeoutMs = AppConstants::SpawnTimeoutMs;
    int drainIntervalMs = AppConstants::EventDrainIntervalMs;
};

enum class JobState {
    Created,
    Validating,
    Invalid,
    Running,
    Completed,
    Failed,
    Cancelled
};

const char* jobStateName(JobState state);

struct ConversionJob {
    int id = 0;
    std::vector<SourceFile> sources;
    AudiobookMetadata metadata;
    QString destination;
    JobState state = JobState::Created;

    bool isTerminal() const;
    // Applies a legal lifecycle step; returns false and leaves the state untouched otherwise.
    bool transitionTo(JobState next);
};

enum class FailureKind {
    None,
    EngineNotFound,
    SpawnFailed,
    NonZeroExit,
    Crashed
};

struct ConversionEvent {
    enum class Type {
        OutputLine,
        Completed,
        Cancelled
    };

    Type type = Type::OutputLine;
    QString text;                   // OutputLine payload, decoded as UTF-8
    QByteArray raw;                 // the same line as the engine wrote it

    // Completed payload; success == false is the failed outcome
    bool success = false;
    int exitCode = 0;
    FailureKind failure = FailureKind::None;
    QStringList tailLines;
    QString message;

    bool isTerminal() const { return type != Type::OutputLine; }

    static ConversionEvent outputLine(const QString& text, const QByteArray& raw = {});
    static ConversionEvent completed(bool success, int exitCode,
                                     FailureKind failure = FailureKind::None,
                                     const QStringList& tailLines = {},
                                     const QString& message = {});
    static ConversionEvent cancelled();
};
