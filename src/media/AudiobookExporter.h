#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <memory>
#include "ConversionTypes.h"
#include "InputValidator.h"

class ConversionWorker;
class EventQueue;
class ProcessProvider;

enum class StartResult {
    Started,
    Invalid,    // see validationError()
    Busy        // another job is still active; exports are rejected, not queued
};

// UI-thread façade over the conversion pipeline. Validates the request, runs
// the job on a ConversionWorker and drains its events on a timer, turning
// them into signals. One job at a time: a job stays active from Running
// until its terminal event has been drained.
class AudiobookExporter : public QObject {
    Q_OBJECT
public:
    explicit AudiobookExporter(QObject* parent = nullptr);
    explicit AudiobookExporter(std::shared_ptr<ProcessProvider> provider, QObject* parent = nullptr);
    ~AudiobookExporter();

    void setSettings(const ConversionSettings& settings) { m_settings = settings; }
    const ConversionSettings& settings() const { return m_settings; }

    StartResult startExport(const ExportRequest& request);

    // No-op unless the current job is Running.
    void cancel();

    bool isExporting() const { return m_worker != nullptr; }

    // Delivers queued events in arrival order; returns how many were delivered.
    int drainEvents();

    // Blocks until the worker thread has finished (headless use and tests).
    bool waitForWorker(int msecs);

    // The active job, or the most recent one once it has finished.
    const ConversionJob& currentJob() const { return m_job; }
    ValidationError validationError() const { return m_validationError; }
    QString errorString() const { return m_error; }
    QStringList lastArguments() const { return m_arguments; }
    double totalDuration() const { return m_totalDuration; }

signals:
    void started(const QString& commandLine);
    void outputLine(const QString& line);
    void progress(double fraction);  // 0.0 to 1.0, only when input durations are known
    void finished(bool success, const QString& message, const QStringList& tailLines);
    void cancelled();

private:
    void deliver(const ConversionEvent& event);
    void finishJob();

    std::shared_ptr<ProcessProvider> m_provider;  // null: a QProcessProvider per job
    ConversionSettings m_settings;
    ConversionJob m_job;
    int m_nextJobId = 1;

    std::shared_ptr<EventQueue> m_queue;
    std::unique_ptr<ConversionWorker> m_worker;
    QTimer m_drainTimer;

    QStringList m_arguments;
    double m_totalDuration = 0.0;
    ValidationError m_validationError = ValidationError::None;
    QString m_error;
};
