#pragma once

#include <QByteArray>
#include <QElapsedTimer>
#include <QString>
#include <QStringList>
#include <atomic>
#include <memory>
#include "ConversionTypes.h"

class QProcess;

enum class LaunchError {
    None,
    EngineNotFound,
    SpawnFailed
};

struct LaunchResult {
    LaunchError error = LaunchError::None;
    QString message;
};

struct ExitStatus {
    int exitCode = 0;
    bool crashed = false;
    bool cancelled = false;  // termination was delivered by cancel() before natural exit
};

// Handle to a started child whose stdout and stderr arrive as one byte stream.
// readNextChunk() and wait() belong to the thread that started the process;
// cancel() may be called from any thread.
class RunningProcess {
public:
    virtual ~RunningProcess() = default;

    // Blocks until bytes arrive. Returns false at end of stream.
    virtual bool readNextChunk(QByteArray& chunk) = 0;
    virtual void cancel() = 0;
    virtual ExitStatus wait() = 0;
    virtual qint64 processId() const = 0;
};

class ProcessProvider {
public:
    virtual ~ProcessProvider() = default;

    // Returns nullptr and fills `result` when the engine cannot be launched.
    virtual std::unique_ptr<RunningProcess> start(const QString& program,
                                                  const QStringList& arguments,
                                                  LaunchResult& result) = 0;
};

class QProcessRunner : public RunningProcess {
public:
    QProcessRunner(std::unique_ptr<QProcess> process, const ConversionSettings& settings);
    ~QProcessRunner() override;

    bool readNextChunk(QByteArray& chunk) override;
    void cancel() override;
    ExitStatus wait() override;
    qint64 processId() const override { return m_pid; }

private:
    void deliverTermination();

    std::unique_ptr<QProcess> m_process;
    int m_pollIntervalMs;
    int m_terminateGraceMs;
    qint64 m_pid = 0;
    std::atomic<bool> m_cancelRequested{false};
    bool m_terminateSent = false;
    bool m_killSent = false;
    QElapsedTimer m_terminateClock;
};

// Launches the engine through QProcess with merged channels.
class QProcessProvider : public ProcessProvider {
public:
    explicit QProcessProvider(const ConversionSettings& settings = ConversionSettings())
        : m_settings(settings) {}

    std::unique_ptr<RunningProcess> start(const QString& program,
                                          const QStringList& arguments,
                                          LaunchResult& result) override;

    // Absolute path of an executable engine, or empty if it cannot be found.
    static QString resolveEngine(const QString& program);

private:
    ConversionSettings m_settings;
};
