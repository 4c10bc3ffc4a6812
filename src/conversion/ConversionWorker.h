#pragma once

#include <QMutex>
#include <QStringList>
#include <QThread>
#include <atomic>
#include <memory>
#include "ConversionTypes.h"
#include "ProcessRunner.h"
#include "ProgressRelay.h"

// Runs one conversion job: spawns the engine, pumps its output through the
// ProgressRelay and reports the outcome. The engine process is created, read
// and reaped on this thread; only requestCancel() is called from outside.
class ConversionWorker : public QThread {
    Q_OBJECT
public:
    ConversionWorker(const ConversionJob& job, const ConversionSettings& settings,
                     std::shared_ptr<ProcessProvider> provider, QObject* parent = nullptr);
    ~ConversionWorker() override;

    // Must be called once, before start().
    void subscribe(EventSink sink);

    void requestCancel();
    bool cancelRequested() const { return m_cancelRequested; }

    const QStringList& arguments() const { return m_arguments; }
    qint64 engineProcessId() const { return m_pid; }

protected:
    void run() override;

private:
    ConversionJob m_job;
    ConversionSettings m_settings;
    std::shared_ptr<ProcessProvider> m_provider;
    QStringList m_arguments;
    ProgressRelay m_relay;

    QMutex m_mutex;                        // guards m_process
    RunningProcess* m_process = nullptr;
    std::atomic<bool> m_cancelRequested{false};
    std::atomic<qint64> m_pid{0};
};
