#include "ProcessRunner.h"
#include "ConversionLog.h"
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

QProcessRunner::QProcessRunner(std::unique_ptr<QProcess> process, const ConversionSettings& settings)
    : m_process(std::move(process))
    , m_pollIntervalMs(settings.pollIntervalMs)
    , m_terminateGraceMs(settings.terminateGraceMs)
    , m_pid(m_process->processId())
{}

QProcessRunner::~QProcessRunner() {
    if (m_process->state() != QProcess::NotRunning) {
        qCWarning(lcConversion) << "Engine pid" << m_pid << "still running at teardown, killing";
        m_process->kill();
        m_process->waitForFinished(-1);
    }
}

bool QProcessRunner::readNextChunk(QByteArray& chunk) {
    for (;;) {
        if (m_cancelRequested.load() && m_process->state() != QProcess::NotRunning) {
            deliverTermination();
        }

        if (m_process->bytesAvailable() > 0) {
            chunk = m_process->readAll();
            return true;
        }

        if (m_process->state() == QProcess::NotRunning) {
            return false;
        }

        m_process->waitForReadyRead(m_pollIntervalMs);
    }
}

void QProcessRunner::cancel() {
    m_cancelRequested = true;
}

ExitStatus QProcessRunner::wait() {
    while (m_process->state() != QProcess::NotRunning) {
        if (m_cancelRequested.load()) deliverTermination();
        m_process->waitForFinished(m_pollIntervalMs);
    }

    ExitStatus status;
    status.exitCode = m_process->exitCode();
    status.crashed = (m_process->exitStatus() == QProcess::CrashExit);
    status.cancelled = m_terminateSent;
    return status;
}

void QProcessRunner::deliverTermination() {
    if (!m_terminateSent) {
        qCInfo(lcConversion) << "Terminating engine pid" << m_pid;
        m_process->terminate();
        m_terminateSent = true;
        m_terminateClock.start();
        return;
    }
    if (!m_killSent && m_terminateClock.elapsed() >= m_terminateGraceMs) {
        qCWarning(lcConversion) << "Engine pid" << m_pid << "ignored SIGTERM, killing";
        m_process->kill();
        m_killSent = true;
    }
}

// --- QProcessProvider ---

std::unique_ptr<RunningProcess> QProcessProvider::start(const QString& program,
                                                        const QStringList& arguments,
                                                        LaunchResult& result) {
    result = LaunchResult{};

    const QString resolved = resolveEngine(program);
    if (resolved.isEmpty()) {
        result.error = LaunchError::EngineNotFound;
        result.message = QString("Engine not found: %1").arg(program);
        qCWarning(lcConversion) << result.message;
        return nullptr;
    }

    auto process = std::make_unique<QProcess>();
    process->setProcessChannelMode(QProcess::MergedChannels);
    process->setProgram(resolved);
    process->setArguments(arguments);
    process->start(QIODevice::ReadOnly);

    if (!process->waitForStarted(m_settings.spawnTimeoutMs)) {
        result.error = LaunchError::SpawnFailed;
        result.message = QString("Failed to launch %1: %2").arg(resolved, process->errorString());
        qCWarning(lcConversion) << result.message;
        return nullptr;
    }

    qCInfo(lcConversion) << "Started" << resolved << "pid" << process->processId();
    return std::make_unique<QProcessRunner>(std::move(process), m_settings);
}

QString QProcessProvider::resolveEngine(const QString& program) {
    if (program.isEmpty()) return {};

    if (program.contains('/')) {
        QFileInfo info(program);
        if (info.isFile() && info.isExecutable())
            return info.absoluteFilePath();
        return {};
    }
    return QStandardPaths::findExecutable(program);
}
