#include "ConversionWorker.h"
#include "CommandBuilder.h"
#include "ConversionLog.h"
#include "ResultReporter.h"

ConversionWorker::ConversionWorker(const ConversionJob& job, const ConversionSettings& settings,
                                   std::shared_ptr<ProcessProvider> provider, QObject* parent)
    : QThread(parent)
    , m_job(job)
    , m_settings(settings)
    , m_provider(std::move(provider))
    , m_arguments(CommandBuilder::buildArguments(job, settings))
{}

ConversionWorker::~ConversionWorker() {
    requestCancel();
    wait();
}

void ConversionWorker::subscribe(EventSink sink) {
    m_relay.subscribe(std::move(sink));
}

void ConversionWorker::requestCancel() {
    m_cancelRequested = true;
    QMutexLocker lock(&m_mutex);
    if (m_process) m_process->cancel();
}

void ConversionWorker::run() {
    qCInfo(lcConversion) << "Job" << m_job.id << "converting" << m_job.sources.size()
                         << "files to" << m_job.destination;

    if (m_cancelRequested) {
        m_relay.publishTerminal(ConversionEvent::cancelled());
        return;
    }

    LaunchResult launch;
    std::unique_ptr<RunningProcess> process =
        m_provider->start(m_settings.enginePath, m_arguments, launch);
    if (!process) {
        m_relay.publishTerminal(ResultReporter::launchFailure(launch));
        return;
    }

    {
        QMutexLocker lock(&m_mutex);
        m_process = process.get();
        m_pid = process->processId();
        if (m_cancelRequested) m_process->cancel();
    }

    ResultReporter reporter(m_settings.tailLineCount);
    QByteArray chunk;
    while (process->readNextChunk(chunk)) {
        reporter.observeLines(m_relay.publishChunk(chunk));
    }
    reporter.observeLines(m_relay.finishStream());

    const ExitStatus status = process->wait();
    {
        QMutexLocker lock(&m_mutex);
        m_process = nullptr;
    }
    process.reset();

    qCInfo(lcConversion) << "Job" << m_job.id << "engine exited with code" << status.exitCode
                         << (status.cancelled ? "(cancelled)" : "");
    m_relay.publishTerminal(reporter.report(status));
}
