#include "AudiobookExporter.h"
#include "CommandBuilder.h"
#include "ConversionLog.h"
#include "ConversionWorker.h"
#include "EventQueue.h"
#include "ProcessRunner.h"
#include "TimeUtil.h"
#include <algorithm>

AudiobookExporter::AudiobookExporter(QObject* parent)
    : AudiobookExporter(nullptr, parent) {}

AudiobookExporter::AudiobookExporter(std::shared_ptr<ProcessProvider> provider, QObject* parent)
    : QObject(parent)
    , m_provider(std::move(provider))
{
    connect(&m_drainTimer, &QTimer::timeout, this, &AudiobookExporter::drainEvents);
}

AudiobookExporter::~AudiobookExporter() {
    m_drainTimer.stop();
    if (m_worker) {
        m_worker->requestCancel();
        m_worker->wait();
        m_worker.reset();
    }
}

StartResult AudiobookExporter::startExport(const ExportRequest& request) {
    m_error.clear();
    m_validationError = ValidationError::None;

    if (isExporting()) {
        m_error = "A conversion is already running";
        qCWarning(lcConversion) << "Rejected export while job" << m_job.id << "is active";
        return StartResult::Busy;
    }

    ConversionJob job;
    job.id = m_nextJobId++;
    job.transitionTo(JobState::Validating);

    InputValidator validator(m_settings);
    if (!validator.validate(request, job)) {
        job.transitionTo(JobState::Invalid);
        m_job = job;
        m_validationError = validator.error();
        m_error = validator.errorString();
        qCInfo(lcConversion) << "Job" << job.id << "invalid:" << m_error;
        return StartResult::Invalid;
    }

    std::shared_ptr<ProcessProvider> provider = m_provider;
    if (!provider) provider = std::make_shared<QProcessProvider>(m_settings);

    m_totalDuration = std::max(request.totalDuration, 0.0);

    job.transitionTo(JobState::Running);
    m_job = job;

    m_queue = std::make_shared<EventQueue>();
    m_worker = std::make_unique<ConversionWorker>(m_job, m_settings, provider);
    std::shared_ptr<EventQueue> queue = m_queue;
    m_worker->subscribe([queue](const ConversionEvent& event) { queue->push(event); });
    m_arguments = m_worker->arguments();

    emit started(CommandBuilder::formatCommandLine(m_settings.enginePath, m_arguments));

    m_worker->start();
    m_drainTimer.start(m_settings.drainIntervalMs);
    return StartResult::Started;
}

void AudiobookExporter::cancel() {
    if (!m_worker || m_job.state != JobState::Running) return;
    qCInfo(lcConversion) << "Cancelling job" << m_job.id;
    m_worker->requestCancel();
}

int AudiobookExporter::drainEvents() {
    if (!m_queue) return 0;

    int delivered = 0;
    for (const auto& event : m_queue->drain()) {
        if (m_job.isTerminal()) {
            qCDebug(lcConversion) << "Ignoring event after terminal state of job" << m_job.id;
            continue;
        }
        deliver(event);
        ++delivered;
    }
    return delivered;
}

bool AudiobookExporter::waitForWorker(int msecs) {
    if (!m_worker) return true;
    return m_worker->wait(static_cast<unsigned long>(msecs));
}

void AudiobookExporter::deliver(const ConversionEvent& event) {
    switch (event.type) {
        case ConversionEvent::Type::OutputLine: {
            emit outputLine(event.text);
            double seconds = 0.0;
            bool ended = false;
            if (TimeUtil::parseProgressLine(event.text, seconds, ended)) {
                if (ended) {
                    emit progress(1.0);
                } else if (m_totalDuration > 0.0) {
                    emit progress(std::clamp(seconds / m_totalDuration, 0.0, 1.0));
                }
            }
            break;
        }
        case ConversionEvent::Type::Completed:
            m_job.transitionTo(event.success ? JobState::Completed : JobState::Failed);
            if (!event.success) m_error = event.message;
            finishJob();
            emit finished(event.success, event.message, event.tailLines);
            break;
        case ConversionEvent::Type::Cancelled:
            m_job.transitionTo(JobState::Cancelled);
            finishJob();
            emit cancelled();
            break;
    }
}

void AudiobookExporter::finishJob() {
    m_drainTimer.stop();
    if (m_worker) {
        // The terminal event is the worker's last act, so this join is short.
        m_worker->wait();
        m_worker.reset();
    }
    qCInfo(lcConversion) << "Job" << m_job.id << "finished:" << jobStateName(m_job.state);
}
