#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QThread>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include "conversion/ConversionWorker.h"
#include "conversion/EventQueue.h"
#include "conversion/ProcessRunner.h"
#include "media/AudiobookExporter.h"

#ifdef Q_OS_UNIX
#include <cerrno>
#include <signal.h>
#endif

static ConversionSettings fastSettings() {
    ConversionSettings settings;
    settings.pollIntervalMs = 20;
    settings.terminateGraceMs = 500;
    return settings;
}

static QByteArray readAll(RunningProcess& process) {
    QByteArray all;
    QByteArray chunk;
    while (process.readNextChunk(chunk)) all += chunk;
    return all;
}

// Writes an executable stand-in engine that runs `body` under /bin/sh.
static QString writeEngine(const QTemporaryDir& dir, const QString& name, const QByteArray& body) {
    QString path = dir.filePath(name);
    QFile f(path);
    bool ok = f.open(QIODevice::WriteOnly);
    assert(ok);
    f.write("#!/bin/sh\n" + body);
    f.close();
    f.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
    return path;
}

void test_missing_engine_not_spawned() {
    QProcessProvider provider(fastSettings());
    LaunchResult launch;
    auto process = provider.start("m4bmaker-no-such-engine", {"-version"}, launch);
    assert(!process);
    assert(launch.error == LaunchError::EngineNotFound);
    assert(launch.message.contains("m4bmaker-no-such-engine"));

    process = provider.start("./no/such/dir/ffmpeg", {}, launch);
    assert(!process);
    assert(launch.error == LaunchError::EngineNotFound);

    assert(QProcessProvider::resolveEngine("").isEmpty());
    printf("PASS: test_missing_engine_not_spawned\n");
}

void test_merged_output_and_exit_code() {
    QProcessProvider provider(fastSettings());
    LaunchResult launch;
    auto process = provider.start("/bin/sh", {"-c", "echo out; echo err 1>&2; exit 3"}, launch);
    assert(process);
    assert(launch.error == LaunchError::None);
    assert(process->processId() > 0);

    QByteArray all = readAll(*process);
    assert(all.contains("out\n"));
    assert(all.contains("err\n"));

    ExitStatus status = process->wait();
    assert(status.exitCode == 3);
    assert(!status.crashed);
    assert(!status.cancelled);
    printf("PASS: test_merged_output_and_exit_code\n");
}

void test_cancel_terminates_and_reaps() {
    QProcessProvider provider(fastSettings());
    LaunchResult launch;
    auto process = provider.start("/bin/sh", {"-c", "echo started; exec sleep 30"}, launch);
    assert(process);
    const qint64 pid = process->processId();

    QByteArray first;
    bool got = process->readNextChunk(first);
    assert(got);
    assert(first.startsWith("started"));

    process->cancel();
    readAll(*process);
    ExitStatus status = process->wait();
    assert(status.cancelled);
    process.reset();

#ifdef Q_OS_UNIX
    // The child has been waited for, so its pid no longer exists
    int rc = ::kill(static_cast<pid_t>(pid), 0);
    assert(rc == -1 && errno == ESRCH);
#else
    Q_UNUSED(pid);
#endif
    printf("PASS: test_cancel_terminates_and_reaps\n");
}

void test_dropped_handle_kills_and_reaps() {
    QProcessProvider provider(fastSettings());
    LaunchResult launch;
    auto process = provider.start("/bin/sh", {"-c", "echo started; exec sleep 30"}, launch);
    assert(process);
    const qint64 pid = process->processId();

    QByteArray first;
    bool got = process->readNextChunk(first);
    assert(got);

    // Neither cancel() nor wait(): the handle alone must clean up
    process.reset();

#ifdef Q_OS_UNIX
    int rc = ::kill(static_cast<pid_t>(pid), 0);
    assert(rc == -1 && errno == ESRCH);
#else
    Q_UNUSED(pid);
#endif
    printf("PASS: test_dropped_handle_kills_and_reaps\n");
}

void test_destroyed_worker_reaps_engine() {
    QTemporaryDir dir;
    QString engine = writeEngine(dir, "sleepy-engine", "echo started; exec sleep 30\n");

    ConversionJob job;
    job.sources.push_back(SourceFile{dir.filePath("a.mp3"), 0});
    job.metadata.title = "T";
    job.metadata.author = "A";
    job.destination = dir.filePath("out.m4b");

    ConversionSettings settings = fastSettings();
    settings.enginePath = engine;

    auto queue = std::make_shared<EventQueue>();
    qint64 pid = 0;
    {
        ConversionWorker worker(job, settings, std::make_shared<QProcessProvider>(settings));
        worker.subscribe([queue](const ConversionEvent& ev) { queue->push(ev); });
        worker.start();
        for (int waited = 0; queue->isEmpty() && waited < 5000; waited += 10) QThread::msleep(10);
        assert(!queue->isEmpty());
        pid = worker.engineProcessId();
        assert(pid > 0);
    }

#ifdef Q_OS_UNIX
    int rc = ::kill(static_cast<pid_t>(pid), 0);
    assert(rc == -1 && errno == ESRCH);
#endif
    std::vector<ConversionEvent> events = queue->drain();
    assert(events.back().type == ConversionEvent::Type::Cancelled);
    printf("PASS: test_destroyed_worker_reaps_engine\n");
}

void test_settings_reach_the_next_job() {
    QTemporaryDir dir;
    ExportRequest req;
    QFile f(dir.filePath("a.mp3"));
    bool ok = f.open(QIODevice::WriteOnly);
    assert(ok);
    f.close();
    req.files << f.fileName();
    req.title = "T";
    req.author = "A";
    req.destination = dir.filePath("out.m4b");

    AudiobookExporter exporter;
    QStringList lines;
    QObject::connect(&exporter, &AudiobookExporter::outputLine, [&](const QString& line) { lines << line; });

    ConversionSettings settings;
    settings.enginePath = writeEngine(dir, "quick-engine", "exit 0\n");
    exporter.setSettings(settings);
    assert(exporter.startExport(req) == StartResult::Started);
    bool joined = exporter.waitForWorker(10000);
    assert(joined);
    exporter.drainEvents();
    assert(exporter.currentJob().state == JobState::Completed);

    // An engine that ignores SIGTERM is only stopped by the kill after the grace period
    settings = fastSettings();
    settings.terminateGraceMs = 200;
    settings.enginePath = writeEngine(dir, "stubborn-engine",
        "trap '' TERM; echo ready; while :; do :; done\n");
    exporter.setSettings(settings);
    assert(exporter.startExport(req) == StartResult::Started);

    for (int waited = 0; lines.isEmpty() && waited < 5000; waited += 10) {
        QThread::msleep(10);
        exporter.drainEvents();
    }
    assert(lines.contains("ready"));

    QElapsedTimer clock;
    clock.start();
    exporter.cancel();
    joined = exporter.waitForWorker(10000);
    assert(joined);
    assert(clock.elapsed() < AppConstants::TerminateGraceMs - 500);
    exporter.drainEvents();
    assert(exporter.currentJob().state == JobState::Cancelled);
    printf("PASS: test_settings_reach_the_next_job\n");
}

void test_cancel_after_exit_is_not_cancellation() {
    QProcessProvider provider(fastSettings());
    LaunchResult launch;
    auto process = provider.start("/bin/sh", {"-c", "exit 0"}, launch);
    assert(process);
    readAll(*process);
    process->cancel();
    ExitStatus status = process->wait();
    assert(!status.cancelled);
    assert(status.exitCode == 0);
    printf("PASS: test_cancel_after_exit_is_not_cancellation\n");
}

void test_worker_passes_arguments_literally() {
    QTemporaryDir dir;
    QString engine = writeEngine(dir, "echo-engine", "for a in \"$@\"; do printf '%s\\n' \"$a\"; done\n");

    ConversionJob job;
    job.id = 1;
    job.sources.push_back(SourceFile{dir.filePath("it's $(touch pwned) `x`.mp3"), 0});
    job.sources.push_back(SourceFile{dir.filePath("b; rm -rf ~.mp3"), 1});
    job.metadata.title = "My Book";
    job.metadata.author = "Jane Doe";
    job.destination = dir.filePath("book.m4b");

    ConversionSettings settings = fastSettings();
    settings.enginePath = engine;

    auto queue = std::make_shared<EventQueue>();
    ConversionWorker worker(job, settings, std::make_shared<QProcessProvider>(settings));
    worker.subscribe([queue](const ConversionEvent& ev) { queue->push(ev); });
    worker.start();
    bool done = worker.wait(10000);
    assert(done);

    std::vector<ConversionEvent> events = queue->drain();
    QStringList echoed;
    for (const auto& ev : events) {
        if (ev.type == ConversionEvent::Type::OutputLine) echoed << ev.text;
    }
    assert(echoed == worker.arguments());
    assert(events.back().type == ConversionEvent::Type::Completed);
    assert(events.back().success);
    assert(!QFileInfo::exists(QDir::current().filePath("pwned")));
    printf("PASS: test_worker_passes_arguments_literally\n");
}

void test_worker_reports_engine_failure() {
    QTemporaryDir dir;
    QString engine = writeEngine(dir, "failing-engine",
        "i=1; while [ $i -le 50 ]; do echo \"line $i\"; i=$((i+1)); done; exit 1\n");

    ConversionJob job;
    job.sources.push_back(SourceFile{dir.filePath("a.mp3"), 0});
    job.metadata.title = "T";
    job.metadata.author = "A";
    job.destination = dir.filePath("out.m4b");

    ConversionSettings settings = fastSettings();
    settings.enginePath = engine;

    auto queue = std::make_shared<EventQueue>();
    ConversionWorker worker(job, settings, std::make_shared<QProcessProvider>(settings));
    worker.subscribe([queue](const ConversionEvent& ev) { queue->push(ev); });
    worker.start();
    bool done = worker.wait(10000);
    assert(done);

    std::vector<ConversionEvent> events = queue->drain();
    assert(events.size() == 51);
    const ConversionEvent& last = events.back();
    assert(last.type == ConversionEvent::Type::Completed);
    assert(!last.success && last.exitCode == 1);
    assert(last.tailLines.last() == "line 50");
    assert(last.tailLines.first() == QString("line %1").arg(51 - settings.tailLineCount));
    printf("PASS: test_worker_reports_engine_failure\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    test_missing_engine_not_spawned();
#ifdef Q_OS_UNIX
    test_merged_output_and_exit_code();
    test_cancel_terminates_and_reaps();
    test_dropped_handle_kills_and_reaps();
    test_cancel_after_exit_is_not_cancellation();
    test_destroyed_worker_reaps_engine();
    test_settings_reach_the_next_job();
    test_worker_passes_arguments_literally();
    test_worker_reports_engine_failure();
#else
    printf("SKIP: shell-based process tests (not a Unix host)\n");
#endif
    printf("All process runner tests passed.\n");
    return 0;
}
