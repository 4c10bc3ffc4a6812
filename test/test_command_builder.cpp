#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <utility>
#include "conversion/CommandBuilder.h"

static ConversionJob makeJob(const QStringList& paths, const QString& title,
                             const QString& author, const QString& destination) {
    ConversionJob job;
    for (int i = 0; i < paths.size(); ++i) {
        job.sources.push_back(SourceFile{paths[i], i});
    }
    job.metadata.title = title;
    job.metadata.author = author;
    job.destination = destination;
    return job;
}

void test_scenario_two_files_with_tags() {
    ConversionJob job = makeJob({"a.mp3", "b.mp3"}, "My Book", "Jane Doe", "/out/book.m4b");
    QStringList args = CommandBuilder::buildArguments(job, ConversionSettings());

    int ia = args.indexOf("a.mp3");
    int ib = args.indexOf("b.mp3");
    assert(ia >= 0 && ib >= 0);
    assert(ia < ib);
    assert(args[ia - 1] == "-i");
    assert(args[ib - 1] == "-i");

    int it = args.indexOf("title=My Book");
    int iu = args.indexOf("artist=Jane Doe");
    assert(it > 0 && args[it - 1] == "-metadata");
    assert(iu > 0 && args[iu - 1] == "-metadata");

    // The destination is the final argument, after the ipod muxer selection
    assert(args.last() == "/out/book.m4b");
    int fmt = args.indexOf("-f");
    assert(fmt >= 0 && args[fmt + 1] == "ipod");
    int codec = args.indexOf("-c:a");
    assert(codec >= 0 && args[codec + 1] == "aac");
    printf("PASS: test_scenario_two_files_with_tags\n");
}

void test_each_source_once_in_order() {
    QStringList paths;
    for (int i = 0; i < 12; ++i) paths << QString("/books/part %1.mp3").arg(11 - i);
    ConversionJob job = makeJob(paths, "T", "A", "/out/x.m4b");
    QStringList args = CommandBuilder::buildArguments(job, ConversionSettings());

    int last = -1;
    for (const auto& p : paths) {
        assert(args.count(p) == 1);
        int idx = args.indexOf(p);
        assert(idx > last);
        last = idx;
    }
    assert(args.contains(CommandBuilder::concatFilter(12)));
    printf("PASS: test_each_source_once_in_order\n");
}

void test_position_decides_order() {
    ConversionJob job = makeJob({"first.mp3", "second.mp3"}, "T", "A", "/out/x.m4b");
    std::swap(job.sources[0], job.sources[1]);  // storage order differs from playback order
    QStringList args = CommandBuilder::buildArguments(job, ConversionSettings());
    assert(args.indexOf("first.mp3") < args.indexOf("second.mp3"));
    printf("PASS: test_position_decides_order\n");
}

void test_deterministic() {
    ConversionJob job = makeJob({"/a/1.mp3", "/a/2.mp3", "/a/3.mp3"}, "Book", "Author", "/out/b.m4b");
    ConversionSettings settings;
    QStringList first = CommandBuilder::buildArguments(job, settings);
    QStringList second = CommandBuilder::buildArguments(job, settings);
    assert(first == second);
    printf("PASS: test_deterministic\n");
}

void test_shell_metacharacters_stay_literal() {
    const QString nasty = "/tmp/it's $(rm -rf ~); `x` | y & z.mp3";
    ConversionJob job = makeJob({nasty}, "A \"quoted\" title; echo", "O'Brien", "/out/b.m4b");
    QStringList args = CommandBuilder::buildArguments(job, ConversionSettings());
    assert(args.count(nasty) == 1);
    assert(args.contains("title=A \"quoted\" title; echo"));
    assert(args.contains("artist=O'Brien"));

    // Display form quotes, the argument vector itself is untouched
    QString shown = CommandBuilder::formatCommandLine("ffmpeg", args);
    assert(shown.startsWith("ffmpeg -hide_banner"));
    assert(shown.contains("'/tmp/it'\\''s $(rm -rf ~); `x` | y & z.mp3'"));
    printf("PASS: test_shell_metacharacters_stay_literal\n");
}

void test_settings_flow_into_arguments() {
    ConversionJob job = makeJob({"a.mp3"}, "T", "A", "/out/b.m4b");
    ConversionSettings settings;
    settings.audioBitrate = "64k";
    QStringList args = CommandBuilder::buildArguments(job, settings);
    int br = args.indexOf("-b:a");
    assert(br >= 0 && args[br + 1] == "64k");
    assert(CommandBuilder::concatFilter(1) == "[0:a:0]concat=n=1:v=0:a=1[aout]");
    assert(CommandBuilder::concatFilter(2) == "[0:a:0][1:a:0]concat=n=2:v=0:a=1[aout]");
    printf("PASS: test_settings_flow_into_arguments\n");
}

int main() {
    test_scenario_two_files_with_tags();
    test_each_source_once_in_order();
    test_position_decides_order();
    test_deterministic();
    test_shell_metacharacters_stay_literal();
    test_settings_flow_into_arguments();
    printf("All command builder tests passed.\n");
    return 0;
}
