#include "CommandBuilder.h"
#include <QRegularExpression>
#include <algorithm>

namespace CommandBuilder {

QStringList buildArguments(const ConversionJob& job, const ConversionSettings& settings) {
    std::vector<SourceFile> ordered = job.sources;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const SourceFile& a, const SourceFile& b) { return a.position < b.position; });

    QStringList args;
    args << "-hide_banner" << "-nostdin" << "-y";

    for (const auto& source : ordered) {
        args << "-i" << source.path;
    }

    args << "-filter_complex" << concatFilter(static_cast<int>(ordered.size()))
         << "-map" << "[aout]"
         << "-c:a" << settings.audioCodec
         << "-b:a" << settings.audioBitrate;

    const AudiobookMetadata& meta = job.metadata;
    args << "-metadata" << QString("title=%1").arg(meta.title)
         << "-metadata" << QString("artist=%1").arg(meta.author)
         << "-metadata" << QString("album=%1").arg(meta.title)
         << "-metadata" << QString("album_artist=%1").arg(meta.author)
         << "-metadata" << "genre=Audiobook";

    // -progress emits key=value blocks on stdout; -nostats drops the \r status line
    args << "-movflags" << "+faststart"
         << "-progress" << "pipe:1"
         << "-nostats"
         << "-f" << "ipod"
         << job.destination;

    return args;
}

QString concatFilter(int inputCount) {
    QString graph;
    for (int i = 0; i < inputCount; ++i) {
        graph += QString("[%1:a:0]").arg(i);
    }
    graph += QString("concat=n=%1:v=0:a=1[aout]").arg(inputCount);
    return graph;
}

QString formatCommandLine(const QString& program, const QStringList& arguments) {
    static const QRegularExpression needsQuoting(R"([\s'"\\$`!*?;&|<>()\[\]{}#~])");
    auto quote = [](const QString& arg) {
        if (!arg.isEmpty() && !arg.contains(needsQuoting))
            return arg;
        QString s = arg;
        s.replace('\'', "'\\''");
        return QString("'%1'").arg(s);
    };

    QStringList parts;
    parts << quote(program);
    for (const auto& arg : arguments) parts << quote(arg);
    return parts.join(' ');
}

} // namespace CommandBuilder
