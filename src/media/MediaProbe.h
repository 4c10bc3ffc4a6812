#pragma once

#include <QObject>
#include <QString>
#include <QMap>

struct MediaInfo {
    QString filePath;
    QString containerFormat;
    double duration = 0.0;
    int audioSampleRate = 0;
    int audioChannels = 0;
    QString audioCodec;
    int audioBitRate = 0;
    bool hasAudio = false;

    // Container tags (title, artist, album, ...)
    QMap<QString, QString> metadata;
};

class MediaProbe : public QObject {
    Q_OBJECT
public:
    explicit MediaProbe(QObject* parent = nullptr);
    ~MediaProbe();

    bool probe(const QString& filePath);
    const MediaInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

private:
    MediaInfo m_info;
    QString m_error;
};
