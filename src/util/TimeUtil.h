#pragma once

#include <QString>
#include <QStringView>
#include <QLatin1String>

namespace TimeUtil {

inline QString secondsToHMS(double totalSeconds) {
    int hours = static_cast<int>(totalSeconds) / 3600;
    int minutes = (static_cast<int>(totalSeconds) % 3600) / 60;
    int seconds = static_cast<int>(totalSeconds) % 60;
    int millis = static_cast<int>((totalSeconds - static_cast<int>(totalSeconds)) * 1000);

    if (hours > 0) {
        return QString("%1:%2:%3.%4")
            .arg(hours)
            .arg(minutes, 2, 10, QChar('0'))
            .arg(seconds, 2, 10, QChar('0'))
            .arg(millis, 3, 10, QChar('0'));
    }
    return QString("%1:%2.%3")
        .arg(minutes)
        .arg(seconds, 2, 10, QChar('0'))
        .arg(millis, 3, 10, QChar('0'));
}

inline QString secondsToMMSS(double totalSeconds) {
    int minutes = static_cast<int>(totalSeconds) / 60;
    int seconds = static_cast<int>(totalSeconds) % 60;
    return QString("%1:%2")
        .arg(minutes)
        .arg(seconds, 2, 10, QChar('0'));
}

// "HH:MM:SS.micro" as written by ffmpeg's out_time key; -1 if malformed
inline double parseClockTime(QStringView text) {
    const auto parts = text.split(u':');
    if (parts.size() != 3) return -1.0;
    bool okH = false, okM = false, okS = false;
    const int h = parts[0].toInt(&okH);
    const int m = parts[1].toInt(&okM);
    const double s = parts[2].toDouble(&okS);
    if (!okH || !okM || !okS || h < 0 || m < 0 || s < 0.0) return -1.0;
    return h * 3600.0 + m * 60.0 + s;
}

// One line of `-progress` output. Sets `seconds` for out_time_us / out_time_ms
// (both are microseconds in ffmpeg) and out_time, or `ended` on progress=end.
// Returns false for any other line.
inline bool parseProgressLine(const QString& line, double& seconds, bool& ended) {
    const QString trimmed = line.trimmed();
    const qsizetype eq = trimmed.indexOf('=');
    if (eq <= 0) return false;

    const QStringView key = QStringView(trimmed).left(eq);
    const QStringView value = QStringView(trimmed).mid(eq + 1);

    if (key == QLatin1String("progress")) {
        if (value != QLatin1String("end")) return false;
        ended = true;
        return true;
    }
    if (key == QLatin1String("out_time_us") || key == QLatin1String("out_time_ms")) {
        bool ok = false;
        const qlonglong us = value.toLongLong(&ok);
        if (!ok || us < 0) return false;
        seconds = static_cast<double>(us) / 1000000.0;
        return true;
    }
    if (key == QLatin1String("out_time")) {
        const double s = parseClockTime(value);
        if (s < 0.0) return false;
        seconds = s;
        return true;
    }
    return false;
}

} // namespace TimeUtil
