#pragma once

#include <QString>
#include <QStringList>
#include "ConversionTypes.h"

// Maps a validated job onto an ffmpeg argument vector. Pure: no filesystem
// access and no state, so identical inputs always give identical vectors.
//
// Inputs are joined with the concat filter (one -i per file, in playback
// order) and re-encoded once to AAC inside the ipod (MP4 audio) muxer, which
// is what .m4b players expect. The vector is handed to the process launcher
// as-is; nothing is ever passed through a shell.
namespace CommandBuilder {

QStringList buildArguments(const ConversionJob& job, const ConversionSettings& settings);

// The concat filter graph for `inputCount` audio inputs, labelled [aout].
QString concatFilter(int inputCount);

// Shell-style quoted rendering for the log view only.
QString formatCommandLine(const QString& program, const QStringList& arguments);

} // namespace CommandBuilder
