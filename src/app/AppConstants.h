#pragma once

#include <QString>

namespace AppConstants {
    inline constexpr const char* AppName = "M4BMaker";
    inline constexpr const char* AppVersion = "0.1.0";
    inline constexpr const char* OrgName = "M4BMaker";

    inline constexpr int DefaultWindowWidth = 960;
    inline constexpr int DefaultWindowHeight = 680;

    // External engine, looked up on PATH unless overridden
    inline constexpr const char* DefaultEngine = "ffmpeg";
    inline constexpr const char* EngineEnvVar = "M4BMAKER_ENGINE";

    inline constexpr const char* DefaultAudioCodec = "aac";
    inline constexpr const char* DefaultAudioBitrate = "128k";
    inline constexpr const char* DefaultOutputName = "audiobook.m4b";

    // Lines of engine output kept for failure diagnosis
    inline constexpr int DefaultTailLineCount = 20;

    inline constexpr int ReadPollIntervalMs = 100;
    inline constexpr int TerminateGraceMs = 3000;
    inline constexpr int SpawnTimeoutMs = 5000;

    // UI drains conversion events roughly once per frame
    inline constexpr int EventDrainIntervalMs = 33;
}
