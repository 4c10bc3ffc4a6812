#include <QApplication>
#include <QCommandLineParser>
#include "MainWindow.h"
#include "AppTheme.h"
#include "AppConstants.h"
#include "ConversionLog.h"
#include "ConversionTypes.h"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName(AppConstants::AppName);
    app.setApplicationVersion(AppConstants::AppVersion);
    app.setOrganizationName(AppConstants::OrgName);

    QCommandLineParser parser;
    parser.setApplicationDescription("Join MP3 files into a tagged M4B audiobook.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption engineOption("engine",
        QString("Transcoding engine executable (default: $%1 or %2).")
            .arg(AppConstants::EngineEnvVar, AppConstants::DefaultEngine),
        "path");
    QCommandLineOption bitrateOption("bitrate", "AAC bitrate, e.g. 96k.", "rate",
        AppConstants::DefaultAudioBitrate);
    QCommandLineOption lightOption("light", "Start with the light theme.");
    parser.addOption(engineOption);
    parser.addOption(bitrateOption);
    parser.addOption(lightOption);
    parser.process(app);

    ConversionSettings settings;
    const QString envEngine = qEnvironmentVariable(AppConstants::EngineEnvVar);
    if (!envEngine.isEmpty()) settings.enginePath = envEngine;
    if (parser.isSet(engineOption)) settings.enginePath = parser.value(engineOption);
    settings.audioBitrate = parser.value(bitrateOption);

    qCInfo(lcApp) << "Engine:" << settings.enginePath << "bitrate:" << settings.audioBitrate;

    const bool dark = !parser.isSet(lightOption);
    AppTheme::apply(app, dark);

    MainWindow window(settings, dark);
    window.show();

    return app.exec();
}
