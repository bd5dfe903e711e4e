#include "ConfigManager.h"
#include "FileSource.hpp"
#include "LipSyncConfig.hpp"
#include "LipSyncSession.hpp"
#include "TemplateBank.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QTextStream>
#include <QTimer>

using namespace lipsync;

namespace {

bool parseFloatOption(const QCommandLineParser &parser, const QString &name, float *value)
{
    if (!parser.isSet(name)) {
        return true;
    }
    bool ok = false;
    const float parsed = parser.value(name).toFloat(&ok);
    if (!ok) {
        qCritical() << "Invalid value for --" + name + ":" << parser.value(name);
        return false;
    }
    *value = parsed;
    return true;
}

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // 设置应用程序信息
    app.setApplicationName("VisemeSync");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("VisemeSync");

    // 解析命令行参数
    QCommandLineParser parser;
    parser.setApplicationDescription("Real-time viseme lip sync from microphone or WAV file");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption fileOption("file", "Play a mono WAV file instead of capturing the microphone.", "wav");
    QCommandLineOption templatesOption("templates", "Load viseme templates from a JSON file.", "json");
    QCommandLineOption sensitivityOption("sensitivity", "Detection sensitivity in [0,1].", "s");
    QCommandLineOption multiplierOption("multiplier", "Intensity multiplier in [1,8].", "m");
    QCommandLineOption noRealtimeOption("no-realtime", "Push file blocks as fast as possible.");
    parser.addOption(fileOption);
    parser.addOption(templatesOption);
    parser.addOption(sensitivityOption);
    parser.addOption(multiplierOption);
    parser.addOption(noRealtimeOption);
    parser.process(app);

    LipSyncConfig config = LipSyncConfig::fromConfigManager();
    if (!parseFloatOption(parser, "sensitivity", &config.sensitivity)
        || !parseFloatOption(parser, "multiplier", &config.intensityMultiplier)) {
        return 2;
    }
    config = config.clamped();

    QString templateFile = parser.isSet(templatesOption) ? parser.value(templatesOption) : config.templateFile;
    std::shared_ptr<const TemplateBank> bank;
    if (!templateFile.isEmpty()) {
        QString error;
        bank = TemplateBank::loadFromFile(templateFile, &error);
        if (!bank) {
            qCritical() << sessionErrorName(SessionError::InvalidTemplate) << ":" << error;
            return 1;
        }
    }

    LipSyncSession session(bank, config);
    QTextStream out(stdout);
    int exitCode = 0;

    QObject::connect(&session, &LipSyncSession::visemeUpdated, [&out](const VisemeState &state) {
        out << state.toString() << Qt::endl;
    });
    QObject::connect(&session, &LipSyncSession::errorOccurred,
                     [&app, &exitCode](SessionError error, const QString &message) {
        qCritical() << sessionErrorName(error) << ":" << message;
        exitCode = 1;
        app.quit();
    });
    QObject::connect(&session, &LipSyncSession::stateChanged, [&app](SessionState state) {
        qDebug() << "Session state:" << sessionStateName(state);
        if (state == SessionState::Stopped) {
            app.quit();
        }
    });

    std::shared_ptr<AudioSource> source;
    if (parser.isSet(fileOption)) {
        std::shared_ptr<FileSource> file = std::make_shared<FileSource>(parser.value(fileOption), config.frameSize);
        file->setRealtime(!parser.isSet(noRealtimeOption));
        source = file;
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &session, &LipSyncSession::stop);

    // 事件循环启动后再开始，保证 quit() 生效
    QTimer::singleShot(0, &session, [&session, source]() {
        session.start(source);
    });

    int result = app.exec();
    return exitCode != 0 ? exitCode : result;
}
