#include "ConfigManager.h"
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace lipsync {

ConfigManager* ConfigManager::s_instance = nullptr;

const QJsonObject ConfigManager::DEFAULT_CONFIG = []() {
    QJsonObject config;

    // LIPSYNC_OPTIONS
    QJsonObject lipsyncOptions;
    lipsyncOptions["SENSITIVITY"] = 0.2;
    lipsyncOptions["INTENSITY_MULTIPLIER"] = 6.0;
    lipsyncOptions["MIN_INTENSITY"] = 0.1;
    lipsyncOptions["SMOOTHING"] = 0.6;
    lipsyncOptions["SETTLE_DELAY_MS"] = 30;
    lipsyncOptions["FRAME_BUDGET_MS"] = 40;
    lipsyncOptions["UPDATE_DELTA"] = 0.1;
    lipsyncOptions["SEQUENCE_LENGTH"] = 1;
    config["LIPSYNC_OPTIONS"] = lipsyncOptions;

    // RECONNECT_OPTIONS
    QJsonObject reconnectOptions;
    reconnectOptions["MAX_RECONNECT_ATTEMPTS"] = 5;
    reconnectOptions["RECONNECT_INTERVAL_MS"] = 2000;
    reconnectOptions["LOCAL_CAPTURE_FALLBACK"] = true;
    config["RECONNECT_OPTIONS"] = reconnectOptions;

    // AUDIO_DEVICES
    QJsonObject audioDevices;
    audioDevices["input_device_id"] = QJsonValue::Null;
    audioDevices["input_sample_rate"] = 16000;
    audioDevices["frame_size"] = 512;
    audioDevices["fft_size"] = 2048;
    config["AUDIO_DEVICES"] = audioDevices;

    // TEMPLATE_OPTIONS
    QJsonObject templateOptions;
    templateOptions["TEMPLATE_FILE"] = QJsonValue::Null;
    config["TEMPLATE_OPTIONS"] = templateOptions;

    return config;
}();

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
{
    initFilePaths();
    loadConfig();

    qDebug() << "ConfigManager initialized";
}

ConfigManager::~ConfigManager()
{
}

ConfigManager* ConfigManager::getInstance()
{
    if (!s_instance) {
        s_instance = new ConfigManager(QCoreApplication::instance());
    }
    return s_instance;
}

void ConfigManager::initFilePaths()
{
    m_configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (!m_configDir.exists()) {
        m_configDir.mkpath(".");
    }
    m_configFilePath = m_configDir.filePath("config.json");
    qDebug() << "ConfigManager config directory:" << m_configDir.path();
}

QJsonObject ConfigManager::loadConfigFromFile() const
{
    QFile file(m_configFilePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qDebug() << "Config file does not exist or cannot be opened:" << m_configFilePath;
        return QJsonObject();
    }

    QByteArray jsonData = file.readAll();
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(jsonData, &parseError);

    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "Failed to parse config file:" << parseError.errorString();
        return QJsonObject();
    }

    return doc.object();
}

QJsonObject ConfigManager::mergeConfigs(const QJsonObject& defaultConfig, const QJsonObject& customConfig)
{
    QJsonObject result = defaultConfig;

    for (auto it = customConfig.begin(); it != customConfig.end(); ++it) {
        const QString& key = it.key();
        const QJsonValue& value = it.value();

        if (result.contains(key) && result[key].isObject() && value.isObject()) {
            result[key] = mergeConfigs(result[key].toObject(), value.toObject());
        } else {
            result[key] = value;
        }
    }

    return result;
}

bool ConfigManager::loadConfig()
{
    QJsonObject fileConfig = loadConfigFromFile();

    if (!fileConfig.isEmpty()) {
        qDebug() << "Config file found, merging with defaults";
        m_config = mergeConfigs(DEFAULT_CONFIG, fileConfig);
    } else {
        qDebug() << "Config file not found or empty, using defaults";
        m_config = DEFAULT_CONFIG;
        saveConfig(); // 保存默认配置
    }

    qDebug() << "Config loaded from:" << m_configFilePath;
    return true;
}

bool ConfigManager::saveConfig()
{
    if (!m_configDir.exists()) {
        m_configDir.mkpath(".");
    }

    QFile file(m_configFilePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Truncate)) {
        qWarning() << "Could not open config file for writing:" << file.errorString();
        return false;
    }

    QJsonDocument doc(m_config);
    if (file.write(doc.toJson(QJsonDocument::Indented)) < 0) {
        qWarning() << "Could not write config file:" << file.errorString();
        return false;
    }
    file.close();

    qDebug() << "Config saved to:" << m_configFilePath;
    return true;
}

QVariant ConfigManager::getConfig(const QString& path, const QVariant& defaultValue) const
{
    QJsonValue value = m_config;
    const QStringList keys = path.split('.');

    for (const QString& key : keys) {
        if (!value.isObject()) {
            return defaultValue;
        }
        QJsonObject obj = value.toObject();
        if (!obj.contains(key)) {
            return defaultValue;
        }
        value = obj[key];
    }

    if (value.isNull()) {
        return defaultValue;
    }
    return value.toVariant();
}

void ConfigManager::updateNestedObject(QJsonObject& obj, const QStringList& parts, const QString& lastKey, const QVariant& value)
{
    if (parts.isEmpty()) {
        obj[lastKey] = QJsonValue::fromVariant(value);
        return;
    }

    QString currentPart = parts.first();
    QStringList remainingParts = parts.mid(1);

    if (!obj.contains(currentPart) || !obj[currentPart].isObject()) {
        obj[currentPart] = QJsonObject();
    }

    QJsonObject nested = obj[currentPart].toObject();
    updateNestedObject(nested, remainingParts, lastKey, value);
    obj[currentPart] = nested;
}

bool ConfigManager::updateConfig(const QString& path, const QVariant& value)
{
    QStringList parts = path.split('.');
    QString last = parts.takeLast();
    if (last.isEmpty()) {
        qWarning() << "Invalid config path:" << path;
        return false;
    }

    updateNestedObject(m_config, parts, last, value);
    emit configChanged(path);

    return saveConfig();
}

bool ConfigManager::reloadConfig()
{
    QJsonObject fileConfig = loadConfigFromFile();
    m_config = fileConfig.isEmpty() ? DEFAULT_CONFIG : mergeConfigs(DEFAULT_CONFIG, fileConfig);
    qDebug() << "Config reloaded successfully";
    return true;
}

} // namespace lipsync
