#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QJsonObject>
#include <QString>
#include <QDir>
#include <QVariant>

namespace lipsync {

/**
 * 全局配置（config.json，位于 AppConfigLocation）
 * 路径用点号分隔，例如 "LIPSYNC_OPTIONS.SENSITIVITY"
 */
class ConfigManager : public QObject
{
    Q_OBJECT

public:
    static ConfigManager* getInstance();
    ~ConfigManager();

    // 配置访问方法
    QVariant getConfig(const QString& path, const QVariant& defaultValue = QVariant()) const;
    bool updateConfig(const QString& path, const QVariant& value);
    bool reloadConfig();

    // 配置管理
    QJsonObject getFullConfig() const { return m_config; }
    QString configFilePath() const { return m_configFilePath; }
    bool saveConfig();
    bool loadConfig();

    static QJsonObject defaultConfig() { return DEFAULT_CONFIG; }
    static QJsonObject mergeConfigs(const QJsonObject& defaultConfig, const QJsonObject& customConfig);

signals:
    void configChanged(const QString& path);

private:
    explicit ConfigManager(QObject *parent = nullptr);
    Q_DISABLE_COPY(ConfigManager)

    void initFilePaths();
    QJsonObject loadConfigFromFile() const;
    static void updateNestedObject(QJsonObject& obj, const QStringList& parts, const QString& lastKey, const QVariant& value);

    static ConfigManager* s_instance;
    QDir m_configDir;
    QString m_configFilePath;
    QJsonObject m_config;

    static const QJsonObject DEFAULT_CONFIG;
};

} // namespace lipsync

#endif // CONFIGMANAGER_H
