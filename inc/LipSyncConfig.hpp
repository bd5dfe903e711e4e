#ifndef LIPSYNCCONFIG_HPP
#define LIPSYNCCONFIG_HPP

#include <QJsonObject>
#include <QString>

#include "DtwClassifier.hpp"
#include "FormantClassifier.hpp"
#include "IntensityShaper.hpp"

namespace lipsync {

// 会话配置，字段对应 config.json 中的 LIPSYNC_OPTIONS / RECONNECT_OPTIONS / AUDIO_DEVICES
struct LipSyncConfig {
    float sensitivity = 0.2f;          // [0,1]
    float intensityMultiplier = 6.0f;  // [1,8]
    float minIntensity = 0.1f;         // [0,1]
    float smoothing = 0.6f;            // [0,1]
    int settleDelayMs = 30;
    int frameBudgetMs = 40;
    float updateDelta = 0.1f;
    int sequenceLength = 1;

    int maxReconnectAttempts = 5;
    int reconnectIntervalMs = 2000;
    bool localCaptureFallback = true;

    int inputDeviceId = -1;            // -1 表示默认设备
    int inputSampleRate = 16000;
    int frameSize = 512;
    int fftSize = 2048;

    QString templateFile;

    // 超出范围的值被夹取到合法区间
    LipSyncConfig clamped() const;

    ClassifierParams classifierParams() const;
    ShaperParams shaperParams() const;
    FormantParams formantParams() const;

    QJsonObject toJson() const;

    // 缺失的字段保持默认值
    static LipSyncConfig fromJson(const QJsonObject &config);
    static LipSyncConfig fromConfigManager();
};

} // namespace lipsync

#endif // LIPSYNCCONFIG_HPP
