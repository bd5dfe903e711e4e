#include "LipSyncConfig.hpp"
#include "ConfigManager.h"

#include <QJsonValue>
#include <algorithm>
#include <cmath>
#include <limits>

namespace lipsync {

namespace {

float clampFloat(float value, float low, float high, float fallback)
{
    if (!std::isfinite(value)) {
        return fallback;
    }
    return std::max(low, std::min(high, value));
}

float readFloat(const QJsonObject &section, const char *key, float fallback)
{
    const QJsonValue value = section.value(QLatin1String(key));
    return value.isDouble() ? static_cast<float>(value.toDouble()) : fallback;
}

int readInt(const QJsonObject &section, const char *key, int fallback)
{
    const QJsonValue value = section.value(QLatin1String(key));
    if (!value.isDouble()) {
        return fallback;
    }
    // 先限制到 int 范围再取整，超大数值交给 clamped() 处理
    const double limited = std::max(static_cast<double>(std::numeric_limits<int>::min()),
                                    std::min(static_cast<double>(std::numeric_limits<int>::max()),
                                             value.toDouble()));
    return static_cast<int>(std::lround(limited));
}

bool readBool(const QJsonObject &section, const char *key, bool fallback)
{
    const QJsonValue value = section.value(QLatin1String(key));
    return value.isBool() ? value.toBool() : fallback;
}

}

LipSyncConfig LipSyncConfig::clamped() const
{
    const LipSyncConfig defaults;
    LipSyncConfig c = *this;

    c.sensitivity = clampFloat(sensitivity, 0.0f, 1.0f, defaults.sensitivity);
    c.intensityMultiplier = clampFloat(intensityMultiplier, 1.0f, 8.0f, defaults.intensityMultiplier);
    c.minIntensity = clampFloat(minIntensity, 0.0f, 1.0f, defaults.minIntensity);
    c.smoothing = clampFloat(smoothing, 0.0f, 1.0f, defaults.smoothing);
    c.updateDelta = clampFloat(updateDelta, 0.0f, 1.0f, defaults.updateDelta);

    c.settleDelayMs = std::max(0, settleDelayMs);
    c.frameBudgetMs = std::max(1, frameBudgetMs);
    c.sequenceLength = std::max(1, sequenceLength);

    c.maxReconnectAttempts = std::max(0, maxReconnectAttempts);
    c.reconnectIntervalMs = std::max(0, reconnectIntervalMs);

    c.inputDeviceId = std::max(-1, inputDeviceId);
    c.inputSampleRate = std::max(8000, std::min(192000, inputSampleRate));
    c.frameSize = std::max(32, frameSize);
    c.fftSize = std::max(32, fftSize);
    return c;
}

ClassifierParams LipSyncConfig::classifierParams() const
{
    ClassifierParams params;
    params.sensitivity = sensitivity;
    params.updateDelta = updateDelta;
    return params;
}

ShaperParams LipSyncConfig::shaperParams() const
{
    ShaperParams params;
    params.sensitivity = sensitivity;
    params.intensityMultiplier = intensityMultiplier;
    params.minIntensity = minIntensity;
    return params;
}

FormantParams LipSyncConfig::formantParams() const
{
    FormantParams params;
    params.sensitivity = sensitivity;
    params.intensityMultiplier = intensityMultiplier;
    params.minIntensity = minIntensity;
    return params;
}

QJsonObject LipSyncConfig::toJson() const
{
    QJsonObject lipsyncOptions;
    lipsyncOptions["SENSITIVITY"] = sensitivity;
    lipsyncOptions["INTENSITY_MULTIPLIER"] = intensityMultiplier;
    lipsyncOptions["MIN_INTENSITY"] = minIntensity;
    lipsyncOptions["SMOOTHING"] = smoothing;
    lipsyncOptions["SETTLE_DELAY_MS"] = settleDelayMs;
    lipsyncOptions["FRAME_BUDGET_MS"] = frameBudgetMs;
    lipsyncOptions["UPDATE_DELTA"] = updateDelta;
    lipsyncOptions["SEQUENCE_LENGTH"] = sequenceLength;

    QJsonObject reconnectOptions;
    reconnectOptions["MAX_RECONNECT_ATTEMPTS"] = maxReconnectAttempts;
    reconnectOptions["RECONNECT_INTERVAL_MS"] = reconnectIntervalMs;
    reconnectOptions["LOCAL_CAPTURE_FALLBACK"] = localCaptureFallback;

    QJsonObject audioDevices;
    audioDevices["input_device_id"] = inputDeviceId >= 0 ? QJsonValue(inputDeviceId) : QJsonValue();
    audioDevices["input_sample_rate"] = inputSampleRate;
    audioDevices["frame_size"] = frameSize;
    audioDevices["fft_size"] = fftSize;

    QJsonObject templateOptions;
    templateOptions["TEMPLATE_FILE"] = templateFile.isEmpty() ? QJsonValue() : QJsonValue(templateFile);

    QJsonObject config;
    config["LIPSYNC_OPTIONS"] = lipsyncOptions;
    config["RECONNECT_OPTIONS"] = reconnectOptions;
    config["AUDIO_DEVICES"] = audioDevices;
    config["TEMPLATE_OPTIONS"] = templateOptions;
    return config;
}

LipSyncConfig LipSyncConfig::fromJson(const QJsonObject &config)
{
    LipSyncConfig c;

    const QJsonObject lipsyncOptions = config.value("LIPSYNC_OPTIONS").toObject();
    c.sensitivity = readFloat(lipsyncOptions, "SENSITIVITY", c.sensitivity);
    c.intensityMultiplier = readFloat(lipsyncOptions, "INTENSITY_MULTIPLIER", c.intensityMultiplier);
    c.minIntensity = readFloat(lipsyncOptions, "MIN_INTENSITY", c.minIntensity);
    c.smoothing = readFloat(lipsyncOptions, "SMOOTHING", c.smoothing);
    c.settleDelayMs = readInt(lipsyncOptions, "SETTLE_DELAY_MS", c.settleDelayMs);
    c.frameBudgetMs = readInt(lipsyncOptions, "FRAME_BUDGET_MS", c.frameBudgetMs);
    c.updateDelta = readFloat(lipsyncOptions, "UPDATE_DELTA", c.updateDelta);
    c.sequenceLength = readInt(lipsyncOptions, "SEQUENCE_LENGTH", c.sequenceLength);

    const QJsonObject reconnectOptions = config.value("RECONNECT_OPTIONS").toObject();
    c.maxReconnectAttempts = readInt(reconnectOptions, "MAX_RECONNECT_ATTEMPTS", c.maxReconnectAttempts);
    c.reconnectIntervalMs = readInt(reconnectOptions, "RECONNECT_INTERVAL_MS", c.reconnectIntervalMs);
    c.localCaptureFallback = readBool(reconnectOptions, "LOCAL_CAPTURE_FALLBACK", c.localCaptureFallback);

    const QJsonObject audioDevices = config.value("AUDIO_DEVICES").toObject();
    c.inputDeviceId = readInt(audioDevices, "input_device_id", c.inputDeviceId);
    c.inputSampleRate = readInt(audioDevices, "input_sample_rate", c.inputSampleRate);
    c.frameSize = readInt(audioDevices, "frame_size", c.frameSize);
    c.fftSize = readInt(audioDevices, "fft_size", c.fftSize);

    const QJsonObject templateOptions = config.value("TEMPLATE_OPTIONS").toObject();
    const QJsonValue templateFile = templateOptions.value("TEMPLATE_FILE");
    if (templateFile.isString()) {
        c.templateFile = templateFile.toString();
    }

    return c.clamped();
}

LipSyncConfig LipSyncConfig::fromConfigManager()
{
    return fromJson(ConfigManager::getInstance()->getFullConfig());
}

} // namespace lipsync
