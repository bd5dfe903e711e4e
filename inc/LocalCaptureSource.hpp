#ifndef LOCALCAPTURESOURCE_HPP
#define LOCALCAPTURESOURCE_HPP

#include <QTimer>
#include <atomic>

// 所有平台都使用PortAudio
#include <portaudio.h>

#include "AudioSource.hpp"

namespace lipsync {

/**
 * 本地麦克风采集（基于PortAudio callback模式）
 * 调用方没有提供音频源时作为最后的回退
 */
class LocalCaptureSource : public AudioSource
{
    Q_OBJECT

public:
    // deviceId < 0 使用默认输入设备
    explicit LocalCaptureSource(int sampleRate = 16000, int frameSize = 512,
                                int deviceId = -1, QObject *parent = nullptr);
    ~LocalCaptureSource() override;

    bool start() override;
    void stop() override;

    int sampleRate() const override { return m_sampleRate; }
    bool isLive() const override { return true; }
    bool isAvailable() const override;
    QString description() const override;

    QString lastError() const { return m_lastError; }

private slots:
    void checkStreamHealth();

private:
    // 音频回调函数（必须是静态的）
    static int audioCallback(
        const void *inputBuffer,
        void *outputBuffer,
        unsigned long framesPerBuffer,
        const PaStreamCallbackTimeInfo* timeInfo,
        PaStreamCallbackFlags statusFlags,
        void *userData);

    void processAudioData(const int16_t* pcmData, unsigned long sampleCount);
    bool initializePortAudio();
    void closeStream();

    PaStream* m_stream;
    bool m_paInitialized;

    int m_sampleRate;
    int m_frameSize;
    int m_deviceId;
    QString m_deviceName;
    QString m_lastError;

    std::atomic<bool> m_capturing;

    // 设备被拔出或流异常终止时报告 sourceLost
    QTimer *m_watchdogTimer;
    static const int WATCHDOG_INTERVAL = 500; // 500ms
};

} // namespace lipsync

#endif // LOCALCAPTURESOURCE_HPP
