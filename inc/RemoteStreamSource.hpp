#ifndef REMOTESTREAMSOURCE_HPP
#define REMOTESTREAMSOURCE_HPP

#include <QByteArray>
#include <QMutex>
#include <memory>
#include <vector>

#include "AudioSource.hpp"

namespace lipsync {

class OpusDecoder;

/**
 * 远端音频流（例如通话对端或TTS推流）
 * 调用方推入 Opus 包或 PCM16，按 frameSize 切块后发出 blockReady
 */
class RemoteStreamSource : public AudioSource
{
    Q_OBJECT

public:
    explicit RemoteStreamSource(int sampleRate = 24000, int frameSize = 512, QObject *parent = nullptr);
    ~RemoteStreamSource() override;

    bool start() override;
    void stop() override;

    int sampleRate() const override { return m_sampleRate; }
    bool isLive() const override { return true; }
    bool isAvailable() const override;
    QString description() const override;

    // 尚未凑满一块的缓存样本数
    int pendingSampleCount() const;

public slots:
    bool pushOpusPacket(const QByteArray &packet);
    // 小端 16bit 单声道
    bool pushPcm16(const QByteArray &pcm);
    void pushSamples(const std::vector<float> &samples);

    // 对端断开，转发为 sourceLost
    void markLost(const QString &reason);

private:
    bool appendAndFlush(const std::vector<float> &samples);

    int m_sampleRate;
    int m_frameSize;
    bool m_started;
    bool m_lost;

    std::unique_ptr<OpusDecoder> m_decoder;
    std::vector<float> m_pending;
    mutable QMutex m_mutex;
};

} // namespace lipsync

#endif // REMOTESTREAMSOURCE_HPP
