#ifndef OPUSDECODER_H
#define OPUSDECODER_H

#include <QByteArray>
#include <opus/opus.h>
#include <vector>

namespace lipsync {

// 远端推流的 Opus 包解码为 float 单声道样本
class OpusDecoder
{
public:
    OpusDecoder();
    ~OpusDecoder();

    OpusDecoder(const OpusDecoder&) = delete;
    OpusDecoder& operator=(const OpusDecoder&) = delete;

    bool initialize(int sampleRate = 24000, int channels = 1);

    // 失败返回 false，out 不变
    bool decode(const QByteArray &opusData, std::vector<float> &out);

    bool isInitialized() const { return m_decoder != nullptr; }
    int getSampleRate() const { return m_sampleRate; }
    int getChannels() const { return m_channels; }

private:
    ::OpusDecoder *m_decoder;  // opus库的解码器类型，使用::前缀避免与类名冲突
    int m_sampleRate;
    int m_channels;

    std::vector<opus_int16> m_pcmBuffer;
};

} // namespace lipsync

#endif // OPUSDECODER_H
