#include "OpusDecoder.h"
#include "LogUtil.h"

namespace lipsync {

OpusDecoder::OpusDecoder()
    : m_decoder(nullptr)
    , m_sampleRate(24000)
    , m_channels(1)
{
}

OpusDecoder::~OpusDecoder()
{
    if (m_decoder) {
        opus_decoder_destroy(m_decoder);
        m_decoder = nullptr;
    }
}

bool OpusDecoder::initialize(int sampleRate, int channels)
{
    if (m_decoder) {
        LS_LOG_DEBUG("OpusDecoder already initialized");
        return true;
    }

    int error = OPUS_OK;
    ::OpusDecoder *decoder = opus_decoder_create(sampleRate, channels, &error);
    if (error != OPUS_OK || !decoder) {
        LS_LOG_ERROR("Failed to create Opus decoder: %s", opus_strerror(error));
        return false;
    }

    m_decoder = decoder;
    m_sampleRate = sampleRate;
    m_channels = channels;

    // 一个 Opus 包最长 120ms
    m_pcmBuffer.resize(static_cast<size_t>(sampleRate * 120 / 1000) * channels);

    LS_LOG_INFO("OpusDecoder initialized (sample rate: %d, channels: %d)", sampleRate, channels);
    return true;
}

bool OpusDecoder::decode(const QByteArray &opusData, std::vector<float> &out)
{
    if (!m_decoder) {
        LS_LOG_ERROR("OpusDecoder not initialized");
        return false;
    }

    if (opusData.isEmpty()) {
        return false;
    }

    const int maxFrameSize = static_cast<int>(m_pcmBuffer.size()) / m_channels;
    int decodedSamples = opus_decode(
        m_decoder,
        reinterpret_cast<const unsigned char*>(opusData.constData()),
        opusData.size(),
        m_pcmBuffer.data(),
        maxFrameSize,
        0 // 不使用FEC
    );

    if (decodedSamples < 0) {
        LS_LOG_WARN("Opus decode failed: %s", opus_strerror(decodedSamples));
        return false;
    }

    LS_LOG_DEBUG("Opus decoded %d samples from %d bytes", decodedSamples, opusData.size());

    // 多声道下混为单声道
    out.resize(decodedSamples);
    for (int i = 0; i < decodedSamples; ++i) {
        int sum = 0;
        for (int c = 0; c < m_channels; ++c) {
            sum += m_pcmBuffer[i * m_channels + c];
        }
        out[i] = static_cast<float>(sum) / (32768.0f * m_channels);
    }
    return true;
}

} // namespace lipsync
