#include "RemoteStreamSource.hpp"
#include "OpusDecoder.h"
#include "LogUtil.h"

#include <QMutexLocker>
#include <QtEndian>
#include <algorithm>

namespace lipsync {

RemoteStreamSource::RemoteStreamSource(int sampleRate, int frameSize, QObject *parent)
    : AudioSource(parent)
    , m_sampleRate(sampleRate)
    , m_frameSize(std::max(1, frameSize))
    , m_started(false)
    , m_lost(false)
{
}

RemoteStreamSource::~RemoteStreamSource()
{
}

bool RemoteStreamSource::start()
{
    QMutexLocker locker(&m_mutex);
    if (m_lost) {
        LS_LOG_WARN("RemoteStreamSource: stream already lost, cannot start");
        return false;
    }
    m_started = true;
    m_pending.clear();
    return true;
}

void RemoteStreamSource::stop()
{
    QMutexLocker locker(&m_mutex);
    m_started = false;
    m_pending.clear();
}

bool RemoteStreamSource::isAvailable() const
{
    QMutexLocker locker(&m_mutex);
    return !m_lost;
}

int RemoteStreamSource::pendingSampleCount() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_pending.size());
}

QString RemoteStreamSource::description() const
{
    return QString("remote stream (%1 Hz)").arg(m_sampleRate);
}

bool RemoteStreamSource::pushOpusPacket(const QByteArray &packet)
{
    std::vector<float> decoded;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_started || m_lost) {
            return false;
        }
        if (!m_decoder) {
            std::unique_ptr<OpusDecoder> decoder(new OpusDecoder());
            if (!decoder->initialize(m_sampleRate, 1)) {
                return false;
            }
            m_decoder = std::move(decoder);
        }
        if (!m_decoder->decode(packet, decoded)) {
            return false;
        }
    }
    return appendAndFlush(decoded);
}

bool RemoteStreamSource::pushPcm16(const QByteArray &pcm)
{
    if (pcm.size() % 2 != 0) {
        LS_LOG_WARN("RemoteStreamSource: odd PCM16 payload size %d", pcm.size());
        return false;
    }

    const int count = pcm.size() / 2;
    const uchar *data = reinterpret_cast<const uchar*>(pcm.constData());
    std::vector<float> samples(count);
    for (int i = 0; i < count; ++i) {
        samples[i] = qFromLittleEndian<qint16>(data + i * 2) / 32768.0f;
    }

    return appendAndFlush(samples);
}

void RemoteStreamSource::pushSamples(const std::vector<float> &samples)
{
    appendAndFlush(samples);
}

void RemoteStreamSource::markLost(const QString &reason)
{
    {
        QMutexLocker locker(&m_mutex);
        if (m_lost) {
            return;
        }
        m_lost = true;
        m_started = false;
        m_pending.clear();
    }
    LS_LOG_WARN("RemoteStreamSource lost: %s", qPrintable(reason));
    emit sourceLost(reason);
}

bool RemoteStreamSource::appendAndFlush(const std::vector<float> &samples)
{
    std::vector<AudioBlock> ready;
    {
        // 状态检查与追加在同一把锁内，stop() 之后不会残留样本
        QMutexLocker locker(&m_mutex);
        if (!m_started || m_lost) {
            return false;
        }
        m_pending.insert(m_pending.end(), samples.begin(), samples.end());

        size_t offset = 0;
        while (m_pending.size() - offset >= static_cast<size_t>(m_frameSize)) {
            AudioBlock block;
            block.sampleRate = m_sampleRate;
            block.timestampMs = monotonicMs();
            block.samples.assign(m_pending.begin() + offset, m_pending.begin() + offset + m_frameSize);
            ready.push_back(std::move(block));
            offset += m_frameSize;
        }
        m_pending.erase(m_pending.begin(), m_pending.begin() + offset);
    }

    // 锁外发信号，避免接收方直连时重入
    for (const AudioBlock &block : ready) {
        emit blockReady(block);
    }
    return true;
}

} // namespace lipsync
