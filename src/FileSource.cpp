#include "FileSource.hpp"
#include "LogUtil.h"

#include <QFile>
#include <QFileInfo>
#include <QtEndian>
#include <algorithm>
#include <cmath>
#include <cstring>

namespace lipsync {

namespace {
const quint16 kFormatPcm = 1;
const quint16 kFormatFloat = 3;
const quint16 kFormatExtensible = 0xFFFE;

void setError(QString *error, const QString &message)
{
    if (error) {
        *error = message;
    }
}
}

FileSource::FileSource(const QString &filePath, int frameSize, QObject *parent)
    : AudioSource(parent)
    , m_filePath(filePath)
    , m_frameSize(std::max(1, frameSize))
    , m_sampleRate(0)
    , m_realtime(true)
    , m_playing(false)
    , m_position(0)
    , m_pacingTimer(new QTimer(this))
{
    connect(m_pacingTimer, &QTimer::timeout, this, &FileSource::pushNextBlock);
}

FileSource::~FileSource()
{
    stop();
}

bool FileSource::parseWav(const QByteArray &data, std::vector<float> &samples,
                          int &sampleRate, QString *error)
{
    const uchar *bytes = reinterpret_cast<const uchar*>(data.constData());
    const int size = data.size();

    if (size < 12 || std::memcmp(bytes, "RIFF", 4) != 0 || std::memcmp(bytes + 8, "WAVE", 4) != 0) {
        setError(error, "not a RIFF/WAVE file");
        return false;
    }

    quint16 format = 0;
    quint16 channels = 0;
    quint32 rate = 0;
    quint16 bitsPerSample = 0;
    bool haveFormat = false;
    const uchar *pcm = nullptr;
    quint32 pcmSize = 0;

    int offset = 12;
    while (offset + 8 <= size) {
        const uchar *chunk = bytes + offset;
        const quint32 chunkSize = qFromLittleEndian<quint32>(chunk + 4);
        const int body = offset + 8;
        if (chunkSize > static_cast<quint32>(size - body)) {
            // 截断的 data 块按实际长度读取
            if (std::memcmp(chunk, "data", 4) == 0) {
                pcm = bytes + body;
                pcmSize = static_cast<quint32>(size - body);
            }
            break;
        }

        if (std::memcmp(chunk, "fmt ", 4) == 0 && chunkSize >= 16) {
            format = qFromLittleEndian<quint16>(chunk + 8);
            channels = qFromLittleEndian<quint16>(chunk + 10);
            rate = qFromLittleEndian<quint32>(chunk + 12);
            bitsPerSample = qFromLittleEndian<quint16>(chunk + 22);
            if (format == kFormatExtensible && chunkSize >= 40) {
                // SubFormat GUID 的前两个字节就是实际格式
                format = qFromLittleEndian<quint16>(chunk + 8 + 24);
            }
            haveFormat = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            pcm = bytes + body;
            pcmSize = chunkSize;
        }

        // 块按偶数字节对齐
        offset = body + static_cast<int>(chunkSize) + (chunkSize & 1);
    }

    if (!haveFormat) {
        setError(error, "missing fmt chunk");
        return false;
    }
    if (!pcm) {
        setError(error, "missing data chunk");
        return false;
    }
    if (channels != 1) {
        setError(error, QString("unsupported channel count %1 (mono only)").arg(channels));
        return false;
    }
    if (rate == 0) {
        setError(error, "invalid sample rate 0");
        return false;
    }

    if (format == kFormatPcm && bitsPerSample == 16) {
        const quint32 count = pcmSize / 2;
        samples.resize(count);
        for (quint32 i = 0; i < count; ++i) {
            samples[i] = qFromLittleEndian<qint16>(pcm + i * 2) / 32768.0f;
        }
    } else if (format == kFormatFloat && bitsPerSample == 32) {
        const quint32 count = pcmSize / 4;
        samples.resize(count);
        for (quint32 i = 0; i < count; ++i) {
            const quint32 raw = qFromLittleEndian<quint32>(pcm + i * 4);
            float value;
            std::memcpy(&value, &raw, sizeof(value));
            samples[i] = std::isfinite(value) ? std::max(-1.0f, std::min(1.0f, value)) : 0.0f;
        }
    } else {
        setError(error, QString("unsupported sample format %1 / %2 bits").arg(format).arg(bitsPerSample));
        return false;
    }

    sampleRate = static_cast<int>(rate);
    return true;
}

bool FileSource::start()
{
    if (m_playing) {
        return true;
    }

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_lastError = QString("cannot open %1: %2").arg(m_filePath, file.errorString());
        qWarning() << "FileSource:" << m_lastError;
        return false;
    }

    std::vector<float> samples;
    int rate = 0;
    QString error;
    if (!parseWav(file.readAll(), samples, rate, &error)) {
        m_lastError = QString("%1: %2").arg(m_filePath, error);
        qWarning() << "FileSource:" << m_lastError;
        return false;
    }

    m_samples.swap(samples);
    m_sampleRate = rate;
    m_position = 0;
    m_playing = true;
    m_lastError.clear();

    qDebug() << "FileSource: playing" << m_filePath << "-" << m_samples.size()
             << "samples at" << m_sampleRate << "Hz";

    m_pacingTimer->setInterval(m_realtime ? std::max(1, m_frameSize * 1000 / m_sampleRate) : 0);
    m_pacingTimer->start();
    return true;
}

void FileSource::stop()
{
    m_pacingTimer->stop();
    m_playing = false;
}

bool FileSource::isAvailable() const
{
    return QFileInfo::exists(m_filePath);
}

QString FileSource::description() const
{
    return QString("file %1").arg(QFileInfo(m_filePath).fileName());
}

void FileSource::setRealtime(bool realtime)
{
    m_realtime = realtime;
    if (m_playing && m_sampleRate > 0) {
        m_pacingTimer->setInterval(m_realtime ? std::max(1, m_frameSize * 1000 / m_sampleRate) : 0);
    }
}

void FileSource::pushNextBlock()
{
    if (!m_playing) {
        return;
    }

    if (m_position >= m_samples.size()) {
        stop();
        LS_LOG_INFO("FileSource: end of file %s", qPrintable(m_filePath));
        emit finished();
        return;
    }

    const size_t end = std::min(m_samples.size(), m_position + static_cast<size_t>(m_frameSize));
    AudioBlock block;
    block.sampleRate = m_sampleRate;
    block.timestampMs = monotonicMs();
    block.samples.assign(m_samples.begin() + m_position, m_samples.begin() + end);
    // 最后一块不足 frameSize 时补零
    block.samples.resize(m_frameSize, 0.0f);
    m_position = end;

    emit blockReady(block);
}

} // namespace lipsync
