#ifndef FILESOURCE_HPP
#define FILESOURCE_HPP

#include <QByteArray>
#include <QTimer>
#include <vector>

#include "AudioSource.hpp"

namespace lipsync {

/**
 * WAV 文件回放（RIFF/WAVE，单声道 PCM16 或 float32）
 * 默认按实时速度推送；setRealtime(false) 时尽快推送
 */
class FileSource : public AudioSource
{
    Q_OBJECT

public:
    explicit FileSource(const QString &filePath, int frameSize = 512, QObject *parent = nullptr);
    ~FileSource() override;

    bool start() override;
    void stop() override;

    int sampleRate() const override { return m_sampleRate; }
    bool isLive() const override { return false; }
    bool isAvailable() const override;
    QString description() const override;

    void setRealtime(bool realtime);
    bool isRealtime() const { return m_realtime; }

    QString lastError() const { return m_lastError; }
    qint64 totalSamples() const { return static_cast<qint64>(m_samples.size()); }
    qint64 position() const { return static_cast<qint64>(m_position); }

    // 解析内存中的 WAV 数据，失败时写入 error
    static bool parseWav(const QByteArray &data, std::vector<float> &samples,
                         int &sampleRate, QString *error = nullptr);

private slots:
    void pushNextBlock();

private:
    QString m_filePath;
    int m_frameSize;
    int m_sampleRate;
    bool m_realtime;
    bool m_playing;
    QString m_lastError;

    std::vector<float> m_samples;
    size_t m_position;
    QTimer *m_pacingTimer;
};

} // namespace lipsync

#endif // FILESOURCE_HPP
