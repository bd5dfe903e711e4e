#ifndef AUDIOSOURCE_HPP
#define AUDIOSOURCE_HPP

#include <QObject>
#include <QString>
#include <memory>

#include "LipSyncTypes.hpp"

namespace lipsync {

/**
 * 音频源抽象（本地麦克风 / 远端推流 / 文件回放）
 * start() 是唯一允许阻塞的步骤（权限、设备、网络）
 * stop() 可重复调用
 * blockReady 可能在音频线程发出，接收方应使用 QueuedConnection
 */
class AudioSource : public QObject
{
    Q_OBJECT

public:
    explicit AudioSource(QObject *parent = nullptr);
    ~AudioSource() override;

    virtual bool start() = 0;
    virtual void stop() = 0;

    virtual int sampleRate() const = 0;
    virtual int channelCount() const { return 1; }
    virtual bool isLive() const = 0;
    virtual bool isAvailable() const = 0;
    virtual QString description() const = 0;

    // 单调时钟（毫秒），所有源共用，保证跨源时间戳可比较
    static qint64 monotonicMs();

signals:
    void blockReady(const lipsync::AudioBlock &block);
    void sourceLost(const QString &reason);
    void finished();
};

// 由调用方（实时会话、播放器）提供音频源
class AudioSourceProvider
{
public:
    virtual ~AudioSourceProvider() = default;

    // 没有可用源时返回 nullptr
    virtual std::shared_ptr<AudioSource> acquireSource() = 0;
};

} // namespace lipsync

#endif // AUDIOSOURCE_HPP
