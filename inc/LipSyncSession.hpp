#ifndef LIPSYNCSESSION_HPP
#define LIPSYNCSESSION_HPP

#include <QObject>
#include <QTimer>
#include <atomic>
#include <memory>

#include "AudioSource.hpp"
#include "DtwClassifier.hpp"
#include "FeatureExtractor.hpp"
#include "FormantClassifier.hpp"
#include "IntensityShaper.hpp"
#include "LipSyncConfig.hpp"
#include "LipSyncTypes.hpp"
#include "TemplateBank.hpp"

namespace lipsync {

class FeatureBuffer;
class SpectrumAnalyzer;

/**
 * 口型同步会话
 *
 * 状态机：Idle -> Starting -> Running <-> Reconnecting -> Stopped，Failed 为终态
 * （Stopped/Failed 之后可以重新 start）。
 *
 * 音频块通过 QueuedConnection 投递到会话所在线程，按顺序处理；
 * 处理中或稳定延迟期间到达的块直接丢弃。
 */
class LipSyncSession : public QObject
{
    Q_OBJECT

public:
    // bank 为空时使用预置模板
    explicit LipSyncSession(std::shared_ptr<const TemplateBank> bank = nullptr,
                            const LipSyncConfig &config = LipSyncConfig(),
                            QObject *parent = nullptr);
    ~LipSyncSession() override;

    // 不持有所有权，provider 需比会话活得更久
    void setSourceProvider(AudioSourceProvider *provider);
    void setFeatureExtractor(std::shared_ptr<FeatureExtractor> extractor);

    // 获取源失败不算错误，会进入 Reconnecting 按间隔重试
    SessionError start(std::shared_ptr<AudioSource> source = nullptr);
    void stop();
    SessionError updateSource(std::shared_ptr<AudioSource> source);
    void notifySourceChanged();

    SessionState state() const { return m_state; }
    bool isActive() const;
    ClassifierStrategy strategy() const { return m_strategy; }
    int droppedFrameCount() const { return m_droppedFrames; }
    const PipelineState &pipelineState() const { return m_pipeline; }
    // 最近一次推送给渲染端的口型，供轮询方读取
    const VisemeState &currentVisemeState() const { return m_pipeline.lastDispatched; }
    std::shared_ptr<AudioSource> currentSource() const { return m_source; }
    const LipSyncConfig &config() const { return m_config; }
    std::shared_ptr<const TemplateBank> templateBank() const { return m_bank; }

signals:
    void visemeUpdated(const lipsync::VisemeState &state);
    void errorOccurred(lipsync::SessionError error, const QString &message);
    void stateChanged(lipsync::SessionState state);

protected:
    // 本地麦克风回退，LOCAL_CAPTURE_FALLBACK 关闭时返回 nullptr
    virtual std::shared_ptr<AudioSource> createLocalSource();

private slots:
    void attemptReconnect();
    void releaseProcessing();

private:
    void setState(SessionState state);
    ClassifierStrategy chooseStrategy();

    bool attachSource(const std::shared_ptr<AudioSource> &source);
    void detachSource();
    std::shared_ptr<AudioSource> acquireInitialSource(const std::shared_ptr<AudioSource> &explicitSource);
    std::shared_ptr<AudioSource> acquireRetrySource();

    void handleBlock(quint64 generation, const AudioBlock &block);
    void handleSourceLost(quint64 generation, const QString &reason);
    void handleSourceFinished(quint64 generation);

    void processBlock(const AudioBlock &block);
    bool classifyCepstral(const AudioBlock &block, Viseme &category, float &intensity);
    bool classifyFormant(const AudioBlock &block, Viseme &category, float &intensity);
    void applyResult(Viseme category, float intensity, qint64 timestampMs);
    void dispatch(const VisemeState &state);

    void enterReconnecting(const QString &reason);
    void scheduleReconnect();
    void shutdown(SessionState finalState);
    void clearBuffers();

    std::shared_ptr<const TemplateBank> m_bank;
    LipSyncConfig m_config;

    DtwClassifier m_classifier;
    IntensityShaper m_shaper;
    FormantClassifier m_formant;
    std::unique_ptr<FeatureBuffer> m_featureBuffer;
    std::unique_ptr<SpectrumAnalyzer> m_spectrum;

    AudioSourceProvider *m_provider;
    std::shared_ptr<FeatureExtractor> m_extractor;

    std::shared_ptr<AudioSource> m_source;
    std::shared_ptr<AudioSource> m_previousSource;
    quint64 m_sourceGeneration;

    SessionState m_state;
    ClassifierStrategy m_strategy;
    PipelineState m_pipeline;

    std::atomic<bool> m_processing;
    int m_droppedFrames;

    QTimer *m_reconnectTimer;
    QTimer *m_settleTimer;
};

} // namespace lipsync

#endif // LIPSYNCSESSION_HPP
