#include "LipSyncSession.hpp"
#include "FeatureBuffer.h"
#include "LocalCaptureSource.hpp"
#include "LogUtil.h"
#include "SpectrumAnalyzer.h"

#include <QDebug>
#include <QElapsedTimer>
#include <exception>

namespace lipsync {

LipSyncSession::LipSyncSession(std::shared_ptr<const TemplateBank> bank,
                               const LipSyncConfig &config, QObject *parent)
    : QObject(parent)
    , m_bank(bank ? std::move(bank) : TemplateBank::defaultBank())
    , m_config(config.clamped())
    , m_classifier(m_bank, m_config.classifierParams())
    , m_shaper(m_config.shaperParams())
    , m_formant(m_config.formantParams())
    , m_featureBuffer(new FeatureBuffer(m_config.sequenceLength))
    , m_spectrum(new SpectrumAnalyzer(m_config.fftSize, m_config.smoothing))
    , m_provider(nullptr)
    , m_sourceGeneration(0)
    , m_state(SessionState::Idle)
    , m_strategy(ClassifierStrategy::Formant)
    , m_processing(false)
    , m_droppedFrames(0)
    , m_reconnectTimer(new QTimer(this))
    , m_settleTimer(new QTimer(this))
{
    qRegisterMetaType<lipsync::VisemeState>("lipsync::VisemeState");
    qRegisterMetaType<lipsync::SessionState>("lipsync::SessionState");
    qRegisterMetaType<lipsync::SessionError>("lipsync::SessionError");

    m_reconnectTimer->setSingleShot(true);
    m_reconnectTimer->setInterval(m_config.reconnectIntervalMs);
    connect(m_reconnectTimer, &QTimer::timeout, this, &LipSyncSession::attemptReconnect);

    m_settleTimer->setSingleShot(true);
    m_settleTimer->setInterval(m_config.settleDelayMs);
    connect(m_settleTimer, &QTimer::timeout, this, &LipSyncSession::releaseProcessing);
}

LipSyncSession::~LipSyncSession()
{
    m_reconnectTimer->stop();
    m_settleTimer->stop();
    detachSource();
}

void LipSyncSession::setSourceProvider(AudioSourceProvider *provider)
{
    m_provider = provider;
}

void LipSyncSession::setFeatureExtractor(std::shared_ptr<FeatureExtractor> extractor)
{
    m_extractor = std::move(extractor);
}

bool LipSyncSession::isActive() const
{
    return m_state == SessionState::Starting
        || m_state == SessionState::Running
        || m_state == SessionState::Reconnecting;
}

void LipSyncSession::setState(SessionState state)
{
    if (m_state == state) {
        return;
    }
    qDebug() << "LipSyncSession:" << sessionStateName(m_state) << "->" << sessionStateName(state);
    m_state = state;
    emit stateChanged(state);
}

ClassifierStrategy LipSyncSession::chooseStrategy()
{
    if (m_extractor) {
        try {
            if (m_extractor->initialize(m_config.inputSampleRate, m_config.frameSize)) {
                LS_LOG_INFO("Using cepstral classifier (%s)", qPrintable(m_extractor->name()));
                return ClassifierStrategy::Cepstral;
            }
            LS_LOG_WARN("%s: %s failed to initialize, using formant fallback",
                        qPrintable(sessionErrorName(SessionError::ExtractorUnavailable)),
                        qPrintable(m_extractor->name()));
        } catch (const std::exception &e) {
            LS_LOG_WARN("%s: %s, using formant fallback",
                        qPrintable(sessionErrorName(SessionError::ExtractorUnavailable)), e.what());
        }
    } else {
        LS_LOG_INFO("No feature extractor installed, using formant fallback");
    }
    return ClassifierStrategy::Formant;
}

SessionError LipSyncSession::start(std::shared_ptr<AudioSource> source)
{
    if (isActive()) {
        LS_LOG_WARN("start() ignored, session is %s", qPrintable(sessionStateName(m_state)));
        return SessionError::AlreadyActive;
    }

    m_pipeline.reset();
    m_droppedFrames = 0;
    m_previousSource.reset();
    clearBuffers();

    setState(SessionState::Starting);
    if (m_state != SessionState::Starting) {
        // stateChanged 的槽里调用了 stop()
        return SessionError::NoError;
    }

    m_strategy = chooseStrategy();

    std::shared_ptr<AudioSource> acquired = acquireInitialSource(source);
    if (m_state != SessionState::Starting) {
        return SessionError::NoError;
    }

    if (acquired) {
        qDebug() << "LipSyncSession: running on" << acquired->description();
        setState(SessionState::Running);
    } else {
        m_previousSource = source;
        LS_LOG_WARN("%s: no audio source at start, retrying every %d ms",
                    qPrintable(sessionErrorName(SessionError::SourceUnavailable)),
                    m_config.reconnectIntervalMs);
        setState(SessionState::Reconnecting);
        if (m_state == SessionState::Reconnecting) {
            scheduleReconnect();
        }
    }
    return SessionError::NoError;
}

void LipSyncSession::stop()
{
    if (!isActive()) {
        return;
    }
    shutdown(SessionState::Stopped);
}

SessionError LipSyncSession::updateSource(std::shared_ptr<AudioSource> source)
{
    if (!isActive()) {
        return SessionError::NotActive;
    }
    if (!source) {
        return SessionError::SourceUnavailable;
    }

    qDebug() << "LipSyncSession: switching source to" << source->description();

    m_reconnectTimer->stop();
    detachSource();
    clearBuffers();
    setState(SessionState::Reconnecting);
    if (m_state != SessionState::Reconnecting) {
        return SessionError::NoError;
    }

    if (attachSource(source)) {
        m_pipeline.reconnectAttempts = 0;
        setState(SessionState::Running);
    } else {
        m_previousSource = source;
        scheduleReconnect();
    }
    return SessionError::NoError;
}

void LipSyncSession::notifySourceChanged()
{
    if (m_state == SessionState::Running) {
        enterReconnecting("source changed");
    }
}

std::shared_ptr<AudioSource> LipSyncSession::createLocalSource()
{
    if (!m_config.localCaptureFallback) {
        return nullptr;
    }
    return std::make_shared<LocalCaptureSource>(m_config.inputSampleRate, m_config.frameSize,
                                                m_config.inputDeviceId);
}

std::shared_ptr<AudioSource> LipSyncSession::acquireInitialSource(const std::shared_ptr<AudioSource> &explicitSource)
{
    if (explicitSource && attachSource(explicitSource)) {
        return explicitSource;
    }

    if (m_provider) {
        std::shared_ptr<AudioSource> provided = m_provider->acquireSource();
        if (provided && attachSource(provided)) {
            return provided;
        }
    }

    std::shared_ptr<AudioSource> local = createLocalSource();
    if (local && attachSource(local)) {
        return local;
    }
    return nullptr;
}

std::shared_ptr<AudioSource> LipSyncSession::acquireRetrySource()
{
    if (m_provider) {
        std::shared_ptr<AudioSource> provided = m_provider->acquireSource();
        if (provided && attachSource(provided)) {
            return provided;
        }
    }

    if (m_previousSource && m_previousSource->isAvailable()) {
        std::shared_ptr<AudioSource> previous = m_previousSource;
        if (attachSource(previous)) {
            return previous;
        }
    }

    std::shared_ptr<AudioSource> local = createLocalSource();
    if (local && attachSource(local)) {
        return local;
    }
    return nullptr;
}

bool LipSyncSession::attachSource(const std::shared_ptr<AudioSource> &source)
{
    if (!source) {
        return false;
    }

    // 旧源排队中的事件凭 generation 识别并丢弃
    const quint64 generation = ++m_sourceGeneration;
    AudioSource *raw = source.get();
    connect(raw, &AudioSource::blockReady, this, [this, generation](const lipsync::AudioBlock &block) {
        handleBlock(generation, block);
    }, Qt::QueuedConnection);
    connect(raw, &AudioSource::sourceLost, this, [this, generation](const QString &reason) {
        handleSourceLost(generation, reason);
    }, Qt::QueuedConnection);
    connect(raw, &AudioSource::finished, this, [this, generation]() {
        handleSourceFinished(generation);
    }, Qt::QueuedConnection);

    if (!source->start()) {
        qWarning() << "LipSyncSession: failed to start" << source->description();
        disconnect(raw, nullptr, this, nullptr);
        ++m_sourceGeneration;
        return false;
    }

    m_source = source;
    m_previousSource = source;
    return true;
}

void LipSyncSession::detachSource()
{
    ++m_sourceGeneration;
    if (!m_source) {
        return;
    }

    std::shared_ptr<AudioSource> source = m_source;
    m_source.reset();
    disconnect(source.get(), nullptr, this, nullptr);
    source->stop();
}

void LipSyncSession::clearBuffers()
{
    m_settleTimer->stop();
    m_processing = false;
    m_featureBuffer->clear();
    m_spectrum->reset();
}

void LipSyncSession::handleBlock(quint64 generation, const AudioBlock &block)
{
    if (generation != m_sourceGeneration || m_state != SessionState::Running) {
        return;
    }

    if (block.timestampMs < m_pipeline.lastTimestampMs) {
        ++m_droppedFrames;
        LS_LOG_DEBUG("Dropping stale block (%lld < %lld)",
                     static_cast<long long>(block.timestampMs),
                     static_cast<long long>(m_pipeline.lastTimestampMs));
        return;
    }

    bool expected = false;
    if (!m_processing.compare_exchange_strong(expected, true)) {
        ++m_droppedFrames;
        // 频谱窗口保持连续，只跳过分类
        if (m_strategy == ClassifierStrategy::Formant) {
            m_spectrum->pushSamples(block.samples);
        }
        return;
    }

    m_pipeline.lastTimestampMs = block.timestampMs;

    try {
        processBlock(block);
    } catch (const std::exception &e) {
        m_processing = false;
        if (m_state == SessionState::Running) {
            enterReconnecting(QString("frame processing failed: %1").arg(e.what()));
        }
        return;
    }

    if (m_state != SessionState::Running) {
        // 处理过程中会话被停止或切换了源
        m_processing = false;
        return;
    }

    if (m_config.settleDelayMs > 0) {
        m_settleTimer->start();
    } else {
        m_processing = false;
    }
}

void LipSyncSession::releaseProcessing()
{
    m_processing = false;
}

void LipSyncSession::handleSourceLost(quint64 generation, const QString &reason)
{
    if (generation != m_sourceGeneration || m_state != SessionState::Running) {
        return;
    }
    enterReconnecting(reason);
}

void LipSyncSession::handleSourceFinished(quint64 generation)
{
    if (generation != m_sourceGeneration) {
        return;
    }
    qDebug() << "LipSyncSession: source finished, stopping";
    stop();
}

void LipSyncSession::processBlock(const AudioBlock &block)
{
    QElapsedTimer elapsed;
    elapsed.start();

    Viseme category = Viseme::Silence;
    float intensity = 0.0f;
    const bool classified = m_strategy == ClassifierStrategy::Cepstral
        ? classifyCepstral(block, category, intensity)
        : classifyFormant(block, category, intensity);
    if (!classified) {
        return;
    }

    if (elapsed.elapsed() > m_config.frameBudgetMs) {
        ++m_droppedFrames;
        LS_LOG_WARN("%s: frame took %lld ms (budget %d ms), result dropped",
                    qPrintable(sessionErrorName(SessionError::ClassificationTimeout)),
                    static_cast<long long>(elapsed.elapsed()), m_config.frameBudgetMs);
        return;
    }

    applyResult(category, intensity, block.timestampMs);
}

bool LipSyncSession::classifyCepstral(const AudioBlock &block, Viseme &category, float &intensity)
{
    FeatureFrame frame;
    frame.timestampMs = block.timestampMs;
    if (!m_extractor->extract(block.samples, block.sampleRate, frame.coefficients)) {
        LS_LOG_DEBUG("Feature extraction produced no frame");
        return false;
    }

    if (!m_featureBuffer->push(frame) || !m_featureBuffer->isFull()) {
        return false;
    }

    const ClassificationResult result = m_classifier.classifySequence(m_featureBuffer->window());
    if (result.category == Viseme::Silence) {
        category = Viseme::Silence;
        intensity = 0.0f;
        return true;
    }

    if (!m_classifier.accepts(result)) {
        // 未通过阈值的帧不更新口型
        LS_LOG_DEBUG("Rejected %s (distance %.2f, threshold %.2f)",
                     qPrintable(visemeName(result.category)), result.distance,
                     m_classifier.dynamicThreshold(result.confidence));
        return false;
    }

    category = result.category;
    intensity = m_shaper.detectionIntensity(result);
    return true;
}

bool LipSyncSession::classifyFormant(const AudioBlock &block, Viseme &category, float &intensity)
{
    m_spectrum->pushSamples(block.samples);
    const FormantResult result = m_formant.classify(m_spectrum->analyze(block.sampleRate, block.timestampMs));
    category = result.category;
    intensity = result.category == Viseme::Silence ? 0.0f : result.intensity;
    return true;
}

void LipSyncSession::applyResult(Viseme category, float intensity, qint64 timestampMs)
{
    if (m_shaper.isBelowFloor(intensity)) {
        category = Viseme::Silence;
        intensity = 0.0f;
    }

    if (!m_classifier.shouldForward(m_pipeline, category, intensity)) {
        return;
    }

    // 先更新状态再发信号，槽里可以安全地 stop()
    m_pipeline.lastCategory = category;
    m_pipeline.lastIntensity = intensity;
    dispatch(m_shaper.shape(category, intensity, timestampMs));
}

void LipSyncSession::dispatch(const VisemeState &state)
{
    m_pipeline.lastDispatched = state;
    emit visemeUpdated(state);
}

void LipSyncSession::enterReconnecting(const QString &reason)
{
    qWarning() << "LipSyncSession: source unavailable -" << reason;

    detachSource();
    clearBuffers();
    setState(SessionState::Reconnecting);
    if (m_state == SessionState::Reconnecting) {
        scheduleReconnect();
    }
}

void LipSyncSession::scheduleReconnect()
{
    if (m_pipeline.reconnectAttempts >= m_config.maxReconnectAttempts) {
        shutdown(SessionState::Failed);
        return;
    }
    m_reconnectTimer->start();
}

void LipSyncSession::attemptReconnect()
{
    if (m_state != SessionState::Reconnecting) {
        return;
    }

    ++m_pipeline.reconnectAttempts;
    LS_LOG_INFO("Reconnect attempt %d/%d", m_pipeline.reconnectAttempts, m_config.maxReconnectAttempts);

    std::shared_ptr<AudioSource> source = acquireRetrySource();
    if (m_state != SessionState::Reconnecting) {
        return;
    }

    if (source) {
        qDebug() << "LipSyncSession: reconnected to" << source->description();
        m_pipeline.reconnectAttempts = 0;
        setState(SessionState::Running);
        return;
    }

    scheduleReconnect();
}

void LipSyncSession::shutdown(SessionState finalState)
{
    m_reconnectTimer->stop();
    detachSource();
    m_previousSource.reset();
    clearBuffers();

    m_pipeline.lastCategory = Viseme::Silence;
    m_pipeline.lastIntensity = 0.0f;

    setState(finalState);
    dispatch(VisemeState::neutral(AudioSource::monotonicMs()));

    if (finalState == SessionState::Failed && !m_pipeline.fatalReported) {
        m_pipeline.fatalReported = true;
        const QString message = QString("audio source unavailable after %1 reconnect attempts")
                                    .arg(m_pipeline.reconnectAttempts);
        LS_LOG_ERROR("%s: %s", qPrintable(sessionErrorName(SessionError::ReconnectExhausted)),
                     qPrintable(message));
        emit errorOccurred(SessionError::ReconnectExhausted, message);
    }
}

} // namespace lipsync
