#include "LocalCaptureSource.hpp"
#include "LogUtil.h"

#include <QDebug>

namespace lipsync {

LocalCaptureSource::LocalCaptureSource(int sampleRate, int frameSize, int deviceId, QObject *parent)
    : AudioSource(parent)
    , m_stream(nullptr)
    , m_paInitialized(false)
    , m_sampleRate(sampleRate)
    , m_frameSize(frameSize)
    , m_deviceId(deviceId)
    , m_capturing(false)
    , m_watchdogTimer(new QTimer(this))
{
    m_watchdogTimer->setInterval(WATCHDOG_INTERVAL);
    connect(m_watchdogTimer, &QTimer::timeout, this, &LocalCaptureSource::checkStreamHealth);
}

LocalCaptureSource::~LocalCaptureSource()
{
    stop();

    if (m_paInitialized) {
        Pa_Terminate();
        m_paInitialized = false;
    }
}

bool LocalCaptureSource::initializePortAudio()
{
    if (m_paInitialized) {
        return true;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        m_lastError = QString("Failed to initialize PortAudio: %1").arg(Pa_GetErrorText(err));
        qWarning() << m_lastError;
        return false;
    }
    m_paInitialized = true;

    int numDevices = Pa_GetDeviceCount();
    qDebug() << "Available audio devices:" << numDevices;
    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(i);
        if (deviceInfo && deviceInfo->maxInputChannels > 0) {
            qDebug() << "  [" << i << "]" << deviceInfo->name
                     << "- Input channels:" << deviceInfo->maxInputChannels;
        }
    }
    return true;
}

bool LocalCaptureSource::start()
{
    if (m_capturing) {
        return true;
    }

    if (!initializePortAudio()) {
        return false;
    }

    PaStreamParameters inputParameters;
    inputParameters.device = m_deviceId >= 0 ? m_deviceId : Pa_GetDefaultInputDevice();
    if (inputParameters.device == paNoDevice || inputParameters.device >= Pa_GetDeviceCount()) {
        m_lastError = "No audio input device available";
        qWarning() << m_lastError;
        return false;
    }

    const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(inputParameters.device);
    if (!deviceInfo || deviceInfo->maxInputChannels < 1) {
        m_lastError = QString("Device %1 has no input channels").arg(inputParameters.device);
        qWarning() << m_lastError;
        return false;
    }
    m_deviceName = QString::fromUtf8(deviceInfo->name);
    qDebug() << "Using input device:" << m_deviceName
             << "default rate:" << deviceInfo->defaultSampleRate;

    // 只采集单声道
    inputParameters.channelCount = 1;
    inputParameters.sampleFormat = paInt16;
    inputParameters.suggestedLatency = deviceInfo->defaultLowInputLatency;
    inputParameters.hostApiSpecificStreamInfo = NULL;

    PaError err = Pa_OpenStream(
        &m_stream,
        &inputParameters,
        NULL,  // 无输出
        m_sampleRate,
        m_frameSize,  // 每次回调的帧数
        paClipOff,
        &LocalCaptureSource::audioCallback,
        this
    );

    if (err != paNoError) {
        m_lastError = QString("Failed to open audio stream: %1 (code %2, device %3, rate %4)")
                          .arg(Pa_GetErrorText(err))
                          .arg(err)
                          .arg(m_deviceName)
                          .arg(m_sampleRate);
        qCritical() << m_lastError;
        m_stream = nullptr;
        return false;
    }

    m_capturing = true;
    err = Pa_StartStream(m_stream);
    if (err != paNoError) {
        m_capturing = false;
        m_lastError = QString("Failed to start audio stream: %1").arg(Pa_GetErrorText(err));
        qWarning() << m_lastError;
        Pa_CloseStream(m_stream);
        m_stream = nullptr;
        return false;
    }

    m_watchdogTimer->start();
    qDebug() << "Local capture started, stream active:" << Pa_IsStreamActive(m_stream);
    return true;
}

void LocalCaptureSource::stop()
{
    m_watchdogTimer->stop();
    if (!m_capturing && !m_stream) {
        return;
    }

    m_capturing = false;
    closeStream();
    qDebug() << "Local capture stopped";
}

void LocalCaptureSource::closeStream()
{
    if (!m_stream) {
        return;
    }

    // Pa_StopStream 会等待正在执行的回调返回
    PaError err = Pa_StopStream(m_stream);
    if (err != paNoError) {
        qWarning() << "Error stopping stream:" << Pa_GetErrorText(err);
    }

    err = Pa_CloseStream(m_stream);
    if (err != paNoError) {
        qWarning() << "Error closing stream:" << Pa_GetErrorText(err);
    }

    m_stream = nullptr;
}

bool LocalCaptureSource::isAvailable() const
{
    if (m_capturing && m_stream) {
        return Pa_IsStreamActive(m_stream) == 1;
    }
    // 未在采集时，只要设备还在就可以重新打开
    if (!m_paInitialized) {
        return false;
    }
    const PaDeviceIndex device = m_deviceId >= 0 ? m_deviceId : Pa_GetDefaultInputDevice();
    return device != paNoDevice && device < Pa_GetDeviceCount();
}

QString LocalCaptureSource::description() const
{
    return QString("local capture (%1, %2 Hz)")
        .arg(m_deviceName.isEmpty() ? QString("default device") : m_deviceName)
        .arg(m_sampleRate);
}

void LocalCaptureSource::checkStreamHealth()
{
    if (!m_capturing || !m_stream) {
        return;
    }

    PaError active = Pa_IsStreamActive(m_stream);
    if (active != 1) {
        QString reason = active < 0
            ? QString("capture stream error: %1").arg(Pa_GetErrorText(active))
            : QString("capture stream stopped");
        qWarning() << "LocalCaptureSource:" << reason;
        m_capturing = false;
        m_watchdogTimer->stop();
        closeStream();
        emit sourceLost(reason);
    }
}

// PortAudio回调函数 - 在音频线程中调用
int LocalCaptureSource::audioCallback(
    const void *inputBuffer,
    void *outputBuffer,
    unsigned long framesPerBuffer,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void *userData)
{
    Q_UNUSED(outputBuffer);
    Q_UNUSED(timeInfo);

    LocalCaptureSource* self = static_cast<LocalCaptureSource*>(userData);
    const int16_t* input = static_cast<const int16_t*>(inputBuffer);

    if (!input || !self) {
        return paContinue;
    }

    if (statusFlags & paInputOverflow) {
        LS_LOG_DEBUG("PortAudio: input overflow detected");
    }

    if (!self->m_capturing) {
        return paComplete;
    }

    self->processAudioData(input, framesPerBuffer);
    return paContinue;
}

void LocalCaptureSource::processAudioData(const int16_t* pcmData, unsigned long sampleCount)
{
    AudioBlock block;
    block.sampleRate = m_sampleRate;
    block.timestampMs = monotonicMs();
    block.samples.resize(sampleCount);
    for (unsigned long i = 0; i < sampleCount; ++i) {
        block.samples[i] = pcmData[i] / 32768.0f;
    }

    // 跨线程信号，接收方以 QueuedConnection 处理
    emit blockReady(block);
}

} // namespace lipsync
