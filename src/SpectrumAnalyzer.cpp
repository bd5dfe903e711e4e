#include "SpectrumAnalyzer.h"
#include "LogUtil.h"

#include <QMutex>
#include <QMutexLocker>
#include <algorithm>
#include <cmath>

namespace lipsync {

namespace {
const double kPi = 3.14159265358979323846;
const float kMinDb = -200.0f;

// FFTW 的 planner 不是线程安全的，只有 fftwf_execute 可以并发
QMutex s_plannerMutex;
}

SpectrumAnalyzer::SpectrumAnalyzer(int fftSize, float smoothing)
    : m_fftSize(std::max(32, fftSize))
    , m_smoothing(0.0f)
    , m_writePos(0)
    , m_plan(nullptr)
    , m_fftInput(nullptr)
    , m_fftOutput(nullptr)
{
    setSmoothing(smoothing);

    m_window.resize(m_fftSize);
    const double alpha = 0.16;
    const double a0 = (1.0 - alpha) / 2.0;
    const double a1 = 0.5;
    const double a2 = alpha / 2.0;
    for (int n = 0; n < m_fftSize; ++n) {
        const double x = static_cast<double>(n) / m_fftSize;
        m_window[n] = static_cast<float>(a0 - a1 * std::cos(2.0 * kPi * x) + a2 * std::cos(4.0 * kPi * x));
    }

    m_history.assign(m_fftSize, 0.0f);
    m_smoothed.assign(binCount(), 0.0f);

    m_fftInput = static_cast<float*>(fftwf_malloc(sizeof(float) * m_fftSize));
    m_fftOutput = static_cast<fftwf_complex*>(fftwf_malloc(sizeof(fftwf_complex) * (m_fftSize / 2 + 1)));
    if (!m_fftInput || !m_fftOutput) {
        LS_LOG_ERROR("SpectrumAnalyzer: failed to allocate FFT buffers (size %d)", m_fftSize);
        return;
    }

    QMutexLocker locker(&s_plannerMutex);
    m_plan = fftwf_plan_dft_r2c_1d(m_fftSize, m_fftInput, m_fftOutput, FFTW_ESTIMATE);
    if (!m_plan) {
        LS_LOG_ERROR("SpectrumAnalyzer: failed to create FFTW plan (size %d)", m_fftSize);
    }
}

SpectrumAnalyzer::~SpectrumAnalyzer()
{
    if (m_plan) {
        QMutexLocker locker(&s_plannerMutex);
        fftwf_destroy_plan(m_plan);
        m_plan = nullptr;
    }
    if (m_fftInput) {
        fftwf_free(m_fftInput);
        m_fftInput = nullptr;
    }
    if (m_fftOutput) {
        fftwf_free(m_fftOutput);
        m_fftOutput = nullptr;
    }
}

void SpectrumAnalyzer::setSmoothing(float smoothing)
{
    if (!std::isfinite(smoothing)) {
        smoothing = 0.0f;
    }
    m_smoothing = std::max(0.0f, std::min(1.0f, smoothing));
}

void SpectrumAnalyzer::pushSamples(const std::vector<float> &samples)
{
    for (float s : samples) {
        m_history[m_writePos] = std::isfinite(s) ? s : 0.0f;
        m_writePos = (m_writePos + 1) % m_fftSize;
    }
}

SpectrumFrame SpectrumAnalyzer::analyze(int sampleRate, qint64 timestampMs)
{
    SpectrumFrame frame;
    frame.sampleRate = sampleRate;
    frame.fftSize = m_fftSize;
    frame.timestampMs = timestampMs;

    if (!isValid()) {
        return frame;
    }

    // 从最旧的样本开始展开环形缓冲
    for (int n = 0; n < m_fftSize; ++n) {
        m_fftInput[n] = m_history[(m_writePos + n) % m_fftSize] * m_window[n];
    }

    fftwf_execute(m_plan);

    const int bins = binCount();
    frame.magnitudesDb.resize(bins);
    const float scale = 1.0f / static_cast<float>(m_fftSize);
    for (int k = 0; k < bins; ++k) {
        const float re = m_fftOutput[k][0];
        const float im = m_fftOutput[k][1];
        const float magnitude = std::sqrt(re * re + im * im) * scale;

        m_smoothed[k] = m_smoothing * m_smoothed[k] + (1.0f - m_smoothing) * magnitude;
        frame.magnitudesDb[k] = m_smoothed[k] > 0.0f
            ? std::max(kMinDb, 20.0f * std::log10(m_smoothed[k]))
            : kMinDb;
    }
    return frame;
}

void SpectrumAnalyzer::reset()
{
    std::fill(m_history.begin(), m_history.end(), 0.0f);
    std::fill(m_smoothed.begin(), m_smoothed.end(), 0.0f);
    m_writePos = 0;
}

} // namespace lipsync
