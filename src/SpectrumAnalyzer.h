#ifndef SPECTRUMANALYZER_H
#define SPECTRUMANALYZER_H

#include <fftw3.h>

#include <vector>

#include "LipSyncTypes.hpp"

namespace lipsync {

/**
 * 回退模式下的频谱分析（基于 FFTW）
 * 1. 保留最近 fftSize 个样本
 * 2. Blackman 窗
 * 3. 实数 FFT，幅度除以 fftSize
 * 4. 时间平滑 τ*prev + (1-τ)*cur
 * 5. 转 dB
 */
class SpectrumAnalyzer
{
public:
    explicit SpectrumAnalyzer(int fftSize = 2048, float smoothing = 0.6f);
    ~SpectrumAnalyzer();

    SpectrumAnalyzer(const SpectrumAnalyzer&) = delete;
    SpectrumAnalyzer& operator=(const SpectrumAnalyzer&) = delete;

    bool isValid() const { return m_plan != nullptr; }

    void pushSamples(const std::vector<float> &samples);
    SpectrumFrame analyze(int sampleRate, qint64 timestampMs);

    void reset();

    int fftSize() const { return m_fftSize; }
    int binCount() const { return m_fftSize / 2; }
    float smoothing() const { return m_smoothing; }
    void setSmoothing(float smoothing);

private:
    int m_fftSize;
    float m_smoothing;

    std::vector<float> m_window;       // Blackman 系数
    std::vector<float> m_history;      // 环形缓冲
    int m_writePos;
    std::vector<float> m_smoothed;

    // FFTW 资源
    fftwf_plan m_plan;
    float *m_fftInput;
    fftwf_complex *m_fftOutput;
};

} // namespace lipsync

#endif // SPECTRUMANALYZER_H
