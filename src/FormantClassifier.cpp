#include "FormantClassifier.hpp"
#include "LogUtil.h"

#include <algorithm>
#include <cmath>

namespace lipsync {

namespace {

struct FormantBox {
    Viseme viseme;
    float f1Min, f1Max, f1Center, f1Span;
    float f2Min, f2Max, f2Center, f2Span;
};

// 日语元音的共振峰范围（Hz），经验值
const FormantBox kFormantBoxes[] = {
    {Viseme::A, 450.0f, 850.0f, 650.0f, 400.0f,  900.0f, 1800.0f, 1350.0f, 900.0f},
    {Viseme::I, 250.0f, 500.0f, 375.0f, 250.0f, 1700.0f, 2400.0f, 2050.0f, 700.0f},
    {Viseme::U, 250.0f, 500.0f, 375.0f, 250.0f,  600.0f, 1200.0f,  900.0f, 600.0f},
    {Viseme::E, 350.0f, 700.0f, 525.0f, 350.0f, 1500.0f, 2200.0f, 1850.0f, 700.0f},
    {Viseme::O, 350.0f, 700.0f, 525.0f, 350.0f,  700.0f, 1500.0f, 1100.0f, 800.0f},
};

struct Peak {
    float frequency;
    float magnitude;
};

} // namespace

FormantClassifier::FormantClassifier(const FormantParams &params)
    : m_params(params)
{
}

float FormantClassifier::score(Viseme viseme, float f1, float f2)
{
    for (const FormantBox &box : kFormantBoxes) {
        if (box.viseme != viseme) {
            continue;
        }
        if (f1 > box.f1Min && f1 < box.f1Max && f2 > box.f2Min && f2 < box.f2Max) {
            const float f1Score = 1.0f - std::fabs(f1 - box.f1Center) / box.f1Span;
            const float f2Score = 1.0f - std::fabs(f2 - box.f2Center) / box.f2Span;
            return std::max(0.0f, std::min(1.0f, (f1Score + f2Score) / 2.0f));
        }
        return 0.0f;
    }
    return 0.0f;
}

std::vector<float> FormantClassifier::findFormantPeaks(const SpectrumFrame &spectrum) const
{
    const std::vector<float> &data = spectrum.magnitudesDb;
    std::vector<Peak> peaks;

    for (size_t i = 2; i + 2 < data.size(); ++i) {
        const float v = data[i];
        if (v > data[i - 1] && v > data[i + 1] && v > data[i - 2] && v > data[i + 2]
            && v > m_params.peakFloorDb) {
            const float freq = spectrum.binFrequency(static_cast<int>(i));
            if (freq > m_params.minFrequency && freq < m_params.maxFrequency) {
                const float prominence = std::min(v - data[i - 1], v - data[i + 1]);
                peaks.push_back({freq, v + prominence});
            }
        }
    }

    // 先按强度取最强的几个，再按频率升序
    std::stable_sort(peaks.begin(), peaks.end(), [](const Peak &a, const Peak &b) {
        return a.magnitude > b.magnitude;
    });
    if (static_cast<int>(peaks.size()) > m_params.maxPeaks) {
        peaks.resize(m_params.maxPeaks);
    }

    std::vector<float> frequencies;
    frequencies.reserve(peaks.size());
    for (const Peak &peak : peaks) {
        frequencies.push_back(peak.frequency);
    }
    std::sort(frequencies.begin(), frequencies.end());
    return frequencies;
}

float FormantClassifier::spectralEnergy(const SpectrumFrame &spectrum) const
{
    double sum = 0.0;
    int count = 0;
    double bandSum = 0.0;
    int bandCount = 0;

    for (size_t i = 0; i < spectrum.magnitudesDb.size(); ++i) {
        const float db = spectrum.magnitudesDb[i];
        if (!std::isfinite(db) || db <= m_params.noiseFloorDb) {
            continue;
        }
        const double linear = std::pow(10.0, db / 12.0);
        sum += linear;
        ++count;

        const float freq = spectrum.binFrequency(static_cast<int>(i));
        if (freq > m_params.bandLow && freq < m_params.bandHigh && db > m_params.bandFloorDb) {
            bandSum += linear;
            ++bandCount;
        }
    }

    const double base = count > 0 ? std::sqrt(sum / count) : 0.0;
    const double band = bandCount > 0 ? std::sqrt(bandSum / bandCount) : 0.0;
    const double combined = base * 0.3 + band * 0.7;
    return static_cast<float>(std::min(combined * 3.0, 1.0));
}

FormantResult FormantClassifier::classify(const SpectrumFrame &spectrum) const
{
    FormantResult result;
    result.timestampMs = spectrum.timestampMs;

    const std::vector<float> peaks = findFormantPeaks(spectrum);
    const float energy = spectralEnergy(spectrum);

    if (peaks.size() < 2 || energy < m_params.silenceEnergy) {
        return result;
    }

    result.f1 = peaks[0];
    result.f2 = peaks[1];

    float intensity = energy * (m_params.sensitivity + 0.3f);
    intensity *= m_params.intensityMultiplier;
    intensity = std::max(intensity, m_params.minIntensity);
    intensity = std::min(intensity, 1.0f);

    float maxConfidence = 0.0f;
    for (const FormantBox &box : kFormantBoxes) {
        const float confidence = score(box.viseme, result.f1, result.f2);
        if (confidence > maxConfidence && confidence > m_params.minConfidence) {
            maxConfidence = confidence;
            result.category = box.viseme;
        }
    }

    result.confidence = maxConfidence;
    result.intensity = std::min(intensity * (1.0f + maxConfidence * 0.5f), 1.0f);

    LS_LOG_DEBUG("Formants F1=%.0f F2=%.0f -> %s (conf %.2f, energy %.3f)",
                 result.f1, result.f2, qPrintable(visemeName(result.category)),
                 result.confidence, energy);
    return result;
}

} // namespace lipsync
