#include "IntensityShaper.hpp"

#include <algorithm>
#include <cmath>

namespace lipsync {

float clamp01(float value)
{
    if (!std::isfinite(value)) {
        return 0.0f;
    }
    return std::max(0.0f, std::min(1.0f, value));
}

IntensityShaper::IntensityShaper(const ShaperParams &params)
    : m_params(params)
{
}

float IntensityShaper::detectionIntensity(const ClassificationResult &result) const
{
    if (!(m_params.maxDistance > 0.0f)) {
        return 0.0f;
    }

    float intensity = clamp01(1.0f - result.distance / m_params.maxDistance);
    intensity *= clamp01(result.confidence) * m_params.confidenceGain;
    intensity *= (m_params.sensitivity + m_params.sensitivityBias);
    intensity *= m_params.intensityMultiplier;

    intensity = std::max(intensity, m_params.minIntensity);
    return std::min(intensity, 1.0f);
}

bool IntensityShaper::isBelowFloor(float intensity) const
{
    return !std::isfinite(intensity) || intensity < m_params.silenceFloor;
}

VisemeState IntensityShaper::shape(Viseme category, float intensity, qint64 timestampMs) const
{
    VisemeState state = VisemeState::neutral(timestampMs);
    if (category == Viseme::Silence || isBelowFloor(intensity)) {
        return state;
    }

    const int index = static_cast<int>(category);

    float boosted = intensity * m_params.boosts[index] * m_params.expressionGain;
    boosted = std::pow(std::max(boosted, 0.0f), m_params.exponent);
    boosted = std::min(boosted, 1.0f);

    // 检测到的口型不能小到看不出来
    const float finalIntensity = clamp01(std::max(boosted, m_params.floors[index]));

    state.setValue(category, finalIntensity);
    state.setValue(adjacentViseme(category), finalIntensity * m_params.blendRatio);
    return state;
}

Viseme IntensityShaper::adjacentViseme(Viseme viseme)
{
    switch (viseme) {
    case Viseme::A: return Viseme::O;
    case Viseme::I: return Viseme::E;
    case Viseme::U: return Viseme::O;
    case Viseme::E: return Viseme::I;
    case Viseme::O: return Viseme::A;
    case Viseme::Silence: return Viseme::Silence;
    }
    return Viseme::Silence;
}

} // namespace lipsync
