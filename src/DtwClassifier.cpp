#include "DtwClassifier.hpp"
#include "LogUtil.h"

#include <cmath>

namespace lipsync {

DtwClassifier::DtwClassifier(std::shared_ptr<const TemplateBank> bank, const ClassifierParams &params)
    : m_bank(std::move(bank))
    , m_params(params)
    , m_notReadyLogged(false)
{
}

bool DtwClassifier::isReady() const
{
    return m_bank && !m_bank->isEmpty();
}

float DtwClassifier::frameDistance(const FeatureVector &a, const FeatureVector &b)
{
    const size_t len = std::min(a.size(), b.size());
    const FeatureVector lhs(a.begin(), a.begin() + len);
    const FeatureVector rhs(b.begin(), b.begin() + len);
    return dtwDistance(lhs, rhs, [](float x, float y) { return std::fabs(x - y); });
}

float DtwClassifier::sequenceDistance(const std::vector<FeatureVector> &a, const std::vector<FeatureVector> &b)
{
    return dtwDistance(a, b, [](const FeatureVector &x, const FeatureVector &y) {
        const size_t dims = std::min(x.size(), y.size());
        float sum = 0.0f;
        for (size_t d = 0; d < dims; ++d) {
            sum += std::fabs(x[d] - y[d]);
        }
        return sum;
    });
}

float DtwClassifier::confidence(float lowestDistance, float secondBestDistance, float epsilon)
{
    if (!(secondBestDistance > 0.0f)) {
        return 1.0f;
    }
    return std::min(1.0f, secondBestDistance / std::max(lowestDistance, epsilon));
}

template <typename DistanceFn>
ClassificationResult DtwClassifier::scanTemplates(qint64 timestampMs, DistanceFn distanceTo) const
{
    ClassificationResult result;
    result.timestampMs = timestampMs;

    if (!isReady()) {
        // ClassifierNotReady：静音总是安全的默认值
        if (!m_notReadyLogged) {
            LS_LOG_ERROR("Template bank is empty, classifier not ready; reporting silence");
            m_notReadyLogged = true;
        }
        result.category = Viseme::Silence;
        result.distance = 0.0f;
        result.secondBestDistance = std::numeric_limits<float>::infinity();
        result.confidence = 0.0f;
        return result;
    }

    const float inf = std::numeric_limits<float>::infinity();
    float lowest = inf;
    float secondBest = inf;
    Viseme bestMatch = Viseme::Silence;

    // 全局最优和全局次优跨所有模板统计，不区分类别
    for (const auto &entry : m_bank->templates()) {
        for (const PhonemeTemplate &sequence : entry.second) {
            const float distance = distanceTo(sequence);
            if (distance < lowest) {
                secondBest = lowest;
                lowest = distance;
                bestMatch = entry.first;
            } else if (distance < secondBest) {
                secondBest = distance;
            }
        }
    }

    result.category = bestMatch;
    result.distance = lowest;
    result.secondBestDistance = secondBest;
    result.confidence = confidence(lowest, secondBest, m_params.confidenceEpsilon);
    return result;
}

ClassificationResult DtwClassifier::classify(const FeatureFrame &frame) const
{
    return scanTemplates(frame.timestampMs, [&frame](const PhonemeTemplate &sequence) {
        // 多帧模板在单帧比较时取距离最近的那一帧
        float best = std::numeric_limits<float>::infinity();
        for (const FeatureVector &templateFrame : sequence) {
            best = std::min(best, frameDistance(frame.coefficients, templateFrame));
        }
        return best;
    });
}

ClassificationResult DtwClassifier::classifySequence(const std::vector<FeatureFrame> &frames) const
{
    if (frames.size() == 1) {
        return classify(frames.front());
    }

    std::vector<FeatureVector> live;
    live.reserve(frames.size());
    for (const FeatureFrame &frame : frames) {
        live.push_back(frame.coefficients);
    }
    const qint64 timestampMs = frames.empty() ? 0 : frames.back().timestampMs;

    return scanTemplates(timestampMs, [&live](const PhonemeTemplate &sequence) {
        return sequenceDistance(live, sequence);
    });
}

float DtwClassifier::baseThreshold() const
{
    return (1.0f - m_params.sensitivity) * m_params.thresholdScale;
}

float DtwClassifier::dynamicThreshold(float confidence) const
{
    // 置信度低时阈值变宽，高时收窄
    return baseThreshold() * (2.0f - confidence);
}

bool DtwClassifier::accepts(const ClassificationResult &result) const
{
    return result.distance < dynamicThreshold(result.confidence);
}

bool DtwClassifier::shouldForward(const PipelineState &state, Viseme category, float intensity) const
{
    if (category != state.lastCategory) {
        return true;
    }
    return std::fabs(intensity - state.lastIntensity) > m_params.updateDelta;
}

} // namespace lipsync
