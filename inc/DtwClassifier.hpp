#ifndef DTWCLASSIFIER_HPP
#define DTWCLASSIFIER_HPP

#include <algorithm>
#include <limits>
#include <memory>
#include <vector>

#include "LipSyncTypes.hpp"
#include "TemplateBank.hpp"

namespace lipsync {

/**
 * 动态时间规整距离
 * D[0][0] = 0，其余边界为 ∞，
 * D[i][j] = cost(a[i-1], b[j-1]) + min(D[i-1][j], D[i][j-1], D[i-1][j-1])
 * cost 对称时结果也对称。任一序列为空返回 ∞。
 */
template <typename T, typename CostFn>
float dtwDistance(const std::vector<T> &seq1, const std::vector<T> &seq2, CostFn cost)
{
    const float inf = std::numeric_limits<float>::infinity();
    const size_t n = seq1.size();
    const size_t m = seq2.size();
    if (n == 0 || m == 0) {
        return inf;
    }

    // 只保留两行，避免每帧分配 (n+1)*(m+1) 的表
    std::vector<float> previous(m + 1, inf);
    std::vector<float> current(m + 1, inf);
    previous[0] = 0.0f;

    for (size_t i = 1; i <= n; ++i) {
        current[0] = inf;
        for (size_t j = 1; j <= m; ++j) {
            const float best = std::min({previous[j], current[j - 1], previous[j - 1]});
            current[j] = cost(seq1[i - 1], seq2[j - 1]) + best;
        }
        std::swap(previous, current);
    }
    return previous[m];
}

// 阈值/置信度相关常数为经验标定值，可重新调参
struct ClassifierParams {
    float sensitivity = 0.2f;         // [0,1]
    float thresholdScale = 60.0f;     // baseThreshold = (1 - sensitivity) * thresholdScale
    float confidenceEpsilon = 0.1f;
    float updateDelta = 0.1f;         // 同类别强度变化小于此值不再推送
};

class DtwClassifier
{
public:
    explicit DtwClassifier(std::shared_ptr<const TemplateBank> bank,
                           const ClassifierParams &params = ClassifierParams());

    bool isReady() const;

    // 单帧：把系数向量当作标量序列比较（截断到较短长度）
    ClassificationResult classify(const FeatureFrame &frame) const;
    // 多帧：逐帧 L1 代价的 DTW
    ClassificationResult classifySequence(const std::vector<FeatureFrame> &frames) const;

    float baseThreshold() const;
    float dynamicThreshold(float confidence) const;
    bool accepts(const ClassificationResult &result) const;

    // 类别变化或强度变化超过 updateDelta 才转发
    bool shouldForward(const PipelineState &state, Viseme category, float intensity) const;

    const ClassifierParams &params() const { return m_params; }
    void setParams(const ClassifierParams &params) { m_params = params; }
    std::shared_ptr<const TemplateBank> bank() const { return m_bank; }

    static float frameDistance(const FeatureVector &a, const FeatureVector &b);
    static float sequenceDistance(const std::vector<FeatureVector> &a, const std::vector<FeatureVector> &b);
    static float confidence(float lowestDistance, float secondBestDistance, float epsilon);

private:
    template <typename DistanceFn>
    ClassificationResult scanTemplates(qint64 timestampMs, DistanceFn distanceTo) const;

    std::shared_ptr<const TemplateBank> m_bank;
    ClassifierParams m_params;
    mutable bool m_notReadyLogged;
};

} // namespace lipsync

#endif // DTWCLASSIFIER_HPP
