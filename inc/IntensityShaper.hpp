#ifndef INTENSITYSHAPER_HPP
#define INTENSITYSHAPER_HPP

#include <array>

#include "LipSyncTypes.hpp"

namespace lipsync {

struct ShaperParams {
    float sensitivity = 0.2f;          // [0,1]
    float intensityMultiplier = 6.0f;  // [1,8]
    float minIntensity = 0.1f;         // [0,1]

    float maxDistance = 60.0f;         // D_max
    float confidenceGain = 1.2f;
    float sensitivityBias = 0.7f;
    float expressionGain = 1.8f;
    float exponent = 0.7f;
    float blendRatio = 0.15f;
    float silenceFloor = 0.05f;

    // 张口幅度大的元音增益更高，顺序 A I U E O
    std::array<float, kVowelCount> boosts = {{2.2f, 1.8f, 2.0f, 1.7f, 1.9f}};
    std::array<float, kVowelCount> floors = {{0.25f, 0.15f, 0.20f, 0.15f, 0.18f}};
};

/**
 * 把分类结果映射成 [0,1] 的口型强度
 * 无隐藏状态，相同输入得到相同输出
 */
class IntensityShaper
{
public:
    explicit IntensityShaper(const ShaperParams &params = ShaperParams());

    // 步骤 1-2：距离 -> 基础强度，乘置信度/灵敏度/倍率，并抬到 minIntensity
    float detectionIntensity(const ClassificationResult &result) const;

    // 步骤 3-7：类别增益、0.7 次幂压缩、最小动作幅度、邻近口型混合、夹取
    VisemeState shape(Viseme category, float intensity, qint64 timestampMs = 0) const;

    bool isBelowFloor(float intensity) const;

    const ShaperParams &params() const { return m_params; }
    void setParams(const ShaperParams &params) { m_params = params; }

    static Viseme adjacentViseme(Viseme viseme);

private:
    ShaperParams m_params;
};

float clamp01(float value);

} // namespace lipsync

#endif // INTENSITYSHAPER_HPP
