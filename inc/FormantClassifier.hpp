#ifndef FORMANTCLASSIFIER_HPP
#define FORMANTCLASSIFIER_HPP

#include <vector>

#include "LipSyncTypes.hpp"

namespace lipsync {

struct FormantParams {
    float peakFloorDb = -50.0f;
    float minFrequency = 80.0f;
    float maxFrequency = 4000.0f;
    int maxPeaks = 6;
    float minConfidence = 0.3f;

    // 能量估计
    float noiseFloorDb = -80.0f;
    float bandFloorDb = -50.0f;
    float bandLow = 200.0f;
    float bandHigh = 3000.0f;
    float silenceEnergy = 0.01f;

    // 与 ShaperParams 共用的用户参数
    float sensitivity = 0.2f;
    float intensityMultiplier = 6.0f;
    float minIntensity = 0.1f;
};

struct FormantResult {
    Viseme category = Viseme::Silence;
    float confidence = 0.0f;
    float intensity = 0.0f;
    float f1 = 0.0f;
    float f2 = 0.0f;
    qint64 timestampMs = 0;
};

/**
 * 共振峰回退分类器
 * 倒谱特征提取器不可用时，直接在功率谱上找 F1/F2 判断元音
 */
class FormantClassifier
{
public:
    explicit FormantClassifier(const FormantParams &params = FormantParams());

    FormantResult classify(const SpectrumFrame &spectrum) const;

    // 返回按频率升序排列的峰值频率（最多 maxPeaks 个最强峰）
    std::vector<float> findFormantPeaks(const SpectrumFrame &spectrum) const;
    float spectralEnergy(const SpectrumFrame &spectrum) const;

    // (F1, F2) 落在类别框内时按到中心的距离打分，框外为 0
    static float score(Viseme viseme, float f1, float f2);

    const FormantParams &params() const { return m_params; }
    void setParams(const FormantParams &params) { m_params = params; }

private:
    FormantParams m_params;
};

} // namespace lipsync

#endif // FORMANTCLASSIFIER_HPP
