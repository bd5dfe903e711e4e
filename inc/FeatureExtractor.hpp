#ifndef FEATUREEXTRACTOR_HPP
#define FEATUREEXTRACTOR_HPP

#include <QString>
#include <vector>

#include "LipSyncTypes.hpp"

namespace lipsync {

/**
 * 外部倒谱（MFCC）特征提取器接口
 * initialize() 失败表示提取器不可用，会话会静默切换到共振峰回退模式。
 * extract() 可能在处理线程上抛出异常，会话会把它当作源故障处理。
 */
class FeatureExtractor
{
public:
    virtual ~FeatureExtractor() = default;

    virtual bool initialize(int sampleRate, int frameSize) = 0;
    virtual bool extract(const std::vector<float> &samples, int sampleRate, FeatureVector &features) = 0;
    virtual QString name() const = 0;
};

} // namespace lipsync

#endif // FEATUREEXTRACTOR_HPP
