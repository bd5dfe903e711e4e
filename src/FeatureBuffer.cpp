#include "FeatureBuffer.h"
#include "LogUtil.h"

#include <algorithm>
#include <cmath>

namespace lipsync {

FeatureBuffer::FeatureBuffer(int capacity)
    : m_capacity(std::max(1, capacity))
    , m_rejected(0)
{
}

bool FeatureBuffer::isWellFormed(const FeatureVector &features, int expectedDimension)
{
    if (features.empty()) {
        return false;
    }
    if (expectedDimension > 0 && static_cast<int>(features.size()) != expectedDimension) {
        return false;
    }
    return std::all_of(features.begin(), features.end(), [](float v) { return std::isfinite(v); });
}

bool FeatureBuffer::push(const FeatureFrame &frame)
{
    if (!isWellFormed(frame.coefficients)) {
        ++m_rejected;
        LS_LOG_DEBUG("Dropping malformed feature frame (size %d)",
                     static_cast<int>(frame.coefficients.size()));
        return false;
    }

    // 提取器换了维度：旧窗口作废，从新帧重新开始
    const int expected = dimension();
    if (expected > 0 && static_cast<int>(frame.coefficients.size()) != expected) {
        LS_LOG_WARN("Feature dimension changed %d -> %d, restarting window",
                    expected, static_cast<int>(frame.coefficients.size()));
        m_frames.clear();
    }

    m_frames.push_back(frame);
    while (static_cast<int>(m_frames.size()) > m_capacity) {
        m_frames.pop_front();
    }
    return true;
}

std::vector<FeatureFrame> FeatureBuffer::window() const
{
    return std::vector<FeatureFrame>(m_frames.begin(), m_frames.end());
}

int FeatureBuffer::dimension() const
{
    return m_frames.empty() ? 0 : static_cast<int>(m_frames.back().coefficients.size());
}

void FeatureBuffer::clear()
{
    m_frames.clear();
}

} // namespace lipsync
