#ifndef FEATUREBUFFER_H
#define FEATUREBUFFER_H

#include <deque>
#include <vector>

#include "LipSyncTypes.hpp"

namespace lipsync {

// 最近 N 帧倒谱特征的滑动窗口
class FeatureBuffer
{
public:
    explicit FeatureBuffer(int capacity = 1);

    // 空帧或含非有限值的帧被丢弃；维度变化时清空窗口后接收新帧
    bool push(const FeatureFrame &frame);

    std::vector<FeatureFrame> window() const;
    bool isFull() const { return static_cast<int>(m_frames.size()) >= m_capacity; }
    int size() const { return static_cast<int>(m_frames.size()); }
    int capacity() const { return m_capacity; }
    int dimension() const;
    int rejectedCount() const { return m_rejected; }

    void clear();

    static bool isWellFormed(const FeatureVector &features, int expectedDimension = 0);

private:
    int m_capacity;
    int m_rejected;
    std::deque<FeatureFrame> m_frames;
};

} // namespace lipsync

#endif // FEATUREBUFFER_H
