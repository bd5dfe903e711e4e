#ifndef TEMPLATERECORDER_H
#define TEMPLATERECORDER_H

#include <QJsonObject>
#include <QString>
#include <map>
#include <memory>
#include <vector>

#include "LipSyncTypes.hpp"
#include "TemplateBank.hpp"

namespace lipsync {

/**
 * 按说话人录制口型模板
 * 每个口型录若干帧特征，取平均（保留一位小数）得到该口型的模板
 */
class TemplateRecorder
{
public:
    TemplateRecorder();

    // 维度与该口型已有录音不一致或含非有限值时拒绝
    bool record(Viseme viseme, const FeatureVector &features);

    int recordingCount(Viseme viseme) const;
    int totalRecordings() const;
    void clear();
    void clear(Viseme viseme);

    std::map<Viseme, FeatureVector> averages() const;

    // { "A": [[...]], ... }，可直接被 TemplateBank::fromJson 读取
    QJsonObject toJson() const;
    bool saveToFile(const QString &filePath, QString *errorString = nullptr) const;

    std::shared_ptr<const TemplateBank> buildBank(QString *errorString = nullptr) const;

private:
    std::map<Viseme, std::vector<FeatureVector>> m_recordings;
};

} // namespace lipsync

#endif // TEMPLATERECORDER_H
