#include "TemplateRecorder.h"
#include "FeatureBuffer.h"
#include "LogUtil.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <cmath>

namespace lipsync {

TemplateRecorder::TemplateRecorder()
{
}

bool TemplateRecorder::record(Viseme viseme, const FeatureVector &features)
{
    std::vector<FeatureVector> &frames = m_recordings[viseme];
    const int expected = frames.empty() ? 0 : static_cast<int>(frames.front().size());
    if (!FeatureBuffer::isWellFormed(features, expected)) {
        LS_LOG_WARN("Rejected recording for %s (size %d, expected %d)",
                    qPrintable(visemeName(viseme)), static_cast<int>(features.size()), expected);
        if (frames.empty()) {
            m_recordings.erase(viseme);
        }
        return false;
    }

    frames.push_back(features);
    return true;
}

int TemplateRecorder::recordingCount(Viseme viseme) const
{
    auto it = m_recordings.find(viseme);
    return it == m_recordings.end() ? 0 : static_cast<int>(it->second.size());
}

int TemplateRecorder::totalRecordings() const
{
    int total = 0;
    for (const auto &entry : m_recordings) {
        total += static_cast<int>(entry.second.size());
    }
    return total;
}

void TemplateRecorder::clear()
{
    m_recordings.clear();
}

void TemplateRecorder::clear(Viseme viseme)
{
    m_recordings.erase(viseme);
}

std::map<Viseme, FeatureVector> TemplateRecorder::averages() const
{
    std::map<Viseme, FeatureVector> result;
    for (const auto &entry : m_recordings) {
        const std::vector<FeatureVector> &frames = entry.second;
        if (frames.empty()) {
            continue;
        }

        std::vector<double> sum(frames.front().size(), 0.0);
        for (const FeatureVector &frame : frames) {
            for (size_t i = 0; i < sum.size(); ++i) {
                sum[i] += frame[i];
            }
        }

        FeatureVector average(sum.size());
        for (size_t i = 0; i < sum.size(); ++i) {
            const double mean = sum[i] / static_cast<double>(frames.size());
            average[i] = static_cast<float>(std::round(mean * 10.0) / 10.0);
        }
        result[entry.first] = average;
    }
    return result;
}

QJsonObject TemplateRecorder::toJson() const
{
    QJsonObject json;
    for (const auto &entry : averages()) {
        QJsonArray frame;
        for (float v : entry.second) {
            frame.append(static_cast<double>(v));
        }
        QJsonArray variants;
        variants.append(frame);
        json[visemeName(entry.first)] = variants;
    }
    return json;
}

bool TemplateRecorder::saveToFile(const QString &filePath, QString *errorString) const
{
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Truncate)) {
        if (errorString) {
            *errorString = file.errorString();
        }
        return false;
    }

    if (file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented)) < 0) {
        if (errorString) {
            *errorString = file.errorString();
        }
        return false;
    }
    LS_LOG_INFO("Saved %d recorded templates to %s",
                static_cast<int>(m_recordings.size()), qPrintable(filePath));
    return true;
}

std::shared_ptr<const TemplateBank> TemplateRecorder::buildBank(QString *errorString) const
{
    TemplateMap templates;
    for (const auto &entry : averages()) {
        templates[entry.first].push_back(PhonemeTemplate{entry.second});
    }
    return TemplateBank::load(templates, errorString);
}

} // namespace lipsync
