#include "TemplateBank.hpp"
#include "LogUtil.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <cmath>

namespace lipsync {

namespace {

void setError(QString *errorString, const QString &message)
{
    if (errorString) {
        *errorString = message;
    }
}

bool parseFrame(const QJsonArray &array, FeatureVector *frame)
{
    frame->clear();
    frame->reserve(array.size());
    for (const QJsonValue &value : array) {
        if (!value.isDouble()) {
            return false;
        }
        frame->push_back(static_cast<float>(value.toDouble()));
    }
    return true;
}

QJsonArray frameToJson(const FeatureVector &frame)
{
    QJsonArray array;
    for (float v : frame) {
        array.append(static_cast<double>(v));
    }
    return array;
}

} // namespace

TemplateBank::TemplateBank(TemplateMap templates)
    : m_templates(std::move(templates))
{
}

bool TemplateBank::validate(const TemplateMap &templates, QString *errorString)
{
    for (const auto &entry : templates) {
        const QString name = visemeName(entry.first);
        if (entry.second.empty()) {
            setError(errorString, QString("category %1 has no templates").arg(name));
            return false;
        }
        for (size_t t = 0; t < entry.second.size(); ++t) {
            const PhonemeTemplate &sequence = entry.second[t];
            if (sequence.empty()) {
                setError(errorString, QString("template %1 of %2 is an empty sequence").arg(t).arg(name));
                return false;
            }
            for (const FeatureVector &frame : sequence) {
                if (frame.empty()) {
                    setError(errorString, QString("template %1 of %2 contains an empty frame").arg(t).arg(name));
                    return false;
                }
                for (float v : frame) {
                    if (!std::isfinite(v)) {
                        setError(errorString, QString("template %1 of %2 contains a non-finite value").arg(t).arg(name));
                        return false;
                    }
                }
            }
        }
    }
    return true;
}

std::shared_ptr<const TemplateBank> TemplateBank::load(const TemplateMap &templates, QString *errorString)
{
    QString error;
    if (!validate(templates, &error)) {
        LS_LOG_ERROR("Invalid template bank: %s", qPrintable(error));
        setError(errorString, error);
        return nullptr;
    }
    return std::shared_ptr<const TemplateBank>(new TemplateBank(templates));
}

std::shared_ptr<const TemplateBank> TemplateBank::defaultBank()
{
    // 实录平均得到的 MFCC 模板，数值属于标定数据，可按说话人重新录制
    static const std::shared_ptr<const TemplateBank> bank = load({
        {Viseme::E, {{{34.8f, 20.6f, 6.7f, 9.2f, 8.3f, 1.9f, -4.2f, -5.0f, -2.6f, -2.7f, -3.2f, -2.6f, -0.9f}}}},
        {Viseme::A, {{{15.8f, 9.7f, 2.5f, 1.1f, 0.0f, -1.5f, -3.1f, -2.8f, -0.7f, -0.3f, -1.3f, -1.4f, -0.6f}}}},
        {Viseme::U, {{{24.7f, 15.8f, 7.8f, 6.3f, 0.6f, -1.8f, -2.1f, -2.7f, -1.3f, -1.9f, -2.6f, -2.1f, -1.6f}}}},
        {Viseme::O, {{{25.9f, 21.3f, 12.0f, 3.6f, -1.8f, -4.1f, -4.0f, -2.8f, -1.6f, -1.5f, -1.7f, -1.6f, -1.2f}}}},
        {Viseme::I, {{{26.1f, 17.5f, 7.1f, 5.2f, 3.1f, 0.1f, -3.0f, -5.2f, -3.7f, -2.0f, -2.6f, -2.4f, -0.8f}}}},
        {Viseme::Silence, {
            {{0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f, 0.0f}},
            {{0.1f, 0.1f, 0.1f, 0.1f, 0.1f, 0.1f, 0.1f, 0.1f, 0.1f, 0.1f, 0.1f, 0.1f, 0.1f}}  // 极轻的底噪
        }},
    });
    return bank;
}

std::shared_ptr<const TemplateBank> TemplateBank::fromJson(const QJsonObject &json, QString *errorString)
{
    TemplateMap templates;

    for (auto it = json.begin(); it != json.end(); ++it) {
        Viseme viseme;
        if (!visemeFromName(it.key(), &viseme)) {
            setError(errorString, QString("unknown viseme category: %1").arg(it.key()));
            return nullptr;
        }
        if (!it.value().isArray()) {
            setError(errorString, QString("templates for %1 must be an array").arg(it.key()));
            return nullptr;
        }

        const QJsonArray outer = it.value().toArray();
        std::vector<PhonemeTemplate> &variants = templates[viseme];

        // 单帧写法：[c0, c1, ...]
        if (!outer.isEmpty() && outer.first().isDouble()) {
            FeatureVector frame;
            if (!parseFrame(outer, &frame)) {
                setError(errorString, QString("malformed frame for %1").arg(it.key()));
                return nullptr;
            }
            variants.push_back({frame});
            continue;
        }

        // 多变体写法：[[...], [...]]，每个变体也可以是帧序列 [[[...], [...]]]
        for (const QJsonValue &variantValue : outer) {
            if (!variantValue.isArray()) {
                setError(errorString, QString("malformed template for %1").arg(it.key()));
                return nullptr;
            }
            const QJsonArray variant = variantValue.toArray();
            PhonemeTemplate sequence;
            if (!variant.isEmpty() && variant.first().isArray()) {
                for (const QJsonValue &frameValue : variant) {
                    FeatureVector frame;
                    if (!frameValue.isArray() || !parseFrame(frameValue.toArray(), &frame)) {
                        setError(errorString, QString("malformed frame for %1").arg(it.key()));
                        return nullptr;
                    }
                    sequence.push_back(frame);
                }
            } else {
                FeatureVector frame;
                if (!parseFrame(variant, &frame)) {
                    setError(errorString, QString("malformed frame for %1").arg(it.key()));
                    return nullptr;
                }
                if (!frame.empty()) {
                    sequence.push_back(frame);
                }
            }
            variants.push_back(sequence);
        }
    }

    return load(templates, errorString);
}

std::shared_ptr<const TemplateBank> TemplateBank::loadFromFile(const QString &filePath, QString *errorString)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        setError(errorString, QString("cannot open template file %1: %2").arg(filePath, file.errorString()));
        return nullptr;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(errorString, QString("failed to parse template file: %1").arg(parseError.errorString()));
        return nullptr;
    }
    if (!doc.isObject()) {
        setError(errorString, "template file must contain a JSON object");
        return nullptr;
    }

    std::shared_ptr<const TemplateBank> bank = fromJson(doc.object(), errorString);
    if (bank) {
        qDebug() << "Loaded" << bank->templateCount() << "templates from" << filePath;
    }
    return bank;
}

QJsonObject TemplateBank::toJson() const
{
    QJsonObject json;
    for (const auto &entry : m_templates) {
        QJsonArray variants;
        for (const PhonemeTemplate &sequence : entry.second) {
            if (sequence.size() == 1) {
                variants.append(frameToJson(sequence.front()));
            } else {
                QJsonArray frames;
                for (const FeatureVector &frame : sequence) {
                    frames.append(frameToJson(frame));
                }
                variants.append(frames);
            }
        }
        json[visemeName(entry.first)] = variants;
    }
    return json;
}

std::vector<Viseme> TemplateBank::categories() const
{
    std::vector<Viseme> result;
    for (const auto &entry : m_templates) {
        result.push_back(entry.first);
    }
    return result;
}

int TemplateBank::templateCount() const
{
    int count = 0;
    for (const auto &entry : m_templates) {
        count += static_cast<int>(entry.second.size());
    }
    return count;
}

} // namespace lipsync
