#ifndef TEMPLATEBANK_HPP
#define TEMPLATEBANK_HPP

#include <QJsonObject>
#include <QString>
#include <map>
#include <memory>
#include <vector>

#include "LipSyncTypes.hpp"

namespace lipsync {

// 一个模板是一段特征帧序列（长度 >= 1）
using PhonemeTemplate = std::vector<FeatureVector>;
using TemplateMap = std::map<Viseme, std::vector<PhonemeTemplate>>;

/**
 * 口型模板库
 * 构造后只读，多个会话以 shared_ptr<const TemplateBank> 共享，无需加锁。
 * 可通过 JSON 替换为按说话人校准的模板。
 */
class TemplateBank
{
public:
    // 任何类别没有模板、任何序列为空或含非有限值时返回 nullptr
    static std::shared_ptr<const TemplateBank> load(const TemplateMap &templates,
                                                    QString *errorString = nullptr);

    // 预置的元音/静音模板（13 维倒谱系数）
    static std::shared_ptr<const TemplateBank> defaultBank();

    // { "A": [[...], ...], "sil": [...] }，值可以是单帧或多个变体
    static std::shared_ptr<const TemplateBank> fromJson(const QJsonObject &json,
                                                        QString *errorString = nullptr);
    static std::shared_ptr<const TemplateBank> loadFromFile(const QString &filePath,
                                                            QString *errorString = nullptr);

    QJsonObject toJson() const;

    const TemplateMap &templates() const { return m_templates; }
    std::vector<Viseme> categories() const;
    int templateCount() const;
    bool isEmpty() const { return m_templates.empty(); }

private:
    explicit TemplateBank(TemplateMap templates);

    static bool validate(const TemplateMap &templates, QString *errorString);

    const TemplateMap m_templates;
};

} // namespace lipsync

#endif // TEMPLATEBANK_HPP
