#ifndef LIPSYNCTYPES_HPP
#define LIPSYNCTYPES_HPP

#include <QMetaType>
#include <QString>
#include <QVariantMap>
#include <array>
#include <vector>

namespace lipsync {

// 口型类别：五个元音 + 静音
enum class Viseme {
    A = 0,
    I,
    U,
    E,
    O,
    Silence
};

constexpr int kVowelCount = 5;

// 会话状态机
enum class SessionState {
    Idle,
    Starting,
    Running,
    Reconnecting,
    Stopped,
    Failed
};

enum class SessionError {
    NoError,
    AlreadyActive,
    NotActive,
    SourceUnavailable,
    ExtractorUnavailable,   // 不是真正的错误，切换到共振峰回退模式
    InvalidTemplate,
    ClassificationTimeout,
    ReconnectExhausted
};

// 分类策略，在 start() 时根据特征提取器是否可用选定一次
enum class ClassifierStrategy {
    Cepstral,
    Formant
};

using FeatureVector = std::vector<float>;

struct FeatureFrame {
    FeatureVector coefficients;
    qint64 timestampMs = 0;
};

// 单声道 PCM 块，样本范围 [-1, 1]
struct AudioBlock {
    std::vector<float> samples;
    int sampleRate = 0;
    qint64 timestampMs = 0;
};

// 功率谱（dB），bins = fftSize / 2
struct SpectrumFrame {
    std::vector<float> magnitudesDb;
    int sampleRate = 0;
    int fftSize = 0;
    qint64 timestampMs = 0;

    float binFrequency(int bin) const;
};

struct ClassificationResult {
    Viseme category = Viseme::Silence;
    float distance = 0.0f;
    float secondBestDistance = 0.0f;
    float confidence = 0.0f;
    qint64 timestampMs = 0;
};

/**
 * 推给渲染端的口型强度。
 * 所有写入都会被夹到 [0,1]，NaN/inf 视为 0。
 */
class VisemeState
{
public:
    VisemeState();

    static VisemeState neutral(qint64 timestampMs = 0);

    float value(Viseme viseme) const;
    void setValue(Viseme viseme, float intensity);

    bool isNeutral() const;

    qint64 timestampMs() const { return m_timestampMs; }
    void setTimestampMs(qint64 timestampMs) { m_timestampMs = timestampMs; }

    // aa / ih / ou / ee / oh -> 强度，供 VRM/Live2D 表情参数使用
    QVariantMap toVariantMap() const;
    QString toString() const;

    bool operator==(const VisemeState &other) const;
    bool operator!=(const VisemeState &other) const { return !(*this == other); }

private:
    std::array<float, kVowelCount> m_values;
    qint64 m_timestampMs;
};

// 每个会话独占的可变状态，显式传入各处理步骤
struct PipelineState {
    Viseme lastCategory = Viseme::Silence;
    float lastIntensity = 0.0f;
    qint64 lastTimestampMs = -1;
    int reconnectAttempts = 0;
    bool fatalReported = false;
    VisemeState lastDispatched;

    void reset();
};

QString visemeName(Viseme viseme);
// 表情名 aa/ih/ou/ee/oh，静音为 sil
QString visemeExpressionName(Viseme viseme);
// 同时接受 A/I/U/E/O/SILENCE 与 aa/ih/ou/ee/oh/sil，大小写不敏感
bool visemeFromName(const QString &name, Viseme *viseme);

QString sessionStateName(SessionState state);
QString sessionErrorName(SessionError error);

} // namespace lipsync

Q_DECLARE_METATYPE(lipsync::AudioBlock)
Q_DECLARE_METATYPE(lipsync::VisemeState)
Q_DECLARE_METATYPE(lipsync::SessionState)
Q_DECLARE_METATYPE(lipsync::SessionError)

#endif // LIPSYNCTYPES_HPP
