#include "LipSyncTypes.hpp"

#include <QStringList>
#include <algorithm>
#include <cmath>

namespace lipsync {

float SpectrumFrame::binFrequency(int bin) const
{
    if (fftSize <= 0) {
        return 0.0f;
    }
    return static_cast<float>(bin) * static_cast<float>(sampleRate) / static_cast<float>(fftSize);
}

VisemeState::VisemeState()
    : m_timestampMs(0)
{
    m_values.fill(0.0f);
}

VisemeState VisemeState::neutral(qint64 timestampMs)
{
    VisemeState state;
    state.setTimestampMs(timestampMs);
    return state;
}

float VisemeState::value(Viseme viseme) const
{
    if (viseme == Viseme::Silence) {
        return 0.0f;
    }
    return m_values[static_cast<int>(viseme)];
}

void VisemeState::setValue(Viseme viseme, float intensity)
{
    if (viseme == Viseme::Silence) {
        return;
    }
    if (!std::isfinite(intensity)) {
        intensity = 0.0f;
    }
    m_values[static_cast<int>(viseme)] = std::max(0.0f, std::min(1.0f, intensity));
}

bool VisemeState::isNeutral() const
{
    return std::all_of(m_values.begin(), m_values.end(), [](float v) { return v == 0.0f; });
}

QVariantMap VisemeState::toVariantMap() const
{
    QVariantMap map;
    for (int i = 0; i < kVowelCount; ++i) {
        map.insert(visemeExpressionName(static_cast<Viseme>(i)), m_values[i]);
    }
    return map;
}

QString VisemeState::toString() const
{
    QStringList parts;
    for (int i = 0; i < kVowelCount; ++i) {
        parts << QString("%1=%2").arg(visemeExpressionName(static_cast<Viseme>(i)))
                                 .arg(m_values[i], 0, 'f', 3);
    }
    return QString("[%1] %2").arg(m_timestampMs).arg(parts.join(' '));
}

bool VisemeState::operator==(const VisemeState &other) const
{
    return m_values == other.m_values;
}

void PipelineState::reset()
{
    lastCategory = Viseme::Silence;
    lastIntensity = 0.0f;
    lastTimestampMs = -1;
    reconnectAttempts = 0;
    fatalReported = false;
    lastDispatched = VisemeState();
}

QString visemeName(Viseme viseme)
{
    switch (viseme) {
    case Viseme::A: return "A";
    case Viseme::I: return "I";
    case Viseme::U: return "U";
    case Viseme::E: return "E";
    case Viseme::O: return "O";
    case Viseme::Silence: return "SILENCE";
    }
    return "SILENCE";
}

QString visemeExpressionName(Viseme viseme)
{
    switch (viseme) {
    case Viseme::A: return "aa";
    case Viseme::I: return "ih";
    case Viseme::U: return "ou";
    case Viseme::E: return "ee";
    case Viseme::O: return "oh";
    case Viseme::Silence: return "sil";
    }
    return "sil";
}

bool visemeFromName(const QString &name, Viseme *viseme)
{
    const QString key = name.trimmed().toLower();
    Viseme parsed;
    if (key == "a" || key == "aa") {
        parsed = Viseme::A;
    } else if (key == "i" || key == "ih") {
        parsed = Viseme::I;
    } else if (key == "u" || key == "ou") {
        parsed = Viseme::U;
    } else if (key == "e" || key == "ee") {
        parsed = Viseme::E;
    } else if (key == "o" || key == "oh") {
        parsed = Viseme::O;
    } else if (key == "silence" || key == "sil") {
        parsed = Viseme::Silence;
    } else {
        return false;
    }
    if (viseme) {
        *viseme = parsed;
    }
    return true;
}

QString sessionStateName(SessionState state)
{
    switch (state) {
    case SessionState::Idle: return "Idle";
    case SessionState::Starting: return "Starting";
    case SessionState::Running: return "Running";
    case SessionState::Reconnecting: return "Reconnecting";
    case SessionState::Stopped: return "Stopped";
    case SessionState::Failed: return "Failed";
    }
    return "Unknown";
}

QString sessionErrorName(SessionError error)
{
    switch (error) {
    case SessionError::NoError: return "NoError";
    case SessionError::AlreadyActive: return "AlreadyActive";
    case SessionError::NotActive: return "NotActive";
    case SessionError::SourceUnavailable: return "SourceUnavailable";
    case SessionError::ExtractorUnavailable: return "ExtractorUnavailable";
    case SessionError::InvalidTemplate: return "InvalidTemplate";
    case SessionError::ClassificationTimeout: return "ClassificationTimeout";
    case SessionError::ReconnectExhausted: return "ReconnectExhausted";
    }
    return "Unknown";
}

} // namespace lipsync
