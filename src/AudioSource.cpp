#include "AudioSource.hpp"

#include <QElapsedTimer>

namespace lipsync {

AudioSource::AudioSource(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<lipsync::AudioBlock>("lipsync::AudioBlock");
}

AudioSource::~AudioSource()
{
}

qint64 AudioSource::monotonicMs()
{
    static QElapsedTimer clock = []() {
        QElapsedTimer timer;
        timer.start();
        return timer;
    }();
    return clock.elapsed();
}

} // namespace lipsync
