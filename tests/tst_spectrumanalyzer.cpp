#include <QtTest>

#include <algorithm>
#include <cmath>

#include "SpectrumAnalyzer.h"

using namespace lipsync;

namespace {

const double kPi = 3.14159265358979323846;

std::vector<float> tone(float frequency, int sampleRate, int count, float amplitude = 0.5f)
{
    std::vector<float> samples(count);
    for (int n = 0; n < count; ++n) {
        samples[n] = amplitude * static_cast<float>(std::sin(2.0 * kPi * frequency * n / sampleRate));
    }
    return samples;
}

int peakBin(const SpectrumFrame &frame)
{
    auto it = std::max_element(frame.magnitudesDb.begin(), frame.magnitudesDb.end());
    return static_cast<int>(std::distance(frame.magnitudesDb.begin(), it));
}

}

class TestSpectrumAnalyzer : public QObject
{
    Q_OBJECT

private slots:
    void frameLayout();
    void pureToneLandsInItsBin();
    void silenceIsFloor();
    void smoothingAveragesFrames();
    void resetClearsHistory();
};

void TestSpectrumAnalyzer::frameLayout()
{
    SpectrumAnalyzer analyzer(2048, 0.6f);
    QVERIFY(analyzer.isValid());
    QCOMPARE(analyzer.binCount(), 1024);

    const SpectrumFrame frame = analyzer.analyze(16000, 99);
    QCOMPARE(static_cast<int>(frame.magnitudesDb.size()), 1024);
    QCOMPARE(frame.fftSize, 2048);
    QCOMPARE(frame.sampleRate, 16000);
    QCOMPARE(frame.timestampMs, qint64(99));
    QCOMPARE(frame.binFrequency(128), 1000.0f);

    analyzer.setSmoothing(4.0f);
    QCOMPARE(analyzer.smoothing(), 1.0f);
}

void TestSpectrumAnalyzer::pureToneLandsInItsBin()
{
    SpectrumAnalyzer analyzer(2048, 0.0f);
    analyzer.pushSamples(tone(1000.0f, 16000, 2048));

    const SpectrumFrame frame = analyzer.analyze(16000, 0);
    QCOMPARE(peakBin(frame), 128);
    QVERIFY(frame.magnitudesDb[128] > -30.0f);
    QVERIFY(frame.magnitudesDb[400] < frame.magnitudesDb[128] - 40.0f);
}

void TestSpectrumAnalyzer::silenceIsFloor()
{
    SpectrumAnalyzer analyzer(1024, 0.0f);
    analyzer.pushSamples(std::vector<float>(1024, 0.0f));

    const SpectrumFrame frame = analyzer.analyze(16000, 0);
    for (float db : frame.magnitudesDb) {
        QCOMPARE(db, -200.0f);
    }
}

void TestSpectrumAnalyzer::smoothingAveragesFrames()
{
    SpectrumAnalyzer sharp(2048, 0.0f);
    SpectrumAnalyzer smooth(2048, 0.5f);
    const std::vector<float> samples = tone(1000.0f, 16000, 2048);
    sharp.pushSamples(samples);
    smooth.pushSamples(samples);

    const float sharpDb = sharp.analyze(16000, 0).magnitudesDb[128];
    const float smoothDb = smooth.analyze(16000, 0).magnitudesDb[128];

    // 第一帧只有一半的能量进入平滑值，约 -6 dB
    QVERIFY(qAbs((sharpDb - smoothDb) - 6.0206f) < 0.01f);

    // 持续输入后收敛到同一水平
    float converged = smoothDb;
    for (int i = 0; i < 30; ++i) {
        converged = smooth.analyze(16000, 0).magnitudesDb[128];
    }
    QVERIFY(qAbs(converged - sharpDb) < 0.01f);
}

void TestSpectrumAnalyzer::resetClearsHistory()
{
    SpectrumAnalyzer analyzer(2048, 0.0f);
    analyzer.pushSamples(tone(500.0f, 16000, 2048));
    analyzer.reset();

    const SpectrumFrame frame = analyzer.analyze(16000, 0);
    QCOMPARE(*std::max_element(frame.magnitudesDb.begin(), frame.magnitudesDb.end()), -200.0f);
}

QTEST_GUILESS_MAIN(TestSpectrumAnalyzer)
#include "tst_spectrumanalyzer.moc"
