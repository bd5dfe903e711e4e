#include <QtTest>

#include "FormantClassifier.hpp"

using namespace lipsync;

namespace {

const int kSampleRate = 16000;
const int kFftSize = 2048;   // 7.8125 Hz / bin

SpectrumFrame quietSpectrum()
{
    SpectrumFrame frame;
    frame.sampleRate = kSampleRate;
    frame.fftSize = kFftSize;
    frame.magnitudesDb.assign(kFftSize / 2, -100.0f);
    return frame;
}

}

class TestFormantClassifier : public QObject
{
    Q_OBJECT

private slots:
    void scoreInsideAndOutsideBox();
    void peaksSortedByFrequency();
    void peaksLimitedToStrongest();
    void peaksOutsideSpeechBandIgnored();
    void classifiesOpenVowel();
    void classifiesFrontVowel();
    void quietSpectrumIsSilence();
    void singlePeakIsSilence();
};

void TestFormantClassifier::scoreInsideAndOutsideBox()
{
    QCOMPARE(FormantClassifier::score(Viseme::A, 650.0f, 1350.0f), 1.0f);
    QCOMPARE(FormantClassifier::score(Viseme::I, 375.0f, 2050.0f), 1.0f);
    QCOMPARE(FormantClassifier::score(Viseme::A, 450.0f, 1350.0f), 0.0f);
    QCOMPARE(FormantClassifier::score(Viseme::U, 375.0f, 2000.0f), 0.0f);
    QCOMPARE(FormantClassifier::score(Viseme::Silence, 650.0f, 1350.0f), 0.0f);

    const float partial = FormantClassifier::score(Viseme::O, 648.4375f, 1351.5625f);
    QVERIFY(partial > 0.6f && partial < 0.7f);
}

void TestFormantClassifier::peaksSortedByFrequency()
{
    SpectrumFrame frame = quietSpectrum();
    frame.magnitudesDb[173] = -25.0f;  // 1351.6 Hz
    frame.magnitudesDb[83] = -20.0f;   // 648.4 Hz

    FormantClassifier classifier;
    const std::vector<float> peaks = classifier.findFormantPeaks(frame);
    QCOMPARE(peaks.size(), size_t(2));
    QCOMPARE(peaks[0], frame.binFrequency(83));
    QCOMPARE(peaks[1], frame.binFrequency(173));
}

void TestFormantClassifier::peaksLimitedToStrongest()
{
    SpectrumFrame frame = quietSpectrum();
    // 8 个峰，最弱的两个在最低频
    const int bins[] = {20, 40, 60, 80, 100, 120, 140, 160};
    const float levels[] = {-45.0f, -44.0f, -30.0f, -29.0f, -28.0f, -27.0f, -26.0f, -25.0f};
    for (int i = 0; i < 8; ++i) {
        frame.magnitudesDb[bins[i]] = levels[i];
    }

    FormantClassifier classifier;
    const std::vector<float> peaks = classifier.findFormantPeaks(frame);
    QCOMPARE(peaks.size(), size_t(6));
    QCOMPARE(peaks.front(), frame.binFrequency(60));
    QCOMPARE(peaks.back(), frame.binFrequency(160));
}

void TestFormantClassifier::peaksOutsideSpeechBandIgnored()
{
    SpectrumFrame frame = quietSpectrum();
    frame.magnitudesDb[8] = -10.0f;     // 62.5 Hz
    frame.magnitudesDb[600] = -10.0f;   // 4687.5 Hz
    frame.magnitudesDb[300] = -60.0f;   // 低于峰值门限

    FormantClassifier classifier;
    QVERIFY(classifier.findFormantPeaks(frame).empty());
}

void TestFormantClassifier::classifiesOpenVowel()
{
    SpectrumFrame frame = quietSpectrum();
    frame.timestampMs = 500;
    frame.magnitudesDb[83] = -20.0f;
    frame.magnitudesDb[173] = -25.0f;

    FormantClassifier classifier;
    const float energy = classifier.spectralEnergy(frame);
    QVERIFY(energy > 0.3f && energy < 0.4f);

    const FormantResult result = classifier.classify(frame);
    QCOMPARE(result.category, Viseme::A);
    QVERIFY(result.confidence > 0.99f);
    QCOMPARE(result.intensity, 1.0f);
    QCOMPARE(result.f1, frame.binFrequency(83));
    QCOMPARE(result.f2, frame.binFrequency(173));
    QCOMPARE(result.timestampMs, qint64(500));
}

void TestFormantClassifier::classifiesFrontVowel()
{
    SpectrumFrame frame = quietSpectrum();
    frame.magnitudesDb[48] = -22.0f;    // 375 Hz
    frame.magnitudesDb[262] = -24.0f;   // 2046.9 Hz

    FormantParams params;
    params.intensityMultiplier = 1.0f;
    FormantClassifier classifier(params);

    const FormantResult result = classifier.classify(frame);
    QCOMPARE(result.category, Viseme::I);
    QVERIFY(result.confidence > 0.99f);
    QVERIFY(result.intensity > params.minIntensity);
    QVERIFY(result.intensity <= 1.0f);
}

void TestFormantClassifier::quietSpectrumIsSilence()
{
    FormantClassifier classifier;
    const FormantResult result = classifier.classify(quietSpectrum());
    QCOMPARE(result.category, Viseme::Silence);
    QCOMPARE(result.intensity, 0.0f);
    QCOMPARE(classifier.spectralEnergy(quietSpectrum()), 0.0f);
}

void TestFormantClassifier::singlePeakIsSilence()
{
    SpectrumFrame frame = quietSpectrum();
    frame.magnitudesDb[83] = -10.0f;

    FormantClassifier classifier;
    QCOMPARE(classifier.classify(frame).category, Viseme::Silence);
}

QTEST_GUILESS_MAIN(TestFormantClassifier)
#include "tst_formantclassifier.moc"
