#include <QtTest>

#include <QTemporaryDir>
#include <QThread>
#include <QtEndian>
#include <atomic>
#include <cstring>

#include "FileSource.hpp"
#include "RemoteStreamSource.hpp"

using namespace lipsync;

namespace {

QByteArray pcm16(const std::vector<qint16> &samples)
{
    QByteArray bytes(static_cast<int>(samples.size() * 2), 0);
    for (size_t i = 0; i < samples.size(); ++i) {
        qToLittleEndian<qint16>(samples[i], bytes.data() + i * 2);
    }
    return bytes;
}

QByteArray wavFile(quint16 format, quint16 channels, quint32 sampleRate, quint16 bits, const QByteArray &data)
{
    QByteArray header(44, 0);
    char *h = header.data();
    std::memcpy(h, "RIFF", 4);
    qToLittleEndian<quint32>(36 + data.size(), h + 4);
    std::memcpy(h + 8, "WAVE", 4);
    std::memcpy(h + 12, "fmt ", 4);
    qToLittleEndian<quint32>(16, h + 16);
    qToLittleEndian<quint16>(format, h + 20);
    qToLittleEndian<quint16>(channels, h + 22);
    qToLittleEndian<quint32>(sampleRate, h + 24);
    qToLittleEndian<quint32>(sampleRate * channels * bits / 8, h + 28);
    qToLittleEndian<quint16>(channels * bits / 8, h + 32);
    qToLittleEndian<quint16>(bits, h + 34);
    std::memcpy(h + 36, "data", 4);
    qToLittleEndian<quint32>(data.size(), h + 40);
    return header + data;
}

AudioBlock blockAt(const QSignalSpy &spy, int index)
{
    return qvariant_cast<AudioBlock>(spy.at(index).at(0));
}

}

class TestAudioSources : public QObject
{
    Q_OBJECT

private slots:
    void remoteChunksPcm();
    void remoteRejectsPushBeforeStart();
    void remoteLossIsReportedOnce();
    void remoteRejectsEmptyOpusPacket();
    void remoteStopLeavesNoPendingSamples();

    void parsesPcm16Wav();
    void parsesFloatWav();
    void rejectsStereoAndGarbage();
    void filePlaysToEnd();
    void missingFileFailsToStart();
};

void TestAudioSources::remoteChunksPcm()
{
    RemoteStreamSource source(16000, 4);
    QSignalSpy blocks(&source, &AudioSource::blockReady);
    QVERIFY(source.start());
    QVERIFY(source.isLive());
    QCOMPARE(source.channelCount(), 1);

    QVERIFY(source.pushPcm16(pcm16({16384, -16384, 0, 32767, 8192, 8192, 1, 2, 3, 4})));
    QCOMPARE(blocks.count(), 2);

    const AudioBlock first = blockAt(blocks, 0);
    QCOMPARE(first.sampleRate, 16000);
    QCOMPARE(static_cast<int>(first.samples.size()), 4);
    QCOMPARE(first.samples[0], 0.5f);
    QCOMPARE(first.samples[1], -0.5f);
    QVERIFY(blockAt(blocks, 1).timestampMs >= first.timestampMs);

    // 剩余 2 个样本等到凑满一块
    source.pushSamples({0.1f, 0.2f});
    QCOMPARE(blocks.count(), 3);
    QCOMPARE(blockAt(blocks, 2).samples[3], 0.2f);

    QVERIFY(!source.pushPcm16(QByteArray(3, 0)));
}

void TestAudioSources::remoteRejectsPushBeforeStart()
{
    RemoteStreamSource source(24000, 4);
    QSignalSpy blocks(&source, &AudioSource::blockReady);
    QVERIFY(!source.pushPcm16(pcm16({1, 2, 3, 4})));

    QVERIFY(source.start());
    source.stop();
    QVERIFY(!source.pushPcm16(pcm16({1, 2, 3, 4})));
    QCOMPARE(blocks.count(), 0);
    QVERIFY(source.isAvailable());
}

void TestAudioSources::remoteLossIsReportedOnce()
{
    RemoteStreamSource source;
    QSignalSpy lost(&source, &AudioSource::sourceLost);
    QVERIFY(source.start());

    source.markLost("peer hung up");
    source.markLost("again");
    QCOMPARE(lost.count(), 1);
    QCOMPARE(lost.at(0).at(0).toString(), QString("peer hung up"));
    QVERIFY(!source.isAvailable());
    QVERIFY(!source.start());
}

void TestAudioSources::remoteRejectsEmptyOpusPacket()
{
    RemoteStreamSource source;
    QVERIFY(source.start());
    QVERIFY(!source.pushOpusPacket(QByteArray()));
}

void TestAudioSources::remoteStopLeavesNoPendingSamples()
{
    RemoteStreamSource source(16000, 4096);
    QVERIFY(source.start());

    std::atomic<bool> running(true);
    std::atomic<int> accepted(0);
    std::unique_ptr<QThread> producer(QThread::create([&source, &running, &accepted]() {
        const QByteArray pcm(6, '\0');
        while (running) {
            if (source.pushPcm16(pcm)) {
                ++accepted;
            }
        }
    }));
    producer->start();

    QTRY_VERIFY(accepted > 0);
    source.stop();
    QCOMPARE(source.pendingSampleCount(), 0);

    // 停止后生产线程继续推送，缓存必须保持为空
    QTest::qWait(20);
    running = false;
    QVERIFY(producer->wait(5000));
    QCOMPARE(source.pendingSampleCount(), 0);
    QVERIFY(!source.pushPcm16(QByteArray(2, '\0')));
}

void TestAudioSources::parsesPcm16Wav()
{
    std::vector<float> samples;
    int sampleRate = 0;
    QString error;
    const QByteArray wav = wavFile(1, 1, 22050, 16, pcm16({0, 16384, -32768}));

    QVERIFY2(FileSource::parseWav(wav, samples, sampleRate, &error), qPrintable(error));
    QCOMPARE(sampleRate, 22050);
    QCOMPARE(static_cast<int>(samples.size()), 3);
    QCOMPARE(samples[1], 0.5f);
    QCOMPARE(samples[2], -1.0f);
}

void TestAudioSources::parsesFloatWav()
{
    QByteArray data(12, 0);
    const float values[] = {0.25f, -0.75f, 3.0f};
    for (int i = 0; i < 3; ++i) {
        quint32 raw;
        std::memcpy(&raw, &values[i], sizeof(raw));
        qToLittleEndian<quint32>(raw, data.data() + i * 4);
    }

    std::vector<float> samples;
    int sampleRate = 0;
    QVERIFY(FileSource::parseWav(wavFile(3, 1, 48000, 32, data), samples, sampleRate));
    QCOMPARE(sampleRate, 48000);
    QCOMPARE(samples[0], 0.25f);
    QCOMPARE(samples[1], -0.75f);
    QCOMPARE(samples[2], 1.0f);
}

void TestAudioSources::rejectsStereoAndGarbage()
{
    std::vector<float> samples;
    int sampleRate = 0;
    QString error;

    QVERIFY(!FileSource::parseWav(wavFile(1, 2, 16000, 16, pcm16({1, 2, 3, 4})), samples, sampleRate, &error));
    QVERIFY(error.contains("mono"));

    QVERIFY(!FileSource::parseWav("definitely not audio", samples, sampleRate, &error));
    QVERIFY(error.contains("RIFF"));

    QVERIFY(!FileSource::parseWav(wavFile(1, 1, 16000, 8, QByteArray(4, 0)), samples, sampleRate, &error));
}

void TestAudioSources::filePlaysToEnd()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("speech.wav");

    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(wavFile(1, 1, 16000, 16, pcm16(std::vector<qint16>(1000, 1000))));
    file.close();

    FileSource source(path, 256);
    source.setRealtime(false);
    QVERIFY(!source.isLive());
    QVERIFY(source.isAvailable());

    QSignalSpy blocks(&source, &AudioSource::blockReady);
    QSignalSpy finished(&source, &AudioSource::finished);
    QVERIFY(source.start());
    QCOMPARE(source.sampleRate(), 16000);
    QCOMPARE(source.totalSamples(), qint64(1000));

    QVERIFY(finished.wait(2000));
    QCOMPARE(blocks.count(), 4);
    QCOMPARE(finished.count(), 1);

    // 最后一块补零到 frameSize
    const AudioBlock last = blockAt(blocks, 3);
    QCOMPARE(static_cast<int>(last.samples.size()), 256);
    QVERIFY(last.samples[231] != 0.0f);
    QCOMPARE(last.samples[232], 0.0f);
}

void TestAudioSources::missingFileFailsToStart()
{
    FileSource source("/nonexistent/voice.wav");
    QVERIFY(!source.isAvailable());
    QVERIFY(!source.start());
    QVERIFY(!source.lastError().isEmpty());
}

QTEST_GUILESS_MAIN(TestAudioSources)
#include "tst_audiosources.moc"
