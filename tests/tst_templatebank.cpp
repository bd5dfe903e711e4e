#include <QtTest>

#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>
#include <limits>

#include "DtwClassifier.hpp"
#include "TemplateBank.hpp"
#include "TemplateRecorder.h"

using namespace lipsync;

class TestTemplateBank : public QObject
{
    Q_OBJECT

private slots:
    void defaultBankCoversAllCategories();
    void rejectsInvalidTemplates();
    void emptyBankIsAllowed();
    void parsesJsonLayouts();
    void rejectsBadJson();
    void jsonRoundTrip();
    void loadsFromFile();
    void recorderAverages();
    void recorderRejectsMismatchedFrames();
    void recorderBuildsUsableBank();
};

void TestTemplateBank::defaultBankCoversAllCategories()
{
    auto bank = TemplateBank::defaultBank();
    QVERIFY(bank);
    QCOMPARE(bank->categories().size(), size_t(6));
    QCOMPARE(bank->templateCount(), 7);
    QCOMPARE(bank->templates().at(Viseme::Silence).size(), size_t(2));
    QCOMPARE(bank->templates().at(Viseme::A).front().front().size(), size_t(13));

    // 预置模板库是共享的同一个实例
    QCOMPARE(TemplateBank::defaultBank().get(), bank.get());
}

void TestTemplateBank::rejectsInvalidTemplates()
{
    QString error;

    TemplateMap emptySequence;
    emptySequence[Viseme::A].push_back(PhonemeTemplate());
    QVERIFY(!TemplateBank::load(emptySequence, &error));
    QVERIFY(error.contains("empty sequence"));

    TemplateMap noVariants;
    noVariants[Viseme::O];
    QVERIFY(!TemplateBank::load(noVariants, &error));
    QVERIFY(error.contains("no templates"));

    TemplateMap emptyFrame;
    emptyFrame[Viseme::I].push_back(PhonemeTemplate{FeatureVector()});
    QVERIFY(!TemplateBank::load(emptyFrame, &error));

    TemplateMap nonFinite;
    nonFinite[Viseme::E].push_back(PhonemeTemplate{FeatureVector{1.0f, std::numeric_limits<float>::quiet_NaN()}});
    QVERIFY(!TemplateBank::load(nonFinite, &error));
    QVERIFY(error.contains("non-finite"));
}

void TestTemplateBank::emptyBankIsAllowed()
{
    auto bank = TemplateBank::load(TemplateMap());
    QVERIFY(bank);
    QVERIFY(bank->isEmpty());
    QCOMPARE(bank->templateCount(), 0);
}

void TestTemplateBank::parsesJsonLayouts()
{
    const QByteArray json = R"({
        "A": [1, 2, 3],
        "ih": [[4, 5, 6], [4.5, 5.5, 6.5]],
        "O": [[[1, 1], [2, 2], [3, 3]]],
        "sil": [[0, 0, 0]]
    })";

    QString error;
    auto bank = TemplateBank::fromJson(QJsonDocument::fromJson(json).object(), &error);
    QVERIFY2(bank, qPrintable(error));

    const TemplateMap &templates = bank->templates();
    QCOMPARE(templates.at(Viseme::A).size(), size_t(1));
    QCOMPARE(templates.at(Viseme::A).front().size(), size_t(1));
    QCOMPARE(templates.at(Viseme::A).front().front(), (FeatureVector{1.0f, 2.0f, 3.0f}));

    QCOMPARE(templates.at(Viseme::I).size(), size_t(2));
    QCOMPARE(templates.at(Viseme::I).back().front().front(), 4.5f);

    QCOMPARE(templates.at(Viseme::O).size(), size_t(1));
    QCOMPARE(templates.at(Viseme::O).front().size(), size_t(3));

    QCOMPARE(templates.count(Viseme::Silence), size_t(1));
}

void TestTemplateBank::rejectsBadJson()
{
    QString error;
    QJsonObject unknown;
    unknown["X"] = QJsonArray{1, 2};
    QVERIFY(!TemplateBank::fromJson(unknown, &error));
    QVERIFY(error.contains("unknown viseme"));

    QJsonObject notArray;
    notArray["A"] = 3;
    QVERIFY(!TemplateBank::fromJson(notArray, &error));

    QJsonObject empty;
    empty["U"] = QJsonArray();
    QVERIFY(!TemplateBank::fromJson(empty, &error));

    QJsonObject strings;
    strings["E"] = QJsonArray{"a", "b"};
    QVERIFY(!TemplateBank::fromJson(strings, &error));
}

void TestTemplateBank::jsonRoundTrip()
{
    auto bank = TemplateBank::defaultBank();
    auto copy = TemplateBank::fromJson(bank->toJson());
    QVERIFY(copy);
    QCOMPARE(copy->templateCount(), bank->templateCount());
    QCOMPARE(copy->templates().at(Viseme::E).front().front(),
             bank->templates().at(Viseme::E).front().front());
}

void TestTemplateBank::loadsFromFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    const QString path = dir.filePath("templates.json");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(R"({"A": [1, 2, 3], "SILENCE": [0, 0, 0]})");
    file.close();

    QString error;
    auto bank = TemplateBank::loadFromFile(path, &error);
    QVERIFY2(bank, qPrintable(error));
    QCOMPARE(bank->templateCount(), 2);

    QVERIFY(!TemplateBank::loadFromFile(dir.filePath("missing.json"), &error));
    QVERIFY(error.contains("cannot open"));

    QFile broken(dir.filePath("broken.json"));
    QVERIFY(broken.open(QIODevice::WriteOnly));
    broken.write("{ not json");
    broken.close();
    QVERIFY(!TemplateBank::loadFromFile(broken.fileName(), &error));
}

void TestTemplateBank::recorderAverages()
{
    TemplateRecorder recorder;
    QVERIFY(recorder.record(Viseme::A, {1.0f, 2.0f, -3.0f}));
    QVERIFY(recorder.record(Viseme::A, {1.25f, 2.0f, -3.5f}));
    QVERIFY(recorder.record(Viseme::U, {7.04f}));
    QCOMPARE(recorder.recordingCount(Viseme::A), 2);
    QCOMPARE(recorder.totalRecordings(), 3);

    const std::map<Viseme, FeatureVector> averages = recorder.averages();
    QCOMPARE(averages.size(), size_t(2));
    QCOMPARE(averages.at(Viseme::A)[0], 1.1f);
    QCOMPARE(averages.at(Viseme::A)[1], 2.0f);
    QCOMPARE(averages.at(Viseme::A)[2], -3.3f);
    QCOMPARE(averages.at(Viseme::U)[0], 7.0f);

    const QJsonObject json = recorder.toJson();
    QVERIFY(json.contains("A"));
    QCOMPARE(json["A"].toArray().first().toArray().size(), 3);

    recorder.clear(Viseme::U);
    QCOMPARE(recorder.recordingCount(Viseme::U), 0);
    recorder.clear();
    QCOMPARE(recorder.totalRecordings(), 0);
}

void TestTemplateBank::recorderRejectsMismatchedFrames()
{
    TemplateRecorder recorder;
    QVERIFY(!recorder.record(Viseme::O, {}));
    QCOMPARE(recorder.recordingCount(Viseme::O), 0);
    QVERIFY(recorder.averages().empty());

    QVERIFY(recorder.record(Viseme::O, {1.0f, 2.0f}));
    QVERIFY(!recorder.record(Viseme::O, {1.0f, 2.0f, 3.0f}));
    QVERIFY(!recorder.record(Viseme::O, {1.0f, std::numeric_limits<float>::infinity()}));
    QCOMPARE(recorder.recordingCount(Viseme::O), 1);
}

void TestTemplateBank::recorderBuildsUsableBank()
{
    TemplateRecorder recorder;
    QVERIFY(recorder.record(Viseme::A, {1.0f, 2.0f, 3.0f}));
    QVERIFY(recorder.record(Viseme::Silence, {0.0f, 0.0f, 0.0f}));

    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("recorded.json");
    QVERIFY(recorder.saveToFile(path));

    auto bank = TemplateBank::loadFromFile(path);
    QVERIFY(bank);

    DtwClassifier classifier(bank);
    FeatureFrame frame;
    frame.coefficients = {1.0f, 2.0f, 3.0f};
    QCOMPARE(classifier.classify(frame).category, Viseme::A);

    QVERIFY(recorder.buildBank());
}

QTEST_GUILESS_MAIN(TestTemplateBank)
#include "tst_templatebank.moc"
