#include <QtTest>
#include <QTemporaryDir>
#include <QSettings>
#include "../src/batch_settings.h"

class TestBatchSettings : public QObject {
    Q_OBJECT
private slots:
    void testDefaults();
    void testSaveLoadIni();
    void testInvalidValuesFallBack();
    void testApiKeyFromEnvironment();
};

void TestBatchSettings::testDefaults()
{
    const BatchSettings b;
    QVERIFY(b.runTransform && b.runArchive && b.runUpload);
    QVERIFY(!b.convertLinks);
    QCOMPARE(b.archiveExtension(), QString("7z"));
    QCOMPARE(b.compressionLevel, 5);
    QCOMPARE(b.uploadMaxAttempts, 3);
    QCOMPARE(b.uploadRetryStepSeconds, 2);

    const ServiceSettings s;
    QCOMPARE(s.pollMaxAttempts, 10);
    QCOMPARE(s.pollDelaySeconds, 30);
    QCOMPARE(s.conversionMaxAttempts, 30);
    QVERIFY(s.apiKey.isEmpty());
    QCOMPARE(s.notReadyMarkers, QStringList({"LINK_DOWN", "wait"}));
}

void TestBatchSettings::testSaveLoadIni()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("batchshare.ini");

    {
        QSettings s(path, QSettings::IniFormat);
        BatchSettings b;
        b.runTransform = false;
        b.archiveFormat = ArchiveFormat::Zip;
        b.compressionLevel = 9;
        b.uploadMaxAttempts = 5;
        b.uploadRetryStepSeconds = 4;
        b.save(s);
        ServiceSettings svc;
        svc.pollMaxAttempts = 4;
        svc.notReadyMarkers = {"SCANNING"};
        svc.save(s);
    }

    QSettings s(path, QSettings::IniFormat);
    BatchSettings b;
    b.load(s);
    QVERIFY(!b.runTransform);
    QCOMPARE(b.archiveFormat, ArchiveFormat::Zip);
    QCOMPARE(b.archiveExtension(), QString("zip"));
    QCOMPARE(b.compressionLevel, 9);
    QCOMPARE(b.uploadMaxAttempts, 5);
    QCOMPARE(b.uploadRetryStepSeconds, 4);
    ServiceSettings svc;
    svc.load(s);
    QCOMPARE(svc.pollMaxAttempts, 4);
    QCOMPARE(svc.notReadyMarkers, QStringList({"SCANNING"}));
}

void TestBatchSettings::testInvalidValuesFallBack()
{
    QTemporaryDir dir;
    QSettings s(dir.filePath("bad.ini"), QSettings::IniFormat);
    s.setValue("Archive/Format", "rar");
    s.setValue("Archive/Level", 42);
    s.setValue("Upload/MaxRetries", 0);

    BatchSettings b;
    b.load(s);
    QCOMPARE(b.archiveFormat, ArchiveFormat::SevenZip);
    QCOMPARE(b.compressionLevel, 9);
    QCOMPARE(b.uploadMaxAttempts, 1);

    bool ok = true;
    BatchSettings::formatFromString("tar", &ok);
    QVERIFY(!ok);
    QCOMPARE(BatchSettings::formatFromString(" ZIP ", &ok), ArchiveFormat::Zip);
    QVERIFY(ok);
}

void TestBatchSettings::testApiKeyFromEnvironment()
{
    qputenv("BATCHSHARE_API_KEY", "env-key");
    ServiceSettings s;
    s.applyEnvironment();
    QCOMPARE(s.apiKey, QString("env-key"));

    ServiceSettings explicitKey;
    explicitKey.apiKey = "cli-key";
    explicitKey.applyEnvironment();
    QCOMPARE(explicitKey.apiKey, QString("cli-key"));
    qunsetenv("BATCHSHARE_API_KEY");
}

QTEST_APPLESS_MAIN(TestBatchSettings)
#include "test_batch_settings.moc"
