#include <QtTest>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>
#include "../src/pipeline/artifact_cleaner.h"

namespace {

void touch(const QString& path, const QByteArray& content = "x")
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile f(path);
    if (f.open(QIODevice::WriteOnly)) f.write(content);
}

QByteArray readAll(const QString& path)
{
    QFile f(path);
    return f.open(QIODevice::ReadOnly) ? f.readAll() : QByteArray();
}

} // namespace

class TestArtifactCleaner : public QObject {
    Q_OBJECT
private slots:
    void testPatternMatching();
    void testRestoresBackups();
    void testRemovesArtifacts();
    void testTopLevelPatternsStayTopLevel();
    void testNestedMatchCountedOnce();
    void testMissingRootWarns();
};

void TestArtifactCleaner::testPatternMatching()
{
    QVERIFY(ArtifactCleaner::matches("_[Readme].txt", "_[*"));
    QVERIFY(!ArtifactCleaner::matches("_Readme.txt", "_[*"));
    QVERIFY(ArtifactCleaner::matches("Game.LNK", "*.lnk"));
    QVERIFY(ArtifactCleaner::matches("lobby_connect_x64.exe", "lobby_connect*"));
    QVERIFY(ArtifactCleaner::matches("creamapi.dll", "CreamAPI.dll"));
    QVERIFY(!ArtifactCleaner::matches("steam_api.dll", "steam_api_o.dll"));
}

void TestArtifactCleaner::testRestoresBackups()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString root = dir.path();
    touch(root + "/bin/steam_api64.dll", "patched");
    touch(root + "/bin/steam_api64.dll.bak", "original");
    touch(root + "/Game.exe.bak", "orig-exe");

    ArtifactCleaner cleaner;
    const CleanupReport report = cleaner.clean(root);
    QCOMPARE(report.restored, 2);
    QVERIFY(report.isClean());
    QCOMPARE(readAll(root + "/bin/steam_api64.dll"), QByteArray("original"));
    QVERIFY(!QFile::exists(root + "/bin/steam_api64.dll.bak"));
    QCOMPARE(readAll(root + "/Game.exe"), QByteArray("orig-exe"));
}

void TestArtifactCleaner::testRemovesArtifacts()
{
    QTemporaryDir dir;
    const QString root = dir.path();
    touch(root + "/steam_settings/configs.ini");
    touch(root + "/bin/steam_settings/force_account_name.txt");
    touch(root + "/bin/lobby_connect_x64.exe");
    touch(root + "/bin/CreamAPI.dll");
    touch(root + "/cream_api.ini");
    touch(root + "/CreamLinux/libcream.so");
    touch(root + "/bin/steam_api64_o.dll");
    touch(root + "/saves/local_save.txt");
    touch(root + "/bin/Game.exe");

    ArtifactCleaner cleaner;
    const CleanupReport report = cleaner.clean(root);
    QVERIFY(report.isClean());
    QVERIFY(!QDir(root + "/steam_settings").exists());
    QVERIFY(!QDir(root + "/bin/steam_settings").exists());
    QVERIFY(!QDir(root + "/CreamLinux").exists());
    QVERIFY(!QFile::exists(root + "/bin/lobby_connect_x64.exe"));
    QVERIFY(!QFile::exists(root + "/bin/CreamAPI.dll"));
    QVERIFY(!QFile::exists(root + "/cream_api.ini"));
    QVERIFY(!QFile::exists(root + "/bin/steam_api64_o.dll"));
    QVERIFY(!QFile::exists(root + "/saves/local_save.txt"));
    QVERIFY(QFile::exists(root + "/bin/Game.exe"));
    QCOMPARE(report.removed, 8);
}

void TestArtifactCleaner::testTopLevelPatternsStayTopLevel()
{
    QTemporaryDir dir;
    const QString root = dir.path();
    touch(root + "/_[Info].txt");
    touch(root + "/Play.lnk");
    touch(root + "/docs/_[Keep].txt");
    touch(root + "/docs/Manual.lnk");

    ArtifactCleaner cleaner;
    cleaner.clean(root);
    QVERIFY(!QFile::exists(root + "/_[Info].txt"));
    QVERIFY(!QFile::exists(root + "/Play.lnk"));
    QVERIFY(QFile::exists(root + "/docs/_[Keep].txt"));
    QVERIFY(QFile::exists(root + "/docs/Manual.lnk"));
}

void TestArtifactCleaner::testNestedMatchCountedOnce()
{
    QTemporaryDir dir;
    const QString root = dir.path();
    // "steam_settings old" sorts between "steam_settings" and its own child
    touch(root + "/steam_settings/steam_settings/user.ini");
    touch(root + "/steam_settings old/configs.ini");
    touch(root + "/Game.exe");

    CleanupRules rules;
    rules.directoryNames = {"steam_settings*"};
    ArtifactCleaner cleaner(rules);
    const CleanupReport report = cleaner.clean(root);

    QVERIFY(report.isClean());
    QCOMPARE(report.removed, 2);
    QVERIFY(!QDir(root + "/steam_settings").exists());
    QVERIFY(!QDir(root + "/steam_settings old").exists());
    QVERIFY(QFile::exists(root + "/Game.exe"));
}

void TestArtifactCleaner::testMissingRootWarns()
{
    ArtifactCleaner cleaner;
    const CleanupReport report = cleaner.clean("/definitely/not/here/batchshare");
    QCOMPARE(report.warnings, 1);
    QCOMPARE(report.removed, 0);
}

QTEST_APPLESS_MAIN(TestArtifactCleaner)
#include "test_artifact_cleaner.moc"
