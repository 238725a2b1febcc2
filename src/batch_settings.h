#pragma once
#include <QString>
#include <QStringList>

class QSettings;

enum class ArchiveFormat { SevenZip, Zip };

// Operator choices for one batch run.
struct BatchSettings {
    bool runTransform = true;
    bool runArchive = true;
    bool runUpload = true;
    bool convertLinks = false;

    ArchiveFormat archiveFormat = ArchiveFormat::SevenZip;
    int compressionLevel = 5;
    QString archivePassword;
    QString outputDirectory;      // empty = desktop
    int maxParallelArchives = 0;  // 0 = one task per eligible item

    int uploadMaxAttempts = 3;
    int uploadRetryStepSeconds = 2;   // countdown after attempt n is n * step
    int countdownStepMs = 1000;

    QString archiveExtension() const { return archiveFormat == ArchiveFormat::Zip ? "zip" : "7z"; }
    QString resolvedOutputDirectory() const;

    void load(QSettings& s);
    void save(QSettings& s) const;

    static ArchiveFormat formatFromString(const QString& text, bool* ok = nullptr);
    static QString formatName(ArchiveFormat format);
};

// Remote endpoints and their tuning.
struct ServiceSettings {
    QString uploadApiBase = "https://api.1fichier.com/v1";
    QString apiKey;
    QString userAgent = "BatchShare/1.0";

    int pollMaxAttempts = 10;
    int pollDelaySeconds = 30;

    QString conversionEndpoint = "https://pydrive.harryeffingpotter.com/convert-1fichier";
    int conversionMaxAttempts = 30;
    int conversionBaseDelaySeconds = 10;
    int conversionStepDelaySeconds = 2;
    int conversionMaxDelaySeconds = 60;
    int conversionErrorDelaySeconds = 10;
    QStringList notReadyMarkers = {"LINK_DOWN", "wait"};

    int stepMs = 1000;   // length of one countdown second; shortened by tests

    void load(QSettings& s);
    void save(QSettings& s) const;

    // Fills apiKey from BATCHSHARE_API_KEY when nothing else provided one.
    void applyEnvironment();
};
