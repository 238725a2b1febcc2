#include "batch_settings.h"

#include <QSettings>
#include <QStandardPaths>
#include <QDir>
#include <QDebug>
#include <algorithm>

QString BatchSettings::resolvedOutputDirectory() const
{
    if (!outputDirectory.isEmpty()) return QDir::cleanPath(outputDirectory);
    QString desktop = QStandardPaths::writableLocation(QStandardPaths::DesktopLocation);
    if (desktop.isEmpty()) desktop = QDir::homePath();
    return desktop;
}

void BatchSettings::load(QSettings& s)
{
    runTransform = s.value("Phases/Transform", runTransform).toBool();
    runArchive = s.value("Phases/Archive", runArchive).toBool();
    runUpload = s.value("Phases/Upload", runUpload).toBool();
    convertLinks = s.value("Phases/ConvertLinks", convertLinks).toBool();

    bool ok = false;
    const ArchiveFormat fmt = formatFromString(s.value("Archive/Format", formatName(archiveFormat)).toString(), &ok);
    if (ok) archiveFormat = fmt;
    else qWarning() << "[Settings] Unknown archive format, keeping" << formatName(archiveFormat);
    compressionLevel = std::clamp(s.value("Archive/Level", compressionLevel).toInt(), 0, 9);
    archivePassword = s.value("Archive/Password", archivePassword).toString();
    outputDirectory = s.value("Archive/OutputDirectory", outputDirectory).toString();
    maxParallelArchives = std::max(0, s.value("Archive/MaxParallel", maxParallelArchives).toInt());

    uploadMaxAttempts = std::max(1, s.value("Upload/MaxRetries", uploadMaxAttempts).toInt());
    // Stored in ms to stay compatible with older RetryDelayMs values
    const int delayMs = s.value("Upload/RetryDelayMs", uploadRetryStepSeconds * 1000).toInt();
    uploadRetryStepSeconds = std::max(0, delayMs / 1000);
}

void BatchSettings::save(QSettings& s) const
{
    s.setValue("Phases/Transform", runTransform);
    s.setValue("Phases/Archive", runArchive);
    s.setValue("Phases/Upload", runUpload);
    s.setValue("Phases/ConvertLinks", convertLinks);
    s.setValue("Archive/Format", formatName(archiveFormat));
    s.setValue("Archive/Level", compressionLevel);
    s.setValue("Archive/Password", archivePassword);
    s.setValue("Archive/OutputDirectory", outputDirectory);
    s.setValue("Archive/MaxParallel", maxParallelArchives);
    s.setValue("Upload/MaxRetries", uploadMaxAttempts);
    s.setValue("Upload/RetryDelayMs", uploadRetryStepSeconds * 1000);
}

ArchiveFormat BatchSettings::formatFromString(const QString& text, bool* ok)
{
    const QString t = text.trimmed().toLower();
    if (ok) *ok = true;
    if (t == "zip") return ArchiveFormat::Zip;
    if (t == "7z" || t == "7zip") return ArchiveFormat::SevenZip;
    if (ok) *ok = false;
    return ArchiveFormat::SevenZip;
}

QString BatchSettings::formatName(ArchiveFormat format)
{
    return format == ArchiveFormat::Zip ? "zip" : "7z";
}

void ServiceSettings::load(QSettings& s)
{
    uploadApiBase = s.value("Service/UploadApiBase", uploadApiBase).toString();
    apiKey = s.value("Service/ApiKey", apiKey).toString();
    userAgent = s.value("Service/UserAgent", userAgent).toString();
    pollMaxAttempts = std::max(1, s.value("Service/PollMaxAttempts", pollMaxAttempts).toInt());
    pollDelaySeconds = std::max(0, s.value("Service/PollDelaySeconds", pollDelaySeconds).toInt());

    conversionEndpoint = s.value("Conversion/Endpoint", conversionEndpoint).toString();
    conversionMaxAttempts = std::max(1, s.value("Conversion/MaxAttempts", conversionMaxAttempts).toInt());
    conversionBaseDelaySeconds = std::max(0, s.value("Conversion/BaseDelaySeconds", conversionBaseDelaySeconds).toInt());
    conversionStepDelaySeconds = std::max(0, s.value("Conversion/StepDelaySeconds", conversionStepDelaySeconds).toInt());
    conversionMaxDelaySeconds = std::max(0, s.value("Conversion/MaxDelaySeconds", conversionMaxDelaySeconds).toInt());
    conversionErrorDelaySeconds = std::max(0, s.value("Conversion/ErrorDelaySeconds", conversionErrorDelaySeconds).toInt());
    const QStringList markers = s.value("Conversion/NotReadyMarkers", notReadyMarkers).toStringList();
    if (!markers.isEmpty()) notReadyMarkers = markers;
}

void ServiceSettings::save(QSettings& s) const
{
    s.setValue("Service/UploadApiBase", uploadApiBase);
    s.setValue("Service/ApiKey", apiKey);
    s.setValue("Service/UserAgent", userAgent);
    s.setValue("Service/PollMaxAttempts", pollMaxAttempts);
    s.setValue("Service/PollDelaySeconds", pollDelaySeconds);
    s.setValue("Conversion/Endpoint", conversionEndpoint);
    s.setValue("Conversion/MaxAttempts", conversionMaxAttempts);
    s.setValue("Conversion/BaseDelaySeconds", conversionBaseDelaySeconds);
    s.setValue("Conversion/StepDelaySeconds", conversionStepDelaySeconds);
    s.setValue("Conversion/MaxDelaySeconds", conversionMaxDelaySeconds);
    s.setValue("Conversion/ErrorDelaySeconds", conversionErrorDelaySeconds);
    s.setValue("Conversion/NotReadyMarkers", notReadyMarkers);
}

void ServiceSettings::applyEnvironment()
{
    if (!apiKey.isEmpty()) return;
    const QString env = qEnvironmentVariable("BATCHSHARE_API_KEY").trimmed();
    if (!env.isEmpty()) apiKey = env;
}
