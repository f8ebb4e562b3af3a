#include "zip_extractor.h"

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QObject>
#include <QRegularExpression>
#include <QtGlobal>
#include <cstring>

#include <miniz/miniz.h>

#include "pathutil.h"

namespace
{
void setError(QString *errorMessage, SkillErrorCode *errorCode, SkillErrorCode code, const QString &message)
{
    if (errorMessage) *errorMessage = message;
    if (errorCode) *errorCode = code;
}

bool ensureDirectory(QDir &baseDir, const QString &relativePath, QString *errorMessage, SkillErrorCode *errorCode)
{
    const QString parentRelative = QFileInfo(relativePath).path();
    if (parentRelative.isEmpty() || parentRelative == QStringLiteral("."))
    {
        return true;
    }
    if (baseDir.mkpath(parentRelative)) return true;
    setError(errorMessage, errorCode, SkillErrorCode::IoFailure,
             QObject::tr("Failed to create directory: %1").arg(baseDir.filePath(parentRelative)));
    return false;
}

bool isAbsoluteEntry(const QString &entryPath)
{
    if (entryPath.startsWith(QChar('/'))) return true;
    static const QRegularExpression drivePrefix(QStringLiteral("^[A-Za-z]:"));
    return drivePrefix.match(entryPath).hasMatch();
}

bool hasParentSegment(const QString &cleanedRelative)
{
    const QStringList segments = cleanedRelative.split(QChar('/'), Qt::SkipEmptyParts);
    for (const QString &segment : segments)
    {
        if (segment == QStringLiteral("..")) return true;
    }
    return false;
}

class ZipReaderGuard
{
public:
    explicit ZipReaderGuard(mz_zip_archive &archive)
        : archive_(archive), active_(true)
    {
    }
    ZipReaderGuard(const ZipReaderGuard &) = delete;
    ZipReaderGuard &operator=(const ZipReaderGuard &) = delete;
    ~ZipReaderGuard()
    {
        if (active_) mz_zip_reader_end(&archive_);
    }
    void release() { active_ = false; }

private:
    mz_zip_archive &archive_;
    bool active_;
};
} // namespace

namespace zip
{
bool looksLikeZip(const QByteArray &head)
{
    if (head.size() < 4) return false;
    return head.startsWith(QByteArray("PK\x03\x04", 4)) || head.startsWith(QByteArray("PK\x05\x06", 4));
}

bool extractArchive(const QString &archivePath, const QString &destinationDir, QString *errorMessage,
                    SkillErrorCode *errorCode)
{
    QFileInfo archiveInfo(archivePath);
    if (!archiveInfo.exists() || !archiveInfo.isFile())
    {
        setError(errorMessage, errorCode, SkillErrorCode::NotFound,
                 QObject::tr("Archive not found: %1").arg(archivePath));
        return false;
    }

    const QString baseDestination = QDir::cleanPath(QFileInfo(destinationDir).absoluteFilePath());
    QDir destDir(baseDestination);
    if (!destDir.exists() && !destDir.mkpath(QStringLiteral(".")))
    {
        setError(errorMessage, errorCode, SkillErrorCode::IoFailure,
                 QObject::tr("Failed to prepare destination: %1").arg(baseDestination));
        return false;
    }

    mz_zip_archive archive;
    memset(&archive, 0, sizeof(archive));
    const QByteArray archiveName = QFile::encodeName(archiveInfo.absoluteFilePath());
    if (!mz_zip_reader_init_file(&archive, archiveName.constData(), 0))
    {
        setError(errorMessage, errorCode, SkillErrorCode::InvalidInput,
                 QObject::tr("Failed to open archive: %1").arg(archivePath));
        return false;
    }
    ZipReaderGuard guard(archive);

    const mz_uint fileCount = mz_zip_reader_get_num_files(&archive);
    for (mz_uint i = 0; i < fileCount; ++i)
    {
        mz_zip_archive_file_stat stat;
        if (!mz_zip_reader_file_stat(&archive, i, &stat))
        {
            setError(errorMessage, errorCode, SkillErrorCode::InvalidInput,
                     QObject::tr("Failed to read archive entry metadata."));
            return false;
        }

        QString relativePath = QString::fromUtf8(stat.m_filename);
        if (relativePath.isEmpty()) continue;
        relativePath.replace('\\', '/');
        if (isAbsoluteEntry(relativePath))
        {
            setError(errorMessage, errorCode, SkillErrorCode::UnsafePath,
                     QObject::tr("Archive contains unsafe path: %1").arg(relativePath));
            return false;
        }

        const QString cleanedRelative = QDir::cleanPath(relativePath);
        if (cleanedRelative.isEmpty() || cleanedRelative == QStringLiteral("."))
        {
            continue;
        }
        if (hasParentSegment(cleanedRelative))
        {
            setError(errorMessage, errorCode, SkillErrorCode::UnsafePath,
                     QObject::tr("Archive contains unsafe path: %1").arg(relativePath));
            return false;
        }

        const QString absoluteOutput = QDir::cleanPath(destDir.filePath(cleanedRelative));
        if (!isSubPath(baseDestination, absoluteOutput))
        {
            setError(errorMessage, errorCode, SkillErrorCode::UnsafePath,
                     QObject::tr("Archive entry escapes destination: %1").arg(relativePath));
            return false;
        }

        if (mz_zip_reader_is_file_a_directory(&archive, i))
        {
            if (!destDir.mkpath(cleanedRelative))
            {
                setError(errorMessage, errorCode, SkillErrorCode::IoFailure,
                         QObject::tr("Failed to create directory: %1").arg(absoluteOutput));
                return false;
            }
            continue;
        }

        if (!ensureDirectory(destDir, cleanedRelative, errorMessage, errorCode)) return false;

        const QByteArray outputName = QFile::encodeName(absoluteOutput);
        if (!mz_zip_reader_extract_to_file(&archive, i, outputName.constData(), 0))
        {
            setError(errorMessage, errorCode, SkillErrorCode::IoFailure,
                     QObject::tr("Failed to extract %1").arg(relativePath));
            return false;
        }
    }
    guard.release();
    mz_zip_reader_end(&archive);
    return true;
}
} // namespace zip
