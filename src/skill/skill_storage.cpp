#include "skill_storage.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

#include "skill_descriptor.h"
#include "skill_types.h"
#include "utils/flowtracer.h"
#include "utils/pathutil.h"

namespace
{
QString descriptorPath(const QString &bundleDir)
{
    return QDir(bundleDir).filePath(QString::fromUtf8(kSkillFileName));
}

bool hasBundleDirectory(const QString &root)
{
    const QStringList dirs = QDir(root).entryList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden, QDir::Unsorted);
    for (const QString &name : dirs)
    {
        if (!isDotName(name)) return true;
    }
    return false;
}
} // namespace

SkillStorage::SkillStorage(const QString &skillsRoot)
    : skillsRoot_(QDir::cleanPath(skillsRoot))
{
}

void SkillStorage::setSkillsRoot(const QString &skillsRoot)
{
    skillsRoot_ = QDir::cleanPath(skillsRoot);
}

SkillResult SkillStorage::ensureRoot() const
{
    if (skillsRoot_.isEmpty())
    {
        return SkillResult::failure(SkillErrorCode::InvalidInput, QObject::tr("Skills directory is not configured."));
    }
    QDir dir(skillsRoot_);
    if (dir.exists() || dir.mkpath(QStringLiteral("."))) return SkillResult::success(skillsRoot_);
    return SkillResult::failure(SkillErrorCode::IoFailure,
                                QObject::tr("Failed to create skills directory: %1").arg(skillsRoot_));
}

QString SkillStorage::resolveSkillDir(const QString &folderName, QString *error, SkillErrorCode *code) const
{
    const QString name = folderName.trimmed();
    if (name.isEmpty())
    {
        if (error) *error = QObject::tr("Skill folder name is required.");
        if (code) *code = SkillErrorCode::InvalidInput;
        return {};
    }
    QString resolveError;
    const QString dir = resolveInside(skillsRoot_, name, false, &resolveError);
    if (dir.isEmpty())
    {
        if (error) *error = resolveError;
        if (code) *code = skillsRoot_.isEmpty() ? SkillErrorCode::InvalidInput : SkillErrorCode::UnsafePath;
        return {};
    }
    return dir;
}

SkillResult SkillStorage::writeBundle(const QString &folderName, const QString &content) const
{
    QString error;
    SkillErrorCode code = SkillErrorCode::None;
    const QString dir = resolveSkillDir(folderName, &error, &code);
    if (dir.isEmpty()) return SkillResult::failure(code, error);

    if (!QDir().mkpath(dir))
    {
        return SkillResult::failure(SkillErrorCode::IoFailure, QObject::tr("Failed to create directory: %1").arg(dir));
    }
    const QString file = descriptorPath(dir);
    if (!writeTextFile(file, content, &error)) return SkillResult::failure(SkillErrorCode::IoFailure, error);
    FlowTracer::log(FlowChannel::Storage, QStringLiteral("wrote %1").arg(file));
    return SkillResult::success(file);
}

SkillResult SkillStorage::deleteBundle(const QString &folderName) const
{
    QString error;
    SkillErrorCode code = SkillErrorCode::None;
    const QString dir = resolveSkillDir(folderName, &error, &code);
    if (dir.isEmpty()) return SkillResult::failure(code, error);

    if (!QFileInfo::exists(dir)) return SkillResult::success();
    if (!removeDirectory(dir, &error)) return SkillResult::failure(SkillErrorCode::IoFailure, error);
    FlowTracer::log(FlowChannel::Storage, QStringLiteral("removed %1").arg(dir));
    return SkillResult::success();
}

SkillReadResult SkillStorage::readSkill(const QString &pathOrFolder) const
{
    SkillReadResult result;
    const QString input = pathOrFolder.trimmed();
    QString target;
    QString error;
    SkillErrorCode code = SkillErrorCode::None;

    if (QDir::isAbsolutePath(input))
    {
        if (skillsRoot_.isEmpty())
        {
            result.code = SkillErrorCode::InvalidInput;
            result.message = QObject::tr("Skills directory is not configured.");
            return result;
        }
        const QString rootAbs = QDir::cleanPath(QFileInfo(skillsRoot_).absoluteFilePath());
        target = resolveInside(rootAbs, QDir(rootAbs).relativeFilePath(QDir::cleanPath(input)), false, &error);
        if (target.isEmpty())
        {
            result.code = SkillErrorCode::UnsafePath;
            result.message = error;
            return result;
        }
        if (QFileInfo(target).isDir()) target = descriptorPath(target);
    }
    else
    {
        const QString dir = resolveSkillDir(input, &error, &code);
        if (dir.isEmpty())
        {
            result.code = code;
            result.message = error;
            return result;
        }
        target = descriptorPath(dir);
    }

    if (!QFileInfo(target).isFile())
    {
        result.code = SkillErrorCode::NotFound;
        result.message = QObject::tr("Skill file not found: %1").arg(target);
        return result;
    }
    const QString content = readTextFile(target, &error);
    if (!error.isEmpty())
    {
        result.code = SkillErrorCode::IoFailure;
        result.message = error;
        return result;
    }
    result.ok = true;
    result.path = target;
    result.content = content;
    return result;
}

SkillFileListResult SkillStorage::listFiles(const QString &folderName) const
{
    SkillFileListResult result;
    QString error;
    SkillErrorCode code = SkillErrorCode::None;
    const QString dir = resolveSkillDir(folderName, &error, &code);
    if (dir.isEmpty())
    {
        result.code = code;
        result.message = error;
        return result;
    }
    if (!QFileInfo(dir).isDir())
    {
        result.code = SkillErrorCode::NotFound;
        result.message = QObject::tr("Skill folder not found: %1").arg(folderName);
        return result;
    }

    const QFileInfoList entries =
        QDir(dir).entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System, QDir::Name);
    for (const QFileInfo &entry : entries)
    {
        result.entries << (entry.isDir() ? entry.fileName() + QChar('/') : entry.fileName());
    }
    result.ok = true;
    return result;
}

SkillLocateResult SkillStorage::locateBundle(const QString &skillName) const
{
    SkillLocateResult result;
    const QString wanted = skillName.trimmed();
    if (wanted.isEmpty())
    {
        result.code = SkillErrorCode::InvalidInput;
        result.message = QObject::tr("Skill name is required.");
        return result;
    }

    const QDir root(skillsRoot_);
    if (!skillsRoot_.isEmpty() && root.exists())
    {
        const QFileInfoList dirs = root.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::NoSymLinks, QDir::Name);
        for (const QFileInfo &dir : dirs)
        {
            if (isDotName(dir.fileName())) continue;
            const QString file = descriptorPath(dir.absoluteFilePath());
            if (!QFileInfo(file).isFile()) continue;
            QString readError;
            const QString raw = readTextFile(file, &readError);
            if (!readError.isEmpty()) continue;
            if (SkillDescriptor::peekName(raw).compare(wanted, Qt::CaseInsensitive) != 0) continue;
            result.ok = true;
            result.folderName = dir.fileName();
            result.folderPath = QDir::cleanPath(dir.absoluteFilePath());
            return result;
        }
    }
    result.code = SkillErrorCode::NotFound;
    result.message = QObject::tr("Skill not found: %1").arg(wanted);
    return result;
}

int SkillStorage::seedExamplesIfEmpty(const QString &exampleDir) const
{
    if (skillsRoot_.isEmpty() || !QFileInfo(skillsRoot_).isDir()) return 0;
    if (hasBundleDirectory(skillsRoot_)) return 0;

    const QDir examples(exampleDir);
    if (exampleDir.isEmpty() || !examples.exists())
    {
        FlowTracer::warn(FlowChannel::Storage, QStringLiteral("example skills dir missing: %1").arg(exampleDir));
        return 0;
    }

    int copied = 0;
    const QStringList entries = examples.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString &entry : entries)
    {
        if (isDotName(entry)) continue;
        const QString srcPath = examples.filePath(entry);
        if (!QFileInfo(descriptorPath(srcPath)).isFile()) continue;

        QString copyError;
        if (!copyDirectory(srcPath, QDir(skillsRoot_).filePath(entry), &copyError))
        {
            FlowTracer::warn(FlowChannel::Storage, QStringLiteral("failed to seed %1: %2").arg(entry, copyError));
            continue;
        }
        ++copied;
    }
    if (copied > 0)
    {
        FlowTracer::log(FlowChannel::Storage, QStringLiteral("seeded %1 example skill(s) from %2").arg(QString::number(copied), exampleDir));
    }
    return copied;
}

bool SkillStorage::copyDirectory(const QString &sourceDir, const QString &targetDir, QString *error)
{
    QDir src(sourceDir);
    if (!src.exists())
    {
        if (error) *error = QObject::tr("Source directory not found: %1").arg(sourceDir);
        return false;
    }
    QDir target(targetDir);
    if (!target.exists())
    {
        if (!target.mkpath(QStringLiteral(".")))
        {
            if (error) *error = QObject::tr("Failed to create directory: %1").arg(targetDir);
            return false;
        }
    }

    const QFileInfoList entries = src.entryInfoList(QDir::NoDotAndDotDot | QDir::AllEntries | QDir::Hidden | QDir::System);
    for (const QFileInfo &entry : entries)
    {
        // Links could point outside the source tree.
        if (entry.isSymLink()) continue;
        const QString srcPath = entry.absoluteFilePath();
        const QString dstPath = QDir(targetDir).filePath(entry.fileName());
        if (entry.isDir())
        {
            if (!copyDirectory(srcPath, dstPath, error)) return false;
        }
        else
        {
            if (QFileInfo::exists(dstPath) && !QFile::remove(dstPath))
            {
                if (error) *error = QObject::tr("Failed to replace %1").arg(dstPath);
                return false;
            }
            if (!QFile::copy(srcPath, dstPath))
            {
                if (error) *error = QObject::tr("Failed to copy %1 -> %2").arg(srcPath, dstPath);
                return false;
            }
        }
    }
    return true;
}

bool SkillStorage::removeDirectory(const QString &path, QString *error)
{
    QDir dir(path);
    if (!dir.exists()) return true;
    if (dir.removeRecursively()) return true;
    if (error) *error = QObject::tr("Failed to remove %1").arg(path);
    return false;
}

QString SkillStorage::readTextFile(const QString &path, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
    {
        if (error) *error = QObject::tr("Failed to open %1: %2").arg(path, file.errorString());
        return {};
    }
    QTextStream in(&file);
    in.setCodec("utf-8");
    const QString content = in.readAll();
    file.close();
    return content;
}

bool SkillStorage::writeTextFile(const QString &path, const QString &content, QString *error)
{
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly))
    {
        if (error) *error = QObject::tr("Failed to open %1 for writing: %2").arg(path, file.errorString());
        return false;
    }
    const QByteArray data = content.toUtf8();
    if (file.write(data) != data.size() || !file.commit())
    {
        if (error) *error = QObject::tr("Failed to write %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}
