#include "skill_scanner.h"

#include <QDir>
#include <QFileInfo>
#include <QObject>

#include "skill_descriptor.h"
#include "skill_storage.h"
#include "utils/flowtracer.h"
#include "utils/pathutil.h"

ScanResult SkillScanner::scan(const QString &root, const QString &exampleDir)
{
    ScanResult result;
    const QFileInfo rootInfo(root);
    if (!rootInfo.exists())
    {
        result.ok = true;
        return result;
    }
    if (!rootInfo.isDir() || !rootInfo.isReadable())
    {
        result.code = SkillErrorCode::IoFailure;
        result.message = QObject::tr("Skills directory is not readable: %1").arg(root);
        FlowTracer::warn(FlowChannel::Scan, result.message);
        return result;
    }

    const QDir rootDir(root);
    const QFileInfoList entries =
        rootDir.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::NoSymLinks, QDir::Unsorted);
    for (const QFileInfo &entry : entries)
    {
        const QString folder = entry.fileName();
        if (isDotName(folder)) continue;

        const QString skillFile = QDir(entry.absoluteFilePath()).filePath(QString::fromUtf8(kSkillFileName));
        if (!QFileInfo(skillFile).isFile()) continue;

        QString readError;
        const QString raw = SkillStorage::readTextFile(skillFile, &readError);
        if (!readError.isEmpty())
        {
            FlowTracer::warn(FlowChannel::Scan, QStringLiteral("skip %1: %2").arg(folder, readError));
            continue;
        }

        SkillDescriptor descriptor;
        if (!SkillDescriptor::parse(raw, &descriptor))
        {
            FlowTracer::warn(FlowChannel::Scan, QStringLiteral("skip %1: invalid SKILL.md front matter").arg(folder));
            continue;
        }

        ScannedSkill skill;
        skill.name = descriptor.name;
        skill.description = descriptor.description;
        skill.path = QDir::cleanPath(QFileInfo(skillFile).absoluteFilePath());
        skill.skillDirName = folder;
        skill.isExample = !exampleDir.isEmpty() &&
                          QFileInfo(QDir(exampleDir).filePath(folder + QChar('/') + QString::fromUtf8(kSkillFileName)))
                              .isFile();
        result.skills.push_back(skill);
    }

    result.ok = true;
    FlowTracer::log(FlowChannel::Scan, QStringLiteral("%1 bundle(s) under %2").arg(QString::number(result.skills.size()), root));
    return result;
}
