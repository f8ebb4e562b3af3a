#include "skill_import.h"

#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QMutexLocker>
#include <QTemporaryDir>
#include <QTemporaryFile>
#include <QtConcurrent/QtConcurrentRun>

#include "skill_descriptor.h"
#include "skill_storage.h"
#include "skill_types.h"
#include "utils/flowtracer.h"
#include "utils/pathutil.h"
#include "utils/zip_extractor.h"

namespace
{
struct PlannedBundle
{
    QString sourceDir;
    QString skillName;
    QString destFolder;
    QString replacedFolder; // existing folder removed right before the rename
};

ImportResult failure(SkillErrorCode code, const QString &message, quint64 ticket)
{
    ImportResult result;
    result.code = code;
    result.message = message;
    result.ticket = ticket;
    return result;
}

QString folderKey(const QString &name)
{
    return pathCaseSensitivity() == Qt::CaseInsensitive ? name.toLower() : name;
}

// Every directory below `dir` that holds a SKILL.md, including `dir` itself.
void collectSkillDirs(const QString &dir, QStringList *out)
{
    const QFileInfoList entries =
        QDir(dir).entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::NoSymLinks, QDir::Name);
    for (const QFileInfo &entry : entries)
    {
        if (isDotName(entry.fileName()) || entry.isSymLink()) continue;
        if (entry.isDir())
        {
            collectSkillDirs(entry.absoluteFilePath(), out);
        }
        else if (entry.fileName() == QString::fromUtf8(kSkillFileName))
        {
            out->append(QDir::cleanPath(dir));
        }
    }
}

// lower-cased display name -> folder name, for bundles already in the root
QHash<QString, QString> indexExistingNames(const QString &root)
{
    QHash<QString, QString> index;
    const QFileInfoList dirs =
        QDir(root).entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::NoSymLinks, QDir::Name);
    for (const QFileInfo &dir : dirs)
    {
        if (isDotName(dir.fileName())) continue;
        const QString file = QDir(dir.absoluteFilePath()).filePath(QString::fromUtf8(kSkillFileName));
        if (!QFileInfo(file).isFile()) continue;
        QString error;
        const QString raw = SkillStorage::readTextFile(file, &error);
        if (!error.isEmpty()) continue;
        const QString name = SkillDescriptor::peekName(raw);
        if (!name.isEmpty()) index.insert(name.toLower(), dir.fileName());
    }
    return index;
}

QString readIncomingName(const QString &skillDir, const QString &fallback)
{
    QString error;
    const QString raw = SkillStorage::readTextFile(QDir(skillDir).filePath(QString::fromUtf8(kSkillFileName)), &error);
    if (!error.isEmpty()) return fallback;
    const QString name = SkillDescriptor::peekName(raw);
    return name.isEmpty() ? fallback : name;
}
} // namespace

QString importStageName(ImportStage stage)
{
    switch (stage)
    {
    case ImportStage::Queued: return QStringLiteral("queued");
    case ImportStage::Started: return QStringLiteral("started");
    case ImportStage::Extracted: return QStringLiteral("extracted");
    case ImportStage::Committed: return QStringLiteral("committed");
    case ImportStage::Finished: return QStringLiteral("finished");
    }
    return QStringLiteral("unknown");
}

quint64 ImportQueue::enqueue()
{
    QMutexLocker locker(&mutex_);
    return nextTicket_++;
}

void ImportQueue::waitTurn(quint64 ticket)
{
    QMutexLocker locker(&mutex_);
    while (nowServing_ != ticket) turnChanged_.wait(&mutex_);
}

void ImportQueue::release(quint64 ticket)
{
    QMutexLocker locker(&mutex_);
    if (nowServing_ != ticket) return;
    ++nowServing_;
    turnChanged_.wakeAll();
}

SkillImportPipeline::SkillImportPipeline(const QString &skillsRoot)
    : skillsRoot_(QDir::cleanPath(skillsRoot))
{
    pool_.setMaxThreadCount(1);
}

SkillImportPipeline::~SkillImportPipeline()
{
    pool_.waitForDone();
}

void SkillImportPipeline::setSkillsRoot(const QString &skillsRoot)
{
    QMutexLocker locker(&stateMutex_);
    skillsRoot_ = QDir::cleanPath(skillsRoot);
}

QString SkillImportPipeline::skillsRoot() const
{
    QMutexLocker locker(&stateMutex_);
    return skillsRoot_;
}

void SkillImportPipeline::setStageObserver(ImportStageObserver observer)
{
    QMutexLocker locker(&stateMutex_);
    observer_ = std::move(observer);
}

void SkillImportPipeline::notify(quint64 ticket, ImportStage stage)
{
    ImportStageObserver observer;
    {
        QMutexLocker locker(&stateMutex_);
        observer = observer_;
    }
    FlowTracer::log(FlowChannel::Import, importStageName(stage), ticket);
    if (observer) observer(ticket, stage);
}

ImportResult SkillImportPipeline::importArchive(const ImportRequest &request)
{
    quint64 ticket = 0;
    QString root;
    {
        QMutexLocker locker(&submitMutex_);
        ticket = queue_.enqueue();
        root = skillsRoot();
        notify(ticket, ImportStage::Queued);
    }
    ImportQueue::Turn turn(queue_, ticket);
    ImportResult result = run(request, root, ticket);
    notify(ticket, ImportStage::Finished);
    return result;
}

QFuture<ImportResult> SkillImportPipeline::importArchiveAsync(const ImportRequest &request)
{
    QMutexLocker locker(&submitMutex_);
    const quint64 ticket = queue_.enqueue();
    const QString root = skillsRoot();
    notify(ticket, ImportStage::Queued);
    return QtConcurrent::run(&pool_, [this, request, root, ticket]() -> ImportResult
                             {
                                 ImportQueue::Turn turn(queue_, ticket);
                                 ImportResult result = run(request, root, ticket);
                                 notify(ticket, ImportStage::Finished);
                                 return result; });
}

void SkillImportPipeline::waitForIdle()
{
    pool_.waitForDone();
}

ImportResult SkillImportPipeline::run(const ImportRequest &request, const QString &skillsRoot, quint64 ticket)
{
    notify(ticket, ImportStage::Started);
    if (skillsRoot.isEmpty())
    {
        return failure(SkillErrorCode::InvalidInput, QObject::tr("Skills directory is not configured."), ticket);
    }

    // Buffer input is staged as a scratch .zip that QTemporaryFile removes on every path.
    QTemporaryFile scratchArchive(QDir(QDir::tempPath()).filePath(QStringLiteral("skilldeck-skill-import-XXXXXX.zip")));
    QString archivePath = request.archivePath;
    QString fallbackName;
    if (request.useBuffer)
    {
        if (!zip::looksLikeZip(request.archiveData.left(4)))
        {
            return failure(SkillErrorCode::InvalidInput, QObject::tr("Buffer is not a zip archive."), ticket);
        }
        if (!scratchArchive.open() || scratchArchive.write(request.archiveData) != request.archiveData.size())
        {
            return failure(SkillErrorCode::IoFailure,
                           QObject::tr("Failed to stage archive buffer: %1").arg(scratchArchive.errorString()), ticket);
        }
        scratchArchive.close();
        archivePath = scratchArchive.fileName();
        fallbackName = request.archiveName.isEmpty() ? QStringLiteral("skill")
                                                     : QFileInfo(request.archiveName).completeBaseName();
    }

    const QFileInfo archiveInfo(archivePath);
    if (archivePath.isEmpty() || !archiveInfo.isFile())
    {
        return failure(SkillErrorCode::NotFound, QObject::tr("Zip file does not exist: %1").arg(archivePath), ticket);
    }
    if (archiveInfo.suffix().compare(QStringLiteral("zip"), Qt::CaseInsensitive) != 0)
    {
        return failure(SkillErrorCode::InvalidInput, QObject::tr("Only .zip files are supported."), ticket);
    }
    if (fallbackName.isEmpty()) fallbackName = archiveInfo.completeBaseName();

    QDir rootDir(skillsRoot);
    if (!rootDir.exists() && !rootDir.mkpath(QStringLiteral(".")))
    {
        return failure(SkillErrorCode::IoFailure, QObject::tr("Failed to create skills directory: %1").arg(skillsRoot),
                       ticket);
    }

    QTemporaryDir extractDir(QDir(QDir::tempPath()).filePath(QStringLiteral("skilldeck-skill-extract-XXXXXX")));
    if (!extractDir.isValid())
    {
        return failure(SkillErrorCode::IoFailure, QObject::tr("Failed to create temporary directory for extraction."),
                       ticket);
    }
    const QString extractRoot = QDir::cleanPath(extractDir.path());

    QString extractError;
    SkillErrorCode extractCode = SkillErrorCode::None;
    if (!zip::extractArchive(archiveInfo.absoluteFilePath(), extractRoot, &extractError, &extractCode))
    {
        FlowTracer::warn(FlowChannel::Import, extractError, ticket);
        return failure(extractCode == SkillErrorCode::None ? SkillErrorCode::InvalidInput : extractCode,
                       extractError.isEmpty() ? QObject::tr("Archive extraction failed.") : extractError, ticket);
    }
    notify(ticket, ImportStage::Extracted);

    QStringList candidates;
    collectSkillDirs(extractRoot, &candidates);
    if (candidates.isEmpty())
    {
        return failure(SkillErrorCode::InvalidInput, QObject::tr("No SKILL.md files found in zip archive."), ticket);
    }

    const QHash<QString, QString> existingNames = indexExistingNames(skillsRoot);
    QVector<ImportConflict> conflicts;
    QVector<PlannedBundle> plan;
    QSet<QString> reserved;
    QSet<QString> replaced;

    for (const QString &candidateDir : candidates)
    {
        const bool atRoot = candidateDir.compare(extractRoot, pathCaseSensitivity()) == 0;
        const QString fallback = atRoot ? fallbackName : QFileInfo(candidateDir).fileName();
        const QString incomingName = readIncomingName(candidateDir, fallback);

        PlannedBundle bundle;
        bundle.sourceDir = candidateDir;
        bundle.skillName = incomingName;

        // A folder already claimed by an earlier candidate is replaced only once.
        const auto existing = existingNames.constFind(incomingName.toLower());
        const bool claimed = existing != existingNames.constEnd() && request.hasConfirmations &&
                             replaced.contains(folderKey(existing.value()));
        if (existing != existingNames.constEnd() && !claimed)
        {
            if (!request.hasConfirmations)
            {
                conflicts.push_back({existing.value(), incomingName});
                continue;
            }
            if (!request.confirmedFolders.contains(existing.value()))
            {
                FlowTracer::log(FlowChannel::Import, QStringLiteral("skip %1: replacement declined").arg(incomingName),
                                ticket);
                continue;
            }
            bundle.replacedFolder = existing.value();
            replaced.insert(folderKey(existing.value()));
        }

        const QString base = SkillDescriptor::dirNameFromSkillName(incomingName, fallback);
        QString dest = base;
        int suffix = 2;
        while (reserved.contains(folderKey(dest)) ||
               (QFileInfo::exists(rootDir.filePath(dest)) && !replaced.contains(folderKey(dest))))
        {
            dest = QStringLiteral("%1-%2").arg(base, QString::number(suffix++));
        }
        reserved.insert(folderKey(dest));
        bundle.destFolder = dest;
        plan.push_back(bundle);
    }

    if (!conflicts.isEmpty())
    {
        ImportResult result = failure(SkillErrorCode::Conflict,
                                      QObject::tr("%1 skill(s) already exist.").arg(conflicts.size()), ticket);
        result.conflicts = conflicts;
        FlowTracer::log(FlowChannel::Import, formatSkillError(result.code, result.message), ticket);
        return result;
    }

    ImportResult result;
    result.ticket = ticket;
    for (int i = 0; i < plan.size(); ++i)
    {
        const PlannedBundle &bundle = plan.at(i);
        const QString stagingName = QStringLiteral(".skilldeck-staging-%1-%2").arg(QString::number(ticket), QString::number(i));
        const QString stagingPath = rootDir.filePath(stagingName);
        QString error;
        bool committed = SkillStorage::removeDirectory(stagingPath, &error) &&
                         SkillStorage::copyDirectory(bundle.sourceDir, stagingPath, &error);
        if (committed && !bundle.replacedFolder.isEmpty())
        {
            committed = SkillStorage::removeDirectory(rootDir.filePath(bundle.replacedFolder), &error);
        }
        if (committed && QFileInfo::exists(rootDir.filePath(bundle.destFolder)))
        {
            error = QObject::tr("Destination already exists: %1").arg(bundle.destFolder);
            committed = false;
        }
        if (committed && !rootDir.rename(stagingName, bundle.destFolder))
        {
            error = QObject::tr("Failed to move %1 into place").arg(bundle.destFolder);
            committed = false;
        }
        if (!committed)
        {
            QString cleanupError;
            if (!SkillStorage::removeDirectory(stagingPath, &cleanupError))
            {
                FlowTracer::warn(FlowChannel::Import, cleanupError, ticket);
            }
            FlowTracer::warn(FlowChannel::Import, QStringLiteral("failed to import %1: %2").arg(bundle.skillName, error), ticket);
            continue;
        }
        result.importedFolders << bundle.destFolder;
        FlowTracer::log(FlowChannel::Import, QStringLiteral("imported %1 -> %2").arg(bundle.skillName, bundle.destFolder), ticket);
    }
    notify(ticket, ImportStage::Committed);

    result.importedCount = result.importedFolders.size();
    if (!plan.isEmpty() && result.importedCount == 0)
    {
        result.code = SkillErrorCode::IoFailure;
        result.message = QObject::tr("Failed to import skills from archive.");
        return result;
    }
    result.ok = true;
    result.message = QObject::tr("Imported %1 skill(s).").arg(result.importedCount);
    return result;
}
