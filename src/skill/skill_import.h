#pragma once

#include <QByteArray>
#include <QFuture>
#include <QMutex>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QThreadPool>
#include <QVector>
#include <QWaitCondition>
#include <functional>

#include "utils/skilldeck_error.h"

struct ImportRequest
{
    QString archivePath;    // used when useBuffer is false
    QByteArray archiveData; // raw zip bytes when useBuffer is true
    QString archiveName;    // display name for buffer input; fallback folder for a root-level SKILL.md
    bool useBuffer = false;

    // Second pass of a conflicting import: the existing folder names the user agreed to replace.
    // An empty set with hasConfirmations=true means "replace nothing".
    bool hasConfirmations = false;
    QSet<QString> confirmedFolders;

    static ImportRequest fromFile(const QString &path)
    {
        ImportRequest r;
        r.archivePath = path;
        return r;
    }

    static ImportRequest fromBuffer(const QByteArray &data, const QString &name = QString())
    {
        ImportRequest r;
        r.archiveData = data;
        r.archiveName = name;
        r.useBuffer = true;
        return r;
    }

    ImportRequest &confirm(const QStringList &folders)
    {
        hasConfirmations = true;
        for (const QString &folder : folders) confirmedFolders.insert(folder);
        return *this;
    }
};

struct ImportConflict
{
    QString existingFolderName; // folder on disk that already carries the display name
    QString skillName;          // incoming display name
};

struct ImportResult
{
    bool ok = false;
    SkillErrorCode code = SkillErrorCode::None;
    QString message;
    int importedCount = 0;
    QStringList importedFolders;
    QVector<ImportConflict> conflicts;
    quint64 ticket = 0;
};

enum class ImportStage
{
    Queued,
    Started,
    Extracted,
    Committed,
    Finished
};

using ImportStageObserver = std::function<void(quint64 ticket, ImportStage stage)>;

// FIFO ticket lock. Tickets are handed out in call order and served strictly in that order;
// waitTurn() blocks until every earlier ticket has been released.
class ImportQueue
{
public:
    quint64 enqueue();
    void waitTurn(quint64 ticket);
    void release(quint64 ticket);

    class Turn
    {
    public:
        Turn(ImportQueue &queue, quint64 ticket)
            : queue_(queue), ticket_(ticket)
        {
            queue_.waitTurn(ticket_);
        }
        Turn(const Turn &) = delete;
        Turn &operator=(const Turn &) = delete;
        ~Turn() { queue_.release(ticket_); }

    private:
        ImportQueue &queue_;
        quint64 ticket_;
    };

private:
    QMutex mutex_;
    QWaitCondition turnChanged_;
    quint64 nextTicket_ = 1;
    quint64 nowServing_ = 1;
};

// Archive -> scratch extraction -> SKILL.md discovery -> collision check -> staged commit.
// All imports of one pipeline run one at a time in arrival order.
class SkillImportPipeline
{
public:
    explicit SkillImportPipeline(const QString &skillsRoot = QString());
    ~SkillImportPipeline();

    SkillImportPipeline(const SkillImportPipeline &) = delete;
    SkillImportPipeline &operator=(const SkillImportPipeline &) = delete;

    void setSkillsRoot(const QString &skillsRoot);
    QString skillsRoot() const;

    // Called from whichever thread runs the import; must be thread-safe.
    void setStageObserver(ImportStageObserver observer);

    // Blocks until earlier imports of this pipeline have finished.
    ImportResult importArchive(const ImportRequest &request);
    // Ticket is taken now; the work runs on the pipeline's own single-thread pool.
    QFuture<ImportResult> importArchiveAsync(const ImportRequest &request);

    void waitForIdle();

private:
    ImportResult run(const ImportRequest &request, const QString &skillsRoot, quint64 ticket);
    void notify(quint64 ticket, ImportStage stage);

    mutable QMutex stateMutex_;
    QString skillsRoot_;
    ImportStageObserver observer_;
    QMutex submitMutex_;
    ImportQueue queue_;
    QThreadPool pool_;
};

QString importStageName(ImportStage stage);
