#include "skill_library.h"

#include <QDateTime>
#include <QFileInfo>
#include <QHash>
#include <QtConcurrent/QtConcurrentRun>
#include <algorithm>

#include "skill_descriptor.h"
#include "skill_scanner.h"
#include "utils/flowtracer.h"

namespace
{
ReconcileSnapshot abortSnapshot(SkillErrorCode code, const QString &message)
{
    ReconcileSnapshot snapshot;
    snapshot.code = code;
    snapshot.message = message;
    FlowTracer::warn(FlowChannel::Reconcile, formatSkillError(code, message));
    return snapshot;
}

// Fill every field the stored entry left out.
SkillConfigEntry completeEntry(const SkillConfigEntry &stored, qint64 fallbackAddedAt, bool scannedIsExample)
{
    return SkillConfigEntry::make(stored.hasEnabled ? stored.enabled : true,
                                  stored.hasScope ? stored.scope : SkillScope(),
                                  stored.hasAddedAt ? stored.addedAt : fallbackAddedAt,
                                  stored.hasIsExample ? stored.isExample : scannedIsExample);
}
} // namespace

SkillLibrary::SkillLibrary(QObject *parent)
    : QObject(parent), store_(&ownedStore_)
{
    connect(&reconcileWatcher_, &QFutureWatcher<ReconcileSnapshot>::finished, this,
            &SkillLibrary::handleReconcileFinished);
}

SkillLibrary::~SkillLibrary()
{
    reconcileWatcher_.waitForFinished();
    importer_.waitForIdle();
}

void SkillLibrary::setSkillsRoot(const QString &skillsRoot)
{
    skillsRoot_ = QDir::cleanPath(skillsRoot);
    storage_.setSkillsRoot(skillsRoot_);
    importer_.setSkillsRoot(skillsRoot_);
}

SkillLibrary::ReconcileInputs SkillLibrary::currentInputs() const
{
    ReconcileInputs inputs;
    inputs.skillsRoot = skillsRoot_;
    inputs.exampleDir = exampleDir_;
    inputs.userId = userId_;
    inputs.projectConfigPath = projectConfigPath_;
    inputs.store = store_;
    return inputs;
}

ReconcileSnapshot SkillLibrary::collectSnapshot(const ReconcileInputs &inputs)
{
    const SkillStorage storage(inputs.skillsRoot);
    const SkillResult rootReady = storage.ensureRoot();
    if (!rootReady.ok) return abortSnapshot(rootReady.code, rootReady.message);
    storage.seedExamplesIfEmpty(inputs.exampleDir);

    const bool hasUser = !inputs.userId.isEmpty() && inputs.store;
    if (hasUser && !inputs.exampleDir.isEmpty())
    {
        const QString defaultsPath = QDir(inputs.exampleDir).filePath(QString::fromUtf8(kDefaultSkillConfigFileName));
        const DefaultsMergeResult merged = inputs.store->initializeDefaults(inputs.userId, defaultsPath);
        if (!merged.ok)
        {
            FlowTracer::warn(FlowChannel::Reconcile, QStringLiteral("default config merge failed: %1").arg(merged.message));
        }
    }

    const ScanResult scan = SkillScanner::scan(inputs.skillsRoot, inputs.exampleDir);
    if (!scan.ok) return abortSnapshot(scan.code, scan.message);

    ReconcileSnapshot snapshot;
    snapshot.scanned = scan.skills;
    snapshot.hasUser = hasUser;
    snapshot.userId = inputs.userId;
    snapshot.store = inputs.store;
    if (hasUser)
    {
        const ConfigLoadResult global = inputs.store->load(inputs.userId);
        if (!global.ok) return abortSnapshot(global.code, global.message);
        snapshot.globalConfig = global.document;
    }
    if (!inputs.projectConfigPath.isEmpty())
    {
        const ConfigLoadResult project = SkillConfigStore::loadFile(inputs.projectConfigPath);
        if (!project.ok) return abortSnapshot(project.code, project.message);
        snapshot.hasProject = project.exists;
        snapshot.projectConfig = project.document;
    }
    snapshot.ok = true;
    return snapshot;
}

void SkillLibrary::applySnapshot(ReconcileSnapshot snapshot)
{
    QHash<QString, SkillRecord> previous;
    for (const SkillRecord &rec : qAsConst(skills_)) previous.insert(rec.skillDirName, rec);

    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    QMap<QString, SkillConfigEntry> &global = snapshot.globalConfig.skills;
    QVector<SkillRecord> next;
    next.reserve(snapshot.scanned.size());

    for (const ScannedSkill &scanned : qAsConst(snapshot.scanned))
    {
        const auto prev = previous.constFind(scanned.skillDirName);
        const bool hasPrev = prev != previous.constEnd();
        const qint64 fallbackAddedAt = hasPrev ? prev->addedAt : now;

        SkillConfigEntry entry;
        if (snapshot.hasProject && snapshot.projectConfig.skills.contains(scanned.name))
        {
            entry = completeEntry(snapshot.projectConfig.skills.value(scanned.name), fallbackAddedAt, scanned.isExample);
        }
        else if (global.contains(scanned.name))
        {
            entry = completeEntry(global.value(scanned.name), fallbackAddedAt, scanned.isExample);
        }
        else
        {
            entry = SkillConfigEntry::make(true, SkillScope(), fallbackAddedAt, scanned.isExample);
            if (snapshot.hasUser)
            {
                const SkillResult registered = snapshot.store->update(snapshot.userId, scanned.name, entry);
                if (registered.ok)
                {
                    FlowTracer::log(FlowChannel::Reconcile, QStringLiteral("registered %1").arg(scanned.name));
                }
                else
                {
                    FlowTracer::warn(FlowChannel::Reconcile,
                                     QStringLiteral("failed to register %1: %2").arg(scanned.name, registered.describe()));
                }
            }
            global.insert(scanned.name, entry);
        }

        SkillRecord rec;
        rec.id = SkillRecord::idForDir(scanned.skillDirName);
        rec.name = scanned.name;
        rec.description = scanned.description;
        rec.filePath = scanned.path;
        rec.fileContent = hasPrev ? prev->fileContent : QString();
        rec.skillDirName = scanned.skillDirName;
        rec.addedAt = entry.addedAt;
        rec.scope = entry.scope;
        rec.enabled = entry.enabled;
        rec.isExample = entry.isExample;
        next.push_back(rec);
    }

    std::stable_sort(next.begin(), next.end(), [](const SkillRecord &a, const SkillRecord &b)
                     { return a.name < b.name; });
    skills_ = next;
    FlowTracer::log(FlowChannel::Reconcile, QStringLiteral("%1 skill(s) in library").arg(skills_.size()));
    emit skillsChanged();
}

SkillResult SkillLibrary::reconcile()
{
    const ReconcileSnapshot snapshot = collectSnapshot(currentInputs());
    if (!snapshot.ok)
    {
        emit reconcileFinished(false, formatSkillError(snapshot.code, snapshot.message));
        return SkillResult::failure(snapshot.code, snapshot.message);
    }
    applySnapshot(snapshot);
    emit reconcileFinished(true, QString());
    return SkillResult::success();
}

void SkillLibrary::reconcileAsync()
{
    if (reconcileWatcher_.isRunning())
    {
        reconcilePending_ = true;
        return;
    }
    const ReconcileInputs inputs = currentInputs();
    reconcileWatcher_.setFuture(QtConcurrent::run([inputs]() { return collectSnapshot(inputs); }));
}

void SkillLibrary::handleReconcileFinished()
{
    const ReconcileSnapshot snapshot = reconcileWatcher_.result();
    if (snapshot.ok)
    {
        applySnapshot(snapshot);
        emit reconcileFinished(true, QString());
    }
    else
    {
        emit reconcileFinished(false, formatSkillError(snapshot.code, snapshot.message));
    }
    if (reconcilePending_)
    {
        reconcilePending_ = false;
        reconcileAsync();
    }
}

int SkillLibrary::indexOf(const QString &id) const
{
    for (int i = 0; i < skills_.size(); ++i)
    {
        if (skills_.at(i).id == id) return i;
    }
    return -1;
}

SkillResult SkillLibrary::failOperation(SkillErrorCode code, const QString &message)
{
    const SkillResult result = SkillResult::failure(code, message);
    FlowTracer::warn(FlowChannel::Mutation, result.describe());
    emit skillOperationFailed(result.describe());
    return result;
}

SkillRecordResult SkillLibrary::addSkill(const SkillDraft &draft)
{
    SkillRecordResult result;
    SkillDescriptor parsed;
    const bool hasDescriptor = SkillDescriptor::parse(draft.content, &parsed);
    const QString name = hasDescriptor ? parsed.name : draft.name.trimmed();
    const QString description = hasDescriptor ? parsed.description : draft.description.trimmed();
    const QString body = hasDescriptor ? parsed.body : draft.content;
    if (name.isEmpty() || description.isEmpty())
    {
        const SkillResult failed = failOperation(SkillErrorCode::InvalidInput, tr("Skill name and description are required."));
        result.code = failed.code;
        result.message = failed.message;
        return result;
    }

    const QString content = SkillDescriptor::build(name, description, body);
    const QString folder =
        draft.folderName.trimmed().isEmpty() ? SkillDescriptor::dirNameFromSkillName(name) : draft.folderName.trimmed();

    const SkillResult written = storage_.writeBundle(folder, content);
    if (!written.ok)
    {
        if (written.code == SkillErrorCode::UnsafePath || written.code == SkillErrorCode::InvalidInput)
        {
            const SkillResult failed = failOperation(written.code, written.message);
            result.code = failed.code;
            result.message = failed.message;
            return result;
        }
        FlowTracer::warn(FlowChannel::Mutation, QStringLiteral("write %1 failed: %2").arg(folder, written.describe()));
    }

    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    if (!userId_.isEmpty())
    {
        const SkillResult saved = store_->update(userId_, name, SkillConfigEntry::make(draft.enabled, draft.scope, now, false));
        if (!saved.ok)
        {
            FlowTracer::warn(FlowChannel::Mutation, QStringLiteral("config for %1 not saved: %2").arg(name, saved.describe()));
        }
    }

    SkillRecord rec;
    rec.id = SkillRecord::idForDir(folder);
    rec.name = name;
    rec.description = description;
    rec.filePath = QDir(QDir(skillsRoot_).filePath(folder)).filePath(QString::fromUtf8(kSkillFileName));
    rec.fileContent = content;
    rec.skillDirName = folder;
    rec.addedAt = now;
    rec.scope = draft.scope;
    rec.enabled = draft.enabled;
    rec.isExample = false;

    const int existing = indexOf(rec.id);
    if (existing >= 0) skills_.remove(existing);
    skills_.prepend(rec);
    FlowTracer::log(FlowChannel::Mutation, QStringLiteral("added %1 (%2)").arg(name, folder));
    emit skillsChanged();

    result.ok = true;
    result.record = rec;
    return result;
}

SkillResult SkillLibrary::writeBundle(const QString &folderName, const QString &content)
{
    const SkillResult written = storage_.writeBundle(folderName, content);
    if (!written.ok) return failOperation(written.code, written.message);
    return written;
}

SkillResult SkillLibrary::deleteSkill(const QString &id)
{
    const int idx = indexOf(id);
    if (idx < 0) return failOperation(SkillErrorCode::NotFound, tr("Skill not found: %1").arg(id));

    const SkillRecord rec = skills_.at(idx);
    if (rec.isExample)
    {
        FlowTracer::log(FlowChannel::Mutation, QStringLiteral("keep example %1").arg(rec.skillDirName));
        return SkillResult::success();
    }

    const SkillResult removed = storage_.deleteBundle(rec.skillDirName);
    if (!removed.ok)
    {
        FlowTracer::warn(FlowChannel::Mutation, QStringLiteral("delete %1 failed: %2").arg(rec.skillDirName, removed.describe()));
    }
    if (!userId_.isEmpty())
    {
        const SkillResult unregistered = store_->remove(userId_, rec.name);
        if (!unregistered.ok)
        {
            FlowTracer::warn(FlowChannel::Mutation,
                             QStringLiteral("config entry for %1 not removed: %2").arg(rec.name, unregistered.describe()));
        }
    }

    skills_.remove(idx);
    FlowTracer::log(FlowChannel::Mutation, QStringLiteral("deleted %1").arg(rec.skillDirName));
    emit skillsChanged();
    return SkillResult::success();
}

SkillRecordResult SkillLibrary::toggleSkill(const QString &id)
{
    SkillRecordResult result;
    int idx = indexOf(id);
    if (idx < 0)
    {
        const SkillResult failed = failOperation(SkillErrorCode::NotFound, tr("Skill not found: %1").arg(id));
        result.code = failed.code;
        result.message = failed.message;
        return result;
    }

    const bool enabled = !skills_.at(idx).enabled;
    skills_[idx].enabled = enabled;
    const QString name = skills_.at(idx).name;
    emit skillsChanged();

    if (!userId_.isEmpty())
    {
        const ConfigEntryResult saved = store_->toggle(userId_, name, enabled);
        if (!saved.ok)
        {
            idx = indexOf(id);
            if (idx >= 0)
            {
                skills_[idx].enabled = !enabled;
                emit skillsChanged();
            }
            const SkillResult failed = failOperation(saved.code, saved.message);
            result.code = failed.code;
            result.message = failed.message;
            return result;
        }
    }

    idx = indexOf(id);
    result.ok = true;
    if (idx >= 0) result.record = skills_.at(idx);
    return result;
}

SkillRecordResult SkillLibrary::updateSkill(const QString &id, const SkillUpdate &update)
{
    SkillRecordResult result;
    int idx = indexOf(id);
    if (idx < 0)
    {
        const SkillResult failed = failOperation(SkillErrorCode::NotFound, tr("Skill not found: %1").arg(id));
        result.code = failed.code;
        result.message = failed.message;
        return result;
    }

    const SkillRecord before = skills_.at(idx);
    SkillRecord &rec = skills_[idx];
    if (update.hasName) rec.name = update.name;
    if (update.hasDescription) rec.description = update.description;
    if (update.hasFileContent) rec.fileContent = update.fileContent;
    if (update.hasEnabled) rec.enabled = update.enabled;
    if (update.hasScope) rec.scope = update.scope;
    const SkillRecord after = rec;
    emit skillsChanged();

    const bool configChanged = after.enabled != before.enabled || after.scope != before.scope;
    if (configChanged && !userId_.isEmpty())
    {
        // Config stays keyed by the name the bundle carries on disk.
        const SkillResult saved = store_->update(
            userId_, before.name, SkillConfigEntry::make(after.enabled, after.scope, after.addedAt, after.isExample));
        if (!saved.ok)
        {
            idx = indexOf(id);
            if (idx >= 0)
            {
                skills_[idx] = before;
                emit skillsChanged();
            }
            const SkillResult failed = failOperation(saved.code, saved.message);
            result.code = failed.code;
            result.message = failed.message;
            return result;
        }
    }

    result.ok = true;
    result.record = after;
    return result;
}

ImportResult SkillLibrary::importArchive(const ImportRequest &request)
{
    const ImportResult result = importer_.importArchive(request);
    finalizeImport(result, false);
    return result;
}

void SkillLibrary::importArchiveAsync(const ImportRequest &request)
{
    auto *watcher = new QFutureWatcher<ImportResult>(this);
    connect(watcher, &QFutureWatcher<ImportResult>::finished, this, [this, watcher]()
            {
                finalizeImport(watcher->result(), true);
                watcher->deleteLater(); });
    watcher->setFuture(importer_.importArchiveAsync(request));
}

void SkillLibrary::finalizeImport(const ImportResult &result, bool async)
{
    if (result.ok && result.importedCount > 0 && async)
    {
        reconcileAsync();
    }
    else if (result.ok && result.importedCount > 0)
    {
        const SkillResult reconciled = reconcile();
        if (!reconciled.ok)
        {
            FlowTracer::warn(FlowChannel::Import, QStringLiteral("post-import reconcile failed: %1").arg(reconciled.describe()));
        }
    }
    const QString message = result.ok ? result.message : formatSkillError(result.code, result.message);
    if (!result.ok && result.code != SkillErrorCode::Conflict) emit skillOperationFailed(message);
    emit importFinished(result.ok, message);
}

const SkillRecord *SkillLibrary::findById(const QString &id) const
{
    const int idx = indexOf(id);
    return idx < 0 ? nullptr : &skills_.at(idx);
}

QVector<SkillRecord> SkillLibrary::skillsByType(bool isExample) const
{
    QVector<SkillRecord> out;
    for (const SkillRecord &rec : skills_)
    {
        if (rec.isExample == isExample) out.push_back(rec);
    }
    return out;
}

QVector<SkillRecord> SkillLibrary::search(const QString &query) const
{
    const QString needle = query.trimmed();
    if (needle.isEmpty()) return skills_;
    QVector<SkillRecord> out;
    for (const SkillRecord &rec : skills_)
    {
        if (rec.name.contains(needle, Qt::CaseInsensitive) || rec.description.contains(needle, Qt::CaseInsensitive))
        {
            out.push_back(rec);
        }
    }
    return out;
}

QVector<SkillRecord> SkillLibrary::enabledSkillsForAgent(const QString &agentName) const
{
    QVector<SkillRecord> out;
    for (const SkillRecord &rec : skills_)
    {
        if (!rec.enabled) continue;
        if (rec.scope.isGlobal || rec.scope.selectedAgents.contains(agentName)) out.push_back(rec);
    }
    return out;
}
