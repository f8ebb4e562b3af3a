#pragma once

#include <QDir>
#include <QFutureWatcher>
#include <QObject>
#include <QString>
#include <QVector>

#include "skill_config_store.h"
#include "skill_import.h"
#include "skill_storage.h"
#include "skill_types.h"
#include "utils/skilldeck_error.h"

struct SkillDraft
{
    QString name;
    QString description;
    QString content;    // full SKILL.md text or a bare body
    QString folderName; // derived from the name when empty
    bool enabled = true;
    SkillScope scope;
};

// Partial update; only fields with has* set are applied.
struct SkillUpdate
{
    bool hasName = false;
    QString name;
    bool hasDescription = false;
    QString description;
    bool hasFileContent = false;
    QString fileContent;
    bool hasEnabled = false;
    bool enabled = true;
    bool hasScope = false;
    SkillScope scope;
};

struct SkillRecordResult
{
    bool ok = false;
    SkillErrorCode code = SkillErrorCode::None;
    QString message;
    SkillRecord record;
};

// Output of the filesystem half of a reconciliation pass.
struct ReconcileSnapshot
{
    bool ok = false;
    SkillErrorCode code = SkillErrorCode::None;
    QString message;
    QVector<ScannedSkill> scanned;
    SkillConfigDocument globalConfig;
    SkillConfigDocument projectConfig;
    bool hasUser = false;
    bool hasProject = false;
    QString userId;                     // config owner the snapshot was collected for
    SkillConfigStore *store = nullptr;
};

// Authoritative in-memory skill list, kept consistent with the skills root and the
// per-user config. Mutations echo into memory first and roll back if persisting fails.
class SkillLibrary : public QObject
{
    Q_OBJECT
public:
    explicit SkillLibrary(QObject *parent = nullptr);
    ~SkillLibrary() override;

    void setSkillsRoot(const QString &skillsRoot);
    QString skillsRoot() const { return skillsRoot_; }
    void setExampleDir(const QString &exampleDir) { exampleDir_ = QDir::cleanPath(exampleDir); }
    QString exampleDir() const { return exampleDir_; }
    void setUserId(const QString &userId) { userId_ = userId.trimmed(); }
    QString userId() const { return userId_; }
    void setProjectConfigPath(const QString &path) { projectConfigPath_ = path; }
    QString projectConfigPath() const { return projectConfigPath_; }

    void setConfigRoot(const QString &configRoot) { ownedStore_.setConfigRoot(configRoot); }
    // nullptr restores the built-in store. The library does not take ownership.
    void setConfigStore(SkillConfigStore *store) { store_ = store ? store : &ownedStore_; }
    SkillConfigStore *configStore() const { return store_; }

    SkillStorage &storage() { return storage_; }
    SkillImportPipeline &importPipeline() { return importer_; }

    SkillResult reconcile();
    // Filesystem work on the Qt Concurrent pool; the list is replaced on this object's thread.
    void reconcileAsync();
    bool isReconciling() const { return reconcileWatcher_.isRunning(); }

    SkillRecordResult addSkill(const SkillDraft &draft);
    SkillResult writeBundle(const QString &folderName, const QString &content);
    SkillResult deleteSkill(const QString &id);
    SkillRecordResult toggleSkill(const QString &id);
    SkillRecordResult updateSkill(const QString &id, const SkillUpdate &update);

    ImportResult importArchive(const ImportRequest &request);
    void importArchiveAsync(const ImportRequest &request);

    const QVector<SkillRecord> &skills() const { return skills_; }
    const SkillRecord *findById(const QString &id) const;
    QVector<SkillRecord> skillsByType(bool isExample) const;
    QVector<SkillRecord> search(const QString &query) const;
    QVector<SkillRecord> enabledSkillsForAgent(const QString &agentName) const;

signals:
    void skillsChanged();
    void reconcileFinished(bool ok, const QString &message);
    void importFinished(bool ok, const QString &message);
    void skillOperationFailed(const QString &message);

private:
    struct ReconcileInputs
    {
        QString skillsRoot;
        QString exampleDir;
        QString userId;
        QString projectConfigPath;
        const SkillConfigStore *store = nullptr;
    };

    ReconcileInputs currentInputs() const;
    static ReconcileSnapshot collectSnapshot(const ReconcileInputs &inputs);
    void applySnapshot(ReconcileSnapshot snapshot);
    void handleReconcileFinished();
    void finalizeImport(const ImportResult &result, bool async);
    int indexOf(const QString &id) const;
    SkillResult failOperation(SkillErrorCode code, const QString &message);

    QString skillsRoot_;
    QString exampleDir_;
    QString userId_;
    QString projectConfigPath_;
    SkillConfigStore ownedStore_;
    SkillConfigStore *store_;
    SkillStorage storage_;
    SkillImportPipeline importer_;
    QVector<SkillRecord> skills_;
    QFutureWatcher<ReconcileSnapshot> reconcileWatcher_;
    bool reconcilePending_ = false;
};
