#pragma once

#include <QString>

#include "skill_types.h"
#include "utils/skilldeck_error.h"

struct ConfigLoadResult
{
    bool ok = false;
    SkillErrorCode code = SkillErrorCode::None;
    QString message;
    SkillConfigDocument document;
    bool exists = false;  // file was present before the call
    bool created = false; // file was auto-provisioned by this call
};

struct ConfigEntryResult
{
    bool ok = false;
    SkillErrorCode code = SkillErrorCode::None;
    QString message;
    SkillConfigEntry entry;
};

struct DefaultsMergeResult
{
    bool ok = false;
    SkillErrorCode code = SkillErrorCode::None;
    QString message;
    int added = 0;
    SkillConfigDocument document;
};

// Per-user skills-config.json under <configRoot>/<userId>/.
// Each mutation is read, change one entry, write back. Persistence is best-effort:
// QSaveFile gives write-then-rename, but there is no cross-process locking.
class SkillConfigStore
{
public:
    explicit SkillConfigStore(const QString &configRoot = QString());
    virtual ~SkillConfigStore() = default;

    void setConfigRoot(const QString &configRoot);
    QString configRoot() const { return configRoot_; }

    QString configPathForUser(const QString &userId, QString *error = nullptr, SkillErrorCode *code = nullptr) const;

    // Missing file: persist and return {version:1, skills:{}}.
    // Unreadable or corrupt file: failure, the file is left untouched.
    virtual ConfigLoadResult load(const QString &userId) const;
    virtual SkillResult save(const QString &userId, const SkillConfigDocument &doc) const;

    // Merge the bundled default-config.json, adding only names absent from the user document.
    DefaultsMergeResult initializeDefaults(const QString &userId, const QString &defaultConfigPath) const;

    virtual ConfigEntryResult toggle(const QString &userId, const QString &skillName, bool enabled) const;
    virtual SkillResult update(const QString &userId, const QString &skillName, const SkillConfigEntry &entry) const;
    virtual SkillResult remove(const QString &userId, const QString &skillName) const;

    // Read-only load of an arbitrary document (project overlay, default template).
    // A missing file is ok with exists=false; it is never created.
    static ConfigLoadResult loadFile(const QString &path);
    static SkillResult saveFile(const QString &path, const SkillConfigDocument &doc);

private:
    QString configRoot_;
};
