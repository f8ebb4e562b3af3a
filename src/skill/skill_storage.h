#pragma once

#include <QString>
#include <QStringList>

#include "utils/skilldeck_error.h"

struct SkillReadResult
{
    bool ok = false;
    SkillErrorCode code = SkillErrorCode::None;
    QString message;
    QString path; // absolute SKILL.md path that was read
    QString content;
};

struct SkillFileListResult
{
    bool ok = false;
    SkillErrorCode code = SkillErrorCode::None;
    QString message;
    QStringList entries; // names; directories carry a trailing '/'
};

struct SkillLocateResult
{
    bool ok = false;
    SkillErrorCode code = SkillErrorCode::None;
    QString message;
    QString folderName;
    QString folderPath;
};

// Single-bundle filesystem operations under one skills root.
// Every caller-supplied folder name goes through resolveSkillDir() first.
class SkillStorage
{
public:
    explicit SkillStorage(const QString &skillsRoot = QString());

    void setSkillsRoot(const QString &skillsRoot);
    QString skillsRoot() const { return skillsRoot_; }

    SkillResult ensureRoot() const;

    // Absolute bundle directory strictly inside the root, or empty with error/code set.
    QString resolveSkillDir(const QString &folderName, QString *error = nullptr, SkillErrorCode *code = nullptr) const;

    SkillResult writeBundle(const QString &folderName, const QString &content) const;
    SkillResult deleteBundle(const QString &folderName) const; // missing folder counts as deleted

    // Accepts an absolute path inside the root (file or bundle directory) or a bare folder name.
    SkillReadResult readSkill(const QString &pathOrFolder) const;
    SkillFileListResult listFiles(const QString &folderName) const;

    // Case-insensitive display-name lookup over the bundles currently on disk.
    SkillLocateResult locateBundle(const QString &skillName) const;

    // Copy bundles from `exampleDir` when the root holds no bundle directory yet.
    // Returns the number of bundles copied.
    int seedExamplesIfEmpty(const QString &exampleDir) const;

    // Recursive copy; symbolic links are skipped.
    static bool copyDirectory(const QString &sourceDir, const QString &targetDir, QString *error = nullptr);
    static bool removeDirectory(const QString &path, QString *error = nullptr);

    static QString readTextFile(const QString &path, QString *error = nullptr);
    static bool writeTextFile(const QString &path, const QString &content, QString *error = nullptr);

private:
    QString skillsRoot_;
};
