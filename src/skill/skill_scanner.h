#pragma once

#include <QString>
#include <QVector>

#include "skill_types.h"
#include "utils/skilldeck_error.h"

struct ScanResult
{
    bool ok = false;
    SkillErrorCode code = SkillErrorCode::None;
    QString message;
    QVector<ScannedSkill> skills; // directory-listing order
};

// Walks the immediate subdirectories of a skills root. A directory counts as a bundle
// when its SKILL.md parses; anything else is skipped without failing the scan.
class SkillScanner
{
public:
    // isExample is derived from `exampleDir/<folder>/SKILL.md` existing; no stored flag.
    static ScanResult scan(const QString &root, const QString &exampleDir);
};
