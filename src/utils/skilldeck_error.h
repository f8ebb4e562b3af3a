#ifndef SKILLDECK_ERROR_H
#define SKILLDECK_ERROR_H

#include <QString>

// Error categories shared by every skill operation.
// - Tags stay stable so logs and hosts can match on them.
// - NF = referenced bundle/config/file missing
// - IN = malformed caller input (archive extension, empty identifier, non-zip buffer)
// - PATH = traversal or containment violation
// - CONFLICT = display-name collision during import (recoverable)
// - IO = filesystem failure
enum class SkillErrorCode
{
    None = 0,
    NotFound,
    InvalidInput,
    UnsafePath,
    Conflict,
    IoFailure,
};

inline QString skillErrorCodeTag(SkillErrorCode code)
{
    switch (code)
    {
    case SkillErrorCode::NotFound: return QStringLiteral("SKD-NF-001");
    case SkillErrorCode::InvalidInput: return QStringLiteral("SKD-IN-001");
    case SkillErrorCode::UnsafePath: return QStringLiteral("SKD-PATH-001");
    case SkillErrorCode::Conflict: return QStringLiteral("SKD-CONFLICT-001");
    case SkillErrorCode::IoFailure: return QStringLiteral("SKD-IO-001");
    case SkillErrorCode::None:
    default:
        break;
    }
    return QStringLiteral("SKD-UNKNOWN");
}

inline QString formatSkillError(SkillErrorCode code, const QString &message)
{
    if (code == SkillErrorCode::None) return message;
    return QStringLiteral("[%1] %2").arg(skillErrorCodeTag(code), message);
}

// Outcome of a single-shot operation. Richer results embed the same three fields.
struct SkillResult
{
    bool ok = false;
    SkillErrorCode code = SkillErrorCode::None;
    QString message;

    static SkillResult success(const QString &message = QString())
    {
        SkillResult r;
        r.ok = true;
        r.message = message;
        return r;
    }

    static SkillResult failure(SkillErrorCode code, const QString &message)
    {
        SkillResult r;
        r.code = code;
        r.message = message;
        return r;
    }

    QString describe() const { return formatSkillError(code, message); }
};

#endif // SKILLDECK_ERROR_H
