#pragma once

#include <QString>

// SKILL.md front matter codec.
//
//   ---
//   name: <display name>
//   description: <one-line description>
//   ---
//   <free-form body>
//
// Only name and description are tracked; other front-matter keys are dropped by build().
struct SkillDescriptor
{
    QString name;
    QString description;
    QString body;

    // Returns false when the fence is malformed or name/description is missing.
    // Callers treat false as "not a bundle", never as an error.
    static bool parse(const QString &content, SkillDescriptor *out);

    static QString build(const QString &name, const QString &description, const QString &body);

    // Loose lookup of the name line only. Accepts an unterminated front-matter block and
    // content without any fence. Empty when no name line exists.
    static QString peekName(const QString &content);

    // Filesystem-safe folder name derived from a display name (<= kMaxDirNameBytes UTF-8 bytes).
    static QString dirNameFromSkillName(const QString &name, const QString &fallback = QStringLiteral("skill"));

    static constexpr int kMaxDirNameBytes = 200;
};
