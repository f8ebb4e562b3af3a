// pathutil.h - containment helpers for the skills root and archive extraction
#ifndef SKILLDECK_PATHUTIL_H
#define SKILLDECK_PATHUTIL_H

#include <QString>
#include <QtGlobal>

// Case sensitivity used for containment comparisons.
// Windows and macOS default filesystems are case-insensitive, so a differently cased
// prefix still names the same directory there.
Qt::CaseSensitivity pathCaseSensitivity();

// True when `candidate` equals `base` or lies below it. Both paths are compared after
// separator normalisation; callers pass cleaned absolute paths.
bool isSubPath(const QString &base, const QString &candidate);

// Join `relative` onto `root` and verify the result stays strictly inside `root`.
// - Lexical check on the cleaned absolute path.
// - When the target exists, the canonical (symlink-resolved) path is checked as well.
// - `allowRoot` accepts a result equal to the root itself.
// Returns the cleaned absolute path, or an empty string with `error` filled.
QString resolveInside(const QString &root, const QString &relative, bool allowRoot = false, QString *error = nullptr);

// Hidden entries (".git", ".import-xxxx") are never treated as bundles.
bool isDotName(const QString &name);

#endif // SKILLDECK_PATHUTIL_H
