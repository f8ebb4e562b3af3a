// pathutil.cpp - see header
#include "pathutil.h"

#include <QDir>
#include <QFileInfo>
#include <QObject>

Qt::CaseSensitivity pathCaseSensitivity()
{
#if defined(Q_OS_WIN) || defined(Q_OS_MACOS)
    return Qt::CaseInsensitive;
#else
    return Qt::CaseSensitive;
#endif
}

bool isSubPath(const QString &base, const QString &candidate)
{
    const Qt::CaseSensitivity sensitivity = pathCaseSensitivity();
    QString normalizedBase = base;
    QString normalizedCandidate = candidate;
    normalizedBase.replace('\\', '/');
    normalizedCandidate.replace('\\', '/');
    while (normalizedCandidate.size() > 1 && normalizedCandidate.endsWith(QChar('/'))) normalizedCandidate.chop(1);
    while (normalizedBase.size() > 1 && normalizedBase.endsWith(QChar('/'))) normalizedBase.chop(1);
    if (normalizedCandidate.compare(normalizedBase, sensitivity) == 0) return true;
    const QString baseWithSlash = normalizedBase.endsWith(QChar('/')) ? normalizedBase : normalizedBase + QChar('/');
    return normalizedCandidate.startsWith(baseWithSlash, sensitivity);
}

QString resolveInside(const QString &root, const QString &relative, bool allowRoot, QString *error)
{
    if (root.isEmpty())
    {
        if (error) *error = QObject::tr("Root directory is not configured");
        return {};
    }
    const QString rootAbs = QDir::cleanPath(QFileInfo(root).absoluteFilePath());
    const QString candidate = QDir::cleanPath(QDir(rootAbs).filePath(relative));

    const bool isRoot = candidate.compare(rootAbs, pathCaseSensitivity()) == 0;
    if (!isSubPath(rootAbs, candidate) || (isRoot && !allowRoot))
    {
        if (error) *error = QObject::tr("Path is outside skills directory: %1").arg(relative);
        return {};
    }

    const QFileInfo candidateInfo(candidate);
    if (candidateInfo.exists())
    {
        const QString rootCanonical = QFileInfo(rootAbs).canonicalFilePath();
        const QString candidateCanonical = candidateInfo.canonicalFilePath();
        if (!rootCanonical.isEmpty() && !candidateCanonical.isEmpty() &&
            !isSubPath(rootCanonical, candidateCanonical))
        {
            if (error) *error = QObject::tr("Path resolves outside skills directory: %1").arg(relative);
            return {};
        }
    }
    return candidate;
}

bool isDotName(const QString &name)
{
    return name.startsWith(QChar('.'));
}
