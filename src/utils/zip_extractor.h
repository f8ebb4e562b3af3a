#ifndef SKILLDECK_ZIP_EXTRACTOR_H
#define SKILLDECK_ZIP_EXTRACTOR_H

#include <QString>

#include "skilldeck_error.h"

namespace zip
{
// Extract every entry of `archivePath` below `destinationDir`.
// Entries whose normalised path is absolute or would land outside the destination
// abort the whole extraction with SkillErrorCode::UnsafePath. Files already written
// stay inside the destination; callers extract into a scratch directory they own.
bool extractArchive(const QString &archivePath, const QString &destinationDir, QString *errorMessage = nullptr,
                    SkillErrorCode *errorCode = nullptr);

// Cheap signature probe: local file header or empty-archive end record.
bool looksLikeZip(const QByteArray &head);
} // namespace zip

#endif // SKILLDECK_ZIP_EXTRACTOR_H
