#include "skill_descriptor.h"

#include <QRegularExpression>
#include <QStringList>

namespace
{
const QString kFence = QStringLiteral("---");

QString stripLineEnding(QString line)
{
    if (line.endsWith(QChar('\r'))) line.chop(1);
    return line;
}

QString stripQuotes(const QString &value)
{
    QString v = value;
    if (!v.isEmpty() && (v.front() == QChar('"') || v.front() == QChar('\''))) v.remove(0, 1);
    if (!v.isEmpty() && (v.back() == QChar('"') || v.back() == QChar('\''))) v.chop(1);
    return v;
}

// First `key: value` line in the block, trimmed and unquoted.
QString extractScalar(const QString &block, const QString &key)
{
    const QRegularExpression re(QStringLiteral("^\\s*%1\\s*:\\s*(.+)$").arg(QRegularExpression::escape(key)));
    const QStringList lines = block.split(QChar('\n'));
    for (const QString &raw : lines)
    {
        const QRegularExpressionMatch match = re.match(stripLineEnding(raw));
        if (!match.hasMatch()) continue;
        return stripQuotes(match.captured(1).trimmed());
    }
    return {};
}

struct FrontMatter
{
    QString block;
    int bodyStart = -1; // -1 when the block is not terminated
};

// Locate the front-matter block. The opening fence must sit at offset 0 on its own line.
bool locateFrontMatter(const QString &content, FrontMatter *out)
{
    if (!content.startsWith(kFence)) return false;
    const int firstLineEnd = content.indexOf(QChar('\n'));
    if (firstLineEnd < 0) return false;
    if (stripLineEnding(content.left(firstLineEnd)) != kFence) return false;

    const int blockStart = firstLineEnd + 1;
    int pos = blockStart;
    while (pos <= content.size())
    {
        const int nl = content.indexOf(QChar('\n'), pos);
        const QString line = stripLineEnding(nl < 0 ? content.mid(pos) : content.mid(pos, nl - pos));
        if (line == kFence)
        {
            out->block = content.mid(blockStart, pos - blockStart);
            out->bodyStart = nl < 0 ? content.size() : nl + 1;
            return true;
        }
        if (nl < 0) break;
        pos = nl + 1;
    }
    out->block = content.mid(blockStart);
    out->bodyStart = -1;
    return true;
}

QString foldLineBreaks(QString value)
{
    value.replace(QStringLiteral("\r\n"), QStringLiteral(" "));
    value.replace(QChar('\n'), QChar(' '));
    value.replace(QChar('\r'), QChar(' '));
    return value;
}

// Quote values that trimming or quote stripping would otherwise alter.
QString protectScalar(const QString &value)
{
    if (value.isEmpty()) return value;
    const bool edgeSpace = value != value.trimmed();
    const bool edgeQuote = value.front() == QChar('"') || value.front() == QChar('\'') ||
                           value.back() == QChar('"') || value.back() == QChar('\'');
    if (!edgeSpace && !edgeQuote) return value;
    return QStringLiteral("\"%1\"").arg(value);
}

QString sanitizeSegment(const QString &input)
{
    static const QRegularExpression disallowed(QStringLiteral("[\\\\/*?:\"<>|\\s]+"));
    static const QRegularExpression dashes(QStringLiteral("-+"));
    static const QRegularExpression leading(QStringLiteral("^[-.]+"));
    static const QRegularExpression trailing(QStringLiteral("-+$"));
    QString out = input;
    out.replace(disallowed, QStringLiteral("-"));
    out.replace(dashes, QStringLiteral("-"));
    out.remove(leading);
    out.remove(trailing);
    return out;
}

QString truncateUtf8(const QString &value, int maxBytes)
{
    QString out;
    int bytes = 0;
    for (int i = 0; i < value.size(); ++i)
    {
        int width = 1;
        if (value.at(i).isHighSurrogate() && i + 1 < value.size() && value.at(i + 1).isLowSurrogate()) width = 2;
        const int charBytes = value.mid(i, width).toUtf8().size();
        if (bytes + charBytes > maxBytes) break;
        out += value.mid(i, width);
        bytes += charBytes;
        i += width - 1;
    }
    return out;
}
} // namespace

bool SkillDescriptor::parse(const QString &content, SkillDescriptor *out)
{
    FrontMatter fm;
    if (!locateFrontMatter(content, &fm) || fm.bodyStart < 0) return false;

    const QString name = extractScalar(fm.block, QStringLiteral("name"));
    const QString description = extractScalar(fm.block, QStringLiteral("description"));
    if (name.isEmpty() || description.isEmpty()) return false;

    if (out)
    {
        out->name = name;
        out->description = description;
        out->body = content.mid(fm.bodyStart);
    }
    return true;
}

QString SkillDescriptor::build(const QString &name, const QString &description, const QString &body)
{
    QString content;
    content += kFence + QChar('\n');
    content += QStringLiteral("name: ") + protectScalar(foldLineBreaks(name)) + QChar('\n');
    content += QStringLiteral("description: ") + protectScalar(foldLineBreaks(description)) + QChar('\n');
    content += kFence + QChar('\n');
    content += body;
    return content;
}

QString SkillDescriptor::peekName(const QString &content)
{
    FrontMatter fm;
    if (locateFrontMatter(content, &fm)) return extractScalar(fm.block, QStringLiteral("name"));
    return extractScalar(content, QStringLiteral("name"));
}

QString SkillDescriptor::dirNameFromSkillName(const QString &name, const QString &fallback)
{
    QString folder = sanitizeSegment(name);
    if (folder.isEmpty()) folder = sanitizeSegment(fallback);
    if (folder.isEmpty()) folder = QStringLiteral("skill");

    if (folder.toUtf8().size() > kMaxDirNameBytes)
    {
        folder = truncateUtf8(folder, kMaxDirNameBytes);
        static const QRegularExpression trailing(QStringLiteral("-+$"));
        folder.remove(trailing);
        if (folder.isEmpty()) folder = QStringLiteral("skill");
    }
    return folder;
}
