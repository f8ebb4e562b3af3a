#include "skill_config_store.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

#include "utils/flowtracer.h"
#include "utils/pathutil.h"

namespace
{
template <typename Result>
Result failed(SkillErrorCode code, const QString &message)
{
    Result r;
    r.ok = false;
    r.code = code;
    r.message = message;
    return r;
}
} // namespace

SkillConfigStore::SkillConfigStore(const QString &configRoot)
    : configRoot_(QDir::cleanPath(configRoot))
{
}

void SkillConfigStore::setConfigRoot(const QString &configRoot)
{
    configRoot_ = QDir::cleanPath(configRoot);
}

QString SkillConfigStore::configPathForUser(const QString &userId, QString *error, SkillErrorCode *code) const
{
    const QString id = userId.trimmed();
    if (id.isEmpty())
    {
        if (error) *error = QObject::tr("User id is required");
        if (code) *code = SkillErrorCode::InvalidInput;
        return {};
    }
    if (id.contains(QChar('/')) || id.contains(QChar('\\')) || id == QStringLiteral(".") || id == QStringLiteral(".."))
    {
        if (error) *error = QObject::tr("User id is not a valid path component: %1").arg(id);
        if (code) *code = SkillErrorCode::UnsafePath;
        return {};
    }
    QString resolveError;
    const QString userDir = resolveInside(configRoot_, id, false, &resolveError);
    if (userDir.isEmpty())
    {
        if (error) *error = resolveError;
        if (code) *code = SkillErrorCode::UnsafePath;
        return {};
    }
    return QDir(userDir).filePath(QString::fromUtf8(kSkillConfigFileName));
}

ConfigLoadResult SkillConfigStore::loadFile(const QString &path)
{
    ConfigLoadResult result;
    QFile file(path);
    if (!file.exists())
    {
        result.ok = true;
        return result;
    }
    result.exists = true;
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        return failed<ConfigLoadResult>(SkillErrorCode::IoFailure,
                                        QObject::tr("Failed to open %1: %2").arg(path, file.errorString()));
    }
    const QByteArray data = file.readAll();
    file.close();

    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
    {
        return failed<ConfigLoadResult>(SkillErrorCode::IoFailure,
                                        QObject::tr("Invalid skills config %1: %2").arg(path, err.errorString()));
    }
    result.ok = true;
    result.exists = true;
    result.document = SkillConfigDocument::fromJson(doc.object());
    return result;
}

SkillResult SkillConfigStore::saveFile(const QString &path, const SkillConfigDocument &doc)
{
    if (!QDir().mkpath(QFileInfo(path).absolutePath()))
    {
        return SkillResult::failure(SkillErrorCode::IoFailure,
                                    QObject::tr("Failed to create directory for %1").arg(path));
    }
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text))
    {
        return SkillResult::failure(SkillErrorCode::IoFailure,
                                    QObject::tr("Failed to open %1 for writing: %2").arg(path, file.errorString()));
    }
    const QByteArray data = QJsonDocument(doc.toJson()).toJson(QJsonDocument::Indented);
    if (file.write(data) != data.size() || !file.commit())
    {
        return SkillResult::failure(SkillErrorCode::IoFailure,
                                    QObject::tr("Failed to write %1: %2").arg(path, file.errorString()));
    }
    return SkillResult::success();
}

ConfigLoadResult SkillConfigStore::load(const QString &userId) const
{
    QString error;
    SkillErrorCode code = SkillErrorCode::None;
    const QString path = configPathForUser(userId, &error, &code);
    if (path.isEmpty()) return failed<ConfigLoadResult>(code, error);

    ConfigLoadResult result = loadFile(path);
    if (!result.ok || result.exists) return result;

    // First use: provision an empty document. A failed write is logged, not fatal.
    const SkillResult saved = saveFile(path, result.document);
    if (saved.ok)
    {
        result.created = true;
        FlowTracer::log(FlowChannel::Config, QStringLiteral("auto-created skills config at %1").arg(path));
    }
    else
    {
        FlowTracer::warn(FlowChannel::Config, QStringLiteral("failed to create default skills config: %1").arg(saved.message));
    }
    return result;
}

SkillResult SkillConfigStore::save(const QString &userId, const SkillConfigDocument &doc) const
{
    QString error;
    SkillErrorCode code = SkillErrorCode::None;
    const QString path = configPathForUser(userId, &error, &code);
    if (path.isEmpty()) return SkillResult::failure(code, error);
    return saveFile(path, doc);
}

DefaultsMergeResult SkillConfigStore::initializeDefaults(const QString &userId, const QString &defaultConfigPath) const
{
    const ConfigLoadResult loaded = load(userId);
    if (!loaded.ok) return failed<DefaultsMergeResult>(loaded.code, loaded.message);

    DefaultsMergeResult result;
    result.ok = true;
    result.document = loaded.document;

    const ConfigLoadResult defaults = loadFile(defaultConfigPath);
    if (!defaults.ok)
    {
        // The user document is still valid; a broken template only costs the defaults.
        FlowTracer::warn(FlowChannel::Config, QStringLiteral("failed to load default config template: %1").arg(defaults.message));
        return result;
    }
    if (!defaults.exists)
    {
        FlowTracer::warn(FlowChannel::Config, QStringLiteral("default config not found at: %1").arg(defaultConfigPath));
        return result;
    }

    const qint64 now = QDateTime::currentMSecsSinceEpoch();
    for (auto it = defaults.document.skills.constBegin(); it != defaults.document.skills.constEnd(); ++it)
    {
        if (result.document.skills.contains(it.key())) continue;
        SkillConfigEntry entry = it.value();
        entry.addedAt = now;
        entry.hasAddedAt = true;
        result.document.skills.insert(it.key(), entry);
        ++result.added;
        FlowTracer::log(FlowChannel::Config, QStringLiteral("initialized config for example skill: %1").arg(it.key()));
    }

    if (result.added > 0)
    {
        const SkillResult saved = save(userId, result.document);
        if (!saved.ok) return failed<DefaultsMergeResult>(saved.code, saved.message);
        FlowTracer::log(FlowChannel::Config, QStringLiteral("added %1 example skill config(s)").arg(result.added));
    }
    return result;
}

ConfigEntryResult SkillConfigStore::toggle(const QString &userId, const QString &skillName, bool enabled) const
{
    ConfigLoadResult loaded = load(userId);
    if (!loaded.ok) return failed<ConfigEntryResult>(loaded.code, loaded.message);

    SkillConfigDocument &doc = loaded.document;
    auto it = doc.skills.find(skillName);
    if (it == doc.skills.end())
    {
        it = doc.skills.insert(skillName,
                               SkillConfigEntry::make(enabled, SkillScope(), QDateTime::currentMSecsSinceEpoch(), false));
    }
    else
    {
        it->enabled = enabled;
        it->hasEnabled = true;
    }

    const SkillResult saved = save(userId, doc);
    if (!saved.ok) return failed<ConfigEntryResult>(saved.code, saved.message);

    ConfigEntryResult result;
    result.ok = true;
    result.entry = it.value();
    return result;
}

SkillResult SkillConfigStore::update(const QString &userId, const QString &skillName, const SkillConfigEntry &entry) const
{
    if (skillName.isEmpty()) return SkillResult::failure(SkillErrorCode::InvalidInput, QObject::tr("Skill name is required"));
    ConfigLoadResult loaded = load(userId);
    if (!loaded.ok) return SkillResult::failure(loaded.code, loaded.message);
    loaded.document.skills.insert(skillName, entry);
    return save(userId, loaded.document);
}

SkillResult SkillConfigStore::remove(const QString &userId, const QString &skillName) const
{
    ConfigLoadResult loaded = load(userId);
    if (!loaded.ok) return SkillResult::failure(loaded.code, loaded.message);
    if (loaded.document.skills.remove(skillName) == 0) return SkillResult::success();
    return save(userId, loaded.document);
}
