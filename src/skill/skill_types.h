#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

constexpr const char *kSkillFileName = "SKILL.md";
constexpr const char *kSkillConfigFileName = "skills-config.json";
constexpr const char *kDefaultSkillConfigFileName = "default-config.json";
constexpr int kSkillConfigVersion = 1;

// Visibility rule: global means every agent, including agents created later.
struct SkillScope
{
    bool isGlobal = true;
    QStringList selectedAgents;

    bool operator==(const SkillScope &other) const
    {
        return isGlobal == other.isGlobal && selectedAgents == other.selectedAgents;
    }
    bool operator!=(const SkillScope &other) const { return !(*this == other); }

    QJsonObject toJson() const
    {
        QJsonObject o;
        o["isGlobal"] = isGlobal;
        o["selectedAgents"] = QJsonArray::fromStringList(selectedAgents);
        return o;
    }
};

// One per-skill entry of skills-config.json. Every field is optional on disk; the
// has* flags record presence so reconciliation can default each field on its own.
struct SkillConfigEntry
{
    bool enabled = true;
    SkillScope scope;
    qint64 addedAt = 0; // ms since epoch
    bool isExample = false;

    bool hasEnabled = false;
    bool hasScope = false;
    bool hasAddedAt = false;
    bool hasIsExample = false;

    static SkillConfigEntry make(bool enabled, const SkillScope &scope, qint64 addedAt, bool isExample)
    {
        SkillConfigEntry e;
        e.enabled = enabled;
        e.scope = scope;
        e.addedAt = addedAt;
        e.isExample = isExample;
        e.hasEnabled = e.hasScope = e.hasAddedAt = e.hasIsExample = true;
        return e;
    }

    static SkillConfigEntry fromJson(const QJsonObject &o)
    {
        SkillConfigEntry e;
        const QJsonValue enabledVal = o.value(QStringLiteral("enabled"));
        if (enabledVal.isBool())
        {
            e.enabled = enabledVal.toBool();
            e.hasEnabled = true;
        }
        const QJsonValue scopeVal = o.value(QStringLiteral("scope"));
        if (scopeVal.isObject())
        {
            const QJsonObject scopeObj = scopeVal.toObject();
            e.scope.isGlobal = scopeObj.value(QStringLiteral("isGlobal")).toBool(true);
            const QJsonArray agents = scopeObj.value(QStringLiteral("selectedAgents")).toArray();
            for (const QJsonValue &agent : agents)
            {
                if (agent.isString()) e.scope.selectedAgents << agent.toString();
            }
            e.hasScope = true;
        }
        const QJsonValue addedVal = o.value(QStringLiteral("addedAt"));
        if (addedVal.isDouble())
        {
            e.addedAt = static_cast<qint64>(addedVal.toDouble());
            e.hasAddedAt = true;
        }
        const QJsonValue exampleVal = o.value(QStringLiteral("isExample"));
        if (exampleVal.isBool())
        {
            e.isExample = exampleVal.toBool();
            e.hasIsExample = true;
        }
        return e;
    }

    // Absent fields are omitted so a partial entry round-trips as partial.
    QJsonObject toJson() const
    {
        QJsonObject o;
        if (hasEnabled) o["enabled"] = enabled;
        if (hasScope) o["scope"] = scope.toJson();
        if (hasAddedAt) o["addedAt"] = static_cast<double>(addedAt);
        if (hasIsExample) o["isExample"] = isExample;
        return o;
    }
};

struct SkillConfigDocument
{
    int version = kSkillConfigVersion;
    QMap<QString, SkillConfigEntry> skills; // keyed by descriptor name

    static SkillConfigDocument fromJson(const QJsonObject &root)
    {
        SkillConfigDocument doc;
        doc.version = root.value(QStringLiteral("version")).toInt(kSkillConfigVersion);
        const QJsonObject skillsObj = root.value(QStringLiteral("skills")).toObject();
        for (auto it = skillsObj.constBegin(); it != skillsObj.constEnd(); ++it)
        {
            if (!it.value().isObject()) continue;
            doc.skills.insert(it.key(), SkillConfigEntry::fromJson(it.value().toObject()));
        }
        return doc;
    }

    QJsonObject toJson() const
    {
        QJsonObject skillsObj;
        for (auto it = skills.constBegin(); it != skills.constEnd(); ++it)
        {
            skillsObj.insert(it.key(), it.value().toJson());
        }
        QJsonObject root;
        root["version"] = version;
        root["skills"] = skillsObj;
        return root;
    }
};

// Bundle as seen by the scanner.
struct ScannedSkill
{
    QString name;         // descriptor display name
    QString description;  // descriptor description
    QString path;         // absolute SKILL.md path
    QString skillDirName; // folder name under the skills root
    bool isExample = false;
};

// Merged in-memory view produced by reconciliation.
struct SkillRecord
{
    QString id; // "disk-" + skillDirName
    QString name;
    QString description;
    QString filePath;
    QString fileContent; // cached descriptor text; the scanner never fills it
    QString skillDirName;
    qint64 addedAt = 0;
    SkillScope scope;
    bool enabled = true;
    bool isExample = false;

    static QString idForDir(const QString &skillDirName) { return QStringLiteral("disk-") + skillDirName; }

    bool operator==(const SkillRecord &other) const
    {
        return id == other.id && name == other.name && description == other.description &&
               filePath == other.filePath && fileContent == other.fileContent && skillDirName == other.skillDirName &&
               addedAt == other.addedAt && scope == other.scope && enabled == other.enabled &&
               isExample == other.isExample;
    }
    bool operator!=(const SkillRecord &other) const { return !(*this == other); }
};
