#include "skilldeck_settings.h"

#include <QDir>
#include <QFileInfo>
#include <QObject>
#include <QProcessEnvironment>
#include <QSettings>

namespace
{
QString valueOr(const QSettings &settings, const QString &key, const QString &fallback)
{
    const QString value = settings.value(key).toString().trimmed();
    return value.isEmpty() ? fallback : value;
}

QString absolutePath(const QString &path)
{
    if (path.isEmpty()) return path;
    QString expanded = path;
    if (expanded == QStringLiteral("~") || expanded.startsWith(QStringLiteral("~/")))
    {
        expanded.replace(0, 1, QDir::homePath());
    }
    return QDir::cleanPath(QFileInfo(expanded).absoluteFilePath());
}
} // namespace

QString SkillDeckSettings::homeDir()
{
    const QString fromEnv = QProcessEnvironment::systemEnvironment().value(QStringLiteral("SKILLDECK_HOME")).trimmed();
    if (!fromEnv.isEmpty()) return absolutePath(fromEnv);
    return QDir(QDir::homePath()).filePath(QStringLiteral(".skilldeck"));
}

QString SkillDeckSettings::defaultSettingsPath()
{
    return QDir(homeDir()).filePath(QStringLiteral("skilldeck.ini"));
}

SkillDeckSettings SkillDeckSettings::load(const QString &iniPath, const QString &appDir)
{
    SkillDeckSettings out;
    out.settingsPath = iniPath.isEmpty() ? defaultSettingsPath() : absolutePath(iniPath);

    const QString home = homeDir();
    QSettings s(out.settingsPath, QSettings::IniFormat);
    s.setIniCodec("utf-8");

    out.skillsRoot = absolutePath(valueOr(s, QStringLiteral("skills_root"), QDir(home).filePath(QStringLiteral("skills"))));
    out.exampleDir = absolutePath(
        valueOr(s, QStringLiteral("example_skills_dir"), QDir(appDir).filePath(QStringLiteral("example-skills"))));
    out.configRoot = absolutePath(valueOr(s, QStringLiteral("config_root"), home));
    out.userId = valueOr(s, QStringLiteral("user_id"), QStringLiteral("default"));
    out.projectConfig = absolutePath(s.value(QStringLiteral("project_config")).toString().trimmed());
    return out;
}

bool SkillDeckSettings::save(QString *error) const
{
    if (!QDir().mkpath(QFileInfo(settingsPath).absolutePath()))
    {
        if (error) *error = QObject::tr("Failed to create directory for %1").arg(settingsPath);
        return false;
    }
    QSettings s(settingsPath, QSettings::IniFormat);
    s.setIniCodec("utf-8");
    s.setValue(QStringLiteral("skills_root"), skillsRoot);
    s.setValue(QStringLiteral("example_skills_dir"), exampleDir);
    s.setValue(QStringLiteral("config_root"), configRoot);
    s.setValue(QStringLiteral("user_id"), userId);
    s.setValue(QStringLiteral("project_config"), projectConfig);
    s.sync();
    if (s.status() != QSettings::NoError)
    {
        if (error) *error = QObject::tr("Failed to write settings: %1").arg(settingsPath);
        return false;
    }
    return true;
}
