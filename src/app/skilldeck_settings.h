#pragma once

#include <QString>

// Resolved runtime paths.
// Precedence: explicit override > INI value > built-in default. SKILLDECK_HOME moves the
// built-in defaults (skills root and config root) to another base directory.
struct SkillDeckSettings
{
    QString settingsPath;     // INI file the values were read from
    QString skillsRoot;       // skills_root
    QString exampleDir;       // example_skills_dir
    QString configRoot;       // config_root
    QString userId;           // user_id
    QString projectConfig;    // project_config, optional

    // ~/.skilldeck unless SKILLDECK_HOME is set.
    static QString homeDir();
    static QString defaultSettingsPath();

    // Missing INI file is not an error; every key falls back to its default.
    // `appDir` locates the bundled example-skills directory.
    static SkillDeckSettings load(const QString &iniPath, const QString &appDir);

    // Write the current values back to `settingsPath`. False with `error` when the INI cannot be written.
    bool save(QString *error = nullptr) const;
};
