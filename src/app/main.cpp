#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "app/skilldeck_settings.h"
#include "skill/skill_library.h"
#include "skill/skill_scanner.h"

namespace
{
QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

int fail(const QString &message)
{
    err() << message << Qt::endl;
    return 1;
}

int fail(const SkillResult &result)
{
    return fail(result.describe());
}

void printRecord(const SkillRecord &rec)
{
    const QString scope = rec.scope.isGlobal ? QStringLiteral("global")
                                             : QStringLiteral("agents:%1").arg(rec.scope.selectedAgents.join(QChar(',')));
    out() << QStringLiteral("%1\t%2\t%3\t%4\t%5")
                 .arg(rec.id, rec.enabled ? QStringLiteral("on") : QStringLiteral("off"),
                      rec.isExample ? QStringLiteral("example") : QStringLiteral("user"), scope, rec.name)
          << Qt::endl;
}

int runImport(SkillLibrary &library, const QString &zipPath, const QStringList &replacements, bool replaceNone)
{
    ImportRequest request = ImportRequest::fromFile(zipPath);
    if (!replacements.isEmpty() || replaceNone) request.confirm(replacements);

    const ImportResult result = library.importArchive(request);
    if (result.code == SkillErrorCode::Conflict)
    {
        err() << formatSkillError(result.code, result.message) << Qt::endl;
        for (const ImportConflict &conflict : result.conflicts)
        {
            err() << QStringLiteral("  %1 (existing folder: %2)").arg(conflict.skillName, conflict.existingFolderName)
                  << Qt::endl;
        }
        err() << QStringLiteral("Re-run with --replace <folder> to overwrite, or --replace-none to skip them.")
              << Qt::endl;
        return 2;
    }
    if (!result.ok) return fail(formatSkillError(result.code, result.message));
    out() << result.message << Qt::endl;
    for (const QString &folder : result.importedFolders) out() << QStringLiteral("  %1").arg(folder) << Qt::endl;
    return 0;
}
} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("skilldeck"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Manage the local skill bundle library"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("init | list | scan | import <zip> | toggle <id> | delete <id> | "
                                                "files <folder> | show <folder> | locate <name>"));

    const QCommandLineOption settingsOption(QStringLiteral("settings"), QStringLiteral("INI settings file."),
                                            QStringLiteral("path"));
    const QCommandLineOption rootOption(QStringLiteral("root"), QStringLiteral("Skills root directory."),
                                        QStringLiteral("path"));
    const QCommandLineOption examplesOption(QStringLiteral("examples"), QStringLiteral("Example skills directory."),
                                            QStringLiteral("path"));
    const QCommandLineOption configRootOption(QStringLiteral("config-root"),
                                              QStringLiteral("Directory holding per-user config."),
                                              QStringLiteral("path"));
    const QCommandLineOption userOption(QStringLiteral("user"), QStringLiteral("User id."), QStringLiteral("id"));
    const QCommandLineOption projectOption(QStringLiteral("project-config"),
                                           QStringLiteral("Project-level skills-config.json overlay."),
                                           QStringLiteral("path"));
    const QCommandLineOption replaceOption(QStringLiteral("replace"),
                                           QStringLiteral("Existing folder to replace on import (repeatable)."),
                                           QStringLiteral("folder"));
    const QCommandLineOption replaceNoneOption(QStringLiteral("replace-none"),
                                               QStringLiteral("Skip every conflicting skill on import."));
    parser.addOptions({settingsOption, rootOption, examplesOption, configRootOption, userOption, projectOption,
                       replaceOption, replaceNoneOption});
    parser.process(app);

    SkillDeckSettings settings =
        SkillDeckSettings::load(parser.value(settingsOption), QCoreApplication::applicationDirPath());
    if (parser.isSet(rootOption)) settings.skillsRoot = parser.value(rootOption);
    if (parser.isSet(examplesOption)) settings.exampleDir = parser.value(examplesOption);
    if (parser.isSet(configRootOption)) settings.configRoot = parser.value(configRootOption);
    if (parser.isSet(userOption)) settings.userId = parser.value(userOption);
    if (parser.isSet(projectOption)) settings.projectConfig = parser.value(projectOption);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) parser.showHelp(1);
    const QString command = args.first();

    if (command == QStringLiteral("init"))
    {
        QString error;
        if (!settings.save(&error)) return fail(error);
        out() << settings.settingsPath << Qt::endl;
        return 0;
    }

    SkillLibrary library;
    library.setSkillsRoot(settings.skillsRoot);
    library.setExampleDir(settings.exampleDir);
    library.setConfigRoot(settings.configRoot);
    library.setUserId(settings.userId);
    library.setProjectConfigPath(settings.projectConfig);

    if (command == QStringLiteral("scan"))
    {
        const ScanResult scan = SkillScanner::scan(settings.skillsRoot, settings.exampleDir);
        if (!scan.ok) return fail(formatSkillError(scan.code, scan.message));
        for (const ScannedSkill &skill : scan.skills)
        {
            out() << QStringLiteral("%1\t%2\t%3").arg(skill.skillDirName, skill.name, skill.path) << Qt::endl;
        }
        return 0;
    }

    if (command == QStringLiteral("files") || command == QStringLiteral("show"))
    {
        if (args.size() < 2) return fail(QStringLiteral("usage: skilldeck %1 <folder>").arg(command));
        if (command == QStringLiteral("files"))
        {
            const SkillFileListResult listed = library.storage().listFiles(args.at(1));
            if (!listed.ok) return fail(formatSkillError(listed.code, listed.message));
            for (const QString &entry : listed.entries) out() << entry << Qt::endl;
            return 0;
        }
        const SkillReadResult read = library.storage().readSkill(args.at(1));
        if (!read.ok) return fail(formatSkillError(read.code, read.message));
        out() << read.content;
        out().flush();
        return 0;
    }

    if (command == QStringLiteral("locate"))
    {
        if (args.size() < 2) return fail(QStringLiteral("usage: skilldeck locate <skill name>"));
        const SkillLocateResult located = library.storage().locateBundle(args.mid(1).join(QChar(' ')));
        if (!located.ok) return fail(formatSkillError(located.code, located.message));
        out() << located.folderPath << Qt::endl;
        return 0;
    }

    if (command == QStringLiteral("import"))
    {
        if (args.size() < 2) return fail(QStringLiteral("usage: skilldeck import <zip> [--replace <folder>]..."));
        return runImport(library, args.at(1), parser.values(replaceOption), parser.isSet(replaceNoneOption));
    }

    const SkillResult reconciled = library.reconcile();
    if (!reconciled.ok) return fail(reconciled);

    if (command == QStringLiteral("list"))
    {
        for (const SkillRecord &rec : library.skills()) printRecord(rec);
        return 0;
    }
    if (command == QStringLiteral("toggle"))
    {
        if (args.size() < 2) return fail(QStringLiteral("usage: skilldeck toggle <id>"));
        const SkillRecordResult toggled = library.toggleSkill(args.at(1));
        if (!toggled.ok) return fail(formatSkillError(toggled.code, toggled.message));
        printRecord(toggled.record);
        return 0;
    }
    if (command == QStringLiteral("delete"))
    {
        if (args.size() < 2) return fail(QStringLiteral("usage: skilldeck delete <id>"));
        const SkillRecord *target = library.findById(args.at(1));
        const bool example = target && target->isExample;
        const SkillResult deleted = library.deleteSkill(args.at(1));
        if (!deleted.ok) return fail(deleted);
        out() << (example ? QStringLiteral("kept example %1") : QStringLiteral("deleted %1")).arg(args.at(1)) << Qt::endl;
        return 0;
    }

    return fail(QStringLiteral("unknown command: %1").arg(command));
}
