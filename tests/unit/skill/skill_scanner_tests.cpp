#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include <algorithm>

#include "common/TestUtils.h"
#include "skill/skill_scanner.h"

using namespace skilldeck::test;

namespace
{
const ScannedSkill *findByDir(const ScanResult &result, const QString &dir)
{
    const auto it = std::find_if(result.skills.cbegin(), result.skills.cend(),
                                 [&](const ScannedSkill &s) { return s.skillDirName == dir; });
    return it == result.skills.cend() ? nullptr : &*it;
}
} // namespace

TEST_CASE("scan lists valid bundles and classifies examples")
{
    QTemporaryDir root;
    QTemporaryDir examples;
    REQUIRE(root.isValid());
    REQUIRE(examples.isValid());
    REQUIRE(writeBundle(root.path(), QStringLiteral("pdf"), QStringLiteral("pdf"), QStringLiteral("PDF tools")));
    REQUIRE(writeBundle(root.path(), QStringLiteral("cleaner"), QStringLiteral("Data Cleaner")));
    REQUIRE(writeBundle(examples.path(), QStringLiteral("pdf"), QStringLiteral("pdf"), QStringLiteral("PDF tools")));

    const ScanResult result = SkillScanner::scan(root.path(), examples.path());
    REQUIRE(result.ok);
    REQUIRE(result.skills.size() == 2);

    const ScannedSkill *pdf = findByDir(result, QStringLiteral("pdf"));
    REQUIRE(pdf != nullptr);
    CHECK(pdf->name == QStringLiteral("pdf"));
    CHECK(pdf->description == QStringLiteral("PDF tools"));
    CHECK(pdf->isExample);
    CHECK(pdf->path == QDir::cleanPath(QDir(root.path()).filePath(QStringLiteral("pdf/SKILL.md"))));

    const ScannedSkill *cleaner = findByDir(result, QStringLiteral("cleaner"));
    REQUIRE(cleaner != nullptr);
    CHECK(cleaner->name == QStringLiteral("Data Cleaner"));
    CHECK_FALSE(cleaner->isExample);
}

TEST_CASE("scan skips hidden, descriptor-less and malformed directories")
{
    QTemporaryDir root;
    REQUIRE(root.isValid());
    REQUIRE(writeBundle(root.path(), QStringLiteral("good"), QStringLiteral("good")));
    REQUIRE(writeBundle(root.path(), QStringLiteral(".hidden"), QStringLiteral("hidden")));
    REQUIRE(QDir(root.path()).mkpath(QStringLiteral("empty")));
    REQUIRE(writeFile(QDir(root.path()).filePath(QStringLiteral("broken/SKILL.md")), QByteArrayLiteral("name: x\n")));
    REQUIRE(writeFile(QDir(root.path()).filePath(QStringLiteral("nodesc/SKILL.md")),
                      QByteArrayLiteral("---\nname: only name\n---\n")));
    REQUIRE(writeFile(QDir(root.path()).filePath(QStringLiteral("loose.md")), skillFile(QStringLiteral("loose"), QStringLiteral("file"))));

    const ScanResult result = SkillScanner::scan(root.path(), QString());
    REQUIRE(result.ok);
    REQUIRE(result.skills.size() == 1);
    CHECK(result.skills.first().skillDirName == QStringLiteral("good"));
    CHECK_FALSE(result.skills.first().isExample);
}

TEST_CASE("scan of a missing root is an empty success")
{
    QTemporaryDir base;
    REQUIRE(base.isValid());
    const ScanResult result = SkillScanner::scan(QDir(base.path()).filePath(QStringLiteral("nope")), QString());
    CHECK(result.ok);
    CHECK(result.skills.isEmpty());
}

TEST_CASE("scan of a file root is an IO failure")
{
    QTemporaryDir base;
    REQUIRE(base.isValid());
    const QString file = QDir(base.path()).filePath(QStringLiteral("root.txt"));
    REQUIRE(writeFile(file, QByteArrayLiteral("x")));
    const ScanResult result = SkillScanner::scan(file, QString());
    CHECK_FALSE(result.ok);
    CHECK(result.code == SkillErrorCode::IoFailure);
}

TEST_CASE("example classification follows the reference directory")
{
    QTemporaryDir root;
    QTemporaryDir examples;
    REQUIRE(root.isValid());
    REQUIRE(examples.isValid());
    REQUIRE(writeBundle(root.path(), QStringLiteral("pdf"), QStringLiteral("pdf")));
    REQUIRE(writeBundle(examples.path(), QStringLiteral("pdf"), QStringLiteral("pdf")));
    CHECK(SkillScanner::scan(root.path(), examples.path()).skills.first().isExample);

    REQUIRE(QDir(QDir(examples.path()).filePath(QStringLiteral("pdf"))).removeRecursively());
    CHECK_FALSE(SkillScanner::scan(root.path(), examples.path()).skills.first().isExample);
}

#ifndef Q_OS_WIN
TEST_CASE("scan ignores symlinked bundle directories")
{
    QTemporaryDir root;
    QTemporaryDir elsewhere;
    REQUIRE(root.isValid());
    REQUIRE(elsewhere.isValid());
    REQUIRE(writeBundle(elsewhere.path(), QStringLiteral("outside"), QStringLiteral("outside")));
    REQUIRE(QFile::link(QDir(elsewhere.path()).filePath(QStringLiteral("outside")),
                        QDir(root.path()).filePath(QStringLiteral("linked"))));

    const ScanResult result = SkillScanner::scan(root.path(), QString());
    REQUIRE(result.ok);
    CHECK(result.skills.isEmpty());
}
#endif

TEST_CASE("scan decodes descriptors as UTF-8")
{
    QTemporaryDir root;
    REQUIRE(root.isValid());
    const QString name = QString::fromUtf8("R\xC3\xA9sum\xC3\xA9 \xE5\xB7\xA5\xE5\x85\xB7");
    const QString description = QString::fromUtf8("\xE7\xAE\x80\xE5\x8E\x86 helper");
    REQUIRE(writeBundle(root.path(), QStringLiteral("resume"), name, description));

    const ScanResult result = SkillScanner::scan(root.path(), QString());
    REQUIRE(result.ok);
    const ScannedSkill *resume = findByDir(result, QStringLiteral("resume"));
    REQUIRE(resume != nullptr);
    CHECK(resume->name == name);
    CHECK(resume->description == description);
}
