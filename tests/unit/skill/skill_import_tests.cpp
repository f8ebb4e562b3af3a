#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <QAtomicInt>
#include <QDir>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QPair>
#include <QTemporaryDir>
#include <QThread>
#include <QVector>
#include <QtConcurrent/QtConcurrentRun>

#include "common/TestUtils.h"
#include "skill/skill_import.h"

using namespace skilldeck::test;

namespace
{
QByteArray descriptor(const QString &name, const QString &body = QStringLiteral("body\n"))
{
    return skillFile(name, QStringLiteral("imported skill"), body);
}

QString makeArchive(const QTemporaryDir &dir, const QString &fileName, const ZipEntries &entries)
{
    const QString path = QDir(dir.path()).filePath(fileName);
    REQUIRE(createZip(path, entries));
    return path;
}

QStringList visibleEntries(const QString &root)
{
    return QDir(root).entryList(QDir::AllEntries | QDir::NoDotAndDotDot, QDir::Name);
}

QStringList hiddenEntries(const QString &root)
{
    QStringList hidden;
    const QStringList all = QDir(root).entryList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden, QDir::Name);
    for (const QString &name : all)
    {
        if (name.startsWith(QChar('.'))) hidden << name;
    }
    return hidden;
}

struct StageLog
{
    QMutex mutex;
    QVector<QPair<quint64, ImportStage>> events;

    void record(quint64 ticket, ImportStage stage)
    {
        QMutexLocker locker(&mutex);
        events.push_back(qMakePair(ticket, stage));
    }
};
} // namespace

TEST_CASE("imports a nested bundle under its display-name folder")
{
    QTemporaryDir work;
    QTemporaryDir root;
    REQUIRE(work.isValid());
    REQUIRE(root.isValid());
    const QString archive = makeArchive(work, QStringLiteral("pack.zip"),
                                        {{QStringLiteral("wrapper/my-skill/SKILL.md"), descriptor(QStringLiteral("My Skill"))},
                                         {QStringLiteral("wrapper/my-skill/scripts/run.py"), QByteArrayLiteral("print(1)")}});

    SkillImportPipeline pipeline(root.path());
    const ImportResult result = pipeline.importArchive(ImportRequest::fromFile(archive));
    REQUIRE(result.ok);
    CHECK(result.importedCount == 1);
    CHECK(result.importedFolders == QStringList{QStringLiteral("My-Skill")});
    CHECK(QFileInfo(QDir(root.path()).filePath(QStringLiteral("My-Skill/SKILL.md"))).isFile());
    CHECK(readFile(QDir(root.path()).filePath(QStringLiteral("My-Skill/scripts/run.py"))) == QByteArrayLiteral("print(1)"));
    CHECK(hiddenEntries(root.path()).isEmpty());
}

TEST_CASE("root-level SKILL.md falls back to the archive name")
{
    QTemporaryDir work;
    QTemporaryDir root;
    REQUIRE(work.isValid());
    REQUIRE(root.isValid());
    const QString archive = makeArchive(work, QStringLiteral("root pack.ZIP"),
                                        {{QStringLiteral("SKILL.md"), QByteArrayLiteral("---\ndescription: no name\n---\n")},
                                         {QStringLiteral("notes.txt"), QByteArrayLiteral("n")}});

    SkillImportPipeline pipeline(root.path());
    const ImportResult result = pipeline.importArchive(ImportRequest::fromFile(archive));
    REQUIRE(result.ok);
    CHECK(result.importedFolders == QStringList{QStringLiteral("root-pack")});
    CHECK(QFileInfo(QDir(root.path()).filePath(QStringLiteral("root-pack/notes.txt"))).isFile());
}

TEST_CASE("imports every bundle of a multi-skill archive")
{
    QTemporaryDir work;
    QTemporaryDir root;
    REQUIRE(work.isValid());
    REQUIRE(root.isValid());
    const QString archive = makeArchive(work, QStringLiteral("multi.zip"),
                                        {{QStringLiteral("a/SKILL.md"), descriptor(QStringLiteral("Alpha"))},
                                         {QStringLiteral("b/SKILL.md"), descriptor(QStringLiteral("Beta"))},
                                         {QStringLiteral(".hidden/SKILL.md"), descriptor(QStringLiteral("Hidden"))}});

    SkillImportPipeline pipeline(root.path());
    const ImportResult result = pipeline.importArchive(ImportRequest::fromFile(archive));
    REQUIRE(result.ok);
    CHECK(result.importedCount == 2);
    CHECK(visibleEntries(root.path()) == QStringList({QStringLiteral("Alpha"), QStringLiteral("Beta")}));
}

TEST_CASE("zip-slip entries reject the whole archive")
{
    QTemporaryDir work;
    QTemporaryDir root;
    REQUIRE(work.isValid());
    REQUIRE(root.isValid());
    const QString probe = QStringLiteral("skilldeck-zip-slip-probe.txt");
    const QString archive = makeArchive(work, QStringLiteral("slip.zip"),
                                        {{QStringLiteral("ok/SKILL.md"), descriptor(QStringLiteral("ok"))},
                                         {QStringLiteral("../") + probe, QByteArrayLiteral("escaped")}});

    SkillImportPipeline pipeline(root.path());
    const ImportResult result = pipeline.importArchive(ImportRequest::fromFile(archive));
    CHECK_FALSE(result.ok);
    CHECK(result.code == SkillErrorCode::UnsafePath);
    CHECK(visibleEntries(root.path()).isEmpty());
    CHECK_FALSE(QFileInfo::exists(QDir(QDir::tempPath()).filePath(probe)));
}

TEST_CASE("absolute entries reject the whole archive")
{
    QTemporaryDir work;
    QTemporaryDir root;
    REQUIRE(work.isValid());
    REQUIRE(root.isValid());
    const QString archive = makeArchive(work, QStringLiteral("abs.zip"),
                                        {{QStringLiteral("ok/SKILL.md"), descriptor(QStringLiteral("ok"))},
                                         {QStringLiteral("_tmp/skilldeck-abs-probe"), QByteArrayLiteral("x")}});
    REQUIRE(renameZipEntry(archive, QByteArrayLiteral("_tmp/skilldeck-abs-probe"), QByteArrayLiteral("/tmp/skilldeck-abs-probe")));

    SkillImportPipeline pipeline(root.path());
    const ImportResult result = pipeline.importArchive(ImportRequest::fromFile(archive));
    CHECK_FALSE(result.ok);
    CHECK(result.code == SkillErrorCode::UnsafePath);
    CHECK(visibleEntries(root.path()).isEmpty());
}

TEST_CASE("input validation errors")
{
    QTemporaryDir work;
    QTemporaryDir root;
    REQUIRE(work.isValid());
    REQUIRE(root.isValid());
    SkillImportPipeline pipeline(root.path());

    const ImportResult missing = pipeline.importArchive(ImportRequest::fromFile(QDir(work.path()).filePath(QStringLiteral("none.zip"))));
    CHECK(missing.code == SkillErrorCode::NotFound);

    const QString tarball = QDir(work.path()).filePath(QStringLiteral("bundle.tar"));
    REQUIRE(writeFile(tarball, QByteArrayLiteral("data")));
    const ImportResult wrongExtension = pipeline.importArchive(ImportRequest::fromFile(tarball));
    CHECK(wrongExtension.code == SkillErrorCode::InvalidInput);

    const ImportResult notZip = pipeline.importArchive(ImportRequest::fromBuffer(QByteArrayLiteral("%PDF-1.7 ...")));
    CHECK(notZip.code == SkillErrorCode::InvalidInput);

    const QString empty = makeArchive(work, QStringLiteral("empty.zip"), {{QStringLiteral("readme.txt"), QByteArrayLiteral("r")}});
    const ImportResult noSkill = pipeline.importArchive(ImportRequest::fromFile(empty));
    CHECK(noSkill.code == SkillErrorCode::InvalidInput);
    CHECK(noSkill.message.contains(QStringLiteral("SKILL.md")));

    SkillImportPipeline unconfigured;
    CHECK(unconfigured.importArchive(ImportRequest::fromFile(empty)).code == SkillErrorCode::InvalidInput);
}

TEST_CASE("imports from an in-memory buffer")
{
    QTemporaryDir work;
    QTemporaryDir root;
    REQUIRE(work.isValid());
    REQUIRE(root.isValid());
    const QByteArray bytes = zipBytes(work.path(), {{QStringLiteral("SKILL.md"), QByteArrayLiteral("---\ndescription: d\n---\n")}});
    REQUIRE_FALSE(bytes.isEmpty());

    SkillImportPipeline pipeline(root.path());
    const ImportResult result = pipeline.importArchive(ImportRequest::fromBuffer(bytes, QStringLiteral("dropped.zip")));
    REQUIRE(result.ok);
    CHECK(result.importedFolders == QStringList{QStringLiteral("dropped")});
}

TEST_CASE("conflicts are reported first and resolved on confirmation")
{
    QTemporaryDir work;
    QTemporaryDir root;
    REQUIRE(work.isValid());
    REQUIRE(root.isValid());
    REQUIRE(writeBundle(root.path(), QStringLiteral("pdf-old"), QStringLiteral("PDF"), QStringLiteral("old"), QStringLiteral("old body")));
    const QString archive = makeArchive(work, QStringLiteral("update.zip"),
                                        {{QStringLiteral("pdf/SKILL.md"), descriptor(QStringLiteral("pdf"), QStringLiteral("new body"))},
                                         {QStringLiteral("notes/SKILL.md"), descriptor(QStringLiteral("Notes"))}});
    SkillImportPipeline pipeline(root.path());

    const ImportResult first = pipeline.importArchive(ImportRequest::fromFile(archive));
    CHECK_FALSE(first.ok);
    CHECK(first.code == SkillErrorCode::Conflict);
    REQUIRE(first.conflicts.size() == 1);
    CHECK(first.conflicts.first().existingFolderName == QStringLiteral("pdf-old"));
    CHECK(first.conflicts.first().skillName == QStringLiteral("pdf"));
    CHECK(visibleEntries(root.path()) == QStringList{QStringLiteral("pdf-old")});

    ImportRequest confirmed = ImportRequest::fromFile(archive);
    confirmed.confirm({first.conflicts.first().existingFolderName});
    const ImportResult second = pipeline.importArchive(confirmed);
    REQUIRE(second.ok);
    CHECK(second.importedCount == 2);
    CHECK(visibleEntries(root.path()) == QStringList({QStringLiteral("Notes"), QStringLiteral("pdf")}));
    CHECK(readFile(QDir(root.path()).filePath(QStringLiteral("pdf/SKILL.md"))).contains("new body"));
    CHECK(hiddenEntries(root.path()).isEmpty());
}

TEST_CASE("declined conflicts are skipped while the rest is imported")
{
    QTemporaryDir work;
    QTemporaryDir root;
    REQUIRE(work.isValid());
    REQUIRE(root.isValid());
    REQUIRE(writeBundle(root.path(), QStringLiteral("pdf-old"), QStringLiteral("PDF")));
    const QString archive = makeArchive(work, QStringLiteral("update.zip"),
                                        {{QStringLiteral("pdf/SKILL.md"), descriptor(QStringLiteral("pdf"))},
                                         {QStringLiteral("notes/SKILL.md"), descriptor(QStringLiteral("Notes"))}});
    SkillImportPipeline pipeline(root.path());

    ImportRequest request = ImportRequest::fromFile(archive);
    request.confirm({});
    const ImportResult result = pipeline.importArchive(request);
    REQUIRE(result.ok);
    CHECK(result.importedFolders == QStringList{QStringLiteral("Notes")});
    CHECK(visibleEntries(root.path()) == QStringList({QStringLiteral("Notes"), QStringLiteral("pdf-old")}));
}

TEST_CASE("two incoming bundles sharing a confirmed name keep both copies")
{
    QTemporaryDir work;
    QTemporaryDir root;
    REQUIRE(work.isValid());
    REQUIRE(root.isValid());
    REQUIRE(writeBundle(root.path(), QStringLiteral("pdf"), QStringLiteral("pdf"), QStringLiteral("old"), QStringLiteral("old body")));
    const QString archive = makeArchive(work, QStringLiteral("twins.zip"),
                                        {{QStringLiteral("a/SKILL.md"), descriptor(QStringLiteral("pdf"), QStringLiteral("first body"))},
                                         {QStringLiteral("b/SKILL.md"), descriptor(QStringLiteral("pdf"), QStringLiteral("second body"))}});
    SkillImportPipeline pipeline(root.path());

    ImportRequest request = ImportRequest::fromFile(archive);
    request.confirm({QStringLiteral("pdf")});
    const ImportResult result = pipeline.importArchive(request);
    REQUIRE(result.ok);
    CHECK(result.importedCount == 2);
    CHECK(result.importedFolders == QStringList({QStringLiteral("pdf"), QStringLiteral("pdf-2")}));
    CHECK(visibleEntries(root.path()) == QStringList({QStringLiteral("pdf"), QStringLiteral("pdf-2")}));
    CHECK(readFile(QDir(root.path()).filePath(QStringLiteral("pdf/SKILL.md"))).contains("first body"));
    CHECK(readFile(QDir(root.path()).filePath(QStringLiteral("pdf-2/SKILL.md"))).contains("second body"));
    CHECK(hiddenEntries(root.path()).isEmpty());
}

TEST_CASE("occupied destination folders get a numeric suffix")
{
    QTemporaryDir work;
    QTemporaryDir root;
    REQUIRE(work.isValid());
    REQUIRE(root.isValid());
    REQUIRE(writeBundle(root.path(), QStringLiteral("Notes"), QStringLiteral("Something Else")));
    const QString archive = makeArchive(work, QStringLiteral("notes.zip"),
                                        {{QStringLiteral("one/SKILL.md"), descriptor(QStringLiteral("Notes"))},
                                         {QStringLiteral("two/SKILL.md"), descriptor(QStringLiteral("Notes"))}});
    SkillImportPipeline pipeline(root.path());
    const ImportResult result = pipeline.importArchive(ImportRequest::fromFile(archive));
    REQUIRE(result.ok);
    CHECK(result.importedFolders == QStringList({QStringLiteral("Notes-2"), QStringLiteral("Notes-3")}));
    CHECK(readFile(QDir(root.path()).filePath(QStringLiteral("Notes/SKILL.md"))).contains("Something Else"));
}

TEST_CASE("ImportQueue serves tickets in order")
{
    ImportQueue queue;
    const quint64 first = queue.enqueue();
    const quint64 second = queue.enqueue();
    CHECK(first == 1);
    CHECK(second == 2);

    queue.waitTurn(first);
    QAtomicInt entered(0);
    QFuture<void> waiter = QtConcurrent::run([&queue, &entered, second]() {
        ImportQueue::Turn turn(queue, second);
        entered.storeRelease(1);
    });
    QThread::msleep(50);
    CHECK(entered.loadAcquire() == 0);
    queue.release(first);
    waiter.waitForFinished();
    CHECK(entered.loadAcquire() == 1);
}

TEST_CASE("concurrent imports run one at a time in arrival order")
{
    QTemporaryDir work;
    QTemporaryDir root;
    REQUIRE(work.isValid());
    REQUIRE(root.isValid());

    QStringList archives;
    for (int i = 0; i < 4; ++i)
    {
        const QString name = QStringLiteral("Skill %1").arg(i);
        archives << makeArchive(work, QStringLiteral("s%1.zip").arg(i),
                                {{QStringLiteral("s/SKILL.md"), descriptor(name)},
                                 {QStringLiteral("s/payload.bin"), QByteArray(64 * 1024, 'x')}});
    }

    StageLog log;
    SkillImportPipeline pipeline(root.path());
    pipeline.setStageObserver([&log](quint64 ticket, ImportStage stage) { log.record(ticket, stage); });

    QVector<QFuture<ImportResult>> futures;
    for (int i = 0; i < 3; ++i) futures << pipeline.importArchiveAsync(ImportRequest::fromFile(archives.at(i)));
    const ImportResult syncResult = pipeline.importArchive(ImportRequest::fromFile(archives.at(3)));

    for (int i = 0; i < futures.size(); ++i)
    {
        futures[i].waitForFinished();
        const ImportResult r = futures[i].result();
        CHECK(r.ok);
        CHECK(r.ticket == static_cast<quint64>(i + 1));
    }
    CHECK(syncResult.ok);
    CHECK(syncResult.ticket == 4);

    QVector<QPair<quint64, ImportStage>> running;
    {
        QMutexLocker locker(&log.mutex);
        for (const auto &event : log.events)
        {
            if (event.second != ImportStage::Queued) running.push_back(event);
        }
    }
    // Started..Finished blocks never interleave and follow ticket order.
    REQUIRE(running.size() == 16);
    const ImportStage expected[] = {ImportStage::Started, ImportStage::Extracted, ImportStage::Committed,
                                    ImportStage::Finished};
    for (int i = 0; i < running.size(); ++i)
    {
        CHECK(running.at(i).first == static_cast<quint64>(i / 4 + 1));
        CHECK(running.at(i).second == expected[i % 4]);
    }
    CHECK(visibleEntries(root.path()).size() == 4);
}
