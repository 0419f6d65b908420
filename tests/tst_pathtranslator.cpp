#include <QtTest>
#include "sftpflow/PathTranslator.hpp"

using namespace sftpflow;

static QString q(const std::string& s) { return QString::fromStdString(s); }

class TestPathTranslator : public QObject
{
    Q_OBJECT

private slots:
    void remoteRoundTrip_data()
    {
        QTest::addColumn<QString>("path");
        QTest::newRow("absolute") << "/data/tv/show.mkv";
        QTest::newRow("relative") << "data/tv";
        QTest::newRow("root") << "/";
        QTest::newRow("empty") << "";
        QTest::newRow("trailing") << "/data/tv/";
        QTest::newRow("doubled") << "//data//tv";
        QTest::newRow("dots") << "./a/../b";
        QTest::newRow("spaces") << "/My Files/a b.txt";
    }

    void remoteRoundTrip()
    {
        QFETCH(QString, path);
        const std::string p = path.toStdString();
        QCOMPARE(q(path::joinSegments(path::splitSegments(p, '/'), '/')), path);
    }

    void localRoundTrip()
    {
        const std::string sep(1, path::kLocalSeparator);
        for (const std::string& p : { sep + "home" + sep + "me" + sep + "x.bin",
                                      std::string("rel") + sep + sep + "x",
                                      sep }) {
            const auto parts = path::splitSegments(p, path::kLocalSeparator);
            QCOMPARE(q(path::joinSegments(parts, path::kLocalSeparator)), q(p));
        }
    }

    void remoteToLocalKeepsSegments()
    {
        const std::string local = path::remoteToLocal("show/season 1/e01.mkv");
        const auto parts = path::splitSegments(local, path::kLocalSeparator);
        QCOMPARE(parts.size(), std::size_t(3));
        QCOMPARE(q(parts[0]), QString("show"));
        QCOMPARE(q(parts[1]), QString("season 1"));
        QCOMPARE(q(parts[2]), QString("e01.mkv"));
        QCOMPARE(q(path::localToRemote(local)), QString("show/season 1/e01.mkv"));
    }

    void remoteJoin()
    {
        QCOMPARE(q(path::remoteJoin("/data", "a.txt")), QString("/data/a.txt"));
        QCOMPARE(q(path::remoteJoin("/data/", "a.txt")), QString("/data/a.txt"));
        QCOMPARE(q(path::remoteJoin("", "a.txt")), QString("a.txt"));
        QCOMPARE(q(path::remoteJoin("/data", "/abs")), QString("/abs"));
        QCOMPARE(q(path::remoteJoin(".", "a")), QString("./a"));
    }

    void basenameDirname()
    {
        QCOMPARE(q(path::remoteBasename("/data/a.txt")), QString("a.txt"));
        QCOMPARE(q(path::remoteBasename("/data/")), QString(""));
        QCOMPARE(q(path::remoteBasename("a.txt")), QString("a.txt"));
        QCOMPARE(q(path::remoteDirname("/data/a.txt")), QString("/data"));
        QCOMPARE(q(path::remoteDirname("/a.txt")), QString("/"));
        QCOMPARE(q(path::remoteDirname("a.txt")), QString(""));
        QCOMPARE(q(path::remoteDirname("/data//a.txt")), QString("/data"));
        QCOMPARE(q(path::remoteDirname("/")), QString("/"));
    }

    void normalizeOnlyWhenAsked()
    {
        QCOMPARE(q(path::remoteNormalize("/data/./tv/../a/")), QString("/data/a"));
        QCOMPARE(q(path::remoteNormalize("/..")), QString("/"));
        QCOMPARE(q(path::remoteNormalize("../x")), QString("../x"));
        QCOMPARE(q(path::remoteNormalize("")), QString("."));
        QCOMPARE(q(path::remoteNormalize("a/..")), QString("."));
        // join does not normalize
        QCOMPARE(q(path::remoteJoin("/data/..", "x")), QString("/data/../x"));
    }

    void relative()
    {
        std::string rel;
        QVERIFY(path::remoteRelative("/x/dir/sub/f", "/x", rel));
        QCOMPARE(q(rel), QString("dir/sub/f"));
        QVERIFY(path::remoteRelative("/dir/f", "/", rel));
        QCOMPARE(q(rel), QString("dir/f"));
        QVERIFY(path::remoteRelative("dir/f", "", rel));
        QCOMPARE(q(rel), QString("dir/f"));
        QVERIFY(!path::remoteRelative("/other/f", "/x", rel));
        QVERIFY(!path::remoteRelative("/xy/f", "/x", rel));
    }

    void localJoinNests()
    {
        const std::string sep(1, path::kLocalSeparator);
        QCOMPARE(q(path::localJoin("dl", "a.txt")), q("dl" + sep + "a.txt"));
        QCOMPARE(q(path::localJoin("dl" + sep, "a.txt")), q("dl" + sep + "a.txt"));
        QCOMPARE(q(path::localJoin("dl", sep + "a.txt")), q("dl" + sep + "a.txt"));
        QCOMPARE(q(path::localJoin("", "a.txt")), QString("a.txt"));
        QCOMPARE(q(path::localBasename("dl" + sep + "a.txt")), QString("a.txt"));
        QCOMPARE(q(path::localDirname("dl" + sep + "a.txt")), QString("dl"));
    }
};

QTEST_APPLESS_MAIN(TestPathTranslator)
#include "tst_pathtranslator.moc"
