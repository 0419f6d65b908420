#include <QtTest>
#include "sftpflow/PathTemplate.hpp"

using namespace sftpflow;

static QString q(const std::string& s) { return QString::fromStdString(s); }

class TestPathTemplate : public QObject
{
    Q_OBJECT

private slots:
    void rendersRecordFields()
    {
        TransferRecord r;
        r.title = "Show";
        r.location = "/tmp/in/e01.mkv";
        r.size = 42;
        FieldPathRenderer renderer;
        std::string out, err;
        QVERIFY(renderer.render("/dl/{{ title }}/{{filename}}.{{ size }}", r, out, err));
        QCOMPARE(q(out), QString("/dl/Show/e01.mkv.42"));
    }

    void customFieldsWin()
    {
        TransferRecord r;
        r.title = "Show";
        r.fields["title"] = "Override";
        r.fields["series"] = "Foo";
        FieldPathRenderer renderer;
        std::string out, err;
        QVERIFY(renderer.render("{{series}}/{{title}}", r, out, err));
        QCOMPARE(q(out), QString("Foo/Override"));
    }

    void plainTextPassesThrough()
    {
        FieldPathRenderer renderer;
        std::string out, err;
        QVERIFY(renderer.render("/srv/in", TransferRecord{}, out, err));
        QCOMPARE(q(out), QString("/srv/in"));
    }

    void unknownFieldFails()
    {
        FieldPathRenderer renderer;
        std::string out, err;
        QVERIFY(!renderer.render("/dl/{{ nope }}", TransferRecord{}, out, err));
        QVERIFY(err.find("nope") != std::string::npos);
    }

    void unterminatedFails()
    {
        FieldPathRenderer renderer;
        std::string out, err;
        QVERIFY(!renderer.render("/dl/{{ title", TransferRecord{}, out, err));
        QVERIFY(!err.empty());
    }

    void firstFailureWins()
    {
        TransferRecord r;
        r.fail(ErrorKind::Render, "first");
        r.fail(ErrorKind::Transfer, "second");
        r.succeed();
        r.skip("later");
        QCOMPARE(r.status, RecordStatus::Failed);
        QCOMPARE(q(r.reason), QString("first"));
        QCOMPARE(r.errorKind, ErrorKind::Render);
        QCOMPARE(QString(recordStatusName(r.status)), QString("FAILED"));
    }
};

QTEST_APPLESS_MAIN(TestPathTemplate)
#include "tst_pathtemplate.moc"
