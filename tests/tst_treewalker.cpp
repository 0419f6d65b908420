#include <QtTest>
#include "sftpflow/MockSftpClient.hpp"
#include "sftpflow/TreeWalker.hpp"

using namespace sftpflow;

class TestTreeWalker : public QObject
{
    Q_OBJECT

private:
    std::shared_ptr<MockRemote> remote_;
    std::unique_ptr<MockSftpClient> client_;
    QStringList visits_;

    TreeWalker::NodeCallback record(const QString& tag)
    {
        return [this, tag](const RemoteNode& node, Error&) {
            visits_ << tag + ":" + QString::fromStdString(node.path);
            return true;
        };
    }

private slots:
    void init()
    {
        remote_ = std::make_shared<MockRemote>();
        remote_->addFile("/r/a.txt", "a");
        remote_->addFile("/r/b/c.txt", "cc");
        remote_->addFile("/r/b/d/e.txt", "eee");
        remote_->addSpecial("/r/link");
        client_ = std::make_unique<MockSftpClient>(remote_);
        SessionOptions opt;
        opt.identity.host = "example.com";
        opt.identity.username = "me";
        std::string err;
        QVERIFY(client_->connect(opt, err));
        visits_.clear();
    }

    void recursiveWalkVisitsEveryNode()
    {
        TreeWalker walker(*client_);
        Error err;
        QVERIFY(walker.walk("/r", record("F"), record("D"), record("U"), true, err));
        QCOMPARE(visits_, (QStringList{ "D:/r", "F:/r/a.txt", "D:/r/b", "F:/r/b/c.txt",
                                        "D:/r/b/d", "F:/r/b/d/e.txt", "U:/r/link" }));
    }

    void shallowWalkStopsAtChildren()
    {
        TreeWalker walker(*client_);
        Error err;
        QVERIFY(walker.walk("/r", record("F"), record("D"), record("U"), false, err));
        QCOMPARE(visits_, (QStringList{ "D:/r", "F:/r/a.txt", "D:/r/b", "U:/r/link" }));
    }

    void fileRootIsDispatchedAlone()
    {
        TreeWalker walker(*client_);
        Error err;
        QVERIFY(walker.walk("/r/a.txt", record("F"), record("D"), record("U"), true, err));
        QCOMPARE(visits_, QStringList{ "F:/r/a.txt" });
    }

    void missingRootIsPathNotFound()
    {
        TreeWalker walker(*client_);
        Error err;
        QVERIFY(!walker.walk("/nope", record("F"), record("D"), record("U"), true, err));
        QCOMPARE(err.kind, ErrorKind::PathNotFound);
        QVERIFY(visits_.isEmpty());
    }

    void rootStatFailureIsTraversal()
    {
        remote_->failStat.insert("/r");
        TreeWalker walker(*client_);
        Error err;
        QVERIFY(!walker.walk("/r", record("F"), record("D"), record("U"), true, err));
        QCOMPARE(err.kind, ErrorKind::Traversal);
    }

    void listingFailureIsTraversal()
    {
        remote_->failList.insert("/r/b");
        TreeWalker walker(*client_);
        Error err;
        QVERIFY(!walker.walk("/r", record("F"), record("D"), record("U"), true, err));
        QCOMPARE(err.kind, ErrorKind::Traversal);
        QVERIFY(!visits_.contains("F:/r/b/c.txt"));
        QVERIFY(!visits_.contains("U:/r/link"));
    }

    void callbackStopsWalk()
    {
        TreeWalker walker(*client_);
        Error err;
        int files = 0;
        auto onFile = [&files](const RemoteNode& node, Error& e) {
            ++files;
            e.set(ErrorKind::Transfer, "stop at " + node.path);
            return false;
        };
        QVERIFY(!walker.walk("/r", onFile, record("D"), record("U"), true, err));
        QCOMPARE(files, 1);
        QCOMPARE(err.kind, ErrorKind::Transfer);
        QCOMPARE(QString::fromStdString(err.message), QString("stop at /r/a.txt"));
    }

    void emptyCallbacksAreIgnored()
    {
        TreeWalker walker(*client_);
        Error err;
        QVERIFY(walker.walk("/r", record("F"), TreeWalker::NodeCallback(), TreeWalker::NodeCallback(), true, err));
        QCOMPARE(visits_, (QStringList{ "F:/r/a.txt", "F:/r/b/c.txt", "F:/r/b/d/e.txt" }));
    }
};

QTEST_APPLESS_MAIN(TestTreeWalker)
#include "tst_treewalker.moc"
