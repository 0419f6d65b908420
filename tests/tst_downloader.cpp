#include <QtTest>
#include <QFile>
#include <QTemporaryDir>
#include "sftpflow/Downloader.hpp"
#include "sftpflow/MockSftpClient.hpp"

using namespace sftpflow;

static QString readLocal(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return QString();
    return QString::fromUtf8(f.readAll());
}

static TransferRecord sftpRecord(const std::string& url, const std::string& title = "item")
{
    TransferRecord r;
    r.title = title;
    r.url = url;
    return r;
}

class TestDownloader : public QObject
{
    Q_OBJECT

private:
    std::shared_ptr<MockRemote> remote_;
    std::unique_ptr<MockSftpClient> proto_;
    std::unique_ptr<ConnectionManager> connections_;
    std::unique_ptr<QTemporaryDir> tmp_;
    FieldPathRenderer renderer_;

    std::string dest() const { return (tmp_->path() + "/dl").toStdString(); }
    QString local(const QString& rel) const { return tmp_->path() + "/dl/" + rel; }

    DownloadOptions options(bool deleteOrigin = false) const
    {
        DownloadOptions o;
        o.destination = dest();
        o.deleteOrigin = deleteOrigin;
        return o;
    }

private slots:
    void init()
    {
        remote_ = std::make_shared<MockRemote>();
        remote_->addFile("/data/a.txt", "hello");
        proto_ = std::make_unique<MockSftpClient>(remote_);
        RetryPolicy policy;
        policy.maxAttempts = 1;
        connections_ = std::make_unique<ConnectionManager>(*proto_, SessionOptions{}, policy,
                                                           [](std::chrono::seconds) {});
        tmp_ = std::make_unique<QTemporaryDir>();
        QVERIFY(tmp_->isValid());
    }

    void downloadsSingleFile()
    {
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{ sftpRecord("sftp://me@example.com/data/a.txt") };
        QVERIFY(dl.download(records, options()));
        QCOMPARE(records[0].status, RecordStatus::Done);
        QCOMPARE(readLocal(local("a.txt")), QString("hello"));
        QCOMPARE(remote_->disconnects, remote_->connects);
    }

    void existingDestinationIsLeftAlone()
    {
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> first{ sftpRecord("sftp://me@example.com/data/a.txt") };
        QVERIFY(dl.download(first, options()));
        std::vector<TransferRecord> again{ sftpRecord("sftp://me@example.com/data/a.txt") };
        QVERIFY(dl.download(again, options(true)));
        QCOMPARE(again[0].status, RecordStatus::Done);
        QCOMPARE(remote_->gets, 1);
        // nothing was transferred, so the origin stays
        QVERIFY(remote_->has("/data/a.txt"));
    }

    void failedTransferLeavesNoPartialFile()
    {
        remote_->failGet.insert("/data/a.txt");
        remote_->partialBytesOnFailedGet = 3;
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{ sftpRecord("sftp://me@example.com/data/a.txt") };
        QVERIFY(dl.download(records, options(true)));
        QCOMPARE(records[0].status, RecordStatus::Failed);
        QCOMPARE(records[0].errorKind, ErrorKind::Transfer);
        QVERIFY(!QFile::exists(local("a.txt")));
        QVERIFY(remote_->has("/data/a.txt"));
    }

    void deleteOriginPrunesEmptyParent()
    {
        remote_->addFile("/data/show/e01.mkv", "video");
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{ sftpRecord("sftp://me@example.com/data/show/e01.mkv") };
        QVERIFY(dl.download(records, options(true)));
        QCOMPARE(records[0].status, RecordStatus::Done);
        QVERIFY(!remote_->has("/data/show/e01.mkv"));
        QVERIFY(!remote_->has("/data/show"));
        QVERIFY(remote_->has("/data"));
    }

    void deleteFailureDoesNotFailRecord()
    {
        remote_->failRemove.insert("/data/a.txt");
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{ sftpRecord("sftp://me@example.com/data/a.txt") };
        QVERIFY(dl.download(records, options(true)));
        QCOMPARE(records[0].status, RecordStatus::Done);
        QVERIFY(remote_->has("/data/a.txt"));
    }

    void pruneReportsCleanupErrors()
    {
        remote_->addDir("/data/empty");
        remote_->failRemoveDir.insert("/data/empty");
        Error err;
        auto session = connections_->connect(ConnectionIdentity{ "example.com", 22, "me", {}, {}, {} }, err);
        QVERIFY(session);
        QVERIFY(!pruneEmptyDirectory(*session, "/data/empty", err));
        QCOMPARE(err.kind, ErrorKind::Cleanup);
        err.clear();
        QVERIFY(pruneEmptyDirectory(*session, "/data", err));
        QVERIFY(remote_->has("/data"));
        QVERIFY(pruneEmptyDirectory(*session, "/nowhere", err));
        QVERIFY(!err.isSet());
    }

    void directoryKeepsItsName()
    {
        remote_->addFile("/x/dir/f1", "one");
        remote_->addFile("/x/dir/sub/f2", "two");
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{ sftpRecord("sftp://me@example.com/x/dir") };
        QVERIFY(dl.download(records, options()));
        QCOMPARE(records[0].status, RecordStatus::Done);
        QCOMPARE(readLocal(local("dir/f1")), QString("one"));
        QCOMPARE(readLocal(local("dir/sub/f2")), QString("two"));
    }

    void shallowDirectoryDownload()
    {
        remote_->addFile("/x/dir/f1", "one");
        remote_->addFile("/x/dir/sub/f2", "two");
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{ sftpRecord("sftp://me@example.com/x/dir") };
        records[0].recursive = false;
        QVERIFY(dl.download(records, options()));
        QVERIFY(QFile::exists(local("dir/f1")));
        QVERIFY(!QFile::exists(local("dir/sub/f2")));
    }

    void directoryDeleteOriginRemovesTree()
    {
        remote_->addFile("/x/dir/f1", "one");
        remote_->addFile("/x/dir/sub/f2", "two");
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{ sftpRecord("sftp://me@example.com/x/dir") };
        QVERIFY(dl.download(records, options(true)));
        QCOMPARE(records[0].status, RecordStatus::Done);
        QVERIFY(!remote_->has("/x/dir"));
        QVERIFY(remote_->has("/x"));
    }

    void directoryFailureFailsRecord()
    {
        remote_->addFile("/x/dir/f1", "one");
        remote_->failGet.insert("/x/dir/f1");
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{ sftpRecord("sftp://me@example.com/x/dir") };
        QVERIFY(dl.download(records, options()));
        QCOMPARE(records[0].status, RecordStatus::Failed);
        QVERIFY(records[0].reason.find("Failed to download directory") != std::string::npos);
    }

    void missingSourceFails()
    {
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{ sftpRecord("sftp://me@example.com/data/nope.txt") };
        QVERIFY(dl.download(records, options()));
        QCOMPARE(records[0].status, RecordStatus::Failed);
        QVERIFY(records[0].reason.find("does not exist") != std::string::npos);
        QCOMPARE(records[0].errorKind, ErrorKind::PathNotFound);
    }

    void unknownSourceIsSkipped()
    {
        remote_->addSpecial("/data/fifo");
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{ sftpRecord("sftp://me@example.com/data/fifo") };
        QVERIFY(dl.download(records, options()));
        QCOMPARE(records[0].status, RecordStatus::Skipped);
        QCOMPARE(remote_->gets, 0);
    }

    void destinationIsRendered()
    {
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{ sftpRecord("sftp://me@example.com/data/a.txt", "Show") };
        DownloadOptions o = options();
        o.destination = dest() + "/{{ title }}";
        QVERIFY(dl.download(records, o));
        QCOMPARE(readLocal(local("Show/a.txt")), QString("hello"));
    }

    void renderFailureFailsRecord()
    {
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{ sftpRecord("sftp://me@example.com/data/a.txt") };
        DownloadOptions o = options();
        o.destination = dest() + "/{{ missing }}";
        QVERIFY(dl.download(records, o));
        QCOMPARE(records[0].status, RecordStatus::Failed);
        QCOMPARE(records[0].errorKind, ErrorKind::Render);
        QCOMPARE(remote_->gets, 0);
    }

    void runsOfIdentitiesShareSessions()
    {
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{
            sftpRecord("sftp://me@a.example.com/data/a.txt"),
            sftpRecord("sftp://me@b.example.com/data/a.txt"),
            sftpRecord("sftp://me@a.example.com/data/a.txt"),
        };
        QVERIFY(dl.download(records, options()));
        QCOMPARE(remote_->connects, 3);
        QCOMPARE(remote_->disconnects, 3);
        for (const TransferRecord& r : records) QCOMPARE(r.status, RecordStatus::Done);
    }

    void connectionFailureFailsGroup()
    {
        remote_->failConnects = -1;
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{
            sftpRecord("sftp://me@example.com/data/a.txt"),
            sftpRecord("sftp://me@example.com/data/b.txt"),
        };
        QVERIFY(dl.download(records, options()));
        for (const TransferRecord& r : records) {
            QCOMPARE(r.status, RecordStatus::Failed);
            QVERIFY(r.reason.find("Failed to connect to example.com") != std::string::npos);
            QCOMPARE(r.errorKind, ErrorKind::Connection);
        }
    }

    void foreignSchemeIsRejected()
    {
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{
            sftpRecord("http://example.com/data/a.txt"),
            sftpRecord("sftp://me@example.com/data/a.txt"),
        };
        QVERIFY(dl.download(records, options()));
        QCOMPARE(records[0].status, RecordStatus::Failed);
        QCOMPARE(records[1].status, RecordStatus::Done);

        std::vector<TransferRecord> none{ sftpRecord("ftp://example.com/x") };
        QVERIFY(!dl.download(none, options()));
        QCOMPARE(none[0].status, RecordStatus::Failed);
    }

    void urlWithoutUserUsesDefaultLogin()
    {
        Downloader dl(*connections_, renderer_);
        std::vector<TransferRecord> records{ sftpRecord("sftp://example.com/data/a.txt") };
        DownloadOptions o = options();
        o.defaultIdentity.username = "me";
        o.defaultIdentity.password = std::string("secret");
        QVERIFY(dl.download(records, o));
        QCOMPARE(records[0].status, RecordStatus::Done);
        QCOMPARE(remote_->connectAttempts, 1);
        QCOMPARE(readLocal(local("a.txt")), QString("hello"));
    }

    void urlUserOverridesDefaultLogin()
    {
        ConnectionIdentity defaults;
        defaults.username = "me";
        defaults.password = std::string("secret");

        const auto own = Downloader::identityOf(sftpRecord("sftp://bob@example.com/x"), defaults);
        QVERIFY(own.has_value());
        QCOMPARE(QString::fromStdString(own->username), QString("bob"));
        QVERIFY(!own->password.has_value());

        const auto withPass = Downloader::identityOf(sftpRecord("sftp://:pw@example.com/x"), defaults);
        QVERIFY(withPass.has_value());
        QCOMPARE(QString::fromStdString(withPass->username), QString("me"));
        QCOMPARE(QString::fromStdString(*withPass->password), QString("pw"));
    }

    void recordKeyReachesSession()
    {
        TransferRecord r = sftpRecord("sftp://me@example.com/data/a.txt");
        r.private_key_path = std::string("/keys/id_rsa");
        const auto id = Downloader::identityOf(r);
        QVERIFY(id.has_value());
        QCOMPARE(QString::fromStdString(*id->private_key_path), QString("/keys/id_rsa"));
        QCOMPARE(QString::fromStdString(id->host), QString("example.com"));
    }
};

QTEST_APPLESS_MAIN(TestDownloader)
#include "tst_downloader.moc"
