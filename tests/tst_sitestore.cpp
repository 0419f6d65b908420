#include <QtTest>
#include <QSettings>
#include <QTemporaryDir>
#include "SecretStore.hpp"
#include "SiteStore.hpp"

class TestSiteStore : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir config_;

    static SiteEntry site(const QString& name)
    {
        SiteEntry e;
        e.name = name;
        e.opt.identity.host = "example.com";
        e.opt.identity.port = 2222;
        e.opt.identity.username = "me";
        return e;
    }

private slots:
    void initTestCase()
    {
        QVERIFY(config_.isValid());
        QSettings::setPath(QSettings::NativeFormat, QSettings::UserScope, config_.path());
        qputenv("SFTPFLOW_ENABLE_INSECURE_FALLBACK", "1");
    }

    void init()
    {
        QSettings("sftpflow", "sftpflow").clear();
        QSettings("sftpflow", "Secrets").clear();
    }

    void savesAndFindsSite()
    {
        SiteEntry e = site("box");
        e.opt.identity.password = std::string("secret");
        e.opt.known_hosts_path = "/tmp/kh";
        SiteStore store;
        store.save(e);

        auto found = store.find("box");
        QVERIFY(found.has_value());
        QCOMPARE(QString::fromStdString(found->opt.identity.host), QString("example.com"));
        QCOMPARE(int(found->opt.identity.port), 2222);
        QCOMPARE(QString::fromStdString(found->opt.known_hosts_path), QString("/tmp/kh"));
        QVERIFY(found->opt.identity.password.has_value());
        QCOMPARE(QString::fromStdString(*found->opt.identity.password), QString("secret"));
        QVERIFY(!store.find("other").has_value());
    }

    void resaveWithoutSecretsDropsOldOnes()
    {
        SiteStore store;
        SiteEntry e = site("box");
        e.opt.identity.password = std::string("secret");
        e.opt.identity.private_key_passphrase = std::string("kp");
        store.save(e);

        store.save(site("box"));
        auto found = store.find("box");
        QVERIFY(found.has_value());
        QVERIFY(!found->opt.identity.password.has_value());
        QVERIFY(!found->opt.identity.private_key_passphrase.has_value());
        QCOMPARE(store.load().size(), qsizetype(1));
    }

    void removeDeletesSiteAndSecrets()
    {
        SiteStore store;
        SiteEntry e = site("box");
        e.opt.identity.password = std::string("secret");
        store.save(e);
        QVERIFY(store.remove("box"));
        QVERIFY(!store.remove("box"));
        QVERIFY(!SecretStore().getSecret("site:box:password").has_value());
    }
};

QTEST_APPLESS_MAIN(TestSiteStore)
#include "tst_sitestore.moc"
