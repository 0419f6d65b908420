// Site profiles: QSettings array "sites", secrets in SecretStore.
#include "SiteStore.hpp"
#include "SecretStore.hpp"
#include <QSettings>

QVector<SiteEntry> SiteStore::load() const {
    QVector<SiteEntry> sites;
    QSettings s("sftpflow", "sftpflow");
    int n = s.beginReadArray("sites");
    for (int i = 0; i < n; ++i) {
        s.setArrayIndex(i);
        SiteEntry e;
        e.name = s.value("name").toString();
        e.opt.identity.host = s.value("host").toString().toStdString();
        e.opt.identity.port = (std::uint16_t)s.value("port", 22).toUInt();
        e.opt.identity.username = s.value("user").toString().toStdString();
        const QString kp = s.value("keyPath").toString();
        if (!kp.isEmpty()) e.opt.identity.private_key_path = kp.toStdString();
        const QString kh = s.value("knownHosts").toString();
        if (!kh.isEmpty()) e.opt.known_hosts_path = kh.toStdString();
        e.opt.known_hosts_policy = (sftpflow::KnownHostsPolicy)s.value("khPolicy", (int)sftpflow::KnownHostsPolicy::Strict).toInt();
        sites.push_back(e);
    }
    s.endArray();
    return sites;
}

std::optional<SiteEntry> SiteStore::find(const QString& name) const {
    for (const SiteEntry& e : load()) {
        if (e.name == name) {
            SiteEntry out = e;
            SecretStore secrets;
            if (auto pw = secrets.getSecret(QString("site:%1:password").arg(name)))
                out.opt.identity.password = pw->toStdString();
            if (auto kp = secrets.getSecret(QString("site:%1:keypass").arg(name)))
                out.opt.identity.private_key_passphrase = kp->toStdString();
            return out;
        }
    }
    return std::nullopt;
}

void SiteStore::save(const SiteEntry& entry) {
    QVector<SiteEntry> sites = load();
    bool replaced = false;
    for (SiteEntry& e : sites) {
        if (e.name == entry.name) {
            e = entry;
            replaced = true;
        }
    }
    if (!replaced) sites.push_back(entry);
    write(sites);

    SecretStore secrets;
    const auto& id = entry.opt.identity;
    const QString pwKey = QString("site:%1:password").arg(entry.name);
    const QString kpKey = QString("site:%1:keypass").arg(entry.name);
    if (id.password) secrets.setSecret(pwKey, QString::fromStdString(*id.password));
    else secrets.removeSecret(pwKey);
    if (id.private_key_passphrase) secrets.setSecret(kpKey, QString::fromStdString(*id.private_key_passphrase));
    else secrets.removeSecret(kpKey);
}

bool SiteStore::remove(const QString& name) {
    QVector<SiteEntry> sites = load();
    QVector<SiteEntry> next;
    for (const SiteEntry& e : sites) {
        if (e.name != name) next.push_back(e);
    }
    if (next.size() == sites.size()) return false;
    write(next);
    SecretStore secrets;
    secrets.removeSecret(QString("site:%1:password").arg(name));
    secrets.removeSecret(QString("site:%1:keypass").arg(name));
    return true;
}

void SiteStore::write(const QVector<SiteEntry>& sites) {
    QSettings s("sftpflow", "sftpflow");
    // Clear previous array to avoid stale entries after deletions
    s.remove("sites");
    s.beginWriteArray("sites");
    for (int i = 0; i < sites.size(); ++i) {
        s.setArrayIndex(i);
        const auto& e = sites[i];
        const auto& id = e.opt.identity;
        s.setValue("name", e.name);
        s.setValue("host", QString::fromStdString(id.host));
        s.setValue("port", (int)id.port);
        s.setValue("user", QString::fromStdString(id.username));
        s.setValue("keyPath", id.private_key_path ? QString::fromStdString(*id.private_key_path) : QString());
        s.setValue("knownHosts", e.opt.known_hosts_path ? QString::fromStdString(*e.opt.known_hosts_path) : QString());
        s.setValue("khPolicy", (int)e.opt.known_hosts_policy);
    }
    s.endArray();
}
