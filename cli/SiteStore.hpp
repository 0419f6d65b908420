// Saved connection profiles ("sites") kept in QSettings.
#pragma once
#include <QString>
#include <QVector>
#include <optional>
#include "sftpflow/SftpTypes.hpp"

struct SiteEntry {
    QString name;
    sftpflow::SessionOptions opt;   // secrets are not part of the stored entry
};

class SiteStore {
public:
    QVector<SiteEntry> load() const;
    std::optional<SiteEntry> find(const QString& name) const;
    // Insert or replace by name. Password and passphrase go to SecretStore.
    void save(const SiteEntry& entry);
    bool remove(const QString& name);

private:
    void write(const QVector<SiteEntry>& sites);
};
