// Secret storage for site passwords and key passphrases.
// Only the insecure QSettings fallback exists; it is off unless
// SFTPFLOW_ENABLE_INSECURE_FALLBACK=1.
#pragma once
#include <QString>
#include <optional>

class SecretStore {
public:
    // Store a secret under a logical key (e.g. "site:Name:password").
    void setSecret(const QString& key, const QString& value);

    // Retrieve a secret if present.
    std::optional<QString> getSecret(const QString& key) const;

    void removeSecret(const QString& key);

    static bool insecureFallbackActive();
};
