// SecretStore implementation: optional fallback with QSettings.
#include "SecretStore.hpp"
#include <QSettings>
#include <QVariant>
#include <cstdlib>

static bool fallbackEnabledEnv() {
    const char* v = std::getenv("SFTPFLOW_ENABLE_INSECURE_FALLBACK");
    return v && *v == '1';
}

void SecretStore::setSecret(const QString& key, const QString& value) {
    if (!fallbackEnabledEnv()) return;
    QSettings s("sftpflow", "Secrets");
    s.setValue(key, value);
}

std::optional<QString> SecretStore::getSecret(const QString& key) const {
    if (!fallbackEnabledEnv()) return std::nullopt;
    QSettings s("sftpflow", "Secrets");
    QVariant v = s.value(key);
    if (!v.isValid()) return std::nullopt;
    return v.toString();
}

void SecretStore::removeSecret(const QString& key) {
    if (!fallbackEnabledEnv()) return;
    QSettings s("sftpflow", "Secrets");
    s.remove(key);
}

bool SecretStore::insecureFallbackActive() {
    return fallbackEnabledEnv();
}
