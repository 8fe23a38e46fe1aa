#include "AppConfig.hpp"
#include "AppLogging.hpp"
#include <QDir>
#include <QSettings>
#include <QStandardPaths>

static constexpr int kDefaultRecentsSize = 16;

QString AppConfig::configDir() {
    const QString env = qEnvironmentVariable("TERMXFER_CONFIG_DIR").trimmed();
    if (!env.isEmpty())
        return QDir::cleanPath(env);
    return QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
}

QString AppConfig::bookmarksPath() {
    return QDir(configDir()).filePath(QStringLiteral("bookmarks.ini"));
}

QString AppConfig::keyPath() {
    return QDir(configDir()).filePath(QStringLiteral(".bookmarks.key"));
}

bool AppConfig::ensureConfigDir(QString *err) {
    const QString dir = configDir();
    if (dir.isEmpty()) {
        if (err)
            *err = QStringLiteral("No configuration directory available");
        return false;
    }
    if (!QDir().mkpath(dir)) {
        if (err)
            *err = QStringLiteral("Could not create %1").arg(dir);
        return false;
    }
    return true;
}

termxfer::KnownHostsPolicy AppConfig::parsePolicy(const QString &value, bool *ok) {
    const QString v = value.trimmed().toLower();
    if (ok)
        *ok = true;
    if (v == QLatin1String("strict"))
        return termxfer::KnownHostsPolicy::Strict;
    if (v == QLatin1String("off") || v == QLatin1String("no"))
        return termxfer::KnownHostsPolicy::Off;
    if (v != QLatin1String("accept-new") && ok)
        *ok = false;
    return termxfer::KnownHostsPolicy::AcceptNew;
}

QString AppConfig::policyName(termxfer::KnownHostsPolicy policy) {
    switch (policy) {
    case termxfer::KnownHostsPolicy::Strict:
        return QStringLiteral("strict");
    case termxfer::KnownHostsPolicy::AcceptNew:
        return QStringLiteral("accept-new");
    case termxfer::KnownHostsPolicy::Off:
        return QStringLiteral("off");
    }
    return QStringLiteral("accept-new");
}

termxfer::KnownHostsPolicy AppConfig::knownHostsPolicy() {
    QSettings s("termxfer", "termxfer");
    const QString raw =
        s.value("Security/knownHostsPolicy", QStringLiteral("accept-new")).toString();
    bool ok = false;
    const auto policy = parsePolicy(raw, &ok);
    if (!ok)
        qCWarning(txConfig) << "Unknown known_hosts policy" << raw << "- using accept-new";
    return policy;
}

int AppConfig::recentsSize() {
    QSettings s("termxfer", "termxfer");
    bool ok = false;
    const int n = s.value("Bookmarks/recentsSize", kDefaultRecentsSize).toInt(&ok);
    if (!ok || n < 1) {
        qCWarning(txConfig) << "Invalid Bookmarks/recentsSize, using" << kDefaultRecentsSize;
        return kDefaultRecentsSize;
    }
    return n;
}
