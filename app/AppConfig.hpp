// User configuration: QSettings("termxfer", "termxfer") plus environment
// overrides for the configuration directory.
#pragma once
#include "termxfer/TransferTypes.hpp"
#include <QString>

class AppConfig {
public:
    // TERMXFER_CONFIG_DIR when set, else the platform config location.
    static QString configDir();
    static QString bookmarksPath();
    static QString keyPath();

    // Creates the configuration directory when missing.
    static bool ensureConfigDir(QString *err);

    // Security/knownHostsPolicy: "strict", "accept-new" or "off".
    static termxfer::KnownHostsPolicy knownHostsPolicy();

    // Bookmarks/recentsSize, at least 1.
    static int recentsSize();

    static termxfer::KnownHostsPolicy parsePolicy(const QString &value, bool *ok = nullptr);
    static QString policyName(termxfer::KnownHostsPolicy policy);
};
