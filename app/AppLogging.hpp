// Qt logging categories of the front end. Enable with
// QT_LOGGING_RULES="termxfer.*.debug=true".
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(txVault)
Q_DECLARE_LOGGING_CATEGORY(txConfig)
Q_DECLARE_LOGGING_CATEGORY(txCli)
