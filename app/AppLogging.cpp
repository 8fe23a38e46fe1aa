#include "AppLogging.hpp"

Q_LOGGING_CATEGORY(txVault, "termxfer.vault")
Q_LOGGING_CATEGORY(txConfig, "termxfer.config")
Q_LOGGING_CATEGORY(txCli, "termxfer.cli")
