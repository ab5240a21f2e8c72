#include "nullus/Logging.hpp"

Q_LOGGING_CATEGORY(lcData, "nullus.data", QtWarningMsg)
Q_LOGGING_CATEGORY(lcCore, "nullus.core", QtWarningMsg)
Q_LOGGING_CATEGORY(lcCli, "nullus.cli", QtWarningMsg)
