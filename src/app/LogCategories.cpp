#include "LogCategories.h"

Q_LOGGING_CATEGORY(lcModel, "mapper.model")
Q_LOGGING_CATEGORY(lcActions, "mapper.actions")
Q_LOGGING_CATEGORY(lcCleanup, "mapper.cleanup")
Q_LOGGING_CATEGORY(lcApp, "mapper.app")
