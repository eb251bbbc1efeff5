#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(rwCore, "routewise.core")
Q_LOGGING_CATEGORY(rwRouting, "routewise.routing")
Q_LOGGING_CATEGORY(rwCache, "routewise.cache")
Q_LOGGING_CATEGORY(rwScoring, "routewise.scoring")
Q_LOGGING_CATEGORY(rwTools, "routewise.tools")
