#include "tv_log.h"

Q_LOGGING_CATEGORY(tvLog, "phi-core.adapters.samsungtv");
