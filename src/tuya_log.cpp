#include "tuya_log.h"

Q_LOGGING_CATEGORY(tuyaLog, "phi-core.adapters.tuya");
