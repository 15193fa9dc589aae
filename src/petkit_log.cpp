#include "petkit_log.h"

Q_LOGGING_CATEGORY(petkitLog, "phi-core.adapters.petkit");
