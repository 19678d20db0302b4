#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(frCore, "factrank.core")
Q_LOGGING_CATEGORY(frText, "factrank.text")
Q_LOGGING_CATEGORY(frRanking, "factrank.ranking")
Q_LOGGING_CATEGORY(frRetrieval, "factrank.retrieval")
