#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(hrCore, "hybridrag.core")
Q_LOGGING_CATEGORY(hrIngest, "hybridrag.ingest")
Q_LOGGING_CATEGORY(hrEmbedding, "hybridrag.embedding")
Q_LOGGING_CATEGORY(hrIndex, "hybridrag.index")
Q_LOGGING_CATEGORY(hrRetrieval, "hybridrag.retrieval")
Q_LOGGING_CATEGORY(hrIpc, "hybridrag.ipc")
