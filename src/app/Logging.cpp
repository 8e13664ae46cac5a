#include "Logging.h"

Q_LOGGING_CATEGORY(REELFORGE_SERVER_LOG, "reelforge.server", QtInfoMsg)
Q_LOGGING_CATEGORY(REELFORGE_EXPORT_LOG, "reelforge.export", QtInfoMsg)
Q_LOGGING_CATEGORY(REELFORGE_RENDER_LOG, "reelforge.render", QtInfoMsg)
Q_LOGGING_CATEGORY(REELFORGE_JOBS_LOG, "reelforge.jobs", QtInfoMsg)
