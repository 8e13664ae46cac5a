#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(REELFORGE_SERVER_LOG)
Q_DECLARE_LOGGING_CATEGORY(REELFORGE_EXPORT_LOG)
Q_DECLARE_LOGGING_CATEGORY(REELFORGE_RENDER_LOG)
Q_DECLARE_LOGGING_CATEGORY(REELFORGE_JOBS_LOG)
