#pragma once

#include <QObject>
#include <QHash>
#include <QPointer>
#include <QString>
#include <optional>
#include <vector>
#include "HttpServer.h"
#include "Job.h"
#include "ServerConfig.h"
#include "Timeline.h"

class JobStore;
class RenderTask;
struct ProbeTarget;

// The render endpoints: accepts uploads, registers jobs, starts their tasks
// and serves progress streams and finished artifacts.
class RenderService : public QObject {
    Q_OBJECT
public:
    RenderService(const ServerConfig& config, JobStore& store, QObject* parent = nullptr);
    ~RenderService() override;

    void registerRoutes(HttpServer& server);

    int runningTaskCount() const { return m_tasks.size(); }

    // Stops every running task now; their jobs end as "Cancelled"
    void shutdownTasks();

    static int countEntries(const QStringList& dirs);
    static int removeEntries(const QStringList& dirs);

    // Download name for an export: the client's name without control
    // characters, "export" when blank, plus the container extension
    static QString exportFileName(const QString& requested, const QString& container);

    // Job id named by a ".../download/<jobId>" url, or empty
    static QString jobIdFromDownloadUrl(const QString& url);

private:
    void handleProcessVideo(HttpConnection& connection);
    void handleExport(HttpConnection& connection);
    void handleProgress(HttpConnection& connection, const QString& jobId, std::optional<JobKind> kind);
    void handleDownload(HttpConnection& connection, const QString& jobId,
                        std::optional<JobKind> kind, const QByteArray& disposition);
    void handleCancel(HttpConnection& connection, const QString& jobId);
    void handleCacheStatus(HttpConnection& connection);
    void handleClearCache(HttpConnection& connection);

    void appendProcessedTargets(const Timeline& timeline, std::vector<ProbeTarget>& targets) const;
    void launch(RenderTask* task);
    QStringList cacheDirs() const;

    static void sendError(HttpConnection& connection, int status, const QString& message);

    ServerConfig m_config;
    JobStore& m_store;
    QHash<QString, QPointer<RenderTask>> m_tasks;
};
