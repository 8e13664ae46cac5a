#include "ProgressBroadcaster.h"
#include "JobRegistry.h"
#include "Logging.h"

#include <QJsonDocument>
#include <QJsonObject>

ProgressBroadcaster::ProgressBroadcaster(const JobStore& store, const QString& jobId,
                                         std::optional<JobKind> kind, int intervalMs, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_jobId(jobId)
    , m_kind(kind)
{
    m_timer.setInterval(intervalMs);
    connect(&m_timer, &QTimer::timeout, this, &ProgressBroadcaster::poll);
}

QByteArray ProgressBroadcaster::statusMessage(const Job& job) {
    QJsonObject obj;
    obj["status"] = jobStatusName(job.status);
    obj["progress"] = job.progress;
    if (job.status == JobStatus::Error) obj["error"] = job.error;
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QByteArray ProgressBroadcaster::notFoundMessage(std::optional<JobKind> kind) {
    QJsonObject obj;
    obj["status"] = "error";
    obj["error"] = (kind && *kind == JobKind::Export) ? "Export not found" : "Job not found";
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

void ProgressBroadcaster::start() {
    if (m_active) return;
    m_active = true;
    poll();
    if (m_active) m_timer.start();
}

void ProgressBroadcaster::stop() {
    m_timer.stop();
    m_active = false;
}

void ProgressBroadcaster::poll() {
    if (!m_active) return;

    std::optional<Job> job = m_store.find(m_jobId);
    if (!job || (m_kind && job->kind != *m_kind)) {
        qCDebug(REELFORGE_JOBS_LOG) << "Progress requested for unknown job" << m_jobId;
        emit update(notFoundMessage(m_kind));
        close();
        return;
    }

    emit update(statusMessage(*job));
    if (job->isTerminal()) close();
}

void ProgressBroadcaster::close() {
    stop();
    emit closed();
}
