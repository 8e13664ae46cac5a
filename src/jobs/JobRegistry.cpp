#include "JobRegistry.h"
#include "Logging.h"

#include <QUuid>
#include <algorithm>

QString JobRegistry::create(JobKind kind, const QString& outputPath, const QString& filename) {
    Job job;
    job.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    job.kind = kind;
    job.outputPath = outputPath;
    job.filename = filename;
    job.createdAt = QDateTime::currentDateTimeUtc();

    QMutexLocker lock(&m_mutex);
    m_jobs.insert(job.id, job);
    return job.id;
}

std::optional<Job> JobRegistry::find(const QString& id) const {
    QMutexLocker lock(&m_mutex);
    auto it = m_jobs.constFind(id);
    if (it == m_jobs.constEnd()) return std::nullopt;
    return *it;
}

bool JobRegistry::setOutput(const QString& id, const QString& outputPath, const QString& filename) {
    QMutexLocker lock(&m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end() || it->isTerminal()) return false;

    it->outputPath = outputPath;
    it->filename = filename;
    return true;
}

bool JobRegistry::updateProgress(const QString& id, double percent) {
    QMutexLocker lock(&m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end() || it->isTerminal()) return false;

    double clamped = std::clamp(percent, 0.0, MaxRunningProgress);
    if (clamped <= it->progress) return false;
    it->progress = clamped;
    return true;
}

bool JobRegistry::markDone(const QString& id) {
    QMutexLocker lock(&m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end() || it->isTerminal()) return false;

    it->status = JobStatus::Done;
    it->progress = 100.0;
    qCInfo(REELFORGE_JOBS_LOG) << "Job" << id << "done";
    return true;
}

bool JobRegistry::markError(const QString& id, const QString& message) {
    QMutexLocker lock(&m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end() || it->isTerminal()) return false;

    it->status = JobStatus::Error;
    it->error = message;
    qCWarning(REELFORGE_JOBS_LOG) << "Job" << id << "failed:" << message;
    return true;
}

QList<Job> JobRegistry::jobs() const {
    QMutexLocker lock(&m_mutex);
    return m_jobs.values();
}

int JobRegistry::clear() {
    QMutexLocker lock(&m_mutex);
    int count = static_cast<int>(m_jobs.size());
    m_jobs.clear();
    return count;
}
