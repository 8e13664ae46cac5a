#pragma once

#include <QHash>
#include <QList>
#include <QMutex>
#include <QString>
#include <optional>
#include "Job.h"

// Access to job state. Every call is one atomic read or read-modify-write
// of a single job; callers only ever receive copies.
class JobStore {
public:
    virtual ~JobStore() = default;

    // Registers a new processing job and returns its id
    virtual QString create(JobKind kind, const QString& outputPath, const QString& filename) = 0;
    virtual std::optional<Job> find(const QString& id) const = 0;
    // Names the artifact of a processing job once its id is known
    virtual bool setOutput(const QString& id, const QString& outputPath, const QString& filename) = 0;

    // Raises progress of a processing job; lower values are ignored and the
    // result stays below 100 until markDone
    virtual bool updateProgress(const QString& id, double percent) = 0;
    // Terminal transitions; false when the job is unknown or already terminal
    virtual bool markDone(const QString& id) = 0;
    virtual bool markError(const QString& id, const QString& message) = 0;

    virtual QList<Job> jobs() const = 0;
    virtual int clear() = 0;
};

class JobRegistry : public JobStore {
public:
    JobRegistry() = default;

    QString create(JobKind kind, const QString& outputPath, const QString& filename) override;
    std::optional<Job> find(const QString& id) const override;
    bool setOutput(const QString& id, const QString& outputPath, const QString& filename) override;
    bool updateProgress(const QString& id, double percent) override;
    bool markDone(const QString& id) override;
    bool markError(const QString& id, const QString& message) override;
    QList<Job> jobs() const override;
    int clear() override;

    static constexpr double MaxRunningProgress = 99.0;

private:
    mutable QMutex m_mutex;
    QHash<QString, Job> m_jobs;
};
