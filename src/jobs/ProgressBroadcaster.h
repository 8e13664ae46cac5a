#pragma once

#include <QObject>
#include <QByteArray>
#include <QString>
#include <QTimer>
#include <optional>
#include "Job.h"

class JobStore;

// Polls one job for one subscriber and emits its status as compact JSON.
// The first update goes out on start(); the broadcaster closes itself after
// the first terminal status, or right away when the job is unknown.
class ProgressBroadcaster : public QObject {
    Q_OBJECT
public:
    ProgressBroadcaster(const JobStore& store, const QString& jobId,
                        std::optional<JobKind> kind, int intervalMs, QObject* parent = nullptr);

    void start();
    void stop();
    bool isActive() const { return m_active; }

    static QByteArray statusMessage(const Job& job);
    static QByteArray notFoundMessage(std::optional<JobKind> kind);

signals:
    void update(const QByteArray& json);
    void closed();

private slots:
    void poll();

private:
    void close();

    const JobStore& m_store;
    QString m_jobId;
    std::optional<JobKind> m_kind;
    QTimer m_timer;
    bool m_active = false;
};
