#pragma once

#include <QObject>
#include <QFutureWatcher>
#include <QString>
#include <functional>
#include <memory>
#include <vector>
#include "EncoderProfile.h"
#include "JobWorkspace.h"
#include "MediaSource.h"
#include "RenderExecutor.h"
#include "SpeedRampCompiler.h"
#include "Timeline.h"

class JobStore;

// A file the task needs metadata for before it can compile
struct ProbeTarget {
    QString id;             // key in the resulting MediaLibrary
    QString path;
    QString contentType;    // multipart Content-Type, may be empty
};

struct ProbeResult {
    MediaLibrary library;
    QString error;
};

// One background job: probe inputs on the thread pool, compile, then run the
// encoder. Owns the job's workspace; the workspace is removed on every exit
// path. Emits finished() once the job is terminal.
class RenderTask : public QObject {
    Q_OBJECT
public:
    using ProbeFunction = std::function<ProbeResult(const std::vector<ProbeTarget>&)>;

    RenderTask(JobStore& store, const QString& jobId, std::unique_ptr<JobWorkspace> workspace,
               QObject* parent = nullptr);
    ~RenderTask() override;

    void setEncoderProgram(const QString& program) { m_executor.setEncoderProgram(program); }
    void setProbeTargets(const std::vector<ProbeTarget>& targets) { m_targets = targets; }
    // Runs on the thread pool in place of probeAll
    void setProbeFunction(ProbeFunction probe) { m_probe = std::move(probe); }

    void start();
    void cancel();

    QString jobId() const { return m_jobId; }

    // Runs synchronously; used from the worker thread
    static ProbeResult probeAll(const std::vector<ProbeTarget>& targets);

signals:
    void finished(const QString& jobId);

protected:
    // Build the encoder invocation from probed media
    virtual bool prepare(const MediaLibrary& media, EncoderInvocation& invocation, QString& error) = 0;

private slots:
    void onProbeFinished();
    void onRenderFinished(bool success, const QString& message);

private:
    void fail(const QString& message);
    void finish();

    JobStore& m_store;
    QString m_jobId;
    std::unique_ptr<JobWorkspace> m_workspace;
    std::vector<ProbeTarget> m_targets;
    ProbeFunction m_probe = &RenderTask::probeAll;
    QFutureWatcher<ProbeResult> m_probeWatcher;
    RenderExecutor m_executor;
    bool m_cancelled = false;
    bool m_finished = false;
};

// POST /export
class ExportTask : public RenderTask {
    Q_OBJECT
public:
    ExportTask(JobStore& store, const QString& jobId, std::unique_ptr<JobWorkspace> workspace,
               const Timeline& timeline, const OutputSettings& settings, const QString& outputPath,
               QObject* parent = nullptr);

protected:
    bool prepare(const MediaLibrary& media, EncoderInvocation& invocation, QString& error) override;

private:
    Timeline m_timeline;
    OutputSettings m_settings;
    QString m_outputPath;
};

// POST /process-video
class SpeedRampTask : public RenderTask {
    Q_OBJECT
public:
    SpeedRampTask(JobStore& store, const QString& jobId, std::unique_ptr<JobWorkspace> workspace,
                  const SpeedRampRequest& request, const OutputSettings& settings,
                  const QString& outputPath, QObject* parent = nullptr);

    static constexpr const char* InputId = "input";

protected:
    bool prepare(const MediaLibrary& media, EncoderInvocation& invocation, QString& error) override;

private:
    SpeedRampRequest m_request;
    OutputSettings m_settings;
    QString m_outputPath;
};
