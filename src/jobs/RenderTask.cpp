#include "RenderTask.h"
#include "ExportCompiler.h"
#include "JobRegistry.h"
#include "Logging.h"
#include "MediaProbe.h"

#include <QtConcurrent/QtConcurrentRun>

RenderTask::RenderTask(JobStore& store, const QString& jobId, std::unique_ptr<JobWorkspace> workspace,
                       QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_jobId(jobId)
    , m_workspace(std::move(workspace))
    , m_executor(store, jobId)
{
    connect(&m_probeWatcher, &QFutureWatcher<ProbeResult>::finished, this, &RenderTask::onProbeFinished);
    connect(&m_executor, &RenderExecutor::finished, this, &RenderTask::onRenderFinished);
}

RenderTask::~RenderTask() {
    // The probe only reads files it was given by value; let it run out
    m_probeWatcher.disconnect(this);
    if (!m_finished) m_store.markError(m_jobId, "Cancelled");
}

ProbeResult RenderTask::probeAll(const std::vector<ProbeTarget>& targets) {
    ProbeResult result;
    for (const auto& target : targets) {
        MediaProbe probe;
        if (!probe.probe(target.path)) {
            result.error = QString("Failed to read metadata of %1: %2")
                               .arg(target.id, probe.errorString());
            return result;
        }
        result.library.insert(target.id, probe.toMediaSource(target.id, target.contentType));
    }
    return result;
}

void RenderTask::start() {
    if (m_workspace && !m_workspace->isValid()) {
        fail(m_workspace->errorString());
        return;
    }
    qCInfo(REELFORGE_JOBS_LOG) << "Job" << m_jobId << "probing" << m_targets.size() << "inputs";
    m_probeWatcher.setFuture(QtConcurrent::run(m_probe, m_targets));
}

void RenderTask::cancel() {
    if (m_finished) return;
    m_cancelled = true;
    if (m_executor.isRunning()) {
        m_executor.cancel();
    }
    // Still probing: onProbeFinished settles the job
}

void RenderTask::onProbeFinished() {
    ProbeResult result = m_probeWatcher.result();

    if (m_cancelled) {
        fail("Cancelled");
        return;
    }
    if (!result.error.isEmpty()) {
        fail(result.error);
        return;
    }

    EncoderInvocation invocation;
    QString error;
    if (!prepare(result.library, invocation, error)) {
        fail(error);
        return;
    }
    // Uploads go as soon as the encoder is done with them
    if (m_workspace) {
        const QString prefix = m_workspace->path() + '/';
        for (const auto& target : m_targets) {
            if (target.path.startsWith(prefix)) invocation.transientPaths << target.path;
        }
    }
    if (!m_executor.start(invocation)) {
        fail("Encoder already started");
    }
}

void RenderTask::onRenderFinished(bool success, const QString& message) {
    if (!success) {
        qCWarning(REELFORGE_JOBS_LOG) << "Job" << m_jobId << "render failed:" << message;
    }
    finish();
}

void RenderTask::fail(const QString& message) {
    m_store.markError(m_jobId, message);
    finish();
}

void RenderTask::finish() {
    if (m_finished) return;
    m_finished = true;
    if (m_workspace) {
        m_workspace->remove();
        m_workspace.reset();
    }
    emit finished(m_jobId);
}

ExportTask::ExportTask(JobStore& store, const QString& jobId, std::unique_ptr<JobWorkspace> workspace,
                       const Timeline& timeline, const OutputSettings& settings,
                       const QString& outputPath, QObject* parent)
    : RenderTask(store, jobId, std::move(workspace), parent)
    , m_timeline(timeline)
    , m_settings(settings)
    , m_outputPath(outputPath)
{
    m_settings.profile = OutputProfile::FinalExport;
}

bool ExportTask::prepare(const MediaLibrary& media, EncoderInvocation& invocation, QString& error) {
    ExportCompiler compiler;
    CompiledGraph graph;
    if (!compiler.compile(m_timeline, media, graph)) {
        error = compiler.errorString();
        return false;
    }
    for (const auto& boundary : graph.boundaries) {
        qCDebug(REELFORGE_JOBS_LOG) << "Job" << jobId() << "boundary" << boundary.clipIndex
                                    << boundaryKindName(boundary.kind);
    }
    invocation = graph.toInvocation(m_outputPath, m_settings);
    return true;
}

SpeedRampTask::SpeedRampTask(JobStore& store, const QString& jobId, std::unique_ptr<JobWorkspace> workspace,
                             const SpeedRampRequest& request, const OutputSettings& settings,
                             const QString& outputPath, QObject* parent)
    : RenderTask(store, jobId, std::move(workspace), parent)
    , m_request(request)
    , m_settings(settings)
    , m_outputPath(outputPath)
{
    m_settings.profile = OutputProfile::SpeedRamp;
}

bool SpeedRampTask::prepare(const MediaLibrary& media, EncoderInvocation& invocation, QString& error) {
    auto it = media.find(InputId);
    if (it == media.end()) {
        error = "Failed to read video metadata";
        return false;
    }

    SpeedRampCompiler compiler;
    CompiledGraph graph;
    if (!compiler.compile(m_request, it.value(), graph)) {
        error = compiler.errorString();
        return false;
    }
    invocation = graph.toInvocation(m_outputPath, m_settings);
    return true;
}
