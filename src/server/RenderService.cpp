#include "RenderService.h"
#include "JobRegistry.h"
#include "JobWorkspace.h"
#include "Logging.h"
#include "MediaProbe.h"
#include "ProgressBroadcaster.h"
#include "RenderTask.h"
#include "SpeedRampCompiler.h"
#include "TimelineReader.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonObject>
#include <QRegularExpression>

RenderService::RenderService(const ServerConfig& config, JobStore& store, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_store(store)
{
}

RenderService::~RenderService() {
    shutdownTasks();
}

void RenderService::registerRoutes(HttpServer& server) {
    server.route("GET", "/", [](HttpConnection& c, const RouteParams&) {
        c.sendText(200, QString("%1 render server %2").arg(AppConstants::AppName, AppConstants::AppVersion));
    });
    server.route("GET", "/health", [](HttpConnection& c, const RouteParams&) {
        c.sendJson(200, {{"status", "ok"}, {"message", "Server is running"}});
    });

    server.route("POST", "/process-video", [this](HttpConnection& c, const RouteParams&) {
        handleProcessVideo(c);
    });
    server.route("GET", "/progress/:jobId", [this](HttpConnection& c, const RouteParams& p) {
        handleProgress(c, p.value("jobId"), std::nullopt);
    });
    server.route("GET", "/download/:jobId", [this](HttpConnection& c, const RouteParams& p) {
        handleDownload(c, p.value("jobId"), std::nullopt, "inline");
    });

    server.route("POST", "/export", [this](HttpConnection& c, const RouteParams&) {
        handleExport(c);
    });
    server.route("GET", "/export-progress/:exportId", [this](HttpConnection& c, const RouteParams& p) {
        handleProgress(c, p.value("exportId"), JobKind::Export);
    });
    server.route("GET", "/download-export/:exportId", [this](HttpConnection& c, const RouteParams& p) {
        handleDownload(c, p.value("exportId"), JobKind::Export, "attachment");
    });

    server.route("POST", "/cancel/:jobId", [this](HttpConnection& c, const RouteParams& p) {
        handleCancel(c, p.value("jobId"));
    });
    server.route("GET", "/cache-status", [this](HttpConnection& c, const RouteParams&) {
        handleCacheStatus(c);
    });
    server.route("POST", "/clear-cache", [this](HttpConnection& c, const RouteParams&) {
        handleClearCache(c);
    });
}

void RenderService::sendError(HttpConnection& connection, int status, const QString& message) {
    connection.sendJson(status, {{"error", message}});
}

void RenderService::handleProcessVideo(HttpConnection& connection) {
    MultipartForm form;
    QString error;
    if (!connection.request().parseMultipart(form, &error)) {
        sendError(connection, 400, error);
        return;
    }

    const MultipartPart* video = form.file("video");
    if (!video) {
        sendError(connection, 400, "No video file uploaded");
        return;
    }

    bool fpsOk = false;
    bool speedOk = false;
    SpeedRampRequest request;
    request.targetFps = form.value("targetFps").trimmed().toInt(&fpsOk);
    request.speed = form.value("speed").trimmed().toDouble(&speedOk);
    if (!fpsOk || !SpeedRampCompiler::isValidFps(request.targetFps)) {
        sendError(connection, 400, "Invalid targetFps");
        return;
    }
    if (!speedOk || !SpeedRampCompiler::isValidSpeed(request.speed)) {
        sendError(connection, 400, "Invalid speed");
        return;
    }

    const QString jobId = m_store.create(JobKind::ProcessVideo, QString(), QString());
    const QString filename = QString("processed-%1.mp4").arg(jobId);
    m_store.setOutput(jobId, QDir(m_config.outputsDir()).absoluteFilePath(filename), filename);

    auto workspace = std::make_unique<JobWorkspace>(m_config.uploadsDir(), "process-" + jobId);

    QString suffix = QFileInfo(video->fileName).suffix();
    if (suffix.isEmpty()) suffix = MediaProbe::extensionForContentType(QString::fromUtf8(video->contentType));
    const QString inputName = suffix.isEmpty() ? QString("input") : "input." + suffix;

    if (workspace->isValid() && !workspace->writeFile(inputName, video->data, &request.inputPath)) {
        qCWarning(REELFORGE_SERVER_LOG) << "Job" << jobId << workspace->errorString();
    }
    const QString writeError = workspace->errorString();

    qCInfo(REELFORGE_SERVER_LOG) << "Job" << jobId << "slow motion" << request.speed << "x,"
                                 << request.targetFps << "fps," << video->data.size() << "bytes";

    OutputSettings settings;
    settings.threads = m_config.effectiveEncoderThreads();

    auto* task = new SpeedRampTask(m_store, jobId, std::move(workspace), request, settings,
                                   QDir(m_config.outputsDir()).absoluteFilePath(filename), this);
    if (!request.inputPath.isEmpty()) {
        task->setProbeTargets({{SpeedRampTask::InputId, request.inputPath,
                                QString::fromUtf8(video->contentType)}});
    }

    connection.sendJson(200, {{"jobId", jobId}});

    if (request.inputPath.isEmpty()) {
        m_store.markError(jobId, writeError.isEmpty() ? QString("Cannot store upload") : writeError);
        delete task;
        return;
    }
    launch(task);
}

void RenderService::appendProcessedTargets(const Timeline& timeline, std::vector<ProbeTarget>& targets) const {
    for (const Track& track : timeline.videoTracks()) {
        for (const Clip& clip : track.clips()) {
            if (clip.processedVideoUrl.isEmpty()) continue;

            const QString sourceJob = jobIdFromDownloadUrl(clip.processedVideoUrl);
            std::optional<Job> job = m_store.find(sourceJob);
            if (!job || job->status != JobStatus::Done || !QFileInfo::exists(job->outputPath)) {
                qCDebug(REELFORGE_SERVER_LOG) << "Processed video" << clip.processedVideoUrl
                                              << "not available, using the upload";
                continue;
            }
            targets.push_back({clip.processedVideoUrl, job->outputPath, QString()});
        }
    }
}

void RenderService::handleExport(HttpConnection& connection) {
    MultipartForm form;
    QString error;
    if (!connection.request().parseMultipart(form, &error)) {
        sendError(connection, 400, error);
        return;
    }

    Timeline timeline;
    TimelineReader reader;
    if (!reader.read(form.value("timeline").toUtf8(), timeline)) {
        sendError(connection, 400, reader.errorString());
        return;
    }

    OutputSettings settings;
    if (!containerFromName(form.value("format"), settings.container)) {
        sendError(connection, 400, QString("Unsupported format: %1").arg(form.value("format")));
        return;
    }
    if (!videoCodecFromName(form.value("codec"), settings.videoCodec)) {
        sendError(connection, 400, QString("Unsupported codec: %1").arg(form.value("codec")));
        return;
    }

    const QString filename = exportFileName(form.value("filename"), settings.container);

    const QString exportId = m_store.create(JobKind::Export, QString(), QString());
    const QString outputPath = QDir(m_config.exportsDir()).absoluteFilePath(
        JobWorkspace::sanitizeFileName(exportId + "-" + filename));
    m_store.setOutput(exportId, outputPath, filename);

    auto workspace = std::make_unique<JobWorkspace>(m_config.uploadsDir(), "export-temp-" + exportId);

    // Upload file names carry the media ids the timeline refers to
    std::vector<ProbeTarget> targets;
    QString writeError;
    for (const MultipartPart* part : form.files("videos")) {
        // The demuxer needs an extension to treat stills as looping images
        QString storedName = part->fileName;
        const QString ext = MediaProbe::extensionForContentType(QString::fromUtf8(part->contentType));
        if (!ext.isEmpty() && !storedName.endsWith("." + ext, Qt::CaseInsensitive)) {
            storedName += "." + ext;
        }

        QString path;
        if (!workspace->isValid() || !workspace->writeFile(storedName, part->data, &path)) {
            writeError = workspace->errorString();
            break;
        }
        targets.push_back({part->fileName, path, QString::fromUtf8(part->contentType)});
    }
    appendProcessedTargets(timeline, targets);

    qCInfo(REELFORGE_SERVER_LOG) << "Export" << exportId << filename << "with"
                                 << form.files("videos").size() << "uploads";

    auto* task = new ExportTask(m_store, exportId, std::move(workspace), timeline, settings, outputPath, this);
    task->setProbeTargets(targets);

    connection.sendJson(200, {{"exportId", exportId}});

    if (!writeError.isEmpty()) {
        m_store.markError(exportId, writeError);
        delete task;
        return;
    }
    launch(task);
}

void RenderService::launch(RenderTask* task) {
    task->setEncoderProgram(m_config.encoderPath);
    m_tasks.insert(task->jobId(), task);
    connect(task, &RenderTask::finished, this, [this, task](const QString& jobId) {
        m_tasks.remove(jobId);
        task->deleteLater();
    });
    task->start();
}

void RenderService::handleProgress(HttpConnection& connection, const QString& jobId,
                                   std::optional<JobKind> kind) {
    connection.startEventStream();

    auto* broadcaster = new ProgressBroadcaster(m_store, jobId, kind, m_config.progressIntervalMs, &connection);
    connect(broadcaster, &ProgressBroadcaster::update, &connection, &HttpConnection::sendEvent);
    connect(broadcaster, &ProgressBroadcaster::closed, &connection, &HttpConnection::endEventStream);
    // Subscriber went away: only the poll stops, the job keeps running
    connect(&connection, &HttpConnection::closed, broadcaster, &ProgressBroadcaster::stop);
    broadcaster->start();
}

void RenderService::handleDownload(HttpConnection& connection, const QString& jobId,
                                   std::optional<JobKind> kind, const QByteArray& disposition) {
    std::optional<Job> job = m_store.find(jobId);
    if (!job || (kind && job->kind != *kind) || job->status != JobStatus::Done
        || !QFileInfo::exists(job->outputPath)) {
        connection.sendText(404, "File not ready or not found");
        return;
    }
    if (!connection.sendFile(job->outputPath, job->filename, disposition)) {
        connection.sendText(500, "Cannot read output file");
    }
}

void RenderService::handleCancel(HttpConnection& connection, const QString& jobId) {
    std::optional<Job> job = m_store.find(jobId);
    if (!job) {
        sendError(connection, 404, "Job not found");
        return;
    }

    QPointer<RenderTask> task = m_tasks.value(jobId);
    if (job->isTerminal() || !task) {
        connection.sendJson(200, {{"cancelled", false}, {"status", jobStatusName(job->status)}});
        return;
    }
    task->cancel();
    connection.sendJson(200, {{"cancelled", true}});
}

QStringList RenderService::cacheDirs() const {
    return {m_config.outputsDir(), m_config.exportsDir(), m_config.uploadsDir()};
}

int RenderService::countEntries(const QStringList& dirs) {
    int count = 0;
    for (const QString& path : dirs) {
        QDir dir(path);
        if (!dir.exists()) continue;
        count += dir.entryList(QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot).size();
    }
    return count;
}

int RenderService::removeEntries(const QStringList& dirs) {
    int removed = 0;
    for (const QString& path : dirs) {
        QDir dir(path);
        if (!dir.exists()) continue;
        const QFileInfoList entries =
            dir.entryInfoList(QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot);
        for (const QFileInfo& entry : entries) {
            bool ok = entry.isDir() && !entry.isSymLink()
                ? QDir(entry.absoluteFilePath()).removeRecursively()
                : QFile::remove(entry.absoluteFilePath());
            if (ok) {
                ++removed;
            } else {
                qCWarning(REELFORGE_SERVER_LOG) << "Could not remove" << entry.absoluteFilePath();
            }
        }
    }
    return removed;
}

QString RenderService::exportFileName(const QString& requested, const QString& container) {
    QString baseName = HttpConnection::headerSafeFileName(requested).trimmed();
    if (baseName.isEmpty()) baseName = "export";
    return QString("%1.%2").arg(baseName, container);
}

QString RenderService::jobIdFromDownloadUrl(const QString& url) {
    const QString marker = "/download/";
    const int pos = url.lastIndexOf(marker);
    if (pos < 0) return QString();
    QString id = url.mid(pos + marker.size());
    const int end = id.indexOf(QRegularExpression("[?#/]"));
    if (end >= 0) id.truncate(end);
    return id;
}

void RenderService::handleCacheStatus(HttpConnection& connection) {
    const int count = countEntries(cacheDirs());
    connection.sendJson(200, {{"hasCache", count > 0}, {"fileCount", count}});
}

void RenderService::handleClearCache(HttpConnection& connection) {
    shutdownTasks();
    const int removed = removeEntries(cacheDirs());
    const int jobs = m_store.clear();
    qCInfo(REELFORGE_SERVER_LOG) << "Cache cleared:" << removed << "entries," << jobs << "jobs";
    connection.sendJson(200, {{"success", true}, {"filesDeleted", removed}});
}

void RenderService::shutdownTasks() {
    const auto tasks = m_tasks;
    m_tasks.clear();
    for (const QPointer<RenderTask>& task : tasks) {
        if (!task) continue;
        qCInfo(REELFORGE_SERVER_LOG) << "Stopping job" << task->jobId();
        task->disconnect(this);
        delete task.data();
    }
}
