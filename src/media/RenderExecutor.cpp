#include "RenderExecutor.h"
#include "JobRegistry.h"
#include "Logging.h"
#include "TimeUtil.h"

#include <QFile>
#include <algorithm>

namespace {
// Keep only the tail of the encoder's stderr for error messages
constexpr int kMaxErrorOutput = 4000;
}

RenderExecutor::RenderExecutor(JobStore& store, const QString& jobId, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_jobId(jobId)
{
    connect(&m_process, &QProcess::readyReadStandardOutput, this, &RenderExecutor::onStandardOutput);
    connect(&m_process, &QProcess::readyReadStandardError, this, &RenderExecutor::onStandardError);
    connect(&m_process, &QProcess::finished, this, &RenderExecutor::onProcessFinished);
    connect(&m_process, &QProcess::errorOccurred, this, &RenderExecutor::onProcessError);
}

RenderExecutor::~RenderExecutor() {
    if (m_running && !m_completed) {
        // Torn down mid-render: stop the encoder and settle the job here
        m_process.disconnect(this);
        m_process.kill();
        m_process.waitForFinished(3000);
        m_completed = true;
        m_store.markError(m_jobId, "Cancelled");
        removeTransientFiles();
        QFile::remove(m_invocation.outputPath);
    }
}

bool RenderExecutor::start(const EncoderInvocation& invocation) {
    if (m_running || m_completed) return false;

    m_invocation = invocation;
    m_running = true;

    const QStringList args = m_invocation.arguments();
    qCInfo(REELFORGE_RENDER_LOG) << "Job" << m_jobId << "starting" << m_program << args.join(' ');
    qCDebug(REELFORGE_RENDER_LOG) << "Expected output duration"
                                  << TimeUtil::secondsToHMSms(m_invocation.expectedDuration);

    m_process.setProgram(m_program);
    m_process.setArguments(args);
    m_process.start();
    return true;
}

void RenderExecutor::cancel() {
    if (!m_running || m_completed) return;
    qCInfo(REELFORGE_RENDER_LOG) << "Job" << m_jobId << "cancel requested";
    m_cancelled = true;
    m_process.kill();
}

double RenderExecutor::progressPercent(double outTimeSeconds, double expectedDuration) {
    if (expectedDuration <= 0.0 || outTimeSeconds < 0.0) return 0.0;
    double percent = outTimeSeconds / expectedDuration * 100.0;
    return std::clamp(percent, 0.0, JobRegistry::MaxRunningProgress);
}

void RenderExecutor::onStandardOutput() {
    m_stdoutBuffer.append(m_process.readAllStandardOutput());

    int newline = -1;
    while ((newline = m_stdoutBuffer.indexOf('\n')) >= 0) {
        QString line = QString::fromUtf8(m_stdoutBuffer.left(newline)).trimmed();
        m_stdoutBuffer.remove(0, newline + 1);
        if (!line.isEmpty()) handleProgressLine(line);
    }
}

void RenderExecutor::handleProgressLine(const QString& line) {
    // -progress emits key=value pairs; out_time_ms is in microseconds too
    const QString key = line.section('=', 0, 0);
    const QString value = line.section('=', 1);

    double seconds = -1.0;
    if (key == "out_time") {
        seconds = TimeUtil::parseTimemark(value);
    } else if (key == "out_time_us" || key == "out_time_ms") {
        bool ok = false;
        qint64 micros = value.toLongLong(&ok);
        if (ok) seconds = static_cast<double>(micros) / 1000000.0;
    }
    if (seconds < 0.0) return;

    double percent = progressPercent(seconds, m_invocation.expectedDuration);
    if (m_store.updateProgress(m_jobId, percent)) {
        emit progress(percent);
    }
}

void RenderExecutor::onStandardError() {
    m_errorOutput.append(QString::fromLocal8Bit(m_process.readAllStandardError()));
    if (m_errorOutput.size() > kMaxErrorOutput) {
        m_errorOutput = m_errorOutput.right(kMaxErrorOutput);
    }
}

void RenderExecutor::onProcessFinished(int exitCode, QProcess::ExitStatus status) {
    // Drain whatever is still buffered before judging the result
    onStandardOutput();
    onStandardError();

    if (m_cancelled) {
        complete(false, "Cancelled");
        return;
    }
    if (status == QProcess::CrashExit || exitCode != 0) {
        complete(false, failureMessage(exitCode, status));
        return;
    }
    if (!QFile::exists(m_invocation.outputPath)) {
        complete(false, QString("Encoder finished without producing %1").arg(m_invocation.outputPath));
        return;
    }
    complete(true, QString());
}

void RenderExecutor::onProcessError(QProcess::ProcessError error) {
    // Crashes are reported again through finished(); only a failed start is final here
    if (error != QProcess::FailedToStart) return;
    complete(false, QString("Failed to start encoder %1: %2").arg(m_program, m_process.errorString()));
}

void RenderExecutor::complete(bool success, const QString& message) {
    if (m_completed) return;
    m_completed = true;
    m_running = false;

    if (success) {
        m_store.markDone(m_jobId);
        qCInfo(REELFORGE_RENDER_LOG) << "Job" << m_jobId << "rendered" << m_invocation.outputPath;
    } else {
        m_store.markError(m_jobId, message);
        if (QFile::exists(m_invocation.outputPath) && !QFile::remove(m_invocation.outputPath)) {
            qCWarning(REELFORGE_RENDER_LOG) << "Could not remove partial output" << m_invocation.outputPath;
        }
    }
    removeTransientFiles();

    emit finished(success, message);
}

void RenderExecutor::removeTransientFiles() {
    for (const QString& path : m_invocation.transientPaths) {
        if (QFile::exists(path) && !QFile::remove(path)) {
            qCWarning(REELFORGE_RENDER_LOG) << "Could not remove transient file" << path;
        }
    }
}

QString RenderExecutor::failureMessage(int exitCode, QProcess::ExitStatus status) const {
    QStringList lines;
    for (const QString& line : m_errorOutput.split('\n')) {
        QString simplified = line.simplified();
        if (!simplified.isEmpty()) lines << simplified;
    }
    // The last few lines carry the actual reason; earlier ones are context
    while (lines.size() > 3) lines.removeFirst();

    QString reason = status == QProcess::CrashExit
        ? QString("Encoder crashed")
        : QString("Encoder exited with code %1").arg(exitCode);
    if (lines.isEmpty()) return reason;
    return reason + ": " + lines.join(" | ");
}
