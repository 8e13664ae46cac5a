#pragma once

#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>
#include "EncoderProfile.h"

class JobStore;

// Runs one encoder invocation for one job and owns that job's transitions:
// progress while running, then exactly one of done / error.
class RenderExecutor : public QObject {
    Q_OBJECT
public:
    RenderExecutor(JobStore& store, const QString& jobId, QObject* parent = nullptr);
    ~RenderExecutor();

    void setEncoderProgram(const QString& program) { m_program = program; }

    bool start(const EncoderInvocation& invocation);
    void cancel();
    bool isRunning() const { return m_running; }

    QString jobId() const { return m_jobId; }
    QStringList arguments() const { return m_invocation.arguments(); }

    // Percent of expectedDuration covered by outTimeSeconds, within [0, 99]
    static double progressPercent(double outTimeSeconds, double expectedDuration);

signals:
    void progress(double percent);
    void finished(bool success, const QString& message);

private slots:
    void onStandardOutput();
    void onStandardError();
    void onProcessFinished(int exitCode, QProcess::ExitStatus status);
    void onProcessError(QProcess::ProcessError error);

private:
    void handleProgressLine(const QString& line);
    void complete(bool success, const QString& message);
    void removeTransientFiles();
    QString failureMessage(int exitCode, QProcess::ExitStatus status) const;

    JobStore& m_store;
    QString m_jobId;
    QString m_program = "ffmpeg";
    EncoderInvocation m_invocation;
    QProcess m_process;
    QByteArray m_stdoutBuffer;
    QString m_errorOutput;
    bool m_running = false;
    bool m_completed = false;
    bool m_cancelled = false;
};
