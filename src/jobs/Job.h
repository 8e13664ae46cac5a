#pragma once

#include <QString>
#include <QDateTime>

enum class JobStatus {
    Processing,
    Done,
    Error
};

enum class JobKind {
    ProcessVideo,
    Export
};

struct Job {
    QString id;
    JobKind kind = JobKind::Export;
    JobStatus status = JobStatus::Processing;
    double progress = 0.0;      // 0-100
    QString outputPath;
    QString filename;           // name offered on download
    QString error;
    QDateTime createdAt;

    bool isTerminal() const { return status != JobStatus::Processing; }
};

inline QString jobStatusName(JobStatus status) {
    switch (status) {
    case JobStatus::Processing: return "processing";
    case JobStatus::Done: return "done";
    case JobStatus::Error: return "error";
    }
    return "error";
}
