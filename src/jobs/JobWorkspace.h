#pragma once

#include <QString>
#include <QByteArray>

// Scratch directory owned by one job. The directory and everything in it is
// removed when the workspace is destroyed, whatever way the job ended.
class JobWorkspace {
public:
    JobWorkspace(const QString& parentDir, const QString& name);
    ~JobWorkspace();

    JobWorkspace(const JobWorkspace&) = delete;
    JobWorkspace& operator=(const JobWorkspace&) = delete;

    bool isValid() const { return m_valid; }
    QString path() const { return m_path; }
    QString filePath(const QString& fileName) const;

    // Writes data into the workspace under a sanitized name, returns the path
    bool writeFile(const QString& fileName, const QByteArray& data, QString* writtenPath);

    bool remove();

    QString errorString() const { return m_error; }

    // Keeps letters, digits, '.', '-' and '_'; everything else becomes '_'
    static QString sanitizeFileName(const QString& name);

private:
    QString m_path;
    bool m_valid = false;
    QString m_error;
};
