#include "JobWorkspace.h"
#include "Logging.h"

#include <QDir>
#include <QFile>

JobWorkspace::JobWorkspace(const QString& parentDir, const QString& name)
    : m_path(QDir(parentDir).absoluteFilePath(sanitizeFileName(name)))
{
    m_valid = QDir().mkpath(m_path);
    if (!m_valid) {
        m_error = QString("Cannot create workspace: %1").arg(m_path);
    }
}

JobWorkspace::~JobWorkspace() {
    remove();
}

QString JobWorkspace::filePath(const QString& fileName) const {
    return QDir(m_path).absoluteFilePath(sanitizeFileName(fileName));
}

bool JobWorkspace::writeFile(const QString& fileName, const QByteArray& data, QString* writtenPath) {
    QString target = filePath(fileName);
    QFile file(target);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QString("Cannot write to: %1").arg(target);
        return false;
    }
    if (file.write(data) != data.size()) {
        m_error = QString("Short write to: %1").arg(target);
        file.close();
        file.remove();
        return false;
    }
    if (writtenPath) *writtenPath = target;
    return true;
}

bool JobWorkspace::remove() {
    if (!m_valid) return true;
    QDir dir(m_path);
    if (dir.exists() && !dir.removeRecursively()) {
        qCWarning(REELFORGE_JOBS_LOG) << "Could not remove workspace" << m_path;
        return false;
    }
    m_valid = false;
    return true;
}

QString JobWorkspace::sanitizeFileName(const QString& name) {
    QString out;
    out.reserve(name.size());
    for (const QChar ch : name) {
        bool keep = (ch.unicode() < 128 && ch.isLetterOrNumber()) ||
                    ch == '.' || ch == '-' || ch == '_';
        out += keep ? ch : QChar('_');
    }
    // Never produce "." or ".." path components
    while (out.startsWith('.')) out[0] = '_';
    if (out.isEmpty()) out = "_";
    return out;
}
