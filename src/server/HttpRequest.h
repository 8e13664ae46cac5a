#pragma once

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include <QUrlQuery>
#include <vector>
#include "AppConstants.h"

// One part of a multipart/form-data body
struct MultipartPart {
    QString name;
    QString fileName;           // null for plain fields
    QByteArray contentType;
    QByteArray data;

    bool isFile() const { return !fileName.isNull(); }
};

struct MultipartForm {
    std::vector<MultipartPart> parts;

    // First plain field called name, or a null string
    QString value(const QString& name) const;
    const MultipartPart* file(const QString& name) const;
    std::vector<const MultipartPart*> files(const QString& name) const;
};

// Incremental HTTP/1.1 request parser for a single request per connection.
// Bodies are buffered in memory up to maxBodyBytes.
class HttpRequest {
public:
    enum class State {
        ReadingHeaders,
        ReadingBody,
        Complete,
        Error
    };

    explicit HttpRequest(qint64 maxBodyBytes = AppConstants::DefaultMaxBodyBytes);

    // Consumes bytes from the socket and returns the new state
    State feed(const QByteArray& data);
    State state() const { return m_state; }
    bool headersComplete() const { return m_state == State::ReadingBody || m_state == State::Complete; }

    QByteArray method() const { return m_method; }
    QString path() const { return m_path; }
    QUrlQuery query() const { return m_query; }
    QByteArray header(const QByteArray& name) const;
    QByteArray body() const { return m_body; }
    qint64 contentLength() const { return m_contentLength; }
    bool expectsContinue() const;

    // Status to answer with when state() == Error
    int errorStatus() const { return m_errorStatus; }
    QString errorString() const { return m_error; }

    bool parseMultipart(MultipartForm& form, QString* error = nullptr) const;

    static QByteArray boundaryFromContentType(const QByteArray& contentType);
    static bool parseMultipartBody(const QByteArray& body, const QByteArray& boundary,
                                   MultipartForm& form, QString* error = nullptr);

    static constexpr int MaxHeaderBytes = 64 * 1024;

private:
    bool parseHeaderBlock(const QByteArray& block);
    State fail(int status, const QString& message);

    qint64 m_maxBodyBytes;
    State m_state = State::ReadingHeaders;
    QByteArray m_buffer;
    QByteArray m_method;
    QString m_path;
    QUrlQuery m_query;
    QList<QPair<QByteArray, QByteArray>> m_headers;
    QByteArray m_body;
    qint64 m_contentLength = 0;
    int m_errorStatus = 0;
    QString m_error;
};
