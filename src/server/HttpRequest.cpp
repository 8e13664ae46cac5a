#include "HttpRequest.h"

#include <QUrl>

namespace {

const QByteArray kCrlf = "\r\n";
const QByteArray kHeaderEnd = "\r\n\r\n";

// Splits "form-data; name=\"a\"; filename=\"b;c\"" into its parameters,
// honouring quoted strings
QList<QPair<QByteArray, QByteArray>> headerParams(const QByteArray& value) {
    QList<QPair<QByteArray, QByteArray>> params;
    QByteArray current;
    bool quoted = false;
    QList<QByteArray> pieces;

    for (int i = 0; i < value.size(); ++i) {
        const char c = value.at(i);
        if (c == '"') {
            quoted = !quoted;
            current += c;
        } else if (c == '\\' && quoted && i + 1 < value.size()) {
            current += value.at(++i);
        } else if (c == ';' && !quoted) {
            pieces << current;
            current.clear();
        } else {
            current += c;
        }
    }
    pieces << current;

    for (const QByteArray& piece : pieces) {
        const int eq = piece.indexOf('=');
        QByteArray key = (eq < 0 ? piece : piece.left(eq)).trimmed().toLower();
        QByteArray val = eq < 0 ? QByteArray() : piece.mid(eq + 1).trimmed();
        if (val.size() >= 2 && val.startsWith('"') && val.endsWith('"')) {
            val = val.mid(1, val.size() - 2);
        }
        if (!key.isEmpty()) params.append({key, val});
    }
    return params;
}

QByteArray paramValue(const QList<QPair<QByteArray, QByteArray>>& params, const QByteArray& key,
                      bool* present = nullptr) {
    for (const auto& p : params) {
        if (p.first == key) {
            if (present) *present = true;
            return p.second;
        }
    }
    if (present) *present = false;
    return QByteArray();
}

} // namespace

QString MultipartForm::value(const QString& name) const {
    for (const auto& part : parts) {
        if (part.name == name && !part.isFile()) return QString::fromUtf8(part.data);
    }
    return QString();
}

const MultipartPart* MultipartForm::file(const QString& name) const {
    for (const auto& part : parts) {
        if (part.name == name && part.isFile()) return &part;
    }
    return nullptr;
}

std::vector<const MultipartPart*> MultipartForm::files(const QString& name) const {
    std::vector<const MultipartPart*> out;
    for (const auto& part : parts) {
        if (part.name == name && part.isFile()) out.push_back(&part);
    }
    return out;
}

HttpRequest::HttpRequest(qint64 maxBodyBytes)
    : m_maxBodyBytes(maxBodyBytes)
{
}

HttpRequest::State HttpRequest::fail(int status, const QString& message) {
    m_state = State::Error;
    m_errorStatus = status;
    m_error = message;
    m_buffer.clear();
    return m_state;
}

HttpRequest::State HttpRequest::feed(const QByteArray& data) {
    if (m_state == State::Complete || m_state == State::Error) return m_state;

    if (m_state == State::ReadingHeaders) {
        m_buffer.append(data);
        const int end = m_buffer.indexOf(kHeaderEnd);
        if (end < 0) {
            if (m_buffer.size() > MaxHeaderBytes) {
                return fail(431, "Request header section too large");
            }
            return m_state;
        }
        if (end > MaxHeaderBytes) return fail(431, "Request header section too large");

        if (!parseHeaderBlock(m_buffer.left(end))) return m_state;

        m_body = m_buffer.mid(end + kHeaderEnd.size());
        m_buffer.clear();
        m_state = State::ReadingBody;
    } else {
        m_body.append(data);
    }

    if (m_body.size() > m_contentLength) {
        // One request per connection; anything past the body is dropped
        m_body.truncate(m_contentLength);
    }
    if (m_body.size() == m_contentLength) m_state = State::Complete;
    return m_state;
}

bool HttpRequest::parseHeaderBlock(const QByteArray& block) {
    const QList<QByteArray> lines = block.split('\n');
    if (lines.isEmpty()) {
        fail(400, "Empty request");
        return false;
    }

    const QList<QByteArray> requestLine = lines.first().trimmed().split(' ');
    if (requestLine.size() != 3 || !requestLine[2].startsWith("HTTP/1.")) {
        fail(400, "Malformed request line");
        return false;
    }
    m_method = requestLine[0].toUpper();

    const QUrl url = QUrl::fromEncoded("http://localhost" + requestLine[1]);
    if (!url.isValid()) {
        fail(400, "Malformed request target");
        return false;
    }
    m_path = url.path();
    m_query = QUrlQuery(url);

    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines[i].trimmed();
        if (line.isEmpty()) continue;
        const int colon = line.indexOf(':');
        if (colon <= 0) {
            fail(400, "Malformed header line");
            return false;
        }
        m_headers.append({line.left(colon).trimmed().toLower(), line.mid(colon + 1).trimmed()});
    }

    if (!header("transfer-encoding").isEmpty()) {
        fail(411, "Chunked request bodies are not supported");
        return false;
    }

    const QByteArray length = header("content-length");
    if (!length.isEmpty()) {
        bool ok = false;
        m_contentLength = length.toLongLong(&ok);
        if (!ok || m_contentLength < 0) {
            fail(400, "Invalid Content-Length");
            return false;
        }
    }
    if (m_contentLength > m_maxBodyBytes) {
        fail(413, QString("Request body exceeds %1 bytes").arg(m_maxBodyBytes));
        return false;
    }
    return true;
}

QByteArray HttpRequest::header(const QByteArray& name) const {
    const QByteArray key = name.toLower();
    for (const auto& h : m_headers) {
        if (h.first == key) return h.second;
    }
    return QByteArray();
}

bool HttpRequest::expectsContinue() const {
    return header("expect").toLower() == "100-continue";
}

QByteArray HttpRequest::boundaryFromContentType(const QByteArray& contentType) {
    const auto params = headerParams(contentType);
    if (params.isEmpty() || params.first().first != "multipart/form-data") return QByteArray();
    return paramValue(params, "boundary");
}

bool HttpRequest::parseMultipart(MultipartForm& form, QString* error) const {
    const QByteArray boundary = boundaryFromContentType(header("content-type"));
    if (boundary.isEmpty()) {
        if (error) *error = "Expected multipart/form-data";
        return false;
    }
    return parseMultipartBody(m_body, boundary, form, error);
}

bool HttpRequest::parseMultipartBody(const QByteArray& body, const QByteArray& boundary,
                                     MultipartForm& form, QString* error) {
    const QByteArray delimiter = "--" + boundary;
    const QByteArray separator = kCrlf + delimiter;

    auto malformed = [error](const char* what) {
        if (error) *error = QString("Malformed multipart body: %1").arg(what);
        return false;
    };

    qsizetype pos = body.indexOf(delimiter);
    if (pos < 0) return malformed("missing boundary");
    pos += delimiter.size();

    while (true) {
        if (body.mid(pos, 2) == "--") return true;   // closing delimiter
        if (body.mid(pos, 2) != kCrlf) return malformed("bad delimiter line");
        pos += 2;

        const qsizetype headerEnd = body.indexOf(kHeaderEnd, pos);
        if (headerEnd < 0) return malformed("unterminated part headers");

        MultipartPart part;
        const QList<QByteArray> lines = body.mid(pos, headerEnd - pos).split('\n');
        for (const QByteArray& raw : lines) {
            const QByteArray line = raw.trimmed();
            const int colon = line.indexOf(':');
            if (colon <= 0) continue;
            const QByteArray name = line.left(colon).trimmed().toLower();
            const QByteArray value = line.mid(colon + 1).trimmed();
            if (name == "content-disposition") {
                const auto params = headerParams(value);
                part.name = QString::fromUtf8(paramValue(params, "name"));
                bool hasFileName = false;
                const QByteArray fileName = paramValue(params, "filename", &hasFileName);
                if (hasFileName) {
                    part.fileName = QString::fromUtf8(fileName);
                    // A present but empty filename still marks a file part
                    if (part.fileName.isNull()) part.fileName = QString("");
                }
            } else if (name == "content-type") {
                part.contentType = value;
            }
        }

        const qsizetype dataStart = headerEnd + kHeaderEnd.size();
        const qsizetype next = body.indexOf(separator, dataStart);
        if (next < 0) return malformed("missing closing boundary");

        part.data = body.mid(dataStart, next - dataStart);
        form.parts.push_back(std::move(part));
        pos = next + separator.size();
    }
}
