#include "webdavconnector.h"

#include <QDateTime>
#include <QLocale>
#include <QXmlStreamReader>

namespace {

const QByteArray PropfindBody =
    "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
    "<d:propfind xmlns:d=\"DAV:\"><d:prop>"
    "<d:resourcetype/><d:getcontentlength/><d:getlastmodified/>"
    "</d:prop></d:propfind>\n";

// RFC 1123 dates, e.g. "Tue, 14 Mar 2023 09:30:00 GMT"
QDateTime parseHttpDate(const QString &text)
{
    QString value = text.trimmed();
    if (value.endsWith(QLatin1String(" GMT"))) {
        value.chop(4);
    }
    QDateTime result = QLocale::c().toDateTime(value, QStringLiteral("ddd, dd MMM yyyy HH:mm:ss"));
    if (!result.isValid()) {
        result = QDateTime::fromString(text.trimmed(), Qt::RFC2822Date);
    }
    if (result.isValid()) {
        result.setTimeSpec(Qt::UTC);
    }
    return result;
}

QString normalizedPath(const QString &path)
{
    QString result = path;
    while (result.length() > 1 && result.endsWith(QLatin1Char('/'))) {
        result.chop(1);
    }
    return result;
}

QString serverPath(const QString &remotePath)
{
    return remotePath.isEmpty() ? QStringLiteral("/") : remotePath;
}

} // namespace

WebDavConnector::WebDavConnector(QObject *parent)
    : HttpConnector(parent)
{
}

QUrl WebDavConnector::resourceUrl(const ConnectionParams &params, const QString &remotePath,
                                  bool collection)
{
    QString path = serverPath(remotePath);
    if (collection && !path.endsWith(QLatin1Char('/'))) {
        path += QLatin1Char('/');
    }
    QUrl url = baseUrl(params, params.secure);
    url.setPath(path, QUrl::DecodedMode);
    return url;
}

QUrl WebDavConnector::contentUrl(const QString &remotePath) const
{
    return resourceUrl(params(), remotePath, false);
}

void WebDavConnector::authorize(QNetworkRequest &request) const
{
    if (params().user.isEmpty()) {
        return;
    }
    const QByteArray credentials = (params().user + QLatin1Char(':') + params().password).toUtf8();
    request.setRawHeader("Authorization", "Basic " + credentials.toBase64());
}

QNetworkReply *WebDavConnector::sendListRequest(const QString &remotePath)
{
    QNetworkRequest request = createRequest(resourceUrl(params(), remotePath, true));
    request.setRawHeader("Depth", "1");
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/xml; charset=utf-8");
    return networkManager_->sendCustomRequest(request, "PROPFIND", PropfindBody);
}

QList<RemoteEntry> WebDavConnector::parseListing(const QString &remotePath,
                                                 const QByteArray &body,
                                                 QString *error) const
{
    return parseMultiStatus(serverPath(remotePath), body, error);
}

QList<RemoteEntry> WebDavConnector::parseMultiStatus(const QString &collectionPath,
                                                     const QByteArray &body,
                                                     QString *error)
{
    QList<RemoteEntry> entries;
    const QString self = normalizedPath(collectionPath);

    QXmlStreamReader xml(body);
    QString href;
    RemoteEntry entry;
    bool inResponse = false;

    while (!xml.atEnd()) {
        xml.readNext();
        const QStringView name = xml.name();

        if (xml.isStartElement()) {
            if (name == QLatin1String("response")) {
                inResponse = true;
                href.clear();
                entry = RemoteEntry();
            } else if (!inResponse) {
                continue;
            } else if (name == QLatin1String("href")) {
                href = xml.readElementText().trimmed();
            } else if (name == QLatin1String("collection")) {
                entry.isDirectory = true;
            } else if (name == QLatin1String("getcontentlength")) {
                entry.size = xml.readElementText().trimmed().toLongLong();
            } else if (name == QLatin1String("getlastmodified")) {
                entry.modified = parseHttpDate(xml.readElementText());
            }
        } else if (xml.isEndElement() && name == QLatin1String("response")) {
            inResponse = false;
            // href may be absolute ("http://host/dav/a.txt") or a path
            const QByteArray encoded = QUrl(href).path(QUrl::FullyEncoded).toUtf8();
            const QString path = normalizedPath(QUrl::fromPercentEncoding(encoded));
            if (path.isEmpty() || path == self) {
                continue;
            }
            entry.name = remoteFileName(path);
            if (entry.isDirectory) {
                entry.size = 0;
            }
            if (!entry.name.isEmpty()) {
                entries.append(entry);
            }
        }
    }

    if (xml.hasError()) {
        if (error) {
            *error = QStringLiteral("Malformed PROPFIND response: %1").arg(xml.errorString());
        }
        return {};
    }
    return entries;
}
