#include "cloudconnector.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrlQuery>

CloudConnector::CloudConnector(QObject *parent)
    : HttpConnector(parent)
{
}

QUrl CloudConnector::endpointUrl(const ConnectionParams &params, const QString &endpoint,
                                 const QString &remotePath)
{
    QUrl url = baseUrl(params, true);
    url.setPath(endpoint);
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("path"),
                       remotePath.isEmpty() ? QStringLiteral("/") : remotePath);
    url.setQuery(query);
    return url;
}

QUrl CloudConnector::contentUrl(const QString &remotePath) const
{
    return endpointUrl(params(), QStringLiteral("/v1/content"), remotePath);
}

void CloudConnector::authorize(QNetworkRequest &request) const
{
    request.setRawHeader("Authorization", "Bearer " + params().password.toUtf8());
}

QNetworkReply *CloudConnector::sendListRequest(const QString &remotePath)
{
    QNetworkRequest request = createRequest(endpointUrl(params(), QStringLiteral("/v1/files"), remotePath));
    request.setRawHeader("Accept", "application/json");
    return networkManager_->get(request);
}

QList<RemoteEntry> CloudConnector::parseListing(const QString &remotePath,
                                                const QByteArray &body,
                                                QString *error) const
{
    Q_UNUSED(remotePath)
    return parseFileList(body, error);
}

QList<RemoteEntry> CloudConnector::parseFileList(const QByteArray &body, QString *error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = QStringLiteral("Malformed file list: %1").arg(parseError.errorString());
        }
        return {};
    }

    const QJsonValue entriesValue = doc.object().value(QStringLiteral("entries"));
    if (!entriesValue.isArray()) {
        if (error) {
            *error = QStringLiteral("Malformed file list: missing \"entries\" array");
        }
        return {};
    }

    QList<RemoteEntry> entries;
    const QJsonArray array = entriesValue.toArray();
    for (const QJsonValue &value : array) {
        const QJsonObject obj = value.toObject();
        RemoteEntry entry;
        entry.name = obj.value(QStringLiteral("name")).toString();
        entry.isDirectory = obj.value(QStringLiteral("isDirectory")).toBool();
        entry.size = entry.isDirectory
                         ? 0
                         : static_cast<qint64>(obj.value(QStringLiteral("size")).toDouble());
        entry.modified = QDateTime::fromString(obj.value(QStringLiteral("modified")).toString(),
                                               Qt::ISODate);
        if (!entry.name.isEmpty()) {
            entries.append(entry);
        }
    }
    return entries;
}
