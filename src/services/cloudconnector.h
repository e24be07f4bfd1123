/**
 * @file cloudconnector.h
 * @brief Connector for the HTTPS JSON file API used by cloud storage.
 */

#ifndef CLOUDCONNECTOR_H
#define CLOUDCONNECTOR_H

#include "httpconnector.h"

/**
 * @brief Connector for a bearer-token JSON file service.
 *
 * Endpoints, relative to https://host:port:
 * - GET /v1/files?path=P lists a directory as
 *   {"entries":[{"name":..,"size":..,"isDirectory":..,"modified":ISO-8601}]}
 * - GET /v1/content?path=P reads a file
 * - PUT /v1/content?path=P writes a file
 *
 * ConnectionParams::password carries the access token.
 */
class CloudConnector : public HttpConnector
{
    Q_OBJECT

public:
    explicit CloudConnector(QObject *parent = nullptr);

    [[nodiscard]] Protocol protocol() const override { return Protocol::Cloud; }

    /**
     * @brief Parses a /v1/files response body.
     * @param body JSON document.
     * @param error Set to a reason when the document is malformed.
     */
    [[nodiscard]] static QList<RemoteEntry> parseFileList(const QByteArray &body, QString *error);

    /**
     * @brief Builds an API URL carrying the remote path as its query.
     * @param params Session parameters (host and port; always HTTPS).
     * @param endpoint API path, e.g. "/v1/files".
     * @param remotePath Absolute remote path; empty means "/".
     */
    [[nodiscard]] static QUrl endpointUrl(const ConnectionParams &params, const QString &endpoint,
                                          const QString &remotePath);

protected:
    QNetworkReply *sendListRequest(const QString &remotePath) override;
    [[nodiscard]] QList<RemoteEntry> parseListing(const QString &remotePath,
                                                  const QByteArray &body,
                                                  QString *error) const override;
    [[nodiscard]] QUrl contentUrl(const QString &remotePath) const override;
    void authorize(QNetworkRequest &request) const override;
};

#endif // CLOUDCONNECTOR_H
