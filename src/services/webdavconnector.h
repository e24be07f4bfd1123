/**
 * @file webdavconnector.h
 * @brief WebDAV connector built on Qt Network.
 */

#ifndef WEBDAVCONNECTOR_H
#define WEBDAVCONNECTOR_H

#include "httpconnector.h"

/**
 * @brief Connector for WebDAV shares (RFC 4918).
 *
 * Directories are read with PROPFIND (Depth: 1), files with GET and PUT.
 * Credentials are sent as HTTP Basic authentication; set
 * ConnectionParams::secure to use HTTPS.
 */
class WebDavConnector : public HttpConnector
{
    Q_OBJECT

public:
    explicit WebDavConnector(QObject *parent = nullptr);

    [[nodiscard]] Protocol protocol() const override { return Protocol::WebDav; }

    /**
     * @brief Parses a PROPFIND multistatus document.
     * @param collectionPath Server path of the listed collection (its own
     *        response entry is skipped).
     * @param body The multistatus XML.
     * @param error Set to a reason when the document is not well-formed.
     */
    [[nodiscard]] static QList<RemoteEntry> parseMultiStatus(const QString &collectionPath,
                                                             const QByteArray &body,
                                                             QString *error);

    /**
     * @brief Builds the URL of a resource on the server.
     * @param params Session parameters (scheme, host and port).
     * @param remotePath Absolute server path; empty means "/".
     * @param collection True to force a trailing slash (PROPFIND on a directory).
     */
    [[nodiscard]] static QUrl resourceUrl(const ConnectionParams &params,
                                          const QString &remotePath, bool collection);

protected:
    QNetworkReply *sendListRequest(const QString &remotePath) override;
    [[nodiscard]] QList<RemoteEntry> parseListing(const QString &remotePath,
                                                  const QByteArray &body,
                                                  QString *error) const override;
    [[nodiscard]] QUrl contentUrl(const QString &remotePath) const override;
    void authorize(QNetworkRequest &request) const override;
};

#endif // WEBDAVCONNECTOR_H
