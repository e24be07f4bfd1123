#include "connectorfactory.h"

#include "cloudconnector.h"
#include "curlconnector.h"
#include "webdavconnector.h"

ProtocolConnector *ConnectorFactory::create(Protocol protocol, QObject *parent)
{
    switch (protocol) {
    case Protocol::WebDav:
        return new WebDavConnector(parent);
    case Protocol::Cloud:
        return new CloudConnector(parent);
    case Protocol::Ftp:
    case Protocol::Sftp:
    case Protocol::Smb:
        break;
    }
    return new CurlConnector(protocol, parent);
}
