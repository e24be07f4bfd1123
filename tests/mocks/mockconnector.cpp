#include "mockconnector.h"

#include <QFile>
#include <QTimer>

#include <optional>

// ---------------------------------------------------------------------------
// MockConnector
// ---------------------------------------------------------------------------

MockConnector::MockConnector(MockConnectorFactory *factory, Protocol protocol, QObject *parent)
    : ProtocolConnector(parent)
    , factory_(factory)
    , protocol_(protocol)
{
}

void MockConnector::setState(State state)
{
    if (state_ != state) {
        state_ = state;
        emit stateChanged(state);
    }
}

void MockConnector::connectToHost(const ConnectionParams &params)
{
    params_ = params;
    const quint64 generation = ++generation_;

    if (factory_) {
        factory_->connectCount_++;
        factory_->connectsInFlight_++;
        factory_->maxConcurrentConnects_ = qMax(factory_->maxConcurrentConnects_,
                                                factory_->connectsInFlight_);
    }
    setState(State::Connecting);

    if (factory_ && factory_->holdConnects_) {
        factory_->heldConnects_.append({this, generation});
        return;
    }
    QTimer::singleShot(0, this, [this, generation]() { completeConnect(generation); });
}

void MockConnector::completeConnect(quint64 generation)
{
    if (generation != generation_ || state_ != State::Connecting) {
        return;
    }
    if (factory_) {
        factory_->connectsInFlight_--;
    }

    if (factory_ && factory_->connectFailure_ != ErrorKind::None) {
        setState(State::Error);
        emit connectFailed(factory_->connectFailure_, factory_->connectFailureMessage_);
        return;
    }
    setState(State::Connected);
    emit connected();
}

void MockConnector::disconnectFromHost()
{
    generation_++;
    transferId_ = 0;
    if (state_ == State::Connecting && factory_) {
        factory_->connectsInFlight_--;
    }
    if (state_ != State::Disconnected) {
        setState(State::Disconnected);
        emit disconnected();
    }
}

void MockConnector::list(const QString &remotePath)
{
    if (factory_) {
        factory_->listRequests_.append(remotePath);
    }

    const quint64 generation = generation_;
    QTimer::singleShot(0, this, [this, generation, remotePath]() {
        if (generation != generation_ || !factory_) {
            return;
        }
        if (state_ != State::Connected) {
            emit listFailed(remotePath, ErrorKind::Connection, QStringLiteral("Not connected"));
        } else if (factory_->listFailures_.contains(remotePath)) {
            emit listFailed(remotePath, factory_->listFailures_.value(remotePath),
                            QStringLiteral("mock list failure"));
        } else if (factory_->listings_.contains(remotePath)) {
            emit entriesListed(remotePath, factory_->listings_.value(remotePath));
        } else {
            emit listFailed(remotePath, ErrorKind::Protocol, QStringLiteral("No such directory"));
        }
    });
}

void MockConnector::upload(quint64 transferId, const QString &localPath,
                           const QString &remotePath, const CancellationToken &token)
{
    startTransfer(transferId, localPath, remotePath, token, true);
}

void MockConnector::download(quint64 transferId, const QString &remotePath,
                             const QString &localPath, const CancellationToken &token)
{
    startTransfer(transferId, localPath, remotePath, token, false);
}

void MockConnector::startTransfer(quint64 transferId, const QString &localPath,
                                  const QString &remotePath, const CancellationToken &token,
                                  bool upload)
{
    if (factory_) {
        MockConnectorFactory::TransferCall call;
        call.transferId = transferId;
        call.localPath = localPath;
        call.remotePath = remotePath;
        call.upload = upload;
        factory_->transferCalls_.append(call);
    }

    if (state_ != State::Connected) {
        QTimer::singleShot(0, this, [this, transferId]() {
            emit transferFailed(transferId, ErrorKind::Connection, QStringLiteral("Not connected"));
        });
        return;
    }

    transferId_ = transferId;
    transferLocalPath_ = localPath;
    transferIsUpload_ = upload;
    token_ = token;

    std::optional<ErrorKind> outcome;
    if (factory_ && !factory_->outcomes_.value(remotePath).isEmpty()) {
        outcome = factory_->outcomes_[remotePath].dequeue();
    } else if (factory_ && factory_->autoComplete_) {
        outcome = ErrorKind::None;
    }
    if (!outcome) {
        return;
    }

    const quint64 generation = generation_;
    const ErrorKind kind = *outcome;
    QTimer::singleShot(0, this, [this, generation, transferId, kind]() {
        if (generation != generation_ || transferId_ != transferId) {
            return;
        }
        const qint64 size = factory_ ? factory_->payload_.size() : 0;
        mockEmitProgress(size / 2, size);
        if (transferId_ != transferId) {
            return;  // Cancelled at the checkpoint
        }
        if (kind == ErrorKind::None) {
            mockFinishTransfer();
        } else {
            mockFailTransfer(kind);
        }
    });
}

void MockConnector::mockEmitProgress(qint64 bytes, qint64 total)
{
    if (transferId_ == 0) {
        return;
    }
    if (token_.isCancelled()) {
        const quint64 id = transferId_;
        transferId_ = 0;
        emit transferFailed(id, ErrorKind::Cancelled, QStringLiteral("Cancelled"));
        return;
    }
    emit transferProgress(transferId_, bytes, total);
}

void MockConnector::mockFinishTransfer()
{
    if (transferId_ == 0) {
        return;
    }
    const quint64 id = transferId_;
    transferId_ = 0;

    if (!transferIsUpload_) {
        QFile file(transferLocalPath_);
        const QByteArray payload = factory_ ? factory_->payload_ : QByteArray();
        if (!file.open(QIODevice::WriteOnly) || file.write(payload) != payload.size()) {
            emit transferFailed(id, ErrorKind::Io, file.errorString());
            return;
        }
    }
    emit transferFinished(id);
}

void MockConnector::mockFailTransfer(ErrorKind kind, const QString &message)
{
    if (transferId_ == 0) {
        return;
    }
    const quint64 id = transferId_;
    transferId_ = 0;
    emit transferFailed(id, kind, message);
}

void MockConnector::mockDropConnection()
{
    generation_++;
    const quint64 id = transferId_;
    transferId_ = 0;
    setState(State::Error);
    if (id != 0) {
        emit transferFailed(id, ErrorKind::Connection, QStringLiteral("Connection lost"));
    }
}

// ---------------------------------------------------------------------------
// MockConnectorFactory
// ---------------------------------------------------------------------------

MockConnectorFactory::MockConnectorFactory(QObject *parent)
    : QObject(parent)
{
}

ProtocolConnector *MockConnectorFactory::create(Protocol protocol, QObject *parent)
{
    auto *connector = new MockConnector(this, protocol, parent);
    connectors_.append(connector);
    return connector;
}

void MockConnectorFactory::mockSetConnectFailure(ErrorKind kind, const QString &message)
{
    connectFailure_ = kind;
    connectFailureMessage_ = message;
}

void MockConnectorFactory::mockReleaseConnects()
{
    const QList<HeldConnect> held = heldConnects_;
    heldConnects_.clear();
    for (const HeldConnect &entry : held) {
        if (entry.connector) {
            entry.connector->completeConnect(entry.generation);
        }
    }
}

void MockConnectorFactory::mockSetListing(const QString &path, const QList<RemoteEntry> &entries)
{
    listFailures_.remove(path);
    listings_.insert(path, entries);
}

void MockConnectorFactory::mockSetListFailure(const QString &path, ErrorKind kind)
{
    listFailures_.insert(path, kind);
}

void MockConnectorFactory::mockQueueOutcome(const QString &remotePath, ErrorKind kind)
{
    outcomes_[remotePath].enqueue(kind);
}

MockConnector *MockConnectorFactory::mockSessionRunning(quint64 transferId) const
{
    for (const QPointer<MockConnector> &connector : connectors_) {
        if (connector && connector->mockTransferId() == transferId) {
            return connector;
        }
    }
    return nullptr;
}

int MockConnectorFactory::mockBusySessions() const
{
    int count = 0;
    for (const QPointer<MockConnector> &connector : connectors_) {
        if (connector && connector->isBusy()) {
            count++;
        }
    }
    return count;
}
