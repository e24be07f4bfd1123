#include "transferqueue.h"

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "utils/logging.h"

TransferQueue::TransferQueue(ConnectionPool *pool, QObject *parent)
    : QAbstractListModel(parent)
    , pool_(pool)
    , retryTimer_(new QTimer(this))
{
    retryTimer_->setSingleShot(true);
    connect(retryTimer_, &QTimer::timeout, this, &TransferQueue::onRetryTimer);

    if (pool_) {
        pool_->setMaxSessions(concurrentLimit_);
        connect(pool_, &ConnectionPool::acquired, this, &TransferQueue::onSessionAcquired);
        connect(pool_, &ConnectionPool::acquireFailed, this, &TransferQueue::onAcquireFailed);
    }
}

TransferQueue::~TransferQueue()
{
    // Running sessions belong to the pool; stop their transfers and walk away
    for (auto it = active_.begin(); it != active_.end(); ++it) {
        it->token.cancel();
        if (it->session) {
            it->session->disconnect(this);
        } else if (pool_) {
            pool_->cancelAcquire(it->ticket);
        }
    }
}

void TransferQueue::scheduleProcessNext()
{
    // Queue the processNext() call for deferred execution.
    // This prevents re-entrancy issues where signal handlers
    // calling processNext() could cause nested state changes.
    eventQueue_.enqueue([this]() { processNext(); });

    // Schedule event processing if not already scheduled
    if (!eventProcessingScheduled_) {
        eventProcessingScheduled_ = true;
        QTimer::singleShot(0, this, &TransferQueue::processEventQueue);
    }
}

void TransferQueue::processEventQueue()
{
    eventProcessingScheduled_ = false;

    // Re-entrancy guard: if we're already processing, let the outer call finish
    if (processingEvents_) {
        if (!eventQueue_.isEmpty() && !eventProcessingScheduled_) {
            eventProcessingScheduled_ = true;
            QTimer::singleShot(0, this, &TransferQueue::processEventQueue);
        }
        return;
    }

    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

void TransferQueue::flushEventQueue()
{
    if (processingEvents_) {
        return;
    }

    eventProcessingScheduled_ = false;
    processingEvents_ = true;
    while (!eventQueue_.isEmpty()) {
        auto event = eventQueue_.dequeue();
        event();
    }
    processingEvents_ = false;
}

void TransferQueue::setConcurrentLimit(int limit)
{
    const int clamped = qBound(MinConcurrentLimit, limit, MaxConcurrentLimit);
    if (clamped != limit) {
        qWarning() << "TransferQueue: concurrent limit" << limit << "clamped to" << clamped;
    }
    concurrentLimit_ = clamped;
    if (pool_) {
        pool_->setMaxSessions(concurrentLimit_);
    }
    scheduleProcessNext();
}

void TransferQueue::setRetryDelays(int baseMs, int maxMs)
{
    retryBaseDelayMs_ = qMax(0, baseMs);
    retryMaxDelayMs_ = qMax(retryBaseDelayMs_, maxMs);
}

void TransferQueue::setMaxHistory(int maxHistory)
{
    maxHistory_ = qMax(1, maxHistory);
    evictHistory();
}

void TransferQueue::applySettings(const TransferSettings &settings)
{
    setDefaultMaxRetries(settings.maxRetries);
    setRetryDelays(settings.retryBaseDelayMs, settings.retryMaxDelayMs);
    setMaxHistory(settings.maxHistory);
    setConcurrentLimit(settings.concurrentLimit);
}

int TransferQueue::retryDelayMs(int retryCount, int baseMs, int maxMs)
{
    if (retryCount <= 0 || baseMs <= 0) {
        return 0;
    }
    qint64 delay = baseMs;
    for (int i = 1; i < retryCount && delay < maxMs; ++i) {
        delay *= 2;
    }
    return static_cast<int>(qMin<qint64>(delay, maxMs));
}

quint64 TransferQueue::enqueue(TransferItem item)
{
    item.id = nextId_++;
    item.driveId = driveId_;
    item.status = TransferItem::Status::Queued;
    item.progress = 0.0;
    item.processedBytes = 0;
    item.retryCount = 0;
    item.errorKind = ErrorKind::None;
    item.errorMessage.clear();
    item.nextRetryAt = QDateTime();
    if (item.maxRetries < 0) {
        item.maxRetries = defaultMaxRetries_;
    }
    if (!item.createdAt.isValid()) {
        item.createdAt = QDateTime::currentDateTimeUtc();
    }
    if (item.fileName.isEmpty()) {
        item.fileName = item.direction == TransferItem::Direction::Upload
                            ? QFileInfo(item.localPath).fileName()
                            : remoteFileName(item.remotePath);
    }
    if (item.direction == TransferItem::Direction::Upload && item.totalBytes <= 0) {
        item.totalBytes = QFileInfo(item.localPath).size();
    }

    const int row = static_cast<int>(items_.size());
    beginInsertRows(QModelIndex(), row, row);
    items_.append(item);
    endInsertRows();

    LOG_VERBOSE() << "TransferQueue: enqueued" << item.id << item.fileName
                  << transferPriorityToString(item.priority);
    emitEvent(TransferEvent::Type::Queued, item);
    emit queueChanged();

    wasBusy_ = true;
    evictHistory();
    scheduleProcessNext();
    return item.id;
}

std::optional<TransferItem> TransferQueue::item(quint64 id) const
{
    const int index = findItemIndex(id);
    if (index < 0) {
        return std::nullopt;
    }
    return items_[index];
}

int TransferQueue::countByStatus(TransferItem::Status status) const
{
    int count = 0;
    for (const auto &item : items_) {
        if (item.status == status) {
            count++;
        }
    }
    return count;
}

bool TransferQueue::isIdle() const
{
    for (const auto &item : items_) {
        if (item.status == TransferItem::Status::Queued
            || item.status == TransferItem::Status::InProgress
            || item.isAwaitingRetry()) {
            return false;
        }
    }
    return true;
}

int TransferQueue::findItemIndex(quint64 id) const
{
    for (int i = 0; i < items_.size(); ++i) {
        if (items_[i].id == id) {
            return i;
        }
    }
    return -1;
}

int TransferQueue::nextQueuedIndex() const
{
    int best = -1;
    for (int i = 0; i < items_.size(); ++i) {
        const TransferItem &candidate = items_[i];
        // An abandoned attempt still owns its session until the connector reports
        if (candidate.status != TransferItem::Status::Queued || active_.contains(candidate.id)) {
            continue;
        }
        if (best < 0) {
            best = i;
            continue;
        }
        const TransferItem &current = items_[best];
        if (candidate.priority != current.priority) {
            if (candidate.priority > current.priority) {
                best = i;
            }
        } else if (candidate.createdAt != current.createdAt) {
            if (candidate.createdAt < current.createdAt) {
                best = i;
            }
        } else if (candidate.id < current.id) {
            best = i;
        }
    }
    return best;
}

void TransferQueue::processNext()
{
    if (!pool_) {
        qDebug() << "TransferQueue: processNext - no connection pool, stopping";
        return;
    }

    while (activeCount() < concurrentLimit_) {
        const int index = nextQueuedIndex();
        if (index < 0) {
            break;
        }
        startItem(index);
    }

    checkIdle();
}

void TransferQueue::startItem(int index)
{
    TransferItem &item = items_[index];
    item.status = TransferItem::Status::InProgress;
    item.lastAttempt = QDateTime::currentDateTimeUtc();
    item.processedBytes = 0;
    item.progress = 0.0;
    item.errorKind = ErrorKind::None;
    item.errorMessage.clear();

    ActiveTransfer transfer;
    transfer.ticket = pool_->acquire();
    active_.insert(item.id, transfer);
    ticketToItem_.insert(transfer.ticket, item.id);

    qDebug() << "TransferQueue: starting" << item.id << item.fileName
             << "attempt" << (item.retryCount + 1);
    notifyRowChanged(index);
    emitEvent(TransferEvent::Type::Started, item);
}

void TransferQueue::onSessionAcquired(quint64 ticket, ProtocolConnector *session)
{
    const auto ticketIt = ticketToItem_.find(ticket);
    if (ticketIt == ticketToItem_.end()) {
        pool_->release(session);
        return;
    }
    const quint64 id = ticketIt.value();
    ticketToItem_.erase(ticketIt);

    auto it = active_.find(id);
    if (it == active_.end() || it->abandoned) {
        active_.remove(id);
        pool_->release(session);
        return;
    }
    beginTransfer(id, session);
}

void TransferQueue::onAcquireFailed(quint64 ticket, ErrorKind kind, const QString &message)
{
    const auto ticketIt = ticketToItem_.find(ticket);
    if (ticketIt == ticketToItem_.end()) {
        return;
    }
    const quint64 id = ticketIt.value();
    ticketToItem_.erase(ticketIt);
    active_.remove(id);
    scheduleProcessNext();

    const int index = findItemIndex(id);
    if (index < 0 || items_[index].status != TransferItem::Status::InProgress) {
        return;
    }
    if (kind == ErrorKind::Cancelled) {
        // Pool closed underneath us; nothing was transferred
        requeueItem(index);
        return;
    }
    failItem(index, kind, message, isTransientError(kind));
}

void TransferQueue::beginTransfer(quint64 id, ProtocolConnector *session)
{
    auto it = active_.find(id);
    it->session = session;
    const CancellationToken token = it->token;

    connect(session, &ProtocolConnector::transferProgress, this, &TransferQueue::onTransferProgress);
    connect(session, &ProtocolConnector::transferFinished, this, &TransferQueue::onTransferFinished);
    connect(session, &ProtocolConnector::transferFailed, this, &TransferQueue::onTransferFailed);
    connect(session, &ProtocolConnector::stateChanged, this,
            [this, id](ProtocolConnector::State state) { onSessionStateChanged(id, state); });

    const int index = findItemIndex(id);
    const TransferItem item = items_[index];

    if (item.direction == TransferItem::Direction::Upload) {
        session->upload(id, item.localPath, item.remotePath, token);
        return;
    }

    const QString localDir = QFileInfo(item.localPath).absolutePath();
    if (!QDir().mkpath(localDir)) {
        finishActive(id);
        failItem(findItemIndex(id), ErrorKind::Io,
                 tr("Cannot create directory %1").arg(localDir), false);
        return;
    }
    session->download(id, item.remotePath, item.localPath, token);
}

void TransferQueue::onTransferProgress(quint64 id, qint64 bytes, qint64 total)
{
    const auto it = active_.constFind(id);
    if (it == active_.constEnd() || it->abandoned) {
        return;
    }
    const int index = findItemIndex(id);
    if (index < 0 || items_[index].status != TransferItem::Status::InProgress) {
        return;
    }

    TransferItem &item = items_[index];
    if (item.totalBytes <= 0 && total > 0) {
        item.totalBytes = total;
    }
    if (item.totalBytes > 0) {
        bytes = qMin(bytes, item.totalBytes);
    }
    if (bytes < item.processedBytes) {
        return;
    }

    item.processedBytes = bytes;
    if (item.totalBytes > 0) {
        item.progress = qBound(item.progress, static_cast<double>(bytes) / item.totalBytes, 1.0);
    }

    notifyRowChanged(index);
    emitEvent(TransferEvent::Type::Progressed, item);
}

void TransferQueue::onTransferFinished(quint64 id)
{
    const auto it = active_.constFind(id);
    if (it == active_.constEnd()) {
        return;
    }
    const bool abandoned = it->abandoned;
    finishActive(id);
    if (abandoned) {
        return;
    }

    const int index = findItemIndex(id);
    if (index < 0 || items_[index].status != TransferItem::Status::InProgress) {
        return;
    }

    ErrorKind kind = ErrorKind::None;
    const QString checksumError = verifyChecksum(items_[index], &kind);
    if (!checksumError.isEmpty()) {
        failItem(index, kind, checksumError, false);
        return;
    }
    completeItem(index);
}

void TransferQueue::onTransferFailed(quint64 id, ErrorKind kind, const QString &message)
{
    const auto it = active_.constFind(id);
    if (it == active_.constEnd()) {
        return;
    }
    const bool abandoned = it->abandoned;
    finishActive(id);
    if (abandoned) {
        return;
    }

    const int index = findItemIndex(id);
    if (index < 0 || items_[index].status != TransferItem::Status::InProgress) {
        return;
    }

    if (kind == ErrorKind::Cancelled) {
        TransferItem &item = items_[index];
        item.status = TransferItem::Status::Cancelled;
        item.errorKind = kind;
        item.errorMessage = message;
        notifyRowChanged(index);
        emitEvent(TransferEvent::Type::Cancelled, item);
        evictHistory();
        return;
    }
    failItem(index, kind, message, isTransientError(kind));
}

void TransferQueue::onSessionStateChanged(quint64 id, ProtocolConnector::State state)
{
    if (state != ProtocolConnector::State::Disconnected && state != ProtocolConnector::State::Error) {
        return;
    }
    // A torn-down session never reports its transfer
    onTransferFailed(id, ErrorKind::Connection, tr("Connection lost"));
}

void TransferQueue::finishActive(quint64 id)
{
    const ActiveTransfer transfer = active_.take(id);
    if (transfer.session) {
        transfer.session->disconnect(this);
        if (pool_) {
            pool_->release(transfer.session);
        }
    }
    scheduleProcessNext();
}

void TransferQueue::stopActive(quint64 id)
{
    auto it = active_.find(id);
    if (it == active_.end()) {
        return;
    }

    if (!it->session) {
        // Still waiting for a session: withdraw the request
        if (pool_) {
            pool_->cancelAcquire(it->ticket);
        }
        ticketToItem_.remove(it->ticket);
        active_.erase(it);
    } else {
        // The connector stops at its next checkpoint and reports back
        it->token.cancel();
        it->abandoned = true;
    }
    scheduleProcessNext();
}

QString TransferQueue::verifyChecksum(const TransferItem &item, ErrorKind *kind) const
{
    if (item.checksum.isEmpty()) {
        return QString();
    }

    QFile file(item.localPath);
    if (!file.open(QIODevice::ReadOnly)) {
        *kind = ErrorKind::Io;
        return tr("Cannot read %1 for verification: %2").arg(item.localPath, file.errorString());
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(&file)) {
        *kind = ErrorKind::Io;
        return tr("Cannot read %1 for verification: %2").arg(item.localPath, file.errorString());
    }

    const QString actual = QString::fromLatin1(hash.result().toHex());
    if (actual.compare(item.checksum.trimmed(), Qt::CaseInsensitive) != 0) {
        *kind = ErrorKind::Integrity;
        return tr("Checksum mismatch for %1: expected %2, got %3")
            .arg(item.fileName, item.checksum.trimmed().toLower(), actual);
    }
    return QString();
}

void TransferQueue::completeItem(int index)
{
    TransferItem &item = items_[index];
    if (item.totalBytes <= 0) {
        item.totalBytes = qMax(item.processedBytes, QFileInfo(item.localPath).size());
    }
    item.processedBytes = item.totalBytes;
    item.progress = 1.0;
    item.status = TransferItem::Status::Completed;
    item.nextRetryAt = QDateTime();

    qDebug() << "TransferQueue: completed" << item.id << item.fileName;
    notifyRowChanged(index);
    emitEvent(TransferEvent::Type::Completed, item);
    evictHistory();
}

void TransferQueue::failItem(int index, ErrorKind kind, const QString &message, bool retryable)
{
    TransferItem &item = items_[index];
    item.status = TransferItem::Status::Failed;
    item.errorKind = kind;
    item.errorMessage = message;
    item.nextRetryAt = QDateTime();

    if (retryable && item.retryCount < item.maxRetries) {
        item.retryCount++;
        const int delay = retryDelayMs(item.retryCount, retryBaseDelayMs_, retryMaxDelayMs_);
        item.nextRetryAt = QDateTime::currentDateTimeUtc().addMSecs(delay);
        qDebug() << "TransferQueue:" << item.id << "failed with" << errorKindToString(kind)
                 << "- retry" << item.retryCount << "of" << item.maxRetries << "in" << delay << "ms";
    } else {
        qWarning() << "TransferQueue:" << item.id << item.fileName << "failed:"
                   << errorKindToString(kind) << message;
        emit statusMessage(tr("Transfer of %1 failed: %2").arg(item.fileName, message), 5000);
    }

    notifyRowChanged(index);
    emitEvent(TransferEvent::Type::Failed, item);
    armRetryTimer();
    evictHistory();
}

void TransferQueue::requeueItem(int index)
{
    TransferItem &item = items_[index];
    item.status = TransferItem::Status::Queued;
    item.nextRetryAt = QDateTime();
    item.processedBytes = 0;
    item.progress = 0.0;
    item.errorKind = ErrorKind::None;
    item.errorMessage.clear();

    wasBusy_ = true;
    notifyRowChanged(index);
    emitEvent(TransferEvent::Type::Queued, item);
    scheduleProcessNext();
}

void TransferQueue::armRetryTimer()
{
    QDateTime earliest;
    for (const auto &item : items_) {
        if (item.isAwaitingRetry() && (!earliest.isValid() || item.nextRetryAt < earliest)) {
            earliest = item.nextRetryAt;
        }
    }

    if (!earliest.isValid()) {
        retryTimer_->stop();
        return;
    }
    const qint64 wait = QDateTime::currentDateTimeUtc().msecsTo(earliest);
    retryTimer_->start(static_cast<int>(qBound<qint64>(0, wait, retryMaxDelayMs_)));
}

void TransferQueue::onRetryTimer()
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    for (int i = 0; i < items_.size(); ++i) {
        if (items_[i].isAwaitingRetry() && items_[i].nextRetryAt <= now) {
            LOG_VERBOSE() << "TransferQueue: retrying" << items_[i].id;
            requeueItem(i);
        }
    }
    armRetryTimer();
}

bool TransferQueue::cancel(quint64 id)
{
    const int index = findItemIndex(id);
    if (index < 0 || items_[index].isTerminal()) {
        return false;
    }

    if (items_[index].status == TransferItem::Status::InProgress) {
        stopActive(id);
    }

    TransferItem &item = items_[index];
    item.status = TransferItem::Status::Cancelled;
    item.nextRetryAt = QDateTime();
    item.errorKind = ErrorKind::Cancelled;
    item.errorMessage = tr("Cancelled");

    qDebug() << "TransferQueue: cancelled" << id;
    notifyRowChanged(index);
    emitEvent(TransferEvent::Type::Cancelled, item);
    armRetryTimer();
    evictHistory();
    scheduleProcessNext();
    return true;
}

bool TransferQueue::retry(quint64 id)
{
    const int index = findItemIndex(id);
    if (index < 0 || items_[index].status != TransferItem::Status::Failed
        || !items_[index].isTerminal()) {
        return false;
    }

    requeueItem(index);
    armRetryTimer();
    return true;
}

bool TransferQueue::remove(quint64 id)
{
    if (findItemIndex(id) < 0) {
        return false;
    }
    cancel(id);

    // cancel() may have evicted it already
    const int index = findItemIndex(id);
    if (index >= 0) {
        beginRemoveRows(QModelIndex(), index, index);
        items_.removeAt(index);
        endRemoveRows();
        emit queueChanged();
    }
    return true;
}

bool TransferQueue::pause(quint64 id)
{
    const int index = findItemIndex(id);
    if (index < 0) {
        return false;
    }

    const TransferItem::Status status = items_[index].status;
    if (status != TransferItem::Status::Queued && status != TransferItem::Status::InProgress) {
        return false;
    }
    if (status == TransferItem::Status::InProgress) {
        stopActive(id);
    }

    items_[index].status = TransferItem::Status::Paused;
    qDebug() << "TransferQueue: paused" << id;
    notifyRowChanged(index);
    emit queueChanged();
    scheduleProcessNext();
    return true;
}

bool TransferQueue::resume(quint64 id)
{
    const int index = findItemIndex(id);
    if (index < 0 || items_[index].status != TransferItem::Status::Paused) {
        return false;
    }

    requeueItem(index);
    return true;
}

void TransferQueue::removeCompleted()
{
    for (int i = static_cast<int>(items_.size()) - 1; i >= 0; --i) {
        if (items_[i].isTerminal()) {
            beginRemoveRows(QModelIndex(), i, i);
            items_.removeAt(i);
            endRemoveRows();
        }
    }
    emit queueChanged();
}

void TransferQueue::cancelAll()
{
    QList<quint64> ids;
    for (const auto &item : items_) {
        if (!item.isTerminal()) {
            ids.append(item.id);
        }
    }

    for (quint64 id : ids) {
        cancel(id);
    }

    if (!ids.isEmpty()) {
        emit statusMessage(tr("Cancelled %n transfer(s)", nullptr, static_cast<int>(ids.size())), 3000);
    }
}

void TransferQueue::evictHistory()
{
    while (items_.size() > maxHistory_) {
        int oldest = -1;
        for (int i = 0; i < items_.size(); ++i) {
            if (items_[i].isTerminal()) {
                oldest = i;
                break;
            }
        }
        if (oldest < 0) {
            return;
        }
        LOG_VERBOSE() << "TransferQueue: evicting" << items_[oldest].id << "from history";
        beginRemoveRows(QModelIndex(), oldest, oldest);
        items_.removeAt(oldest);
        endRemoveRows();
    }
}

void TransferQueue::checkIdle()
{
    const bool busy = !isIdle();
    if (wasBusy_ && !busy) {
        qDebug() << "TransferQueue: all operations completed";
        wasBusy_ = false;
        emit allOperationsCompleted();
        return;
    }
    wasBusy_ = busy;
}

void TransferQueue::notifyRowChanged(int index)
{
    const QModelIndex modelIndex = createIndex(index, 0);
    emit dataChanged(modelIndex, modelIndex);
}

void TransferQueue::emitEvent(TransferEvent::Type type, const TransferItem &item)
{
    TransferEvent event;
    event.type = type;
    event.itemId = item.id;
    event.driveId = item.driveId;
    event.bytes = item.processedBytes;
    event.totalBytes = item.totalBytes;
    event.progress = item.progress;
    event.errorKind = item.errorKind;
    event.message = item.errorMessage;
    event.willRetry = item.isAwaitingRetry();
    emit transferEvent(event);
}

int TransferQueue::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return static_cast<int>(items_.size());
}

QVariant TransferQueue::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= items_.size()) {
        return QVariant();
    }

    const TransferItem &item = items_[index.row()];

    switch (role) {
    case Qt::DisplayRole:
    case FileNameRole:
        return item.fileName;
    case LocalPathRole:
        return item.localPath;
    case RemotePathRole:
        return item.remotePath;
    case DirectionRole:
        return static_cast<int>(item.direction);
    case StatusRole:
        return static_cast<int>(item.status);
    case PriorityRole:
        return static_cast<int>(item.priority);
    case ProgressRole:
        return item.progress;
    case BytesTransferredRole:
        return item.processedBytes;
    case TotalBytesRole:
        return item.totalBytes;
    case ErrorMessageRole:
        return item.errorMessage;
    case RetryCountRole:
        return item.retryCount;
    }

    return QVariant();
}

QHash<int, QByteArray> TransferQueue::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles[FileNameRole] = "fileName";
    roles[LocalPathRole] = "localPath";
    roles[RemotePathRole] = "remotePath";
    roles[DirectionRole] = "direction";
    roles[StatusRole] = "status";
    roles[PriorityRole] = "priority";
    roles[ProgressRole] = "progress";
    roles[BytesTransferredRole] = "bytesTransferred";
    roles[TotalBytesRole] = "totalBytes";
    roles[ErrorMessageRole] = "errorMessage";
    roles[RetryCountRole] = "retryCount";
    return roles;
}
