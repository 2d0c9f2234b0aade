#include <qt6entitlements/abstractplatformstore.h>
#include <qt6entitlements/entitlementstore.h>
#include <qt6entitlements/transactionlistener.h>
#include <qt6entitlements/transactionverifier.h>

#include <QDebug>

TransactionListener::TransactionListener(AbstractPlatformStore * platform, const TransactionVerifier * verifier,
                                         EntitlementStore * store, QObject * parent)
    : QObject(parent)
    , _platform(platform)
    , _verifier(verifier)
    , _store(store)
{
    Q_ASSERT(_platform);
    Q_ASSERT(_verifier);
    Q_ASSERT(_store);
}

TransactionListener::~TransactionListener()
{
    if (_state == Listening)
        stop();
}

bool TransactionListener::start()
{
    if (_state != NotStarted) {
        qWarning() << "Transaction listener can only be started once, state:" << _state;
        return false;
    }

    // Queued: every update is handled as its own task on the event loop
    _connection = connect(_platform, &AbstractPlatformStore::transactionUpdated,
                          this, &TransactionListener::onTransactionUpdated, Qt::QueuedConnection);
    _state = Listening;
    qDebug() << "Transaction listener started";
    emit listeningChanged();
    return true;
}

bool TransactionListener::stop()
{
    if (_state != Listening) {
        qWarning() << "Transaction listener is not running, state:" << _state;
        return false;
    }

    disconnect(_connection);
    _state = Stopped;
    qDebug() << "Transaction listener stopped";
    emit listeningChanged();
    return true;
}

void TransactionListener::onTransactionUpdated(const SignedTransaction &envelope)
{
    if (_state != Listening)
        return;

    Transaction transaction;
    QString reason;
    if (!_verifier->verify(envelope, &transaction, &reason)) {
        // Left unfinished on purpose: the platform may redeliver it, it never grants anything
        qWarning() << "Transaction update failed verification, dropping:" << reason;
        emit transactionRejected(reason);
        return;
    }

    qDebug() << "Transaction update:" << transaction.transactionId << "for" << transaction.productId
             << (transaction.isRevoked() ? "(revoked)" : "");
    emit transactionVerified(transaction);

    const QString transactionId = transaction.transactionId;
    _store->refresh(this, [this, transactionId](const StoreError &error) {
        if (error.isError()) {
            qWarning() << "Entitlement refresh failed after update" << transactionId
                       << "- leaving it unfinished for redelivery:" << error;
            return;
        }

        _platform->finishTransaction(transactionId, this, [this, transactionId](const StoreError &finishError) {
            if (finishError.isError()) {
                qWarning() << "Failed to finish transaction" << transactionId << finishError;
                return;
            }
            qDebug() << "Finished transaction" << transactionId;
            emit transactionFinished(transactionId);
        });
    });
}
