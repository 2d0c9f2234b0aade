#include <qt6entitlements/abstractplatformstore.h>
#include <qt6entitlements/catalogloader.h>
#include <qt6entitlements/entitlementstore.h>
#include <qt6entitlements/purchaseinitiator.h>
#include <qt6entitlements/transactionverifier.h>

#include <QDebug>
#include <QTimer>

PurchaseInitiator::PurchaseInitiator(AbstractPlatformStore * platform, const TransactionVerifier * verifier,
                                     CatalogLoader * catalog, EntitlementStore * store, QObject * parent)
    : QObject(parent)
    , _platform(platform)
    , _verifier(verifier)
    , _catalog(catalog)
    , _store(store)
{
    Q_ASSERT(_platform);
    Q_ASSERT(_verifier);
    Q_ASSERT(_catalog);
    Q_ASSERT(_store);
}

void PurchaseInitiator::purchase(const QString &productId, QObject * context, PurchaseCallback callback)
{
    if (!context)
        context = this;

    if (!_catalog->configuration().contains(productId)) {
        qWarning() << "Cannot purchase - product id is not configured:" << productId;
        reject(context, callback, StoreError(StoreError::ProductNotFound,
                                             QString("Product ID '%1' is not in the configuration").arg(productId)));
        return;
    }

    if (!_catalog->contains(productId)) {
        qWarning() << "Cannot purchase - product is not in the loaded catalog:" << productId;
        reject(context, callback, StoreError(StoreError::ProductNotFound, productId));
        return;
    }

    if (_attempts.contains(productId)) {
        qWarning() << "Cannot purchase - purchase already in progress for" << productId;
        reject(context, callback, StoreError(StoreError::PurchaseInProgress, productId));
        return;
    }

    if (!_platform->canMakePurchases()) {
        qWarning() << "Cannot purchase - store does not allow purchases";
        reject(context, callback, StoreError(StoreError::PurchaseFailed,
                                             StoreError::codeDescription(StoreError::NotAllowed)));
        return;
    }

    const quint64 serial = ++_nextSerial;
    _attempts.insert(productId, Attempt{serial, QPointer<QObject>(context), callback});
    qDebug() << "Submitting purchase of" << productId << "attempt" << serial;
    emit stateChanged(productId, AwaitingPlatformResponse);

    _platform->submitPurchase(productId, this, [this, productId, serial](const PlatformPurchaseOutcome &outcome) {
        onPlatformOutcome(productId, serial, outcome);
    });
}

void PurchaseInitiator::onPlatformOutcome(const QString &productId, quint64 serial, const PlatformPurchaseOutcome &outcome)
{
    const auto it = _attempts.constFind(productId);
    if (it == _attempts.constEnd() || it->serial != serial) {
        qWarning() << "Ignoring duplicate platform outcome for" << productId << "attempt" << serial;
        return;
    }

    PurchaseOutcome result;
    switch (outcome.status) {
        case PlatformPurchaseOutcome::Success: {
            Transaction transaction;
            QString reason;
            if (!_verifier->verify(outcome.transaction, &transaction, &reason)) {
                // The platform reported success but the verifier is the trust boundary
                qWarning() << "Purchase of" << productId << "reported success but failed verification:" << reason;
                result.status = PurchaseOutcome::Failed;
                result.error = StoreError(StoreError::PurchaseFailed,
                                          QString("%1: %2").arg(StoreError::codeDescription(StoreError::VerificationFailed), reason));
                complete(productId, serial, result);
                return;
            }
            if (transaction.productId != productId) {
                qCritical() << "Verified transaction" << transaction.transactionId << "is for" << transaction.productId
                            << "but the purchase was for" << productId;
                result.status = PurchaseOutcome::Failed;
                result.error = StoreError(StoreError::PurchaseFailed, "Transaction does not match the purchased product");
                complete(productId, serial, result);
                return;
            }
            onVerifiedPurchase(productId, serial, transaction);
            return;
        }
        case PlatformPurchaseOutcome::UserCancelled:
            qDebug() << "Purchase of" << productId << "cancelled by user";
            result.status = PurchaseOutcome::UserCancelled;
            result.error = StoreError(StoreError::UserCancelled);
            break;
        case PlatformPurchaseOutcome::Pending:
            qDebug() << "Purchase of" << productId << "is pending approval";
            result.status = PurchaseOutcome::Pending;
            result.error = StoreError(StoreError::Pending);
            break;
        case PlatformPurchaseOutcome::Failed:
            qWarning() << "Purchase of" << productId << "failed:" << outcome.error;
            result.status = PurchaseOutcome::Failed;
            result.error = StoreError(StoreError::PurchaseFailed, outcome.error.description(), outcome.error.platformCode);
            break;
        case PlatformPurchaseOutcome::Unknown:
            qWarning() << "Purchase of" << productId << "returned an unknown outcome";
            result.status = PurchaseOutcome::Failed;
            result.error = StoreError(StoreError::UnknownPurchaseOutcome, productId);
            break;
    }

    complete(productId, serial, result);
}

void PurchaseInitiator::onVerifiedPurchase(const QString &productId, quint64 serial, const Transaction &transaction)
{
    qDebug() << "Purchase of" << productId << "verified, transaction" << transaction.transactionId;

    _platform->finishTransaction(transaction.transactionId, this, [this, productId, serial, transaction](const StoreError &finishError) {
        if (finishError.isError()) {
            // Unfinished transactions are redelivered through the update stream
            qWarning() << "Failed to finish transaction" << transaction.transactionId << finishError;
        }

        // Ownership must reflect the purchase before the caller hears about it
        _store->refresh(this, [this, productId, serial, transaction](const StoreError &refreshError) {
            if (refreshError.isError())
                qWarning() << "Entitlement refresh after purchase of" << productId << "failed:" << refreshError;

            PurchaseOutcome result;
            result.status = PurchaseOutcome::Succeeded;
            result.result.productId = transaction.productId;
            result.result.transactionId = transaction.transactionId;
            result.result.purchaseDate = transaction.purchaseDate;
            result.result.successful = true;
            complete(productId, serial, result);
        });
    });
}

void PurchaseInitiator::complete(const QString &productId, quint64 serial, const PurchaseOutcome &outcome)
{
    const auto it = _attempts.find(productId);
    if (it == _attempts.end() || it->serial != serial)
        return;

    const Attempt attempt = it.value();
    _attempts.erase(it);

    State terminal = Failed;
    switch (outcome.status) {
        case PurchaseOutcome::Succeeded:
            terminal = Succeeded;
            break;
        case PurchaseOutcome::UserCancelled:
            terminal = UserCancelled;
            break;
        case PurchaseOutcome::Pending:
            terminal = Pending;
            break;
        case PurchaseOutcome::Failed:
            terminal = Failed;
            break;
    }

    emit stateChanged(productId, terminal);
    emit stateChanged(productId, Idle);

    if (attempt.context)
        attempt.callback(outcome);
}

void PurchaseInitiator::reject(QObject * context, const PurchaseCallback &callback, const StoreError &error)
{
    PurchaseOutcome outcome;
    outcome.status = PurchaseOutcome::Failed;
    outcome.error = error;
    QTimer::singleShot(0, context, [callback, outcome]() {
        callback(outcome);
    });
}

PurchaseInitiator::State PurchaseInitiator::state(const QString &productId) const
{
    return _attempts.contains(productId) ? AwaitingPlatformResponse : Idle;
}
