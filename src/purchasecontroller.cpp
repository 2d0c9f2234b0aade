#include <qt6entitlements/catalogloader.h>
#include <qt6entitlements/entitlementengine.h>
#include <qt6entitlements/entitlementstore.h>
#include <qt6entitlements/purchasecontroller.h>
#include <qt6entitlements/purchaseinitiator.h>
#include <qt6entitlements/restorationflow.h>
#include <qt6entitlements/telemetrysink.h>

#include <QDebug>

namespace {

// Wrapping codes already carry the platform's own description
QString failureReason(const StoreError &error)
{
    const bool wrapped = error.code == StoreError::PurchaseFailed || error.code == StoreError::RestoreFailed;
    if (wrapped && !error.message.isEmpty())
        return error.message;
    return error.description();
}

} // namespace

PurchaseController::PurchaseController(EntitlementEngine * engine, TelemetrySink * telemetry, QObject * parent)
    : QObject(parent)
    , _engine(engine)
    , _telemetry(telemetry)
{
    Q_ASSERT(_engine);

    connect(_engine->entitlements(), &EntitlementStore::entitlementsChanged, this, &PurchaseController::syncEntitlements);
    syncEntitlements();
}

QList<Product> PurchaseController::subscriptionProducts() const
{
    QList<Product> result;
    for (const Product &product : _products) {
        if (product.kind == Product::AutoRenewable)
            result.append(product);
    }
    return result;
}

QList<Product> PurchaseController::nonSubscriptionProducts() const
{
    QList<Product> result;
    for (const Product &product : _products) {
        if (product.kind != Product::AutoRenewable)
            result.append(product);
    }
    return result;
}

bool PurchaseController::isPurchased(const QString &productId) const
{
    return _ownedProductIds.contains(productId);
}

bool PurchaseController::isSubscriptionActive(const QString &productId) const
{
    for (const ActiveSubscription &subscription : _activeSubscriptions) {
        if (subscription.product.identifier == productId)
            return subscription.isActive();
    }
    return false;
}

void PurchaseController::onAppear()
{
    track("screen_view", {{"screen_name", "purchase_screen"}});
    loadCatalog();
}

void PurchaseController::loadCatalog()
{
    setLoadState(Loading);
    setError(StoreError(), QString());
    track("iap_load_started");

    _engine->catalog()->load(this, [this](const QList<Product> &products, const StoreError &error) {
        if (error.isError())
            onCatalogLoadFailed(error);
        else
            onCatalogLoaded(products);
    });
}

void PurchaseController::onCatalogLoaded(const QList<Product> &products)
{
    qDebug() << "Catalog loaded with" << products.size() << "product(s)";
    if (_products != products) {
        _products = products;
        emit productsChanged();
    }
    setLoadState(Loaded);
    syncEntitlements();
    track("iap_load_success", {{"product_count", static_cast<int>(products.size())}});
}

void PurchaseController::onCatalogLoadFailed(const StoreError &error)
{
    setLoadState(LoadFailed);
    setError(error, error.description());
    track("iap_load_failed", {{"error", error.description()}});
}

void PurchaseController::purchase(const QString &productId)
{
    // A duplicate request is still forwarded so the initiator can refuse it,
    // but it must not disturb the attempt already running.
    PurchaseInitiator * purchases = _engine->purchases();
    const bool duplicate = purchases->isPurchasing(productId);
    if (!duplicate) {
        setError(StoreError(), QString());
        setSuccessMessage(QString());
        setInfoMessage(QString());
    }

    track("iap_purchase_started", {{"product_id", productId}});

    purchases->purchase(productId, this, [this, productId](const PurchaseOutcome &outcome) {
        onPurchaseFinished(productId, outcome);
    });

    // Requests the initiator refuses never start an attempt
    if (!duplicate && purchases->isPurchasing(productId)) {
        _inFlightProductIds.append(productId);
        setPurchaseState(Purchasing, productId);
    }
}

void PurchaseController::onPurchaseFinished(const QString &productId, const PurchaseOutcome &outcome)
{
    if (outcome.error.code == StoreError::PurchaseInProgress) {
        setError(outcome.error, outcome.error.description());
        track("iap_purchase_failed", {{"product_id", productId}, {"error", outcome.error.description()}});
        return;
    }

    _inFlightProductIds.removeOne(productId);

    // Purchasing holds while any attempt is outstanding
    auto settle = [this](PurchaseState terminal) {
        if (_inFlightProductIds.isEmpty())
            setPurchaseState(terminal, QString());
        else
            setPurchaseState(Purchasing, _inFlightProductIds.last());
    };

    switch (outcome.status) {
        case PurchaseOutcome::Succeeded:
            settle(Purchased);
            setSuccessMessage("Purchase successful!");
            track("iap_purchase_success", {{"product_id", outcome.result.productId},
                                           {"transaction_id", outcome.result.transactionId}});
            break;
        case PurchaseOutcome::UserCancelled:
            // Not an error: no banner
            settle(Cancelled);
            track("iap_purchase_cancelled", {{"product_id", productId}});
            break;
        case PurchaseOutcome::Pending:
            settle(PendingApproval);
            setInfoMessage("Your purchase is waiting for approval. It will unlock once approved.");
            track("iap_purchase_pending", {{"product_id", productId}});
            break;
        case PurchaseOutcome::Failed:
            settle(PurchaseFailed);
            setError(outcome.error, QString("Purchase failed: %1").arg(failureReason(outcome.error)));
            track("iap_purchase_failed", {{"product_id", productId}, {"error", failureReason(outcome.error)}});
            break;
    }

    _engine->entitlements()->refresh();
}

void PurchaseController::restore()
{
    if (!_restoring) {
        _restoring = true;
        emit restoringChanged();
    }
    setError(StoreError(), QString());
    track("iap_restore_started");

    _engine->restoration()->restore(this, [this](const QStringList &owned, const StoreError &error) {
        onRestoreFinished(owned, error);
    });
}

void PurchaseController::onRestoreFinished(const QStringList &restoredProductIds, const StoreError &error)
{
    if (!_engine->restoration()->isRestoring() && _restoring) {
        _restoring = false;
        emit restoringChanged();
    }

    if (error.isError()) {
        setError(error, QString("Restore failed: %1").arg(failureReason(error)));
        track("iap_restore_failed", {{"error", failureReason(error)}});
        return;
    }

    syncEntitlements();
    if (restoredProductIds.isEmpty())
        setSuccessMessage("No purchases found to restore.");
    else
        setSuccessMessage(QString("Restored %1 purchase(s).").arg(restoredProductIds.size()));
    track("iap_restore_success", {{"restored_count", static_cast<int>(restoredProductIds.size())}});
}

void PurchaseController::clearError()
{
    setError(StoreError(), QString());
}

void PurchaseController::clearSuccess()
{
    setSuccessMessage(QString());
    setInfoMessage(QString());
}

void PurchaseController::syncEntitlements()
{
    const EntitlementStore * store = _engine->entitlements();
    const QStringList owned = store->ownedProductIds();
    const QList<ActiveSubscription> subscriptions = store->currentSubscriptions();
    const bool premium = store->hasPremium();
    const bool removedAds = store->hasRemovedAds();

    if (owned == _ownedProductIds && subscriptions == _activeSubscriptions
        && premium == _hasPremium && removedAds == _hasRemovedAds)
        return;

    _ownedProductIds = owned;
    _activeSubscriptions = subscriptions;
    _hasPremium = premium;
    _hasRemovedAds = removedAds;
    emit entitlementsChanged();
}

void PurchaseController::setLoadState(LoadState state)
{
    if (_loadState == state)
        return;
    _loadState = state;
    emit loadStateChanged();
}

void PurchaseController::setPurchaseState(PurchaseState state, const QString &productId)
{
    if (_purchaseState == state && _purchasingProductId == productId)
        return;
    _purchaseState = state;
    _purchasingProductId = productId;
    emit purchaseStateChanged();
}

void PurchaseController::setError(const StoreError &error, const QString &message)
{
    if (_lastError == error && _errorMessage == message)
        return;
    _lastError = error;
    _errorMessage = message;
    emit messagesChanged();
}

void PurchaseController::setSuccessMessage(const QString &message)
{
    if (_successMessage == message)
        return;
    _successMessage = message;
    emit messagesChanged();
}

void PurchaseController::setInfoMessage(const QString &message)
{
    if (_infoMessage == message)
        return;
    _infoMessage = message;
    emit messagesChanged();
}

void PurchaseController::track(const QString &event, const QVariantMap &parameters)
{
    if (_telemetry)
        _telemetry->trackEvent(event, parameters);
}
