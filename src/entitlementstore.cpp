#include <qt6entitlements/abstractplatformstore.h>
#include <qt6entitlements/entitlementstore.h>
#include <qt6entitlements/transactionverifier.h>

#include <QDebug>
#include <QHash>
#include <QReadLocker>
#include <QWriteLocker>

#include <algorithm>

EntitlementStore::EntitlementStore(AbstractPlatformStore * platform, const TransactionVerifier * verifier, QObject * parent)
    : QObject(parent)
    , _platform(platform)
    , _verifier(verifier)
{
    Q_ASSERT(_platform);
    Q_ASSERT(_verifier);
}

void EntitlementStore::setCatalog(const QList<Product> &products)
{
    QWriteLocker locker(&_lock);
    _catalog = products;
}

void EntitlementStore::setPolicy(const EntitlementPolicy &policy)
{
    {
        QWriteLocker locker(&_lock);
        _policy = policy;
    }
    emit entitlementsChanged();
}

void EntitlementStore::refresh(QObject * context, RefreshCallback callback)
{
    if (callback)
        _waiting.append(Waiter{QPointer<QObject>(context ? context : this), callback});

    if (_replayInFlight) {
        qDebug() << "Entitlement replay already running - queueing one follow-up replay";
        _replayQueued = true;
        return;
    }

    startReplay();
}

void EntitlementStore::startReplay()
{
    const QList<Waiter> waiters = _waiting;
    _waiting.clear();
    _replayQueued = false;
    _replayInFlight = true;
    emit refreshingChanged();

    qDebug() << "Replaying current entitlements ledger";
    _platform->queryCurrentEntitlements(this, [this, waiters](const QList<SignedTransaction> &ledger, const StoreError &error) {
        onLedgerReceived(ledger, error, waiters);
    });
}

void EntitlementStore::onLedgerReceived(const QList<SignedTransaction> &ledger, const StoreError &error, const QList<Waiter> &waiters)
{
    if (error.isError()) {
        qWarning() << "Current entitlements query failed, keeping previous entitlements:" << error;
        finishReplay(error, waiters);
        return;
    }

    QSet<QString> owned;
    int rejected = 0;
    for (const SignedTransaction &envelope : ledger) {
        Transaction transaction;
        QString reason;
        if (!_verifier->verify(envelope, &transaction, &reason)) {
            // One bad record only excludes itself
            qWarning() << "Dropping unverified ledger entry:" << reason;
            ++rejected;
            continue;
        }

        if (transaction.isRevoked()) {
            qDebug() << "Skipping revoked transaction" << transaction.transactionId
                     << "for" << transaction.productId;
            continue;
        }

        owned.insert(transaction.productId);
    }

    qDebug() << "Ledger replay found" << owned.size() << "owned product(s)," << rejected << "rejected entry(ies)";

    QList<Product> catalog;
    {
        QReadLocker locker(&_lock);
        catalog = _catalog;
    }

    QList<ActiveSubscription> subscriptions;
    QStringList renewableIds;
    for (const Product &product : catalog) {
        if (!product.isSubscription() || !owned.contains(product.identifier))
            continue;

        ActiveSubscription subscription;
        subscription.product = product;
        // A non-renewing subscription is reported by the ledger only while valid
        subscription.state = ActiveSubscription::Subscribed;
        subscriptions.append(subscription);
        if (product.kind == Product::AutoRenewable)
            renewableIds.append(product.identifier);
    }

    if (renewableIds.isEmpty()) {
        commit(owned, subscriptions);
        finishReplay(StoreError(), waiters);
        return;
    }

    _platform->querySubscriptionStates(renewableIds, this,
            [this, owned, subscriptions, waiters](const QHash<QString, ActiveSubscription::State> &states, const StoreError &statusError) {
        QList<ActiveSubscription> tagged = subscriptions;
        if (statusError.isError())
            qWarning() << "Subscription status query failed, keeping last known states:" << statusError;

        for (ActiveSubscription &subscription : tagged) {
            if (subscription.product.kind != Product::AutoRenewable)
                continue;

            const QString id = subscription.product.identifier;
            if (states.contains(id)) {
                subscription.state = states.value(id);
            } else {
                const ActiveSubscription::State previous = subscriptionState(id);
                if (previous != ActiveSubscription::NotSubscribed)
                    subscription.state = previous;
            }
        }

        commit(owned, tagged);
        finishReplay(StoreError(), waiters);
    });
}

void EntitlementStore::commit(const QSet<QString> &owned, const QList<ActiveSubscription> &subscriptions)
{
    bool changed = false;
    {
        QWriteLocker locker(&_lock);
        changed = (_owned != owned) || (_subscriptions != subscriptions);
        _owned = owned;
        _subscriptions = subscriptions;
    }

    if (changed) {
        qDebug() << "Entitlements changed:" << ownedProductIds();
        emit entitlementsChanged();
    }
}

void EntitlementStore::finishReplay(const StoreError &error, const QList<Waiter> &waiters)
{
    _replayInFlight = false;
    ++_completedReplays;

    // Start the coalesced follow-up before notifying, so a callback that
    // refreshes again joins it instead of racing it.
    if (_replayQueued)
        startReplay();
    else
        emit refreshingChanged();

    emit refreshFinished(error);

    for (const Waiter &waiter : waiters) {
        if (waiter.context)
            waiter.callback(error);
    }
}

bool EntitlementStore::isOwned(const QString &productId) const
{
    QReadLocker locker(&_lock);
    return _owned.contains(productId);
}

QStringList EntitlementStore::ownedProductIds() const
{
    QStringList ids;
    {
        QReadLocker locker(&_lock);
        ids = QStringList(_owned.cbegin(), _owned.cend());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

QList<ActiveSubscription> EntitlementStore::currentSubscriptions() const
{
    QReadLocker locker(&_lock);
    return _subscriptions;
}

ActiveSubscription::State EntitlementStore::subscriptionState(const QString &productId) const
{
    QReadLocker locker(&_lock);
    for (const ActiveSubscription &subscription : _subscriptions) {
        if (subscription.product.identifier == productId)
            return subscription.state;
    }
    return ActiveSubscription::NotSubscribed;
}

bool EntitlementStore::hasPremium() const
{
    QReadLocker locker(&_lock);
    return _policy.hasPremium(_owned, _subscriptions);
}

bool EntitlementStore::hasRemovedAds() const
{
    QReadLocker locker(&_lock);
    return _policy.hasRemovedAds(_owned, _subscriptions);
}
