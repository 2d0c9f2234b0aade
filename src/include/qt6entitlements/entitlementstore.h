#ifndef ENTITLEMENTSTORE_H
#define ENTITLEMENTSTORE_H

#include <QList>
#include <QObject>
#include <QPointer>
#include <QReadWriteLock>
#include <QSet>
#include <QStringList>

#include <functional>

#include <qt6entitlements/activesubscription.h>
#include <qt6entitlements/entitlementpolicy.h>
#include <qt6entitlements/product.h>
#include <qt6entitlements/storeerror.h>

class AbstractPlatformStore;
class TransactionVerifier;

// Owned products, derived only by replaying the platform's current
// entitlements ledger. refresh() is the single write path and must be called
// from the thread the store lives in; the read accessors are thread-safe and
// always see one complete replay.
class EntitlementStore : public QObject
{
    Q_OBJECT

    Q_PROPERTY(QStringList ownedProductIds READ ownedProductIds NOTIFY entitlementsChanged)
    Q_PROPERTY(bool refreshing READ isRefreshing NOTIFY refreshingChanged)

public:
    using RefreshCallback = std::function<void(const StoreError &error)>;

    EntitlementStore(AbstractPlatformStore * platform, const TransactionVerifier * verifier, QObject * parent = nullptr);

    // Products known from the last catalog load; used to tag owned
    // subscriptions.
    void setCatalog(const QList<Product> &products);
    void setPolicy(const EntitlementPolicy &policy);

    // Requests a ledger replay. Calls made while a replay is running are
    // coalesced into a single follow-up replay; `callback` runs once the
    // first replay started after this call has finished.
    void refresh(QObject * context = nullptr, RefreshCallback callback = RefreshCallback());

    bool isOwned(const QString &productId) const;
    QStringList ownedProductIds() const;
    QList<ActiveSubscription> currentSubscriptions() const;
    ActiveSubscription::State subscriptionState(const QString &productId) const;
    bool hasPremium() const;
    bool hasRemovedAds() const;

    bool isRefreshing() const { return _replayInFlight; }
    int completedReplays() const { return _completedReplays; }

signals:
    void entitlementsChanged();
    void refreshingChanged();
    void refreshFinished(const StoreError &error);

private:
    struct Waiter {
        QPointer<QObject> context;
        RefreshCallback callback;
    };

    void startReplay();
    void onLedgerReceived(const QList<SignedTransaction> &ledger, const StoreError &error, const QList<Waiter> &waiters);
    void commit(const QSet<QString> &owned, const QList<ActiveSubscription> &subscriptions);
    void finishReplay(const StoreError &error, const QList<Waiter> &waiters);

    AbstractPlatformStore * _platform = nullptr;
    const TransactionVerifier * _verifier = nullptr;

    mutable QReadWriteLock _lock;
    QSet<QString> _owned;
    QList<ActiveSubscription> _subscriptions;
    QList<Product> _catalog;
    EntitlementPolicy _policy;

    bool _replayInFlight = false;
    bool _replayQueued = false;
    QList<Waiter> _waiting;
    int _completedReplays = 0;
};

#endif // ENTITLEMENTSTORE_H
