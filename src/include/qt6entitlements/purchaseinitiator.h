#ifndef PURCHASEINITIATOR_H
#define PURCHASEINITIATOR_H

#include <QHash>
#include <QObject>
#include <QPointer>

#include <functional>

#include <qt6entitlements/storeerror.h>
#include <qt6entitlements/transaction.h>

class AbstractPlatformStore;
class CatalogLoader;
class EntitlementStore;
class TransactionVerifier;
struct PlatformPurchaseOutcome;

struct PurchaseOutcome
{
    enum Status {
        Succeeded,
        UserCancelled,
        Pending,
        Failed
    };

    Status status = Failed;
    PurchaseResult result;  // set when Succeeded
    StoreError error;
};

class PurchaseInitiator : public QObject
{
    Q_OBJECT

public:
    enum State {
        Idle,
        AwaitingPlatformResponse,
        Succeeded,
        UserCancelled,
        Pending,
        Failed
    };
    Q_ENUM(State)

    using PurchaseCallback = std::function<void(const PurchaseOutcome &outcome)>;

    PurchaseInitiator(AbstractPlatformStore * platform, const TransactionVerifier * verifier,
                      CatalogLoader * catalog, EntitlementStore * store, QObject * parent = nullptr);

    // At most one attempt per product identifier runs at a time; a second
    // request for the same identifier is rejected with PurchaseInProgress.
    void purchase(const QString &productId, QObject * context, PurchaseCallback callback);

    State state(const QString &productId) const;
    bool isPurchasing(const QString &productId) const { return _attempts.contains(productId); }
    bool isPurchasing() const { return !_attempts.isEmpty(); }

signals:
    void stateChanged(const QString &productId, PurchaseInitiator::State state);

private:
    struct Attempt {
        quint64 serial = 0;
        QPointer<QObject> context;
        PurchaseCallback callback;
    };

    void onPlatformOutcome(const QString &productId, quint64 serial, const PlatformPurchaseOutcome &outcome);
    void onVerifiedPurchase(const QString &productId, quint64 serial, const Transaction &transaction);
    void complete(const QString &productId, quint64 serial, const PurchaseOutcome &outcome);
    void reject(QObject * context, const PurchaseCallback &callback, const StoreError &error);

    AbstractPlatformStore * _platform = nullptr;
    const TransactionVerifier * _verifier = nullptr;
    CatalogLoader * _catalog = nullptr;
    EntitlementStore * _store = nullptr;

    QHash<QString, Attempt> _attempts;
    quint64 _nextSerial = 0;
};

#endif // PURCHASEINITIATOR_H
