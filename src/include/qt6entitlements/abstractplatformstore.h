#ifndef ABSTRACTPLATFORMSTORE_H
#define ABSTRACTPLATFORMSTORE_H

#include <QHash>
#include <QList>
#include <QMetaObject>
#include <QObject>
#include <QPointer>
#include <QQmlEngine>
#include <QStringList>

#include <functional>

#include <qt6entitlements/activesubscription.h>
#include <qt6entitlements/product.h>
#include <qt6entitlements/storeerror.h>
#include <qt6entitlements/transaction.h>

struct PlatformPurchaseOutcome
{
    enum Status {
        Success,
        UserCancelled,
        Pending,
        Failed,
        Unknown
    };

    Status status = Unknown;
    SignedTransaction transaction;  // set on Success
    StoreError error;               // set on Failed
};

// The platform store API the engine talks to. Every request completes
// asynchronously: the callback is queued to the thread of `context` and is
// dropped if `context` is destroyed first. Transactions completed outside a
// foreground purchase (renewals, refunds, approvals, purchases made on
// another device) are pushed through transactionUpdated().
class AbstractPlatformStore : public QObject
{
    Q_OBJECT
    QML_NAMED_ELEMENT(AbstractPlatformStore)
    QML_UNCREATABLE("AbstractPlatformStore is an abstract base class")

    Q_PROPERTY(bool canMakePurchases READ canMakePurchases NOTIFY canMakePurchasesChanged FINAL)

public:
    using ProductsCallback = std::function<void(const QList<Product> &products, const StoreError &error)>;
    using PurchaseCallback = std::function<void(const PlatformPurchaseOutcome &outcome)>;
    using FinishCallback = std::function<void(const StoreError &error)>;
    using LedgerCallback = std::function<void(const QList<SignedTransaction> &ledger, const StoreError &error)>;
    using SubscriptionStatesCallback = std::function<void(const QHash<QString, ActiveSubscription::State> &states,
                                                          const StoreError &error)>;

    virtual bool canMakePurchases() const = 0;

    virtual void fetchProducts(const QStringList &productIds, QObject * context, ProductsCallback callback) = 0;
    virtual void submitPurchase(const QString &productId, QObject * context, PurchaseCallback callback) = 0;
    // Acknowledges a delivered transaction so the platform stops redelivering
    // it. Consumables are consumed by this call.
    virtual void finishTransaction(const QString &transactionId, QObject * context, FinishCallback callback) = 0;
    // Transactions that currently grant an entitlement: latest transaction of
    // each subscription, non-consumables, and unfinished consumables.
    virtual void queryCurrentEntitlements(QObject * context, LedgerCallback callback) = 0;
    // Every transaction ever made by the user, including revoked and expired.
    virtual void queryTransactionHistory(QObject * context, LedgerCallback callback) = 0;
    virtual void querySubscriptionStates(const QStringList &productIds, QObject * context,
                                         SubscriptionStatesCallback callback) = 0;

protected:
    explicit AbstractPlatformStore(QObject * parent = nullptr);

    template <typename Functor>
    static void deliver(QObject * context, Functor functor)
    {
        if (!context)
            return;
        QPointer<QObject> guard(context);
        QMetaObject::invokeMethod(context, [guard, functor]() {
            if (guard)
                functor();
        }, Qt::QueuedConnection);
    }

signals:
    void canMakePurchasesChanged();
    void transactionUpdated(const SignedTransaction &transaction);
};

#endif // ABSTRACTPLATFORMSTORE_H
