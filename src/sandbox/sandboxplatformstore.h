#ifndef SANDBOXPLATFORMSTORE_H
#define SANDBOXPLATFORMSTORE_H

#include <qt6entitlements/abstractplatformstore.h>

#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QPointer>

// In-process store used for local testing: serves a catalog loaded from a
// store file, signs the transactions it creates with its own key and keeps
// the user's ledger in memory. Out-of-band events (approvals, renewals,
// refunds, purchases on another device) are triggered explicitly and pushed
// through transactionUpdated().
class SandboxPlatformStore : public AbstractPlatformStore
{
    Q_OBJECT
    QML_NAMED_ELEMENT(SandboxStore)

    Q_PROPERTY(QString catalogFile READ catalogFile WRITE setCatalogFile NOTIFY catalogFileChanged)
    Q_PROPERTY(int responseDelay READ responseDelay WRITE setResponseDelay NOTIFY responseDelayChanged)

public:
    enum Operation {
        FetchProducts,
        SubmitPurchase,
        FinishTransaction,
        CurrentEntitlements,
        TransactionHistory,
        SubscriptionStatus
    };
    Q_ENUM(Operation)

    enum PurchaseBehavior {
        Approve,
        Cancel,
        AskToBuy,           // answered Pending, completes later via approvePendingPurchase()
        Decline,            // answered Failed with the configured failure
        ReturnUnknown,
        ApproveUnverified   // answered Success with a forged signature
    };
    Q_ENUM(PurchaseBehavior)

    explicit SandboxPlatformStore(QObject * parent = nullptr);
    SandboxPlatformStore(const QByteArray &signingKey, QObject * parent = nullptr);

    QByteArray signingKey() const { return _signingKey; }
    void setSigningKey(const QByteArray &key);

    // Catalog
    QString catalogFile() const { return _catalogFile; }
    void setCatalogFile(const QString &path);
    bool loadCatalog(const QJsonObject &json, QString * errorMessage = nullptr);
    void addProduct(const Product &product);
    QList<Product> catalog() const { return _catalog; }

    // Behavior knobs
    int responseDelay() const { return _responseDelay; }
    void setResponseDelay(int milliseconds);
    void setCanMakePurchases(bool allowed);
    void setPurchaseBehavior(const QString &productId, PurchaseBehavior behavior);
    void setDefaultPurchaseBehavior(PurchaseBehavior behavior);
    void setFailure(Operation operation, const StoreError &error);
    void clearFailure(Operation operation);
    void setHoldPurchases(bool hold);
    int heldPurchaseCount() const { return _heldPurchases.size(); }
    bool resolveHeldPurchase(const QString &productId);
    void setCurrentDateTime(const QDateTime &dateTime);
    int requestCount(Operation operation) const { return _requestCounts.value(operation); }

    // Out-of-band events, each pushed through transactionUpdated()
    QString grant(const QString &productId, bool notify = true);
    bool approvePendingPurchase(const QString &productId);
    bool revoke(const QString &transactionId);
    QString renew(const QString &productId);
    bool expire(const QString &productId);
    void setSubscriptionState(const QString &productId, ActiveSubscription::State state);
    void pushForgedUpdate(const QString &productId);
    void addForgedLedgerEntry(const QString &productId);

    // Ledger inspection
    QList<Transaction> transactions() const;
    bool isFinished(const QString &transactionId) const;
    QStringList unfinishedTransactionIds() const;

    // AbstractPlatformStore
    bool canMakePurchases() const override { return _canMakePurchases; }
    void fetchProducts(const QStringList &productIds, QObject * context, ProductsCallback callback) override;
    void submitPurchase(const QString &productId, QObject * context, PurchaseCallback callback) override;
    void finishTransaction(const QString &transactionId, QObject * context, FinishCallback callback) override;
    void queryCurrentEntitlements(QObject * context, LedgerCallback callback) override;
    void queryTransactionHistory(QObject * context, LedgerCallback callback) override;
    void querySubscriptionStates(const QStringList &productIds, QObject * context,
                                 SubscriptionStatesCallback callback) override;

signals:
    void catalogFileChanged();
    void responseDelayChanged();

private:
    struct Record {
        Transaction transaction;
        bool finished = false;
    };

    struct HeldPurchase {
        QString productId;
        QPointer<QObject> context;
        PurchaseCallback callback;
    };

    template <typename Functor>
    void respond(QObject * context, Functor functor);

    bool failureFor(Operation operation, StoreError * error);
    void countRequest(Operation operation);
    PlatformPurchaseOutcome processPurchase(const QString &productId);
    Record createTransaction(const Product &product, const QString &originalTransactionId = QString());
    SignedTransaction sign(const Transaction &transaction) const;
    Product productFor(const QString &productId) const;
    const Record * latestRecord(const QString &productId) const;
    bool isCurrentEntitlement(const Record &record) const;
    ActiveSubscription::State computedState(const QString &productId) const;
    QDateTime now() const;

    QByteArray _signingKey;
    QString _catalogFile;
    QList<Product> _catalog;
    QList<Record> _ledger;
    QList<SignedTransaction> _forgedLedgerEntries;
    QHash<QString, ActiveSubscription::State> _stateOverrides;
    QHash<QString, PurchaseBehavior> _behaviors;
    PurchaseBehavior _defaultBehavior = Approve;
    QHash<int, StoreError> _failures;
    QHash<int, int> _requestCounts;
    QList<HeldPurchase> _heldPurchases;
    QStringList _awaitingApproval;
    QDateTime _now;
    int _responseDelay = 0;
    bool _canMakePurchases = true;
    bool _holdPurchases = false;
    quint64 _nextTransaction = 1000;
};

#endif // SANDBOXPLATFORMSTORE_H
