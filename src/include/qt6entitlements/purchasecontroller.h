#ifndef PURCHASECONTROLLER_H
#define PURCHASECONTROLLER_H

#include <QList>
#include <QObject>
#include <QQmlEngine>
#include <QStringList>
#include <QVariantMap>

#include <qt6entitlements/activesubscription.h>
#include <qt6entitlements/product.h>
#include <qt6entitlements/storeerror.h>

class EntitlementEngine;
class TelemetrySink;
struct PurchaseOutcome;

// The purchase screen's view model. Sequences catalog loads, purchases and
// restores on the engine and exposes the resulting state to QML. It never
// decides whether a purchase is genuine.
class PurchaseController : public QObject
{
    Q_OBJECT
    QML_NAMED_ELEMENT(PurchaseController)
    QML_UNCREATABLE("PurchaseController is created by the application")

    Q_PROPERTY(QList<Product> products READ products NOTIFY productsChanged)
    Q_PROPERTY(QList<Product> subscriptionProducts READ subscriptionProducts NOTIFY productsChanged)
    Q_PROPERTY(QList<Product> nonSubscriptionProducts READ nonSubscriptionProducts NOTIFY productsChanged)
    Q_PROPERTY(QStringList ownedProductIds READ ownedProductIds NOTIFY entitlementsChanged)
    Q_PROPERTY(QList<ActiveSubscription> activeSubscriptions READ activeSubscriptions NOTIFY entitlementsChanged)
    Q_PROPERTY(bool hasPremium READ hasPremium NOTIFY entitlementsChanged)
    Q_PROPERTY(bool hasRemovedAds READ hasRemovedAds NOTIFY entitlementsChanged)
    Q_PROPERTY(LoadState loadState READ loadState NOTIFY loadStateChanged)
    Q_PROPERTY(PurchaseState purchaseState READ purchaseState NOTIFY purchaseStateChanged)
    Q_PROPERTY(QString purchasingProductId READ purchasingProductId NOTIFY purchaseStateChanged)
    Q_PROPERTY(bool restoring READ isRestoring NOTIFY restoringChanged)
    Q_PROPERTY(StoreError lastError READ lastError NOTIFY messagesChanged)
    Q_PROPERTY(QString errorMessage READ errorMessage NOTIFY messagesChanged)
    Q_PROPERTY(QString successMessage READ successMessage NOTIFY messagesChanged)
    Q_PROPERTY(QString infoMessage READ infoMessage NOTIFY messagesChanged)

public:
    enum LoadState {
        NotLoaded,
        Loading,
        Loaded,
        LoadFailed
    };
    Q_ENUM(LoadState)

    enum PurchaseState {
        Idle,
        Purchasing,
        Purchased,
        Cancelled,
        PendingApproval,
        PurchaseFailed
    };
    Q_ENUM(PurchaseState)

    explicit PurchaseController(EntitlementEngine * engine, TelemetrySink * telemetry = nullptr, QObject * parent = nullptr);

    QList<Product> products() const { return _products; }
    QList<Product> subscriptionProducts() const;
    QList<Product> nonSubscriptionProducts() const;
    QStringList ownedProductIds() const { return _ownedProductIds; }
    QList<ActiveSubscription> activeSubscriptions() const { return _activeSubscriptions; }
    bool hasPremium() const { return _hasPremium; }
    bool hasRemovedAds() const { return _hasRemovedAds; }
    LoadState loadState() const { return _loadState; }
    PurchaseState purchaseState() const { return _purchaseState; }
    QString purchasingProductId() const { return _purchasingProductId; }
    bool isRestoring() const { return _restoring; }
    StoreError lastError() const { return _lastError; }
    QString errorMessage() const { return _errorMessage; }
    QString successMessage() const { return _successMessage; }
    QString infoMessage() const { return _infoMessage; }

    Q_INVOKABLE bool isPurchased(const QString &productId) const;
    Q_INVOKABLE bool isSubscriptionActive(const QString &productId) const;

    Q_INVOKABLE void onAppear();
    Q_INVOKABLE void loadCatalog();
    Q_INVOKABLE void purchase(const QString &productId);
    Q_INVOKABLE void restore();
    Q_INVOKABLE void clearError();
    Q_INVOKABLE void clearSuccess();

signals:
    void productsChanged();
    void entitlementsChanged();
    void loadStateChanged();
    void purchaseStateChanged();
    void restoringChanged();
    void messagesChanged();

private:
    void onCatalogLoaded(const QList<Product> &products);
    void onCatalogLoadFailed(const StoreError &error);
    void onPurchaseFinished(const QString &productId, const PurchaseOutcome &outcome);
    void onRestoreFinished(const QStringList &restoredProductIds, const StoreError &error);
    void syncEntitlements();

    void setLoadState(LoadState state);
    void setPurchaseState(PurchaseState state, const QString &productId);
    void setError(const StoreError &error, const QString &message);
    void setSuccessMessage(const QString &message);
    void setInfoMessage(const QString &message);
    void track(const QString &event, const QVariantMap &parameters = QVariantMap());

    EntitlementEngine * _engine = nullptr;
    TelemetrySink * _telemetry = nullptr;

    QList<Product> _products;
    QStringList _ownedProductIds;
    QList<ActiveSubscription> _activeSubscriptions;
    bool _hasPremium = false;
    bool _hasRemovedAds = false;
    LoadState _loadState = NotLoaded;
    PurchaseState _purchaseState = Idle;
    QString _purchasingProductId;
    QStringList _inFlightProductIds;
    bool _restoring = false;
    StoreError _lastError;
    QString _errorMessage;
    QString _successMessage;
    QString _infoMessage;
};

#endif // PURCHASECONTROLLER_H
