#ifndef ENTITLEMENTENGINE_H
#define ENTITLEMENTENGINE_H

#include <QByteArray>
#include <QObject>

#include <qt6entitlements/storeconfiguration.h>
#include <qt6entitlements/transactionverifier.h>

class AbstractPlatformStore;
class CatalogLoader;
class EntitlementStore;
class PurchaseInitiator;
class RestorationFlow;
class TransactionListener;

// Owns one instance of every purchasing component, wired to a single
// platform store. Construct one per application (or per test); nothing here
// is global.
class EntitlementEngine : public QObject
{
    Q_OBJECT

public:
    EntitlementEngine(AbstractPlatformStore * platform, const StoreConfiguration &configuration,
                      const QByteArray &signingKey, QObject * parent = nullptr);
    ~EntitlementEngine() override;

    // Starts the transaction listener. Call once, after construction.
    bool start();
    // Stops the transaction listener. Call once, before teardown.
    bool shutdown();

    AbstractPlatformStore * platform() const { return _platform; }
    const StoreConfiguration &configuration() const { return _configuration; }
    const TransactionVerifier * verifier() const { return &_verifier; }
    EntitlementStore * entitlements() const { return _entitlements; }
    CatalogLoader * catalog() const { return _catalog; }
    PurchaseInitiator * purchases() const { return _purchases; }
    RestorationFlow * restoration() const { return _restoration; }
    TransactionListener * listener() const { return _listener; }

private:
    AbstractPlatformStore * _platform = nullptr;
    const StoreConfiguration _configuration;
    const TransactionVerifier _verifier;

    EntitlementStore * _entitlements = nullptr;
    CatalogLoader * _catalog = nullptr;
    PurchaseInitiator * _purchases = nullptr;
    RestorationFlow * _restoration = nullptr;
    TransactionListener * _listener = nullptr;
};

#endif // ENTITLEMENTENGINE_H
