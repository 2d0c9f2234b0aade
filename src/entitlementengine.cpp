#include <qt6entitlements/abstractplatformstore.h>
#include <qt6entitlements/catalogloader.h>
#include <qt6entitlements/entitlementengine.h>
#include <qt6entitlements/entitlementpolicy.h>
#include <qt6entitlements/entitlementstore.h>
#include <qt6entitlements/purchaseinitiator.h>
#include <qt6entitlements/restorationflow.h>
#include <qt6entitlements/transactionlistener.h>

#include <QDebug>

EntitlementEngine::EntitlementEngine(AbstractPlatformStore * platform, const StoreConfiguration &configuration,
                                     const QByteArray &signingKey, QObject * parent)
    : QObject(parent)
    , _platform(platform)
    , _configuration(configuration)
    , _verifier(signingKey)
{
    Q_ASSERT(_platform);
    qDebug() << "Creating entitlement engine";

    if (!_configuration.isConfigured())
        qWarning() << "Entitlement engine created without configured product ids - catalog loads will fail";

    _entitlements = new EntitlementStore(_platform, &_verifier, this);
    _entitlements->setPolicy(EntitlementPolicy::fromConfiguration(_configuration));
    _catalog = new CatalogLoader(_platform, _entitlements, _configuration, this);
    _purchases = new PurchaseInitiator(_platform, &_verifier, _catalog, _entitlements, this);
    _restoration = new RestorationFlow(_platform, &_verifier, _entitlements, this);
    _listener = new TransactionListener(_platform, &_verifier, _entitlements, this);
}

EntitlementEngine::~EntitlementEngine()
{
    if (_listener->isListening()) {
        qWarning() << "Entitlement engine destroyed without shutdown() - stopping listener";
        _listener->stop();
    }
    qDebug() << "Destroying entitlement engine";
}

bool EntitlementEngine::start()
{
    return _listener->start();
}

bool EntitlementEngine::shutdown()
{
    return _listener->stop();
}
