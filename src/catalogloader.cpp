#include <qt6entitlements/abstractplatformstore.h>
#include <qt6entitlements/catalogloader.h>
#include <qt6entitlements/entitlementstore.h>

#include <QDebug>
#include <QPointer>
#include <QTimer>

#include <algorithm>

CatalogLoader::CatalogLoader(AbstractPlatformStore * platform, EntitlementStore * store,
                             const StoreConfiguration &configuration, QObject * parent)
    : QObject(parent)
    , _platform(platform)
    , _store(store)
    , _configuration(configuration)
{
    Q_ASSERT(_platform);
    Q_ASSERT(_store);
}

void CatalogLoader::load(QObject * context, LoadCallback callback)
{
    if (!context)
        context = this;

    if (!_configuration.isConfigured()) {
        qWarning() << "Cannot load products - no product ids configured";
        const StoreError error(StoreError::ConfigurationError,
                               "No product ids configured. Provide a StoreConfiguration with product ids first.");
        QTimer::singleShot(0, context, [callback, error]() {
            callback(QList<Product>(), error);
        });
        return;
    }

    const quint64 serial = ++_lastStarted;
    if (_pendingLoads++ == 0)
        emit loadingChanged();

    qDebug() << "Loading" << _configuration.productIds().size() << "product(s), request" << serial;
    QPointer<QObject> guard(context);
    _platform->fetchProducts(_configuration.productIds(), this,
            [this, serial, guard, callback](const QList<Product> &products, const StoreError &error) {
        if (!guard) {
            endLoad();
            return;
        }
        onProductsFetched(serial, products, error, guard.data(), callback);
    });
}

void CatalogLoader::onProductsFetched(quint64 serial, QList<Product> products, const StoreError &error,
                                      QObject * context, const LoadCallback &callback)
{
    if (error.isError()) {
        qWarning() << "Product fetch failed:" << error;
        endLoad();
        callback(QList<Product>(), StoreError(StoreError::CatalogFetchError, error.description(), error.platformCode));
        return;
    }

    // Never expose a product the application did not configure
    products.erase(std::remove_if(products.begin(), products.end(), [this](const Product &product) {
        if (_configuration.contains(product.identifier))
            return false;
        qWarning() << "Ignoring unconfigured product returned by the store:" << product.identifier;
        return true;
    }), products.end());

    std::stable_sort(products.begin(), products.end(), [](const Product &a, const Product &b) {
        return a.priceMicros < b.priceMicros;
    });

    for (const QString &id : _configuration.productIds()) {
        const bool found = std::any_of(products.cbegin(), products.cend(), [&id](const Product &product) {
            return product.identifier == id;
        });
        if (!found)
            qDebug() << "Configured product not available in store:" << id;
    }

    if (serial >= _lastApplied) {
        _lastApplied = serial;
        _products = products;
        _store->setCatalog(products);
        emit catalogChanged();
    } else {
        qDebug() << "Catalog request" << serial << "superseded by request" << _lastApplied;
    }

    QPointer<QObject> guard(context);
    _store->refresh(this, [this, guard, callback, products](const StoreError &refreshError) {
        if (refreshError.isError())
            qWarning() << "Entitlement refresh after catalog load failed:" << refreshError;
        endLoad();
        if (guard)
            callback(products, StoreError());
    });
}

void CatalogLoader::endLoad()
{
    if (--_pendingLoads == 0)
        emit loadingChanged();
}

Product CatalogLoader::product(const QString &identifier) const
{
    for (const Product &product : _products) {
        if (product.identifier == identifier)
            return product;
    }
    return Product();
}

bool CatalogLoader::contains(const QString &identifier) const
{
    return product(identifier).isValid();
}
