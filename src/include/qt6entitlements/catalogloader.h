#ifndef CATALOGLOADER_H
#define CATALOGLOADER_H

#include <QList>
#include <QObject>

#include <functional>

#include <qt6entitlements/product.h>
#include <qt6entitlements/storeconfiguration.h>
#include <qt6entitlements/storeerror.h>

class AbstractPlatformStore;
class EntitlementStore;

class CatalogLoader : public QObject
{
    Q_OBJECT

    Q_PROPERTY(bool loading READ isLoading NOTIFY loadingChanged)

public:
    using LoadCallback = std::function<void(const QList<Product> &products, const StoreError &error)>;

    CatalogLoader(AbstractPlatformStore * platform, EntitlementStore * store,
                  const StoreConfiguration &configuration, QObject * parent = nullptr);

    // Fetches the configured products sorted by ascending price, caches them
    // and refreshes entitlements before calling back.
    void load(QObject * context, LoadCallback callback);

    QList<Product> products() const { return _products; }
    Product product(const QString &identifier) const;
    bool contains(const QString &identifier) const;

    const StoreConfiguration &configuration() const { return _configuration; }
    bool isLoading() const { return _pendingLoads > 0; }

signals:
    void loadingChanged();
    void catalogChanged();

private:
    void onProductsFetched(quint64 serial, QList<Product> products, const StoreError &error,
                           QObject * context, const LoadCallback &callback);
    void endLoad();

    AbstractPlatformStore * _platform = nullptr;
    EntitlementStore * _store = nullptr;
    const StoreConfiguration _configuration;

    QList<Product> _products;
    quint64 _lastStarted = 0;
    quint64 _lastApplied = 0;
    int _pendingLoads = 0;
};

#endif // CATALOGLOADER_H
