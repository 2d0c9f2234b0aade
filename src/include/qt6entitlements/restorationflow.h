#ifndef RESTORATIONFLOW_H
#define RESTORATIONFLOW_H

#include <QObject>
#include <QStringList>

#include <functional>

#include <qt6entitlements/storeerror.h>

class AbstractPlatformStore;
class EntitlementStore;
class TransactionVerifier;

// Rebuilds entitlements from the user's full transaction history, for when
// local state is believed stale (reinstall, new device).
class RestorationFlow : public QObject
{
    Q_OBJECT

    Q_PROPERTY(bool restoring READ isRestoring NOTIFY restoringChanged)

public:
    using RestoreCallback = std::function<void(const QStringList &ownedProductIds, const StoreError &error)>;

    RestorationFlow(AbstractPlatformStore * platform, const TransactionVerifier * verifier,
                    EntitlementStore * store, QObject * parent = nullptr);

    void restore(QObject * context, RestoreCallback callback);

    bool isRestoring() const { return _running > 0; }

signals:
    void restoringChanged();
    void restoreFinished(const QStringList &ownedProductIds, const StoreError &error);

private:
    void finish(QObject * context, const RestoreCallback &callback, const QStringList &owned, const StoreError &error);

    AbstractPlatformStore * _platform = nullptr;
    const TransactionVerifier * _verifier = nullptr;
    EntitlementStore * _store = nullptr;
    int _running = 0;
};

#endif // RESTORATIONFLOW_H
