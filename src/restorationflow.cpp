#include <qt6entitlements/abstractplatformstore.h>
#include <qt6entitlements/entitlementstore.h>
#include <qt6entitlements/restorationflow.h>
#include <qt6entitlements/transactionverifier.h>

#include <QDebug>
#include <QPointer>
#include <QSet>

RestorationFlow::RestorationFlow(AbstractPlatformStore * platform, const TransactionVerifier * verifier,
                                 EntitlementStore * store, QObject * parent)
    : QObject(parent)
    , _platform(platform)
    , _verifier(verifier)
    , _store(store)
{
    Q_ASSERT(_platform);
    Q_ASSERT(_verifier);
    Q_ASSERT(_store);
}

void RestorationFlow::restore(QObject * context, RestoreCallback callback)
{
    if (!context)
        context = this;

    if (_running++ == 0)
        emit restoringChanged();

    qDebug() << "Restoring purchases from transaction history";
    QPointer<QObject> guard(context);
    _platform->queryTransactionHistory(this, [this, guard, callback](const QList<SignedTransaction> &history, const StoreError &error) {
        if (error.isError()) {
            qWarning() << "Transaction history query failed:" << error;
            finish(guard.data(), callback, QStringList(),
                   StoreError(StoreError::RestoreFailed, error.description(), error.platformCode));
            return;
        }

        QSet<QString> historicProducts;
        int rejected = 0;
        int revoked = 0;
        for (const SignedTransaction &envelope : history) {
            Transaction transaction;
            QString reason;
            if (!_verifier->verify(envelope, &transaction, &reason)) {
                qWarning() << "Dropping unverified history entry:" << reason;
                ++rejected;
                continue;
            }
            if (transaction.isRevoked()) {
                ++revoked;
                continue;
            }
            historicProducts.insert(transaction.productId);
        }
        qDebug() << "History contains" << history.size() << "transaction(s):" << historicProducts.size()
                 << "product(s)," << revoked << "revoked," << rejected << "rejected";

        _store->refresh(this, [this, guard, callback](const StoreError &refreshError) {
            if (refreshError.isError()) {
                finish(guard.data(), callback, QStringList(),
                       StoreError(StoreError::RestoreFailed, refreshError.description(), refreshError.platformCode));
                return;
            }
            finish(guard.data(), callback, _store->ownedProductIds(), StoreError());
        });
    });
}

void RestorationFlow::finish(QObject * context, const RestoreCallback &callback, const QStringList &owned, const StoreError &error)
{
    if (--_running == 0)
        emit restoringChanged();

    if (error.isError())
        qWarning() << "Restore failed:" << error;
    else
        qDebug() << "Restore complete, owned products:" << owned;

    emit restoreFinished(owned, error);
    if (context)
        callback(owned, error);
}
