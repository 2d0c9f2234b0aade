#ifndef TESTFIXTURES_H
#define TESTFIXTURES_H

#include <QByteArray>
#include <QDateTime>
#include <QJsonDocument>
#include <QList>
#include <QTimeZone>

#include <qt6entitlements/product.h>
#include <qt6entitlements/storeconfiguration.h>
#include <qt6entitlements/transaction.h>
#include <qt6entitlements/transactionverifier.h>

#include "sandboxplatformstore.h"

// Shared catalog and key used by every test: two subscriptions, one
// non-consumable and one consumable, deliberately listed out of price order.

inline const QByteArray &testSigningKey()
{
    static const QByteArray key("sandbox-signing-key");
    return key;
}

inline Product makeProduct(const QString &id, const QString &price, qint64 priceMicros,
                           Product::Kind kind, const QString &period = QString())
{
    Product product;
    product.identifier = id;
    product.displayName = id;
    product.displayPrice = price;
    product.priceMicros = priceMicros;
    product.currencyCode = "USD";
    product.kind = kind;
    product.subscriptionPeriod = SubscriptionPeriod::fromString(period);
    return product;
}

inline QList<Product> sampleCatalog()
{
    return {
        makeProduct("premium.yearly", "$39.99", 39990000, Product::AutoRenewable, "P1Y"),
        makeProduct("premium.monthly", "$4.99", 4990000, Product::AutoRenewable, "P1M"),
        makeProduct("removeads", "$2.99", 2990000, Product::NonConsumable),
        makeProduct("coins.100", "$0.99", 990000, Product::Consumable),
    };
}

inline StoreConfiguration sampleConfiguration()
{
    StoreConfiguration configuration({"premium.monthly", "premium.yearly", "removeads", "coins.100"}, "premium");
    configuration.setRemoveAdsProductIds({"removeads"});
    return configuration;
}

inline SandboxPlatformStore * makeSandbox(QObject * parent)
{
    auto * sandbox = new SandboxPlatformStore(testSigningKey(), parent);
    for (const Product &product : sampleCatalog())
        sandbox->addProduct(product);
    return sandbox;
}

inline Transaction makeTransaction(const QString &transactionId, const QString &productId)
{
    Transaction transaction;
    transaction.transactionId = transactionId;
    transaction.originalTransactionId = transactionId;
    transaction.productId = productId;
    transaction.purchaseDate = QDateTime::fromMSecsSinceEpoch(1700000000000, QTimeZone::utc());
    return transaction;
}

inline SignedTransaction signTransaction(const Transaction &transaction, const QByteArray &key = testSigningKey())
{
    SignedTransaction envelope;
    envelope.payload = QJsonDocument(transaction.toJson()).toJson(QJsonDocument::Compact);
    envelope.signature = TransactionVerifier::sign(envelope.payload, key);
    return envelope;
}

#endif // TESTFIXTURES_H
