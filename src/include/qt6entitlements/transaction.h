#ifndef TRANSACTION_H
#define TRANSACTION_H

#include <QByteArray>
#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>
#include <QQmlEngine>
#include <QString>

struct Transaction
{
    Q_GADGET
    QML_VALUE_TYPE(transaction)

    Q_PROPERTY(QString transactionId MEMBER transactionId CONSTANT)
    Q_PROPERTY(QString originalTransactionId MEMBER originalTransactionId CONSTANT)
    Q_PROPERTY(QString productId MEMBER productId CONSTANT)
    Q_PROPERTY(QDateTime purchaseDate MEMBER purchaseDate CONSTANT)
    Q_PROPERTY(QDateTime expirationDate MEMBER expirationDate CONSTANT)
    Q_PROPERTY(QDateTime revocationDate MEMBER revocationDate CONSTANT)
    Q_PROPERTY(bool revoked READ isRevoked CONSTANT)

public:
    QString transactionId;
    QString originalTransactionId;
    QString productId;
    QDateTime purchaseDate;
    QDateTime expirationDate;   // subscriptions only
    QDateTime revocationDate;   // invalid unless refunded or revoked

    bool isRevoked() const { return revocationDate.isValid(); }

    QJsonObject toJson() const;
    static Transaction fromJson(const QJsonObject &json);

    bool operator==(const Transaction &other) const;
    bool operator!=(const Transaction &other) const { return !(*this == other); }
};

// Transaction as delivered by the platform: a compact JSON payload and the
// base64 HMAC-SHA256 signature of exactly those bytes. Only
// TransactionVerifier may turn it into a Transaction.
struct SignedTransaction
{
    Q_GADGET

public:
    QByteArray payload;
    QByteArray signature;

    bool isEmpty() const { return payload.isEmpty(); }
};

struct PurchaseResult
{
    Q_GADGET
    QML_VALUE_TYPE(purchaseResult)

    Q_PROPERTY(QString productId MEMBER productId CONSTANT)
    Q_PROPERTY(QString transactionId MEMBER transactionId CONSTANT)
    Q_PROPERTY(QDateTime purchaseDate MEMBER purchaseDate CONSTANT)
    Q_PROPERTY(bool successful MEMBER successful CONSTANT)

public:
    QString productId;
    QString transactionId;
    QDateTime purchaseDate;
    bool successful = false;

    bool operator==(const PurchaseResult &other) const
    {
        return productId == other.productId && transactionId == other.transactionId
            && purchaseDate == other.purchaseDate && successful == other.successful;
    }
    bool operator!=(const PurchaseResult &other) const { return !(*this == other); }
};

#endif // TRANSACTION_H
