#include <qt6entitlements/transaction.h>

#include <QTimeZone>

namespace {

QDateTime parseTimestamp(const QJsonValue &value)
{
    if (value.isDouble())
        return QDateTime::fromMSecsSinceEpoch(value.toInteger(), QTimeZone::utc());
    if (value.isString())
        return QDateTime::fromString(value.toString(), Qt::ISODateWithMs).toUTC();
    return QDateTime();
}

} // namespace

QJsonObject Transaction::toJson() const
{
    QJsonObject json;
    json["transactionId"] = transactionId;
    if (!originalTransactionId.isEmpty())
        json["originalTransactionId"] = originalTransactionId;
    json["productId"] = productId;
    json["purchaseDate"] = purchaseDate.toMSecsSinceEpoch();
    if (expirationDate.isValid())
        json["expirationDate"] = expirationDate.toMSecsSinceEpoch();
    if (revocationDate.isValid())
        json["revocationDate"] = revocationDate.toMSecsSinceEpoch();
    return json;
}

/*static*/ Transaction Transaction::fromJson(const QJsonObject &json)
{
    Transaction transaction;
    transaction.transactionId = json["transactionId"].toString();
    transaction.originalTransactionId = json["originalTransactionId"].toString();
    transaction.productId = json["productId"].toString();
    transaction.purchaseDate = parseTimestamp(json["purchaseDate"]);
    transaction.expirationDate = parseTimestamp(json["expirationDate"]);
    transaction.revocationDate = parseTimestamp(json["revocationDate"]);
    if (transaction.originalTransactionId.isEmpty())
        transaction.originalTransactionId = transaction.transactionId;
    return transaction;
}

bool Transaction::operator==(const Transaction &other) const
{
    return transactionId == other.transactionId
        && originalTransactionId == other.originalTransactionId
        && productId == other.productId
        && purchaseDate == other.purchaseDate
        && expirationDate == other.expirationDate
        && revocationDate == other.revocationDate;
}
