#include <qt6entitlements/transactionverifier.h>

#include <QCryptographicHash>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMessageAuthenticationCode>

namespace {

bool constantTimeEquals(const QByteArray &a, const QByteArray &b)
{
    if (a.size() != b.size())
        return false;

    char diff = 0;
    for (qsizetype i = 0; i < a.size(); ++i)
        diff |= a.at(i) ^ b.at(i);
    return diff == 0;
}

} // namespace

TransactionVerifier::TransactionVerifier(const QByteArray &signingKey)
    : _signingKey(signingKey)
{
}

/*static*/ QByteArray TransactionVerifier::sign(const QByteArray &payload, const QByteArray &signingKey)
{
    return QMessageAuthenticationCode::hash(payload, signingKey, QCryptographicHash::Sha256).toBase64();
}

bool TransactionVerifier::verify(const SignedTransaction &envelope, Transaction * transaction, QString * errorMessage) const
{
    if (_signingKey.isEmpty()) {
        if (errorMessage)
            *errorMessage = "No signing key configured";
        return false;
    }

    if (envelope.isEmpty() || envelope.signature.isEmpty()) {
        if (errorMessage)
            *errorMessage = "Transaction envelope is incomplete";
        return false;
    }

    const QByteArray expected = sign(envelope.payload, _signingKey);
    if (!constantTimeEquals(expected, envelope.signature.trimmed())) {
        if (errorMessage)
            *errorMessage = "Signature mismatch";
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(envelope.payload, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        if (errorMessage)
            *errorMessage = QString("Malformed transaction payload: %1").arg(parseError.errorString());
        return false;
    }

    const Transaction decoded = Transaction::fromJson(document.object());
    if (decoded.transactionId.isEmpty() || decoded.productId.isEmpty() || !decoded.purchaseDate.isValid()) {
        if (errorMessage)
            *errorMessage = "Transaction payload is missing required fields";
        return false;
    }

    if (transaction)
        *transaction = decoded;
    return true;
}
