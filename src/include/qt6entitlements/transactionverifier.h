#ifndef TRANSACTIONVERIFIER_H
#define TRANSACTIONVERIFIER_H

#include <QByteArray>
#include <QString>

#include <qt6entitlements/transaction.h>

// Stateless authenticity gate. A SignedTransaction is trusted only if its
// signature is the HMAC-SHA256 of its payload under the platform signing key
// and the payload decodes to a complete transaction.
class TransactionVerifier
{
public:
    explicit TransactionVerifier(const QByteArray &signingKey);

    bool verify(const SignedTransaction &envelope, Transaction * transaction, QString * errorMessage = nullptr) const;

    static QByteArray sign(const QByteArray &payload, const QByteArray &signingKey);

private:
    QByteArray _signingKey;
};

#endif // TRANSACTIONVERIFIER_H
