#ifndef STOREERROR_H
#define STOREERROR_H

#include <QMetaType>
#include <QQmlEngine>
#include <QString>

struct StoreError
{
    Q_GADGET
    QML_VALUE_TYPE(storeError)

    Q_PROPERTY(Code code MEMBER code CONSTANT)
    Q_PROPERTY(int platformCode MEMBER platformCode CONSTANT)
    Q_PROPERTY(QString message MEMBER message CONSTANT)
    Q_PROPERTY(bool isError READ isError CONSTANT)

public:
    enum Code {
        NoError,
        // Engine errors
        ConfigurationError,
        CatalogFetchError,
        RestoreFailed,
        VerificationFailed,
        ProductNotFound,
        PurchaseInProgress,
        UserCancelled,
        Pending,
        PurchaseFailed,
        UnknownPurchaseOutcome,
        // Platform errors
        NetworkError,
        ServiceUnavailable,
        ItemUnavailable,
        NotAllowed,
        UnknownError
    };
    Q_ENUM(Code)

    StoreError() = default;
    StoreError(Code code, const QString &message = QString(), int platformCode = 0)
        : code(code), platformCode(platformCode), message(message) {}

    Code code = NoError;
    int platformCode = 0;
    QString message;

    // Cancellation and pending approval are terminal outcomes, not failures.
    bool isError() const { return code != NoError && code != UserCancelled && code != Pending; }

    Q_INVOKABLE QString description() const;

    bool operator==(const StoreError &other) const
    {
        return code == other.code && platformCode == other.platformCode && message == other.message;
    }
    bool operator!=(const StoreError &other) const { return !(*this == other); }

    static QString codeDescription(Code code);
};

QDebug operator<<(QDebug debug, const StoreError &error);

#endif // STOREERROR_H
