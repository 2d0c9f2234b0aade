#include <qt6entitlements/storeerror.h>

#include <QDebug>

/*static*/ QString StoreError::codeDescription(Code code)
{
    switch (code) {
        case NoError:
            return "Success";
        case ConfigurationError:
            return "Store configuration has not been set up";
        case CatalogFetchError:
            return "Failed to load products";
        case RestoreFailed:
            return "Failed to restore purchases";
        case VerificationFailed:
            return "Transaction verification failed";
        case ProductNotFound:
            return "Product not found";
        case PurchaseInProgress:
            return "A purchase of this product is already in progress";
        case UserCancelled:
            return "Purchase was cancelled";
        case Pending:
            return "Purchase is pending approval";
        case PurchaseFailed:
            return "Purchase failed";
        case UnknownPurchaseOutcome:
            return "The store returned an unknown purchase result";
        case NetworkError:
            return "Network error occurred";
        case ServiceUnavailable:
            return "Store service is unavailable";
        case ItemUnavailable:
            return "The requested item is not available";
        case NotAllowed:
            return "The user is not allowed to make purchases";
        case UnknownError:
            return "Unknown error";
    }

    return QString("Unknown error code: %1").arg(static_cast<int>(code));
}

QString StoreError::description() const
{
    if (message.isEmpty())
        return codeDescription(code);
    return QString("%1: %2").arg(codeDescription(code), message);
}

QDebug operator<<(QDebug debug, const StoreError &error)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "StoreError(" << error.code;
    if (error.platformCode != 0)
        debug << ", platformCode=" << error.platformCode;
    if (!error.message.isEmpty())
        debug << ", " << error.message;
    debug << ')';
    return debug;
}
