#include "sandboxplatformstore.h"

#include <qt6entitlements/transactionverifier.h>

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTimer>

namespace {
const int kCancelledCode = 1;
const int kDeclinedCode = 2;
const int kUnknownProductCode = 4;
const int kUnknownTransactionCode = 8;

QDateTime addPeriod(const QDateTime &start, const SubscriptionPeriod &period)
{
    switch (period.unit) {
        case SubscriptionPeriod::Day:
            return start.addDays(period.value);
        case SubscriptionPeriod::Week:
            return start.addDays(7 * period.value);
        case SubscriptionPeriod::Month:
            return start.addMonths(period.value);
        case SubscriptionPeriod::Year:
            return start.addYears(period.value);
    }
    return start;
}
} // namespace

SandboxPlatformStore::SandboxPlatformStore(QObject * parent) : AbstractPlatformStore(parent)
{
    qDebug() << "Creating sandbox platform store";
}

SandboxPlatformStore::SandboxPlatformStore(const QByteArray &signingKey, QObject * parent)
    : AbstractPlatformStore(parent)
    , _signingKey(signingKey)
{
    qDebug() << "Creating sandbox platform store";
}

void SandboxPlatformStore::setSigningKey(const QByteArray &key)
{
    _signingKey = key;
}

void SandboxPlatformStore::setCatalogFile(const QString &path)
{
    if (_catalogFile == path)
        return;
    _catalogFile = path;
    emit catalogFileChanged();

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Sandbox store could not open catalog file" << path << ":" << file.errorString();
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        qWarning() << "Sandbox store catalog file" << path << "is not a JSON object:" << parseError.errorString();
        return;
    }

    QString error;
    if (!loadCatalog(document.object(), &error))
        qWarning() << "Sandbox store catalog file" << path << "rejected:" << error;
}

bool SandboxPlatformStore::loadCatalog(const QJsonObject &json, QString * errorMessage)
{
    const QJsonValue productsValue = json.value("products");
    if (!productsValue.isArray()) {
        if (errorMessage)
            *errorMessage = "\"products\" must be an array";
        return false;
    }

    QList<Product> catalog;
    const QJsonArray products = productsValue.toArray();
    for (int i = 0; i < products.size(); ++i) {
        Product product;
        QString error;
        if (!products.at(i).isObject() || !Product::fromJson(products.at(i).toObject(), &product, &error)) {
            if (errorMessage)
                *errorMessage = QString("product %1: %2").arg(i).arg(error.isEmpty() ? "not an object" : error);
            return false;
        }
        catalog.append(product);
    }

    _catalog = catalog;
    qDebug() << "Sandbox store catalog holds" << _catalog.size() << "product(s)";
    return true;
}

void SandboxPlatformStore::addProduct(const Product &product)
{
    for (Product &existing : _catalog) {
        if (existing.identifier == product.identifier) {
            existing = product;
            return;
        }
    }
    _catalog.append(product);
}

void SandboxPlatformStore::setResponseDelay(int milliseconds)
{
    if (_responseDelay == milliseconds)
        return;
    _responseDelay = qMax(0, milliseconds);
    emit responseDelayChanged();
}

void SandboxPlatformStore::setCanMakePurchases(bool allowed)
{
    if (_canMakePurchases == allowed)
        return;
    _canMakePurchases = allowed;
    emit canMakePurchasesChanged();
}

void SandboxPlatformStore::setPurchaseBehavior(const QString &productId, PurchaseBehavior behavior)
{
    _behaviors.insert(productId, behavior);
}

void SandboxPlatformStore::setDefaultPurchaseBehavior(PurchaseBehavior behavior)
{
    _defaultBehavior = behavior;
}

void SandboxPlatformStore::setFailure(Operation operation, const StoreError &error)
{
    _failures.insert(operation, error);
}

void SandboxPlatformStore::clearFailure(Operation operation)
{
    _failures.remove(operation);
}

void SandboxPlatformStore::setHoldPurchases(bool hold)
{
    _holdPurchases = hold;
}

bool SandboxPlatformStore::resolveHeldPurchase(const QString &productId)
{
    for (int i = 0; i < _heldPurchases.size(); ++i) {
        if (_heldPurchases.at(i).productId != productId)
            continue;

        const HeldPurchase held = _heldPurchases.takeAt(i);
        if (!held.context) {
            qDebug() << "Held purchase of" << productId << "resolved after its requester went away";
            return true;
        }
        const PlatformPurchaseOutcome outcome = processPurchase(productId);
        const PurchaseCallback callback = held.callback;
        respond(held.context, [callback, outcome]() { callback(outcome); });
        return true;
    }

    qWarning() << "No held purchase of" << productId;
    return false;
}

void SandboxPlatformStore::setCurrentDateTime(const QDateTime &dateTime)
{
    _now = dateTime;
}

QString SandboxPlatformStore::grant(const QString &productId, bool notify)
{
    const Product product = productFor(productId);
    if (!product.isValid()) {
        qWarning() << "Cannot grant unknown product" << productId;
        return QString();
    }

    // Records made outside this process arrive already acknowledged
    Record record = createTransaction(product);
    record.finished = !product.isConsumable();
    _ledger.append(record);

    if (notify)
        emit transactionUpdated(sign(record.transaction));
    return record.transaction.transactionId;
}

bool SandboxPlatformStore::approvePendingPurchase(const QString &productId)
{
    if (!_awaitingApproval.removeOne(productId)) {
        qWarning() << "No purchase of" << productId << "is awaiting approval";
        return false;
    }

    const Record record = createTransaction(productFor(productId));
    _ledger.append(record);
    qDebug() << "Approved pending purchase of" << productId << "as" << record.transaction.transactionId;
    emit transactionUpdated(sign(record.transaction));
    return true;
}

bool SandboxPlatformStore::revoke(const QString &transactionId)
{
    for (Record &record : _ledger) {
        if (record.transaction.transactionId != transactionId)
            continue;
        record.transaction.revocationDate = now();
        qDebug() << "Revoked transaction" << transactionId << "for" << record.transaction.productId;
        emit transactionUpdated(sign(record.transaction));
        return true;
    }

    qWarning() << "Cannot revoke unknown transaction" << transactionId;
    return false;
}

QString SandboxPlatformStore::renew(const QString &productId)
{
    const Record * previous = latestRecord(productId);
    if (!previous || !productFor(productId).isSubscription()) {
        qWarning() << "Cannot renew" << productId << "- no subscription transaction";
        return QString();
    }

    const QString original = previous->transaction.originalTransactionId;
    Record record = createTransaction(productFor(productId), original);
    record.finished = true;
    _ledger.append(record);
    _stateOverrides.remove(productId);

    emit transactionUpdated(sign(record.transaction));
    return record.transaction.transactionId;
}

bool SandboxPlatformStore::expire(const QString &productId)
{
    bool expired = false;
    for (Record &record : _ledger) {
        if (record.transaction.productId == productId && record.transaction.expirationDate.isValid()) {
            record.transaction.expirationDate = now().addSecs(-1);
            expired = true;
        }
    }

    if (!expired) {
        qWarning() << "Cannot expire" << productId << "- no subscription transaction";
        return false;
    }

    _stateOverrides.insert(productId, ActiveSubscription::Expired);
    emit transactionUpdated(sign(latestRecord(productId)->transaction));
    return true;
}

void SandboxPlatformStore::setSubscriptionState(const QString &productId, ActiveSubscription::State state)
{
    _stateOverrides.insert(productId, state);
}

void SandboxPlatformStore::pushForgedUpdate(const QString &productId)
{
    Transaction transaction;
    transaction.transactionId = QString("forged-%1").arg(_nextTransaction++);
    transaction.originalTransactionId = transaction.transactionId;
    transaction.productId = productId;
    transaction.purchaseDate = now();

    SignedTransaction envelope = sign(transaction);
    envelope.signature = TransactionVerifier::sign(envelope.payload, "not-the-platform-key");
    emit transactionUpdated(envelope);
}

void SandboxPlatformStore::addForgedLedgerEntry(const QString &productId)
{
    Transaction transaction;
    transaction.transactionId = QString("forged-%1").arg(_nextTransaction++);
    transaction.originalTransactionId = transaction.transactionId;
    transaction.productId = productId;
    transaction.purchaseDate = now();

    SignedTransaction envelope = sign(transaction);
    envelope.signature = TransactionVerifier::sign(envelope.payload, "not-the-platform-key");
    _forgedLedgerEntries.append(envelope);
}

QList<Transaction> SandboxPlatformStore::transactions() const
{
    QList<Transaction> result;
    for (const Record &record : _ledger)
        result.append(record.transaction);
    return result;
}

bool SandboxPlatformStore::isFinished(const QString &transactionId) const
{
    for (const Record &record : _ledger) {
        if (record.transaction.transactionId == transactionId)
            return record.finished;
    }
    return false;
}

QStringList SandboxPlatformStore::unfinishedTransactionIds() const
{
    QStringList result;
    for (const Record &record : _ledger) {
        if (!record.finished)
            result.append(record.transaction.transactionId);
    }
    return result;
}

void SandboxPlatformStore::fetchProducts(const QStringList &productIds, QObject * context, ProductsCallback callback)
{
    countRequest(FetchProducts);

    StoreError error;
    if (failureFor(FetchProducts, &error)) {
        respond(context, [callback, error]() { callback(QList<Product>(), error); });
        return;
    }

    // Unknown identifiers are silently omitted, like the real stores do
    QList<Product> products;
    for (const Product &product : _catalog) {
        if (productIds.contains(product.identifier))
            products.append(product);
    }

    respond(context, [callback, products]() { callback(products, StoreError()); });
}

void SandboxPlatformStore::submitPurchase(const QString &productId, QObject * context, PurchaseCallback callback)
{
    countRequest(SubmitPurchase);
    qDebug() << "Sandbox purchase requested for" << productId;

    if (_holdPurchases) {
        _heldPurchases.append({productId, context, callback});
        return;
    }

    const PlatformPurchaseOutcome outcome = processPurchase(productId);
    respond(context, [callback, outcome]() { callback(outcome); });
}

void SandboxPlatformStore::finishTransaction(const QString &transactionId, QObject * context, FinishCallback callback)
{
    countRequest(FinishTransaction);

    StoreError error;
    if (!failureFor(FinishTransaction, &error)) {
        bool found = false;
        for (Record &record : _ledger) {
            if (record.transaction.transactionId == transactionId) {
                record.finished = true;
                found = true;
                break;
            }
        }
        if (!found)
            error = StoreError(StoreError::ItemUnavailable, QString("Unknown transaction %1").arg(transactionId),
                               kUnknownTransactionCode);
    }

    respond(context, [callback, error]() { callback(error); });
}

void SandboxPlatformStore::queryCurrentEntitlements(QObject * context, LedgerCallback callback)
{
    countRequest(CurrentEntitlements);

    StoreError error;
    if (failureFor(CurrentEntitlements, &error)) {
        respond(context, [callback, error]() { callback(QList<SignedTransaction>(), error); });
        return;
    }

    QList<SignedTransaction> ledger;
    for (const Record &record : _ledger) {
        if (isCurrentEntitlement(record))
            ledger.append(sign(record.transaction));
    }
    ledger.append(_forgedLedgerEntries);

    respond(context, [callback, ledger]() { callback(ledger, StoreError()); });
}

void SandboxPlatformStore::queryTransactionHistory(QObject * context, LedgerCallback callback)
{
    countRequest(TransactionHistory);

    StoreError error;
    if (failureFor(TransactionHistory, &error)) {
        respond(context, [callback, error]() { callback(QList<SignedTransaction>(), error); });
        return;
    }

    QList<SignedTransaction> history;
    for (const Record &record : _ledger)
        history.append(sign(record.transaction));
    history.append(_forgedLedgerEntries);

    respond(context, [callback, history]() { callback(history, StoreError()); });
}

void SandboxPlatformStore::querySubscriptionStates(const QStringList &productIds, QObject * context,
                                                   SubscriptionStatesCallback callback)
{
    countRequest(SubscriptionStatus);

    QHash<QString, ActiveSubscription::State> states;
    StoreError error;
    if (!failureFor(SubscriptionStatus, &error)) {
        for (const QString &productId : productIds)
            states.insert(productId, _stateOverrides.value(productId, computedState(productId)));
    }

    respond(context, [callback, states, error]() { callback(states, error); });
}

template <typename Functor>
void SandboxPlatformStore::respond(QObject * context, Functor functor)
{
    if (_responseDelay > 0 && context)
        QTimer::singleShot(_responseDelay, context, functor);
    else
        deliver(context, functor);
}

bool SandboxPlatformStore::failureFor(Operation operation, StoreError * error)
{
    if (!_failures.contains(operation))
        return false;
    *error = _failures.value(operation);
    qDebug() << "Sandbox store failing" << operation << "with" << *error;
    return true;
}

void SandboxPlatformStore::countRequest(Operation operation)
{
    _requestCounts[operation] += 1;
}

PlatformPurchaseOutcome SandboxPlatformStore::processPurchase(const QString &productId)
{
    PlatformPurchaseOutcome outcome;

    const Product product = productFor(productId);
    if (!product.isValid()) {
        outcome.status = PlatformPurchaseOutcome::Failed;
        outcome.error = StoreError(StoreError::ItemUnavailable, QString("Unknown product %1").arg(productId),
                                   kUnknownProductCode);
        return outcome;
    }

    StoreError failure;
    if (failureFor(SubmitPurchase, &failure)) {
        outcome.status = PlatformPurchaseOutcome::Failed;
        outcome.error = failure;
        return outcome;
    }

    switch (_behaviors.value(productId, _defaultBehavior)) {
        case Approve: {
            const Record record = createTransaction(product);
            _ledger.append(record);
            outcome.status = PlatformPurchaseOutcome::Success;
            outcome.transaction = sign(record.transaction);
            break;
        }
        case ApproveUnverified: {
            // Nothing lands in the ledger: the platform never issued this one
            Transaction transaction = createTransaction(product).transaction;
            outcome.status = PlatformPurchaseOutcome::Success;
            outcome.transaction = sign(transaction);
            outcome.transaction.signature = TransactionVerifier::sign(outcome.transaction.payload, "not-the-platform-key");
            break;
        }
        case Cancel:
            outcome.status = PlatformPurchaseOutcome::UserCancelled;
            outcome.error = StoreError(StoreError::UserCancelled, QString(), kCancelledCode);
            break;
        case AskToBuy:
            _awaitingApproval.append(productId);
            outcome.status = PlatformPurchaseOutcome::Pending;
            break;
        case Decline:
            outcome.status = PlatformPurchaseOutcome::Failed;
            outcome.error = StoreError(StoreError::NotAllowed, "Payment declined", kDeclinedCode);
            break;
        case ReturnUnknown:
            outcome.status = PlatformPurchaseOutcome::Unknown;
            break;
    }

    return outcome;
}

SandboxPlatformStore::Record SandboxPlatformStore::createTransaction(const Product &product,
                                                                     const QString &originalTransactionId)
{
    Record record;
    record.transaction.transactionId = QString("sandbox-%1").arg(_nextTransaction++);
    record.transaction.originalTransactionId = originalTransactionId.isEmpty()
            ? record.transaction.transactionId : originalTransactionId;
    record.transaction.productId = product.identifier;
    record.transaction.purchaseDate = now();
    if (product.isSubscription() && product.subscriptionPeriod.isValid())
        record.transaction.expirationDate = addPeriod(record.transaction.purchaseDate, product.subscriptionPeriod);
    return record;
}

SignedTransaction SandboxPlatformStore::sign(const Transaction &transaction) const
{
    SignedTransaction envelope;
    envelope.payload = QJsonDocument(transaction.toJson()).toJson(QJsonDocument::Compact);
    envelope.signature = TransactionVerifier::sign(envelope.payload, _signingKey);
    return envelope;
}

Product SandboxPlatformStore::productFor(const QString &productId) const
{
    for (const Product &product : _catalog) {
        if (product.identifier == productId)
            return product;
    }
    return Product();
}

const SandboxPlatformStore::Record * SandboxPlatformStore::latestRecord(const QString &productId) const
{
    const Record * latest = nullptr;
    for (const Record &record : _ledger) {
        if (record.transaction.productId == productId)
            latest = &record;
    }
    return latest;
}

bool SandboxPlatformStore::isCurrentEntitlement(const Record &record) const
{
    const Product product = productFor(record.transaction.productId);

    switch (product.kind) {
        case Product::Consumable:
            return !record.finished;
        case Product::NonConsumable:
            return true;
        case Product::AutoRenewable:
        case Product::NonRenewable:
            if (latestRecord(record.transaction.productId) != &record)
                return false;
            if (_stateOverrides.value(record.transaction.productId) == ActiveSubscription::InGracePeriod)
                return true;
            return !record.transaction.expirationDate.isValid() || record.transaction.expirationDate > now();
    }
    return false;
}

ActiveSubscription::State SandboxPlatformStore::computedState(const QString &productId) const
{
    const Record * latest = latestRecord(productId);
    if (!latest)
        return ActiveSubscription::NotSubscribed;
    if (latest->transaction.isRevoked())
        return ActiveSubscription::Expired;
    if (latest->transaction.expirationDate.isValid() && latest->transaction.expirationDate <= now())
        return ActiveSubscription::Expired;
    return ActiveSubscription::Subscribed;
}

QDateTime SandboxPlatformStore::now() const
{
    return _now.isValid() ? _now : QDateTime::currentDateTimeUtc();
}
