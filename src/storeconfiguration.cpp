#include <qt6entitlements/storeconfiguration.h>

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

namespace {

QStringList uniqueIds(const QStringList &ids)
{
    QStringList result;
    for (const QString &id : ids) {
        const QString trimmed = id.trimmed();
        if (trimmed.isEmpty() || result.contains(trimmed))
            continue;
        result.append(trimmed);
    }
    return result;
}

bool readIdList(const QJsonObject &json, const QString &key, QStringList *ids, QString *errorMessage)
{
    const QJsonValue value = json.value(key);
    if (value.isUndefined() || value.isNull())
        return true;

    if (!value.isArray()) {
        if (errorMessage)
            *errorMessage = QString("'%1' must be an array of strings").arg(key);
        return false;
    }

    QStringList parsed;
    const QJsonArray array = value.toArray();
    for (const QJsonValue &entry : array) {
        if (!entry.isString()) {
            if (errorMessage)
                *errorMessage = QString("'%1' contains a non-string entry").arg(key);
            return false;
        }
        parsed.append(entry.toString());
    }

    *ids = uniqueIds(parsed);
    return true;
}

} // namespace

StoreConfiguration::StoreConfiguration(const QStringList &productIds, const QString &subscriptionGroupId)
    : _productIds(uniqueIds(productIds))
    , _subscriptionGroupId(subscriptionGroupId)
{
}

void StoreConfiguration::setPremiumProductIds(const QStringList &ids)
{
    _premiumProductIds = uniqueIds(ids);
}

void StoreConfiguration::setRemoveAdsProductIds(const QStringList &ids)
{
    _removeAdsProductIds = uniqueIds(ids);
}

QJsonObject StoreConfiguration::toJson() const
{
    QJsonObject json;
    json["productIds"] = QJsonArray::fromStringList(_productIds);
    if (!_subscriptionGroupId.isEmpty())
        json["subscriptionGroupId"] = _subscriptionGroupId;
    if (!_premiumProductIds.isEmpty())
        json["premiumProductIds"] = QJsonArray::fromStringList(_premiumProductIds);
    if (!_removeAdsProductIds.isEmpty())
        json["removeAdsProductIds"] = QJsonArray::fromStringList(_removeAdsProductIds);
    return json;
}

/*static*/ bool StoreConfiguration::fromJson(const QJsonObject &json, StoreConfiguration *configuration, QString *errorMessage)
{
    QStringList productIds;
    QStringList premiumIds;
    QStringList removeAdsIds;
    if (!readIdList(json, "productIds", &productIds, errorMessage)
        || !readIdList(json, "premiumProductIds", &premiumIds, errorMessage)
        || !readIdList(json, "removeAdsProductIds", &removeAdsIds, errorMessage))
        return false;

    const QJsonValue groupValue = json.value("subscriptionGroupId");
    if (!groupValue.isUndefined() && !groupValue.isNull() && !groupValue.isString()) {
        if (errorMessage)
            *errorMessage = "'subscriptionGroupId' must be a string";
        return false;
    }

    StoreConfiguration parsed(productIds, groupValue.toString());
    parsed.setPremiumProductIds(premiumIds);
    parsed.setRemoveAdsProductIds(removeAdsIds);

    for (const QString &id : parsed._premiumProductIds + parsed._removeAdsProductIds) {
        if (!parsed.contains(id))
            qWarning() << "Policy product" << id << "is not in the configured product list";
    }

    *configuration = parsed;
    return true;
}

/*static*/ bool StoreConfiguration::loadFromFile(const QString &path, StoreConfiguration *configuration, QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage)
            *errorMessage = QString("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMessage)
            *errorMessage = QString("Invalid JSON in %1: %2").arg(path, parseError.errorString());
        return false;
    }

    if (!document.isObject()) {
        if (errorMessage)
            *errorMessage = QString("%1 does not contain a JSON object").arg(path);
        return false;
    }

    if (!fromJson(document.object(), configuration, errorMessage))
        return false;

    qDebug() << "Loaded store configuration from" << path << "with"
             << configuration->productIds().size() << "product id(s)";
    return true;
}
