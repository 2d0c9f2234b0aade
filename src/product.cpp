#include <qt6entitlements/product.h>

#include <QRegularExpression>

QString SubscriptionPeriod::description() const
{
    if (!isValid())
        return QString();

    QString singular;
    switch (unit) {
        case Day:
            singular = "day";
            break;
        case Week:
            singular = "week";
            break;
        case Month:
            singular = "month";
            break;
        case Year:
            singular = "year";
            break;
    }

    if (value == 1)
        return singular;
    return QString("%1 %2s").arg(value).arg(singular);
}

/*static*/ SubscriptionPeriod SubscriptionPeriod::fromString(const QString &text)
{
    SubscriptionPeriod period;
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty())
        return period;

    // ISO 8601 duration as reported by Google Play: P1W, P1M, P3M, P1Y
    static const QRegularExpression isoPattern("^P(\\d+)([DWMY])$");
    QRegularExpressionMatch match = isoPattern.match(trimmed.toUpper());
    if (match.hasMatch()) {
        period.value = match.captured(1).toInt();
        const QChar unitChar = match.captured(2).at(0);
        if (unitChar == 'D')
            period.unit = Day;
        else if (unitChar == 'W')
            period.unit = Week;
        else if (unitChar == 'M')
            period.unit = Month;
        else
            period.unit = Year;
        return period;
    }

    static const QRegularExpression textPattern("^(?:(\\d+)\\s+)?(day|week|month|year)s?$",
                                                QRegularExpression::CaseInsensitiveOption);
    match = textPattern.match(trimmed);
    if (!match.hasMatch())
        return period;

    period.value = match.captured(1).isEmpty() ? 1 : match.captured(1).toInt();
    const QString unitName = match.captured(2).toLower();
    if (unitName == "day")
        period.unit = Day;
    else if (unitName == "week")
        period.unit = Week;
    else if (unitName == "month")
        period.unit = Month;
    else
        period.unit = Year;
    return period;
}

bool Product::isSubscription() const
{
    switch (kind) {
        case Consumable:
        case NonConsumable:
            return false;
        case AutoRenewable:
        case NonRenewable:
            return true;
    }
    return false;
}

bool Product::isConsumable() const
{
    switch (kind) {
        case Consumable:
            return true;
        case NonConsumable:
        case AutoRenewable:
        case NonRenewable:
            return false;
    }
    return false;
}

/*static*/ QString Product::kindName(Kind kind)
{
    switch (kind) {
        case Consumable:
            return "consumable";
        case NonConsumable:
            return "nonConsumable";
        case AutoRenewable:
            return "autoRenewable";
        case NonRenewable:
            return "nonRenewable";
    }
    return QString();
}

/*static*/ bool Product::kindFromName(const QString &name, Kind *kind)
{
    for (Kind candidate : {Consumable, NonConsumable, AutoRenewable, NonRenewable}) {
        if (kindName(candidate).compare(name, Qt::CaseInsensitive) == 0) {
            *kind = candidate;
            return true;
        }
    }
    return false;
}

QJsonObject Product::toJson() const
{
    QJsonObject json;
    json["id"] = identifier;
    json["displayName"] = displayName;
    json["description"] = description;
    json["displayPrice"] = displayPrice;
    json["priceMicros"] = priceMicros;
    json["currency"] = currencyCode;
    json["type"] = kindName(kind);
    if (subscriptionPeriod.isValid())
        json["subscriptionPeriod"] = subscriptionPeriod.description();
    return json;
}

/*static*/ bool Product::fromJson(const QJsonObject &json, Product *product, QString *errorMessage)
{
    Product parsed;
    parsed.identifier = json["id"].toString();
    if (parsed.identifier.isEmpty()) {
        if (errorMessage)
            *errorMessage = "Product has no id";
        return false;
    }

    if (!kindFromName(json["type"].toString(), &parsed.kind)) {
        if (errorMessage)
            *errorMessage = QString("Product %1 has unknown type '%2'").arg(parsed.identifier, json["type"].toString());
        return false;
    }

    parsed.displayName = json["displayName"].toString();
    parsed.description = json["description"].toString();
    parsed.priceMicros = json["priceMicros"].toInteger();
    parsed.currencyCode = json["currency"].toString();
    parsed.displayPrice = json["displayPrice"].toString();
    if (parsed.displayPrice.isEmpty())
        parsed.displayPrice = QString("%1 %2").arg(parsed.price(), 0, 'f', 2).arg(parsed.currencyCode).trimmed();

    parsed.subscriptionPeriod = SubscriptionPeriod::fromString(json["subscriptionPeriod"].toString());
    if (parsed.kind == AutoRenewable && !parsed.subscriptionPeriod.isValid()) {
        if (errorMessage)
            *errorMessage = QString("Subscription %1 has no valid subscription period").arg(parsed.identifier);
        return false;
    }

    *product = parsed;
    return true;
}

bool Product::operator==(const Product &other) const
{
    return identifier == other.identifier
        && displayName == other.displayName
        && description == other.description
        && displayPrice == other.displayPrice
        && priceMicros == other.priceMicros
        && currencyCode == other.currencyCode
        && kind == other.kind
        && subscriptionPeriod == other.subscriptionPeriod;
}
