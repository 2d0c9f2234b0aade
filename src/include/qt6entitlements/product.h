#ifndef PRODUCT_H
#define PRODUCT_H

#include <QJsonObject>
#include <QMetaType>
#include <QQmlEngine>
#include <QString>

struct SubscriptionPeriod
{
    Q_GADGET
    QML_VALUE_TYPE(subscriptionPeriod)

    Q_PROPERTY(Unit unit MEMBER unit CONSTANT)
    Q_PROPERTY(int value MEMBER value CONSTANT)
    Q_PROPERTY(QString text READ description CONSTANT)

public:
    enum Unit {
        Day,
        Week,
        Month,
        Year
    };
    Q_ENUM(Unit)

    Unit unit = Month;
    int value = 0;

    bool isValid() const { return value > 0; }
    QString description() const;

    // Parses "month", "3 months", "P1M", "P2W"...
    static SubscriptionPeriod fromString(const QString &text);

    bool operator==(const SubscriptionPeriod &other) const { return unit == other.unit && value == other.value; }
    bool operator!=(const SubscriptionPeriod &other) const { return !(*this == other); }
};

struct Product
{
    Q_GADGET
    QML_VALUE_TYPE(product)

    Q_PROPERTY(QString identifier MEMBER identifier CONSTANT)
    Q_PROPERTY(QString displayName MEMBER displayName CONSTANT)
    Q_PROPERTY(QString description MEMBER description CONSTANT)
    Q_PROPERTY(QString displayPrice MEMBER displayPrice CONSTANT)
    Q_PROPERTY(qint64 priceMicros MEMBER priceMicros CONSTANT)
    Q_PROPERTY(QString currencyCode MEMBER currencyCode CONSTANT)
    Q_PROPERTY(Kind kind MEMBER kind CONSTANT)
    Q_PROPERTY(SubscriptionPeriod subscriptionPeriod MEMBER subscriptionPeriod CONSTANT)
    Q_PROPERTY(bool isSubscription READ isSubscription CONSTANT)

public:
    enum Kind {
        Consumable,
        NonConsumable,
        AutoRenewable,
        NonRenewable
    };
    Q_ENUM(Kind)

    QString identifier;
    QString displayName;
    QString description;
    QString displayPrice;
    qint64 priceMicros = 0;
    QString currencyCode;
    Kind kind = NonConsumable;
    SubscriptionPeriod subscriptionPeriod;

    bool isValid() const { return !identifier.isEmpty(); }
    bool isSubscription() const;
    bool isConsumable() const;
    double price() const { return static_cast<double>(priceMicros) / 1000000.0; }

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject &json, Product *product, QString *errorMessage = nullptr);

    static QString kindName(Kind kind);
    static bool kindFromName(const QString &name, Kind *kind);

    bool operator==(const Product &other) const;
    bool operator!=(const Product &other) const { return !(*this == other); }
};

#endif // PRODUCT_H
