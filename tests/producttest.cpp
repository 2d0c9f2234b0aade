#include <QtTest/QtTest>
#include <QJsonObject>

#include <qt6entitlements/product.h>

class ProductTest : public QObject
{
    Q_OBJECT

private slots:
    void periodFromString_data();
    void periodFromString();
    void periodDescription();
    void kinds();
    void fromJsonReadsStoreFileEntry();
    void fromJsonFillsMissingDisplayPrice();
    void fromJsonRejectsBadEntries();
};

void ProductTest::periodFromString_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<int>("unit");
    QTest::addColumn<int>("value");

    QTest::newRow("iso month") << "P1M" << int(SubscriptionPeriod::Month) << 1;
    QTest::newRow("iso quarter") << "P3M" << int(SubscriptionPeriod::Month) << 3;
    QTest::newRow("iso week") << "p2w" << int(SubscriptionPeriod::Week) << 2;
    QTest::newRow("word") << "year" << int(SubscriptionPeriod::Year) << 1;
    QTest::newRow("count and plural") << "6 months" << int(SubscriptionPeriod::Month) << 6;
    QTest::newRow("garbage") << "fortnightly" << int(SubscriptionPeriod::Month) << 0;
    QTest::newRow("empty") << "" << int(SubscriptionPeriod::Month) << 0;
}

void ProductTest::periodFromString()
{
    QFETCH(QString, text);
    QFETCH(int, unit);
    QFETCH(int, value);

    const SubscriptionPeriod period = SubscriptionPeriod::fromString(text);
    QCOMPARE(period.value, value);
    if (value > 0)
        QCOMPARE(int(period.unit), unit);
}

void ProductTest::periodDescription()
{
    QCOMPARE(SubscriptionPeriod::fromString("P1M").description(), QStringLiteral("month"));
    QCOMPARE(SubscriptionPeriod::fromString("P3M").description(), QStringLiteral("3 months"));
    QVERIFY(SubscriptionPeriod().description().isEmpty());
}

void ProductTest::kinds()
{
    Product product;
    product.kind = Product::AutoRenewable;
    QVERIFY(product.isSubscription());
    QVERIFY(!product.isConsumable());

    product.kind = Product::NonRenewable;
    QVERIFY(product.isSubscription());

    product.kind = Product::Consumable;
    QVERIFY(product.isConsumable());
    QVERIFY(!product.isSubscription());

    Product::Kind kind = Product::Consumable;
    QVERIFY(Product::kindFromName("NONCONSUMABLE", &kind));
    QCOMPARE(kind, Product::NonConsumable);
    QVERIFY(!Product::kindFromName("bundle", &kind));
}

void ProductTest::fromJsonReadsStoreFileEntry()
{
    QJsonObject json;
    json["id"] = "premium.monthly";
    json["displayName"] = "Premium Monthly";
    json["description"] = "All features, billed monthly";
    json["displayPrice"] = "$4.99";
    json["priceMicros"] = 4990000;
    json["currency"] = "USD";
    json["type"] = "autoRenewable";
    json["subscriptionPeriod"] = "P1M";

    Product product;
    QString error;
    QVERIFY2(Product::fromJson(json, &product, &error), qPrintable(error));
    QCOMPARE(product.identifier, QStringLiteral("premium.monthly"));
    QCOMPARE(product.displayPrice, QStringLiteral("$4.99"));
    QCOMPARE(product.priceMicros, qint64(4990000));
    QCOMPARE(product.kind, Product::AutoRenewable);
    QCOMPARE(product.subscriptionPeriod.unit, SubscriptionPeriod::Month);
    QCOMPARE(product.subscriptionPeriod.value, 1);
    QCOMPARE(product.toJson()["subscriptionPeriod"].toString(), QStringLiteral("month"));
}

void ProductTest::fromJsonFillsMissingDisplayPrice()
{
    QJsonObject json;
    json["id"] = "coins.100";
    json["priceMicros"] = 990000;
    json["currency"] = "EUR";
    json["type"] = "consumable";

    Product product;
    QVERIFY(Product::fromJson(json, &product));
    QCOMPARE(product.displayPrice, QStringLiteral("0.99 EUR"));
}

void ProductTest::fromJsonRejectsBadEntries()
{
    Product product;
    QString error;

    QVERIFY(!Product::fromJson(QJsonObject{{"type", "consumable"}}, &product, &error));
    QCOMPARE(error, QStringLiteral("Product has no id"));

    QVERIFY(!Product::fromJson(QJsonObject{{"id", "x"}, {"type", "bundle"}}, &product, &error));
    QVERIFY(error.contains("unknown type"));

    QVERIFY(!Product::fromJson(QJsonObject{{"id", "sub"}, {"type", "autoRenewable"}}, &product, &error));
    QVERIFY(error.contains("subscription period"));
}

QTEST_MAIN(ProductTest)
#include "producttest.moc"
