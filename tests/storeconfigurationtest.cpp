#include <QtTest/QtTest>
#include <QFile>
#include <QJsonArray>
#include <QTemporaryDir>

#include <qt6entitlements/storeconfiguration.h>

namespace {

QString writeFile(const QTemporaryDir &dir, const QByteArray &contents)
{
    const QString path = dir.filePath("store.json");
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        return QString();
    file.write(contents);
    return path;
}

} // namespace

class StoreConfigurationTest : public QObject
{
    Q_OBJECT

private slots:
    void emptyIsNotConfigured();
    void idsAreTrimmedAndDeduplicated();
    void fromJson();
    void fromJsonRejectsWrongTypes();
    void loadFromFile();
    void loadFromMissingOrInvalidFile();
};

void StoreConfigurationTest::emptyIsNotConfigured()
{
    QVERIFY(!StoreConfiguration().isConfigured());
    QVERIFY(!StoreConfiguration({" ", ""}).isConfigured());
    QVERIFY(StoreConfiguration({"premium.monthly"}).isConfigured());
}

void StoreConfigurationTest::idsAreTrimmedAndDeduplicated()
{
    const StoreConfiguration configuration({" premium.monthly", "removeads", "premium.monthly "});
    QCOMPARE(configuration.productIds(), QStringList({"premium.monthly", "removeads"}));
    QVERIFY(configuration.contains("removeads"));
    QVERIFY(!configuration.contains("coins.100"));
}

void StoreConfigurationTest::fromJson()
{
    QJsonObject json;
    json["productIds"] = QJsonArray{"premium.monthly", "premium.yearly", "removeads"};
    json["subscriptionGroupId"] = "premium";
    json["premiumProductIds"] = QJsonArray{"premium.monthly", "premium.yearly"};
    json["removeAdsProductIds"] = QJsonArray{"removeads"};

    StoreConfiguration configuration;
    QString error;
    QVERIFY2(StoreConfiguration::fromJson(json, &configuration, &error), qPrintable(error));
    QCOMPARE(configuration.productIds().size(), 3);
    QCOMPARE(configuration.subscriptionGroupId(), QStringLiteral("premium"));
    QCOMPARE(configuration.premiumProductIds(), QStringList({"premium.monthly", "premium.yearly"}));
    QCOMPARE(configuration.removeAdsProductIds(), QStringList({"removeads"}));
    QCOMPARE(configuration.toJson(), json);
}

void StoreConfigurationTest::fromJsonRejectsWrongTypes()
{
    StoreConfiguration configuration({"untouched"});
    QString error;

    QVERIFY(!StoreConfiguration::fromJson(QJsonObject{{"productIds", "premium.monthly"}}, &configuration, &error));
    QVERIFY(error.contains("productIds"));

    QVERIFY(!StoreConfiguration::fromJson(QJsonObject{{"productIds", QJsonArray{"a", 3}}}, &configuration, &error));
    QVERIFY(error.contains("non-string"));

    QVERIFY(!StoreConfiguration::fromJson(QJsonObject{{"subscriptionGroupId", 7}}, &configuration, &error));
    QVERIFY(error.contains("subscriptionGroupId"));

    QCOMPARE(configuration.productIds(), QStringList({"untouched"}));
}

void StoreConfigurationTest::loadFromFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = writeFile(dir, R"({"productIds": ["premium.monthly", "removeads"], "removeAdsProductIds": ["removeads"]})");
    QVERIFY(!path.isEmpty());

    StoreConfiguration configuration;
    QString error;
    QVERIFY2(StoreConfiguration::loadFromFile(path, &configuration, &error), qPrintable(error));
    QVERIFY(configuration.isConfigured());
    QCOMPARE(configuration.removeAdsProductIds(), QStringList({"removeads"}));
}

void StoreConfigurationTest::loadFromMissingOrInvalidFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    StoreConfiguration configuration;
    QString error;

    QVERIFY(!StoreConfiguration::loadFromFile(dir.filePath("missing.json"), &configuration, &error));
    QVERIFY(error.startsWith("Cannot open"));

    const QString broken = writeFile(dir, "{\"productIds\": [");
    QVERIFY(!StoreConfiguration::loadFromFile(broken, &configuration, &error));
    QVERIFY(error.startsWith("Invalid JSON"));

    const QString array = writeFile(dir, "[\"premium.monthly\"]");
    QVERIFY(!StoreConfiguration::loadFromFile(array, &configuration, &error));
    QVERIFY(error.contains("does not contain a JSON object"));
}

QTEST_MAIN(StoreConfigurationTest)
#include "storeconfigurationtest.moc"
