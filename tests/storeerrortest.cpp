#include <QtTest/QtTest>

#include <qt6entitlements/storeerror.h>

class StoreErrorTest : public QObject
{
    Q_OBJECT

private slots:
    void defaultIsNoError();
    void cancellationAndPendingAreNotFailures();
    void descriptionAppendsMessage();
    void everyCodeHasADescription();
};

void StoreErrorTest::defaultIsNoError()
{
    const StoreError error;
    QCOMPARE(error.code, StoreError::NoError);
    QVERIFY(!error.isError());
    QCOMPARE(error.description(), QStringLiteral("Success"));
}

void StoreErrorTest::cancellationAndPendingAreNotFailures()
{
    QVERIFY(!StoreError(StoreError::UserCancelled).isError());
    QVERIFY(!StoreError(StoreError::Pending).isError());
    QVERIFY(StoreError(StoreError::PurchaseFailed).isError());
    QVERIFY(StoreError(StoreError::UnknownPurchaseOutcome).isError());
}

void StoreErrorTest::descriptionAppendsMessage()
{
    const StoreError error(StoreError::CatalogFetchError, "Network error occurred", 2);
    QCOMPARE(error.description(), QStringLiteral("Failed to load products: Network error occurred"));
    QCOMPARE(error.platformCode, 2);

    QCOMPARE(StoreError(StoreError::ProductNotFound).description(), QStringLiteral("Product not found"));
}

void StoreErrorTest::everyCodeHasADescription()
{
    const QMetaEnum codes = QMetaEnum::fromType<StoreError::Code>();
    for (int i = 0; i < codes.keyCount(); ++i) {
        const auto code = static_cast<StoreError::Code>(codes.value(i));
        QVERIFY2(!StoreError::codeDescription(code).startsWith("Unknown error code"), codes.key(i));
    }
}

QTEST_MAIN(StoreErrorTest)
#include "storeerrortest.moc"
