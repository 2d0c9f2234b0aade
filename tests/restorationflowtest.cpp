#include <QtTest/QtTest>
#include <QSignalSpy>

#include <memory>

#include <qt6entitlements/entitlementstore.h>
#include <qt6entitlements/restorationflow.h>

#include "testfixtures.h"

namespace {

struct RestoreResult
{
    bool done = false;
    QStringList owned;
    StoreError error;
};

} // namespace

class RestorationFlowTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void nothingToRestore();
    void restoresEverythingOwned();
    void restoredSetContainsPreviouslyOwned();
    void revokedAndForgedEntriesGrantNothing();
    void historyFailureIsRestoreFailed();
    void refreshFailureIsRestoreFailed();

private:
    void restore(RestoreResult * result);

    std::unique_ptr<QObject> _root;
    SandboxPlatformStore * _sandbox = nullptr;
    std::unique_ptr<TransactionVerifier> _verifier;
    EntitlementStore * _store = nullptr;
    RestorationFlow * _restoration = nullptr;
};

void RestorationFlowTest::init()
{
    _root = std::make_unique<QObject>();
    _sandbox = makeSandbox(_root.get());
    _verifier = std::make_unique<TransactionVerifier>(testSigningKey());
    _store = new EntitlementStore(_sandbox, _verifier.get(), _root.get());
    _store->setCatalog(sampleCatalog());
    _restoration = new RestorationFlow(_sandbox, _verifier.get(), _store, _root.get());
}

void RestorationFlowTest::cleanup()
{
    _root.reset();
    _verifier.reset();
}

void RestorationFlowTest::restore(RestoreResult * result)
{
    _restoration->restore(this, [result](const QStringList &owned, const StoreError &error) {
        result->owned = owned;
        result->error = error;
        result->done = true;
    });
    QTRY_VERIFY(result->done);
}

void RestorationFlowTest::nothingToRestore()
{
    QSignalSpy restoring(_restoration, &RestorationFlow::restoringChanged);
    QSignalSpy finished(_restoration, &RestorationFlow::restoreFinished);

    RestoreResult result;
    restore(&result);

    QVERIFY(!result.error.isError());
    QVERIFY(result.owned.isEmpty());
    QCOMPARE(restoring.count(), 2);
    QCOMPARE(finished.count(), 1);
    QVERIFY(!_restoration->isRestoring());
}

void RestorationFlowTest::restoresEverythingOwned()
{
    // Simulates a reinstall: the platform knows, local state does not
    _sandbox->grant("removeads", false);
    _sandbox->grant("premium.monthly", false);
    QVERIFY(_store->ownedProductIds().isEmpty());

    RestoreResult result;
    restore(&result);

    QVERIFY(!result.error.isError());
    QCOMPARE(result.owned, QStringList({"premium.monthly", "removeads"}));
    QCOMPARE(_store->ownedProductIds(), result.owned);
    QCOMPARE(_sandbox->requestCount(SandboxPlatformStore::TransactionHistory), 1);
}

void RestorationFlowTest::restoredSetContainsPreviouslyOwned()
{
    _sandbox->grant("removeads", false);
    bool refreshed = false;
    _store->refresh(this, [&refreshed](const StoreError &) { refreshed = true; });
    QTRY_VERIFY(refreshed);
    const QStringList before = _store->ownedProductIds();

    _sandbox->grant("premium.yearly", false);
    RestoreResult result;
    restore(&result);

    for (const QString &id : before)
        QVERIFY(result.owned.contains(id));
    QVERIFY(result.owned.contains("premium.yearly"));
}

void RestorationFlowTest::revokedAndForgedEntriesGrantNothing()
{
    const QString refunded = _sandbox->grant("removeads", false);
    QVERIFY(_sandbox->revoke(refunded));
    _sandbox->addForgedLedgerEntry("premium.yearly");

    RestoreResult result;
    restore(&result);

    QVERIFY(!result.error.isError());
    QVERIFY(result.owned.isEmpty());
}

void RestorationFlowTest::historyFailureIsRestoreFailed()
{
    _sandbox->grant("removeads", false);
    _sandbox->setFailure(SandboxPlatformStore::TransactionHistory, StoreError(StoreError::NetworkError, "offline", 2));

    RestoreResult result;
    restore(&result);

    QCOMPARE(result.error.code, StoreError::RestoreFailed);
    QCOMPARE(result.error.platformCode, 2);
    QCOMPARE(result.error.message, QStringLiteral("Network error occurred: offline"));
    QVERIFY(result.owned.isEmpty());
    QCOMPARE(_sandbox->requestCount(SandboxPlatformStore::CurrentEntitlements), 0);
    QVERIFY(!_restoration->isRestoring());
}

void RestorationFlowTest::refreshFailureIsRestoreFailed()
{
    _sandbox->grant("removeads", false);
    _sandbox->setFailure(SandboxPlatformStore::CurrentEntitlements, StoreError(StoreError::ServiceUnavailable));

    RestoreResult result;
    restore(&result);

    QCOMPARE(result.error.code, StoreError::RestoreFailed);
    QVERIFY(!_store->isOwned("removeads"));
}

QTEST_MAIN(RestorationFlowTest)
#include "restorationflowtest.moc"
