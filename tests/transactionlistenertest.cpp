#include <QtTest/QtTest>
#include <QSignalSpy>

#include <memory>

#include <qt6entitlements/entitlementstore.h>
#include <qt6entitlements/transactionlistener.h>

#include "testfixtures.h"

class TransactionListenerTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void startsAndStopsOnce();
    void verifiedUpdateIsAppliedThenFinished();
    void forgedUpdateIsNeverFinished();
    void updateLeftUnfinishedWhenRefreshFails();
    void revocationRemovesOwnership();
    void approvedPurchaseUnlocks();
    void stoppedListenerIgnoresUpdates();

private:
    std::unique_ptr<QObject> _root;
    SandboxPlatformStore * _sandbox = nullptr;
    std::unique_ptr<TransactionVerifier> _verifier;
    EntitlementStore * _store = nullptr;
    TransactionListener * _listener = nullptr;
};

void TransactionListenerTest::init()
{
    _root = std::make_unique<QObject>();
    _sandbox = makeSandbox(_root.get());
    _verifier = std::make_unique<TransactionVerifier>(testSigningKey());
    _store = new EntitlementStore(_sandbox, _verifier.get(), _root.get());
    _store->setCatalog(sampleCatalog());
    _listener = new TransactionListener(_sandbox, _verifier.get(), _store, _root.get());
}

void TransactionListenerTest::cleanup()
{
    _root.reset();
    _verifier.reset();
}

void TransactionListenerTest::startsAndStopsOnce()
{
    QSignalSpy listening(_listener, &TransactionListener::listeningChanged);
    QCOMPARE(_listener->state(), TransactionListener::NotStarted);

    QVERIFY(_listener->start());
    QVERIFY(_listener->isListening());
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("can only be started once"));
    QVERIFY(!_listener->start());

    QVERIFY(_listener->stop());
    QCOMPARE(_listener->state(), TransactionListener::Stopped);
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("is not running"));
    QVERIFY(!_listener->stop());
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("can only be started once"));
    QVERIFY(!_listener->start());

    QCOMPARE(listening.count(), 2);
}

void TransactionListenerTest::verifiedUpdateIsAppliedThenFinished()
{
    QSignalSpy verified(_listener, &TransactionListener::transactionVerified);
    QSignalSpy finished(_listener, &TransactionListener::transactionFinished);
    QVERIFY(_listener->start());

    // A purchase made on another device arrives unannounced
    const QString transactionId = _sandbox->grant("coins.100");
    QVERIFY(!_sandbox->isFinished(transactionId));

    QTRY_COMPARE(finished.count(), 1);
    QCOMPARE(finished.first().first().toString(), transactionId);
    QCOMPARE(verified.count(), 1);
    QVERIFY(_sandbox->isFinished(transactionId));
    QVERIFY(_store->completedReplays() >= 1);
}

void TransactionListenerTest::forgedUpdateIsNeverFinished()
{
    QSignalSpy rejected(_listener, &TransactionListener::transactionRejected);
    QSignalSpy verified(_listener, &TransactionListener::transactionVerified);
    QVERIFY(_listener->start());

    _sandbox->pushForgedUpdate("premium.monthly");

    QTRY_COMPARE(rejected.count(), 1);
    QCOMPARE(rejected.first().first().toString(), QStringLiteral("Signature mismatch"));
    QCOMPARE(verified.count(), 0);
    QCOMPARE(_sandbox->requestCount(SandboxPlatformStore::FinishTransaction), 0);
    QCOMPARE(_sandbox->requestCount(SandboxPlatformStore::CurrentEntitlements), 0);
    QVERIFY(!_store->isOwned("premium.monthly"));
}

void TransactionListenerTest::updateLeftUnfinishedWhenRefreshFails()
{
    QSignalSpy verified(_listener, &TransactionListener::transactionVerified);
    QSignalSpy refreshed(_store, &EntitlementStore::refreshFinished);
    QSignalSpy finished(_listener, &TransactionListener::transactionFinished);
    _sandbox->setFailure(SandboxPlatformStore::CurrentEntitlements, StoreError(StoreError::NetworkError));
    QVERIFY(_listener->start());

    const QString transactionId = _sandbox->grant("coins.100");

    QTRY_COMPARE(refreshed.count(), 1);
    QCOMPARE(verified.count(), 1);
    QCOMPARE(finished.count(), 0);
    QCOMPARE(_sandbox->requestCount(SandboxPlatformStore::FinishTransaction), 0);
    QCOMPARE(_sandbox->unfinishedTransactionIds(), QStringList({transactionId}));
}

void TransactionListenerTest::revocationRemovesOwnership()
{
    QSignalSpy finished(_listener, &TransactionListener::transactionFinished);
    QVERIFY(_listener->start());

    const QString transactionId = _sandbox->grant("removeads");
    QTRY_COMPARE(finished.count(), 1);
    QVERIFY(_store->isOwned("removeads"));

    QVERIFY(_sandbox->revoke(transactionId));
    QTRY_COMPARE(finished.count(), 2);
    QVERIFY(!_store->isOwned("removeads"));
}

void TransactionListenerTest::approvedPurchaseUnlocks()
{
    QSignalSpy finished(_listener, &TransactionListener::transactionFinished);
    QVERIFY(_listener->start());
    _sandbox->setPurchaseBehavior("removeads", SandboxPlatformStore::AskToBuy);

    PlatformPurchaseOutcome::Status status = PlatformPurchaseOutcome::Unknown;
    bool answered = false;
    _sandbox->submitPurchase("removeads", this, [&status, &answered](const PlatformPurchaseOutcome &outcome) {
        status = outcome.status;
        answered = true;
    });
    QTRY_VERIFY(answered);
    QCOMPARE(status, PlatformPurchaseOutcome::Pending);
    QVERIFY(_sandbox->transactions().isEmpty());

    QVERIFY(_sandbox->approvePendingPurchase("removeads"));
    QTRY_COMPARE(finished.count(), 1);
    QVERIFY(_store->isOwned("removeads"));
    QVERIFY(_sandbox->unfinishedTransactionIds().isEmpty());
}

void TransactionListenerTest::stoppedListenerIgnoresUpdates()
{
    QSignalSpy verified(_listener, &TransactionListener::transactionVerified);
    QVERIFY(_listener->start());
    QVERIFY(_listener->stop());

    _sandbox->grant("removeads");
    QTest::qWait(50);

    QCOMPARE(verified.count(), 0);
    QCOMPARE(_sandbox->requestCount(SandboxPlatformStore::CurrentEntitlements), 0);
}

QTEST_MAIN(TransactionListenerTest)
#include "transactionlistenertest.moc"
