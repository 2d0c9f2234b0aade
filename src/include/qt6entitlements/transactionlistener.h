#ifndef TRANSACTIONLISTENER_H
#define TRANSACTIONLISTENER_H

#include <QMetaObject>
#include <QObject>

#include <qt6entitlements/transaction.h>

class AbstractPlatformStore;
class EntitlementStore;
class TransactionVerifier;

// Consumes the platform's transaction update stream for the lifetime of the
// engine. Started once and stopped once.
class TransactionListener : public QObject
{
    Q_OBJECT

    Q_PROPERTY(bool listening READ isListening NOTIFY listeningChanged)

public:
    enum State {
        NotStarted,
        Listening,
        Stopped
    };
    Q_ENUM(State)

    TransactionListener(AbstractPlatformStore * platform, const TransactionVerifier * verifier,
                        EntitlementStore * store, QObject * parent = nullptr);
    ~TransactionListener() override;

    bool start();
    bool stop();

    State state() const { return _state; }
    bool isListening() const { return _state == Listening; }

signals:
    void listeningChanged();
    void transactionVerified(const Transaction &transaction);
    void transactionRejected(const QString &reason);
    void transactionFinished(const QString &transactionId);

private slots:
    void onTransactionUpdated(const SignedTransaction &envelope);

private:
    AbstractPlatformStore * _platform = nullptr;
    const TransactionVerifier * _verifier = nullptr;
    EntitlementStore * _store = nullptr;
    State _state = NotStarted;
    QMetaObject::Connection _connection;
};

#endif // TRANSACTIONLISTENER_H
