#ifndef ACTIVESUBSCRIPTION_H
#define ACTIVESUBSCRIPTION_H

#include <QMetaType>
#include <QQmlEngine>

#include <qt6entitlements/product.h>

struct ActiveSubscription
{
    Q_GADGET
    QML_VALUE_TYPE(activeSubscription)

    Q_PROPERTY(Product product MEMBER product CONSTANT)
    Q_PROPERTY(State state MEMBER state CONSTANT)
    Q_PROPERTY(bool active READ isActive CONSTANT)

public:
    // Renewal status as reported by the platform
    enum State {
        Subscribed,
        InGracePeriod,
        Expired,
        NotSubscribed
    };
    Q_ENUM(State)

    Product product;
    State state = NotSubscribed;

    bool isActive() const { return state == Subscribed || state == InGracePeriod; }

    bool operator==(const ActiveSubscription &other) const { return product == other.product && state == other.state; }
    bool operator!=(const ActiveSubscription &other) const { return !(*this == other); }
};

#endif // ACTIVESUBSCRIPTION_H
