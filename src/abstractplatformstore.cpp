#include <qt6entitlements/abstractplatformstore.h>

#include <QDebug>

AbstractPlatformStore::AbstractPlatformStore(QObject * parent) : QObject(parent)
{
    qDebug() << "Creating platform store";

    connect(this, &AbstractPlatformStore::canMakePurchasesChanged, this, [this]() {
        qDebug() << "Platform store canMakePurchases status changed to"
                 << (canMakePurchases() ? "enabled" : "disabled");
    });
}
