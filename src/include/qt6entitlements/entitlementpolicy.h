#ifndef ENTITLEMENTPOLICY_H
#define ENTITLEMENTPOLICY_H

#include <QList>
#include <QSet>
#include <QStringList>

#include <qt6entitlements/activesubscription.h>

class StoreConfiguration;

// Application policy layered over the entitlement set. Evaluated on every
// query against the latest committed snapshot.
class EntitlementPolicy
{
public:
    EntitlementPolicy() = default;
    EntitlementPolicy(const QStringList &premiumProductIds, const QStringList &removeAdsProductIds);

    static EntitlementPolicy fromConfiguration(const StoreConfiguration &configuration);

    QStringList premiumProductIds() const { return _premiumProductIds; }
    QStringList removeAdsProductIds() const { return _removeAdsProductIds; }

    // Premium: any active subscription, or ownership of a premium product.
    bool hasPremium(const QSet<QString> &ownedProductIds, const QList<ActiveSubscription> &subscriptions) const;
    // Ads removed: premium, or ownership of an ads-removal product.
    bool hasRemovedAds(const QSet<QString> &ownedProductIds, const QList<ActiveSubscription> &subscriptions) const;

private:
    QStringList _premiumProductIds;
    QStringList _removeAdsProductIds;
};

#endif // ENTITLEMENTPOLICY_H
