#include <qt6entitlements/entitlementpolicy.h>
#include <qt6entitlements/storeconfiguration.h>

EntitlementPolicy::EntitlementPolicy(const QStringList &premiumProductIds, const QStringList &removeAdsProductIds)
    : _premiumProductIds(premiumProductIds)
    , _removeAdsProductIds(removeAdsProductIds)
{
}

/*static*/ EntitlementPolicy EntitlementPolicy::fromConfiguration(const StoreConfiguration &configuration)
{
    return EntitlementPolicy(configuration.premiumProductIds(), configuration.removeAdsProductIds());
}

bool EntitlementPolicy::hasPremium(const QSet<QString> &ownedProductIds, const QList<ActiveSubscription> &subscriptions) const
{
    for (const ActiveSubscription &subscription : subscriptions) {
        if (subscription.isActive())
            return true;
    }

    for (const QString &id : _premiumProductIds) {
        if (ownedProductIds.contains(id))
            return true;
    }
    return false;
}

bool EntitlementPolicy::hasRemovedAds(const QSet<QString> &ownedProductIds, const QList<ActiveSubscription> &subscriptions) const
{
    if (hasPremium(ownedProductIds, subscriptions))
        return true;

    for (const QString &id : _removeAdsProductIds) {
        if (ownedProductIds.contains(id))
            return true;
    }
    return false;
}
