#ifndef STORECONFIGURATION_H
#define STORECONFIGURATION_H

#include <QJsonObject>
#include <QString>
#include <QStringList>

// Products the application may query and sell. Built once at startup and
// read-only afterwards. An empty product list means "not configured" and
// every catalog load fails closed.
class StoreConfiguration
{
public:
    StoreConfiguration() = default;
    explicit StoreConfiguration(const QStringList &productIds,
                                const QString &subscriptionGroupId = QString());

    QStringList productIds() const { return _productIds; }
    QString subscriptionGroupId() const { return _subscriptionGroupId; }

    // Entitlement policy inputs
    QStringList premiumProductIds() const { return _premiumProductIds; }
    QStringList removeAdsProductIds() const { return _removeAdsProductIds; }
    void setPremiumProductIds(const QStringList &ids);
    void setRemoveAdsProductIds(const QStringList &ids);

    bool isConfigured() const { return !_productIds.isEmpty(); }
    bool contains(const QString &productId) const { return _productIds.contains(productId); }

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject &json, StoreConfiguration *configuration, QString *errorMessage = nullptr);
    static bool loadFromFile(const QString &path, StoreConfiguration *configuration, QString *errorMessage = nullptr);

private:
    QStringList _productIds;
    QString _subscriptionGroupId;
    QStringList _premiumProductIds;
    QStringList _removeAdsProductIds;
};

#endif // STORECONFIGURATION_H
