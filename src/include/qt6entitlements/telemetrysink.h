#ifndef TELEMETRYSINK_H
#define TELEMETRYSINK_H

#include <QString>
#include <QVariantMap>

// Analytics collaborator. Implemented by the application over its analytics
// SDK; the engine only reports event names and parameters.
class TelemetrySink
{
public:
    virtual ~TelemetrySink() = default;

    virtual void trackEvent(const QString &name, const QVariantMap &parameters = QVariantMap()) = 0;
};

#endif // TELEMETRYSINK_H
