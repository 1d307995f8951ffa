#pragma once

#include <QObject>
#include "IConfigService.hpp"

namespace adk {

class YamlConfig;

/// Concrete IConfigService wrapping YamlConfig.
/// Single writer: only one ConfigService instance should exist.
/// Does NOT own the YamlConfig (caller manages lifetime).
///
/// Policy values are read once at startup; a changed value takes effect
/// after the service restarts.
class ConfigService : public QObject, public IConfigService {
    Q_OBJECT
public:
    explicit ConfigService(YamlConfig* config, const QString& configPath, QObject* parent = nullptr);

    QVariant value(const QString& key) const override;
    bool setValue(const QString& key, const QVariant& value) override;
    QStringList keys() const override;
    void save() override;

    const QString& configPath() const { return configPath_; }

signals:
    void configChanged(const QString& path, const QVariant& value);

private:
    YamlConfig* config_;
    QString configPath_;
};

} // namespace adk
