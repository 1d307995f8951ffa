#include "ConfigService.hpp"
#include "core/YamlConfig.hpp"
#include <QDebug>

namespace adk {

ConfigService::ConfigService(YamlConfig* config, const QString& configPath, QObject* parent)
    : QObject(parent), config_(config), configPath_(configPath)
{
}

QVariant ConfigService::value(const QString& key) const
{
    return config_->valueByPath(key);
}

bool ConfigService::setValue(const QString& key, const QVariant& val)
{
    if (!config_->setValueByPath(key, val)) {
        qWarning() << "[Config] Rejected write to unknown key" << key;
        return false;
    }
    emit configChanged(key, config_->valueByPath(key));
    return true;
}

QStringList ConfigService::keys() const
{
    return config_->scalarPaths();
}

void ConfigService::save()
{
    config_->save(configPath_);
    qInfo() << "[Config] Saved" << configPath_;
}

} // namespace adk
