#include "settings_config_store.h"

#include <QDebug>

namespace Themis {
namespace Config {

namespace {
constexpr const char* SETTINGS_GROUP = "controller/";
} // namespace

SettingsConfigStore::SettingsConfigStore(QObject* parent)
    : ConfigStore(parent)
    , m_settings(std::make_unique<QSettings>("Themis", "Controller"))
{
    qDebug() << "[ConfigStore] 설정 파일:" << m_settings->fileName();
}

SettingsConfigStore::SettingsConfigStore(const QString& iniPath, QObject* parent)
    : ConfigStore(parent)
    , m_settings(std::make_unique<QSettings>(iniPath, QSettings::IniFormat))
{
    qDebug() << "[ConfigStore] 설정 파일:" << m_settings->fileName();
}

SettingsConfigStore::~SettingsConfigStore()
{
    m_settings->sync();
}

QVariant SettingsConfigStore::value(const QString& key, const QVariant& defaultValue) const
{
    return m_settings->value(groupKey(key), defaultValue);
}

void SettingsConfigStore::storeValue(const QString& key, const QVariant& value)
{
    m_settings->setValue(groupKey(key), value);
    m_settings->sync();

    if (m_settings->status() != QSettings::NoError) {
        qWarning() << "[ConfigStore] 저장 실패:" << key << "status" << m_settings->status();
    }
}

QString SettingsConfigStore::fileName() const
{
    return m_settings->fileName();
}

void SettingsConfigStore::sync()
{
    m_settings->sync();
}

QString SettingsConfigStore::groupKey(const QString& key)
{
    return QLatin1String(SETTINGS_GROUP) + key;
}

} // namespace Config
} // namespace Themis
