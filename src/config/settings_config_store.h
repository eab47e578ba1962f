#pragma once

#include "config_store.h"

#include <QSettings>
#include <QString>
#include <QVariant>

#include <memory>

namespace Themis {
namespace Config {

// ============================================================
// SettingsConfigStore — QSettings 기반 설정 저장소
// ============================================================
class SettingsConfigStore : public ConfigStore {
    Q_OBJECT

public:
    // 플랫폼 기본 위치: QSettings("Themis", "Controller")
    explicit SettingsConfigStore(QObject* parent = nullptr);

    // INI 파일 경로 지정 (CLI --config, 테스트)
    explicit SettingsConfigStore(const QString& iniPath, QObject* parent = nullptr);

    ~SettingsConfigStore() override;

    QVariant value(const QString& key, const QVariant& defaultValue) const override;

    QString fileName() const;
    void sync();

protected:
    void storeValue(const QString& key, const QVariant& value) override;

private:
    static QString groupKey(const QString& key);

    std::unique_ptr<QSettings> m_settings;
};

} // namespace Config
} // namespace Themis
