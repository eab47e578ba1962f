/**
 * @file config_store.h
 * @brief 테마 컨트롤러 설정 저장소 추상화
 *
 * 결정 엔진은 이 인터페이스에만 의존함. 실제 저장 방식(QSettings 등)은
 * 하위 클래스가 value()/storeValue()로 제공하고, 타입별 접근자와
 * 변경 알림(changed 시그널)은 이 클래스가 담당.
 */

#ifndef THEMIS_CONFIG_STORE_H
#define THEMIS_CONFIG_STORE_H

#include "core/theme_types.h"

#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariant>

namespace Themis {
namespace Config {

/**
 * @brief 설정 키 (기존 저장 데이터와 호환되는 이름)
 */
namespace Keys {
constexpr const char* MasterEnabled          = "masterEnabled";
constexpr const char* ManualThemeId          = "manualThemeId";
constexpr const char* RandomEnabled          = "randomEnabled";
constexpr const char* RandomPool             = "randomPoolSerialized";
constexpr const char* RandomOnStartup        = "randomOnStartup";
constexpr const char* RandomIntervalEnabled  = "randomIntervalEnabled";
constexpr const char* RandomIntervalMinutes  = "randomIntervalMinutes";
constexpr const char* RandomAvoidRepeat      = "randomAvoidRepeat";
constexpr const char* RandomCycleMode        = "randomCycleMode";
constexpr const char* ScheduleEnabled        = "scheduleEnabled";
constexpr const char* ScheduleRules          = "scheduleRulesSerialized";
constexpr const char* ScheduleTimezoneOffset = "scheduleTimezoneOffset";
} // namespace Keys

/**
 * @class ConfigStore
 * @brief 타입 지정 읽기/쓰기 + 변경 구독
 */
class ConfigStore : public QObject {
    Q_OBJECT

public:
    explicit ConfigStore(QObject* parent = nullptr);
    ~ConfigStore() override = default;

    /**
     * @brief 원시 값 조회
     * @param key 설정 키
     * @param defaultValue 저장된 값이 없을 때 반환할 값
     */
    virtual QVariant value(const QString& key, const QVariant& defaultValue) const = 0;

    /**
     * @brief 원시 값 저장. 값이 실제로 바뀐 경우에만 changed(key) 발생
     */
    void setValue(const QString& key, const QVariant& value);

    // ---- 일반 ----
    bool masterEnabled() const;
    void setMasterEnabled(bool enabled);

    QString manualThemeId() const;
    void setManualThemeId(const QString& themeId);

    // ---- 랜덤 ----
    bool randomEnabled() const;
    void setRandomEnabled(bool enabled);

    QStringList randomPool() const;
    void setRandomPool(const QStringList& pool);

    /**
     * @brief 풀에 있으면 제거, 없으면 뒤에 추가
     * @return 토글 후 포함 여부
     */
    bool togglePoolMember(const QString& themeId);

    bool randomOnStartup() const;
    void setRandomOnStartup(bool enabled);

    bool randomIntervalEnabled() const;
    void setRandomIntervalEnabled(bool enabled);

    /**
     * @brief 랜덤 주기 (분). 1 미만 값은 1로 보정
     */
    int randomIntervalMinutes() const;
    void setRandomIntervalMinutes(int minutes);

    bool randomAvoidRepeat() const;
    void setRandomAvoidRepeat(bool enabled);

    bool randomCycleMode() const;
    void setRandomCycleMode(bool enabled);

    /**
     * @brief 랜덤 관련 설정 전체 스냅샷
     */
    RandomizationConfig randomizationConfig() const;

    // ---- 스케줄 ----
    bool scheduleEnabled() const;
    void setScheduleEnabled(bool enabled);

    QList<ScheduleRule> scheduleRules() const;
    void setScheduleRules(const QList<ScheduleRule>& rules);

    /**
     * @brief 규칙 추가 (같은 ID가 있으면 실패)
     */
    bool addScheduleRule(const ScheduleRule& rule);

    /**
     * @brief ID가 같은 규칙 교체 (순서 유지)
     */
    bool updateScheduleRule(const ScheduleRule& rule);

    bool removeScheduleRule(const QString& ruleId);

    int scheduleTimezoneOffsetMinutes() const;
    void setScheduleTimezoneOffsetMinutes(int minutes);

signals:
    /**
     * @brief 설정 값이 바뀔 때 발생
     * @param key 변경된 키
     */
    void changed(const QString& key);

protected:
    /**
     * @brief 하위 클래스의 실제 저장
     */
    virtual void storeValue(const QString& key, const QVariant& value) = 0;
};

} // namespace Config
} // namespace Themis

#endif // THEMIS_CONFIG_STORE_H
