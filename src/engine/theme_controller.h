/**
 * @file theme_controller.h
 * @brief 테마 결정 엔진 — 스케줄 > 랜덤 > 수동 우선순위로 활성 테마 결정
 *
 * 세 가지 독립 입력(수동 선택, 랜덤 선택, 요일/시간 스케줄)을
 * 하나의 활성 테마로 합치고 ThemeApplier로 적용한다.
 * 모든 동작은 Qt 이벤트 루프 단일 스레드에서 실행됨.
 */

#ifndef THEMIS_THEME_CONTROLLER_H
#define THEMIS_THEME_CONTROLLER_H

#include "core/random_selector.h"
#include "core/theme_types.h"

#include <QDateTime>
#include <QMetaObject>
#include <QObject>
#include <QString>
#include <QTimer>

#include <functional>
#include <optional>

namespace Themis {

namespace Catalog {
class CatalogProvider;
class ThemeApplier;
} // namespace Catalog

namespace Config {
class ConfigStore;
} // namespace Config

namespace Engine {

/**
 * @class ThemeController
 * @brief 활성 테마 결정 상태 머신
 *
 * activeSource ∈ {manual, random, schedule}. 같은 (테마, 출처) 쌍은
 * 연속으로 두 번 적용하지 않는다 (깜빡임/중복 쓰기 방지).
 * 랜덤 주기 타이머와 30초 스케줄 폴링 타이머는 설정 변경 시
 * 항상 먼저 정지한 뒤 다시 시작한다.
 */
class ThemeController : public QObject {
    Q_OBJECT

public:
    using Clock = std::function<QDateTime()>;

    /// 스케줄 폴링 주기 (30초)
    static constexpr int SCHEDULE_POLL_MS = 30 * 1000;

    /**
     * @param config 설정 저장소 (소유하지 않음)
     * @param catalog 테마 카탈로그 (소유하지 않음)
     * @param applier 테마 적용기 (소유하지 않음)
     */
    ThemeController(Config::ConfigStore* config,
                    Catalog::CatalogProvider* catalog,
                    Catalog::ThemeApplier* applier,
                    QObject* parent = nullptr);
    ~ThemeController() override;

    ThemeController(const ThemeController&) = delete;
    ThemeController& operator=(const ThemeController&) = delete;

    /**
     * @brief 카탈로그 스냅샷, 설정 구독, 타이머 설정 후 최초 평가
     *
     * 랜덤이 켜져 있고 "시작 시 랜덤"이면 랜덤 선택도 한 번 실행.
     */
    void start();

    /**
     * @brief 타이머 정지, 설정 구독 해제 (여러 번 호출해도 안전)
     *
     * 엔진 상태(랜덤 선택, 순환 대기열)는 다음 start()에서 새로 만들어짐.
     */
    void stop();

    /**
     * @brief 시작 → (선택) 랜덤 한 번 → 정지. CLI 일회성 실행용
     *
     * 시작 시 랜덤이 이미 실행되면 추가로 고르지 않으므로 테마는 최대 한 번만 바뀜.
     */
    void runOnce(bool randomize);

    /**
     * @brief 새 랜덤 테마를 골라 기억한 뒤 평가
     *
     * 스케줄이 활성 상태면 선택은 기억만 되고 스케줄이 끝난 뒤 적용됨.
     * @param reason 로그용 사유 ("startup", "interval", "manual" 등)
     */
    void triggerRandomization(const QString& reason);

    /**
     * @brief 우선순위에 따라 활성 테마 결정
     *
     * 1. 스케줄 규칙  2. 기억된 랜덤 선택  3. 수동 테마.
     * 아무것도 없으면 현재 테마를 유지.
     */
    void evaluate(const QString& reason);

    /**
     * @brief 카탈로그 다시 읽기 (수동 기본값 보정 포함)
     */
    void refreshCatalog();

    const EngineState& state() const { return m_state; }
    bool isRunning() const { return m_running; }

    bool isRandomTimerActive() const;
    bool isScheduleTimerActive() const;
    int randomIntervalMs() const;
    int scheduleIntervalMs() const;

    /// 현재 시각 공급자 교체 (기본: QDateTime::currentDateTime)
    void setClock(Clock clock);

    /// 랜덤 선택용 난수 생성기 교체 (소유하지 않음)
    void setRandomGenerator(QRandomGenerator* rng);

signals:
    void themeApplied(const QString& themeId, Themis::ActiveSource source);
    void randomPicked(const QString& themeId);

private:
    void onSettingsChanged(const QString& key);
    void applySettingsChange();

    void ensureManualThemeDefault();
    void setupRandomTimer();
    void setupScheduleTimer();

    std::optional<QString> scheduledTheme(const QDateTime& now) const;
    void evaluateNow(const QString& reason);
    void updateState(const QString& themeId, ActiveSource source);

    // 실행 중 재진입 차단. 도중에 들어온 설정 변경은 끝난 뒤 한 번 처리
    template <typename Body>
    void runExclusive(const char* operation, Body&& body);

    Config::ConfigStore* m_config;
    Catalog::CatalogProvider* m_catalog;
    Catalog::ThemeApplier* m_applier;

    EngineState m_state;
    Core::RandomSelector m_selector;
    Clock m_clock;

    QTimer* m_randomTimer;
    QTimer* m_scheduleTimer;
    QMetaObject::Connection m_configConnection;

    bool m_running = false;
    bool m_busy = false;
    bool m_settingsChangePending = false;
};

} // namespace Engine
} // namespace Themis

Q_DECLARE_METATYPE(Themis::ActiveSource)

#endif // THEMIS_THEME_CONTROLLER_H
