#include "theme_controller.h"

#include "catalog/theme_catalog.h"
#include "config/config_store.h"
#include "core/schedule_resolver.h"

#include <QDebug>

#include <algorithm>
#include <limits>
#include <utility>

namespace Themis {
namespace Engine {

ThemeController::ThemeController(Config::ConfigStore* config,
                                 Catalog::CatalogProvider* catalog,
                                 Catalog::ThemeApplier* applier,
                                 QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_catalog(catalog)
    , m_applier(applier)
    , m_clock([] { return QDateTime::currentDateTime(); })
    , m_randomTimer(new QTimer(this))
    , m_scheduleTimer(new QTimer(this))
{
    m_randomTimer->setObjectName(QStringLiteral("randomTimer"));
    m_scheduleTimer->setObjectName(QStringLiteral("scheduleTimer"));
    m_scheduleTimer->setInterval(SCHEDULE_POLL_MS);
    connect(m_randomTimer, &QTimer::timeout, this, [this]() {
        triggerRandomization("interval");
    });
    connect(m_scheduleTimer, &QTimer::timeout, this, [this]() {
        evaluate("schedule-tick");
    });
}

ThemeController::~ThemeController()
{
    stop();
}

template <typename Body>
void ThemeController::runExclusive(const char* operation, Body&& body)
{
    if (m_busy) {
        qDebug() << "[ThemeController] 실행 중 재진입 무시:" << operation;
        return;
    }

    m_busy = true;
    body();
    while (m_settingsChangePending) {
        m_settingsChangePending = false;
        applySettingsChange();
    }
    m_busy = false;
}

// ============================================================
// 시작 / 종료
// ============================================================

void ThemeController::start()
{
    if (m_running) return;
    if (!m_config) {
        qWarning() << "[ThemeController] 설정 저장소 없음 — 시작하지 않음";
        return;
    }

    runExclusive("start", [this]() {
        // 이전 실행의 랜덤 선택/순환 대기열은 이어받지 않음
        m_state = EngineState{};
        refreshCatalog();

        // 현재 적용 중인 테마는 수동 출처로 간주
        m_state.activeTheme = m_catalog ? m_catalog->activeThemeId() : std::nullopt;
        m_state.activeSource = ActiveSource::Manual;

        m_configConnection = connect(m_config, &Config::ConfigStore::changed,
                                     this, &ThemeController::onSettingsChanged);
        m_running = true;

        setupRandomTimer();
        setupScheduleTimer();

        qInfo() << "[ThemeController] 시작 — 테마" << m_state.availableThemes.size() << "개, 현재:"
                << m_state.activeTheme.value_or(QStringLiteral("(없음)"));

        evaluateNow("start");
    });

    if (m_config->randomEnabled() && m_config->randomOnStartup()) {
        triggerRandomization("startup");
    }
}

void ThemeController::stop()
{
    m_randomTimer->stop();
    m_scheduleTimer->stop();

    if (m_configConnection) {
        disconnect(m_configConnection);
        m_configConnection = {};
    }

    if (m_running) {
        m_running = false;
        qInfo() << "[ThemeController] 정지";
    }
}

void ThemeController::runOnce(bool randomize)
{
    const bool pickedOnStart = m_config && m_config->randomEnabled()
                               && m_config->randomOnStartup();
    start();
    if (randomize && !pickedOnStart) {
        triggerRandomization("manual");
    }
    stop();
}

// ============================================================
// 설정 변경 처리
// ============================================================

void ThemeController::onSettingsChanged(const QString& key)
{
    if (m_busy) {
        m_settingsChangePending = true;
        return;
    }
    qDebug() << "[ThemeController] 설정 변경:" << key;
    runExclusive("settings-change", [this]() { applySettingsChange(); });
}

void ThemeController::applySettingsChange()
{
    refreshCatalog();
    setupRandomTimer();
    setupScheduleTimer();
    evaluateNow("settings-change");
}

void ThemeController::refreshCatalog()
{
    m_state.availableThemes = m_catalog ? m_catalog->listThemes() : QList<ThemeDescriptor>{};
    ensureManualThemeDefault();
}

void ThemeController::ensureManualThemeDefault()
{
    if (!m_config || !m_config->manualThemeId().isEmpty()) return;
    if (m_state.availableThemes.isEmpty()) return;

    const QString first = m_state.availableThemes.first().id;
    qInfo() << "[ThemeController] 수동 테마 미설정 — 기본값으로" << first << "지정";
    m_config->setManualThemeId(first);
}

// ============================================================
// 타이머
// ============================================================

void ThemeController::setupRandomTimer()
{
    // 새 타이머를 켜기 전에 항상 기존 타이머부터 정지
    m_randomTimer->stop();

    if (!m_running) return;
    if (!m_config->masterEnabled() || !m_config->randomEnabled()
        || !m_config->randomIntervalEnabled()) {
        return;
    }

    const qint64 ms = static_cast<qint64>(m_config->randomIntervalMinutes()) * 60 * 1000;
    m_randomTimer->setInterval(static_cast<int>(
        std::min<qint64>(ms, std::numeric_limits<int>::max())));
    m_randomTimer->start();
    qDebug() << "[ThemeController] 랜덤 타이머:" << m_config->randomIntervalMinutes() << "분";
}

void ThemeController::setupScheduleTimer()
{
    m_scheduleTimer->stop();

    if (!m_running) return;
    if (!m_config->masterEnabled() || !m_config->scheduleEnabled()) return;

    m_scheduleTimer->start();
}

bool ThemeController::isRandomTimerActive() const
{
    return m_randomTimer->isActive();
}

bool ThemeController::isScheduleTimerActive() const
{
    return m_scheduleTimer->isActive();
}

int ThemeController::randomIntervalMs() const
{
    return m_randomTimer->interval();
}

int ThemeController::scheduleIntervalMs() const
{
    return m_scheduleTimer->interval();
}

// ============================================================
// 랜덤 선택
// ============================================================

void ThemeController::triggerRandomization(const QString& reason)
{
    if (!m_config || !m_config->masterEnabled() || !m_config->randomEnabled()) return;

    runExclusive("randomize", [this, &reason]() {
        const auto pick = m_selector.select(m_state.availableThemes,
                                            m_config->randomizationConfig(),
                                            m_state);
        if (!pick) {
            qDebug() << "[ThemeController] 랜덤 후보 없음 (" << reason << ")";
            return;
        }

        // 스케줄에 가려져도 기억해 두었다가 스케줄 종료 후 적용
        m_state.lastRandomTheme = pick;
        qInfo() << "[ThemeController] 랜덤 선택:" << *pick << "(" << reason << ")";
        emit randomPicked(*pick);

        evaluateNow(reason);
    });
}

// ============================================================
// 평가
// ============================================================

void ThemeController::evaluate(const QString& reason)
{
    runExclusive("evaluate", [this, &reason]() { evaluateNow(reason); });
}

std::optional<QString> ThemeController::scheduledTheme(const QDateTime& now) const
{
    if (!m_config->scheduleEnabled()) return std::nullopt;
    return Core::ScheduleResolver::resolve(m_config->scheduleRules(), now,
                                           m_config->scheduleTimezoneOffsetMinutes());
}

void ThemeController::evaluateNow(const QString& reason)
{
    if (!m_config || !m_config->masterEnabled()) return;

    if (const auto scheduled = scheduledTheme(m_clock())) {
        updateState(*scheduled, ActiveSource::Schedule);
        return;
    }

    if (m_config->randomEnabled() && m_state.lastRandomTheme) {
        updateState(*m_state.lastRandomTheme, ActiveSource::Random);
        return;
    }

    const QString manual = m_config->manualThemeId();
    if (!manual.isEmpty()) {
        updateState(manual, ActiveSource::Manual);
        return;
    }

    qDebug() << "[ThemeController] 결정 없음 — 현재 테마 유지 (" << reason << ")";
}

void ThemeController::updateState(const QString& themeId, ActiveSource source)
{
    if (themeId.isEmpty()) return;
    if (m_state.activeTheme == themeId && m_state.activeSource == source) return;

    m_state.activeTheme = themeId;
    m_state.activeSource = source;

    qInfo() << "[ThemeController] 테마 적용:" << themeId << "출처:" << activeSourceName(source);
    if (m_applier) m_applier->apply(themeId);
    emit themeApplied(themeId, source);
}

// ============================================================
// 설정
// ============================================================

void ThemeController::setClock(Clock clock)
{
    if (clock) m_clock = std::move(clock);
}

void ThemeController::setRandomGenerator(QRandomGenerator* rng)
{
    m_selector.setGenerator(rng);
}

} // namespace Engine
} // namespace Themis
