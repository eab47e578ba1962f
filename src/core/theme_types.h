/**
 * @file theme_types.h
 * @brief 테마 컨트롤러 공용 타입 — 테마 설명자, 스케줄 규칙, 랜덤 설정, 엔진 상태
 *
 * 코어 모듈(시간 범위, 스케줄, 랜덤 선택, 결정 엔진)이 공유하는 값 타입.
 * 모든 타입은 복사 가능한 평범한 구조체이며 외부 시스템에 의존하지 않음.
 */

#ifndef THEMIS_THEME_TYPES_H
#define THEMIS_THEME_TYPES_H

#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

namespace Themis {

/**
 * @brief 카탈로그가 제공하는 테마 정보 (코어 입장에서는 읽기 전용)
 */
struct ThemeDescriptor {
    QString id;                     ///< 테마 ID (카탈로그 내 고유)
    QString displayName;            ///< 표시 이름
    std::optional<QString> note;    ///< 설명/제작자 등 부가 정보

    bool operator==(const ThemeDescriptor& other) const {
        return id == other.id && displayName == other.displayName && note == other.note;
    }
};

/**
 * @brief 요일/시간 조건으로 테마를 지정하는 스케줄 규칙
 *
 * days는 0(일요일)~6(토요일). start == end 이면 하루 종일 적용.
 */
struct ScheduleRule {
    QString id;                     ///< 안정적인 고유 ID
    QString name;                   ///< 사용자 표시 이름
    QString themeId;                ///< 적용할 테마 (비어 있으면 무시됨)
    QList<int> days;                ///< 적용 요일 (정렬, 중복 없음)
    QString start = "00:00";        ///< 시작 시각 "HH:mm"
    QString end = "00:00";          ///< 종료 시각 "HH:mm" (미포함)

    bool operator==(const ScheduleRule& other) const {
        return id == other.id && name == other.name && themeId == other.themeId
            && days == other.days && start == other.start && end == other.end;
    }
};

/**
 * @brief 랜덤 선택 설정 스냅샷
 *
 * cycleMode가 켜져 있으면 avoidRepeat보다 우선함.
 */
struct RandomizationConfig {
    bool enabled = false;
    QStringList pool;               ///< 랜덤 후보 테마 ID
    bool onStartup = true;
    bool intervalEnabled = false;
    int intervalMinutes = 60;       ///< 1 이상
    bool avoidRepeat = true;
    bool cycleMode = false;
};

/**
 * @brief 현재 테마를 결정한 출처
 */
enum class ActiveSource {
    Manual,
    Random,
    Schedule
};

QString activeSourceName(ActiveSource source);

/**
 * @brief 결정 엔진 내부 상태 (재시작 시 새로 구성, 영속화하지 않음)
 */
struct EngineState {
    std::optional<QString> lastRandomTheme;     ///< 마지막 랜덤 선택 (스케줄 종료 후 복귀용)
    std::optional<QString> activeTheme;         ///< 마지막으로 적용한 테마
    ActiveSource activeSource = ActiveSource::Manual;
    QList<ThemeDescriptor> availableThemes;     ///< 카탈로그 스냅샷
    QStringList randomRotationQueue;            ///< 순환 모드 대기열
};

// 요일 이름 (0 = Sunday)
extern const char* const kDayNames[7];

/**
 * @brief 요일 번호를 이름으로 변환 (범위 밖이면 빈 문자열)
 */
QString dayName(int day);

} // namespace Themis

#endif // THEMIS_THEME_TYPES_H
