/**
 * @file random_selector.h
 * @brief 랜덤 테마 선택기 — 반복 회피 모드 / 셔플 순환 모드
 */

#pragma once

#include "core/theme_types.h"

#include <QList>
#include <QRandomGenerator>
#include <QString>
#include <QStringList>

#include <optional>

namespace Themis {
namespace Core {

/**
 * @class RandomSelector
 * @brief 후보 풀에서 다음 랜덤 테마를 고른다
 *
 * 순환 모드: 풀 전체를 Fisher–Yates로 섞은 대기열에서 하나씩 꺼냄.
 * 한 바퀴 동안 모든 테마가 정확히 한 번씩 선택됨.
 * 반복 회피 모드: 직전 선택을 제외하고 균등 선택 (후보가 하나뿐이면 제외하지 않음).
 */
class RandomSelector {
public:
    /**
     * @param rng 난수 생성기 (nullptr 이면 QRandomGenerator::global())
     */
    explicit RandomSelector(QRandomGenerator* rng = nullptr);

    /**
     * @brief 다음 테마 선택
     * @param available 현재 카탈로그
     * @param config 랜덤 설정 (pool, avoidRepeat, cycleMode 사용)
     * @param state lastRandomTheme 참조, 순환 모드에서는 randomRotationQueue 갱신
     * @return 선택된 ID. 유효한 후보가 없으면 nullopt (state 변경 없음)
     */
    std::optional<QString> select(const QList<ThemeDescriptor>& available,
                                  const RandomizationConfig& config,
                                  EngineState& state);

    /**
     * @brief 풀과 카탈로그의 교집합 (카탈로그 순서 유지)
     */
    static QStringList effectivePool(const QList<ThemeDescriptor>& available,
                                     const QStringList& pool);

    /**
     * @brief 균등 셔플된 복사본 반환
     */
    QStringList shuffled(QStringList ids);

    void setGenerator(QRandomGenerator* rng);

private:
    QString nextFromCycle(const QStringList& candidates, EngineState& state);
    QString pickAvoidingRepeat(const QStringList& candidates,
                               bool avoidRepeat,
                               const std::optional<QString>& last);
    int bounded(int upper);

    QRandomGenerator* m_rng;
};

} // namespace Core
} // namespace Themis
