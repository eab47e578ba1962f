#include "random_selector.h"

#include <QSet>

namespace Themis {
namespace Core {

RandomSelector::RandomSelector(QRandomGenerator* rng)
    : m_rng(rng)
{
}

void RandomSelector::setGenerator(QRandomGenerator* rng)
{
    m_rng = rng;
}

std::optional<QString> RandomSelector::select(const QList<ThemeDescriptor>& available,
                                              const RandomizationConfig& config,
                                              EngineState& state)
{
    const QStringList candidates = effectivePool(available, config.pool);
    if (candidates.isEmpty()) return std::nullopt;

    if (config.cycleMode) {
        return nextFromCycle(candidates, state);
    }
    return pickAvoidingRepeat(candidates, config.avoidRepeat, state.lastRandomTheme);
}

QStringList RandomSelector::effectivePool(const QList<ThemeDescriptor>& available,
                                          const QStringList& pool)
{
    QStringList ids;
    if (pool.isEmpty()) return ids;

    const QSet<QString> wanted(pool.cbegin(), pool.cend());
    for (const auto& theme : available) {
        if (wanted.contains(theme.id) && !ids.contains(theme.id)) {
            ids.append(theme.id);
        }
    }
    return ids;
}

QStringList RandomSelector::shuffled(QStringList ids)
{
    // Fisher–Yates: i = 마지막 인덱스부터 1까지, [0, i] 중 하나와 교환
    for (int i = ids.size() - 1; i > 0; --i) {
        const int j = bounded(i + 1);
        if (i != j) ids.swapItemsAt(i, j);
    }
    return ids;
}

QString RandomSelector::nextFromCycle(const QStringList& candidates, EngineState& state)
{
    // 풀이 바뀐 뒤 남은 대기열 항목은 버림
    const QSet<QString> valid(candidates.cbegin(), candidates.cend());
    QStringList& queue = state.randomRotationQueue;
    for (auto it = queue.begin(); it != queue.end();) {
        if (valid.contains(*it)) ++it;
        else it = queue.erase(it);
    }

    if (queue.isEmpty()) {
        queue = shuffled(candidates);
    }
    return queue.takeFirst();
}

QString RandomSelector::pickAvoidingRepeat(const QStringList& candidates,
                                           bool avoidRepeat,
                                           const std::optional<QString>& last)
{
    QStringList filtered = candidates;
    if (avoidRepeat && last) {
        filtered.removeAll(*last);
    }
    const QStringList& poolToUse = filtered.isEmpty() ? candidates : filtered;
    return poolToUse.at(bounded(poolToUse.size()));
}

int RandomSelector::bounded(int upper)
{
    QRandomGenerator* rng = m_rng ? m_rng : QRandomGenerator::global();
    return static_cast<int>(rng->bounded(static_cast<quint32>(upper)));
}

} // namespace Core
} // namespace Themis
