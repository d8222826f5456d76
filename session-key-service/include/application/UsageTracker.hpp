#pragma once

#include "domain/SessionKey.hpp"
#include "domain/SessionKeyUsage.hpp"
#include "domain/Timestamp.hpp"

namespace sessionkeys::application {

/**
 * @brief Учёт дневного расхода с ленивым сбросом суток
 *
 * Фонового таймера нет: номер суток вычисляется из переданного "now"
 * в момент обращения. Если часы вызывающего ушли назад (сутки меньше
 * lastUsedDay), счётчик не сбрасывается и lastUsedDay не откатывается.
 */
class UsageTracker {
public:
    /**
     * @brief Расход за текущие сутки с учётом виртуального сброса
     */
    static domain::Amount effectiveUsedToday(const domain::SessionKey& key, domain::UnixTime now) {
        if (domain::dayIndex(now) > key.lastUsedDay) {
            return 0;
        }
        return key.usedToday;
    }

    /**
     * @brief Сбросить счётчик, если наступили новые сутки
     * @return true если запись изменилась
     */
    static bool reconcileDay(domain::SessionKey& key, domain::UnixTime now) {
        auto today = domain::dayIndex(now);
        if (today <= key.lastUsedDay) {
            return false;
        }
        key.usedToday = 0;
        key.lastUsedDay = today;
        return true;
    }

    /**
     * @brief Учесть расход: сброс суток, затем usedToday += value
     *
     * Вызывается только после положительного решения политики,
     * поэтому usedToday + value <= dailyLimit.
     */
    static void recordUsage(domain::SessionKey& key, const domain::Amount& value, domain::UnixTime now) {
        reconcileDay(key, now);
        key.usedToday += value;
    }

    /**
     * @brief Статистика использования без изменения записи
     */
    static domain::SessionKeyUsage usage(const domain::SessionKey& key, domain::UnixTime now) {
        domain::SessionKeyUsage stats;
        stats.usedToday = effectiveUsedToday(key, now);
        stats.remainingDaily = key.dailyLimit - stats.usedToday;
        stats.remainingPerTx = key.spendingLimit;
        stats.timeUntilExpiry = key.expiryTime > now ? key.expiryTime - now : 0;
        return stats;
    }
};

} // namespace sessionkeys::application
