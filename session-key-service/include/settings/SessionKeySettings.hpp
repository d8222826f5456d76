#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace sessionkeys::settings {

/**
 * @brief Настройки движка авторизации из ENV
 *
 * - SESSION_KEYS_MAX_COMMIT_ATTEMPTS (default: 3) - сколько раз
 *   переоценивать операцию при конфликте версий записи
 */
class SessionKeySettings {
public:
    SessionKeySettings() {
        if (const char* attempts = std::getenv("SESSION_KEYS_MAX_COMMIT_ATTEMPTS")) {
            maxCommitAttempts_ = std::stoi(attempts);
        }
        if (maxCommitAttempts_ < 1) {
            throw std::invalid_argument("SESSION_KEYS_MAX_COMMIT_ATTEMPTS must be >= 1");
        }
    }

    explicit SessionKeySettings(int maxCommitAttempts)
        : maxCommitAttempts_(maxCommitAttempts)
    {
        if (maxCommitAttempts_ < 1) {
            throw std::invalid_argument("maxCommitAttempts must be >= 1");
        }
    }

    int getMaxCommitAttempts() const { return maxCommitAttempts_; }

private:
    int maxCommitAttempts_ = 3;
};

} // namespace sessionkeys::settings
