#pragma once

#include "domain/Amount.hpp"
#include "domain/enums/DenialReason.hpp"
#include <string>

namespace sessionkeys::domain {

/**
 * @brief Решение политики по предложенной операции
 *
 * При отказе limit и attempted содержат сработавший лимит и запрошенное
 * значение, чтобы вызывающий мог показать точное сообщение.
 */
struct AuthorizationDecision {
    bool allowed = false;
    DenialReason reason = DenialReason::NONE;
    Amount limit;               ///< Сработавший лимит (для лимитных отказов)
    Amount attempted;           ///< Запрошенное значение
    std::string message;

    static AuthorizationDecision allow(const Amount& value) {
        AuthorizationDecision d;
        d.allowed = true;
        d.attempted = value;
        return d;
    }

    static AuthorizationDecision deny(DenialReason reason,
                                      const std::string& message,
                                      const Amount& limit = 0,
                                      const Amount& attempted = 0) {
        AuthorizationDecision d;
        d.allowed = false;
        d.reason = reason;
        d.limit = limit;
        d.attempted = attempted;
        d.message = message;
        return d;
    }
};

} // namespace sessionkeys::domain
