#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <string>
#include <stdexcept>
#include <algorithm>
#include <cctype>
#include <limits>

namespace sessionkeys::domain {

/**
 * @brief Денежная сумма в минимальных единицах (wei)
 *
 * Беззнаковое 256-битное целое. Плавающая точка не используется нигде:
 * лимиты и расход сравниваются точно.
 */
using Amount = boost::multiprecision::uint256_t;

/**
 * @brief Разобрать сумму из десятичной строки
 * @throws std::invalid_argument если строка пустая, содержит не-цифры
 *         или не помещается в 256 бит
 */
inline Amount parseAmount(const std::string& str) {
    if (str.empty()) {
        throw std::invalid_argument("Amount is empty");
    }
    bool digitsOnly = std::all_of(str.begin(), str.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
    if (!digitsOnly) {
        throw std::invalid_argument("Amount must be a non-negative decimal integer: " + str);
    }

    boost::multiprecision::cpp_int wide(str);
    if (wide > boost::multiprecision::cpp_int(std::numeric_limits<Amount>::max())) {
        throw std::invalid_argument("Amount exceeds 256 bits: " + str);
    }
    return Amount(wide);
}

/**
 * @brief Десятичное представление суммы
 */
inline std::string toString(const Amount& amount) {
    return amount.str();
}

} // namespace sessionkeys::domain
