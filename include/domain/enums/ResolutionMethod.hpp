#pragma once

#include <string>
#include <stdexcept>

namespace chronicle::domain {

/**
 * @brief Как был разрешён сбой проекции
 */
enum class ResolutionMethod {
    AUTO_RETRY,     ///< Успешный повтор (inline, воркер или replay)
    MANUAL_RETRY,   ///< Оператор запустил повтор
    MANUAL_SKIP,    ///< Оператор пропустил событие (возможна рассинхронизация)
    MANUAL_FIX,     ///< Оператор исправил read model вручную
    MANUAL_RESET    ///< Сброс проекции целиком
};

inline std::string toString(ResolutionMethod method) {
    switch (method) {
        case ResolutionMethod::AUTO_RETRY:   return "auto_retry";
        case ResolutionMethod::MANUAL_RETRY: return "manual_retry";
        case ResolutionMethod::MANUAL_SKIP:  return "manual_skip";
        case ResolutionMethod::MANUAL_FIX:   return "manual_fix";
        case ResolutionMethod::MANUAL_RESET: return "manual_reset";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline ResolutionMethod resolutionMethodFromString(const std::string& str) {
    if (str == "auto_retry")   return ResolutionMethod::AUTO_RETRY;
    if (str == "manual_retry") return ResolutionMethod::MANUAL_RETRY;
    if (str == "manual_skip")  return ResolutionMethod::MANUAL_SKIP;
    if (str == "manual_fix")   return ResolutionMethod::MANUAL_FIX;
    if (str == "manual_reset") return ResolutionMethod::MANUAL_RESET;
    throw std::invalid_argument("Unknown ResolutionMethod: " + str);
}

} // namespace chronicle::domain
