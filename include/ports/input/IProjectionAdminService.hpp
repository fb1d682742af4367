#pragma once

#include "domain/ProjectionAdmin.hpp"
#include "domain/Result.hpp"
#include <string>

namespace chronicle::ports::input {

/**
 * @brief Компенсирующие действия оператора над проекциями
 */
class IProjectionAdminService {
public:
    virtual ~IProjectionAdminService() = default;

    /**
     * @brief Прогнать диапазон событий через проекцию заново
     */
    virtual domain::Result<domain::ReplayResult, domain::AdminError> replay(
        const domain::ReplayRequest& request) = 0;

    /**
     * @brief Очистить read-модель, checkpoint и активные сбои
     */
    virtual domain::Result<domain::ResetResult, domain::AdminError> reset(
        const std::string& projectionName) = 0;

    /**
     * @brief Ручное разрешение сбоя
     * @param strategy "retry" | "skip" | "manual_fix"
     */
    virtual domain::Result<domain::ResolveResult, domain::AdminError> resolve(
        const std::string& failureId,
        const std::string& strategy) = 0;
};

} // namespace chronicle::ports::input
