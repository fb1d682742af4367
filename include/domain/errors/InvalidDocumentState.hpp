#pragma once

#include <stdexcept>
#include <string>

namespace chronicle::domain {

/**
 * @brief Команда недопустима в текущем статусе документа
 */
class InvalidDocumentState : public std::runtime_error {
public:
    InvalidDocumentState(const std::string& documentId,
                         const std::string& operation,
                         const std::string& currentStatus,
                         const std::string& requiredStatus)
        : std::runtime_error("Cannot " + operation + " document " + documentId +
                             ": status is " + currentStatus + ", required " + requiredStatus)
        , operation_(operation)
        , currentStatus_(currentStatus)
    {}

    const std::string& operation() const { return operation_; }
    const std::string& currentStatus() const { return currentStatus_; }

private:
    std::string operation_;
    std::string currentStatus_;
};

} // namespace chronicle::domain
