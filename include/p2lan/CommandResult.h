/**
 * @file CommandResult.h
 * @brief Outcome of a command issued to the core
 */

#pragma once

#include <string>

namespace P2Lan {

/**
 * @brief Success flag plus a stable error code and a readable message
 *
 * errorCode is one of the ErrorCodes constants when success is false.
 */
struct CommandResult {
    bool success = false;
    std::string errorCode;
    std::string message;

    static CommandResult ok(const std::string& message = {}) {
        CommandResult r;
        r.success = true;
        r.message = message;
        return r;
    }

    static CommandResult fail(const char* errorCode, const std::string& message) {
        CommandResult r;
        r.success = false;
        r.errorCode = errorCode;
        r.message = message;
        return r;
    }

    explicit operator bool() const { return success; }
};

}  // namespace P2Lan
