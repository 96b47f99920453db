#pragma once

#include "tempora/expected.hpp"

#include <string>
#include <utility>

#include <cstdint>

namespace tempora {

/**
 * @brief Failure categories reported by tempora operations
 */
enum class ErrorCode : uint8_t {
    invalid_argument, ///< Malformed constructor input (bad date, zero step, zone/offset mismatch)
    unknown_zone,     ///< Time zone name not known to the zone database
    domain_error,     ///< Timestamp requested before the epoch started
    data_error        ///< Embedded leap-second list failed its consistency checks
};

/**
 * @brief Get a human-readable description of an error code
 */
[[nodiscard]] constexpr const char* error_code_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::invalid_argument:
            return "Invalid argument";
        case ErrorCode::unknown_zone:
            return "Unknown time zone";
        case ErrorCode::domain_error:
            return "Outside of epoch domain";
        case ErrorCode::data_error:
            return "Corrupt leap second data";
    }
    return "Unknown error";
}

/**
 * @brief Error information from a failed tempora operation
 *
 * Carries the failure category plus a detail string naming the offending
 * input, e.g. "2021-02-29 is not a valid date".
 */
struct Error {
    ErrorCode code;     ///< Failure category
    std::string detail; ///< Context for diagnostics (may be empty)

    /**
     * @brief Get the static description of the error category
     */
    [[nodiscard]] const char* message() const noexcept { return error_code_string(code); }

    /**
     * @brief Get the detail text, falling back to message() when no detail was recorded
     */
    [[nodiscard]] std::string what() const {
        return detail.empty() ? std::string(message()) : detail;
    }
};

/**
 * @brief Result type for fallible tempora operations
 *
 * Alias for expected<T, Error>. Holds either the constructed value or an
 * Error describing why construction failed. No partially built value ever
 * escapes a failed operation.
 *
 * Usage:
 * @code
 *   auto dt = DateTime::create(2020, 2, 30, 0, 0, 0);
 *   if (!dt) {
 *       std::cerr << dt.error().message() << ": " << dt.error().what() << "\n";
 *   }
 * @endcode
 *
 * @tparam T The type of the successfully constructed value
 */
template <typename T>
using Result = expected<T, Error>;

/**
 * @brief Factory function for creating tempora errors
 *
 * Usage:
 * @code
 *   return make_error(ErrorCode::unknown_zone, "Mars/Olympus_Mons");
 * @endcode
 */
inline auto make_error(ErrorCode code, std::string detail = {}) {
    return unexpected(Error{.code = code, .detail = std::move(detail)});
}

} // namespace tempora
