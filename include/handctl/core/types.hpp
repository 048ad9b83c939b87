/**
 * @file types.hpp
 * @brief Common result codes for the handctl library
 */

#ifndef HANDCTL_CORE_TYPES_HPP
#define HANDCTL_CORE_TYPES_HPP

namespace handctl {
namespace core {

/**
 * @brief Result codes reported by the non-realtime parts of the library
 *
 * The per-tick gesture pipeline never produces these; they describe
 * configuration, file and setup failures.
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_GENERIC,
    ERROR_INVALID_PARAMETER,
    ERROR_NOT_INITIALIZED,
    ERROR_CONFIGURATION_INVALID,
    ERROR_FILE_NOT_FOUND,
    ERROR_FILE_IO,
    ERROR_FILE_FORMAT
};

} // namespace core
} // namespace handctl

#endif // HANDCTL_CORE_TYPES_HPP
