#pragma once

#include <string>

namespace keylight {

/**
 * @brief Status codes shared by discovery and control results
 *
 * - OK                    -> operation completed
 * - INVALID_CONFIG        -> configuration could not produce endpoints
 * - NO_DEVICES_FOUND      -> discovery timer elapsed with zero endpoints
 * - PARTIAL_DISCOVERY     -> timer elapsed with 1..N-1 endpoints and policy is "fail"
 * - DISCOVERY_UNAVAILABLE -> multicast browser could not be opened
 * - DEVICE_UNREACHABLE    -> transport or protocol failure against one endpoint
 * - OPERATION_FAILED      -> control operation aborted on one endpoint
 */
enum class ErrorCode {
    OK,
    INVALID_CONFIG,
    NO_DEVICES_FOUND,
    PARTIAL_DISCOVERY,
    DISCOVERY_UNAVAILABLE,
    DEVICE_UNREACHABLE,
    OPERATION_FAILED
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return "OK";
        case ErrorCode::INVALID_CONFIG:
            return "INVALID_CONFIG";
        case ErrorCode::NO_DEVICES_FOUND:
            return "NO_DEVICES_FOUND";
        case ErrorCode::PARTIAL_DISCOVERY:
            return "PARTIAL_DISCOVERY";
        case ErrorCode::DISCOVERY_UNAVAILABLE:
            return "DISCOVERY_UNAVAILABLE";
        case ErrorCode::DEVICE_UNREACHABLE:
            return "DEVICE_UNREACHABLE";
        case ErrorCode::OPERATION_FAILED:
            return "OPERATION_FAILED";
        default:
            return "UNKNOWN";
    }
}

}  // namespace keylight
