// PRICEFEED - Oracle Error Types
// Copyright (c) 2024 PRICEFEED Developers
// MIT License

#include "pricefeed/oracle/errors.h"

namespace pricefeed {
namespace oracle {

const char* OracleErrorToString(OracleError error) {
    switch (error) {
        case OracleError::NotAuthorized: return "NotAuthorized";
        case OracleError::InvalidPrice: return "InvalidPrice";
        case OracleError::StalePrice: return "StalePrice";
        case OracleError::SourceNotFound: return "SourceNotFound";
        case OracleError::AlreadyExists: return "AlreadyExists";
        case OracleError::InsufficientSources: return "InsufficientSources";
        case OracleError::InvalidAsset: return "InvalidAsset";
        case OracleError::ArithmeticOverflow: return "ArithmeticOverflow";
        case OracleError::StorageError: return "StorageError";
        default: return "Unknown";
    }
}

std::string Failure::ToString() const {
    std::string result = "u" + std::to_string(OracleErrorCode(kind)) + " " +
                         OracleErrorToString(kind);
    if (!message.empty()) {
        result += ": " + message;
    }
    return result;
}

} // namespace oracle
} // namespace pricefeed
