// SHARELEDGER - Error Codes Implementation
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include "shareledger/core/result.h"

namespace shareledger {

const char* LedgerErrorToString(LedgerError err) {
    switch (err) {
        case LedgerError::OwnerOnly: return "OwnerOnly";
        case LedgerError::NotFound: return "NotFound";
        case LedgerError::AlreadyListed: return "AlreadyListed";
        case LedgerError::InvalidAmount: return "InvalidAmount";
        case LedgerError::NotAuthorized: return "NotAuthorized";
        case LedgerError::KycRequired: return "KycRequired";
        case LedgerError::VoteExists: return "VoteExists";
        case LedgerError::VoteEnded: return "VoteEnded";
        case LedgerError::PriceExpired: return "PriceExpired";
        case LedgerError::InvalidURI: return "InvalidURI";
        case LedgerError::InvalidValue: return "InvalidValue";
        case LedgerError::InvalidDuration: return "InvalidDuration";
        case LedgerError::InvalidKycLevel: return "InvalidKycLevel";
        case LedgerError::InvalidExpiry: return "InvalidExpiry";
        case LedgerError::InvalidVotes: return "InvalidVotes";
        case LedgerError::InvalidAddress: return "InvalidAddress";
        case LedgerError::InvalidTitle: return "InvalidTitle";
        case LedgerError::AlreadyExecuted: return "AlreadyExecuted";
        case LedgerError::VotingActive: return "VotingActive";
        default: return "Unknown";
    }
}

std::optional<LedgerError> ParseLedgerError(const std::string& str) {
    for (uint32_t code = LedgerErrorCode(LedgerError::OwnerOnly);
         code <= LedgerErrorCode(LedgerError::VotingActive); ++code) {
        auto err = static_cast<LedgerError>(code);
        if (str == LedgerErrorToString(err)) {
            return err;
        }
    }
    return std::nullopt;
}

ErrorCategory GetErrorCategory(LedgerError err) {
    switch (err) {
        case LedgerError::OwnerOnly:
        case LedgerError::NotAuthorized:
            return ErrorCategory::Authorization;

        case LedgerError::NotFound:
            return ErrorCategory::NotFound;

        case LedgerError::AlreadyListed:
        case LedgerError::VoteExists:
        case LedgerError::VoteEnded:
        case LedgerError::AlreadyExecuted:
        case LedgerError::VotingActive:
            return ErrorCategory::StateConflict;

        case LedgerError::KycRequired:
        case LedgerError::PriceExpired:
            return ErrorCategory::StaleData;

        default:
            return ErrorCategory::InvalidInput;
    }
}

const char* ErrorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Authorization: return "Authorization";
        case ErrorCategory::NotFound: return "NotFound";
        case ErrorCategory::InvalidInput: return "InvalidInput";
        case ErrorCategory::StateConflict: return "StateConflict";
        case ErrorCategory::StaleData: return "StaleData";
        default: return "Unknown";
    }
}

} // namespace shareledger
