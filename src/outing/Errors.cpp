#include "outing/Errors.hpp"

namespace outing {

const char* error_code_str(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidObservation: return "InvalidObservation";
        case ErrorCode::InvalidProfile: return "InvalidProfile";
        case ErrorCode::InvalidActivity: return "InvalidActivity";
        case ErrorCode::InvalidWeights: return "InvalidWeights";
        case ErrorCode::EmptyCandidateSet: return "EmptyCandidateSet";
        case ErrorCode::EmptyBallotSet: return "EmptyBallotSet";
        case ErrorCode::CandidateSetMismatch: return "CandidateSetMismatch";
        case ErrorCode::InvalidBallot: return "InvalidBallot";
        default: return "Unknown";
    }
}

}  // namespace outing
