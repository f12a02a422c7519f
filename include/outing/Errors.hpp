#pragma once

#include <stdexcept>
#include <string>

namespace outing {

enum class ErrorCode {
    InvalidObservation,
    InvalidProfile,
    InvalidActivity,
    InvalidWeights,
    EmptyCandidateSet,
    EmptyBallotSet,
    CandidateSetMismatch,
    InvalidBallot
};

const char* error_code_str(ErrorCode code);

// Base for every validation failure raised by the engine. All of them are
// caller errors scoped to one request; none is worth retrying.
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(error_code_str(code)) + ": " + message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class InvalidObservation : public EngineError {
public:
    explicit InvalidObservation(const std::string& msg) : EngineError(ErrorCode::InvalidObservation, msg) {}
};

class InvalidProfile : public EngineError {
public:
    explicit InvalidProfile(const std::string& msg) : EngineError(ErrorCode::InvalidProfile, msg) {}
};

class InvalidActivity : public EngineError {
public:
    explicit InvalidActivity(const std::string& msg) : EngineError(ErrorCode::InvalidActivity, msg) {}
};

class InvalidWeights : public EngineError {
public:
    explicit InvalidWeights(const std::string& msg) : EngineError(ErrorCode::InvalidWeights, msg) {}
};

class EmptyCandidateSet : public EngineError {
public:
    explicit EmptyCandidateSet(const std::string& msg) : EngineError(ErrorCode::EmptyCandidateSet, msg) {}
};

class EmptyBallotSet : public EngineError {
public:
    explicit EmptyBallotSet(const std::string& msg) : EngineError(ErrorCode::EmptyBallotSet, msg) {}
};

class CandidateSetMismatch : public EngineError {
public:
    explicit CandidateSetMismatch(const std::string& msg) : EngineError(ErrorCode::CandidateSetMismatch, msg) {}
};

class InvalidBallot : public EngineError {
public:
    explicit InvalidBallot(const std::string& msg) : EngineError(ErrorCode::InvalidBallot, msg) {}
};

}  // namespace outing
