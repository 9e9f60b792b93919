#pragma once

#include <exception>
#include <string>

enum class ErrorCode {
    UnknownPose,              // Pose name not in the registry
    InvalidPoseDefinition,    // Catalog entry failed validation
    InvalidFrameSequence,     // Frame indices not strictly increasing
    InsufficientTrainingData, // Too few usable training frames
    AngleUnreliable,          // Angle missing in too many training frames
    AlignmentInputTooShort,   // Empty (or too short) sequence to align
    AlignmentDegenerate,      // Sequences share no comparable angles
    LowDetectionRate,         // Too many candidate frames without a usable pose
    InvalidConfiguration,     // Setting out of range (band width, thresholds)
    IOError,                  // File could not be read or written
    FormatError               // JSON record missing required fields
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnknownPose:              return "UnknownPose";
        case ErrorCode::InvalidPoseDefinition:    return "InvalidPoseDefinition";
        case ErrorCode::InvalidFrameSequence:     return "InvalidFrameSequence";
        case ErrorCode::InsufficientTrainingData: return "InsufficientTrainingData";
        case ErrorCode::AngleUnreliable:          return "AngleUnreliable";
        case ErrorCode::AlignmentInputTooShort:   return "AlignmentInputTooShort";
        case ErrorCode::AlignmentDegenerate:      return "AlignmentDegenerate";
        case ErrorCode::LowDetectionRate:         return "LowDetectionRate";
        case ErrorCode::InvalidConfiguration:     return "InvalidConfiguration";
        case ErrorCode::IOError:                  return "IOError";
        case ErrorCode::FormatError:              return "FormatError";
        default:                                  return "Unknown";
    }
}

/**
 * @brief Typed failure raised by the training and testing paths
 *
 * Every fatal condition carries an ErrorCode so callers can tell
 * "video too short" apart from "wrong pose" apart from "pose unsupported".
 */
class PoseError : public std::exception {
public:
    PoseError(ErrorCode code, const std::string& message)
        : code_(code), message_(message) {
        what_ = std::string("[") + errorCodeToString(code_) + "] " + message_;
    }

    ErrorCode code() const noexcept { return code_; }
    const char* what() const noexcept override { return what_.c_str(); }
    const std::string& message() const noexcept { return message_; }

private:
    ErrorCode code_;
    std::string message_;
    std::string what_;
};
