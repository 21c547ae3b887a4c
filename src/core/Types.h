#pragma once

#include <string>

namespace addsynth {

enum class ErrorCode {
    ok,
    unknownWaveName,
    duplicateWaveName,
    invalidDuration,
    invalidSampleRate,
    invalidGenerator,
    builtInWave,
    unresolvedStep
};

inline const char* errorCodeName(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::ok:                return "Ok";
        case ErrorCode::unknownWaveName:   return "UnknownWaveName";
        case ErrorCode::duplicateWaveName: return "DuplicateWaveName";
        case ErrorCode::invalidDuration:   return "InvalidDuration";
        case ErrorCode::invalidSampleRate: return "InvalidSampleRate";
        case ErrorCode::invalidGenerator:  return "InvalidGenerator";
        case ErrorCode::builtInWave:       return "BuiltInWave";
        case ErrorCode::unresolvedStep:    return "UnresolvedStep";
    }
    return "???";
}

/// Built-in wave kinds. Custom kinds are addressed by their registered name.
enum class Wave { sine, square, triangle, sawtooth };

inline const char* waveName(Wave wave)
{
    switch (wave)
    {
        case Wave::sine:     return "Sine";
        case Wave::square:   return "Square";
        case Wave::triangle: return "Triangle";
        case Wave::sawtooth: return "Sawtooth";
    }
    return "???";
}

/// One sequencer step. Tokens are opaque to the core; a StepResolver turns
/// them into (frequency, duration) at compile time.
struct Step {
    std::string pitch;
    std::string duration;
};

} // namespace addsynth
