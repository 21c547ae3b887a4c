#pragma once

#include "core/Types.h"

#include <string>

namespace addsynth {

/// Turns a step's opaque tokens into a frequency (Hz) and a duration (s).
/// Called once per step, in step order, while a track compiles.
class StepResolver {
public:
    virtual ~StepResolver() = default;

    virtual bool resolve(const Step& step, double& frequency, double& duration,
                         std::string& error) const = 0;
};

/// Both tokens are plain decimal numbers: "440", "0.25".
class NumericStepResolver : public StepResolver {
public:
    bool resolve(const Step& step, double& frequency, double& duration,
                 std::string& error) const override;
};

/// Scientific pitch notation and note-length names at a fixed tempo.
///
/// Pitch: letter A-G, any number of '#' or 'b', then an octave ("C4",
/// "F#3", "Bb-1"); "R" or "rest" is silence (0 Hz).
/// Duration: "w" "h" "q" "e" "s" or "whole" "half" "quarter" "eighth"
/// "sixteenth", optionally dotted ("q."); a bare number counts beats.
/// One beat is a quarter note.
class NoteStepResolver : public StepResolver {
public:
    explicit NoteStepResolver(double bpm = 120.0, double a4Frequency = 440.0);

    bool resolve(const Step& step, double& frequency, double& duration,
                 std::string& error) const override;

    bool pitchToFrequency(const std::string& token, double& frequency) const;
    bool durationToSeconds(const std::string& token, double& seconds) const;

    /// MIDI-style note number (C4 = 60); false for tokens that are not a note name.
    static bool noteNumber(const std::string& token, int& note);

    double getBpm() const { return bpm_; }
    double getA4Frequency() const { return a4Frequency_; }

private:
    double bpm_;
    double a4Frequency_;
};

} // namespace addsynth
