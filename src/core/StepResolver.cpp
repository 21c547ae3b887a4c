#include "core/StepResolver.h"
#include "core/Logger.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace addsynth {

namespace {

// Optional sign, digits with at most one '.', optional exponent.
bool isDecimal(const std::string& token)
{
    size_t i = 0, n = token.size();
    if (i < n && (token[i] == '+' || token[i] == '-'))
        ++i;

    int digits = 0;
    bool point = false;
    for (; i < n; ++i)
    {
        if (std::isdigit(static_cast<unsigned char>(token[i])))
            ++digits;
        else if (token[i] == '.' && !point)
            point = true;
        else
            break;
    }
    if (digits == 0)
        return false;

    if (i < n && (token[i] == 'e' || token[i] == 'E'))
    {
        ++i;
        if (i < n && (token[i] == '+' || token[i] == '-'))
            ++i;
        size_t expStart = i;
        while (i < n && std::isdigit(static_cast<unsigned char>(token[i])))
            ++i;
        if (i == expStart)
            return false;
    }
    return i == n;
}

// Whole-string decimal parse with '.' as the separator whatever the C locale.
// Rejects empty, trailing junk and non-finite values.
bool parseNumber(const std::string& token, double& value)
{
    if (!isDecimal(token))
        return false;
    double v = juce::String(token).getDoubleValue();
    if (!std::isfinite(v))
        return false;
    value = v;
    return true;
}

bool parseInt(const std::string& token, int& value)
{
    if (token.empty())
        return false;
    const char* begin = token.c_str();
    char* end = nullptr;
    long v = std::strtol(begin, &end, 10);
    if (end == begin || *end != '\0' || v < -10 || v > 20)
        return false;
    value = static_cast<int>(v);
    return true;
}

std::string lower(const std::string& s)
{
    std::string out(s);
    for (auto& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// NumericStepResolver
// ═══════════════════════════════════════════════════════════════════

bool NumericStepResolver::resolve(const Step& step, double& frequency, double& duration,
                                  std::string& error) const
{
    double f = 0.0, d = 0.0;
    if (!parseNumber(step.pitch, f))
    {
        error = "Not a frequency: '" + step.pitch + "'";
        return false;
    }
    if (!parseNumber(step.duration, d))
    {
        error = "Not a duration: '" + step.duration + "'";
        return false;
    }
    frequency = f;
    duration = d;
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// NoteStepResolver
// ═══════════════════════════════════════════════════════════════════

NoteStepResolver::NoteStepResolver(double bpm, double a4Frequency)
    : bpm_(bpm), a4Frequency_(a4Frequency)
{
    if (!(bpm_ > 0.0))
    {
        AS_WARN("NoteStepResolver: invalid tempo %f, using 120", bpm);
        bpm_ = 120.0;
    }
    if (!(a4Frequency_ > 0.0))
    {
        AS_WARN("NoteStepResolver: invalid A4 %f, using 440", a4Frequency);
        a4Frequency_ = 440.0;
    }
}

bool NoteStepResolver::noteNumber(const std::string& token, int& note)
{
    if (token.empty())
        return false;

    static const int letterSemitones[] = {9, 11, 0, 2, 4, 5, 7}; // A B C D E F G
    char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(token[0])));
    if (letter < 'A' || letter > 'G')
        return false;

    int semitone = letterSemitones[letter - 'A'];
    size_t pos = 1;
    while (pos < token.size() && (token[pos] == '#' || token[pos] == 'b'))
    {
        semitone += token[pos] == '#' ? 1 : -1;
        ++pos;
    }

    int octave = 0;
    if (!parseInt(token.substr(pos), octave))
        return false;

    note = 12 * (octave + 1) + semitone;
    return true;
}

bool NoteStepResolver::pitchToFrequency(const std::string& token, double& frequency) const
{
    auto t = lower(token);
    if (t == "r" || t == "rest")
    {
        frequency = 0.0;
        return true;
    }

    int note = 0;
    if (!noteNumber(token, note))
        return false;

    frequency = juce::MidiMessage::getMidiNoteInHertz(note, a4Frequency_);
    return true;
}

bool NoteStepResolver::durationToSeconds(const std::string& token, double& seconds) const
{
    double beatSeconds = 60.0 / bpm_;

    double beats = 0.0;
    if (parseNumber(token, beats))
    {
        seconds = beats * beatSeconds;
        return true;
    }

    auto t = lower(token);
    double dot = 1.0;
    if (!t.empty() && t.back() == '.')
    {
        dot = 1.5;
        t.pop_back();
    }

    if (t == "w" || t == "whole")          beats = 4.0;
    else if (t == "h" || t == "half")      beats = 2.0;
    else if (t == "q" || t == "quarter")   beats = 1.0;
    else if (t == "e" || t == "eighth")    beats = 0.5;
    else if (t == "s" || t == "sixteenth") beats = 0.25;
    else
        return false;

    seconds = beats * dot * beatSeconds;
    return true;
}

bool NoteStepResolver::resolve(const Step& step, double& frequency, double& duration,
                               std::string& error) const
{
    double f = 0.0, d = 0.0;
    if (!pitchToFrequency(step.pitch, f))
    {
        error = "Unknown pitch: '" + step.pitch + "'";
        return false;
    }
    if (!durationToSeconds(step.duration, d))
    {
        error = "Unknown duration: '" + step.duration + "'";
        return false;
    }
    frequency = f;
    duration = d;
    AS_TRACE("NoteStepResolver: %s/%s -> %f Hz, %f s",
             step.pitch.c_str(), step.duration.c_str(), f, d);
    return true;
}

} // namespace addsynth
