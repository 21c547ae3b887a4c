#pragma once

#include "core/Types.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace addsynth {

/// Maps sample instants t (seconds), a frequency (Hz) and a phase (radians)
/// to one amplitude per instant. Must return exactly t.size() values.
using WaveGenerator = std::function<std::vector<double>(
    const std::vector<double>& t, double freq, double phase)>;

// --- Built-in generators ---

std::vector<double> generateSine(const std::vector<double>& t, double freq, double phase);
std::vector<double> generateSquare(const std::vector<double>& t, double freq, double phase);
std::vector<double> generateTriangle(const std::vector<double>& t, double freq, double phase);
std::vector<double> generateSawtooth(const std::vector<double>& t, double freq, double phase);

/// Ordered name -> generator table. Seeded with Sine, Square, Triangle and
/// Sawtooth, which can never be removed or replaced. Generators are shared
/// with the oscillators that resolve them.
class WaveRegistry {
public:
    WaveRegistry();
    ~WaveRegistry();

    WaveRegistry(const WaveRegistry&) = delete;
    WaveRegistry& operator=(const WaveRegistry&) = delete;

    // --- Registration ---
    ErrorCode add(const std::string& name, WaveGenerator generator);
    ErrorCode remove(const std::string& name);

    // --- Lookup ---
    std::shared_ptr<const WaveGenerator> resolve(const std::string& name,
                                                 ErrorCode& error) const;
    bool contains(const std::string& name) const;
    static bool isBuiltIn(const std::string& name);

    // --- Queries ---
    std::vector<std::string> getNames() const;
    int size() const;
    std::string describe() const;

private:
    struct Entry {
        std::string name;
        std::shared_ptr<const WaveGenerator> generator;
    };

    std::vector<Entry>::const_iterator find(const std::string& name) const;

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

} // namespace addsynth
