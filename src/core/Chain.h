#pragma once

#include "core/Processor.h"

#include <memory>
#include <vector>

namespace addsynth {

/// Ordered list of owned processors run one after another on a buffer.
class Chain {
public:
    Chain();
    ~Chain();

    // Non-copyable, non-movable
    Chain(const Chain&) = delete;
    Chain& operator=(const Chain&) = delete;

    // --- Structural modification ---

    /// Takes ownership and returns the raw pointer, or nullptr for a null processor.
    Processor* append(std::unique_ptr<Processor> p);

    /// Index is clamped to [0, size()].
    Processor* insert(int index, std::unique_ptr<Processor> p);
    std::unique_ptr<Processor> remove(int index);

    /// No-op if either index is out of range.
    void move(int fromIndex, int toIndex);
    void clear();

    // --- Query ---
    int size() const;
    Processor* at(int index) const;

    /// -1 if `p` is not in the chain.
    int indexOf(const Processor* p) const;

    // --- Processing ---

    /// prepare() and reset() every processor, then run the non-bypassed
    /// ones in order. The buffer keeps its length.
    void process(juce::AudioBuffer<float>& buffer, double sampleRate);

private:
    std::vector<std::unique_ptr<Processor>> processors_;
};

} // namespace addsynth
