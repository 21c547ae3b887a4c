#include "core/Chain.h"
#include "core/Logger.h"

namespace addsynth {

Chain::Chain() = default;

Chain::~Chain()
{
    AS_DEBUG("Chain destroyed, size=%d", size());
}

Processor* Chain::append(std::unique_ptr<Processor> p)
{
    if (!p) {
        AS_WARN("Chain::append: null processor");
        return nullptr;
    }

    auto* raw = p.get();
    processors_.push_back(std::move(p));
    AS_DEBUG("Chain::append: name=%s, size=%d", raw->getName().c_str(), size());
    return raw;
}

Processor* Chain::insert(int index, std::unique_ptr<Processor> p)
{
    if (!p) {
        AS_WARN("Chain::insert: null processor");
        return nullptr;
    }

    index = juce::jlimit(0, size(), index);
    auto* raw = p.get();
    processors_.insert(processors_.begin() + index, std::move(p));
    AS_DEBUG("Chain::insert: name=%s, index=%d, size=%d", raw->getName().c_str(), index, size());
    return raw;
}

std::unique_ptr<Processor> Chain::remove(int index)
{
    if (index < 0 || index >= size()) {
        AS_DEBUG("Chain::remove: index=%d out of range (size=%d)", index, size());
        return nullptr;
    }

    auto it = processors_.begin() + index;
    auto p = std::move(*it);
    processors_.erase(it);
    AS_DEBUG("Chain::remove: name=%s, size=%d", p->getName().c_str(), size());
    return p;
}

void Chain::move(int fromIndex, int toIndex)
{
    if (fromIndex < 0 || fromIndex >= size() || toIndex < 0 || toIndex >= size()
        || fromIndex == toIndex)
        return;

    auto p = std::move(processors_[fromIndex]);
    processors_.erase(processors_.begin() + fromIndex);
    processors_.insert(processors_.begin() + toIndex, std::move(p));
    AS_DEBUG("Chain::move: %d -> %d", fromIndex, toIndex);
}

void Chain::clear()
{
    processors_.clear();
}

int Chain::size() const
{
    return (int)processors_.size();
}

Processor* Chain::at(int index) const
{
    return (index >= 0 && index < size()) ? processors_[index].get() : nullptr;
}

int Chain::indexOf(const Processor* p) const
{
    if (p == nullptr)
        return -1;
    for (int i = 0; i < size(); ++i)
    {
        if (processors_[i].get() == p)
            return i;
    }
    return -1;
}

void Chain::process(juce::AudioBuffer<float>& buffer, double sampleRate)
{
    const int numSamples = buffer.getNumSamples();
    for (auto& p : processors_)
    {
        p->prepare(sampleRate);
        p->reset();
        if (p->isBypassed())
            continue;

        p->process(buffer);
        if (buffer.getNumSamples() != numSamples)
            AS_WARN("Chain::process: %s changed length %d -> %d",
                    p->getName().c_str(), numSamples, buffer.getNumSamples());
    }
}

} // namespace addsynth
