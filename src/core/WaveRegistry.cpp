#include "core/WaveRegistry.h"
#include "core/Logger.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace addsynth {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;

// sign(0) == 0; NaN passes through
double signum(double x)
{
    if (x > 0.0) return 1.0;
    if (x < 0.0) return -1.0;
    return x;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// Built-in generators
// ═══════════════════════════════════════════════════════════════════

std::vector<double> generateSine(const std::vector<double>& t, double freq, double phase)
{
    std::vector<double> out(t.size());
    for (size_t i = 0; i < t.size(); ++i)
        out[i] = std::sin(kTwoPi * freq * t[i] + phase);
    return out;
}

std::vector<double> generateSquare(const std::vector<double>& t, double freq, double phase)
{
    std::vector<double> out(t.size());
    for (size_t i = 0; i < t.size(); ++i)
        out[i] = signum(std::sin(kTwoPi * freq * t[i] + phase));
    return out;
}

std::vector<double> generateTriangle(const std::vector<double>& t, double freq, double phase)
{
    std::vector<double> out(t.size());
    for (size_t i = 0; i < t.size(); ++i)
        out[i] = 2.0 * std::asin(std::sin(kTwoPi * freq * t[i] + phase)) / kPi;
    return out;
}

std::vector<double> generateSawtooth(const std::vector<double>& t, double freq, double phase)
{
    double offset = phase / kTwoPi;
    std::vector<double> out(t.size());
    for (size_t i = 0; i < t.size(); ++i)
    {
        double x = freq * t[i] + offset;
        out[i] = 2.0 * (x - std::floor(0.5 + x));
    }
    return out;
}

// ═══════════════════════════════════════════════════════════════════
// WaveRegistry
// ═══════════════════════════════════════════════════════════════════

WaveRegistry::WaveRegistry()
{
    const std::pair<Wave, WaveGenerator> builtIns[] = {
        {Wave::sine, generateSine},
        {Wave::square, generateSquare},
        {Wave::triangle, generateTriangle},
        {Wave::sawtooth, generateSawtooth},
    };
    for (const auto& [wave, gen] : builtIns)
        entries_.push_back({waveName(wave), std::make_shared<const WaveGenerator>(gen)});

    AS_DEBUG("WaveRegistry: created with %d built-in waves", (int)entries_.size());
}

WaveRegistry::~WaveRegistry()
{
    AS_DEBUG("WaveRegistry: destroying with %d waves", (int)entries_.size());
}

std::vector<WaveRegistry::Entry>::const_iterator WaveRegistry::find(const std::string& name) const
{
    return std::find_if(entries_.begin(), entries_.end(),
                        [&](const Entry& e) { return e.name == name; });
}

ErrorCode WaveRegistry::add(const std::string& name, WaveGenerator generator)
{
    if (name.empty() || !generator)
    {
        AS_WARN("WaveRegistry::add: rejected name='%s' (empty name or generator)",
                name.c_str());
        return ErrorCode::invalidGenerator;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (find(name) != entries_.end())
    {
        AS_WARN("WaveRegistry::add: wave name '%s' already exists", name.c_str());
        return ErrorCode::duplicateWaveName;
    }

    entries_.push_back({name, std::make_shared<const WaveGenerator>(std::move(generator))});
    AS_INFO("WaveRegistry::add: name=%s, size=%d", name.c_str(), (int)entries_.size());
    return ErrorCode::ok;
}

ErrorCode WaveRegistry::remove(const std::string& name)
{
    if (isBuiltIn(name))
    {
        AS_WARN("WaveRegistry::remove: '%s' is built in", name.c_str());
        return ErrorCode::builtInWave;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find(name);
    if (it == entries_.end())
    {
        AS_DEBUG("WaveRegistry::remove: '%s' not found", name.c_str());
        return ErrorCode::unknownWaveName;
    }

    entries_.erase(it);
    AS_INFO("WaveRegistry::remove: name=%s, size=%d", name.c_str(), (int)entries_.size());
    return ErrorCode::ok;
}

std::shared_ptr<const WaveGenerator> WaveRegistry::resolve(const std::string& name,
                                                           ErrorCode& error) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = find(name);
    if (it == entries_.end())
    {
        error = ErrorCode::unknownWaveName;
        AS_WARN("WaveRegistry::resolve: wave '%s' does not exist", name.c_str());
        return nullptr;
    }

    error = ErrorCode::ok;
    return it->generator;
}

bool WaveRegistry::contains(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return find(name) != entries_.end();
}

bool WaveRegistry::isBuiltIn(const std::string& name)
{
    for (Wave w : {Wave::sine, Wave::square, Wave::triangle, Wave::sawtooth})
    {
        if (name == waveName(w))
            return true;
    }
    return false;
}

std::vector<std::string> WaveRegistry::getNames() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& e : entries_)
        names.push_back(e.name);
    return names;
}

int WaveRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return (int)entries_.size();
}

std::string WaveRegistry::describe() const
{
    std::string result = "Available oscillators: ";
    auto names = getNames();
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (i > 0)
            result += ", ";
        result += names[i];
    }
    return result + ".";
}

} // namespace addsynth
