#pragma once

#include "physics/Body.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace orrery {

/// Source of initial body states, keyed by body name and reference epoch.
/// Implementations deliver SI units (m, m/s, m, kg).
class IEphemerisProvider {
public:
    virtual ~IEphemerisProvider() = default;

    /// State of `name` at `epoch`, or nullopt if the provider has none.
    virtual std::optional<Body> lookup(const std::string& name,
                                       const std::string& epoch) const = 0;

    /// Short description for logs
    virtual std::string describe() const = 0;
};

/// Tries `primary` first and falls back to `fallback` for bodies it lacks.
class LayeredEphemeris : public IEphemerisProvider {
public:
    LayeredEphemeris(std::unique_ptr<IEphemerisProvider> primary,
                     std::unique_ptr<IEphemerisProvider> fallback)
        : m_primary(std::move(primary)), m_fallback(std::move(fallback)) {}

    std::optional<Body> lookup(const std::string& name,
                               const std::string& epoch) const override;
    std::string describe() const override;

private:
    std::unique_ptr<IEphemerisProvider> m_primary;
    std::unique_ptr<IEphemerisProvider> m_fallback;
};

/// Look up every name at `epoch`. Returns nullopt, after logging each
/// missing body, if any lookup fails; the result keeps the order of `names`.
std::optional<std::vector<Body>> loadBodies(const IEphemerisProvider& provider,
                                            const std::vector<std::string>& names,
                                            const std::string& epoch);

} // namespace orrery
