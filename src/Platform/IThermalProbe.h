#pragma once

#include "ThermalTypes.h"

namespace Platform
{

/// Interface for platform-specific thermal zone readings.
/// Implementations read raw values from OS APIs; never throws for missing sensors.
class IThermalProbe
{
  public:
    virtual ~IThermalProbe() = default;

    IThermalProbe() = default;
    IThermalProbe(const IThermalProbe&) = default;
    IThermalProbe& operator=(const IThermalProbe&) = default;
    IThermalProbe(IThermalProbe&&) = default;
    IThermalProbe& operator=(IThermalProbe&&) = default;

    /// Returns raw thermal zone readings (stateless read).
    [[nodiscard]] virtual ThermalCounters read() = 0;

    /// What this platform supports.
    [[nodiscard]] virtual ThermalCapabilities capabilities() const = 0;
};

} // namespace Platform
