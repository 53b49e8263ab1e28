#pragma once

#include "ProcessTypes.h"

namespace Platform
{

/// Interface for platform-specific process enumeration.
/// Implementations read raw counters from OS APIs.
/// Domain layer computes deltas and percentages.
class IProcessProbe
{
  public:
    virtual ~IProcessProbe() = default;

    IProcessProbe() = default;
    IProcessProbe(const IProcessProbe&) = default;
    IProcessProbe& operator=(const IProcessProbe&) = default;
    IProcessProbe(IProcessProbe&&) = default;
    IProcessProbe& operator=(IProcessProbe&&) = default;

    /// Returns raw counters for all visible processes (stateless read).
    /// Processes that vanish mid-read are skipped; throws SourceUnavailableError
    /// only when the enumeration root itself is inaccessible.
    [[nodiscard]] virtual ProcessSnapshot enumerate() = 0;

    /// Clock ticks per second (e.g., sysconf(_SC_CLK_TCK) on Linux).
    [[nodiscard]] virtual long ticksPerSecond() const = 0;
};

} // namespace Platform
