#include "TemperatureReader.h"

#include "SensorOutputParser.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace Domain
{

TemperatureReader::TemperatureReader(std::unique_ptr<Platform::IThermalProbe> thermalProbe,
                                     std::unique_ptr<Platform::ISensorsCommand> sensorsCommand)
    : m_ThermalProbe(std::move(thermalProbe)), m_SensorsCommand(std::move(sensorsCommand))
{
    if (m_ThermalProbe)
    {
        const auto caps = m_ThermalProbe->capabilities();
        spdlog::debug("TemperatureReader: {} thermal zones, sensors fallback {}",
                      caps.zoneCount,
                      m_SensorsCommand ? "enabled" : "disabled");
    }
}

std::optional<TemperatureReading> TemperatureReader::capture()
{
    if (auto reading = readThermalZones())
    {
        return reading;
    }

    if (auto reading = readSensorsCommand())
    {
        return reading;
    }

    spdlog::debug("TemperatureReader: no temperature source available");
    return std::nullopt;
}

std::optional<TemperatureReading> TemperatureReader::readThermalZones()
{
    if (!m_ThermalProbe)
    {
        return std::nullopt;
    }

    const auto counters = m_ThermalProbe->read();

    std::optional<TemperatureReading> hottest;
    for (const auto& zone : counters.zones)
    {
        if (!isPlausibleCelsius(zone.celsius))
        {
            spdlog::debug("TemperatureReader: ignoring {} ({}) at {:.1f}C", zone.zone, zone.type, zone.celsius);
            continue;
        }
        if (!hottest || zone.celsius > hottest->celsius)
        {
            hottest = TemperatureReading{.celsius = zone.celsius,
                                         .source = TemperatureSource::ThermalZone,
                                         .label = zone.type.empty() ? zone.zone : zone.type};
        }
    }

    if (!hottest && counters.unreadableZones > 0)
    {
        spdlog::debug("TemperatureReader: {} thermal zones unreadable", counters.unreadableZones);
    }
    return hottest;
}

std::optional<TemperatureReading> TemperatureReader::readSensorsCommand()
{
    if (!m_SensorsCommand)
    {
        return std::nullopt;
    }

    const auto output = m_SensorsCommand->run();
    if (!output)
    {
        return std::nullopt;
    }

    std::optional<TemperatureReading> hottest;
    for (const auto& sensor : SensorOutputParser::parse(*output))
    {
        if (!isPlausibleCelsius(sensor.celsius))
        {
            continue;
        }
        if (!hottest || sensor.celsius > hottest->celsius)
        {
            hottest = TemperatureReading{.celsius = sensor.celsius, .source = TemperatureSource::SensorsCommand, .label = sensor.label};
        }
    }

    if (!hottest)
    {
        spdlog::debug("TemperatureReader: sensors output contained no temperatures");
    }
    return hottest;
}

} // namespace Domain
