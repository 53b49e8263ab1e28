#include "ProcessRanking.h"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace Domain
{

std::vector<ProcessUsage> rankProcesses(const std::unordered_map<std::int32_t, double>& percentByPid,
                                        const Platform::ProcessSnapshot& snapshot,
                                        std::size_t limit)
{
    std::vector<ProcessUsage> ranked;
    ranked.reserve(percentByPid.size());

    for (const auto& [pid, percent] : percentByPid)
    {
        ProcessUsage usage{.pid = pid, .cpuPercent = percent, .name = {}, .user = {}};
        if (const auto it = snapshot.processes.find(pid); it != snapshot.processes.end())
        {
            usage.name = it->second.name;
            usage.user = it->second.user;
        }
        else
        {
            usage.name = Platform::PLACEHOLDER_PROCESS_NAME;
            usage.user = Platform::PLACEHOLDER_USER;
        }
        ranked.push_back(std::move(usage));
    }

    const auto byUsage = [](const ProcessUsage& lhs, const ProcessUsage& rhs)
    {
        if (lhs.cpuPercent != rhs.cpuPercent)
        {
            return lhs.cpuPercent > rhs.cpuPercent;
        }
        return lhs.pid < rhs.pid;
    };

    if (limit > 0 && limit < ranked.size())
    {
        std::partial_sort(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(limit), ranked.end(), byUsage);
        ranked.resize(limit);
    }
    else
    {
        std::sort(ranked.begin(), ranked.end(), byUsage);
    }
    return ranked;
}

} // namespace Domain
