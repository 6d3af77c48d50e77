#pragma once

#include "indevolt/net/discovery/discovered_device.hpp"

#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace indevolt
{

/**
 * @brief Devices found during one discovery run, at most one per host, in arrival order.
 *
 * Thread safe. The first reply from a host is kept, later ones from the same host are dropped
 * whatever they contain.
 */
class DiscoveryCollector
{
public:
    /**
     * @brief Records the reply of a host that has not replied before.
     * @return false if the host already has a device in this run
     */
    bool add_response(const std::string& host, const std::string& payload);

    std::vector<DiscoveredDevice> devices() const;

    std::size_t size() const;

private:
    mutable std::mutex _mutex;
    std::vector<DiscoveredDevice> _devices;
    std::unordered_set<std::string> _hosts;
};

} // namespace indevolt
