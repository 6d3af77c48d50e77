#include "indevolt/net/discovery/discovery_collector.hpp"

#include "indevolt/logging/indevolt_logging.hpp"

namespace indevolt
{

bool DiscoveryCollector::add_response(const std::string& host, const std::string& payload)
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_hosts.insert(host).second)
    {
        INDEVOLT_LOG_TRACE("Dropping repeated reply from " << host);
        return false;
    }

    _devices.push_back(DiscoveredDevice::from_response(host, payload));
    INDEVOLT_LOG_DEBUG("Found " << _devices.back());
    return true;
}

std::vector<DiscoveredDevice> DiscoveryCollector::devices() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _devices;
}

std::size_t DiscoveryCollector::size() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _devices.size();
}

} // namespace indevolt
