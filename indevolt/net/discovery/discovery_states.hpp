#pragma once

namespace indevolt
{
enum class DeviceDiscoveryState
{
    open,
    running,
    stopping,
    sending_async,
    receiving_async,
};

inline const char* to_string(DeviceDiscoveryState state) noexcept
{
    switch (state)
    {
    case DeviceDiscoveryState::open:
        return "open";

    case DeviceDiscoveryState::running:
        return "running";

    case DeviceDiscoveryState::stopping:
        return "stopping";

    case DeviceDiscoveryState::sending_async:
        return "sending_async";

    case DeviceDiscoveryState::receiving_async:
        return "receiving_async";
    }

    return "unknown";
}

} // namespace indevolt
