/*
 * port_allocator.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "port_allocator.hpp"

#include <algorithm>

namespace devpreview::device::android {

PortAllocator::PortAllocator(int firstPort, int lastPort)
    : first_(firstPort % 2 == 0 ? firstPort : firstPort + 1), last_(lastPort) {}

auto PortAllocator::allocate(const std::vector<int>& busyPorts) const
    -> PreviewResult<int> {
    for (int port = first_; port <= last_; port += 2) {
        if (std::find(busyPorts.begin(), busyPorts.end(), port) ==
            busyPorts.end()) {
            return port;
        }
    }
    return failure(PreviewErrorCode::ResourceExhausted,
                   "No free emulator port between " + std::to_string(first_) +
                       " and " + std::to_string(last_));
}

}  // namespace devpreview::device::android
