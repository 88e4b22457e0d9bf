/*
 * port_allocator.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Emulator console port selection

**************************************************/

#ifndef DEVPREVIEW_DEVICE_ANDROID_PORT_ALLOCATOR_HPP
#define DEVPREVIEW_DEVICE_ANDROID_PORT_ALLOCATOR_HPP

#include <vector>

#include "common/preview_result.hpp"

namespace devpreview::device::android {

/**
 * @brief Picks console ports for new emulators.
 *
 * Emulators use an even console port and the odd port after it for adb, so
 * only even ports in [first, last] are handed out.
 */
class PortAllocator {
public:
    PortAllocator(int firstPort, int lastPort);

    /**
     * @brief Lowest free console port
     * @param busyPorts Ports of emulators currently running
     * @return Port, or ResourceExhausted when every port is taken
     */
    [[nodiscard]] auto allocate(const std::vector<int>& busyPorts) const
        -> PreviewResult<int>;

    [[nodiscard]] auto firstPort() const noexcept -> int { return first_; }
    [[nodiscard]] auto lastPort() const noexcept -> int { return last_; }

private:
    int first_;
    int last_;
};

}  // namespace devpreview::device::android

#endif  // DEVPREVIEW_DEVICE_ANDROID_PORT_ALLOCATOR_HPP
