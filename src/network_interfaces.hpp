#pragma once
// =============================================================================
// AutoLink - Network interfaces
// =============================================================================
// IPv4 interfaces a device on the LAN could reach this machine through.
// Loopback and down interfaces are skipped.
// =============================================================================

#include <string>
#include <vector>

namespace autolink {

struct NetworkInterface {
    std::string name;  // "eth0"
    std::string ip4;   // "192.168.1.10"
    std::string mac;   // "aa:bb:cc:dd:ee:ff", empty when unknown
};

std::vector<NetworkInterface> listLanInterfaces();

} // namespace autolink
