#include "network_interfaces.hpp"
#include "autolink_log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <map>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <netpacket/packet.h>

namespace autolink {

std::vector<NetworkInterface> listLanInterfaces() {
    std::vector<NetworkInterface> result;

    ifaddrs* ifs = nullptr;
    if (::getifaddrs(&ifs) != 0) {
        ALOG_WARN("netif", "getifaddrs failed: %s", std::strerror(errno));
        return result;
    }

    std::map<std::string, std::string> macs;
    for (ifaddrs* it = ifs; it; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_PACKET) continue;
        auto* ll = reinterpret_cast<sockaddr_ll*>(it->ifa_addr);
        if (ll->sll_halen != 6) continue;
        char mac[18];
        std::snprintf(mac, sizeof(mac), "%02x:%02x:%02x:%02x:%02x:%02x",
                      ll->sll_addr[0], ll->sll_addr[1], ll->sll_addr[2],
                      ll->sll_addr[3], ll->sll_addr[4], ll->sll_addr[5]);
        macs[it->ifa_name] = mac;
    }

    for (ifaddrs* it = ifs; it; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
        if ((it->ifa_flags & IFF_LOOPBACK) || !(it->ifa_flags & IFF_UP)) continue;

        char ip[INET_ADDRSTRLEN] = {};
        auto* sin = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
        if (!::inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip))) continue;

        NetworkInterface ni;
        ni.name = it->ifa_name;
        ni.ip4 = ip;
        auto mac = macs.find(ni.name);
        if (mac != macs.end()) ni.mac = mac->second;
        result.push_back(std::move(ni));
    }

    ::freeifaddrs(ifs);
    ALOG_DEBUG("netif", "%zu LAN interface(s)", result.size());
    return result;
}

} // namespace autolink
