#include "puresend/network/network_info.hpp"
#include "puresend/core/logger.hpp"
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace puresend::network {

namespace {
    // Lower rank sorts first; -1 means the address is never offered.
    int address_rank(const std::string& address) {
        boost::system::error_code ec;
        auto ip = boost::asio::ip::make_address_v4(address, ec);
        if (ec || ip.is_loopback() || ip.is_unspecified()) {
            return -1;
        }

        auto bytes = ip.to_bytes();
        if (bytes[0] == 169 && bytes[1] == 254) {
            return -1;
        }
        if (bytes[0] == 192 && bytes[1] == 168) {
            return 0;
        }
        if (bytes[0] == 10) {
            return 1;
        }
        if (bytes[0] == 172 && bytes[1] >= 16 && bytes[1] <= 31) {
            return 2;
        }
        return 3;
    }
}

std::vector<std::string> order_addresses(const std::vector<std::string>& addresses) {
    std::vector<std::pair<int, std::string>> ranked;
    for (const auto& address : addresses) {
        int rank = address_rank(address);
        if (rank < 0) {
            continue;
        }
        bool duplicate = std::any_of(ranked.begin(), ranked.end(),
                                     [&](const auto& entry) { return entry.second == address; });
        if (!duplicate) {
            ranked.emplace_back(rank, address);
        }
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::string> ordered;
    ordered.reserve(ranked.size());
    for (auto& [rank, address] : ranked) {
        ordered.push_back(std::move(address));
    }
    return ordered;
}

std::vector<std::string> local_ipv4_addresses() {
    std::vector<std::string> found;

    ifaddrs* interfaces = nullptr;
    if (::getifaddrs(&interfaces) != 0) {
        LOG_WARN("getifaddrs failed: {}", std::strerror(errno));
    } else {
        for (auto* entry = interfaces; entry != nullptr; entry = entry->ifa_next) {
            if (!entry->ifa_addr || entry->ifa_addr->sa_family != AF_INET) {
                continue;
            }
            if (!(entry->ifa_flags & IFF_UP)) {
                continue;
            }

            char buffer[INET_ADDRSTRLEN] = {};
            auto* addr = reinterpret_cast<sockaddr_in*>(entry->ifa_addr);
            if (::inet_ntop(AF_INET, &addr->sin_addr, buffer, sizeof(buffer))) {
                found.emplace_back(buffer);
            }
        }
        ::freeifaddrs(interfaces);
    }

    auto ordered = order_addresses(found);
    if (ordered.empty()) {
        ordered.push_back("127.0.0.1");
    }
    return ordered;
}

NetworkInfo get_network_info() {
    NetworkInfo info;

    boost::system::error_code ec;
    info.host_name = boost::asio::ip::host_name(ec);
    if (ec) {
        info.host_name = "localhost";
    }

    info.addresses = local_ipv4_addresses();
    info.primary_address = info.addresses.front();
    return info;
}

} // namespace puresend::network
