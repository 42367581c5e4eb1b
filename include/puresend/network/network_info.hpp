#pragma once

#include <string>
#include <vector>

namespace puresend::network {

struct NetworkInfo {
    std::string host_name;
    std::vector<std::string> addresses; // preferred first
    std::string primary_address;
};

// 192.168.x.x first, then 10.x.x.x, then 172.16-31.x.x, then everything else.
// Loopback and link-local addresses are dropped. Order within a class is kept.
std::vector<std::string> order_addresses(const std::vector<std::string>& addresses);

// IPv4 addresses of the up interfaces, ordered; {"127.0.0.1"} when there are none.
std::vector<std::string> local_ipv4_addresses();

NetworkInfo get_network_info();

} // namespace puresend::network
