#ifndef AIRBEACON_CORE_NET_UTILS_HPP
#define AIRBEACON_CORE_NET_UTILS_HPP

#include <string>

namespace airbeacon
{
    namespace core
    {

        /**
         * Best guess at the IPv4 address AirPlay clients should connect to.
         *
         * Tries, in order: the source address the kernel picks for a UDP
         * "connection" toward a public address, the first non-loopback
         * interface address, then gethostbyname() on the host name and on
         * "<hostname>.local". Throws ConfigError when nothing usable is found.
         */
        std::string resolve_local_ipv4();

        bool is_loopback_ipv4(const std::string &address);

    } // namespace core
} // namespace airbeacon

#endif // AIRBEACON_CORE_NET_UTILS_HPP
