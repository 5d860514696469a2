#include "core/net_utils.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <netdb.h>
#include <ifaddrs.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace airbeacon
{
    namespace core
    {

        namespace
        {
            std::string probe_route_source()
            {
                auto logger = get_logger("net");

                int sock = socket(AF_INET, SOCK_DGRAM, 0);
                if (sock < 0)
                {
                    logger->warning("Failed to create probe socket",
                                    LogContext().add("error", strerror(errno)));
                    return "";
                }

                sockaddr_in remote{};
                remote.sin_family = AF_INET;
                remote.sin_port = htons(80);
                inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

                std::string result;
                if (connect(sock, reinterpret_cast<sockaddr *>(&remote), sizeof(remote)) == 0)
                {
                    sockaddr_in local{};
                    socklen_t len = sizeof(local);
                    if (getsockname(sock, reinterpret_cast<sockaddr *>(&local), &len) == 0)
                    {
                        char ip_str[INET_ADDRSTRLEN];
                        if (inet_ntop(AF_INET, &local.sin_addr, ip_str, INET_ADDRSTRLEN))
                        {
                            result = ip_str;
                        }
                    }
                }
                else
                {
                    logger->debug("Route probe failed, will try interfaces and gethostbyname",
                                  LogContext().add("error", strerror(errno)));
                }

                close(sock);
                return result;
            }

            std::string first_interface_address()
            {
                struct ifaddrs *ifaddr, *ifa;
                if (getifaddrs(&ifaddr) == -1)
                {
                    return "";
                }

                std::string result;
                for (ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next)
                {
                    if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET)
                        continue;

                    auto *addr = reinterpret_cast<sockaddr_in *>(ifa->ifa_addr);
                    char ip_str[INET_ADDRSTRLEN];
                    inet_ntop(AF_INET, &addr->sin_addr, ip_str, INET_ADDRSTRLEN);

                    if (!is_loopback_ipv4(ip_str))
                    {
                        result = ip_str;
                        break;
                    }
                }
                freeifaddrs(ifaddr);
                return result;
            }

            std::string lookup_host(const std::string &name)
            {
                struct hostent *host = gethostbyname(name.c_str());
                if (host == nullptr || host->h_addrtype != AF_INET || host->h_addr_list[0] == nullptr)
                {
                    return "";
                }

                char ip_str[INET_ADDRSTRLEN];
                if (!inet_ntop(AF_INET, host->h_addr_list[0], ip_str, INET_ADDRSTRLEN))
                {
                    return "";
                }
                return ip_str;
            }
        } // namespace

        bool is_loopback_ipv4(const std::string &address)
        {
            in_addr addr{};
            if (inet_pton(AF_INET, address.c_str(), &addr) != 1)
            {
                return false;
            }
            return (ntohl(addr.s_addr) >> 24) == 127;
        }

        std::string resolve_local_ipv4()
        {
            auto logger = get_logger("net");

            std::string address = probe_route_source();
            if (!address.empty() && !is_loopback_ipv4(address))
            {
                return address;
            }

            address = first_interface_address();
            if (!address.empty())
            {
                return address;
            }

            char hostname[256] = {0};
            if (gethostname(hostname, sizeof(hostname) - 1) != 0)
            {
                throw ConfigError("failed to obtain local ipv4 address: enter it with option --ipv4 ...");
            }

            address = lookup_host(hostname);
            if (address == "127.0.1.1" || address.empty())
            {
                // Debian maps the host name to 127.0.1.1 in /etc/hosts
                address = lookup_host(std::string(hostname) + ".local");
            }

            if (address.empty() || is_loopback_ipv4(address))
            {
                throw ConfigError("failed to obtain local ipv4 address: enter it with option --ipv4 ...");
            }

            logger->debug("Resolved local IPv4 by host name", LogContext().add("hostname", hostname).add("ipv4", address));
            return address;
        }

    } // namespace core
} // namespace airbeacon
