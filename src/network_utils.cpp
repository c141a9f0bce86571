#ifdef _WIN32
    // Include winsock2.h first to avoid conflicts with windows.h
    #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
    #endif
    #include <winsock2.h>
    #include <ws2tcpip.h>
#else
    #include <netdb.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
#endif

#include "network_utils.h"
#include "logger.h"
#include <cstring>
#include <cstdlib>

// Network utilities module logging macros
#define LOG_NETUTILS_DEBUG(message) LOG_DEBUG("network_utils", message)
#define LOG_NETUTILS_INFO(message)  LOG_INFO("network_utils", message)
#define LOG_NETUTILS_WARN(message)  LOG_WARN("network_utils", message)
#define LOG_NETUTILS_ERROR(message) LOG_ERROR("network_utils", message)

namespace skyshare {
namespace network_utils {

namespace {

std::string resolve_family(const std::string& hostname, int family) {
    struct addrinfo hints, *result;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = family;
    hints.ai_socktype = SOCK_DGRAM;

    int status = getaddrinfo(hostname.c_str(), nullptr, &hints, &result);
    if (status != 0) {
#ifdef _WIN32
        LOG_NETUTILS_ERROR("Failed to resolve hostname " << hostname << ": " << WSAGetLastError());
#else
        LOG_NETUTILS_ERROR("Failed to resolve hostname " << hostname << ": " << gai_strerror(status));
#endif
        return "";
    }

    std::string ip;
    if (family == AF_INET6) {
        char ip_str[INET6_ADDRSTRLEN];
        struct sockaddr_in6* addr_in6 = (struct sockaddr_in6*)result->ai_addr;
        inet_ntop(AF_INET6, &addr_in6->sin6_addr, ip_str, INET6_ADDRSTRLEN);
        ip = ip_str;
    } else {
        char ip_str[INET_ADDRSTRLEN];
        struct sockaddr_in* addr_in = (struct sockaddr_in*)result->ai_addr;
        inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);
        ip = ip_str;
    }

    freeaddrinfo(result);

    LOG_NETUTILS_INFO("Resolved " << hostname << " to " << ip);
    return ip;
}

} // namespace

std::string resolve_hostname(const std::string& hostname) {
    LOG_NETUTILS_DEBUG("Resolving hostname: " << hostname);

    if (hostname.empty()) {
        LOG_NETUTILS_DEBUG("Empty hostname provided");
        return "";
    }

    if (is_valid_ipv4(hostname)) {
        return hostname;
    }

    return resolve_family(hostname, AF_INET);
}

std::string resolve_hostname_v6(const std::string& hostname) {
    LOG_NETUTILS_DEBUG("Resolving hostname to IPv6: " << hostname);

    if (hostname.empty()) {
        LOG_NETUTILS_DEBUG("Empty hostname provided");
        return "";
    }

    if (is_valid_ipv6(hostname)) {
        return hostname;
    }

    return resolve_family(hostname, AF_INET6);
}

std::string resolve(const std::string& hostname, bool ipv6) {
    return ipv6 ? resolve_hostname_v6(hostname) : resolve_hostname(hostname);
}

bool is_valid_ipv4(const std::string& ip_str) {
    struct sockaddr_in sa;
    return inet_pton(AF_INET, ip_str.c_str(), &sa.sin_addr) == 1;
}

bool is_valid_ipv6(const std::string& ip_str) {
    struct sockaddr_in6 sa;
    return inet_pton(AF_INET6, ip_str.c_str(), &sa.sin6_addr) == 1;
}

bool is_hostname(const std::string& str) {
    if (is_valid_ipv4(str) || is_valid_ipv6(str)) {
        return false;
    }

    if (str.empty() || str.length() > 253) {
        return false;
    }

    if (str.front() == '.' || str.back() == '.' || str.front() == '-' || str.back() == '-') {
        return false;
    }

    if (str.find("..") != std::string::npos) {
        return false;
    }

    for (char c : str) {
        bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                       (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_';
        if (!allowed) {
            return false;
        }
    }

    return true;
}

std::string normalize_ip(const std::string& ip) {
    static const std::string mapped_prefix = "::ffff:";
    if (ip.size() > mapped_prefix.size() && ip.compare(0, mapped_prefix.size(), mapped_prefix) == 0) {
        std::string tail = ip.substr(mapped_prefix.size());
        if (is_valid_ipv4(tail)) {
            return tail;
        }
    }
    return ip;
}

bool split_host_port(const std::string& text, std::string& host_out, uint16_t& port_out) {
    std::string host;
    std::string port_str;

    if (!text.empty() && text.front() == '[') {
        size_t close = text.find(']');
        if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            return false;
        }
        host = text.substr(1, close - 1);
        port_str = text.substr(close + 2);
    } else {
        size_t colon = text.rfind(':');
        if (colon == std::string::npos || colon == 0) {
            return false;
        }
        host = text.substr(0, colon);
        // A bare IPv6 literal without brackets has more than one colon
        if (host.find(':') != std::string::npos) {
            return false;
        }
        port_str = text.substr(colon + 1);
    }

    if (host.empty() || port_str.empty() || port_str.size() > 5) {
        return false;
    }
    for (char c : port_str) {
        if (c < '0' || c > '9') {
            return false;
        }
    }

    long port = std::strtol(port_str.c_str(), nullptr, 10);
    if (port <= 0 || port > 65535) {
        return false;
    }

    host_out = host;
    port_out = static_cast<uint16_t>(port);
    return true;
}

} // namespace network_utils
} // namespace skyshare
