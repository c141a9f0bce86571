#include "socket.h"
#include "network_utils.h"
#include "logger.h"
#include <cstring>
#ifndef _WIN32
    #include <fcntl.h>    // for O_NONBLOCK
    #include <errno.h>    // for errno
#endif

// Socket module logging macros
#define LOG_SOCKET_DEBUG(message) LOG_DEBUG("socket", message)
#define LOG_SOCKET_INFO(message)  LOG_INFO("socket", message)
#define LOG_SOCKET_WARN(message)  LOG_WARN("socket", message)
#define LOG_SOCKET_ERROR(message) LOG_ERROR("socket", message)

namespace skyshare {

//=============================================================================
// SocketAddress
//=============================================================================

bool SocketAddress::is_ipv6() const {
    return network_utils::is_valid_ipv6(ip);
}

std::string SocketAddress::to_string() const {
    if (is_ipv6()) {
        return "[" + ip + "]:" + std::to_string(port);
    }
    return ip + ":" + std::to_string(port);
}

bool SocketAddress::parse(const std::string& text, SocketAddress& out) {
    std::string host;
    uint16_t port = 0;
    if (!network_utils::split_host_port(text, host, port)) {
        return false;
    }
    if (!network_utils::is_valid_ipv4(host) && !network_utils::is_valid_ipv6(host)) {
        return false;
    }
    out.ip = network_utils::normalize_ip(host);
    out.port = port;
    return true;
}

//=============================================================================
// Socket Library Initialization
//=============================================================================

bool init_socket_library() {
#ifdef _WIN32
    WSADATA wsaData;
    int result = WSAStartup(MAKEWORD(2, 2), &wsaData);
    if (result != 0) {
        LOG_SOCKET_ERROR("WSAStartup failed: " << result);
        return false;
    }
    LOG_SOCKET_INFO("Windows Socket API initialized");
#endif
    LOG_SOCKET_DEBUG("Socket library initialized");
    return true;
}

void cleanup_socket_library() {
#ifdef _WIN32
    WSACleanup();
    LOG_SOCKET_INFO("Windows Socket API cleaned up");
#endif
    LOG_SOCKET_DEBUG("Socket library cleaned up");
}

std::string get_last_socket_error() {
#ifdef _WIN32
    return "error " + std::to_string(WSAGetLastError());
#else
    return strerror(errno);
#endif
}

//=============================================================================
// UDP Socket Functions
//=============================================================================

socket_t create_udp_socket_v4(const std::string& bind_ip, int port, std::string* error_out) {
    LOG_SOCKET_DEBUG("Creating UDP socket on " << (bind_ip.empty() ? "0.0.0.0" : bind_ip) << ":" << port);

    if (port < 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 0-65535)");
        if (error_out) *error_out = "Invalid port number " + std::to_string(port);
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (bind_ip.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, bind_ip.c_str(), &addr.sin_addr) != 1) {
        LOG_SOCKET_ERROR("Invalid IPv4 bind address: " << bind_ip);
        if (error_out) *error_out = "Invalid bind address " + bind_ip;
        return INVALID_SOCKET_VALUE;
    }

    socket_t udp_socket = socket(AF_INET, SOCK_DGRAM, 0);
    if (udp_socket == INVALID_SOCKET_VALUE) {
        std::string reason = get_last_socket_error();
        LOG_SOCKET_ERROR("Failed to create UDP socket: " << reason);
        if (error_out) *error_out = "Failed to create socket: " + reason;
        return INVALID_SOCKET_VALUE;
    }

    if (bind(udp_socket, (struct sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VALUE) {
        std::string reason = get_last_socket_error();
        LOG_SOCKET_ERROR("Failed to bind UDP socket to port " << port << ": " << reason);
        if (error_out) *error_out = "Failed to bind port " + std::to_string(port) + ": " + reason;
        close_socket(udp_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("UDP socket bound to port " << get_ephemeral_port(udp_socket));
    return udp_socket;
}

socket_t create_udp_socket_v6(const std::string& bind_ip, int port, std::string* error_out) {
    LOG_SOCKET_DEBUG("Creating dual stack UDP socket on [" << (bind_ip.empty() ? "::" : bind_ip) << "]:" << port);

    if (port < 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 0-65535)");
        if (error_out) *error_out = "Invalid port number " + std::to_string(port);
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_in6 addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin6_family = AF_INET6;
    addr.sin6_port = htons(static_cast<uint16_t>(port));
    if (bind_ip.empty()) {
        addr.sin6_addr = in6addr_any;
    } else if (inet_pton(AF_INET6, bind_ip.c_str(), &addr.sin6_addr) != 1) {
        LOG_SOCKET_ERROR("Invalid IPv6 bind address: " << bind_ip);
        if (error_out) *error_out = "Invalid bind address " + bind_ip;
        return INVALID_SOCKET_VALUE;
    }

    socket_t udp_socket = socket(AF_INET6, SOCK_DGRAM, 0);
    if (udp_socket == INVALID_SOCKET_VALUE) {
        std::string reason = get_last_socket_error();
        LOG_SOCKET_ERROR("Failed to create dual stack UDP socket: " << reason);
        if (error_out) *error_out = "Failed to create socket: " + reason;
        return INVALID_SOCKET_VALUE;
    }

    // Disable IPv6-only mode to allow IPv4 connections
    int ipv6_only = 0;
    if (setsockopt(udp_socket, IPPROTO_IPV6, IPV6_V6ONLY,
                   (char*)&ipv6_only, sizeof(ipv6_only)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_WARN("Failed to disable IPv6-only mode, will be IPv6 only");
    }

    if (bind(udp_socket, (struct sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VALUE) {
        std::string reason = get_last_socket_error();
        LOG_SOCKET_ERROR("Failed to bind dual stack UDP socket to port " << port << ": " << reason);
        if (error_out) *error_out = "Failed to bind port " + std::to_string(port) + ": " + reason;
        close_socket(udp_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("Dual stack UDP socket bound to port " << get_ephemeral_port(udp_socket));
    return udp_socket;
}

int send_udp_data(socket_t socket, const std::vector<uint8_t>& data, const SocketAddress& peer) {
    sockaddr_storage local;
    socklen_t local_len = sizeof(local);
    if (getsockname(socket, (struct sockaddr*)&local, &local_len) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to query socket family: " << get_last_socket_error());
        return -1;
    }

    sockaddr_storage dest;
    memset(&dest, 0, sizeof(dest));
    socklen_t dest_len = 0;

    if (local.ss_family == AF_INET6) {
        sockaddr_in6* addr = (sockaddr_in6*)&dest;
        addr->sin6_family = AF_INET6;
        addr->sin6_port = htons(peer.port);
        dest_len = sizeof(sockaddr_in6);

        if (network_utils::is_valid_ipv6(peer.ip)) {
            inet_pton(AF_INET6, peer.ip.c_str(), &addr->sin6_addr);
        } else {
            // Dual stack socket: IPv4 peers go through ::ffff:x.x.x.x
            struct in_addr ipv4_addr;
            if (inet_pton(AF_INET, peer.ip.c_str(), &ipv4_addr) != 1) {
                LOG_SOCKET_ERROR("Invalid destination address: " << peer.ip);
                return -1;
            }
            addr->sin6_addr.s6_addr[10] = 0xff;
            addr->sin6_addr.s6_addr[11] = 0xff;
            memcpy(&addr->sin6_addr.s6_addr[12], &ipv4_addr.s_addr, 4);
        }
    } else {
        sockaddr_in* addr = (sockaddr_in*)&dest;
        addr->sin_family = AF_INET;
        addr->sin_port = htons(peer.port);
        dest_len = sizeof(sockaddr_in);

        if (inet_pton(AF_INET, peer.ip.c_str(), &addr->sin_addr) != 1) {
            LOG_SOCKET_ERROR("Cannot reach " << peer.ip << " from an IPv4 socket");
            return -1;
        }
    }

    int bytes_sent = sendto(socket, (const char*)data.data(), static_cast<int>(data.size()), 0,
                            (struct sockaddr*)&dest, dest_len);
    if (bytes_sent == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to send UDP data to " << peer.to_string() << " (error: " << get_last_socket_error() << ")");
        return -1;
    }

    return bytes_sent;
}

std::vector<uint8_t> receive_udp_data(socket_t socket, size_t buffer_size, SocketAddress& sender_peer) {
    std::vector<uint8_t> buffer(buffer_size);
    int bytes_received = receive_udp_data(socket, buffer, sender_peer);
    if (bytes_received <= 0) {
        return std::vector<uint8_t>();
    }
    buffer.resize(bytes_received);
    return buffer;
}

int receive_udp_data(socket_t socket, std::vector<uint8_t>& buffer, SocketAddress& sender_peer) {
    if (buffer.empty()) {
        return 0;
    }

    sockaddr_storage sender_addr;
    socklen_t sender_addr_len = sizeof(sender_addr);

    int bytes_received = recvfrom(socket, (char*)buffer.data(), static_cast<int>(buffer.size()), 0,
                                  (struct sockaddr*)&sender_addr, &sender_addr_len);

    if (bytes_received == SOCKET_ERROR_VALUE) {
#ifdef _WIN32
        int error = WSAGetLastError();
        // WSAECONNRESET reports an ICMP port unreachable from an earlier send
        if (error != WSAEWOULDBLOCK && error != WSAECONNRESET) {
            LOG_SOCKET_ERROR("Failed to receive UDP data: " << error);
        }
#else
        int error = errno;
        if (error != EAGAIN && error != EWOULDBLOCK && error != ECONNREFUSED) {
            LOG_SOCKET_ERROR("Failed to receive UDP data: " << strerror(error));
        }
#endif
        return 0;
    }

    if (bytes_received == 0) {
        return 0;
    }

    if (sender_addr.ss_family == AF_INET) {
        char sender_ip[INET_ADDRSTRLEN];
        struct sockaddr_in* addr_in = (struct sockaddr_in*)&sender_addr;
        inet_ntop(AF_INET, &addr_in->sin_addr, sender_ip, INET_ADDRSTRLEN);
        sender_peer.ip = sender_ip;
        sender_peer.port = ntohs(addr_in->sin_port);
    } else if (sender_addr.ss_family == AF_INET6) {
        char sender_ip[INET6_ADDRSTRLEN];
        struct sockaddr_in6* addr_in6 = (struct sockaddr_in6*)&sender_addr;
        inet_ntop(AF_INET6, &addr_in6->sin6_addr, sender_ip, INET6_ADDRSTRLEN);
        sender_peer.ip = network_utils::normalize_ip(sender_ip);
        sender_peer.port = ntohs(addr_in6->sin6_port);
    } else {
        LOG_SOCKET_WARN("Received UDP data from unknown address family");
        return 0;
    }

    return bytes_received;
}

//=============================================================================
// Common Socket Functions
//=============================================================================

void close_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
        LOG_SOCKET_DEBUG("Closing socket " << socket);
        closesocket(socket);
    }
}

bool is_valid_socket(socket_t socket) {
    return socket != INVALID_SOCKET_VALUE;
}

bool set_socket_nonblocking(socket_t socket) {
#ifdef _WIN32
    unsigned long mode = 1;
    if (ioctlsocket(socket, FIONBIO, &mode) != 0) {
        LOG_SOCKET_ERROR("Failed to set socket to non-blocking mode");
        return false;
    }
#else
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags == -1) {
        LOG_SOCKET_ERROR("Failed to get socket flags");
        return false;
    }

    if (fcntl(socket, F_SETFL, flags | O_NONBLOCK) == -1) {
        LOG_SOCKET_ERROR("Failed to set socket to non-blocking mode");
        return false;
    }
#endif
    return true;
}

int get_ephemeral_port(socket_t socket) {
    sockaddr_storage addr;
    socklen_t addr_len = sizeof(addr);
    if (getsockname(socket, (struct sockaddr*)&addr, &addr_len) == SOCKET_ERROR_VALUE) {
        return 0;
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(((struct sockaddr_in*)&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(((struct sockaddr_in6*)&addr)->sin6_port);
    }
    return 0;
}

} // namespace skyshare
