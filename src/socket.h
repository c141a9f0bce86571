#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <functional>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    typedef SOCKET socket_t;
    #define INVALID_SOCKET_VALUE INVALID_SOCKET
    #define SOCKET_ERROR_VALUE SOCKET_ERROR
#else
    #include <sys/socket.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <unistd.h>
    typedef int socket_t;
    #define INVALID_SOCKET_VALUE -1
    #define SOCKET_ERROR_VALUE -1
    #define closesocket close
#endif

namespace skyshare {

/**
 * UDP endpoint: numeric IP (IPv4 or IPv6, never IPv4-mapped) and port.
 * Text form is "a.b.c.d:port" or "[v6]:port".
 */
struct SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : port(0) {}
    SocketAddress(const std::string& ip, uint16_t port) : ip(ip), port(port) {}

    bool is_ipv6() const;
    bool empty() const { return ip.empty(); }
    std::string to_string() const;

    /**
     * Parse the text form. Hostnames are not resolved here.
     * @return false if the text is not a numeric endpoint
     */
    static bool parse(const std::string& text, SocketAddress& out);

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }

    bool operator!=(const SocketAddress& other) const {
        return !(*this == other);
    }

    bool operator<(const SocketAddress& other) const {
        return ip < other.ip || (ip == other.ip && port < other.port);
    }
};

// Socket Library Initialization
/**
 * Initialize the socket library
 * @return true if successful, false otherwise
 */
bool init_socket_library();

/**
 * Cleanup the socket library
 */
void cleanup_socket_library();

/**
 * Describe the last socket error of the calling thread (errno / WSAGetLastError).
 */
std::string get_last_socket_error();

// UDP Socket Functions
/**
 * Create a UDP socket bound to an IPv4 address
 * @param bind_ip Local IPv4 address ("0.0.0.0" or empty for any)
 * @param port The port to bind to (0 for any available port)
 * @param error_out Optional output for a description of the failure
 * @return UDP socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_udp_socket_v4(const std::string& bind_ip, int port, std::string* error_out = nullptr);

/**
 * Create a dual stack UDP socket bound to an IPv6 address (IPv4 peers
 * are reachable through IPv4-mapped addresses)
 * @param bind_ip Local IPv6 address ("::" or empty for any)
 * @param port The port to bind to (0 for any available port)
 * @param error_out Optional output for a description of the failure
 * @return UDP socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_udp_socket_v6(const std::string& bind_ip, int port, std::string* error_out = nullptr);

/**
 * Send UDP data to a peer
 * @param socket The UDP socket handle
 * @param data The data to send
 * @param peer The destination (numeric address)
 * @return Number of bytes sent, or -1 on error
 */
int send_udp_data(socket_t socket, const std::vector<uint8_t>& data, const SocketAddress& peer);

/**
 * Receive UDP data from a peer
 * @param socket The UDP socket handle
 * @param buffer_size Maximum number of bytes to receive
 * @param sender_peer Output parameter for the sender address (IPv4-mapped addresses are unmapped)
 * @return Received data, empty vector when nothing is pending or on error
 */
std::vector<uint8_t> receive_udp_data(socket_t socket, size_t buffer_size, SocketAddress& sender_peer);

/**
 * Receive one UDP datagram into a caller owned buffer
 * @param socket The UDP socket handle
 * @param buffer Destination, its size is the maximum datagram size; contents past the returned length are unspecified
 * @param sender_peer Output parameter for the sender address (IPv4-mapped addresses are unmapped)
 * @return Number of bytes received, 0 when nothing is pending or on error
 */
int receive_udp_data(socket_t socket, std::vector<uint8_t>& buffer, SocketAddress& sender_peer);

// Common Socket Functions
/**
 * Close a socket
 * @param socket The socket handle to close
 */
void close_socket(socket_t socket);

/**
 * Check if a socket is valid
 * @param socket The socket handle to check
 * @return true if valid, false otherwise
 */
bool is_valid_socket(socket_t socket);

/**
 * Set socket to non-blocking mode
 * @param socket The socket handle
 * @return true if successful, false otherwise
 */
bool set_socket_nonblocking(socket_t socket);

/**
 * Get the port that a socket is bound to
 * @param socket The socket handle
 * @return The local port, or 0 on error
 */
int get_ephemeral_port(socket_t socket);

} // namespace skyshare
