#pragma once

#include <string>
#include <cstdint>

namespace skyshare {
namespace network_utils {

/**
 * Resolve hostname to IPv4 address
 * @param hostname The hostname to resolve (can be hostname or IP address)
 * @return IP address string, or empty string on error
 *
 * Example usage:
 *   std::string ip = network_utils::resolve_hostname("localhost");
 *   std::string ip2 = network_utils::resolve_hostname("192.168.1.1"); // returns same IP
 */
std::string resolve_hostname(const std::string& hostname);

/**
 * Resolve hostname to IPv6 address
 * @param hostname The hostname to resolve (can be hostname or IPv6 address)
 * @return IPv6 address string, or empty string on error
 */
std::string resolve_hostname_v6(const std::string& hostname);

/**
 * Resolve a hostname for the given address family.
 * @param hostname Hostname or IP literal
 * @param ipv6 true to resolve to an IPv6 address
 * @return IP address string, or empty string on error
 */
std::string resolve(const std::string& hostname, bool ipv6);

/**
 * Check if a string is a valid IPv4 address
 * @param ip_str The string to validate
 * @return true if valid IPv4 address, false otherwise
 */
bool is_valid_ipv4(const std::string& ip_str);

/**
 * Check if a string is a valid IPv6 address
 * @param ip_str The string to validate
 * @return true if valid IPv6 address, false otherwise
 */
bool is_valid_ipv6(const std::string& ip_str);

/**
 * Check if a string is a hostname (not an IP address)
 * @param str The string to check
 * @return true if it's a hostname, false if it's an IP address
 */
bool is_hostname(const std::string& str);

/**
 * Turn an IPv4-mapped IPv6 address (::ffff:a.b.c.d) back into a.b.c.d.
 * Any other address is returned unchanged.
 */
std::string normalize_ip(const std::string& ip);

/**
 * Split "host:port" or "[v6]:port" into its parts.
 * @return false if the port is missing or not in 1..65535
 */
bool split_host_port(const std::string& text, std::string& host_out, uint16_t& port_out);

} // namespace network_utils
} // namespace skyshare
