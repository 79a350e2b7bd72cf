#pragma once
/**
 * @file ipv4.hpp
 * @brief IPv4 helpers for active-mode FTP address negotiation.
 *
 * Addresses are host-order uint32_t (10.0.0.7 == 0x0A000007).
 *
 * In active mode the client tells the server where to connect back with
 * `PORT h1,h2,h3,h4,p1,p2`, where p1 = port / 256 and p2 = port % 256. The
 * address sent must be one the printer can reach, so it is taken from the
 * local interface sharing a subnet with the control connection's peer.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace zebralink {

struct Ipv4Interface {
  std::string name;
  uint32_t    address = 0;
  uint32_t    netmask = 0;
};

/// Dotted quad to host-order address. Rejects anything but four 0..255 octets.
bool parse_ipv4(const std::string& s, uint32_t& out);
std::string format_ipv4(uint32_t addr);

inline bool same_subnet(uint32_t a, uint32_t b, uint32_t mask) { return (a & mask) == (b & mask); }

/// First interface whose subnet contains @p peer. Interfaces with a zero mask are skipped.
bool find_shared_subnet(const std::vector<Ipv4Interface>& ifaces, uint32_t peer, Ipv4Interface& out);

/// "h1,h2,h3,h4,p1,p2"
std::string format_port_argument(uint32_t addr, uint16_t port);
bool parse_port_argument(const std::string& arg, uint32_t& addr, uint16_t& port);

} // namespace zebralink
