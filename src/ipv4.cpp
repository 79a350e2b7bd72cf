// ============================================================================
// ipv4.cpp - implementation for ipv4.hpp
// ============================================================================

#include "zebralink/ipv4.hpp"

#include <cstdlib>

namespace zebralink {

// Split on ',' or '.', each part 0..255 decimal. @p count parts expected.
static bool parse_octets(const std::string& s, char sep, std::size_t count, std::vector<uint32_t>& out) {
  out.clear();
  std::size_t start = 0;
  while (true) {
    const std::size_t end = s.find(sep, start);
    const std::string part = s.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (part.empty() || part.size() > 3) return false;
    for (char c : part) if (c < '0' || c > '9') return false;
    const long v = std::strtol(part.c_str(), nullptr, 10);
    if (v > 255) return false;
    out.push_back(static_cast<uint32_t>(v));
    if (end == std::string::npos) break;
    start = end + 1;
  }
  return out.size() == count;
}

bool parse_ipv4(const std::string& s, uint32_t& out) {
  std::vector<uint32_t> o;
  if (!parse_octets(s, '.', 4, o)) return false;
  out = (o[0] << 24) | (o[1] << 16) | (o[2] << 8) | o[3];
  return true;
}

std::string format_ipv4(uint32_t addr) {
  return std::to_string((addr >> 24) & 0xFF) + "." + std::to_string((addr >> 16) & 0xFF) + "." +
         std::to_string((addr >> 8) & 0xFF) + "." + std::to_string(addr & 0xFF);
}

bool find_shared_subnet(const std::vector<Ipv4Interface>& ifaces, uint32_t peer, Ipv4Interface& out) {
  for (const auto& i : ifaces) {
    if (i.netmask == 0 || i.address == 0) continue;
    if (same_subnet(i.address, peer, i.netmask)) {
      out = i;
      return true;
    }
  }
  return false;
}

std::string format_port_argument(uint32_t addr, uint16_t port) {
  return std::to_string((addr >> 24) & 0xFF) + "," + std::to_string((addr >> 16) & 0xFF) + "," +
         std::to_string((addr >> 8) & 0xFF) + "," + std::to_string(addr & 0xFF) + "," +
         std::to_string(port / 256) + "," + std::to_string(port % 256);
}

bool parse_port_argument(const std::string& arg, uint32_t& addr, uint16_t& port) {
  std::vector<uint32_t> o;
  if (!parse_octets(arg, ',', 6, o)) return false;
  addr = (o[0] << 24) | (o[1] << 16) | (o[2] << 8) | o[3];
  port = static_cast<uint16_t>(o[4] * 256 + o[5]);
  return true;
}

} // namespace zebralink
