#pragma once

#include "utils.hpp"

namespace pythia {

/** Peer of the node protocol, id is its crypto_box public key. */
struct Contact {
  u256 id;
  net::ip::address address;
  u16 port = 0;

  bool operator==(const Contact &pOther) const;
  bool operator!=(const Contact &pOther) const;

  net::ip::udp::endpoint endpoint() const;

  static Contact fromEndpoint(const u256 &pID, const net::ip::udp::endpoint &pEndpoint);

  /** @throw std::invalid_argument if pHost is not a literal IPv4 or IPv6 address */
  static Contact resolve(const u256 &pID, const std::string &pHost, u16 pPort);
};

std::ostream &operator<<(std::ostream &pOS, const Contact &pContact);

} // namespace pythia
