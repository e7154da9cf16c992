#include "Contact.hpp"

using namespace pythia;

bool Contact::operator==(const Contact &pOther) const {
  return id == pOther.id && address == pOther.address && port == pOther.port;
}

bool Contact::operator!=(const Contact &pOther) const { return !(*this == pOther); }

net::ip::udp::endpoint Contact::endpoint() const { return {address, port}; }

Contact Contact::fromEndpoint(const u256 &pID, const net::ip::udp::endpoint &pEndpoint) {
  return {pID, pEndpoint.address(), pEndpoint.port()};
}

Contact Contact::resolve(const u256 &pID, const std::string &pHost, u16 pPort) {
  ErrorCode lError;
  auto lAddress = net::ip::make_address(pHost, lError);
  if (lError)
    throw std::invalid_argument("bad node address " + pHost + ": " + lError.message());
  return {pID, lAddress, pPort};
}

std::ostream &pythia::operator<<(std::ostream &pOS, const Contact &pContact) {
  return pOS << '{' << pContact.id << ", " << pContact.address.to_string() << ", " << pContact.port << '}';
}
