/* -*- Mode:C++; c-file-style:"gnu"; indent-tabs-mode:nil; -*- */
/*
 * Copyright (c) 2024-2026,  The spa-codec Authors.
 *
 * This file is part of spa-codec (Single Packet Authorization header codec).
 * See AUTHORS.md for complete list of spa-codec authors and contributors.
 *
 * spa-codec is free software: you can redistribute it and/or modify it under the terms
 * of the GNU General Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later version.
 *
 * spa-codec is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY;
 * without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
 * PURPOSE.  See the GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along with
 * spa-codec, e.g., in COPYING.md file.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "codec/internet-protocol.hpp"

#include <ostream>

namespace spa {
namespace codec {

bool
portCanBeZero(InternetProtocolNumber protocol) noexcept
{
  switch (protocol) {
    case InternetProtocolNumber::TCP:
    case InternetProtocolNumber::UDP:
    case InternetProtocolNumber::SCTP:
    case InternetProtocolNumber::UDP_LITE:
      return false;
    default:
      return true;
  }
}

std::ostream&
operator<<(std::ostream& os, InternetProtocolNumber protocol)
{
  switch (protocol) {
    case InternetProtocolNumber::ICMP:
      return os << "icmp";
    case InternetProtocolNumber::IPV4:
      return os << "ipv4";
    case InternetProtocolNumber::TCP:
      return os << "tcp";
    case InternetProtocolNumber::UDP:
      return os << "udp";
    case InternetProtocolNumber::IPV6:
      return os << "ipv6";
    case InternetProtocolNumber::ICMPV6:
      return os << "icmpv6";
    case InternetProtocolNumber::SCTP:
      return os << "sctp";
    case InternetProtocolNumber::UDP_LITE:
      return os << "udplite";
  }
  return os << "protocol(" << static_cast<unsigned>(protocol) << ")";
}

} // namespace codec
} // namespace spa
