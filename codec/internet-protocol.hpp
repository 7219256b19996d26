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

#ifndef SPA_CODEC_INTERNET_PROTOCOL_HPP
#define SPA_CODEC_INTERNET_PROTOCOL_HPP

#include "core/common.hpp"

#include <iosfwd>

namespace spa {
namespace codec {

/**
 * \brief Assigned Internet protocol number (IANA "Protocol Numbers" registry).
 *
 * Any 8-bit value is a valid InternetProtocolNumber; only the numbers the protocol cares
 * about are named.
 */
enum class InternetProtocolNumber : uint8_t {
  ICMP     = 1,
  IPV4     = 4,   ///< IPv4 encapsulation
  TCP      = 6,
  UDP      = 17,
  IPV6     = 41,  ///< IPv6 encapsulation
  ICMPV6   = 58,
  SCTP     = 132,
  UDP_LITE = 136,
};

/**
 * \brief Returns whether a port field of 0 is acceptable for \p protocol.
 *
 * Only protocols with a port concept (TCP, UDP, SCTP, UDP-Lite) require non-zero ports.
 * Any other protocol, ICMP for instance, carries 0 in both port fields.
 */
bool
portCanBeZero(InternetProtocolNumber protocol) noexcept;

std::ostream&
operator<<(std::ostream& os, InternetProtocolNumber protocol);

} // namespace codec
} // namespace spa

#endif // SPA_CODEC_INTERNET_PROTOCOL_HPP
