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

#include "codec/ip-address.hpp"
#include "core/logger.hpp"

#include <algorithm>

namespace spa {
namespace codec {

SPA_LOG_INIT(codec.IpAddress);

// RFC 4291 2.5.5.2: 80 zero bits, then 16 one bits, then the IPv4 address
const size_t V4_MAPPED_ZERO_LENGTH = 10;
const size_t V4_MAPPED_PREFIX_LENGTH = V4_MAPPED_ZERO_LENGTH + 2;

static_assert(V4_MAPPED_PREFIX_LENGTH + sizeof(ip::address_v4::bytes_type) == IP_ADDRESS_SIZE, "");
static_assert(sizeof(ip::address_v6::bytes_type) == IP_ADDRESS_SIZE, "");

static bool
isV4Mapped(span<const uint8_t> wire)
{
  BOOST_ASSERT(wire.size() == IP_ADDRESS_SIZE);

  return std::all_of(wire.begin(), wire.begin() + V4_MAPPED_ZERO_LENGTH,
                     [] (uint8_t b) { return b == 0x00; }) &&
         wire[V4_MAPPED_ZERO_LENGTH] == 0xFF &&
         wire[V4_MAPPED_ZERO_LENGTH + 1] == 0xFF;
}

IpAddressBytes
encodeIpAddress(const ip::address& address)
{
  IpAddressBytes wire{};

  if (address.is_v6()) {
    ip::address_v6::bytes_type bytes = address.to_v6().to_bytes();
    std::copy(bytes.begin(), bytes.end(), wire.begin());
    return wire;
  }

  wire[V4_MAPPED_ZERO_LENGTH] = 0xFF;
  wire[V4_MAPPED_ZERO_LENGTH + 1] = 0xFF;
  ip::address_v4::bytes_type bytes = address.to_v4().to_bytes();
  std::copy(bytes.begin(), bytes.end(), wire.begin() + V4_MAPPED_PREFIX_LENGTH);
  return wire;
}

IpAddressBytes
encodeIpAddress(const std::string& text, boost::system::error_code& ec)
{
  ec.clear();

  boost::system::error_code parseError;
  ip::address address = ip::make_address(text, parseError);
  if (parseError) {
    SPA_LOG_TRACE("cannot parse ip address '" << text << "': " << parseError.message());
    ec = ErrorCode::IP_ADDRESS_UNPARSABLE;
    return {};
  }

  return encodeIpAddress(address);
}

ip::address
decodeIpAddress(span<const uint8_t> wire, boost::system::error_code& ec)
{
  ec.clear();

  if (wire.size() != IP_ADDRESS_SIZE) {
    SPA_LOG_TRACE("rejecting ip address field of " << wire.size() << " octets");
    ec = ErrorCode::IP_ADDRESS_INVALID;
    return {};
  }

  if (isV4Mapped(wire)) {
    ip::address_v4::bytes_type bytes;
    std::copy(wire.begin() + V4_MAPPED_PREFIX_LENGTH, wire.end(), bytes.begin());
    return ip::address_v4(bytes);
  }

  ip::address_v6::bytes_type bytes;
  std::copy(wire.begin(), wire.end(), bytes.begin());
  return ip::address_v6(bytes);
}

void
checkClientIp(const ip::address& address, boost::system::error_code& ec)
{
  ec.clear();

  if (address.is_unspecified()) {
    ec = ErrorCode::CLIENT_IP_EMPTY;
  }
}

void
checkServerIp(const ip::address& address, boost::system::error_code& ec)
{
  ec.clear();

  if (address.is_unspecified()) {
    ec = ErrorCode::SERVER_IP_EMPTY;
  }
}

} // namespace codec
} // namespace spa
