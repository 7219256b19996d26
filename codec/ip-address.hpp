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

#ifndef SPA_CODEC_IP_ADDRESS_HPP
#define SPA_CODEC_IP_ADDRESS_HPP

#include "codec/constants.hpp"
#include "codec/error.hpp"

namespace spa {
namespace codec {

/// Wire form of an IP address: 16 octets, see encodeIpAddress()
using IpAddressBytes = std::array<uint8_t, IP_ADDRESS_SIZE>;

/**
 * \brief Encodes \p address into 16 octets.
 *
 * An IPv6 address is copied unchanged. An IPv4 address a.b.c.d is encoded as the
 * "IPv4-Mapped IPv6 Address" ::ffff:a.b.c.d of RFC 4291 section 2.5.5.2: 80 zero bits,
 * 16 one bits, then the 32 bits of the IPv4 address.
 */
IpAddressBytes
encodeIpAddress(const ip::address& address);

/**
 * \brief Encodes an IPv4 or IPv6 address given in textual form.
 * \retval IP_ADDRESS_UNPARSABLE \p text is not an IPv4 nor an IPv6 address
 */
IpAddressBytes
encodeIpAddress(const std::string& text, boost::system::error_code& ec);

/**
 * \brief Decodes a 16-octet IP address field.
 *
 * A value of the form ::ffff:a.b.c.d is decoded as the IPv4 address a.b.c.d, anything else
 * as an IPv6 address. An IPv6 peer that really uses an IPv4-mapped address is therefore
 * seen as IPv4; the two cannot be told apart on the wire.
 *
 * \retval IP_ADDRESS_INVALID \p wire is not IP_ADDRESS_SIZE octets long
 */
ip::address
decodeIpAddress(span<const uint8_t> wire, boost::system::error_code& ec);

/**
 * \brief Checks that the client's public address is set.
 * \retval CLIENT_IP_EMPTY \p address is unspecified (0.0.0.0 or ::)
 */
void
checkClientIp(const ip::address& address, boost::system::error_code& ec);

/**
 * \brief Checks that the server's public address is set.
 * \retval SERVER_IP_EMPTY \p address is unspecified (0.0.0.0 or ::)
 */
void
checkServerIp(const ip::address& address, boost::system::error_code& ec);

} // namespace codec
} // namespace spa

#endif // SPA_CODEC_IP_ADDRESS_HPP
