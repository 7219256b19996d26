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

#ifndef SPA_CODEC_PORT_HPP
#define SPA_CODEC_PORT_HPP

#include "codec/constants.hpp"
#include "codec/error.hpp"
#include "codec/internet-protocol.hpp"

namespace spa {
namespace codec {

/// Wire form of a port: unsigned 16-bit big-endian
using PortBytes = std::array<uint8_t, PORT_SIZE>;

PortBytes
encodePort(uint16_t port);

/**
 * \brief Decodes a start or end port field.
 * \param protocol the protocol the port belongs to, decides whether 0 is acceptable
 * \retval PORT_INVALID \p wire is not PORT_SIZE octets long
 * \retval PORT_ZERO_DISALLOWED the port is 0 and portCanBeZero(\p protocol) is false
 */
uint16_t
decodePort(span<const uint8_t> wire, InternetProtocolNumber protocol,
           boost::system::error_code& ec);

/**
 * \brief Validates the port range [\p startPort, \p endPort] requested for \p protocol.
 * \retval UNSUPPORTED_START_PORT \p startPort is 0 where \p protocol requires a port
 * \retval UNSUPPORTED_END_PORT \p endPort is 0 where \p protocol requires a port
 * \retval START_END_PORT_MISMATCH \p startPort is greater than \p endPort
 */
void
checkPortRange(uint16_t startPort, uint16_t endPort, InternetProtocolNumber protocol,
               boost::system::error_code& ec);

} // namespace codec
} // namespace spa

#endif // SPA_CODEC_PORT_HPP
