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

#include "codec/port.hpp"
#include "core/logger.hpp"

#include <boost/endian/conversion.hpp>

namespace spa {
namespace codec {

SPA_LOG_INIT(codec.Port);

PortBytes
encodePort(uint16_t port)
{
  PortBytes wire;
  boost::endian::store_big_u16(wire.data(), port);
  return wire;
}

uint16_t
decodePort(span<const uint8_t> wire, InternetProtocolNumber protocol,
           boost::system::error_code& ec)
{
  ec.clear();

  if (wire.size() != PORT_SIZE) {
    SPA_LOG_TRACE("rejecting port field of " << wire.size() << " octets");
    ec = ErrorCode::PORT_INVALID;
    return 0;
  }

  uint16_t port = boost::endian::load_big_u16(wire.data());
  if (port == 0 && !portCanBeZero(protocol)) {
    SPA_LOG_TRACE("rejecting port 0 for " << protocol);
    ec = ErrorCode::PORT_ZERO_DISALLOWED;
    return 0;
  }

  return port;
}

void
checkPortRange(uint16_t startPort, uint16_t endPort, InternetProtocolNumber protocol,
               boost::system::error_code& ec)
{
  ec.clear();

  if (!portCanBeZero(protocol)) {
    if (startPort == 0) {
      ec = ErrorCode::UNSUPPORTED_START_PORT;
    }
    else if (endPort == 0) {
      ec = ErrorCode::UNSUPPORTED_END_PORT;
    }
  }
  if (!ec && startPort > endPort) {
    ec = ErrorCode::START_END_PORT_MISMATCH;
  }

  if (ec) {
    SPA_LOG_TRACE("rejecting " << protocol << " port range " << startPort << "-" << endPort
                  << ": " << ec.message());
  }
}

} // namespace codec
} // namespace spa
