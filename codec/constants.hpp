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

#ifndef SPA_CODEC_CONSTANTS_HPP
#define SPA_CODEC_CONSTANTS_HPP

#include "core/common.hpp"

namespace spa {
namespace codec {

/// Version of the SPA protocol whose header fields this library encodes
constexpr uint8_t VERSION = 2;

const size_t PDU_MAX_SIZE  = 1408; ///< Max octets in a PDU (UDP payload, i.e. header + body)
const size_t HEADER_SIZE   = 8;    ///< Octets in the fixed PDU header
const size_t BODY_MAX_SIZE = PDU_MAX_SIZE - HEADER_SIZE; ///< Max octets in a signed PDU body

const size_t DEVICE_ID_SIZE    = 16; ///< Octets in a device identifier field
const size_t TIMESTAMP_SIZE    = 8;  ///< Octets in a timestamp field
const size_t IP_ADDRESS_SIZE   = 16; ///< Octets in a client or server IP address field
const size_t PORT_SIZE         = 2;  ///< Octets in a start or end port field
const size_t DURATION_SIZE     = 2;  ///< Octets in a duration field
const size_t MISC_FIELD_SIZE   = 4;  ///< Octets in the misc field
const size_t CIPHER_SUITE_SIZE = 1;  ///< Octets in a cipher suite field

/// Bits of the misc field carrying the signature offset
const size_t SIGNATURE_OFFSET_BIT_SIZE = 10;

/// Largest signature offset that fits into the misc field
constexpr uint16_t MAX_SIGNATURE_OFFSET = (1 << SIGNATURE_OFFSET_BIT_SIZE) - 1;

/// Longest duration that fits into a duration field
constexpr time::seconds MAX_DURATION{std::numeric_limits<uint16_t>::max()};

static_assert(BODY_MAX_SIZE == 1400, "");
static_assert(MAX_SIGNATURE_OFFSET == 1023, "");

} // namespace codec
} // namespace spa

#endif // SPA_CODEC_CONSTANTS_HPP
