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

#ifndef SPA_CODEC_DEVICE_ID_HPP
#define SPA_CODEC_DEVICE_ID_HPP

#include "codec/constants.hpp"
#include "codec/error.hpp"

namespace spa {
namespace codec {

/// Wire form of a device identifier: the raw 128-bit value, no separators
using DeviceIdBytes = std::array<uint8_t, DEVICE_ID_SIZE>;

/**
 * \brief Encodes a device identifier string into its 16-byte wire form.
 *
 * The identifier is normally a UUID v4 in 8-4-4-4-12 notation
 * ("550e8400-e29b-41d4-a716-446655440000"), but the 32 hex digits may also be given
 * without dashes. Hex digits are accepted in either case.
 *
 * \retval DEVICE_ID_INVALID \p id is neither 32 nor 36 characters long, or a 36-character
 *                           \p id does not have its dashes exactly at positions 8, 13, 18, 23
 * \retval DEVICE_ID_NOT_HEX \p id contains a character that is not a hex digit
 */
DeviceIdBytes
encodeDeviceId(const std::string& id, boost::system::error_code& ec);

/**
 * \brief Decodes a device identifier into lower-case 8-4-4-4-12 notation.
 *
 * Version and variant bits are not checked; any 128-bit value is accepted.
 */
std::string
decodeDeviceId(const DeviceIdBytes& wire);

/**
 * \brief Decodes a device identifier field of a received packet.
 * \retval DEVICE_ID_INVALID \p wire is not DEVICE_ID_SIZE octets long
 */
std::string
decodeDeviceId(span<const uint8_t> wire, boost::system::error_code& ec);

} // namespace codec
} // namespace spa

#endif // SPA_CODEC_DEVICE_ID_HPP
