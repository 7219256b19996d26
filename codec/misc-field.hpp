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

#ifndef SPA_CODEC_MISC_FIELD_HPP
#define SPA_CODEC_MISC_FIELD_HPP

#include "codec/constants.hpp"
#include "codec/error.hpp"

#include <iosfwd>

namespace spa {
namespace codec {

/// Wire form of the misc field
using MiscFieldBytes = std::array<uint8_t, MISC_FIELD_SIZE>;

/**
 * \brief Logical content of the misc field.
 *
 * \code
 *   Byte 1: NXXXXXXX
 *   Byte 2: XXXXXXXX
 *   Byte 3: XXXXXXSS
 *   Byte 4: SSSSSSSS
 * \endcode
 *
 * N is the behind-NAT flag, S the 10-bit signature offset (most significant bits in byte 3),
 * X reserved for future use: zero when encoding, ignored when decoding.
 */
struct MiscField
{
  /// whether the client is behind a NAT
  bool behindNat = false;

  /// offset of the signature within the PDU body, at most MAX_SIGNATURE_OFFSET
  uint16_t signatureOffset = 0;
};

bool
operator==(const MiscField& lhs, const MiscField& rhs) noexcept;

inline bool
operator!=(const MiscField& lhs, const MiscField& rhs) noexcept
{
  return !(lhs == rhs);
}

std::ostream&
operator<<(std::ostream& os, const MiscField& field);

/**
 * \retval SIGNATURE_OFFSET_TOO_LARGE \p signatureOffset exceeds MAX_SIGNATURE_OFFSET
 */
MiscFieldBytes
encodeMiscField(bool behindNat, unsigned int signatureOffset, boost::system::error_code& ec);

inline MiscFieldBytes
encodeMiscField(const MiscField& field, boost::system::error_code& ec)
{
  return encodeMiscField(field.behindNat, field.signatureOffset, ec);
}

/**
 * \brief Reads the behind-NAT flag from the first octet of the misc field.
 */
bool
decodeBehindNat(uint8_t firstOctet) noexcept;

/**
 * \brief Decodes the whole misc field. Reserved bits are ignored.
 * \retval MISC_FIELD_INVALID \p wire is not MISC_FIELD_SIZE octets long
 */
MiscField
decodeMiscField(span<const uint8_t> wire, boost::system::error_code& ec);

} // namespace codec
} // namespace spa

#endif // SPA_CODEC_MISC_FIELD_HPP
