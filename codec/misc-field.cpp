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

#include "codec/misc-field.hpp"
#include "core/logger.hpp"

#include <ostream>

namespace spa {
namespace codec {

SPA_LOG_INIT(codec.MiscField);

const uint8_t BEHIND_NAT_MASK = 0x80;
const uint8_t SIGNATURE_OFFSET_HIGH_MASK = 0x03;

bool
operator==(const MiscField& lhs, const MiscField& rhs) noexcept
{
  return lhs.behindNat == rhs.behindNat && lhs.signatureOffset == rhs.signatureOffset;
}

std::ostream&
operator<<(std::ostream& os, const MiscField& field)
{
  return os << "MiscField(behindNat=" << (field.behindNat ? "yes" : "no")
            << ", signatureOffset=" << field.signatureOffset << ")";
}

MiscFieldBytes
encodeMiscField(bool behindNat, unsigned int signatureOffset, boost::system::error_code& ec)
{
  ec.clear();

  if (signatureOffset > MAX_SIGNATURE_OFFSET) {
    SPA_LOG_TRACE("rejecting signature offset " << signatureOffset);
    ec = ErrorCode::SIGNATURE_OFFSET_TOO_LARGE;
    return {};
  }

  MiscFieldBytes wire{};
  if (behindNat) {
    wire[0] |= BEHIND_NAT_MASK;
  }
  wire[2] = static_cast<uint8_t>(signatureOffset >> 8) & SIGNATURE_OFFSET_HIGH_MASK;
  wire[3] = static_cast<uint8_t>(signatureOffset & 0xFF);
  return wire;
}

bool
decodeBehindNat(uint8_t firstOctet) noexcept
{
  return (firstOctet & BEHIND_NAT_MASK) != 0;
}

MiscField
decodeMiscField(span<const uint8_t> wire, boost::system::error_code& ec)
{
  ec.clear();

  if (wire.size() != MISC_FIELD_SIZE) {
    SPA_LOG_TRACE("rejecting misc field of " << wire.size() << " octets");
    ec = ErrorCode::MISC_FIELD_INVALID;
    return {};
  }

  MiscField field;
  field.behindNat = decodeBehindNat(wire[0]);
  field.signatureOffset = static_cast<uint16_t>(((wire[2] & SIGNATURE_OFFSET_HIGH_MASK) << 8) |
                                                wire[3]);
  return field;
}

} // namespace codec
} // namespace spa
