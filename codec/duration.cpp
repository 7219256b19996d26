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

#include "codec/duration.hpp"
#include "core/logger.hpp"

#include <boost/endian/conversion.hpp>

#include <ostream>

namespace spa {
namespace codec {

SPA_LOG_INIT(codec.Duration);

std::ostream&
operator<<(std::ostream& os, DurationOverflow policy)
{
  switch (policy) {
    case DurationOverflow::REJECT:
      return os << "reject";
    case DurationOverflow::SATURATE:
      return os << "saturate";
  }
  return os << "none";
}

DurationBytes
encodeDuration(time::nanoseconds duration, boost::system::error_code& ec,
               DurationOverflow overflow)
{
  ec.clear();

  if (duration < time::nanoseconds::zero()) {
    SPA_LOG_TRACE("rejecting negative duration " << duration);
    ec = ErrorCode::DURATION_OUT_OF_RANGE;
    return {};
  }

  auto seconds = time::duration_cast<time::seconds>(duration);
  if (seconds > MAX_DURATION) {
    if (overflow == DurationOverflow::REJECT) {
      SPA_LOG_TRACE("rejecting duration " << seconds << " longer than " << MAX_DURATION);
      ec = ErrorCode::DURATION_OUT_OF_RANGE;
      return {};
    }
    seconds = MAX_DURATION;
  }

  DurationBytes wire;
  boost::endian::store_big_u16(wire.data(), static_cast<uint16_t>(seconds.count()));
  return wire;
}

time::seconds
decodeDuration(span<const uint8_t> wire, boost::system::error_code& ec)
{
  ec.clear();

  if (wire.size() != DURATION_SIZE) {
    SPA_LOG_TRACE("rejecting duration field of " << wire.size() << " octets");
    ec = ErrorCode::DURATION_INVALID;
    return {};
  }

  return time::seconds(boost::endian::load_big_u16(wire.data()));
}

} // namespace codec
} // namespace spa
