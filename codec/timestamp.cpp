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

#include "codec/timestamp.hpp"
#include "core/logger.hpp"

#include <boost/chrono/floor.hpp>
#include <boost/endian/conversion.hpp>

namespace spa {
namespace codec {

SPA_LOG_INIT(codec.Timestamp);

Timestamp
toTimestamp(const time::system_clock::time_point& tp)
{
  return Timestamp(boost::chrono::floor<time::seconds>(tp.time_since_epoch()));
}

TimestampBytes
encodeTimestamp(const Timestamp& timestamp)
{
  TimestampBytes wire;
  boost::endian::store_big_s64(wire.data(), timestamp.time_since_epoch().count());
  return wire;
}

TimestampBytes
encodeTimestamp(const time::system_clock::time_point& tp)
{
  return encodeTimestamp(toTimestamp(tp));
}

Timestamp
decodeTimestamp(span<const uint8_t> wire, boost::system::error_code& ec)
{
  ec.clear();

  if (wire.size() != TIMESTAMP_SIZE) {
    SPA_LOG_TRACE("rejecting timestamp field of " << wire.size() << " octets");
    ec = ErrorCode::TIMESTAMP_INVALID;
    return {};
  }

  return Timestamp(time::seconds(boost::endian::load_big_s64(wire.data())));
}

} // namespace codec
} // namespace spa
