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

#ifndef SPA_CODEC_TIMESTAMP_HPP
#define SPA_CODEC_TIMESTAMP_HPP

#include "codec/constants.hpp"
#include "codec/error.hpp"

namespace spa {
namespace codec {

/**
 * \brief A point in time with whole-second precision.
 *
 * The representation is a signed 64-bit count of seconds since the Unix epoch, so every
 * value of a timestamp field is representable.
 */
using Timestamp = boost::chrono::time_point<time::system_clock, time::seconds>;

/// Wire form of a timestamp: signed 64-bit big-endian Unix seconds
using TimestampBytes = std::array<uint8_t, TIMESTAMP_SIZE>;

/**
 * \brief Truncates \p tp to the whole second at or before it.
 */
Timestamp
toTimestamp(const time::system_clock::time_point& tp);

TimestampBytes
encodeTimestamp(const Timestamp& timestamp);

/**
 * \brief Encodes \p tp, dropping its sub-second part.
 */
TimestampBytes
encodeTimestamp(const time::system_clock::time_point& tp);

/**
 * \retval TIMESTAMP_INVALID \p wire is not TIMESTAMP_SIZE octets long
 */
Timestamp
decodeTimestamp(span<const uint8_t> wire, boost::system::error_code& ec);

} // namespace codec
} // namespace spa

#endif // SPA_CODEC_TIMESTAMP_HPP
