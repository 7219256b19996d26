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

#ifndef SPA_CODEC_DURATION_HPP
#define SPA_CODEC_DURATION_HPP

#include "codec/constants.hpp"
#include "codec/error.hpp"

#include <iosfwd>

namespace spa {
namespace codec {

/// Wire form of a duration: unsigned 16-bit big-endian seconds
using DurationBytes = std::array<uint8_t, DURATION_SIZE>;

/**
 * \brief What encodeDuration does with a duration longer than MAX_DURATION.
 */
enum class DurationOverflow {
  REJECT,   ///< report DURATION_OUT_OF_RANGE
  SATURATE, ///< encode MAX_DURATION
};

std::ostream&
operator<<(std::ostream& os, DurationOverflow policy);

/**
 * \brief Encodes the whole seconds of \p duration.
 *
 * Sub-second precision is truncated before the range is checked, so
 * MAX_DURATION + 999ms still fits.
 *
 * \retval DURATION_OUT_OF_RANGE \p duration is negative, or longer than MAX_DURATION
 *                               while \p overflow is DurationOverflow::REJECT
 */
DurationBytes
encodeDuration(time::nanoseconds duration, boost::system::error_code& ec,
               DurationOverflow overflow = DurationOverflow::REJECT);

/**
 * \retval DURATION_INVALID \p wire is not DURATION_SIZE octets long
 */
time::seconds
decodeDuration(span<const uint8_t> wire, boost::system::error_code& ec);

} // namespace codec
} // namespace spa

#endif // SPA_CODEC_DURATION_HPP
