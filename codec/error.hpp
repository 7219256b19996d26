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

#ifndef SPA_CODEC_ERROR_HPP
#define SPA_CODEC_ERROR_HPP

#include "core/common.hpp"

#include <iosfwd>
#include <type_traits>

namespace spa {
namespace codec {

/**
 * \brief Conditions reported by the header field codecs.
 *
 * Codec operations never throw. An operation that can fail takes a
 * `boost::system::error_code&` as its last argument, clears it on success and sets it to
 * one of these values on failure, in which case the returned value is value-initialized.
 */
enum class ErrorCode {
  // format errors: input does not meet the fixed length or shape of the field
  DEVICE_ID_INVALID = 1,
  DEVICE_ID_NOT_HEX,
  TIMESTAMP_INVALID,
  PORT_INVALID,
  DURATION_INVALID,
  MISC_FIELD_INVALID,
  IP_ADDRESS_INVALID,
  IP_ADDRESS_UNPARSABLE,
  CIPHER_SUITE_INVALID,

  // value errors: well-formed input that violates a protocol rule
  PORT_ZERO_DISALLOWED,
  UNSUPPORTED_START_PORT,
  UNSUPPORTED_END_PORT,
  START_END_PORT_MISMATCH,
  DURATION_OUT_OF_RANGE,
  SIGNATURE_OFFSET_TOO_LARGE,
  CLIENT_IP_EMPTY,
  SERVER_IP_EMPTY,

  // capability errors
  CIPHER_SUITE_NOT_SUPPORTED,
};

/**
 * \brief Broad class of an ErrorCode.
 */
enum class ErrorClass {
  FORMAT,     ///< wrong length or shape, the input cannot be a value of the field
  VALUE,      ///< the value is representable but violates a protocol rule
  CAPABILITY, ///< the value names something this implementation does not support
};

ErrorClass
getErrorClass(ErrorCode code) noexcept;

std::ostream&
operator<<(std::ostream& os, ErrorCode code);

std::ostream&
operator<<(std::ostream& os, ErrorClass errorClass);

/**
 * \brief The Boost.System error category of ErrorCode, named "spa-codec".
 */
const boost::system::error_category&
getErrorCategory() noexcept;

boost::system::error_code
make_error_code(ErrorCode code) noexcept;

} // namespace codec
} // namespace spa

namespace boost {
namespace system {

template<>
struct is_error_code_enum<spa::codec::ErrorCode> : std::true_type
{
};

} // namespace system
} // namespace boost

#endif // SPA_CODEC_ERROR_HPP
