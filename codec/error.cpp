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

#include "codec/error.hpp"

#include <ostream>

namespace spa {
namespace codec {

static const char*
getMessage(ErrorCode code)
{
  switch (code) {
    case ErrorCode::DEVICE_ID_INVALID:
      return "device id is invalid";
    case ErrorCode::DEVICE_ID_NOT_HEX:
      return "device id is not hexadecimal";
    case ErrorCode::TIMESTAMP_INVALID:
      return "timestamp is invalid";
    case ErrorCode::PORT_INVALID:
      return "port is invalid";
    case ErrorCode::DURATION_INVALID:
      return "duration is invalid";
    case ErrorCode::MISC_FIELD_INVALID:
      return "misc field is invalid";
    case ErrorCode::IP_ADDRESS_INVALID:
      return "ip address is not 16 bytes long";
    case ErrorCode::IP_ADDRESS_UNPARSABLE:
      return "failed to detect the ip address family";
    case ErrorCode::CIPHER_SUITE_INVALID:
      return "cipher suite is invalid";
    case ErrorCode::PORT_ZERO_DISALLOWED:
      return "port 0 is disallowed";
    case ErrorCode::UNSUPPORTED_START_PORT:
      return "unsupported start port";
    case ErrorCode::UNSUPPORTED_END_PORT:
      return "unsupported end port";
    case ErrorCode::START_END_PORT_MISMATCH:
      return "start port end port mismatch";
    case ErrorCode::DURATION_OUT_OF_RANGE:
      return "duration out of range";
    case ErrorCode::SIGNATURE_OFFSET_TOO_LARGE:
      return "signature offset too large";
    case ErrorCode::CLIENT_IP_EMPTY:
      return "client public ip is empty";
    case ErrorCode::SERVER_IP_EMPTY:
      return "server public ip is empty";
    case ErrorCode::CIPHER_SUITE_NOT_SUPPORTED:
      return "cipher suite not supported";
  }
  return "unknown error";
}

namespace {

class ErrorCategory : public boost::system::error_category
{
public:
  const char*
  name() const noexcept final
  {
    return "spa-codec";
  }

  std::string
  message(int ev) const final
  {
    return getMessage(static_cast<ErrorCode>(ev));
  }
};

} // namespace

ErrorClass
getErrorClass(ErrorCode code) noexcept
{
  switch (code) {
    case ErrorCode::DEVICE_ID_INVALID:
    case ErrorCode::DEVICE_ID_NOT_HEX:
    case ErrorCode::TIMESTAMP_INVALID:
    case ErrorCode::PORT_INVALID:
    case ErrorCode::DURATION_INVALID:
    case ErrorCode::MISC_FIELD_INVALID:
    case ErrorCode::IP_ADDRESS_INVALID:
    case ErrorCode::IP_ADDRESS_UNPARSABLE:
    case ErrorCode::CIPHER_SUITE_INVALID:
      return ErrorClass::FORMAT;
    case ErrorCode::PORT_ZERO_DISALLOWED:
    case ErrorCode::UNSUPPORTED_START_PORT:
    case ErrorCode::UNSUPPORTED_END_PORT:
    case ErrorCode::START_END_PORT_MISMATCH:
    case ErrorCode::DURATION_OUT_OF_RANGE:
    case ErrorCode::SIGNATURE_OFFSET_TOO_LARGE:
    case ErrorCode::CLIENT_IP_EMPTY:
    case ErrorCode::SERVER_IP_EMPTY:
      return ErrorClass::VALUE;
    case ErrorCode::CIPHER_SUITE_NOT_SUPPORTED:
      return ErrorClass::CAPABILITY;
  }
  // not a valid ErrorCode
  return ErrorClass::FORMAT;
}

std::ostream&
operator<<(std::ostream& os, ErrorCode code)
{
  return os << getMessage(code);
}

std::ostream&
operator<<(std::ostream& os, ErrorClass errorClass)
{
  switch (errorClass) {
    case ErrorClass::FORMAT:
      return os << "format";
    case ErrorClass::VALUE:
      return os << "value";
    case ErrorClass::CAPABILITY:
      return os << "capability";
  }
  return os << "none";
}

const boost::system::error_category&
getErrorCategory() noexcept
{
  static ErrorCategory instance;
  return instance;
}

boost::system::error_code
make_error_code(ErrorCode code) noexcept
{
  return {static_cast<int>(code), getErrorCategory()};
}

} // namespace codec
} // namespace spa
