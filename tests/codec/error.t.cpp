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

#include "tests/test-common.hpp"

#include <boost/lexical_cast.hpp>

#include <map>
#include <set>

namespace spa {
namespace codec {
namespace tests {

BOOST_AUTO_TEST_SUITE(Codec)
BOOST_AUTO_TEST_SUITE(TestError)

BOOST_AUTO_TEST_CASE(Category)
{
  boost::system::error_code ec = ErrorCode::PORT_ZERO_DISALLOWED;
  BOOST_CHECK(ec);
  BOOST_CHECK_EQUAL(ec.category().name(), std::string("spa-codec"));
  BOOST_CHECK(ec.category() == getErrorCategory());
  BOOST_CHECK_EQUAL(ec.value(), static_cast<int>(ErrorCode::PORT_ZERO_DISALLOWED));
  BOOST_CHECK_EQUAL(ec.message(), "port 0 is disallowed");

  BOOST_CHECK(ec == ErrorCode::PORT_ZERO_DISALLOWED);
  BOOST_CHECK(ec != ErrorCode::PORT_INVALID);

  // codes from other categories never compare equal
  boost::system::error_code other(ec.value(), boost::system::generic_category());
  BOOST_CHECK(other != ec);
}

BOOST_AUTO_TEST_CASE(Messages)
{
  BOOST_CHECK_EQUAL(make_error_code(ErrorCode::DEVICE_ID_INVALID).message(), "device id is invalid");
  BOOST_CHECK_EQUAL(make_error_code(ErrorCode::DEVICE_ID_NOT_HEX).message(),
                    "device id is not hexadecimal");
  BOOST_CHECK_EQUAL(make_error_code(ErrorCode::START_END_PORT_MISMATCH).message(),
                    "start port end port mismatch");
  BOOST_CHECK_EQUAL(make_error_code(ErrorCode::DURATION_OUT_OF_RANGE).message(),
                    "duration out of range");
  BOOST_CHECK_EQUAL(make_error_code(ErrorCode::SIGNATURE_OFFSET_TOO_LARGE).message(),
                    "signature offset too large");
  BOOST_CHECK_EQUAL(make_error_code(ErrorCode::CLIENT_IP_EMPTY).message(),
                    "client public ip is empty");
  BOOST_CHECK_EQUAL(make_error_code(ErrorCode::IP_ADDRESS_INVALID).message(),
                    "ip address is not 16 bytes long");
  BOOST_CHECK_EQUAL(make_error_code(ErrorCode::IP_ADDRESS_UNPARSABLE).message(),
                    "failed to detect the ip address family");
  BOOST_CHECK_EQUAL(make_error_code(ErrorCode::CIPHER_SUITE_NOT_SUPPORTED).message(),
                    "cipher suite not supported");

  BOOST_CHECK_EQUAL(boost::lexical_cast<std::string>(ErrorCode::SERVER_IP_EMPTY),
                    "server public ip is empty");

  // every code has its own message
  std::set<std::string> messages;
  for (int i = static_cast<int>(ErrorCode::DEVICE_ID_INVALID);
       i <= static_cast<int>(ErrorCode::CIPHER_SUITE_NOT_SUPPORTED); ++i) {
    auto message = make_error_code(static_cast<ErrorCode>(i)).message();
    BOOST_CHECK_NE(message, "unknown error");
    BOOST_CHECK(messages.insert(message).second);
  }
}

BOOST_AUTO_TEST_CASE(Classes)
{
  BOOST_CHECK_EQUAL(getErrorClass(ErrorCode::DEVICE_ID_INVALID), ErrorClass::FORMAT);
  BOOST_CHECK_EQUAL(getErrorClass(ErrorCode::DEVICE_ID_NOT_HEX), ErrorClass::FORMAT);
  BOOST_CHECK_EQUAL(getErrorClass(ErrorCode::TIMESTAMP_INVALID), ErrorClass::FORMAT);
  BOOST_CHECK_EQUAL(getErrorClass(ErrorCode::IP_ADDRESS_UNPARSABLE), ErrorClass::FORMAT);
  BOOST_CHECK_EQUAL(getErrorClass(ErrorCode::CIPHER_SUITE_INVALID), ErrorClass::FORMAT);

  BOOST_CHECK_EQUAL(getErrorClass(ErrorCode::PORT_ZERO_DISALLOWED), ErrorClass::VALUE);
  BOOST_CHECK_EQUAL(getErrorClass(ErrorCode::START_END_PORT_MISMATCH), ErrorClass::VALUE);
  BOOST_CHECK_EQUAL(getErrorClass(ErrorCode::SIGNATURE_OFFSET_TOO_LARGE), ErrorClass::VALUE);
  BOOST_CHECK_EQUAL(getErrorClass(ErrorCode::SERVER_IP_EMPTY), ErrorClass::VALUE);

  BOOST_CHECK_EQUAL(getErrorClass(ErrorCode::CIPHER_SUITE_NOT_SUPPORTED), ErrorClass::CAPABILITY);

  BOOST_CHECK_EQUAL(boost::lexical_cast<std::string>(ErrorClass::FORMAT), "format");
  BOOST_CHECK_EQUAL(boost::lexical_cast<std::string>(ErrorClass::VALUE), "value");
  BOOST_CHECK_EQUAL(boost::lexical_cast<std::string>(ErrorClass::CAPABILITY), "capability");
}

BOOST_AUTO_TEST_CASE(ClassOfEveryCode)
{
  std::map<ErrorClass, int> counts;
  for (int i = static_cast<int>(ErrorCode::DEVICE_ID_INVALID);
       i <= static_cast<int>(ErrorCode::CIPHER_SUITE_NOT_SUPPORTED); ++i) {
    ++counts[getErrorClass(static_cast<ErrorCode>(i))];
  }
  BOOST_CHECK_EQUAL(counts[ErrorClass::FORMAT], 9);
  BOOST_CHECK_EQUAL(counts[ErrorClass::VALUE], 8);
  BOOST_CHECK_EQUAL(counts[ErrorClass::CAPABILITY], 1);

  BOOST_CHECK_EQUAL(getErrorClass(ErrorCode::PORT_INVALID), ErrorClass::FORMAT);
  BOOST_CHECK_EQUAL(getErrorClass(ErrorCode::DURATION_INVALID), ErrorClass::FORMAT);
  BOOST_CHECK_EQUAL(getErrorClass(ErrorCode::MISC_FIELD_INVALID), ErrorClass::FORMAT);
  BOOST_CHECK_EQUAL(getErrorClass(ErrorCode::IP_ADDRESS_INVALID), ErrorClass::FORMAT);
}

BOOST_AUTO_TEST_SUITE_END() // TestError
BOOST_AUTO_TEST_SUITE_END() // Codec

} // namespace tests
} // namespace codec
} // namespace spa
