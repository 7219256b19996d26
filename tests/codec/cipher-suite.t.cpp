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

#include "codec/cipher-suite.hpp"

#include "tests/test-common.hpp"

#include <boost/lexical_cast.hpp>

namespace spa {
namespace codec {
namespace tests {

using namespace spa::tests;

BOOST_AUTO_TEST_SUITE(Codec)
BOOST_AUTO_TEST_SUITE(TestCipherSuite)

BOOST_AUTO_TEST_CASE(KnownIds)
{
  BOOST_CHECK_EQUAL(encodeCipherSuite(CipherSuiteId::RSA_SHA256_AES256CBC), 1);
  BOOST_CHECK_EQUAL(isKnownCipherSuite(1), true);
  BOOST_CHECK_EQUAL(isKnownCipherSuite(0), false);
  BOOST_CHECK_EQUAL(isKnownCipherSuite(2), false);
  BOOST_CHECK_EQUAL(isKnownCipherSuite(255), false);

  BOOST_CHECK_EQUAL(boost::lexical_cast<std::string>(CipherSuiteId::RSA_SHA256_AES256CBC),
                    "RSA_SHA256_AES256CBC");
  BOOST_CHECK_EQUAL(boost::lexical_cast<std::string>(static_cast<CipherSuiteId>(7)), "7");
}

BOOST_AUTO_TEST_CASE(Decode)
{
  boost::system::error_code ec;

  static const uint8_t WIRE[] = {0x01};
  BOOST_CHECK_EQUAL(decodeCipherSuite(WIRE, ec), CipherSuiteId::RSA_SHA256_AES256CBC);
  BOOST_CHECK(!ec);
}

BOOST_AUTO_TEST_CASE(DecodeNotSupported)
{
  boost::system::error_code ec;

  static const uint8_t ZERO[] = {0x00};
  decodeCipherSuite(ZERO, ec);
  BOOST_CHECK_EQUAL(ec, make_error_code(ErrorCode::CIPHER_SUITE_NOT_SUPPORTED));

  static const uint8_t UNKNOWN[] = {0x2A};
  decodeCipherSuite(UNKNOWN, ec);
  BOOST_CHECK_EQUAL(ec, make_error_code(ErrorCode::CIPHER_SUITE_NOT_SUPPORTED));
}

BOOST_AUTO_TEST_CASE(DecodeBadLength)
{
  boost::system::error_code ec;

  decodeCipherSuite(span<const uint8_t>{}, ec);
  BOOST_CHECK_EQUAL(ec, make_error_code(ErrorCode::CIPHER_SUITE_INVALID));

  static const uint8_t LONG[] = {0x01, 0x00};
  decodeCipherSuite(LONG, ec);
  BOOST_CHECK_EQUAL(ec, make_error_code(ErrorCode::CIPHER_SUITE_INVALID));
}

BOOST_AUTO_TEST_CASE(NotSupportedError)
{
  auto id = static_cast<CipherSuiteId>(42);
  BOOST_CHECK_EXCEPTION(NDN_THROW(CipherSuiteNotSupported(id)), CipherSuiteNotSupported,
    [id] (const auto& e) {
      return e.getCipherSuite() == id &&
             e.code() == ErrorCode::CIPHER_SUITE_NOT_SUPPORTED &&
             std::string(e.what()) == "cipher suite 42 not supported";
    });
}

BOOST_AUTO_TEST_SUITE_END() // TestCipherSuite
BOOST_AUTO_TEST_SUITE_END() // Codec

} // namespace tests
} // namespace codec
} // namespace spa
