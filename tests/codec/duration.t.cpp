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

#include "tests/test-common.hpp"

#include <boost/lexical_cast.hpp>

namespace spa {
namespace codec {
namespace tests {

using namespace spa::tests;

BOOST_AUTO_TEST_SUITE(Codec)
BOOST_AUTO_TEST_SUITE(TestDuration)

BOOST_AUTO_TEST_CASE(Encode)
{
  boost::system::error_code ec;

  auto wire = encodeDuration(30_s, ec);
  BOOST_CHECK(!ec);
  BOOST_CHECK_EQUAL(wire[0], 0x00);
  BOOST_CHECK_EQUAL(wire[1], 0x1E);

  wire = encodeDuration(1_h, ec);
  BOOST_CHECK(!ec);
  BOOST_CHECK_EQUAL(wire[0], 0x0E);
  BOOST_CHECK_EQUAL(wire[1], 0x10);

  wire = encodeDuration(0_s, ec);
  BOOST_CHECK(!ec);
  BOOST_CHECK_EQUAL(wire[0], 0x00);
  BOOST_CHECK_EQUAL(wire[1], 0x00);

  wire = encodeDuration(MAX_DURATION, ec);
  BOOST_CHECK(!ec);
  BOOST_CHECK_EQUAL(wire[0], 0xFF);
  BOOST_CHECK_EQUAL(wire[1], 0xFF);
}

BOOST_AUTO_TEST_CASE(EncodeTruncates)
{
  boost::system::error_code ec;

  auto wire = encodeDuration(1999_ms, ec);
  BOOST_CHECK(!ec);
  BOOST_CHECK_EQUAL(wire[0], 0x00);
  BOOST_CHECK_EQUAL(wire[1], 0x01);

  wire = encodeDuration(500_ms, ec);
  BOOST_CHECK(!ec);
  BOOST_CHECK_EQUAL(wire[1], 0x00);

  // a fraction above the largest representable value still fits
  wire = encodeDuration(MAX_DURATION + 999_ms, ec);
  BOOST_CHECK(!ec);
  BOOST_CHECK_EQUAL(wire[0], 0xFF);
  BOOST_CHECK_EQUAL(wire[1], 0xFF);
}

BOOST_AUTO_TEST_CASE(EncodeOutOfRange)
{
  boost::system::error_code ec;

  encodeDuration(MAX_DURATION + 1_s, ec);
  BOOST_CHECK_EQUAL(ec, make_error_code(ErrorCode::DURATION_OUT_OF_RANGE));

  encodeDuration(24_h, ec);
  BOOST_CHECK_EQUAL(ec, make_error_code(ErrorCode::DURATION_OUT_OF_RANGE));

  encodeDuration(-1_s, ec);
  BOOST_CHECK_EQUAL(ec, make_error_code(ErrorCode::DURATION_OUT_OF_RANGE));

  encodeDuration(-500_ms, ec);
  BOOST_CHECK_EQUAL(ec, make_error_code(ErrorCode::DURATION_OUT_OF_RANGE));
}

BOOST_AUTO_TEST_CASE(EncodeSaturate)
{
  boost::system::error_code ec;

  auto wire = encodeDuration(24_h, ec, DurationOverflow::SATURATE);
  BOOST_CHECK(!ec);
  BOOST_CHECK_EQUAL(wire[0], 0xFF);
  BOOST_CHECK_EQUAL(wire[1], 0xFF);

  wire = encodeDuration(30_s, ec, DurationOverflow::SATURATE);
  BOOST_CHECK(!ec);
  BOOST_CHECK_EQUAL(wire[1], 0x1E);

  // saturation does not apply to negative durations
  encodeDuration(-1_s, ec, DurationOverflow::SATURATE);
  BOOST_CHECK_EQUAL(ec, make_error_code(ErrorCode::DURATION_OUT_OF_RANGE));
}

BOOST_AUTO_TEST_CASE(Decode)
{
  boost::system::error_code ec;

  static const uint8_t WIRE[] = {0x0E, 0x10};
  BOOST_CHECK_EQUAL(decodeDuration(WIRE, ec), 3600_s);
  BOOST_CHECK(!ec);

  static const uint8_t MAX[] = {0xFF, 0xFF};
  BOOST_CHECK_EQUAL(decodeDuration(MAX, ec), MAX_DURATION);
  BOOST_CHECK(!ec);
}

BOOST_AUTO_TEST_CASE(DecodeBadLength)
{
  static const uint8_t WIRE[] = {0x0E, 0x10};
  boost::system::error_code ec;

  BOOST_CHECK_EQUAL(decodeDuration(resize(WIRE, -1), ec), 0_s);
  BOOST_CHECK_EQUAL(ec, make_error_code(ErrorCode::DURATION_INVALID));

  BOOST_CHECK_EQUAL(decodeDuration(resize(WIRE, +1), ec), 0_s);
  BOOST_CHECK_EQUAL(ec, make_error_code(ErrorCode::DURATION_INVALID));
}

BOOST_AUTO_TEST_CASE(PrintOverflow)
{
  BOOST_CHECK_EQUAL(boost::lexical_cast<std::string>(DurationOverflow::REJECT), "reject");
  BOOST_CHECK_EQUAL(boost::lexical_cast<std::string>(DurationOverflow::SATURATE), "saturate");
}

BOOST_AUTO_TEST_SUITE_END() // TestDuration
BOOST_AUTO_TEST_SUITE_END() // Codec

} // namespace tests
} // namespace codec
} // namespace spa
