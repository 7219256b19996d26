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

#include "codec/device-id.hpp"
#include "core/logger.hpp"

#include <ndn-cxx/encoding/buffer.hpp>
#include <ndn-cxx/util/string-helper.hpp>

#include <algorithm>
#include <iterator>

namespace spa {
namespace codec {

SPA_LOG_INIT(codec.DeviceId);

// positions of the dashes in 8-4-4-4-12 notation
static const std::array<size_t, 4> DASH_POSITIONS{{8, 13, 18, 23}};

const size_t DASHLESS_LENGTH = DEVICE_ID_SIZE * 2;
const size_t DASHED_LENGTH = DASHLESS_LENGTH + DASH_POSITIONS.size();

static bool
isDashPosition(size_t pos)
{
  return std::find(DASH_POSITIONS.begin(), DASH_POSITIONS.end(), pos) != DASH_POSITIONS.end();
}

static bool
hasCanonicalDashes(const std::string& id)
{
  BOOST_ASSERT(id.size() == DASHED_LENGTH);

  for (size_t pos = 0; pos < id.size(); ++pos) {
    if ((id[pos] == '-') != isDashPosition(pos)) {
      return false;
    }
  }
  return true;
}

static std::string
insertDashes(const std::string& hex)
{
  BOOST_ASSERT(hex.size() == DASHLESS_LENGTH);

  std::string dashed(DASHED_LENGTH, '-');
  size_t dst = 0;
  for (char c : hex) {
    if (isDashPosition(dst)) {
      ++dst;
    }
    dashed[dst++] = c;
  }
  return dashed;
}

DeviceIdBytes
encodeDeviceId(const std::string& id, boost::system::error_code& ec)
{
  ec.clear();

  std::string hex;
  if (id.size() == DASHLESS_LENGTH) {
    hex = id;
  }
  else if (id.size() == DASHED_LENGTH && hasCanonicalDashes(id)) {
    hex.reserve(DASHLESS_LENGTH);
    std::remove_copy(id.begin(), id.end(), std::back_inserter(hex), '-');
  }
  else {
    SPA_LOG_TRACE("rejecting device id of length " << id.size());
    ec = ErrorCode::DEVICE_ID_INVALID;
    return {};
  }

  shared_ptr<ndn::Buffer> buffer;
  try {
    buffer = ndn::fromHex(hex);
  }
  catch (const ndn::StringHelperError& e) {
    SPA_LOG_TRACE("rejecting device id '" << id << "': " << e.what());
    ec = ErrorCode::DEVICE_ID_NOT_HEX;
    return {};
  }
  BOOST_ASSERT(buffer->size() == DEVICE_ID_SIZE);

  DeviceIdBytes wire;
  std::copy(buffer->begin(), buffer->end(), wire.begin());
  return wire;
}

std::string
decodeDeviceId(const DeviceIdBytes& wire)
{
  return insertDashes(ndn::toHex(wire, false));
}

std::string
decodeDeviceId(span<const uint8_t> wire, boost::system::error_code& ec)
{
  ec.clear();

  if (wire.size() != DEVICE_ID_SIZE) {
    SPA_LOG_TRACE("rejecting device id field of " << wire.size() << " octets");
    ec = ErrorCode::DEVICE_ID_INVALID;
    return {};
  }

  DeviceIdBytes bytes;
  std::copy(wire.begin(), wire.end(), bytes.begin());
  return decodeDeviceId(bytes);
}

} // namespace codec
} // namespace spa
