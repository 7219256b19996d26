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
#include "core/logger.hpp"

#include <ostream>

namespace spa {
namespace codec {

SPA_LOG_INIT(codec.CipherSuite);

std::ostream&
operator<<(std::ostream& os, CipherSuiteId id)
{
  switch (id) {
    case CipherSuiteId::RSA_SHA256_AES256CBC:
      return os << "RSA_SHA256_AES256CBC";
  }
  return os << static_cast<unsigned>(id);
}

bool
isKnownCipherSuite(uint8_t id) noexcept
{
  switch (static_cast<CipherSuiteId>(id)) {
    case CipherSuiteId::RSA_SHA256_AES256CBC:
      return true;
  }
  return false;
}

uint8_t
encodeCipherSuite(CipherSuiteId id) noexcept
{
  return static_cast<uint8_t>(id);
}

CipherSuiteId
decodeCipherSuite(span<const uint8_t> wire, boost::system::error_code& ec)
{
  ec.clear();

  if (wire.size() != CIPHER_SUITE_SIZE) {
    SPA_LOG_TRACE("rejecting cipher suite field of " << wire.size() << " octets");
    ec = ErrorCode::CIPHER_SUITE_INVALID;
    return {};
  }

  if (!isKnownCipherSuite(wire[0])) {
    SPA_LOG_TRACE("rejecting unknown cipher suite " << static_cast<unsigned>(wire[0]));
    ec = ErrorCode::CIPHER_SUITE_NOT_SUPPORTED;
    return {};
  }

  return static_cast<CipherSuiteId>(wire[0]);
}

CipherSuiteNotSupported::CipherSuiteNotSupported(CipherSuiteId cipherSuite)
  : std::runtime_error("cipher suite " + to_string(static_cast<unsigned>(cipherSuite)) +
                       " not supported")
  , m_cipherSuite(cipherSuite)
{
}

} // namespace codec
} // namespace spa
