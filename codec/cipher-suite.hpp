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

#ifndef SPA_CODEC_CIPHER_SUITE_HPP
#define SPA_CODEC_CIPHER_SUITE_HPP

#include "codec/constants.hpp"
#include "codec/error.hpp"

#include <iosfwd>

namespace spa {
namespace codec {

/**
 * \brief Identifies the combination of algorithms a PDU is signed and encrypted with.
 */
enum class CipherSuiteId : uint8_t {
  RSA_SHA256_AES256CBC = 1,
};

std::ostream&
operator<<(std::ostream& os, CipherSuiteId id);

/**
 * \brief Returns whether \p id names a cipher suite known to this library.
 */
bool
isKnownCipherSuite(uint8_t id) noexcept;

uint8_t
encodeCipherSuite(CipherSuiteId id) noexcept;

/**
 * \retval CIPHER_SUITE_INVALID \p wire is not CIPHER_SUITE_SIZE octets long
 * \retval CIPHER_SUITE_NOT_SUPPORTED the octet is not a known CipherSuiteId
 */
CipherSuiteId
decodeCipherSuite(span<const uint8_t> wire, boost::system::error_code& ec);

/**
 * \brief Raised by a signing or verification layer that is handed a cipher suite it does
 *        not implement.
 */
class CipherSuiteNotSupported : public std::runtime_error
{
public:
  explicit
  CipherSuiteNotSupported(CipherSuiteId cipherSuite);

  CipherSuiteId
  getCipherSuite() const noexcept
  {
    return m_cipherSuite;
  }

  /**
   * \return CIPHER_SUITE_NOT_SUPPORTED as a boost::system::error_code
   */
  boost::system::error_code
  code() const noexcept
  {
    return make_error_code(ErrorCode::CIPHER_SUITE_NOT_SUPPORTED);
  }

private:
  CipherSuiteId m_cipherSuite;
};

} // namespace codec
} // namespace spa

#endif // SPA_CODEC_CIPHER_SUITE_HPP
