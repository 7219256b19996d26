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

#ifndef SPA_CODEC_CODEC_CONFIG_SECTION_HPP
#define SPA_CODEC_CODEC_CONFIG_SECTION_HPP

#include "codec/duration.hpp"
#include "core/config-file.hpp"

namespace spa {
namespace codec {

/**
 * \brief Codec behavior that the embedding application may configure.
 */
struct CodecOptions
{
  DurationOverflow durationOverflow = DurationOverflow::REJECT;
};

/**
 * \brief Register the "codec" section handler with \p config.
 *
 * \code
 * codec
 * {
 *   duration_overflow reject ; reject or saturate
 * }
 * \endcode
 *
 * Unspecified options take their default value. \p options must outlive \p config;
 * it is only written when the section is processed outside of a dry run.
 */
void
setConfigFile(ConfigFile& config, CodecOptions& options);

} // namespace codec
} // namespace spa

#endif // SPA_CODEC_CODEC_CONFIG_SECTION_HPP
