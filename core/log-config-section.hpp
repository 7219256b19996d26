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

#ifndef SPA_CORE_LOG_CONFIG_SECTION_HPP
#define SPA_CORE_LOG_CONFIG_SECTION_HPP

#include "core/config-file.hpp"

namespace spa {
namespace log {

/**
 * \brief Register the "log" section handler with \p config.
 *
 * \code
 * log
 * {
 *   default_level INFO   ; applies to all spa.* loggers
 *   codec.IpAddress TRACE
 *   codec.* DEBUG        ; a prefix ending in .* covers the loggers below it
 * }
 * \endcode
 *
 * Module names are relative to "spa." and must name a registered logger.
 */
void
setConfigFile(ConfigFile& config);

} // namespace log
} // namespace spa

#endif // SPA_CORE_LOG_CONFIG_SECTION_HPP
