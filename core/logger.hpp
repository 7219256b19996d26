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

#ifndef SPA_CORE_LOGGER_HPP
#define SPA_CORE_LOGGER_HPP

#include <ndn-cxx/util/logger.hpp>

/**
 * \file
 * \brief Logging macros of spa-codec.
 *
 * All loggers live under the "spa." prefix of the ndn-cxx logging facility, so that
 * `NDN_LOG=spa.*=TRACE` or the "log" configuration section controls them together.
 */

#define SPA_LOG_INIT(name) NDN_LOG_INIT(spa.name)

#define SPA_LOG_TRACE NDN_LOG_TRACE
#define SPA_LOG_DEBUG NDN_LOG_DEBUG
#define SPA_LOG_INFO  NDN_LOG_INFO
#define SPA_LOG_WARN  NDN_LOG_WARN
#define SPA_LOG_ERROR NDN_LOG_ERROR
#define SPA_LOG_FATAL NDN_LOG_FATAL

#endif // SPA_CORE_LOGGER_HPP
