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

#ifndef SPA_CORE_VERSION_HPP
#define SPA_CORE_VERSION_HPP

/** spa-codec version follows Semantic Versioning 2.0.0 specification
 *  http://semver.org/
 *
 *  This is the version of the library, not of the wire protocol.
 *  \sa spa::codec::VERSION
 */

/** \brief spa-codec version represented as an integer
 *
 *  MAJOR*1000000 + MINOR*1000 + PATCH
 */
#define SPA_VERSION 2001

/** \brief spa-codec version represented as a string
 *
 *  MAJOR.MINOR.PATCH
 */
#define SPA_VERSION_STRING "0.2.1"

/// MAJOR version
#define SPA_VERSION_MAJOR (SPA_VERSION / 1000000)
/// MINOR version
#define SPA_VERSION_MINOR (SPA_VERSION % 1000000 / 1000)
/// PATCH version
#define SPA_VERSION_PATCH (SPA_VERSION % 1000)

#endif // SPA_CORE_VERSION_HPP
