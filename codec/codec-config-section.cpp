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

#include "codec/codec-config-section.hpp"
#include "core/logger.hpp"

namespace spa {
namespace codec {

SPA_LOG_INIT(codec.CodecConfigSection);

const std::string CFG_SECTION = "codec";

static DurationOverflow
parseDurationOverflow(const ConfigSection& node, const std::string& key)
{
  auto value = node.get_value<std::string>();
  if (value == "reject") {
    return DurationOverflow::REJECT;
  }
  else if (value == "saturate") {
    return DurationOverflow::SATURATE;
  }
  NDN_THROW(ConfigFile::Error("Invalid value '" + value + "' for option '" + key +
                              "' in section '" + CFG_SECTION + "'"));
}

static void
onConfig(const ConfigSection& section, bool isDryRun, CodecOptions& options)
{
  CodecOptions parsed;

  for (const auto& i : section) {
    if (i.first == "duration_overflow") {
      parsed.durationOverflow = parseDurationOverflow(i.second, i.first);
    }
    else {
      NDN_THROW(ConfigFile::Error("Unrecognized option " + CFG_SECTION + "." + i.first));
    }
  }

  if (!isDryRun) {
    SPA_LOG_DEBUG("duration_overflow=" << parsed.durationOverflow);
    options = parsed;
  }
}

void
setConfigFile(ConfigFile& config, CodecOptions& options)
{
  config.addSectionHandler(CFG_SECTION,
    [&options] (const ConfigSection& section, bool isDryRun, const std::string&) {
      onConfig(section, isDryRun, options);
    });
}

} // namespace codec
} // namespace spa
