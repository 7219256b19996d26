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

#include "core/log-config-section.hpp"

#include <ndn-cxx/util/logger.hpp>
#include <ndn-cxx/util/logging.hpp>

#include <algorithm>

namespace spa {
namespace log {

using ndn::util::LogLevel;
using ndn::util::Logging;

const std::string CFG_SECTION = "log";
const std::string MODULE_PREFIX = "spa.";

static LogLevel
parseLogLevel(const ConfigSection& item, const std::string& key)
{
  try {
    return ndn::util::parseLogLevel(item.get_value<std::string>());
  }
  catch (const std::invalid_argument&) {
    NDN_THROW_NESTED(ConfigFile::Error("Invalid log level for '" + key +
                                       "' in section '" + CFG_SECTION + "'"));
  }
}

/** \return the full logger name or "<prefix>.*" pattern of \p key
 *  \throw ConfigFile::Error no registered logger matches
 */
static std::string
resolveModule(const std::string& key)
{
  auto names = Logging::getLoggerNames();
  std::string module = MODULE_PREFIX + key;

  bool isKnown = false;
  if (key.size() > 2 && key.compare(key.size() - 2, 2, ".*") == 0) {
    std::string prefix = module.substr(0, module.size() - 1);
    isKnown = std::any_of(names.begin(), names.end(), [&prefix] (const std::string& name) {
      return name.compare(0, prefix.size(), prefix) == 0;
    });
  }
  else {
    isKnown = names.count(module) > 0;
  }

  if (!isKnown) {
    NDN_THROW(ConfigFile::Error("Unknown logger '" + key + "' in section '" + CFG_SECTION + "'"));
  }
  return module;
}

static void
onConfig(const ConfigSection& section, bool isDryRun)
{
  LogLevel defaultLevel = LogLevel::INFO;
  std::vector<std::pair<std::string, LogLevel>> moduleLevels;

  for (const auto& i : section) {
    if (i.first == "default_level") {
      defaultLevel = parseLogLevel(i.second, i.first);
    }
    else {
      moduleLevels.emplace_back(resolveModule(i.first), parseLogLevel(i.second, i.first));
    }
  }

  if (isDryRun) {
    return;
  }

  Logging::setLevel(MODULE_PREFIX + "*", defaultLevel);
  for (const auto& moduleLevel : moduleLevels) {
    Logging::setLevel(moduleLevel.first, moduleLevel.second);
  }
}

void
setConfigFile(ConfigFile& config)
{
  config.addSectionHandler(CFG_SECTION,
    [] (const ConfigSection& section, bool isDryRun, const std::string&) {
      onConfig(section, isDryRun);
    });
}

} // namespace log
} // namespace spa
