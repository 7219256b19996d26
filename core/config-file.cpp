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

#include "core/config-file.hpp"
#include "core/logger.hpp"

#include <boost/property_tree/info_parser.hpp>

#include <fstream>
#include <sstream>

namespace spa {

SPA_LOG_INIT(ConfigFile);

void
ConfigFile::addSectionHandler(const std::string& sectionName, ConfigSectionHandler handler)
{
  bool isNew = m_handlers.emplace(sectionName, std::move(handler)).second;
  if (!isNew) {
    NDN_THROW(std::invalid_argument("Handler for section '" + sectionName +
                                    "' is already registered"));
  }
}

void
ConfigFile::parse(const std::string& filename, bool isDryRun)
{
  std::ifstream inputFile(filename);
  if (!inputFile) {
    NDN_THROW(Error("Failed to read configuration file " + filename));
  }
  parse(inputFile, isDryRun, filename);
}

void
ConfigFile::parse(const std::string& input, bool isDryRun, const std::string& filename)
{
  std::istringstream inputStream(input);
  parse(inputStream, isDryRun, filename);
}

void
ConfigFile::parse(std::istream& input, bool isDryRun, const std::string& filename)
{
  ConfigSection config;
  try {
    boost::property_tree::read_info(input, config);
  }
  catch (const boost::property_tree::info_parser_error& e) {
    NDN_THROW(Error("Failed to parse configuration file " + filename +
                    ": " + e.message() + " on line " + to_string(e.line())));
  }

  dispatch(config, isDryRun, filename);
}

void
ConfigFile::dispatch(const ConfigSection& config, bool isDryRun,
                     const std::string& filename) const
{
  // every section must be known before any handler sees its own
  for (const auto& section : config) {
    if (m_handlers.count(section.first) == 0) {
      NDN_THROW(Error("Error processing configuration file " + filename +
                      ": no module subscribed for section '" + section.first + "'"));
    }
  }

  for (const auto& section : config) {
    SPA_LOG_TRACE("Processing section '" << section.first << "'"
                  << (isDryRun ? " (dry run)" : ""));
    m_handlers.at(section.first)(section.second, isDryRun, filename);
  }
}

} // namespace spa
