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

#ifndef SPA_CORE_CONFIG_FILE_HPP
#define SPA_CORE_CONFIG_FILE_HPP

#include "core/common.hpp"

#include <boost/property_tree/ptree.hpp>

#include <istream>
#include <stdexcept>

namespace spa {

/**
 * \brief A configuration file section.
 */
using ConfigSection = boost::property_tree::ptree;

/**
 * \brief Callback to process a configuration file section.
 * \throw ConfigFile::Error the section contains an invalid option or value
 */
using ConfigSectionHandler = std::function<void(const ConfigSection& section, bool isDryRun,
                                                const std::string& filename)>;

/**
 * \brief Dispatches the sections of an INFO-format configuration to their handlers.
 *
 * Each top-level section ("log", "codec", ...) must have a handler registered under its
 * name; a section without a handler is an error. With \p isDryRun set, handlers only
 * validate their section, so a configuration can be checked before any of it is applied.
 */
class ConfigFile : noncopyable
{
public:
  class Error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  /** \brief Register the handler of \p sectionName.
   *  \throw std::invalid_argument a handler is already registered for \p sectionName
   */
  void
  addSectionHandler(const std::string& sectionName, ConfigSectionHandler handler);

  /** \brief Read and dispatch the configuration file \p filename.
   *  \throw Error the file cannot be read or parsed, or a section is rejected
   */
  void
  parse(const std::string& filename, bool isDryRun);

  /** \brief Dispatch configuration text.
   *  \param filename name used in error messages
   */
  void
  parse(const std::string& input, bool isDryRun, const std::string& filename);

  void
  parse(std::istream& input, bool isDryRun, const std::string& filename);

private:
  void
  dispatch(const ConfigSection& config, bool isDryRun, const std::string& filename) const;

private:
  std::map<std::string, ConfigSectionHandler> m_handlers;
};

} // namespace spa

#endif // SPA_CORE_CONFIG_FILE_HPP
