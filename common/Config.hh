//------------------------------------------------------------------------------
// File: Config.hh
//------------------------------------------------------------------------------

/************************************************************************
 * EOS - the CERN Disk Storage System                                   *
 * Copyright (C) 2024 CERN/Switzerland                                  *
 *                                                                      *
 * This program is free software: you can redistribute it and/or modify *
 * it under the terms of the GNU General Public License as published by *
 * the Free Software Foundation, either version 3 of the License, or    *
 * (at your option) any later version.                                  *
 *                                                                      *
 * This program is distributed in the hope that it will be useful,      *
 * but WITHOUT ANY WARRANTY; without even the implied warranty of       *
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the        *
 * GNU General Public License for more details.                         *
 *                                                                      *
 * You should have received a copy of the GNU General Public License    *
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.*
 ************************************************************************/

#ifndef __WARDENCOMMON_CONFIG_HH__
#define __WARDENCOMMON_CONFIG_HH__

#include "common/Namespace.hh"
#include "common/Status.hh"
#include <map>
#include <string>
#include <vector>

WARDENCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Chapter based configuration file support
//!
//! A configuration file is a list of chapters introduced by a '[name]' header
//! followed by 'key = value' lines. Lines starting with '#' are comments.
//! Values may reference variables of the 'sysconfig' chapter as ${VAR} or
//! $VAR, the WARDENHOST variable is always defined and holds the host name.
//!
//! [sysconfig]
//! RBAC_HOST = rbac.example.org
//!
//! [authorization]
//! driver = rbac
//! rbac.api.url = https://${RBAC_HOST}
//------------------------------------------------------------------------------
class Config
{
public:
  typedef std::vector<std::pair<std::string, std::string>> ConfigSection;
  typedef std::map<std::string, ConfigSection> ConfigChapter;

  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  Config();

  //----------------------------------------------------------------------------
  //! Load a configuration file
  //!
  //! @param path location of the file
  //! @param reset if true wipe any previously loaded configuration
  //!
  //! @return status of the operation
  //----------------------------------------------------------------------------
  Status Load(const std::string& path, bool reset = true);

  //----------------------------------------------------------------------------
  //! Load configuration from an in-memory buffer
  //!
  //! @param content configuration text
  //! @param origin name used in error messages
  //! @param reset if true wipe any previously loaded configuration
  //!
  //! @return status of the operation
  //----------------------------------------------------------------------------
  Status LoadFromString(const std::string& content,
                        const std::string& origin = "<memory>",
                        bool reset = true);

  //----------------------------------------------------------------------------
  //! Test for configuration chapter
  //----------------------------------------------------------------------------
  bool Has(const std::string& chapter) const
  {
    return (mConf.count(chapter) != 0);
  }

  //----------------------------------------------------------------------------
  //! Get the value of a key in a chapter with variables substituted
  //!
  //! @param chapter chapter name
  //! @param key key name
  //! @param dflt value returned if the key is not present
  //----------------------------------------------------------------------------
  std::string GetValueByKey(const std::string& chapter, const std::string& key,
                            const std::string& dflt = "") const;

  //----------------------------------------------------------------------------
  //! Return the key/value map of a chapter with variables substituted. Later
  //! definitions of a key override earlier ones.
  //----------------------------------------------------------------------------
  std::map<std::string, std::string> AsMap(const std::string& chapter) const;

  //----------------------------------------------------------------------------
  //! Replace ${VAR} and $VAR references using the sysconfig chapter
  //----------------------------------------------------------------------------
  std::string Substitute(const std::string& s) const;

  //----------------------------------------------------------------------------
  //! Dump the configuration, all chapters if chapter is empty
  //----------------------------------------------------------------------------
  std::string Dump(const std::string& chapter = "",
                   bool substitute = false) const;

private:
  //----------------------------------------------------------------------------
  //! Parse and possibly return a chapter entry, empty if not a chapter header
  //----------------------------------------------------------------------------
  static std::string ParseChapter(const std::string& line);

  //----------------------------------------------------------------------------
  //! Extract the next variable reference of s starting at offset
  //!
  //! @param s input string
  //! @param offset position where the search starts
  //! @param start position of the '$' of the reference
  //! @param stop position after the reference
  //!
  //! @return variable name or empty if no reference found
  //----------------------------------------------------------------------------
  static std::string ParseVariable(const std::string& s, size_t offset,
                                   size_t& start, size_t& stop);

  std::string mHostname;
  ConfigChapter mConf;
};

WARDENCOMMONNAMESPACE_END

#endif
