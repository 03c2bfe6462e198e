//------------------------------------------------------------------------------
// File: StringConversion.hh
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

#ifndef __WARDENCOMMON_STRINGCONVERSION_HH__
#define __WARDENCOMMON_STRINGCONVERSION_HH__

#include "common/Namespace.hh"
#include <fmt/format.h>
#include <string>
#include <vector>

WARDENCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Static helper class with convenience functions for string tokenizing,
//! escaping and identifier generation.
//------------------------------------------------------------------------------
class StringConversion
{
public:
  // ---------------------------------------------------------------------------
  /**
   * Tokenize a string
   *
   * @param str string to be tokenized
   * @param tokens  returned list of separated string tokens
   * @param delimiters delimiter used for tokenizing
   */
  // ---------------------------------------------------------------------------
  static void Tokenize(const std::string& str,
                       std::vector<std::string>& tokens,
                       const std::string& delimiters = " ");

  // ---------------------------------------------------------------------------
  /**
   * Tokenize a string accepting also empty members e.g. a||b returns 3 fields
   *
   * @param str string to be tokenized
   * @param tokens  returned list of separated string tokens
   * @param delimiters delimiter used for tokenizing
   */
  // ---------------------------------------------------------------------------
  static void EmptyTokenize(const std::string& str,
                            std::vector<std::string>& tokens,
                            const std::string& delimiters = " ");

  //----------------------------------------------------------------------------
  //! Join the given tokens with the separator
  //----------------------------------------------------------------------------
  static std::string Join(const std::vector<std::string>& tokens,
                          const std::string& separator);

  //----------------------------------------------------------------------------
  //! Remove leading and trailing whitespace
  //----------------------------------------------------------------------------
  static std::string Trim(const std::string& str);

  //----------------------------------------------------------------------------
  //! Return an escaped URI
  //!
  //! @param str - uri to escape
  //! @return escaped URI string
  //----------------------------------------------------------------------------
  static std::string
  curl_default_escaped(const std::string& str);

  //----------------------------------------------------------------------------
  /**
   * Returns a time-based generated uuid
   *
   * @return uuid string
   */
  //----------------------------------------------------------------------------
  static std::string timebased_uuidstring();

  //------------------------------------------------------------------------------
  //! Fast convert element to string representation
  //!
  //! @param elem element to be converted
  //!
  //! @return string representation
  //------------------------------------------------------------------------------
  template <typename T>
  static std::string stringify(const T& elem)
  {
    return fmt::to_string(elem);
  }

  //------------------------------------------------------------------------------
  //! Replace a substring with another substring in a string
  //------------------------------------------------------------------------------
  static void ReplaceStringInPlace(std::string& subject,
                                   const std::string& search,
                                   const std::string& replace)
  {
    if (subject.empty() || search.empty()) {
      return;
    }

    size_t pos = 0;

    while ((pos = subject.find(search, pos)) != std::string::npos) {
      subject.replace(pos, search.length(), replace);
      pos += replace.length();
    }
  }

  //----------------------------------------------------------------------------
  //! Parse a non-negative integer value
  //!
  //! @param str input string
  //! @param value parsed value
  //!
  //! @return true if the whole string was a valid number, otherwise false
  //----------------------------------------------------------------------------
  static bool GetSizeFromString(const std::string& str, uint64_t& value);

private:
  StringConversion() = delete;
};

WARDENCOMMONNAMESPACE_END

#endif
