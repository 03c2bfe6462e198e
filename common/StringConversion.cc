//------------------------------------------------------------------------------
// File: StringConversion.cc
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

#include "common/StringConversion.hh"
#include "common/Logging.hh"
#include <curl/curl.h>
#include <uuid/uuid.h>
#include <cerrno>
#include <cstdlib>
#include <memory>

WARDENCOMMONNAMESPACE_BEGIN

namespace
{
//------------------------------------------------------------------------------
// Thread specific CURL session used for escaping
//------------------------------------------------------------------------------
struct CurlDeleter {
  void operator()(CURL* curl) const
  {
    warden_static_debug("%s", "msg=\"destroying thread specific CURL session\"");
    curl_easy_cleanup(curl);
  }
};

CURL*
tlCurl()
{
  static thread_local std::unique_ptr<CURL, CurlDeleter> sCurl;

  if (!sCurl) {
    warden_static_debug("%s", "msg=\"allocating thread specific CURL session\"");
    sCurl.reset(curl_easy_init());

    if (!sCurl) {
      warden_static_crit("%s", "msg=\"error initialising CURL easy session\"");
    }
  }

  return sCurl.get();
}
}

//------------------------------------------------------------------------------
// Tokenize a string
//------------------------------------------------------------------------------
void
StringConversion::Tokenize(const std::string& str,
                           std::vector<std::string>& tokens,
                           const std::string& delimiters)
{
  // Skip delimiters at the beginning
  std::string::size_type lastPos = str.find_first_not_of(delimiters, 0);
  // Find first "non-delimiter"
  std::string::size_type pos = str.find_first_of(delimiters, lastPos);

  while (std::string::npos != pos || std::string::npos != lastPos) {
    tokens.push_back(str.substr(lastPos, pos - lastPos));
    lastPos = str.find_first_not_of(delimiters, pos);
    pos = str.find_first_of(delimiters, lastPos);
  }
}

//------------------------------------------------------------------------------
// Tokenize a string accepting also empty members e.g. a||b returns 3 fields
//------------------------------------------------------------------------------
void
StringConversion::EmptyTokenize(const std::string& str,
                                std::vector<std::string>& tokens,
                                const std::string& delimiters)
{
  std::string::size_type lastPos = 0;
  std::string::size_type pos = str.find_first_of(delimiters, lastPos);

  while (pos != std::string::npos) {
    tokens.push_back(str.substr(lastPos, pos - lastPos));
    lastPos = pos + 1;
    pos = str.find_first_of(delimiters, lastPos);
  }

  tokens.push_back(str.substr(lastPos));
}

//------------------------------------------------------------------------------
// Join tokens
//------------------------------------------------------------------------------
std::string
StringConversion::Join(const std::vector<std::string>& tokens,
                       const std::string& separator)
{
  std::string out;

  for (size_t i = 0; i < tokens.size(); ++i) {
    if (i) {
      out += separator;
    }

    out += tokens[i];
  }

  return out;
}

//------------------------------------------------------------------------------
// Trim whitespace
//------------------------------------------------------------------------------
std::string
StringConversion::Trim(const std::string& str)
{
  static const char* ws = " \t\r\n";
  size_t start = str.find_first_not_of(ws);

  if (start == std::string::npos) {
    return "";
  }

  size_t end = str.find_last_not_of(ws);
  return str.substr(start, end - start + 1);
}

//------------------------------------------------------------------------------
// Escape string using CURL
//------------------------------------------------------------------------------
std::string
StringConversion::curl_default_escaped(const std::string& str)
{
  std::string ret_str;
  CURL* curl = tlCurl();

  if (curl) {
    char* output = curl_easy_escape(curl, str.c_str(), str.length());

    if (output) {
      ret_str = output;
      curl_free(output);
    }
  }

  return ret_str;
}

//------------------------------------------------------------------------------
// Create time-based uuid string
//------------------------------------------------------------------------------
std::string
StringConversion::timebased_uuidstring()
{
  uuid_t uuid;
  // 36-byte string + '\0' trailing
  char uuid_str[37];
  uuid_generate_time(uuid);
  uuid_unparse(uuid, uuid_str);
  return std::string(uuid_str);
}

//------------------------------------------------------------------------------
// Parse a non-negative integer value
//------------------------------------------------------------------------------
bool
StringConversion::GetSizeFromString(const std::string& str, uint64_t& value)
{
  if (str.empty() || (str.find_first_not_of("0123456789") != std::string::npos)) {
    return false;
  }

  errno = 0;
  char* end = nullptr;
  unsigned long long val = strtoull(str.c_str(), &end, 10);

  if (errno || (end == nullptr) || (*end != '\0')) {
    return false;
  }

  value = val;
  return true;
}

WARDENCOMMONNAMESPACE_END
