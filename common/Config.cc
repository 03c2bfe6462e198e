//------------------------------------------------------------------------------
// File: Config.cc
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

#include "common/Config.hh"
#include "common/Logging.hh"
#include "common/StringConversion.hh"
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

WARDENCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
Config::Config()
{
  char host[256];

  if (gethostname(host, sizeof(host)) == 0) {
    host[sizeof(host) - 1] = '\0';
    mHostname = host;
  } else {
    mHostname = "localhost";
  }
}

//------------------------------------------------------------------------------
// Load a configuration file
//------------------------------------------------------------------------------
Status
Config::Load(const std::string& path, bool reset)
{
  warden_static_info("msg=\"loading configuration\" path=\"%s\"", path.c_str());
  errno = 0;
  std::ifstream file(path);

  if (!file.is_open()) {
    int errc = errno ? errno : ENOENT;
    return Status(errc, SSTR("unable to load '" << path << "' : "
                             << strerror(errc)));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return LoadFromString(buffer.str(), path, reset);
}

//------------------------------------------------------------------------------
// Load configuration from an in-memory buffer
//------------------------------------------------------------------------------
Status
Config::LoadFromString(const std::string& content, const std::string& origin,
                       bool reset)
{
  if (reset) {
    mConf.clear();
  }

  std::istringstream f(content);
  std::string line;
  std::string chapter;
  int lineno = 0;

  while (std::getline(f, line)) {
    ++lineno;
    std::string pline = StringConversion::Trim(line);

    // skip empty lines and comments
    if (pline.empty() || (pline.front() == '#')) {
      continue;
    }

    std::string p = ParseChapter(pline);

    if (!p.empty()) {
      chapter = p;
      mConf[chapter];
      continue;
    }

    if (chapter.empty()) {
      return Status(EINVAL, SSTR("no chapter header before line " << lineno
                                 << " in " << origin));
    }

    size_t pos = pline.find('=');

    if (pos == std::string::npos) {
      return Status(EINVAL, SSTR("malformed line " << lineno << " in " << origin
                                 << ": expected 'key = value'"));
    }

    std::string key = StringConversion::Trim(pline.substr(0, pos));
    std::string value = StringConversion::Trim(pline.substr(pos + 1));

    if (key.empty()) {
      return Status(EINVAL, SSTR("empty key on line " << lineno << " in "
                                 << origin));
    }

    mConf[chapter].emplace_back(key, value);
  }

  return Status();
}

//------------------------------------------------------------------------------
// Parse and possibly return a chapter entry
//------------------------------------------------------------------------------
std::string
Config::ParseChapter(const std::string& line)
{
  if ((line.size() > 2) && (line.front() == '[') && (line.back() == ']')) {
    return StringConversion::Trim(line.substr(1, line.size() - 2));
  }

  return "";
}

//------------------------------------------------------------------------------
// Get the value of a key in a chapter
//------------------------------------------------------------------------------
std::string
Config::GetValueByKey(const std::string& chapter, const std::string& key,
                      const std::string& dflt) const
{
  auto it = mConf.find(chapter);

  if (it == mConf.end()) {
    return dflt;
  }

  // last definition wins
  for (auto rit = it->second.rbegin(); rit != it->second.rend(); ++rit) {
    if (rit->first == key) {
      return Substitute(rit->second);
    }
  }

  return dflt;
}

//------------------------------------------------------------------------------
// Return the key/value map of a chapter
//------------------------------------------------------------------------------
std::map<std::string, std::string>
Config::AsMap(const std::string& chapter) const
{
  std::map<std::string, std::string> map;
  auto it = mConf.find(chapter);

  if (it != mConf.end()) {
    for (const auto& kv : it->second) {
      map[kv.first] = Substitute(kv.second);
    }
  }

  return map;
}

//------------------------------------------------------------------------------
// Extract the next variable reference
//------------------------------------------------------------------------------
std::string
Config::ParseVariable(const std::string& s, size_t offset, size_t& start,
                      size_t& stop)
{
  size_t vstart = s.find('$', offset);

  if ((vstart == std::string::npos) || (vstart + 1 >= s.size())) {
    start = stop = std::string::npos;
    return "";
  }

  if (s[vstart + 1] == '{') {
    size_t vstop = s.find('}', vstart + 2);

    if (vstop == std::string::npos) {
      start = stop = std::string::npos;
      return "";
    }

    start = vstart;
    stop = vstop + 1;
    return s.substr(vstart + 2, vstop - vstart - 2);
  }

  size_t vstop = s.find_first_not_of("ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                     "abcdefghijklmnopqrstuvwxyz0123456789_",
                                     vstart + 1);

  if (vstop == std::string::npos) {
    vstop = s.size();
  }

  start = vstart;
  stop = vstop;
  return s.substr(vstart + 1, vstop - vstart - 1);
}

//------------------------------------------------------------------------------
// Replace variable references using the sysconfig chapter
//------------------------------------------------------------------------------
std::string
Config::Substitute(const std::string& s) const
{
  std::map<std::string, std::string> vars;
  auto it = mConf.find("sysconfig");

  if (it != mConf.end()) {
    for (const auto& kv : it->second) {
      vars[kv.first] = kv.second;
    }
  }

  // preset always the WARDENHOST variable
  vars["WARDENHOST"] = mHostname;
  std::string r = s;
  size_t offset = 0;
  size_t p1, p2;
  // bound the number of expansions to stop self referencing definitions
  int max_expansions = 64;

  while (max_expansions-- > 0) {
    std::string var = ParseVariable(r, offset, p1, p2);

    if (p1 == std::string::npos) {
      break;
    }

    auto vit = vars.find(var);

    if (var.empty() || (vit == vars.end())) {
      // leave unknown references untouched
      offset = p2;
      continue;
    }

    r.replace(p1, p2 - p1, vit->second);
    offset = p1;
  }

  return r;
}

//------------------------------------------------------------------------------
// Config dumper
//------------------------------------------------------------------------------
std::string
Config::Dump(const std::string& chapter, bool substitute) const
{
  std::ostringstream out;

  for (const auto& c : mConf) {
    if (!chapter.empty() && (c.first != chapter)) {
      continue;
    }

    if (chapter.empty()) {
      out << "[" << c.first << "]\n";
    }

    for (const auto& kv : c.second) {
      out << kv.first << " = " << (substitute ? Substitute(kv.second) : kv.second)
          << "\n";
    }
  }

  return out.str();
}

WARDENCOMMONNAMESPACE_END
