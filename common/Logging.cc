// ----------------------------------------------------------------------
// File: Logging.cc
// ----------------------------------------------------------------------

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

#include "common/Logging.hh"
#include "common/StringConversion.hh"
#include <sys/time.h>
#include <sys/syscall.h>
#include <unistd.h>
#include <cstdarg>
#include <vector>
#include <cstdlib>
#include <ctime>
#include <strings.h>

WARDENCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Get singleton instance
//------------------------------------------------------------------------------
Logging&
Logging::GetInstance()
{
  static Logging sLogging;
  return sLogging;
}

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
Logging::Logging():
  mLogMask(LOG_UPTO(LOG_NOTICE)), mPriorityLevel(LOG_NOTICE),
  mToSysLog(false), mShortFormat(false), mUnit("none"), mOutput(nullptr)
{
  const char* tosyslog = getenv("WARDEN_LOG_SYSLOG");

  if (tosyslog && (!strcmp(tosyslog, "1") || !strcmp(tosyslog, "true"))) {
    mToSysLog = true;
  }

  const char* level = getenv("WARDEN_LOG_LEVEL");

  if (level) {
    int pri = GetPriorityByString(level);

    if (pri != -1) {
      SetLogPriority(pri);
    }
  }
}

//------------------------------------------------------------------------------
// Set the function name filter
//------------------------------------------------------------------------------
void
Logging::SetFilter(const char* filter)
{
  std::lock_guard<std::mutex> lock(mMutex);
  mAllowFilter.clear();
  mDenyFilter.clear();

  if (filter == nullptr) {
    return;
  }

  std::string sfilter = filter;
  std::set<std::string>* target = &mDenyFilter;

  if (sfilter.find("PASS:") == 0) {
    sfilter.erase(0, 5);
    target = &mAllowFilter;
  }

  std::vector<std::string> tokens;
  StringConversion::Tokenize(sfilter, tokens, ",");

  for (const auto& token : tokens) {
    target->insert(token);
  }
}

//------------------------------------------------------------------------------
// Return priority as string
//------------------------------------------------------------------------------
const char*
Logging::GetPriorityString(int pri)
{
  if (pri == (LOG_INFO)) {
    return "INFO ";
  }

  if (pri == (LOG_DEBUG)) {
    return "DEBUG";
  }

  if (pri == (LOG_ERR)) {
    return "ERROR";
  }

  if (pri == (LOG_EMERG)) {
    return "EMERG";
  }

  if (pri == (LOG_ALERT)) {
    return "ALERT";
  }

  if (pri == (LOG_CRIT)) {
    return "CRIT ";
  }

  if (pri == (LOG_WARNING)) {
    return "WARN ";
  }

  if (pri == (LOG_NOTICE)) {
    return "NOTE ";
  }

  if (pri == (LOG_SILENT)) {
    return "";
  }

  return "NONE ";
}

//------------------------------------------------------------------------------
// Return priority int from string
//------------------------------------------------------------------------------
int
Logging::GetPriorityByString(const char* pri)
{
  if (!strcasecmp(pri, "info")) {
    return LOG_INFO;
  }

  if (!strcasecmp(pri, "debug")) {
    return LOG_DEBUG;
  }

  if (!strcasecmp(pri, "err") || !strcasecmp(pri, "error")) {
    return LOG_ERR;
  }

  if (!strcasecmp(pri, "emerg")) {
    return LOG_EMERG;
  }

  if (!strcasecmp(pri, "alert")) {
    return LOG_ALERT;
  }

  if (!strcasecmp(pri, "crit")) {
    return LOG_CRIT;
  }

  if (!strcasecmp(pri, "warning")) {
    return LOG_WARNING;
  }

  if (!strcasecmp(pri, "notice")) {
    return LOG_NOTICE;
  }

  if (!strcasecmp(pri, "silent")) {
    return LOG_SILENT;
  }

  return -1;
}

//------------------------------------------------------------------------------
// Should log function
//------------------------------------------------------------------------------
bool
Logging::shouldlog(const char* func, int priority)
{
  if (priority == LOG_SILENT) {
    return true;
  }

  // short cut if log messages are masked
  if (!((LOG_MASK(priority) & mLogMask))) {
    return false;
  }

  // apply filter to avoid message flooding for debug messages
  if (priority >= LOG_INFO) {
    std::lock_guard<std::mutex> lock(mMutex);

    if (!mAllowFilter.empty()) {
      return (mAllowFilter.count(func) != 0);
    }

    if (mDenyFilter.count(func)) {
      return false;
    }
  }

  return true;
}

//------------------------------------------------------------------------------
// Logging function
//------------------------------------------------------------------------------
const char*
Logging::log(const char* func, const char* file, int line, const char* logid,
             const char* cident, int priority, const char* msg, ...)
{
  static thread_local std::string sLast;

  if (!shouldlog(func, priority)) {
    return "";
  }

  // we show only the file name without directory and extension
  std::string sfile = file;
  sfile.erase(0, sfile.rfind('/') + 1);
  size_t dpos = sfile.rfind('.');

  if (dpos != std::string::npos) {
    sfile.erase(dpos);
  }

  struct timeval tv;
  gettimeofday(&tv, nullptr);
  time_t current_time = tv.tv_sec;
  tm tm;
  localtime_r(&current_time, &tm);
  char sourceline[64];
  snprintf(sourceline, sizeof(sourceline), "%s:%d", sfile.c_str(), line);
  char header[512];
  unsigned long tid = (unsigned long) syscall(SYS_gettid);
  std::string unit;
  {
    std::lock_guard<std::mutex> lock(mMutex);
    unit = mUnit;
  }

  if (mShortFormat) {
    snprintf(header, sizeof(header),
             "%02d%02d%02d %02d:%02d:%02d t=%lu.%06lu f=%-16s l=%s tid=%08lx s=%-24s ",
             tm.tm_year - 100, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
             tm.tm_sec, (unsigned long) current_time, (unsigned long) tv.tv_usec,
             func, GetPriorityString(priority), tid, sourceline);
  } else {
    snprintf(header, sizeof(header),
             "%02d%02d%02d %02d:%02d:%02d time=%lu.%06lu func=%-24s level=%s logid=%s unit=%s tid=%08lx source=%-30s tident=%s ",
             tm.tm_year - 100, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
             tm.tm_sec, (unsigned long) current_time, (unsigned long) tv.tv_usec,
             func, GetPriorityString(priority), logid, unit.c_str(), tid,
             sourceline, cident);
  }

  char body[4096];
  va_list args;
  va_start(args, msg);
  vsnprintf(body, sizeof(body), msg, args);
  va_end(args);
  sLast = header;
  sLast += body;

  if (priority == LOG_SILENT) {
    return sLast.c_str();
  }

  {
    std::lock_guard<std::mutex> lock(mMutex);
    FILE* out = (mOutput ? mOutput : stderr);
    fprintf(out, "%s\n", sLast.c_str());
    fflush(out);
  }

  if (mToSysLog) {
    syslog(priority, "%s", sLast.c_str());
  }

  return sLast.c_str();
}

WARDENCOMMONNAMESPACE_END
