// ----------------------------------------------------------------------
// File: Logging.hh
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

/**
 * @file   Logging.hh
 *
 * @brief  Class for message logging.
 *
 * The class provides a global singleton, no instance has to be created. All
 * the 'warden_<level>' macros require that the logging class inherits from
 * 'LogId'. Free functions and static members use the 'warden_static_<level>'
 * macros instead. The log level is defined with 'SetLogPriority'. 'SetFilter'
 * allows to filter out messages by their function name (__FUNCTION__). If the
 * comma separated list is prefixed with 'PASS:' it is used as an acceptance
 * filter. By default all messages are printed to 'stderr', 'SetSysLog'
 * duplicates them into syslog.
 */

#ifndef __WARDENCOMMON_LOGGING_HH__
#define __WARDENCOMMON_LOGGING_HH__

#include "common/Namespace.hh"
#include <sys/syslog.h>
#include <uuid/uuid.h>
#include <string.h>
#include <cstdio>
#include <mutex>
#include <set>
#include <sstream>
#include <string>

#define SSTR(message) static_cast<std::ostringstream&>(std::ostringstream().flush() << message).str()

WARDENCOMMONNAMESPACE_BEGIN

#define WARDEN_TEXTNORMAL "\033[0m"
#define WARDEN_TEXTRED    "\033[49;31m"
#define WARDEN_TEXTGREEN  "\033[49;32m"
#define WARDEN_TEXTYELLOW "\033[49;33m"
#define WARDEN_TEXTBLUE   "\033[49;34m"
#define LOG_SILENT 0xffff

//------------------------------------------------------------------------------
//! Log Macros usable in objects inheriting from the LogId Class
//------------------------------------------------------------------------------
#define warden_log(__WARDENCOMMON_LOG_PRIORITY__ , ...) \
  warden::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                             this->cident, __WARDENCOMMON_LOG_PRIORITY__, __VA_ARGS__)
#define warden_debug(...) \
  warden::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                             this->cident, (LOG_DEBUG), __VA_ARGS__)
#define warden_info(...) \
  warden::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                             this->cident, (LOG_INFO), __VA_ARGS__)
#define warden_notice(...) \
  warden::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                             this->cident, (LOG_NOTICE), __VA_ARGS__)
#define warden_warning(...) \
  warden::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                             this->cident, (LOG_WARNING), __VA_ARGS__)
#define warden_err(...) \
  warden::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                             this->cident, (LOG_ERR), __VA_ARGS__)
#define warden_crit(...) \
  warden::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, this->logId, \
                                             this->cident, (LOG_CRIT), __VA_ARGS__)

//------------------------------------------------------------------------------
//! Log Macros usable from static member functions without LogId object
//------------------------------------------------------------------------------
#define warden_static_debug(...) \
  warden::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                             "", (LOG_DEBUG), __VA_ARGS__)
#define warden_static_info(...) \
  warden::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                             "", (LOG_INFO), __VA_ARGS__)
#define warden_static_notice(...) \
  warden::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                             "", (LOG_NOTICE), __VA_ARGS__)
#define warden_static_warning(...) \
  warden::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                             "", (LOG_WARNING), __VA_ARGS__)
#define warden_static_err(...) \
  warden::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                             "", (LOG_ERR), __VA_ARGS__)
#define warden_static_crit(...) \
  warden::common::Logging::GetInstance().log(__FUNCTION__,__FILE__, __LINE__, "static..............................", \
                                             "", (LOG_CRIT), __VA_ARGS__)

//------------------------------------------------------------------------------
//! Log Macros to check if a function would log in a certain log level
//------------------------------------------------------------------------------
#define WARDEN_LOGS_DEBUG   warden::common::Logging::GetInstance().shouldlog(__FUNCTION__,(LOG_DEBUG)  )
#define WARDEN_LOGS_INFO    warden::common::Logging::GetInstance().shouldlog(__FUNCTION__,(LOG_INFO)   )
#define WARDEN_LOGS_WARNING warden::common::Logging::GetInstance().shouldlog(__FUNCTION__,(LOG_WARNING))

//------------------------------------------------------------------------------
//! Class carrying the log identifier of an object
//------------------------------------------------------------------------------
class LogId
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  LogId()
  {
    uuid_t uuid;
    uuid_generate_time(uuid);
    uuid_unparse(uuid, logId);
    snprintf(cident, sizeof(cident), "<service>");
  }

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  virtual ~LogId() = default;

  //----------------------------------------------------------------------------
  //! Generate log id value
  //----------------------------------------------------------------------------
  static std::string GenerateLogId()
  {
    char log_id[40];
    uuid_t uuid;
    uuid_generate_time(uuid);
    uuid_unparse(uuid, log_id);
    return log_id;
  }

  //----------------------------------------------------------------------------
  //! Set the logid and the client identifier
  //----------------------------------------------------------------------------
  void
  SetLogId(const char* newlogid, const char* td = nullptr)
  {
    if (newlogid && (newlogid != logId)) {
      snprintf(logId, sizeof(logId), "%s", newlogid);
    }

    if (td) {
      snprintf(cident, sizeof(cident), "%s", td);
    }
  }

  char logId[40]; //< the log Id for message printout
  char cident[256]; //< the client identifier
};

//------------------------------------------------------------------------------
//! Class wrapping the global logging singleton
//------------------------------------------------------------------------------
class Logging
{
public:
  //----------------------------------------------------------------------------
  //! Get singleton instance
  //----------------------------------------------------------------------------
  static Logging& GetInstance();

  //----------------------------------------------------------------------------
  //! Get current log mask
  //----------------------------------------------------------------------------
  int
  GetLogMask() const
  {
    return mLogMask;
  }

  //----------------------------------------------------------------------------
  //! Set the log priority (like syslog)
  //----------------------------------------------------------------------------
  void
  SetLogPriority(int pri)
  {
    mLogMask = LOG_UPTO(pri);
    mPriorityLevel = pri;
  }

  //----------------------------------------------------------------------------
  //! Get the current log priority
  //----------------------------------------------------------------------------
  int
  GetLogPriority() const
  {
    return mPriorityLevel;
  }

  //----------------------------------------------------------------------------
  //! Set the log unit name
  //----------------------------------------------------------------------------
  void
  SetUnit(const char* unit)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mUnit = unit;
  }

  //----------------------------------------------------------------------------
  //! Duplicate all messages into syslog
  //----------------------------------------------------------------------------
  void
  SetSysLog(bool onoff)
  {
    mToSysLog = onoff;
  }

  //----------------------------------------------------------------------------
  //! Switch between the short and the long output format
  //----------------------------------------------------------------------------
  void
  SetShortFormat(bool onoff)
  {
    mShortFormat = onoff;
  }

  //----------------------------------------------------------------------------
  //! Redirect the output stream, nullptr restores stderr
  //----------------------------------------------------------------------------
  void
  SetOutput(FILE* fd)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mOutput = fd;
  }

  //----------------------------------------------------------------------------
  //! Set the function name filter. A 'PASS:' prefix turns the list into an
  //! allow list, otherwise it is a deny list.
  //!
  //! @param filter comma separated list of function names
  //----------------------------------------------------------------------------
  void SetFilter(const char* filter);

  //----------------------------------------------------------------------------
  //! Return priority as string
  //----------------------------------------------------------------------------
  static const char* GetPriorityString(int pri);

  //----------------------------------------------------------------------------
  //! Return priority int from string
  //----------------------------------------------------------------------------
  static int GetPriorityByString(const char* pri);

  //----------------------------------------------------------------------------
  //! Check if we should log in the defined level/filter
  //!
  //! @param func name of the calling function
  //! @param priority priority level of the message
  //----------------------------------------------------------------------------
  bool shouldlog(const char* func, int priority);

  //----------------------------------------------------------------------------
  //! Log a message
  //!
  //! @param func name of the calling function
  //! @param file name of the source file calling
  //! @param line line in the source file
  //! @param logid log message identifier
  //! @param cident client identifier
  //! @param priority priority level of the message
  //! @param msg the actual log message
  //!
  //! @return pointer to the formatted message
  //----------------------------------------------------------------------------
  const char* log(const char* func, const char* file, int line,
                  const char* logid, const char* cident, int priority,
                  const char* msg, ...) __attribute__((format(printf, 8, 9)));

private:
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  Logging();

  Logging(const Logging&) = delete;
  Logging& operator=(const Logging&) = delete;

  int mLogMask; ///< log mask
  int mPriorityLevel; ///< log priority
  bool mToSysLog; ///< duplicate into syslog
  bool mShortFormat; ///< short log-output format
  std::mutex mMutex; ///< protects unit, filters and output
  std::string mUnit; ///< global unit name
  std::set<std::string> mAllowFilter; ///< function names allowed to log
  std::set<std::string> mDenyFilter; ///< function names denied to log
  FILE* mOutput; ///< output stream, stderr if null
};

WARDENCOMMONNAMESPACE_END

#endif
