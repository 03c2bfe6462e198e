//------------------------------------------------------------------------------
// File: RWMutex.hh
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

//------------------------------------------------------------------------------
//! @brief Class implementing a read-write mutex with scoped lock helpers.
//!
//! @description Locks held for longer than the configured blocked interval
//! are reported through the logging facility together with the caller
//! function and source line which acquired them.
//------------------------------------------------------------------------------

#pragma once
#include "common/Namespace.hh"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <shared_mutex>
#include <string>

WARDENCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Class RWMutex
//------------------------------------------------------------------------------
class RWMutex
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  RWMutex();

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  ~RWMutex() = default;

  RWMutex(const RWMutex&) = delete;
  RWMutex& operator=(const RWMutex&) = delete;

  //----------------------------------------------------------------------------
  //! Set the mutex name used in blocking reports
  //----------------------------------------------------------------------------
  void SetName(const std::string& name)
  {
    mName = name;
  }

  //----------------------------------------------------------------------------
  //! Get the mutex name
  //----------------------------------------------------------------------------
  const std::string& GetName() const
  {
    return mName;
  }

  //----------------------------------------------------------------------------
  //! Set interval in ms after which a held lock is reported, 0 disables it
  //----------------------------------------------------------------------------
  void SetBlockedForMsInterval(int64_t ms)
  {
    mBlockedForInterval = ms;
  }

  //----------------------------------------------------------------------------
  //! Get the blocked interval in ms
  //----------------------------------------------------------------------------
  int64_t BlockedForMsInterval() const
  {
    return mBlockedForInterval;
  }

  //----------------------------------------------------------------------------
  //! Lock for read
  //----------------------------------------------------------------------------
  void LockRead();

  //----------------------------------------------------------------------------
  //! Unlock a read lock
  //----------------------------------------------------------------------------
  void UnLockRead();

  //----------------------------------------------------------------------------
  //! Try to read lock the mutex within the timeout
  //!
  //! @param timeout_ns nano seconds timeout
  //!
  //! @return true if lock acquired successfully, otherwise false
  //----------------------------------------------------------------------------
  bool TimedRdLock(uint64_t timeout_ns);

  //----------------------------------------------------------------------------
  //! Lock for write
  //----------------------------------------------------------------------------
  void LockWrite();

  //----------------------------------------------------------------------------
  //! Unlock a write lock
  //----------------------------------------------------------------------------
  void UnLockWrite();

  //----------------------------------------------------------------------------
  //! Try to write lock the mutex within the timeout
  //!
  //! @param timeout_ns nano seconds timeout
  //!
  //! @return true if lock acquired successfully, otherwise false
  //----------------------------------------------------------------------------
  bool TimedWrLock(uint64_t timeout_ns);

  //----------------------------------------------------------------------------
  //! Report a lock held longer than the blocked interval
  //----------------------------------------------------------------------------
  void ReportBlocking(const char* function, const char* file, int line,
                      std::chrono::steady_clock::time_point acquired_at,
                      bool write) const;

private:
  std::shared_timed_mutex mMutex;
  std::string mName;
  std::atomic<int64_t> mBlockedForInterval; ///< ms, 0 means no reporting
};

#define WARDEN_FUNCTION __builtin_FUNCTION()
#define WARDEN_FILE     __builtin_FILE()
#define WARDEN_LINE     __builtin_LINE()

//------------------------------------------------------------------------------
//! Class RWMutexWriteLock
//------------------------------------------------------------------------------
class RWMutexWriteLock
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  RWMutexWriteLock():
    mWrMutex(nullptr), mFunction("unknown"), mFile("unknown"), mLine(0)
  {}

  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param mutex mutex to lock for write
  //! @param function caller function name
  //! @param file caller file name
  //! @param line caller line number in file
  //----------------------------------------------------------------------------
  RWMutexWriteLock(RWMutex& mutex,
                   const char* function = WARDEN_FUNCTION,
                   const char* file = WARDEN_FILE,
                   int line = WARDEN_LINE);

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  ~RWMutexWriteLock()
  {
    Release();
  }

  RWMutexWriteLock(const RWMutexWriteLock&) = delete;
  RWMutexWriteLock& operator=(const RWMutexWriteLock&) = delete;

  //----------------------------------------------------------------------------
  //! Grab mutex and write lock it
  //----------------------------------------------------------------------------
  void Grab(RWMutex& mutex,
            const char* function = WARDEN_FUNCTION,
            const char* file = WARDEN_FILE,
            int line = WARDEN_LINE);

  //----------------------------------------------------------------------------
  //! Release the write lock after grab
  //----------------------------------------------------------------------------
  void Release();

private:
  std::chrono::steady_clock::time_point mAcquiredAt;
  RWMutex* mWrMutex {nullptr};
  const char* mFunction;
  const char* mFile;
  int mLine;
};

//------------------------------------------------------------------------------
//! Class RWMutexReadLock
//------------------------------------------------------------------------------
class RWMutexReadLock
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  RWMutexReadLock():
    mRdMutex(nullptr), mFunction("unknown"), mFile("unknown"), mLine(0)
  {}

  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param mutex mutex to lock for read
  //! @param function caller function name
  //! @param file caller file name
  //! @param line caller line number in file
  //----------------------------------------------------------------------------
  RWMutexReadLock(RWMutex& mutex,
                  const char* function = WARDEN_FUNCTION,
                  const char* file = WARDEN_FILE,
                  int line = WARDEN_LINE);

  //----------------------------------------------------------------------------
  //! Grab mutex and read lock it
  //----------------------------------------------------------------------------
  void Grab(RWMutex& mutex,
            const char* function = WARDEN_FUNCTION,
            const char* file = WARDEN_FILE,
            int line = WARDEN_LINE);

  //----------------------------------------------------------------------------
  //! Release the read lock after grab
  //----------------------------------------------------------------------------
  void Release();

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  ~RWMutexReadLock()
  {
    Release();
  }

  RWMutexReadLock(const RWMutexReadLock&) = delete;
  RWMutexReadLock& operator=(const RWMutexReadLock&) = delete;

private:
  std::chrono::steady_clock::time_point mAcquiredAt;
  RWMutex* mRdMutex {nullptr};
  const char* mFunction;
  const char* mFile;
  int mLine;
};

WARDENCOMMONNAMESPACE_END
