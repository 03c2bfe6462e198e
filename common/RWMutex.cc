//------------------------------------------------------------------------------
// File: RWMutex.cc
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

#include "common/RWMutex.hh"
#include "common/Logging.hh"
#include <stdexcept>

WARDENCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
RWMutex::RWMutex():
  mName("unnamed"), mBlockedForInterval(0)
{}

//------------------------------------------------------------------------------
// Lock for read
//------------------------------------------------------------------------------
void
RWMutex::LockRead()
{
  mMutex.lock_shared();
}

//------------------------------------------------------------------------------
// Unlock a read lock
//------------------------------------------------------------------------------
void
RWMutex::UnLockRead()
{
  mMutex.unlock_shared();
}

//------------------------------------------------------------------------------
// Try to read lock the mutex within the timeout
//------------------------------------------------------------------------------
bool
RWMutex::TimedRdLock(uint64_t timeout_ns)
{
  return mMutex.try_lock_shared_for(std::chrono::nanoseconds(timeout_ns));
}

//------------------------------------------------------------------------------
// Lock for write
//------------------------------------------------------------------------------
void
RWMutex::LockWrite()
{
  mMutex.lock();
}

//------------------------------------------------------------------------------
// Unlock a write lock
//------------------------------------------------------------------------------
void
RWMutex::UnLockWrite()
{
  mMutex.unlock();
}

//------------------------------------------------------------------------------
// Try to write lock the mutex within the timeout
//------------------------------------------------------------------------------
bool
RWMutex::TimedWrLock(uint64_t timeout_ns)
{
  return mMutex.try_lock_for(std::chrono::nanoseconds(timeout_ns));
}

//------------------------------------------------------------------------------
// Report a lock held longer than the blocked interval
//------------------------------------------------------------------------------
void
RWMutex::ReportBlocking(const char* function, const char* file, int line,
                        std::chrono::steady_clock::time_point acquired_at,
                        bool write) const
{
  int64_t interval = mBlockedForInterval;

  if (interval == 0) {
    return;
  }

  int64_t held_ms = std::chrono::duration_cast<std::chrono::milliseconds>
                    (std::chrono::steady_clock::now() - acquired_at).count();

  if (held_ms >= interval) {
    warden_static_warning("msg=\"mutex held too long\" mutex=%s type=%s "
                          "held_ms=%lld caller=%s file=%s line=%d",
                          mName.c_str(), (write ? "write" : "read"),
                          (long long) held_ms, function, file, line);
  }
}

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
RWMutexWriteLock::RWMutexWriteLock(RWMutex& mutex, const char* function,
                                   const char* file, int line):
  mWrMutex(nullptr), mFunction(function), mFile(file), mLine(line)
{
  Grab(mutex, function, file, line);
}

//------------------------------------------------------------------------------
// Grab mutex and write lock it
//------------------------------------------------------------------------------
void
RWMutexWriteLock::Grab(RWMutex& mutex, const char* function,
                       const char* file, int line)
{
  if (mWrMutex) {
    throw std::runtime_error("already holding a mutex");
  }

  mWrMutex = &mutex;
  mFunction = function;
  mFile = file;
  mLine = line;
  mWrMutex->LockWrite();
  mAcquiredAt = std::chrono::steady_clock::now();
}

//------------------------------------------------------------------------------
// Release the write lock after grab
//------------------------------------------------------------------------------
void
RWMutexWriteLock::Release()
{
  if (mWrMutex) {
    mWrMutex->UnLockWrite();
    mWrMutex->ReportBlocking(mFunction, mFile, mLine, mAcquiredAt, true);
    mWrMutex = nullptr;
  }
}

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
RWMutexReadLock::RWMutexReadLock(RWMutex& mutex, const char* function,
                                 const char* file, int line):
  mRdMutex(nullptr), mFunction(function), mFile(file), mLine(line)
{
  Grab(mutex, function, file, line);
}

//------------------------------------------------------------------------------
// Grab mutex and read lock it
//------------------------------------------------------------------------------
void
RWMutexReadLock::Grab(RWMutex& mutex, const char* function,
                      const char* file, int line)
{
  if (mRdMutex) {
    throw std::runtime_error("already holding a mutex");
  }

  mRdMutex = &mutex;
  mFunction = function;
  mFile = file;
  mLine = line;
  mRdMutex->LockRead();
  mAcquiredAt = std::chrono::steady_clock::now();
}

//------------------------------------------------------------------------------
// Release the read lock after grab
//------------------------------------------------------------------------------
void
RWMutexReadLock::Release()
{
  if (mRdMutex) {
    mRdMutex->UnLockRead();
    mRdMutex->ReportBlocking(mFunction, mFile, mLine, mAcquiredAt, false);
    mRdMutex = nullptr;
  }
}

WARDENCOMMONNAMESPACE_END
