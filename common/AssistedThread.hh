//------------------------------------------------------------------------------
// File: AssistedThread.hh
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

#pragma once
#include "common/Namespace.hh"
#include <pthread.h>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

WARDENCOMMONNAMESPACE_BEGIN

//------------------------------------------------------------------------------
// Background thread which can be asked to stop at any time.
//
// The thread function receives a ThreadAssistant as one extra parameter at
// the end, for example:
//
// void Watcher::Loop(ThreadAssistant& assistant)
// {
//   while (!assistant.terminationRequested()) {
//     Poll();
//     assistant.wait_for(std::chrono::seconds(5));
//   }
// }
//
// wait_for returns the moment termination is requested. Work which blocks
// elsewhere (a network transfer for example) can be interrupted through a
// callback registered with registerCallback.
//------------------------------------------------------------------------------
class AssistedThread;

//------------------------------------------------------------------------------
//! Class ThreadAssistant
//------------------------------------------------------------------------------
class ThreadAssistant
{
public:
  void reset()
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mStopFlag = false;
    mCallbacks.clear();
  }

  void requestTermination()
  {
    std::lock_guard<std::mutex> lock(mMutex);

    if (!mStopFlag) {
      mStopFlag = true;
      mNotifier.notify_all();

      for (auto& callback : mCallbacks) {
        callback();
      }
    }
  }

  //----------------------------------------------------------------------------
  //! Register a callback executed when termination is requested. If the
  //! request already happened the callback runs immediately.
  //----------------------------------------------------------------------------
  void registerCallback(std::function<void()> callable)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mCallbacks.emplace_back(std::move(callable));

    if (mStopFlag) {
      (mCallbacks.back())();
    }
  }

  bool terminationRequested() const
  {
    return mStopFlag;
  }

  template<typename T>
  void wait_for(T duration)
  {
    std::unique_lock<std::mutex> lock(mMutex);

    if (mStopFlag) {
      return;
    }

    mNotifier.wait_for(lock, duration, [this]() {
      return mStopFlag.load();
    });
  }

private:
  friend class AssistedThread;
  // Only AssistedThread can create such an object
  explicit ThreadAssistant(bool flag) : mStopFlag(flag) {}

  std::atomic<bool> mStopFlag;
  std::mutex mMutex;
  std::condition_variable mNotifier;
  std::vector<std::function<void()>> mCallbacks;
};

//------------------------------------------------------------------------------
//! Class AssistedThread
//------------------------------------------------------------------------------
class AssistedThread
{
public:
  //----------------------------------------------------------------------------
  //! Null constructor, no underlying thread
  //----------------------------------------------------------------------------
  AssistedThread() :
    mAssistant(new ThreadAssistant(true)), mJoined(true)
  {}

  //----------------------------------------------------------------------------
  //! Constructor starting the thread, same arguments as std::thread
  //----------------------------------------------------------------------------
  template<typename... Args>
  explicit AssistedThread(Args&& ... args) :
    mAssistant(new ThreadAssistant(false)), mJoined(false),
    mThread(std::forward<Args>(args)..., std::ref(*mAssistant))
  {}

  AssistedThread(const AssistedThread&) = delete;
  AssistedThread& operator=(const AssistedThread&) = delete;

  //----------------------------------------------------------------------------
  //! (Re)start the thread, joining any previous one
  //----------------------------------------------------------------------------
  template<typename... Args>
  void reset(Args&& ... args)
  {
    join();
    mAssistant->reset();
    mJoined = false;
    mThread = std::thread(std::forward<Args>(args)..., std::ref(*mAssistant));
  }

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  virtual ~AssistedThread()
  {
    join();
  }

  //----------------------------------------------------------------------------
  //! Ask the thread to terminate without waiting for it
  //----------------------------------------------------------------------------
  void stop()
  {
    if (mJoined) {
      return;
    }

    mAssistant->requestTermination();
  }

  //----------------------------------------------------------------------------
  //! Ask the thread to terminate and wait for it
  //----------------------------------------------------------------------------
  void join()
  {
    if (mJoined) {
      return;
    }

    stop();
    mThread.join();
    mJoined = true;
  }

  void registerCallback(std::function<void()> callable)
  {
    mAssistant->registerCallback(std::move(callable));
  }

  //----------------------------------------------------------------------------
  //! Set thread name, visible in GDB traces
  //----------------------------------------------------------------------------
  void setName(const std::string& threadName)
  {
    pthread_setname_np(mThread.native_handle(), threadName.substr(0, 15).c_str());
  }

private:
  std::unique_ptr<ThreadAssistant> mAssistant;
  bool mJoined;
  std::thread mThread;
};

WARDENCOMMONNAMESPACE_END
