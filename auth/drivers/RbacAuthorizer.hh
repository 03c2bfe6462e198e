//------------------------------------------------------------------------------
// File: RbacAuthorizer.hh
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
#include "auth/CommonAuthorizer.hh"
#include "auth/drivers/TlsAuthorizer.hh"
#include "auth/rbac/HttpClient.hh"
#include "common/AssistedThread.hh"
#include "common/RWMutex.hh"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

WARDENAUTHNAMESPACE_BEGIN

//! Configuration keys of the rbac driver
static constexpr auto RBAC_API_URL = "rbac.api.url";
static constexpr auto RBAC_API_TOKEN = "rbac.api.token";
static constexpr auto RBAC_API_TIMEOUT = "rbac.api.timeout";
static constexpr auto RBAC_SYNC_RETRY_INTERVAL = "rbac.sync.retry_interval";
static constexpr auto RBAC_CHANGES_RETRY_INTERVAL = "rbac.changes.retry_interval";

//------------------------------------------------------------------------------
//! Project resource as registered with the policy server
//------------------------------------------------------------------------------
struct RbacResource {
  std::string identifier;
  std::string name;
};

//------------------------------------------------------------------------------
//! @brief Authorization delegated to a remote policy server
//!
//! @description The projects are registered with the policy server as
//! resources identified by their database id. The permissions of a user are
//! fetched on first use and cached until the server reports a change through
//! its long-poll change feed, in which case the whole cache is flushed.
//! Callers authenticated with TLS are handled by an embedded tls driver.
//!
//! Two background threads run while the driver is loaded: one retrying the
//! initial full project sync until it succeeds and one following the change
//! feed. Both are stopped by StopService.
//------------------------------------------------------------------------------
class RbacAuthorizer : public CommonAuthorizer
{
public:
  enum class SyncState {
    Unsynced,
    Syncing,
    Synced
  };

  //! project name -> permissions, the empty name holds server permissions
  typedef std::map<std::string, std::set<std::string>> ProjectPermissions;

  //----------------------------------------------------------------------------
  //! Constructor using a libcurl transport created on Load
  //----------------------------------------------------------------------------
  RbacAuthorizer();

  //----------------------------------------------------------------------------
  //! Constructor with a given transport
  //----------------------------------------------------------------------------
  explicit RbacAuthorizer(std::shared_ptr<IHttpClient> client);

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  virtual ~RbacAuthorizer();

  //----------------------------------------------------------------------------
  //! Configure the driver and start the background threads
  //----------------------------------------------------------------------------
  warden::common::Status Load(const Opts& opts) override;

  //----------------------------------------------------------------------------
  //! Stop the background threads and abort in-flight requests
  //----------------------------------------------------------------------------
  warden::common::Status StopService() override;

  using CommonAuthorizer::CheckPermission;

  warden::common::Status
  CheckPermission(const RequestDetails& details, const Object& object,
                  Relation relation) override;

  warden::common::Status AddProject(int64_t projectId,
                                    const std::string& name) override;
  warden::common::Status DeleteProject(int64_t projectId,
                                       const std::string& name) override;
  warden::common::Status RenameProject(int64_t projectId,
                                       const std::string& oldName,
                                       const std::string& newName) override;

  //----------------------------------------------------------------------------
  //! Register resource updates and removals with the policy server
  //!
  //! @param updates resources to add or rename
  //! @param removals identifiers of the resources to remove
  //! @param force replace the complete resource list on the server
  //!
  //! A non forced post without a previous sync token triggers a full sync
  //! instead, a sync token conflict triggers exactly one full sync.
  //----------------------------------------------------------------------------
  warden::common::Status PostResources(const std::vector<RbacResource>& updates,
                                       const std::vector<std::string>& removals,
                                       bool force);

  //----------------------------------------------------------------------------
  //! Register all existing projects with the policy server
  //----------------------------------------------------------------------------
  warden::common::Status SyncProjects();

  //----------------------------------------------------------------------------
  //! Fetch the permissions of a user and replace its cache entry
  //----------------------------------------------------------------------------
  warden::common::Status SyncPermissions(const std::string& username);

  //----------------------------------------------------------------------------
  //! Drop all cached permissions
  //----------------------------------------------------------------------------
  void FlushCache();

  bool HasCachedPermissions(const std::string& username);

  SyncState GetSyncState() const
  {
    return mSyncState.load();
  }

  static const char* SyncStateToString(SyncState state);

  std::string GetLastSyncId();

  std::string GetLastChange();

  //----------------------------------------------------------------------------
  //! Identifier registered for a project, empty if unknown
  //----------------------------------------------------------------------------
  std::string GetResourceId(const std::string& projectName);

protected:
  warden::common::Status
  BuildPermissionChecker(const RequestDetails& details, Relation relation,
                         ObjectType type,
                         std::unique_ptr<PermissionChecker>& checker) override;

private:
  //----------------------------------------------------------------------------
  //! Fetch the permissions of a user from the policy server
  //!
  //! @param username user name
  //! @param known set to false if the server does not know the user
  //! @param perms permissions re-keyed by project name
  //----------------------------------------------------------------------------
  warden::common::Status FetchPermissions(const std::string& username,
                                          bool& known,
                                          ProjectPermissions& perms);

  //----------------------------------------------------------------------------
  //! Check the server wide admin permission of a user, false on any error
  //!
  //! @param username user name
  //! @param escapedUser user name escaped for the query string
  //----------------------------------------------------------------------------
  bool FetchAdmin(const std::string& username, const std::string& escapedUser);

  //----------------------------------------------------------------------------
  //! Get the permissions of a user from the cache or the policy server
  //----------------------------------------------------------------------------
  warden::common::Status GetUserPermissions(const std::string& username,
      bool& known, ProjectPermissions& perms);

  //----------------------------------------------------------------------------
  //! Retry the full project sync until it succeeds
  //----------------------------------------------------------------------------
  void FullSyncLoop(warden::common::ThreadAssistant& assistant) noexcept;

  //----------------------------------------------------------------------------
  //! Follow the change feed of the policy server
  //----------------------------------------------------------------------------
  void PollChanges(warden::common::ThreadAssistant& assistant) noexcept;

  //! Options of the synchronous requests
  HttpRequestOptions SyncRequestOptions() const;

  std::shared_ptr<IHttpClient> mHttpClient;
  std::string mApiUrl;
  long mApiTimeout;
  std::chrono::seconds mSyncRetryInterval;
  std::chrono::seconds mChangesRetryInterval;
  ProjectsGetFunc mProjectsGetFunc;
  TlsAuthorizer mTls;
  bool mTlsLoaded;
  std::atomic<SyncState> mSyncState;
  std::atomic<bool> mAbort;
  std::mutex mTokenMutex; ///< protects the sync token and the last change
  std::string mLastSyncId;
  std::string mLastChange;
  warden::common::RWMutex mResourcesMutex;
  std::map<std::string, std::string> mResources; ///< name -> identifier
  warden::common::RWMutex mPermissionsMutex;
  std::map<std::string, ProjectPermissions> mPermissions;
  std::atomic<uint64_t> mCacheGeneration; ///< bumped by every cache flush
  warden::common::AssistedThread mSyncThread;
  warden::common::AssistedThread mChangesThread;
};

WARDENAUTHNAMESPACE_END
