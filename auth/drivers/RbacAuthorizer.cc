//------------------------------------------------------------------------------
// File: RbacAuthorizer.cc
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

#include "auth/drivers/RbacAuthorizer.hh"
#include "auth/Errors.hh"
#include "auth/rbac/RbacPermission.hh"
#include "common/StringConversion.hh"
#include <json/json.h>
#include <cerrno>
#include <sstream>

WARDENAUTHNAMESPACE_BEGIN

using warden::common::RWMutexReadLock;
using warden::common::RWMutexWriteLock;
using warden::common::Status;
using warden::common::StringConversion;
using warden::common::ThreadAssistant;

namespace
{
static constexpr auto RESOURCES_PATH = "/api/service/v1/resources/project";
static constexpr auto PROJECT_PERMISSIONS_PATH =
  "/api/service/v1/resources/project/permissions-for-user";
static constexpr auto SERVER_PERMISSIONS_PATH =
  "/api/service/v1/resources/lxd/permissions-for-user";
static constexpr auto CHANGES_PATH = "/api/service/v1/changes";

const long sDefaultApiTimeout = 30;
const long sDefaultSyncRetryInterval = 60;
const long sDefaultChangesRetryInterval = 5;
//! Report locks held longer than this
const int64_t sBlockedForMsInterval = 1000;

//------------------------------------------------------------------------------
// Read a number of seconds from the driver configuration
//------------------------------------------------------------------------------
Status
GetSeconds(const std::map<std::string, std::string>& config,
           const std::string& key, long default_value, long& value)
{
  auto it = config.find(key);

  if ((it == config.end()) || it->second.empty()) {
    value = default_value;
    return Status();
  }

  uint64_t parsed = 0;

  if (!StringConversion::GetSizeFromString(it->second, parsed)) {
    return ConfigurationError(SSTR("Invalid value \"" << it->second
                                   << "\" for " << key));
  }

  value = (long) parsed;
  return Status();
}

//------------------------------------------------------------------------------
// Parse a JSON document
//------------------------------------------------------------------------------
bool
ParseJson(const std::string& data, Json::Value& root, std::string& errs)
{
  Json::CharReaderBuilder builder;
  std::istringstream iss(data);
  return Json::parseFromStream(builder, iss, &root, &errs);
}

//------------------------------------------------------------------------------
// Check if a permission is granted on a project
//------------------------------------------------------------------------------
bool
HasPermission(const RbacAuthorizer::ProjectPermissions& perms,
              const std::string& project, RbacPermission permission)
{
  auto it = perms.find(project);
  return ((it != perms.end()) &&
          it->second.count(RbacPermissionToString(permission)));
}

//------------------------------------------------------------------------------
// Checker evaluating a snapshot of the permissions of a user
//------------------------------------------------------------------------------
class RbacPermissionChecker : public PermissionChecker
{
public:
  RbacPermissionChecker(RbacAuthorizer::ProjectPermissions perms,
                        Relation relation) :
    mPermissions(std::move(perms)), mRelation(relation) {}

  bool Allows(const Object& object) const override
  {
    RbacPermission permission;
    Status st = RelationToPermission(object.Type(), mRelation, permission);

    if (!st.ok()) {
      warden_static_err("msg=\"could not convert object and relation to RBAC "
                        "permission\" object=\"%s\" relation=%s err=\"%s\"",
                        object.String().c_str(), RelationToString(mRelation),
                        st.getMsg().c_str());
      return false;
    }

    return HasPermission(mPermissions, object.Project(), permission);
  }

private:
  RbacAuthorizer::ProjectPermissions mPermissions;
  Relation mRelation;
};
}

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
RbacAuthorizer::RbacAuthorizer():
  RbacAuthorizer(nullptr)
{}

//------------------------------------------------------------------------------
// Constructor with a given transport
//------------------------------------------------------------------------------
RbacAuthorizer::RbacAuthorizer(std::shared_ptr<IHttpClient> client):
  mHttpClient(client), mApiTimeout(sDefaultApiTimeout),
  mSyncRetryInterval(sDefaultSyncRetryInterval),
  mChangesRetryInterval(sDefaultChangesRetryInterval), mTlsLoaded(false),
  mSyncState(SyncState::Unsynced), mAbort(false), mCacheGeneration(0)
{
  mResourcesMutex.SetName("RbacResources");
  mResourcesMutex.SetBlockedForMsInterval(sBlockedForMsInterval);
  mPermissionsMutex.SetName("RbacPermissions");
  mPermissionsMutex.SetBlockedForMsInterval(sBlockedForMsInterval);
}

//------------------------------------------------------------------------------
// Destructor
//------------------------------------------------------------------------------
RbacAuthorizer::~RbacAuthorizer()
{
  (void) StopService();
}

//------------------------------------------------------------------------------
// Sync state to string
//------------------------------------------------------------------------------
const char*
RbacAuthorizer::SyncStateToString(SyncState state)
{
  switch (state) {
  case SyncState::Unsynced:
    return "unsynced";

  case SyncState::Syncing:
    return "syncing";

  case SyncState::Synced:
    return "synced";
  }

  return "unknown";
}

//------------------------------------------------------------------------------
// Configure the driver and start the background threads
//------------------------------------------------------------------------------
Status
RbacAuthorizer::Load(const Opts& opts)
{
  auto it = opts.config.find(RBAC_API_URL);

  if ((it == opts.config.end()) || it->second.empty()) {
    return ConfigurationError(SSTR("Missing " << RBAC_API_URL));
  }

  mApiUrl = it->second;

  while (!mApiUrl.empty() && (mApiUrl.back() == '/')) {
    mApiUrl.pop_back();
  }

  if (!opts.projectsGetFunc) {
    return ConfigurationError("Missing projects hook for RBAC driver");
  }

  mProjectsGetFunc = opts.projectsGetFunc;
  long sync_retry = 0;
  long changes_retry = 0;
  Status st = GetSeconds(opts.config, RBAC_API_TIMEOUT, sDefaultApiTimeout,
                         mApiTimeout);

  if (st.ok()) {
    st = GetSeconds(opts.config, RBAC_SYNC_RETRY_INTERVAL,
                    sDefaultSyncRetryInterval, sync_retry);
  }

  if (st.ok()) {
    st = GetSeconds(opts.config, RBAC_CHANGES_RETRY_INTERVAL,
                    sDefaultChangesRetryInterval, changes_retry);
  }

  if (!st.ok()) {
    return st;
  }

  mSyncRetryInterval = std::chrono::seconds(sync_retry);
  mChangesRetryInterval = std::chrono::seconds(changes_retry);

  if (!mHttpClient) {
    auto it_token = opts.config.find(RBAC_API_TOKEN);
    mHttpClient = std::make_shared<CurlHttpClient>
                  (it_token == opts.config.end() ? "" : it_token->second);
  }

  // callers authenticated by certificate follow the certificate restrictions
  if (opts.certificateCache) {
    st = mTls.Init(DRIVER_TLS);

    if (st.ok()) {
      st = mTls.Load(opts);
    }

    if (!st.ok()) {
      return st;
    }

    mTlsLoaded = true;
  }

  mAbort = false;
  mSyncThread.reset(&RbacAuthorizer::FullSyncLoop, this);
  mSyncThread.setName("RbacFullSync");
  mChangesThread.reset(&RbacAuthorizer::PollChanges, this);
  mChangesThread.setName("RbacChanges");
  warden_info("msg=\"loaded RBAC driver\" url=\"%s\" timeout_sec=%ld",
              mApiUrl.c_str(), mApiTimeout);
  return Status();
}

//------------------------------------------------------------------------------
// Stop the background threads
//------------------------------------------------------------------------------
Status
RbacAuthorizer::StopService()
{
  mAbort = true;
  mSyncThread.stop();
  mChangesThread.stop();
  mSyncThread.join();
  mChangesThread.join();
  return Status();
}

//------------------------------------------------------------------------------
// Options of the synchronous requests
//------------------------------------------------------------------------------
HttpRequestOptions
RbacAuthorizer::SyncRequestOptions() const
{
  HttpRequestOptions opts;
  opts.timeoutSec = mApiTimeout;
  opts.abortFlag = &mAbort;
  return opts;
}

//------------------------------------------------------------------------------
// Check a relation on an object
//------------------------------------------------------------------------------
Status
RbacAuthorizer::CheckPermission(const RequestDetails& details,
                                const Object& object, Relation relation)
{
  if (details.isInternalOrUnix) {
    return Status();
  }

  if (details.authenticationProtocol == AUTH_METHOD_TLS) {
    if (!mTlsLoaded) {
      return ConfigurationError("RBAC driver has no certificate cache for "
                                "TLS authenticated callers");
    }

    return mTls.CheckPermission(details, object, relation);
  }

  bool known = false;
  ProjectPermissions perms;
  Status st = GetUserPermissions(details.username, known, perms);

  if (!st.ok()) {
    return st;
  }

  if (!known) {
    return ForbiddenError("Unknown RBAC user");
  }

  if (HasPermission(perms, "", RbacPermission::Admin)) {
    return Status();
  }

  if (details.isAllProjectsRequest) {
    return ForbiddenError("User is not an administrator");
  }

  bool allowed = false;

  if (CheckNonProjectType(object.Type(), relation, allowed)) {
    return (allowed ? Status() : ForbiddenError("User is not an administrator"));
  }

  RbacPermission permission;
  st = RelationToPermission(object.Type(), relation, permission);

  if (!st.ok()) {
    return st;
  }

  if (!HasPermission(perms, object.Project(), permission)) {
    return ForbiddenError(SSTR("User \"" << details.username
                               << "\" does not have permission \""
                               << RbacPermissionToString(permission)
                               << "\" on project \"" << object.Project()
                               << "\""));
  }

  return Status();
}

//------------------------------------------------------------------------------
// Get a filter for a listing of objects of the given type
//------------------------------------------------------------------------------
Status
RbacAuthorizer::BuildPermissionChecker(const RequestDetails& details,
                                       Relation relation, ObjectType type,
                                       std::unique_ptr<PermissionChecker>& checker)
{
  if (details.isInternalOrUnix) {
    checker.reset(new StaticPermissionChecker(true));
    return Status();
  }

  if (details.authenticationProtocol == AUTH_METHOD_TLS) {
    if (!mTlsLoaded) {
      return ConfigurationError("RBAC driver has no certificate cache for "
                                "TLS authenticated callers");
    }

    return mTls.GetPermissionChecker(details, relation, type, checker);
  }

  bool known = false;
  ProjectPermissions perms;
  Status st = GetUserPermissions(details.username, known, perms);

  if (!st.ok()) {
    return st;
  }

  if (!known) {
    return ForbiddenError("Unknown RBAC user");
  }

  if (HasPermission(perms, "", RbacPermission::Admin)) {
    checker.reset(new StaticPermissionChecker(true));
    return Status();
  }

  if (details.isAllProjectsRequest) {
    return ForbiddenError("User is not an administrator");
  }

  bool allowed = false;

  if (CheckNonProjectType(type, relation, allowed)) {
    if (!allowed) {
      return ForbiddenError("User is not an administrator");
    }

    checker.reset(new StaticPermissionChecker(true));
    return Status();
  }

  // listing projects filters the result instead of failing
  if ((type != ObjectType::Project) && !perms.count(details.projectName)) {
    return ForbiddenError(SSTR("User does not have permissions for project \""
                               << details.projectName << "\""));
  }

  checker.reset(new RbacPermissionChecker(std::move(perms), relation));
  return Status();
}

//------------------------------------------------------------------------------
// Get the permissions of a user from the cache or the policy server
//------------------------------------------------------------------------------
Status
RbacAuthorizer::GetUserPermissions(const std::string& username, bool& known,
                                   ProjectPermissions& perms)
{
  {
    RWMutexReadLock rd_lock(mPermissionsMutex);
    auto it = mPermissions.find(username);

    if (it != mPermissions.end()) {
      known = true;
      perms = it->second;
      return Status();
    }
  }

  uint64_t generation = mCacheGeneration.load();
  Status st = FetchPermissions(username, known, perms);

  if (!st.ok()) {
    return WrapStatus(st, "Failed to sync user permissions with RBAC server");
  }

  if (known) {
    RWMutexWriteLock wr_lock(mPermissionsMutex);

    // a flush during the fetch invalidates the answer for later decisions
    if (generation == mCacheGeneration.load()) {
      mPermissions[username] = perms;
    } else {
      warden_debug("msg=\"cache flushed during fetch, not caching\" "
                   "user=\"%s\"", username.c_str());
    }
  }

  return Status();
}

//------------------------------------------------------------------------------
// Fetch the permissions of a user and replace its cache entry
//------------------------------------------------------------------------------
Status
RbacAuthorizer::SyncPermissions(const std::string& username)
{
  bool known = false;
  ProjectPermissions perms;
  uint64_t generation = mCacheGeneration.load();
  Status st = FetchPermissions(username, known, perms);

  if (!st.ok()) {
    return st;
  }

  RWMutexWriteLock wr_lock(mPermissionsMutex);

  if (generation != mCacheGeneration.load()) {
    return Status();
  }

  if (known) {
    mPermissions[username] = perms;
  } else {
    mPermissions.erase(username);
  }

  return Status();
}

//------------------------------------------------------------------------------
// Fetch the permissions of a user from the policy server
//------------------------------------------------------------------------------
Status
RbacAuthorizer::FetchPermissions(const std::string& username, bool& known,
                                 ProjectPermissions& perms)
{
  known = false;
  perms.clear();
  std::string user = StringConversion::curl_default_escaped(username);

  if (user.empty() && !username.empty()) {
    return RemoteUnavailableError(SSTR("Failed to escape user name \""
                                       << username << "\""));
  }

  std::string url = mApiUrl + PROJECT_PERMISSIONS_PATH + "?u=" + user;
  HttpResponse response;
  Status st = mHttpClient->Get(url, SyncRequestOptions(), response);

  if (!st.ok()) {
    return RemoteUnavailableError(st.getMsg());
  }

  if (response.code == 404) {
    warden_debug("msg=\"user unknown to RBAC server\" user=\"%s\"",
                 username.c_str());
    return Status();
  }

  if (response.code != 200) {
    return RemoteUnavailableError(SSTR("RBAC server answered permission "
                                       "request with HTTP " << response.code));
  }

  Json::Value root;
  std::string errs;

  if (!ParseJson(response.body, root, errs) || !root.isObject()) {
    return RemoteUnavailableError(SSTR("Failed to parse RBAC permissions: "
                                       << errs));
  }

  std::map<std::string, std::set<std::string>> by_id;

  for (const auto& key : root.getMemberNames()) {
    const Json::Value& list = root[key];

    if (!list.isArray()) {
      return RemoteUnavailableError(SSTR("Invalid RBAC permissions for "
                                         "resource \"" << key << "\""));
    }

    for (const auto& elem : list) {
      if (!elem.isString()) {
        return RemoteUnavailableError(SSTR("Invalid RBAC permission for "
                                           "resource \"" << key << "\""));
      }

      by_id[key].insert(elem.asString());
    }
  }

  if (FetchAdmin(username, user)) {
    by_id[""] = {RbacPermissionToString(RbacPermission::Admin)};
  }

  {
    RWMutexReadLock rd_lock(mResourcesMutex);
    std::map<std::string, std::string> names;

    for (const auto& elem : mResources) {
      names[elem.second] = elem.first;
    }

    for (auto& elem : by_id) {
      if (elem.first.empty()) {
        perms[""] = std::move(elem.second);
        continue;
      }

      auto it = names.find(elem.first);

      // resources not registered by us are ignored
      if (it != names.end()) {
        perms[it->second] = std::move(elem.second);
      }
    }
  }

  known = true;
  return Status();
}

//------------------------------------------------------------------------------
// Check the server wide admin permission of a user
//------------------------------------------------------------------------------
bool
RbacAuthorizer::FetchAdmin(const std::string& username,
                           const std::string& escapedUser)
{
  std::string url = mApiUrl + SERVER_PERMISSIONS_PATH + "?u=" + escapedUser;
  HttpResponse response;
  Status st = mHttpClient->Get(url, SyncRequestOptions(), response);

  if (!st.ok() || (response.code != 200)) {
    warden_warning("msg=\"failed to check server permissions\" user=\"%s\" "
                   "code=%ld err=\"%s\"", username.c_str(), response.code,
                   st.getMsg().c_str());
    return false;
  }

  Json::Value root;
  std::string errs;

  if (!ParseJson(response.body, root, errs) || !root.isObject()) {
    warden_warning("msg=\"failed to parse server permissions\" user=\"%s\" "
                   "err=\"%s\"", username.c_str(), errs.c_str());
    return false;
  }

  const Json::Value& server = root[""];

  if (!server.isArray()) {
    return false;
  }

  for (const auto& elem : server) {
    if (elem.isString() && (elem.asString() == "admin")) {
      return true;
    }
  }

  return false;
}

//------------------------------------------------------------------------------
// Register resource updates and removals with the policy server
//------------------------------------------------------------------------------
Status
RbacAuthorizer::PostResources(const std::vector<RbacResource>& updates,
                              const std::vector<std::string>& removals,
                              bool force)
{
  Json::Value root(Json::objectValue);

  if (force) {
    root["last-sync-id"] = Json::Value(Json::nullValue);
  } else {
    std::string last_sync_id = GetLastSyncId();

    // make sure there is a baseline sync in place
    if (last_sync_id.empty()) {
      return SyncProjects();
    }

    root["last-sync-id"] = last_sync_id;
  }

  if (!updates.empty()) {
    Json::Value json_updates(Json::arrayValue);

    for (const auto& update : updates) {
      Json::Value item(Json::objectValue);
      item["identifier"] = update.identifier;
      item["name"] = update.name;
      json_updates.append(item);
    }

    root["updates"] = json_updates;
  }

  if (!removals.empty()) {
    Json::Value json_removals(Json::arrayValue);

    for (const auto& removal : removals) {
      json_removals.append(removal);
    }

    root["removals"] = json_removals;
  }

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  HttpResponse response;
  Status st = mHttpClient->Post(mApiUrl + RESOURCES_PATH,
                                Json::writeString(builder, root),
                                SyncRequestOptions(), response);

  if (!st.ok()) {
    return RemoteUnavailableError(st.getMsg());
  }

  if (response.code == 409) {
    if (force) {
      return RemoteUnavailableError("RBAC server rejected a full resource "
                                    "sync");
    }

    // sync ids don't match
    warden_info("msg=\"RBAC sync id conflict, forcing full sync\"");
    return SyncProjects();
  }

  if (response.code != 200) {
    return RemoteUnavailableError(SSTR("RBAC server answered resource "
                                       "update with HTTP " << response.code));
  }

  Json::Value reply;
  std::string errs;

  if (!ParseJson(response.body, reply, errs) || !reply.isObject() ||
      !reply["sync-id"].isString()) {
    return RemoteUnavailableError(SSTR("Failed to parse RBAC resource "
                                       "update response: " << errs));
  }

  std::lock_guard<std::mutex> lock(mTokenMutex);
  mLastSyncId = reply["sync-id"].asString();
  return Status();
}

//------------------------------------------------------------------------------
// Register all existing projects with the policy server
//------------------------------------------------------------------------------
Status
RbacAuthorizer::SyncProjects()
{
  if (!mProjectsGetFunc) {
    return ConfigurationError("Projects hook isn't configured, cannot sync");
  }

  mSyncState = SyncState::Syncing;
  std::map<int64_t, std::string> projects;
  Status st = mProjectsGetFunc(projects);

  if (!st.ok()) {
    mSyncState = SyncState::Unsynced;
    return WrapStatus(st, "Failed to enumerate projects");
  }

  std::vector<RbacResource> updates;
  std::map<std::string, std::string> resources;

  for (const auto& project : projects) {
    RbacResource resource;
    resource.identifier = StringConversion::stringify(project.first);
    resource.name = project.second;
    resources[resource.name] = resource.identifier;
    updates.push_back(resource);
  }

  st = PostResources(updates, {}, true);

  if (!st.ok()) {
    mSyncState = SyncState::Unsynced;
    return st;
  }

  {
    RWMutexWriteLock wr_lock(mResourcesMutex);
    mResources.swap(resources);
  }

  mSyncState = SyncState::Synced;
  return Status();
}

//------------------------------------------------------------------------------
// Add a project resource
//------------------------------------------------------------------------------
Status
RbacAuthorizer::AddProject(int64_t projectId, const std::string& name)
{
  RbacResource resource;
  resource.identifier = StringConversion::stringify(projectId);
  resource.name = name;
  Status st = PostResources({resource}, {}, false);

  if (!st.ok()) {
    return st;
  }

  RWMutexWriteLock wr_lock(mResourcesMutex);
  mResources[name] = resource.identifier;
  return Status();
}

//------------------------------------------------------------------------------
// Remove a project resource
//------------------------------------------------------------------------------
Status
RbacAuthorizer::DeleteProject(int64_t projectId, const std::string& name)
{
  std::string id = StringConversion::stringify(projectId);
  Status st = PostResources({}, {id}, false);

  if (!st.ok()) {
    return st;
  }

  RWMutexWriteLock wr_lock(mResourcesMutex);

  for (auto it = mResources.begin(); it != mResources.end(); ++it) {
    if (it->second == id) {
      mResources.erase(it);
      break;
    }
  }

  return Status();
}

//------------------------------------------------------------------------------
// Rename a project resource
//------------------------------------------------------------------------------
Status
RbacAuthorizer::RenameProject(int64_t projectId, const std::string& oldName,
                              const std::string& newName)
{
  RbacResource resource;
  resource.identifier = StringConversion::stringify(projectId);
  resource.name = newName;
  Status st = PostResources({resource}, {}, false);

  if (!st.ok()) {
    return st;
  }

  RWMutexWriteLock wr_lock(mResourcesMutex);
  mResources.erase(oldName);
  mResources[newName] = resource.identifier;
  return Status();
}

//------------------------------------------------------------------------------
// Drop all cached permissions
//------------------------------------------------------------------------------
void
RbacAuthorizer::FlushCache()
{
  RWMutexWriteLock wr_lock(mPermissionsMutex);
  warden_info("msg=\"flushing RBAC permissions cache\" entries=%zu",
              mPermissions.size());
  mPermissions.clear();
  ++mCacheGeneration;
}

bool
RbacAuthorizer::HasCachedPermissions(const std::string& username)
{
  RWMutexReadLock rd_lock(mPermissionsMutex);
  return (mPermissions.count(username) != 0);
}

std::string
RbacAuthorizer::GetLastSyncId()
{
  std::lock_guard<std::mutex> lock(mTokenMutex);
  return mLastSyncId;
}

std::string
RbacAuthorizer::GetLastChange()
{
  std::lock_guard<std::mutex> lock(mTokenMutex);
  return mLastChange;
}

//------------------------------------------------------------------------------
// Identifier registered for a project
//------------------------------------------------------------------------------
std::string
RbacAuthorizer::GetResourceId(const std::string& projectName)
{
  RWMutexReadLock rd_lock(mResourcesMutex);
  auto it = mResources.find(projectName);
  return ((it == mResources.end()) ? "" : it->second);
}

//------------------------------------------------------------------------------
// Retry the full project sync until it succeeds
//------------------------------------------------------------------------------
void
RbacAuthorizer::FullSyncLoop(ThreadAssistant& assistant) noexcept
{
  while (!assistant.terminationRequested()) {
    Status st = SyncProjects();

    if (st.ok()) {
      warden_info("msg=\"synced projects with RBAC server\" sync_id=\"%s\"",
                  GetLastSyncId().c_str());
      break;
    }

    if (assistant.terminationRequested()) {
      break;
    }

    warden_err("msg=\"failed to sync projects with RBAC server\" err=\"%s\" "
               "retry_sec=%lld", st.getMsg().c_str(),
               (long long) mSyncRetryInterval.count());
    assistant.wait_for(mSyncRetryInterval);
  }
}

//------------------------------------------------------------------------------
// Follow the change feed of the policy server
//------------------------------------------------------------------------------
void
RbacAuthorizer::PollChanges(ThreadAssistant& assistant) noexcept
{
  HttpRequestOptions opts;
  opts.abortFlag = &mAbort;

  while (!assistant.terminationRequested()) {
    std::string url = mApiUrl + CHANGES_PATH;
    std::string last_change = GetLastChange();

    if (!last_change.empty()) {
      url += "?last-change=";
      url += StringConversion::curl_default_escaped(last_change);
    }

    HttpResponse response;
    Status st = mHttpClient->Get(url, opts, response);

    if (!st.ok()) {
      if ((st.getErrc() == ECANCELED) || assistant.terminationRequested()) {
        break;
      }

      // server or load balancer closed the long-poll
      if (st.getErrc() == ECONNRESET) {
        continue;
      }

      warden_err("msg=\"failed to connect to RBAC server, re-trying\" "
                 "err=\"%s\"", st.getMsg().c_str());
      assistant.wait_for(mChangesRetryInterval);
      continue;
    }

    // server timed out the long-poll, reconnect at once
    if (response.code == 504) {
      continue;
    }

    if (response.code != 200) {
      warden_debug("msg=\"RBAC server disconnected, re-connecting\" code=%ld",
                   response.code);
      assistant.wait_for(mChangesRetryInterval);
      continue;
    }

    Json::Value root;
    std::string errs;

    if (!ParseJson(response.body, root, errs) || !root.isObject() ||
        !root["last-change"].isString()) {
      warden_err("msg=\"failed to parse RBAC change response, re-trying\" "
                 "err=\"%s\"", errs.c_str());
      assistant.wait_for(mChangesRetryInterval);
      continue;
    }

    {
      std::lock_guard<std::mutex> lock(mTokenMutex);
      mLastChange = root["last-change"].asString();
    }

    warden_debug("msg=\"RBAC change detected, flushing cache\" "
                 "last_change=\"%s\"", root["last-change"].asString().c_str());
    FlushCache();
  }
}

WARDENAUTHNAMESPACE_END
