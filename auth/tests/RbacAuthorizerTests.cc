//------------------------------------------------------------------------------
// File: RbacAuthorizerTests.cc
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

#include "gtest/gtest.h"
#include "auth/drivers/RbacAuthorizer.hh"
#include "auth/certificate/CertificateCache.hh"
#include <json/json.h>
#include <condition_variable>
#include <deque>
#include <functional>
#include <sstream>
#include <thread>

using namespace warden::auth;
using warden::common::Status;

namespace
{
//------------------------------------------------------------------------------
// In-memory policy server answering the RBAC driver requests
//------------------------------------------------------------------------------
class FakeRbacServer : public IHttpClient
{
public:
  Status Get(const std::string& url, const HttpRequestOptions& opts,
             HttpResponse& response) override
  {
    std::unique_lock<std::mutex> lock(mMutex);

    if (url.find("/api/service/v1/changes") != std::string::npos) {
      mChangeUrls.push_back(url);
      mChangeTimeouts.push_back(opts.timeoutSec);

      while (mChanges.empty()) {
        if (opts.abortFlag && opts.abortFlag->load()) {
          return Status(ECANCELED, "request aborted");
        }

        mCond.wait_for(lock, std::chrono::milliseconds(10));
      }

      response.code = 200;
      response.body = "{\"last-change\":\"" + mChanges.front() + "\"}";
      mChanges.pop_front();
      return Status();
    }

    if (mDown) {
      return Status(ECOMM, "Couldn't connect to server");
    }

    ++mPermissionRequests;
    mPermissionUrls.push_back(url);
    mPermissionTimeouts.push_back(opts.timeoutSec);
    std::string user = url.substr(url.find("?u=") + 3);

    if (url.find("/resources/lxd/permissions-for-user") != std::string::npos) {
      response.code = 200;
      response.body = (mAdmins.count(user) ? "{\"\":[\"admin\"]}" : "{\"\":[]}");
      return Status();
    }

    auto it = mPermissions.find(user);

    if (it == mPermissions.end()) {
      response.code = 404;
      response.body = "{\"error\":\"user not found\"}";
      return Status();
    }

    response.code = 200;
    response.body = it->second;
    std::function<void()> hook;
    hook.swap(mFetchHook);
    lock.unlock();

    // runs once, after the answer is fixed and before it is delivered
    if (hook) {
      hook();
    }

    return Status();
  }

  Status Post(const std::string& url, const std::string& body,
              const HttpRequestOptions& opts, HttpResponse& response) override
  {
    std::lock_guard<std::mutex> lock(mMutex);

    if (mDown) {
      return Status(ECOMM, "Couldn't connect to server");
    }

    mPostUrls.push_back(url);
    mPostBodies.push_back(body);

    if (!mPostCodes.empty()) {
      response.code = mPostCodes.front();
      mPostCodes.pop_front();
    } else {
      response.code = 200;
    }

    response.body = "{\"sync-id\":\"sync-" + std::to_string(mPostBodies.size())
                    + "\"}";
    return Status();
  }

  void PushChange(const std::string& token)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mChanges.push_back(token);
    mCond.notify_all();
  }

  void SetPermissions(const std::string& user, const std::string& json)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mPermissions[user] = json;
  }

  void AddAdmin(const std::string& user)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mAdmins.insert(user);
  }

  void PushPostCode(long code)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mPostCodes.push_back(code);
  }

  void SetFetchHook(std::function<void()> hook)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mFetchHook = hook;
  }

  void SetDown(bool down)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mDown = down;
  }

  size_t PermissionRequests()
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mPermissionRequests;
  }

  std::vector<std::string> PostBodies()
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mPostBodies;
  }

  std::vector<std::string> PostUrls()
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mPostUrls;
  }

  std::vector<std::string> ChangeUrls()
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mChangeUrls;
  }

  std::vector<long> ChangeTimeouts()
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mChangeTimeouts;
  }

  std::vector<std::string> PermissionUrls()
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mPermissionUrls;
  }

  std::vector<long> PermissionTimeouts()
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mPermissionTimeouts;
  }

private:
  std::mutex mMutex;
  std::condition_variable mCond;
  std::deque<std::string> mChanges;
  std::deque<long> mPostCodes;
  std::map<std::string, std::string> mPermissions;
  std::set<std::string> mAdmins;
  std::function<void()> mFetchHook;
  std::vector<std::string> mPostUrls;
  std::vector<std::string> mPostBodies;
  std::vector<std::string> mChangeUrls;
  std::vector<long> mChangeTimeouts;
  std::vector<long> mPermissionTimeouts;
  std::vector<std::string> mPermissionUrls;
  size_t mPermissionRequests = 0;
  bool mDown = false;
};

//------------------------------------------------------------------------------
// Wait up to five seconds for a condition to hold
//------------------------------------------------------------------------------
template<typename Predicate>
bool
WaitFor(Predicate pred)
{
  for (int i = 0; i < 500; ++i) {
    if (pred()) {
      return true;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  return pred();
}

Json::Value
ParseBody(const std::string& body)
{
  Json::Value root;
  Json::CharReaderBuilder builder;
  std::istringstream iss(body);
  std::string errs;
  EXPECT_TRUE(Json::parseFromStream(builder, iss, &root, &errs)) << errs;
  return root;
}

RequestDetails
Candid(const std::string& user, const std::string& project = "default")
{
  RequestDetails details;
  details.authenticationProtocol = AUTH_METHOD_CANDID;
  details.username = user;
  details.projectName = project;
  return details;
}
}

//------------------------------------------------------------------------------
// Fixture with a loaded RBAC driver synced against the fake server
//------------------------------------------------------------------------------
class RbacAuthorizerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    mProjects = {{1, "default"}, {2, "p1"}, {3, "p2"}};
    mServer = std::make_shared<FakeRbacServer>();
    mServer->SetPermissions("alice",
                            "{\"2\":[\"view\",\"manage-containers\"],"
                            "\"99\":[\"view\"]}");
    mServer->SetPermissions("root", "{}");
    mServer->AddAdmin("root");
    mAuthz.reset(new RbacAuthorizer(mServer));
    ASSERT_TRUE(mAuthz->Init(DRIVER_RBAC).ok());
    ASSERT_TRUE(mAuthz->Load(MakeOpts()).ok());
    ASSERT_TRUE(WaitFor([this]() {
      return mAuthz->GetSyncState() == RbacAuthorizer::SyncState::Synced;
    }));
  }

  void TearDown() override
  {
    if (mAuthz) {
      ASSERT_TRUE(mAuthz->StopService().ok());
    }
  }

  Opts MakeOpts()
  {
    Opts opts;
    opts.config[RBAC_API_URL] = "http://rbac.test/";
    opts.config[RBAC_SYNC_RETRY_INTERVAL] = "0";
    opts.projectsGetFunc = [this](std::map<int64_t, std::string>& projects) {
      std::lock_guard<std::mutex> lock(mProjectsMutex);
      projects = mProjects;
      return Status();
    };
    return opts;
  }

  void SetProject(int64_t id, const std::string& name)
  {
    std::lock_guard<std::mutex> lock(mProjectsMutex);
    mProjects[id] = name;
  }

  std::mutex mProjectsMutex;
  std::map<int64_t, std::string> mProjects;
  std::shared_ptr<FakeRbacServer> mServer;
  std::unique_ptr<RbacAuthorizer> mAuthz;
};

TEST(RbacAuthorizer, LoadErrors)
{
  auto server = std::make_shared<FakeRbacServer>();
  RbacAuthorizer authz(server);
  ASSERT_TRUE(authz.Init(DRIVER_RBAC).ok());
  Opts opts;
  Status st = authz.Load(opts);
  ASSERT_EQ(st.getErrc(), ENOKEY);
  ASSERT_EQ(st.getMsg(), "Missing rbac.api.url");
  opts.config[RBAC_API_URL] = "http://rbac.test";
  st = authz.Load(opts);
  ASSERT_EQ(st.getErrc(), ENOKEY);
  ASSERT_EQ(st.getMsg(), "Missing projects hook for RBAC driver");
  opts.projectsGetFunc = [](std::map<int64_t, std::string>&) {
    return Status();
  };
  opts.config[RBAC_API_TIMEOUT] = "soon";
  st = authz.Load(opts);
  ASSERT_EQ(st.getErrc(), ENOKEY);
  ASSERT_EQ(authz.GetSyncState(), RbacAuthorizer::SyncState::Unsynced);
}

TEST(RbacAuthorizer, SyncRetry)
{
  auto server = std::make_shared<FakeRbacServer>();
  server->PushPostCode(500);
  RbacAuthorizer authz(server);
  ASSERT_TRUE(authz.Init(DRIVER_RBAC).ok());
  Opts opts;
  opts.config[RBAC_API_URL] = "http://rbac.test";
  opts.config[RBAC_SYNC_RETRY_INTERVAL] = "0";
  opts.projectsGetFunc = [](std::map<int64_t, std::string>& projects) {
    projects = {{1, "default"}};
    return Status();
  };
  ASSERT_TRUE(authz.Load(opts).ok());
  ASSERT_TRUE(WaitFor([&authz]() {
    return authz.GetSyncState() == RbacAuthorizer::SyncState::Synced;
  }));
  ASSERT_EQ(server->PostBodies().size(), 2u);
  ASSERT_EQ(authz.GetLastSyncId(), "sync-2");
  ASSERT_TRUE(authz.StopService().ok());
}

TEST_F(RbacAuthorizerTest, InitialSync)
{
  auto bodies = mServer->PostBodies();
  ASSERT_EQ(bodies.size(), 1u);
  ASSERT_EQ(mServer->PostUrls()[0],
            "http://rbac.test/api/service/v1/resources/project");
  Json::Value root = ParseBody(bodies[0]);
  ASSERT_TRUE(root["last-sync-id"].isNull());
  ASSERT_EQ(root["updates"].size(), 3u);
  ASSERT_FALSE(root.isMember("removals"));
  ASSERT_EQ(mAuthz->GetLastSyncId(), "sync-1");
  ASSERT_EQ(mAuthz->GetResourceId("p1"), "2");
  ASSERT_STREQ(RbacAuthorizer::SyncStateToString(mAuthz->GetSyncState()),
               "synced");
}

TEST_F(RbacAuthorizerTest, PermissionsAreCached)
{
  ASSERT_FALSE(mAuthz->HasCachedPermissions("alice"));
  ASSERT_TRUE(mAuthz->CheckPermission(Candid("alice", "p1"),
                                      Object::Instance("p1", "c1"),
                                      Relation::CanEdit).ok());
  ASSERT_EQ(mServer->PermissionRequests(), 2u);
  ASSERT_TRUE(mAuthz->HasCachedPermissions("alice"));
  ASSERT_TRUE(mAuthz->CheckPermission(Candid("alice", "p1"),
                                      Object::Instance("p1", "c1"),
                                      Relation::CanView).ok());
  ASSERT_EQ(mServer->PermissionRequests(), 2u);

  for (const auto& timeout : mServer->PermissionTimeouts()) {
    ASSERT_EQ(timeout, 30);
  }
}

TEST_F(RbacAuthorizerTest, PermissionDenied)
{
  Status st = mAuthz->CheckPermission(Candid("alice", "p2"),
                                      Object::Instance("p2", "c1"),
                                      Relation::CanView);
  ASSERT_EQ(st.getErrc(), EPERM);
  ASSERT_EQ(st.getMsg(),
            "User \"alice\" does not have permission \"view\" on project \"p2\"");
  st = mAuthz->CheckPermission(Candid("alice", "p1"), Object::Project("p1"),
                               Relation::CanManageProfiles);
  ASSERT_EQ(st.getMsg(), "User \"alice\" does not have permission "
            "\"manage-profiles\" on project \"p1\"");
  ASSERT_TRUE(mAuthz->CheckPermission(Candid("alice"), Object::Server(),
                                      Relation::CanView).ok());
  st = mAuthz->CheckPermission(Candid("alice"), Object::Server(),
                               Relation::Admin);
  ASSERT_EQ(st.getMsg(), "User is not an administrator");
  RequestDetails all = Candid("alice");
  all.isAllProjectsRequest = true;
  st = mAuthz->CheckPermission(all, Object::Instance("p1", "c1"),
                               Relation::CanView);
  ASSERT_EQ(st.getMsg(), "User is not an administrator");
}

TEST_F(RbacAuthorizerTest, UnknownUser)
{
  Status st = mAuthz->CheckPermission(Candid("mallory"), Object::Server(),
                                      Relation::CanView);
  ASSERT_EQ(st.getErrc(), EPERM);
  ASSERT_EQ(st.getMsg(), "Unknown RBAC user");
  ASSERT_FALSE(mAuthz->HasCachedPermissions("mallory"));
  ASSERT_EQ(mServer->PermissionRequests(), 1u);
  ASSERT_FALSE(mAuthz->CheckPermission(Candid("mallory"), Object::Server(),
                                       Relation::CanView).ok());
  ASSERT_EQ(mServer->PermissionRequests(), 2u);
}

TEST_F(RbacAuthorizerTest, Administrator)
{
  RequestDetails all = Candid("root");
  all.isAllProjectsRequest = true;
  ASSERT_TRUE(mAuthz->CheckPermission(all, Object::Instance("p2", "c1"),
                                      Relation::CanExec).ok());
  ASSERT_TRUE(mAuthz->CheckPermission(Candid("root"), Object::Server(),
                                      Relation::Admin).ok());
  std::unique_ptr<PermissionChecker> checker;
  ASSERT_TRUE(mAuthz->GetPermissionChecker(all, Relation::CanView,
                                           ObjectType::Instance,
                                           checker).ok());
  ASSERT_TRUE(checker->Allows(Object::Instance("p2", "c1")));
}

TEST_F(RbacAuthorizerTest, RemoteUnavailable)
{
  mServer->SetDown(true);
  Status st = mAuthz->CheckPermission(Candid("alice", "p1"),
                                      Object::Instance("p1", "c1"),
                                      Relation::CanView);
  ASSERT_EQ(st.getErrc(), ECOMM);
  ASSERT_EQ(st.getMsg().find("Failed to sync user permissions with RBAC "
                             "server"), 0u);
  // clients only get an opaque denial
  st = mAuthz->CheckPermission(Candid("alice", "p1"), Relation::CanView,
                               ObjectType::Instance, "p1", "", {"c1"});
  ASSERT_EQ(st.getErrc(), EPERM);
  ASSERT_EQ(st.getMsg(), "Forbidden");
  std::unique_ptr<PermissionChecker> checker;
  st = mAuthz->GetPermissionChecker(Candid("alice", "p1"), Relation::CanView,
                                    ObjectType::Instance, checker);
  ASSERT_EQ(st.getErrc(), EPERM);
  ASSERT_EQ(st.getMsg(), "Forbidden");
  ASSERT_TRUE(checker == nullptr);
}

TEST_F(RbacAuthorizerTest, PermissionChecker)
{
  std::unique_ptr<PermissionChecker> checker;
  ASSERT_TRUE(mAuthz->GetPermissionChecker(Candid("alice", "p1"),
                                           Relation::CanView,
                                           ObjectType::Instance,
                                           checker).ok());
  ASSERT_TRUE(checker->Allows(Object::Instance("p1", "c1")));
  ASSERT_FALSE(checker->Allows(Object::Instance("p2", "c1")));
  Status st = mAuthz->GetPermissionChecker(Candid("alice", "p2"),
                                           Relation::CanView,
                                           ObjectType::Instance, checker);
  ASSERT_EQ(st.getMsg(), "User does not have permissions for project \"p2\"");
  ASSERT_TRUE(mAuthz->GetPermissionChecker(Candid("alice", "p2"),
                                           Relation::CanView,
                                           ObjectType::Project,
                                           checker).ok());
  ASSERT_TRUE(checker->Allows(Object::Project("p1")));
  ASSERT_FALSE(checker->Allows(Object::Project("p2")));
  st = mAuthz->GetPermissionChecker(Candid("alice", "p1"), Relation::CanExec,
                                    ObjectType::Profile, checker);
  ASSERT_EQ(st.getErrc(), EINVAL);
  ASSERT_TRUE(checker == nullptr);
}

TEST_F(RbacAuthorizerTest, ProjectHooks)
{
  SetProject(4, "p4");
  ASSERT_TRUE(mAuthz->AddProject(4, "p4").ok());
  ASSERT_EQ(mAuthz->GetResourceId("p4"), "4");
  auto bodies = mServer->PostBodies();
  ASSERT_EQ(bodies.size(), 2u);
  Json::Value root = ParseBody(bodies[1]);
  ASSERT_EQ(root["last-sync-id"].asString(), "sync-1");
  ASSERT_EQ(root["updates"][0]["identifier"].asString(), "4");
  ASSERT_EQ(root["updates"][0]["name"].asString(), "p4");
  ASSERT_EQ(mAuthz->GetLastSyncId(), "sync-2");
  SetProject(4, "p5");
  ASSERT_TRUE(mAuthz->RenameProject(4, "p4", "p5").ok());
  ASSERT_EQ(mAuthz->GetResourceId("p4"), "");
  ASSERT_EQ(mAuthz->GetResourceId("p5"), "4");
  ASSERT_TRUE(mAuthz->DeleteProject(4, "p5").ok());
  ASSERT_EQ(mAuthz->GetResourceId("p5"), "");
  root = ParseBody(mServer->PostBodies().back());
  ASSERT_EQ(root["removals"][0].asString(), "4");
  ASSERT_FALSE(root.isMember("updates"));
}

TEST_F(RbacAuthorizerTest, SyncConflict)
{
  SetProject(4, "p4");
  mServer->PushPostCode(409);
  ASSERT_TRUE(mAuthz->AddProject(4, "p4").ok());
  auto bodies = mServer->PostBodies();
  ASSERT_EQ(bodies.size(), 3u);
  Json::Value root = ParseBody(bodies[2]);
  ASSERT_TRUE(root["last-sync-id"].isNull());
  ASSERT_EQ(root["updates"].size(), 4u);
  ASSERT_EQ(mAuthz->GetLastSyncId(), "sync-3");
  ASSERT_EQ(mAuthz->GetResourceId("p4"), "4");
  // a rejected full sync is an error
  mServer->PushPostCode(409);
  Status st = mAuthz->SyncProjects();
  ASSERT_EQ(st.getErrc(), ECOMM);
  ASSERT_EQ(mAuthz->GetSyncState(), RbacAuthorizer::SyncState::Unsynced);
}

TEST_F(RbacAuthorizerTest, ChangeFeedFlushesCache)
{
  ASSERT_TRUE(mAuthz->CheckPermission(Candid("alice", "p1"),
                                      Object::Instance("p1", "c1"),
                                      Relation::CanView).ok());
  ASSERT_TRUE(mAuthz->HasCachedPermissions("alice"));
  mServer->PushChange("change-1");
  ASSERT_TRUE(WaitFor([this]() {
    return !mAuthz->HasCachedPermissions("alice") &&
           (mAuthz->GetLastChange() == "change-1");
  }));
  ASSERT_TRUE(WaitFor([this]() {
    auto urls = mServer->ChangeUrls();
    return (urls.size() >= 2) &&
           (urls.back() ==
            "http://rbac.test/api/service/v1/changes?last-change=change-1");
  }));
  ASSERT_EQ(mServer->ChangeUrls()[0], "http://rbac.test/api/service/v1/changes");

  // the long-poll never times out
  for (const auto& timeout : mServer->ChangeTimeouts()) {
    ASSERT_EQ(timeout, 0);
  }

  // next decision fetches once: project permissions plus server permissions
  size_t requests = mServer->PermissionRequests();
  ASSERT_TRUE(mAuthz->CheckPermission(Candid("alice", "p1"),
                                      Object::Instance("p1", "c1"),
                                      Relation::CanView).ok());
  ASSERT_EQ(mServer->PermissionRequests(), requests + 2);
  ASSERT_TRUE(mAuthz->CheckPermission(Candid("alice", "p1"),
                                      Object::Instance("p1", "c1"),
                                      Relation::CanView).ok());
  ASSERT_EQ(mServer->PermissionRequests(), requests + 2);
}

TEST_F(RbacAuthorizerTest, FlushDuringFetch)
{
  mServer->SetFetchHook([this]() {
    mServer->SetPermissions("alice", "{}");
    mAuthz->FlushCache();
  });
  // the answer fetched before the flush still decides this one request
  ASSERT_TRUE(mAuthz->CheckPermission(Candid("alice", "p1"),
                                      Object::Instance("p1", "c1"),
                                      Relation::CanView).ok());
  ASSERT_EQ(mServer->PermissionRequests(), 2u);
  ASSERT_FALSE(mAuthz->HasCachedPermissions("alice"));
  Status st = mAuthz->CheckPermission(Candid("alice", "p1"),
                                      Object::Instance("p1", "c1"),
                                      Relation::CanView);
  ASSERT_EQ(mServer->PermissionRequests(), 4u);
  ASSERT_EQ(st.getErrc(), EPERM);
  ASSERT_TRUE(mAuthz->HasCachedPermissions("alice"));
}

TEST_F(RbacAuthorizerTest, UserNameEscaping)
{
  // the fake server keys users by the raw query value
  mServer->SetPermissions("bob%20smith%2Fops", "{\"2\":[\"view\"]}");
  ASSERT_TRUE(mAuthz->CheckPermission(Candid("bob smith/ops", "p1"),
                                      Object::Instance("p1", "c1"),
                                      Relation::CanView).ok());
  auto urls = mServer->PermissionUrls();
  ASSERT_EQ(urls.size(), 2u);
  ASSERT_EQ(urls[0], "http://rbac.test/api/service/v1/resources/project/"
            "permissions-for-user?u=bob%20smith%2Fops");
  ASSERT_EQ(urls[1], "http://rbac.test/api/service/v1/resources/lxd/"
            "permissions-for-user?u=bob%20smith%2Fops");
  // an empty name is asked for as such
  Status st = mAuthz->CheckPermission(Candid(""), Object::Server(),
                                      Relation::CanView);
  ASSERT_EQ(st.getMsg(), "Unknown RBAC user");
  ASSERT_EQ(mServer->PermissionUrls().back(),
            "http://rbac.test/api/service/v1/resources/project/"
            "permissions-for-user?u=");
}

TEST_F(RbacAuthorizerTest, SyncPermissions)
{
  ASSERT_TRUE(mAuthz->SyncPermissions("alice").ok());
  ASSERT_TRUE(mAuthz->HasCachedPermissions("alice"));
  ASSERT_TRUE(mAuthz->SyncPermissions("mallory").ok());
  ASSERT_FALSE(mAuthz->HasCachedPermissions("mallory"));
  mAuthz->FlushCache();
  ASSERT_FALSE(mAuthz->HasCachedPermissions("alice"));
}

TEST_F(RbacAuthorizerTest, TlsCallers)
{
  RequestDetails tls;
  tls.authenticationProtocol = AUTH_METHOD_TLS;
  tls.username = "fingerprint";
  Status st = mAuthz->CheckPermission(tls, Object::Server(), Relation::CanView);
  ASSERT_EQ(st.getErrc(), ENOKEY);
  ASSERT_TRUE(mAuthz->StopService().ok());
  mAuthz.reset(new RbacAuthorizer(mServer));
  ASSERT_TRUE(mAuthz->Init(DRIVER_RBAC).ok());
  auto cache = std::make_shared<CertificateCache>();
  cache->SetCertificates({{CertificateType::Client, {{"fingerprint", "pem"}}}});
  Opts opts = MakeOpts();
  opts.certificateCache = cache;
  ASSERT_TRUE(mAuthz->Load(opts).ok());
  ASSERT_TRUE(mAuthz->CheckPermission(tls, Object::Server(),
                                      Relation::Admin).ok());
  RequestDetails internal;
  internal.isInternalOrUnix = true;
  ASSERT_TRUE(mAuthz->CheckPermission(internal, Object::Server(),
                                      Relation::Admin).ok());
}

TEST_F(RbacAuthorizerTest, StopService)
{
  ASSERT_TRUE(WaitFor([this]() {
    return !mServer->ChangeUrls().empty();
  }));
  ASSERT_TRUE(mAuthz->StopService().ok());
  // stopping twice is harmless
  ASSERT_TRUE(mAuthz->StopService().ok());
  mAuthz.reset();
}
