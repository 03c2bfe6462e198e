//------------------------------------------------------------------------------
// File: TlsAuthorizerTests.cc
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
#include "auth/drivers/TlsAuthorizer.hh"
#include "auth/certificate/CertificateCache.hh"

using namespace warden::auth;
using warden::common::Status;

//------------------------------------------------------------------------------
// Fixture with a loaded TLS driver and a few known certificates
//------------------------------------------------------------------------------
class TlsAuthorizerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    mCache = std::make_shared<CertificateCache>();
    mCache->SetCertificatesProjectsAndGroups({
      {CertificateType::Client, {{"admin", "pem1"}, {"restricted", "pem2"}}},
      {CertificateType::Metrics, {{"metrics", "pem3"}}}
    }, {
      {"restricted", {"p1", "p2"}}
    }, {});
    ASSERT_TRUE(mAuthz.Init(DRIVER_TLS).ok());
    Opts opts;
    opts.certificateCache = mCache;
    ASSERT_TRUE(mAuthz.Load(opts).ok());
  }

  RequestDetails Tls(const std::string& fingerprint,
                     const std::string& project = "default")
  {
    RequestDetails details;
    details.authenticationProtocol = AUTH_METHOD_TLS;
    details.username = fingerprint;
    details.projectName = project;
    return details;
  }

  std::shared_ptr<CertificateCache> mCache;
  TlsAuthorizer mAuthz;
};

TEST(TlsAuthorizer, LoadRequiresCache)
{
  TlsAuthorizer authz;
  ASSERT_TRUE(authz.Init(DRIVER_TLS).ok());
  Status st = authz.Load(Opts());
  ASSERT_EQ(st.getErrc(), ENOKEY);
  ASSERT_EQ(authz.Driver(), "tls");
}

TEST_F(TlsAuthorizerTest, Bypasses)
{
  RequestDetails internal;
  internal.isInternalOrUnix = true;
  ASSERT_TRUE(mAuthz.CheckPermission(internal, Object::Server(),
                                     Relation::Admin).ok());
  RequestDetails candid;
  candid.authenticationProtocol = AUTH_METHOD_CANDID;
  candid.username = "alice";
  ASSERT_TRUE(mAuthz.CheckPermission(candid, Object::Server(),
                                     Relation::Admin).ok());
}

TEST_F(TlsAuthorizerTest, Unrestricted)
{
  ASSERT_TRUE(mAuthz.CheckPermission(Tls("admin"), Object::Server(),
                                     Relation::Admin).ok());
  ASSERT_TRUE(mAuthz.CheckPermission(Tls("admin"),
                                     Object::Instance("p9", "c1"),
                                     Relation::CanEdit).ok());
}

TEST_F(TlsAuthorizerTest, Restricted)
{
  ASSERT_TRUE(mAuthz.CheckPermission(Tls("restricted", "p1"),
                                     Object::Instance("p1", "c1"),
                                     Relation::CanEdit).ok());
  Status st = mAuthz.CheckPermission(Tls("restricted", "p3"),
                                     Object::Instance("p3", "c1"),
                                     Relation::CanView);
  ASSERT_EQ(st.getErrc(), EPERM);
  ASSERT_EQ(st.getMsg(), "User does not have permission for project \"p3\"");
  ASSERT_TRUE(mAuthz.CheckPermission(Tls("restricted"), Object::Server(),
                                     Relation::CanView).ok());
  ASSERT_TRUE(mAuthz.CheckPermission(Tls("restricted"),
                                     Object::StoragePool("pool"),
                                     Relation::CanView).ok());
  st = mAuthz.CheckPermission(Tls("restricted"), Object::Server(),
                              Relation::Admin);
  ASSERT_EQ(st.getMsg(), "Certificate is restricted");
  st = mAuthz.CheckPermission(Tls("restricted"), Object::StoragePool("pool"),
                              Relation::CanEdit);
  ASSERT_EQ(st.getErrc(), EPERM);
  RequestDetails all = Tls("restricted");
  all.isAllProjectsRequest = true;
  st = mAuthz.CheckPermission(all, Object::Instance("p1", "c1"),
                              Relation::CanView);
  ASSERT_EQ(st.getMsg(), "Certificate is restricted");
}

TEST_F(TlsAuthorizerTest, Metrics)
{
  ASSERT_TRUE(mAuthz.CheckPermission(Tls("metrics"), Object::Server(),
                                     Relation::CanViewMetrics).ok());
  ASSERT_FALSE(mAuthz.CheckPermission(Tls("metrics"),
                                      Object::Instance("p1", "c1"),
                                      Relation::CanView).ok());
}

TEST_F(TlsAuthorizerTest, UnknownCertificate)
{
  Status st = mAuthz.CheckPermission(Tls("unknown"), Object::Server(),
                                     Relation::CanView);
  ASSERT_EQ(st.getErrc(), EPERM);
  ASSERT_EQ(st.getMsg(), "Client certificate not found");
  mCache->SetTrustCA(true);
  ASSERT_TRUE(mAuthz.CheckPermission(Tls("unknown"), Object::Server(),
                                     Relation::Admin).ok());
}

TEST_F(TlsAuthorizerTest, CheckByRequestParams)
{
  ASSERT_TRUE(mAuthz.CheckPermission(Tls("restricted", "p2"),
                                     Relation::CanEdit, ObjectType::Instance,
                                     "p2", "", {"c1"}).ok());
  Status st = mAuthz.CheckPermission(Tls("restricted", "p3"),
                                     Relation::CanEdit, ObjectType::Instance,
                                     "p3", "", {"c1"});
  ASSERT_EQ(st.getErrc(), EPERM);
  st = mAuthz.CheckPermission(Tls("restricted", "p2"), Relation::CanEdit,
                              ObjectType::Instance, "p2", "", {""});
  ASSERT_EQ(st.getErrc(), EINVAL);
  st = mAuthz.CheckPermission(Tls("restricted", "p2"), Relation::Member,
                              ObjectType::Instance, "p2", "", {"c1"});
  ASSERT_EQ(st.getErrc(), EINVAL);
}

TEST_F(TlsAuthorizerTest, PermissionChecker)
{
  std::unique_ptr<PermissionChecker> checker;
  ASSERT_TRUE(mAuthz.GetPermissionChecker(Tls("admin"), Relation::CanView,
                                          ObjectType::Instance, checker).ok());
  ASSERT_TRUE(checker->Allows(Object::Instance("any", "c1")));
  ASSERT_TRUE(mAuthz.GetPermissionChecker(Tls("restricted", "p1"),
                                          Relation::CanView,
                                          ObjectType::Instance, checker).ok());
  ASSERT_TRUE(checker->Allows(Object::Instance("p1", "c1")));
  ASSERT_FALSE(checker->Allows(Object::Instance("p3", "c1")));
  Status st = mAuthz.GetPermissionChecker(Tls("restricted", "p3"),
                                          Relation::CanView,
                                          ObjectType::Instance, checker);
  ASSERT_EQ(st.getErrc(), EPERM);
  // project listings are filtered rather than refused
  ASSERT_TRUE(mAuthz.GetPermissionChecker(Tls("restricted", "p3"),
                                          Relation::CanView,
                                          ObjectType::Project, checker).ok());
  ASSERT_TRUE(checker->Allows(Object::Project("p2")));
  ASSERT_FALSE(checker->Allows(Object::Project("p3")));
  ASSERT_TRUE(mAuthz.GetPermissionChecker(Tls("restricted"), Relation::CanView,
                                          ObjectType::StoragePool,
                                          checker).ok());
  ASSERT_TRUE(checker->Allows(Object::StoragePool("pool")));
  st = mAuthz.GetPermissionChecker(Tls("restricted"), Relation::CanEdit,
                                   ObjectType::StoragePool, checker);
  ASSERT_EQ(st.getMsg(), "Certificate is restricted");
}
