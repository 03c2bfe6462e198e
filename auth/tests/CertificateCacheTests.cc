//------------------------------------------------------------------------------
// File: CertificateCacheTests.cc
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
#include "auth/certificate/CertificateCache.hh"
#include "auth/tests/TestCertificate.hh"

using namespace warden::auth;
using warden::common::Status;

TEST(CertificateCache, Fingerprint)
{
  std::string fingerprint;
  ASSERT_TRUE(CertificateCache::Fingerprint(sTestCertificatePEM,
              fingerprint).ok());
  ASSERT_EQ(fingerprint, sTestCertificateFingerprint);
  Status st = CertificateCache::Fingerprint("not a certificate", fingerprint);
  ASSERT_EQ(st.getErrc(), EINVAL);
}

TEST(CertificateCache, AddCertificatePEM)
{
  CertificateCache cache;
  std::string fingerprint;
  ASSERT_TRUE(cache.AddCertificatePEM(CertificateType::Client,
                                      sTestCertificatePEM, fingerprint).ok());
  ASSERT_EQ(fingerprint, sTestCertificateFingerprint);
  auto certs = cache.GetCertificates();
  ASSERT_EQ(certs[CertificateType::Client].count(fingerprint), 1u);
  CertificateDetails details;
  ASSERT_TRUE(cache.GetDetails(fingerprint, details).ok());
  ASSERT_EQ(details.type, CertificateType::Client);
  ASSERT_TRUE(details.unrestricted);
}

TEST(CertificateCache, Restrictions)
{
  CertificateCache cache;
  cache.SetCertificatesProjectsAndGroups({
    {CertificateType::Client, {{"restricted", "pem1"}, {"grouped", "pem2"}, {"free", "pem3"}}},
    {CertificateType::Metrics, {{"metrics", "pem4"}}}
  }, {
    {"restricted", {"p1", "p2"}}
  }, {
    {"grouped", {"ops"}}
  });
  CertificateDetails details;
  ASSERT_TRUE(cache.GetDetails("restricted", details).ok());
  ASSERT_FALSE(details.unrestricted);
  ASSERT_EQ(details.projects, std::vector<std::string>({"p1", "p2"}));
  ASSERT_TRUE(cache.GetDetails("grouped", details).ok());
  ASSERT_FALSE(details.unrestricted);
  ASSERT_TRUE(details.projects.empty());
  ASSERT_EQ(details.groups, std::vector<std::string>({"ops"}));
  ASSERT_TRUE(cache.GetDetails("free", details).ok());
  ASSERT_TRUE(details.unrestricted);
  ASSERT_TRUE(cache.GetDetails("metrics", details).ok());
  ASSERT_EQ(details.type, CertificateType::Metrics);
  ASSERT_FALSE(details.unrestricted);
}

TEST(CertificateCache, UnknownCertificate)
{
  CertificateCache cache;
  CertificateDetails details;
  Status st = cache.GetDetails("unknown", details);
  ASSERT_EQ(st.getErrc(), EPERM);
  ASSERT_EQ(st.getMsg(), "Client certificate not found");
  cache.SetTrustCA(true);
  ASSERT_TRUE(cache.GetDetails("unknown", details).ok());
  ASSERT_EQ(details.type, CertificateType::Client);
  ASSERT_TRUE(details.unrestricted);
}

TEST(CertificateCache, SetCertificatesKeepsRestrictions)
{
  CertificateCache cache;
  cache.SetCertificatesProjectsAndGroups({
    {CertificateType::Client, {{"restricted", "pem1"}}}
  }, {{"restricted", {"p1"}}}, {});
  cache.SetCertificates({{CertificateType::Client, {{"restricted", "pem2"}}}});
  CertificateDetails details;
  ASSERT_TRUE(cache.GetDetails("restricted", details).ok());
  ASSERT_FALSE(details.unrestricted);
  ASSERT_EQ(details.projects, std::vector<std::string>({"p1"}));
}

TEST(CertificateCache, TypeStrings)
{
  CertificateType type;
  ASSERT_TRUE(CertificateTypeFromString("metrics", type).ok());
  ASSERT_EQ(type, CertificateType::Metrics);
  ASSERT_STREQ(CertificateTypeToString(CertificateType::Server), "server");
  ASSERT_FALSE(CertificateTypeFromString("root", type).ok());
}
