//------------------------------------------------------------------------------
// File: EntitlementTests.cc
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
#include "auth/Entitlement.hh"
#include "auth/Errors.hh"

using namespace warden::auth;
using warden::common::Status;

TEST(Entitlement, ObjectTypeStrings)
{
  for (const auto& type : AllObjectTypes()) {
    ObjectType parsed;
    ASSERT_TRUE(ObjectTypeFromString(ObjectTypeToString(type), parsed).ok());
    ASSERT_EQ(parsed, type);
  }

  ObjectType type;
  Status st = ObjectTypeFromString("container", type);
  ASSERT_EQ(st.getErrc(), EINVAL);
  ASSERT_EQ(st.getMsg(), "Invalid object type \"container\"");
  ASSERT_EQ(AllObjectTypes().size(), 15u);
}

TEST(Entitlement, ObjectTypeTraits)
{
  ASSERT_EQ(GetObjectTypeTraits(ObjectType::Project).nElements, 0u);
  ASSERT_TRUE(GetObjectTypeTraits(ObjectType::Project).requireProject);
  ASSERT_EQ(GetObjectTypeTraits(ObjectType::Server).nElements, 1u);
  ASSERT_FALSE(GetObjectTypeTraits(ObjectType::Server).requireProject);
  ASSERT_EQ(GetObjectTypeTraits(ObjectType::StorageBucket).nElements, 3u);
  ASSERT_EQ(GetObjectTypeTraits(ObjectType::StorageVolume).nElements, 4u);
  ASSERT_TRUE(GetObjectTypeTraits(ObjectType::ImageAlias).requireProject);
  ASSERT_FALSE(GetObjectTypeTraits(ObjectType::Group).requireProject);
}

TEST(Entitlement, RelationStrings)
{
  Relation relation;
  ASSERT_TRUE(RelationFromString("can_view", relation).ok());
  ASSERT_EQ(relation, Relation::CanView);
  ASSERT_TRUE(RelationFromString("can_manage_network_acls", relation).ok());
  ASSERT_EQ(relation, Relation::CanManageNetworkACLs);
  ASSERT_STREQ(RelationToString(Relation::CanConnectSFTP), "can_connect_sftp");
  ASSERT_STREQ(RelationToString(Relation::Member), "member");
  ASSERT_EQ(RelationFromString("can_fly", relation).getErrc(), EINVAL);
}

TEST(Entitlement, ValidateRelation)
{
  ASSERT_TRUE(ValidateRelation(ObjectType::Server, Relation::CanViewMetrics).ok());
  ASSERT_TRUE(ValidateRelation(ObjectType::Instance, Relation::CanExec).ok());
  ASSERT_TRUE(ValidateRelation(ObjectType::Project,
                               Relation::CanManageStorageBuckets).ok());
  ASSERT_TRUE(ValidateRelation(ObjectType::StorageVolume,
                               Relation::CanManageSnapshots).ok());
  Status st = ValidateRelation(ObjectType::Profile, Relation::CanExec);
  ASSERT_EQ(st.getErrc(), EINVAL);
  ASSERT_NE(st.getMsg().find("can_exec"), std::string::npos);
  ASSERT_TRUE(Relations(ObjectType::User).empty());
  ASSERT_FALSE(ValidateRelation(ObjectType::User, Relation::CanView).ok());
}

TEST(Errors, WrapKeepsCode)
{
  Status st = WrapStatus(RemoteUnavailableError("connection refused"),
                         "Failed to sync");
  ASSERT_EQ(st.getErrc(), ECOMM);
  ASSERT_EQ(st.getMsg(), "Failed to sync: connection refused");
  ASSERT_TRUE(WrapStatus(Status(), "Failed to sync").ok());
}

TEST(Errors, ClientStatusIsOpaque)
{
  Status forbidden = ForbiddenError("Certificate is restricted");
  ASSERT_EQ(ToClientStatus(forbidden, "server:main", "can_edit", "tls"),
            forbidden);
  Status st = ToClientStatus(MappingGapError("no mapping"), "server:main",
                             "can_edit", "candid");
  ASSERT_TRUE(IsForbidden(st));
  ASSERT_EQ(st.getMsg(), "Forbidden");
  ASSERT_TRUE(ToClientStatus(Status(), "server:main", "can_edit", "tls").ok());
}
