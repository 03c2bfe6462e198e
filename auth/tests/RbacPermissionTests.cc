//------------------------------------------------------------------------------
// File: RbacPermissionTests.cc
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
#include "auth/rbac/RbacPermission.hh"

using namespace warden::auth;
using warden::common::Status;

TEST(RbacPermission, Strings)
{
  RbacPermission permission;
  ASSERT_STREQ(RbacPermissionToString(RbacPermission::ManageContainers),
               "manage-containers");
  ASSERT_STREQ(RbacPermissionToString(RbacPermission::OperateContainers),
               "operate-containers");
  ASSERT_TRUE(RbacPermissionFromString("manage-storage-volumes",
                                       permission).ok());
  ASSERT_EQ(permission, RbacPermission::ManageStorageVolumes);
  ASSERT_EQ(RbacPermissionFromString("manage-everything",
                                     permission).getErrc(), EINVAL);
}

TEST(RbacPermission, EveryRelationIsMapped)
{
  RbacPermission permission;

  for (const auto& type : AllObjectTypes()) {
    for (const auto& relation : Relations(type)) {
      Status st = RelationToPermission(type, relation, permission);
      ASSERT_TRUE(st.ok()) << st.getMsg();
    }
  }
}

TEST(RbacPermission, Mapping)
{
  const struct {
    ObjectType type;
    Relation relation;
    RbacPermission permission;
  } cases[] = {
    {ObjectType::Server, Relation::Admin, RbacPermission::Admin},
    {ObjectType::Server, Relation::CanManageProjects, RbacPermission::Admin},
    {ObjectType::Server, Relation::CanView, RbacPermission::View},
    {ObjectType::Server, Relation::CanViewMetrics, RbacPermission::View},
    {ObjectType::StoragePool, Relation::CanEdit, RbacPermission::Admin},
    {ObjectType::Project, Relation::CanEdit, RbacPermission::ManageProjects},
    {ObjectType::Project, Relation::CanViewEvents, RbacPermission::View},
    {ObjectType::Project, Relation::CanManageInstances, RbacPermission::ManageContainers},
    {ObjectType::Project, Relation::CanManageNetworkACLs, RbacPermission::ManageNetworks},
    {ObjectType::Project, Relation::CanManageStorageBuckets, RbacPermission::ManageStorageVolumes},
    {ObjectType::Instance, Relation::CanEdit, RbacPermission::ManageContainers},
    {ObjectType::Instance, Relation::CanExec, RbacPermission::OperateContainers},
    {ObjectType::Instance, Relation::CanView, RbacPermission::View},
    {ObjectType::Image, Relation::CanEdit, RbacPermission::ManageImages},
    {ObjectType::NetworkZone, Relation::CanEdit, RbacPermission::ManageNetworks},
    {ObjectType::Profile, Relation::CanEdit, RbacPermission::ManageProfiles},
    {ObjectType::StorageVolume, Relation::CanManageSnapshots, RbacPermission::ManageStorageVolumes},
    {ObjectType::StorageBucket, Relation::CanView, RbacPermission::View}
  };

  for (const auto& test : cases) {
    RbacPermission permission;
    ASSERT_TRUE(RelationToPermission(test.type, test.relation,
                                     permission).ok());
    ASSERT_EQ(permission, test.permission)
        << ObjectTypeToString(test.type) << "#"
        << RelationToString(test.relation);
  }
}

TEST(RbacPermission, MappingGap)
{
  RbacPermission permission;
  Status st = RelationToPermission(ObjectType::Image, Relation::CanExec,
                                   permission);
  ASSERT_EQ(st.getErrc(), EFAULT);
  st = RelationToPermission(ObjectType::User, Relation::CanView, permission);
  ASSERT_EQ(st.getErrc(), EFAULT);
}
