//------------------------------------------------------------------------------
// File: RbacPermission.cc
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

#include "auth/rbac/RbacPermission.hh"
#include "auth/Errors.hh"
#include "common/Logging.hh"
#include <map>
#include <utility>

WARDENAUTHNAMESPACE_BEGIN

using warden::common::Status;

namespace
{
typedef std::map<std::pair<ObjectType, Relation>, RbacPermission> MappingTable;

//------------------------------------------------------------------------------
// Add the same permission for a list of relations of a type
//------------------------------------------------------------------------------
void
AddMapping(MappingTable& table, ObjectType type,
           std::initializer_list<Relation> relations, RbacPermission permission)
{
  for (const auto& relation : relations) {
    table[std::make_pair(type, relation)] = permission;
  }
}

//------------------------------------------------------------------------------
// Build the mapping table
//------------------------------------------------------------------------------
MappingTable
BuildMappingTable()
{
  MappingTable table;
  AddMapping(table, ObjectType::Server, {
    Relation::Admin, Relation::Operator, Relation::CanEdit,
    Relation::CanManagePermissions, Relation::CanManageStoragePools,
    Relation::CanManageProjects, Relation::CanManageCertificates,
    Relation::CanOverrideClusterTargetRestriction,
    Relation::CanViewPrivilegedEvents
  }, RbacPermission::Admin);
  AddMapping(table, ObjectType::Server, {
    Relation::Viewer, Relation::CanView, Relation::CanViewResources,
    Relation::CanViewMetrics, Relation::CanViewWarnings
  }, RbacPermission::View);

  for (const auto& type : {
         ObjectType::Certificate, ObjectType::StoragePool, ObjectType::Group
       }) {
    AddMapping(table, type, {Relation::CanEdit}, RbacPermission::Admin);
    AddMapping(table, type, {Relation::CanView}, RbacPermission::View);
  }

  AddMapping(table, ObjectType::Project, {
    Relation::CanEdit, Relation::Manager
  }, RbacPermission::ManageProjects);
  AddMapping(table, ObjectType::Project, {
    Relation::CanView, Relation::Viewer, Relation::CanViewOperations,
    Relation::CanViewEvents
  }, RbacPermission::View);
  AddMapping(table, ObjectType::Project, {Relation::Operator},
             RbacPermission::OperateContainers);
  AddMapping(table, ObjectType::Project, {Relation::CanManageInstances},
             RbacPermission::ManageContainers);
  AddMapping(table, ObjectType::Project, {
    Relation::CanManageImages, Relation::CanManageImageAliases
  }, RbacPermission::ManageImages);
  AddMapping(table, ObjectType::Project, {
    Relation::CanManageNetworks, Relation::CanManageNetworkACLs,
    Relation::CanManageNetworkZones
  }, RbacPermission::ManageNetworks);
  AddMapping(table, ObjectType::Project, {Relation::CanManageProfiles},
             RbacPermission::ManageProfiles);
  AddMapping(table, ObjectType::Project, {
    Relation::CanManageStorageVolumes, Relation::CanManageStorageBuckets
  }, RbacPermission::ManageStorageVolumes);

  AddMapping(table, ObjectType::Instance, {
    Relation::CanEdit, Relation::Manager
  }, RbacPermission::ManageContainers);
  AddMapping(table, ObjectType::Instance, {
    Relation::CanView, Relation::Viewer
  }, RbacPermission::View);
  AddMapping(table, ObjectType::Instance, {
    Relation::Operator, Relation::User, Relation::CanUpdateState,
    Relation::CanManageBackups, Relation::CanManageSnapshots,
    Relation::CanConnectSFTP, Relation::CanAccessFiles,
    Relation::CanAccessConsole, Relation::CanExec
  }, RbacPermission::OperateContainers);

  // entity types with can_edit and can_view only
  const std::pair<ObjectType, RbacPermission> editors[] = {
    {ObjectType::Image, RbacPermission::ManageImages},
    {ObjectType::ImageAlias, RbacPermission::ManageImages},
    {ObjectType::Network, RbacPermission::ManageNetworks},
    {ObjectType::NetworkACL, RbacPermission::ManageNetworks},
    {ObjectType::NetworkZone, RbacPermission::ManageNetworks},
    {ObjectType::Profile, RbacPermission::ManageProfiles},
    {ObjectType::StorageBucket, RbacPermission::ManageStorageVolumes},
    {ObjectType::StorageVolume, RbacPermission::ManageStorageVolumes}
  };

  for (const auto& editor : editors) {
    AddMapping(table, editor.first, {Relation::CanEdit}, editor.second);
    AddMapping(table, editor.first, {Relation::CanView}, RbacPermission::View);
  }

  AddMapping(table, ObjectType::StorageVolume, {
    Relation::CanManageBackups, Relation::CanManageSnapshots
  }, RbacPermission::ManageStorageVolumes);
  return table;
}
}

//------------------------------------------------------------------------------
// Permission to string
//------------------------------------------------------------------------------
const char*
RbacPermissionToString(RbacPermission permission)
{
  switch (permission) {
  case RbacPermission::Admin:
    return "admin";

  case RbacPermission::View:
    return "view";

  case RbacPermission::ManageProjects:
    return "manage-projects";

  case RbacPermission::ManageContainers:
    return "manage-containers";

  case RbacPermission::ManageImages:
    return "manage-images";

  case RbacPermission::ManageNetworks:
    return "manage-networks";

  case RbacPermission::ManageProfiles:
    return "manage-profiles";

  case RbacPermission::ManageStorageVolumes:
    return "manage-storage-volumes";

  case RbacPermission::OperateContainers:
    return "operate-containers";
  }

  return "unknown";
}

//------------------------------------------------------------------------------
// Permission from string
//------------------------------------------------------------------------------
Status
RbacPermissionFromString(const std::string& str, RbacPermission& permission)
{
  for (const auto& candidate : {
         RbacPermission::Admin, RbacPermission::View,
         RbacPermission::ManageProjects, RbacPermission::ManageContainers,
         RbacPermission::ManageImages, RbacPermission::ManageNetworks,
         RbacPermission::ManageProfiles, RbacPermission::ManageStorageVolumes,
         RbacPermission::OperateContainers
       }) {
    if (str == RbacPermissionToString(candidate)) {
      permission = candidate;
      return Status();
    }
  }

  return InvalidArgumentError(SSTR("Unknown RBAC permission \"" << str << "\""));
}

//------------------------------------------------------------------------------
// Map a relation on an object type to the coarse permission granting it
//------------------------------------------------------------------------------
Status
RelationToPermission(ObjectType type, Relation relation,
                     RbacPermission& permission)
{
  static const MappingTable sTable = BuildMappingTable();
  auto it = sTable.find(std::make_pair(type, relation));

  if (it == sTable.end()) {
    return MappingGapError(SSTR("No RBAC permission is mapped to relation \""
                                << RelationToString(relation)
                                << "\" on objects of type \""
                                << ObjectTypeToString(type) << "\""));
  }

  permission = it->second;
  return Status();
}

WARDENAUTHNAMESPACE_END
