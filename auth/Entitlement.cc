//------------------------------------------------------------------------------
// File: Entitlement.cc
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

#include "auth/Entitlement.hh"
#include "auth/Errors.hh"
#include "common/Logging.hh"
#include <algorithm>
#include <map>
#include <stdexcept>

WARDENAUTHNAMESPACE_BEGIN

using warden::common::Status;

namespace
{
struct ObjectTypeEntry {
  ObjectType type;
  const char* name;
  ObjectTypeTraits traits;
};

const ObjectTypeEntry sObjectTypes[] = {
  {ObjectType::User,          "user",           {1, false}},
  {ObjectType::Group,         "group",          {1, false}},
  {ObjectType::Server,        "server",         {1, false}},
  {ObjectType::Certificate,   "certificate",    {1, false}},
  {ObjectType::StoragePool,   "storage_pool",   {1, false}},
  {ObjectType::Project,       "project",        {0, true}},
  {ObjectType::Image,         "image",          {1, true}},
  {ObjectType::ImageAlias,    "image_alias",    {1, true}},
  {ObjectType::Instance,      "instance",       {1, true}},
  {ObjectType::Network,       "network",        {1, true}},
  {ObjectType::NetworkACL,    "network_acl",    {1, true}},
  {ObjectType::NetworkZone,   "network_zone",   {1, true}},
  {ObjectType::Profile,       "profile",        {1, true}},
  // pool, bucket, location
  {ObjectType::StorageBucket, "storage_bucket", {3, true}},
  // pool, volume type, volume, location
  {ObjectType::StorageVolume, "storage_volume", {4, true}}
};

const std::map<Relation, const char*> sRelationNames = {
  {Relation::CanEdit, "can_edit"},
  {Relation::CanView, "can_view"},
  {Relation::Admin, "admin"},
  {Relation::Operator, "operator"},
  {Relation::Viewer, "viewer"},
  {Relation::CanManagePermissions, "can_manage_permissions"},
  {Relation::CanManageStoragePools, "can_manage_storage_pools"},
  {Relation::CanManageProjects, "can_manage_projects"},
  {Relation::CanViewResources, "can_view_resources"},
  {Relation::CanManageCertificates, "can_manage_certificates"},
  {Relation::CanViewMetrics, "can_view_metrics"},
  {Relation::CanOverrideClusterTargetRestriction, "can_override_cluster_target_restriction"},
  {Relation::CanViewPrivilegedEvents, "can_view_privileged_events"},
  {Relation::CanViewWarnings, "can_view_warnings"},
  {Relation::Manager, "manager"},
  {Relation::CanManageImages, "can_manage_images"},
  {Relation::CanManageImageAliases, "can_manage_image_aliases"},
  {Relation::CanManageInstances, "can_manage_instances"},
  {Relation::CanManageNetworks, "can_manage_networks"},
  {Relation::CanManageNetworkACLs, "can_manage_network_acls"},
  {Relation::CanManageNetworkZones, "can_manage_network_zones"},
  {Relation::CanManageProfiles, "can_manage_profiles"},
  {Relation::CanManageStorageVolumes, "can_manage_storage_volumes"},
  {Relation::CanManageStorageBuckets, "can_manage_storage_buckets"},
  {Relation::CanViewOperations, "can_view_operations"},
  {Relation::CanViewEvents, "can_view_events"},
  {Relation::User, "user"},
  {Relation::CanUpdateState, "can_update_state"},
  {Relation::CanConnectSFTP, "can_connect_sftp"},
  {Relation::CanAccessFiles, "can_access_files"},
  {Relation::CanAccessConsole, "can_access_console"},
  {Relation::CanExec, "can_exec"},
  {Relation::CanManageSnapshots, "can_manage_snapshots"},
  {Relation::CanManageBackups, "can_manage_backups"},
  {Relation::Server, "server"},
  {Relation::Project, "project"},
  {Relation::Member, "member"}
};

const ObjectTypeEntry&
LookupObjectType(ObjectType type)
{
  for (const auto& entry : sObjectTypes) {
    if (entry.type == type) {
      return entry;
    }
  }

  // every enumerator has an entry in the table
  throw std::logic_error("object type missing from type table");
}
}

//------------------------------------------------------------------------------
// Object type to string
//------------------------------------------------------------------------------
const char*
ObjectTypeToString(ObjectType type)
{
  return LookupObjectType(type).name;
}

//------------------------------------------------------------------------------
// Parse an object type
//------------------------------------------------------------------------------
Status
ObjectTypeFromString(const std::string& str, ObjectType& type)
{
  for (const auto& entry : sObjectTypes) {
    if (str == entry.name) {
      type = entry.type;
      return Status();
    }
  }

  return InvalidArgumentError(SSTR("Invalid object type \"" << str << "\""));
}

//------------------------------------------------------------------------------
// Identifier layout of an object type
//------------------------------------------------------------------------------
const ObjectTypeTraits&
GetObjectTypeTraits(ObjectType type)
{
  return LookupObjectType(type).traits;
}

//------------------------------------------------------------------------------
// All object types
//------------------------------------------------------------------------------
const std::vector<ObjectType>&
AllObjectTypes()
{
  static const std::vector<ObjectType> sAll = [] {
    std::vector<ObjectType> all;

    for (const auto& entry : sObjectTypes) {
      all.push_back(entry.type);
    }

    return all;
  }();
  return sAll;
}

//------------------------------------------------------------------------------
// Relation to string
//------------------------------------------------------------------------------
const char*
RelationToString(Relation relation)
{
  auto it = sRelationNames.find(relation);
  return (it == sRelationNames.end()) ? "unknown" : it->second;
}

//------------------------------------------------------------------------------
// Parse a relation
//------------------------------------------------------------------------------
Status
RelationFromString(const std::string& str, Relation& relation)
{
  for (const auto& entry : sRelationNames) {
    if (str == entry.second) {
      relation = entry.first;
      return Status();
    }
  }

  return InvalidArgumentError(SSTR("Invalid relation \"" << str << "\""));
}

//------------------------------------------------------------------------------
// Relations declared for an object type
//------------------------------------------------------------------------------
const std::vector<Relation>&
Relations(ObjectType type)
{
  static const std::vector<Relation> sNone;
  static const std::vector<Relation> sViewEdit {
    Relation::CanView, Relation::CanEdit
  };
  static const std::vector<Relation> sServer {
    Relation::Admin,
    Relation::Operator,
    Relation::Viewer,
    Relation::CanEdit,
    Relation::CanView,
    Relation::CanManagePermissions,
    Relation::CanManageStoragePools,
    Relation::CanManageProjects,
    Relation::CanViewResources,
    Relation::CanManageCertificates,
    Relation::CanViewMetrics,
    Relation::CanOverrideClusterTargetRestriction,
    Relation::CanViewPrivilegedEvents,
    Relation::CanViewWarnings
  };
  static const std::vector<Relation> sProject {
    Relation::Manager,
    Relation::Operator,
    Relation::Viewer,
    Relation::CanView,
    Relation::CanEdit,
    Relation::CanManageImages,
    Relation::CanManageImageAliases,
    Relation::CanManageInstances,
    Relation::CanManageNetworks,
    Relation::CanManageNetworkACLs,
    Relation::CanManageNetworkZones,
    Relation::CanManageProfiles,
    Relation::CanManageStorageVolumes,
    Relation::CanManageStorageBuckets,
    Relation::CanViewOperations,
    Relation::CanViewEvents
  };
  static const std::vector<Relation> sInstance {
    Relation::Manager,
    Relation::Operator,
    Relation::User,
    Relation::Viewer,
    Relation::CanEdit,
    Relation::CanView,
    Relation::CanUpdateState,
    Relation::CanManageSnapshots,
    Relation::CanManageBackups,
    Relation::CanConnectSFTP,
    Relation::CanAccessFiles,
    Relation::CanAccessConsole,
    Relation::CanExec
  };
  static const std::vector<Relation> sStorageVolume {
    Relation::CanView,
    Relation::CanEdit,
    Relation::CanManageSnapshots,
    Relation::CanManageBackups
  };

  switch (type) {
  case ObjectType::User:
    return sNone;

  case ObjectType::Server:
    return sServer;

  case ObjectType::Project:
    return sProject;

  case ObjectType::Instance:
    return sInstance;

  case ObjectType::StorageVolume:
    return sStorageVolume;

  case ObjectType::Group:
  case ObjectType::Certificate:
  case ObjectType::StoragePool:
  case ObjectType::Image:
  case ObjectType::ImageAlias:
  case ObjectType::Network:
  case ObjectType::NetworkACL:
  case ObjectType::NetworkZone:
  case ObjectType::Profile:
  case ObjectType::StorageBucket:
    return sViewEdit;
  }

  return sNone;
}

//------------------------------------------------------------------------------
// Check that a relation is declared for an object type
//------------------------------------------------------------------------------
Status
ValidateRelation(ObjectType type, Relation relation)
{
  const auto& relations = Relations(type);

  if (std::find(relations.begin(), relations.end(), relation) ==
      relations.end()) {
    return InvalidArgumentError(SSTR("No such relation \""
                                     << RelationToString(relation)
                                     << "\" for objects of type \""
                                     << ObjectTypeToString(type) << "\""));
  }

  return Status();
}

WARDENAUTHNAMESPACE_END
