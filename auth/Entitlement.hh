//------------------------------------------------------------------------------
// File: Entitlement.hh
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
#include "auth/Namespace.hh"
#include "common/Status.hh"
#include <cstddef>
#include <string>
#include <vector>

WARDENAUTHNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Type of an authorization object
//------------------------------------------------------------------------------
enum class ObjectType {
  User,
  Group,
  Server,
  Certificate,
  StoragePool,
  Project,
  Image,
  ImageAlias,
  Instance,
  Network,
  NetworkACL,
  NetworkZone,
  Profile,
  StorageBucket,
  StorageVolume
};

//------------------------------------------------------------------------------
//! Entitlement a caller can hold on an authorization object
//------------------------------------------------------------------------------
enum class Relation {
  // relations that apply to all resources
  CanEdit,
  CanView,
  // server
  Admin,
  Operator,
  Viewer,
  CanManagePermissions,
  CanManageStoragePools,
  CanManageProjects,
  CanViewResources,
  CanManageCertificates,
  CanViewMetrics,
  CanOverrideClusterTargetRestriction,
  CanViewPrivilegedEvents,
  CanViewWarnings,
  // project
  Manager,
  CanManageImages,
  CanManageImageAliases,
  CanManageInstances,
  CanManageNetworks,
  CanManageNetworkACLs,
  CanManageNetworkZones,
  CanManageProfiles,
  CanManageStorageVolumes,
  CanManageStorageBuckets,
  CanViewOperations,
  CanViewEvents,
  // instance
  User,
  CanUpdateState,
  CanConnectSFTP,
  CanAccessFiles,
  CanAccessConsole,
  CanExec,
  // instance and storage volume
  CanManageSnapshots,
  CanManageBackups,
  // object to object
  Server,
  Project,
  // user to group
  Member
};

//------------------------------------------------------------------------------
//! Identifier layout of an object type
//------------------------------------------------------------------------------
struct ObjectTypeTraits {
  size_t nElements; ///< number of identifier elements, project excluded
  bool requireProject; ///< identifier starts with the project name
};

//------------------------------------------------------------------------------
//! Return the string form of an object type e.g. "storage_volume"
//------------------------------------------------------------------------------
const char* ObjectTypeToString(ObjectType type);

//------------------------------------------------------------------------------
//! Parse an object type
//!
//! @param str string form of the type
//! @param type parsed value
//!
//! @return InvalidArgument status if the type is unknown
//------------------------------------------------------------------------------
warden::common::Status ObjectTypeFromString(const std::string& str,
                                            ObjectType& type);

//------------------------------------------------------------------------------
//! Return the identifier layout of an object type
//------------------------------------------------------------------------------
const ObjectTypeTraits& GetObjectTypeTraits(ObjectType type);

//------------------------------------------------------------------------------
//! Return all object types
//------------------------------------------------------------------------------
const std::vector<ObjectType>& AllObjectTypes();

//------------------------------------------------------------------------------
//! Return the string form of a relation e.g. "can_view"
//------------------------------------------------------------------------------
const char* RelationToString(Relation relation);

//------------------------------------------------------------------------------
//! Parse a relation
//!
//! @return InvalidArgument status if the relation is unknown
//------------------------------------------------------------------------------
warden::common::Status RelationFromString(const std::string& str,
                                          Relation& relation);

//------------------------------------------------------------------------------
//! Return the fixed list of relations declared for an object type. The user
//! type declares none.
//------------------------------------------------------------------------------
const std::vector<Relation>& Relations(ObjectType type);

//------------------------------------------------------------------------------
//! Check that a relation is declared for an object type
//!
//! @return InvalidArgument status if not declared
//------------------------------------------------------------------------------
warden::common::Status ValidateRelation(ObjectType type, Relation relation);

WARDENAUTHNAMESPACE_END
