//------------------------------------------------------------------------------
// File: RbacPermission.hh
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
#include "auth/Entitlement.hh"
#include "common/Status.hh"
#include <string>

WARDENAUTHNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Coarse permissions granted by the remote policy server
//------------------------------------------------------------------------------
enum class RbacPermission {
  Admin,
  View,
  ManageProjects,
  ManageContainers,
  ManageImages,
  ManageNetworks,
  ManageProfiles,
  ManageStorageVolumes,
  OperateContainers
};

const char* RbacPermissionToString(RbacPermission permission);

warden::common::Status RbacPermissionFromString(const std::string& str,
    RbacPermission& permission);

//------------------------------------------------------------------------------
//! Map a relation on an object type to the coarse permission granting it
//!
//! @param type object type
//! @param relation requested relation
//! @param permission set to the mapped permission
//!
//! @return MappingGap status if no permission is mapped
//------------------------------------------------------------------------------
warden::common::Status RelationToPermission(ObjectType type, Relation relation,
    RbacPermission& permission);

WARDENAUTHNAMESPACE_END
