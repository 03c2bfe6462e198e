//------------------------------------------------------------------------------
// File: CommonAuthorizer.cc
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

#include "auth/CommonAuthorizer.hh"
#include "auth/Errors.hh"

WARDENAUTHNAMESPACE_BEGIN

using warden::common::Status;

//------------------------------------------------------------------------------
// Set the driver name
//------------------------------------------------------------------------------
Status
CommonAuthorizer::Init(const std::string& driverName)
{
  mDriverName = driverName;
  SetLogId(nullptr, SSTR("authorizer:" << driverName).c_str());
  return Status();
}

//------------------------------------------------------------------------------
// Check a relation on the object addressed by request parameters
//------------------------------------------------------------------------------
Status
CommonAuthorizer::CheckPermission(const RequestDetails& details,
                                  Relation relation, ObjectType type,
                                  const std::string& project,
                                  const std::string& location,
                                  const std::vector<std::string>& pathArgs)
{
  Object object;
  Status st = ObjectFromRequestParams(type, project, location, pathArgs, object);

  if (!st.ok()) {
    return WrapStatus(st, "Failed to create authorization object");
  }

  st = ValidateRelation(type, relation);

  if (!st.ok()) {
    return st;
  }

  st = CheckPermission(details, object, relation);
  return ToClientStatus(st, object.String(), RelationToString(relation),
                        details.authenticationProtocol);
}

//------------------------------------------------------------------------------
// Get a filter for a listing of objects of the given type
//------------------------------------------------------------------------------
Status
CommonAuthorizer::GetPermissionChecker(const RequestDetails& details,
                                       Relation relation, ObjectType type,
                                       std::unique_ptr<PermissionChecker>& checker)
{
  checker.reset();
  Status st = ValidateRelation(type, relation);

  if (!st.ok()) {
    return st;
  }

  st = BuildPermissionChecker(details, relation, type, checker);

  if (!st.ok()) {
    checker.reset();
  }

  return ToClientStatus(st, ObjectTypeToString(type),
                        RelationToString(relation),
                        details.authenticationProtocol);
}

//------------------------------------------------------------------------------
// Decision for a restricted caller on objects outside of any project
//------------------------------------------------------------------------------
bool
CommonAuthorizer::CheckNonProjectType(ObjectType type, Relation relation,
                                      bool& allowed)
{
  switch (type) {
  case ObjectType::Server:
    allowed = (relation == Relation::CanView) ||
              (relation == Relation::CanViewResources) ||
              (relation == Relation::CanViewMetrics);
    return true;

  case ObjectType::StoragePool:
  case ObjectType::Certificate:
  case ObjectType::Group:
    allowed = (relation == Relation::CanView);
    return true;

  default:
    return false;
  }
}

Status
CommonAuthorizer::AddProject(int64_t, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::DeleteProject(int64_t, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::RenameProject(int64_t, const std::string&,
                                const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::AddCertificate(const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::DeleteCertificate(const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::AddStoragePool(const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::DeleteStoragePool(const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::AddImage(const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::DeleteImage(const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::AddImageAlias(const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::DeleteImageAlias(const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::RenameImageAlias(const std::string&, const std::string&,
                                   const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::AddInstance(const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::DeleteInstance(const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::RenameInstance(const std::string&, const std::string&,
                                 const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::AddNetwork(const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::DeleteNetwork(const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::RenameNetwork(const std::string&, const std::string&,
                                const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::AddNetworkZone(const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::DeleteNetworkZone(const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::AddNetworkACL(const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::DeleteNetworkACL(const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::RenameNetworkACL(const std::string&, const std::string&,
                                   const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::AddProfile(const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::DeleteProfile(const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::RenameProfile(const std::string&, const std::string&,
                                const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::AddStoragePoolVolume(const std::string&, const std::string&,
                                       const std::string&, const std::string&,
                                       const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::DeleteStoragePoolVolume(const std::string&,
    const std::string&, const std::string&, const std::string&,
    const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::RenameStoragePoolVolume(const std::string&,
    const std::string&, const std::string&, const std::string&,
    const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::AddStorageBucket(const std::string&, const std::string&,
                                   const std::string&, const std::string&)
{
  return Status();
}

Status
CommonAuthorizer::DeleteStorageBucket(const std::string&, const std::string&,
                                      const std::string&, const std::string&)
{
  return Status();
}

WARDENAUTHNAMESPACE_END
