//------------------------------------------------------------------------------
// File: OpenFgaAuthorizer.cc
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

#include "auth/drivers/OpenFgaAuthorizer.hh"
#include "auth/Errors.hh"
#include "auth/rbac/HttpClient.hh"
#include "auth/rebac/AuthModel.hh"
#include "auth/rebac/OpenFgaHttpEngine.hh"
#include "common/StringConversion.hh"
#include <set>

WARDENAUTHNAMESPACE_BEGIN

using warden::common::Status;
using warden::common::StringConversion;

//------------------------------------------------------------------------------
// Load the driver
//------------------------------------------------------------------------------
Status
OpenFgaAuthorizer::Load(const Opts& opts)
{
  if (!opts.certificateCache) {
    return ConfigurationError("OpenFGA authorization driver requires a "
                              "certificate cache");
  }

  mCertificateCache = opts.certificateCache;
  mEngine = opts.rebacEngine;

  if (!mEngine) {
    auto it_url = opts.config.find(OPENFGA_API_URL);

    if ((it_url == opts.config.end()) || it_url->second.empty()) {
      return ConfigurationError(SSTR("OpenFGA authorization driver requires a "
                                     "ReBAC engine or " << OPENFGA_API_URL));
    }

    auto it_token = opts.config.find(OPENFGA_API_TOKEN);
    auto it_timeout = opts.config.find(OPENFGA_API_TIMEOUT);
    uint64_t timeout = 30;

    if ((it_timeout != opts.config.end()) &&
        !StringConversion::GetSizeFromString(it_timeout->second, timeout)) {
      return ConfigurationError(SSTR("Invalid value \"" << it_timeout->second
                                     << "\" for " << OPENFGA_API_TIMEOUT));
    }

    std::shared_ptr<IHttpClient> client = std::make_shared<CurlHttpClient>
                                          (it_token == opts.config.end() ? "" : it_token->second);
    mEngine = std::make_shared<OpenFgaHttpEngine>(it_url->second, client,
              (long) timeout);
  }

  mStoreId = StringConversion::timebased_uuidstring();
  Status st = mEngine->WriteAuthorizationModel(mStoreId,
              BuiltinAuthorizationModel());

  if (!st.ok()) {
    return WrapStatus(st, "Failed to write authorization model");
  }

  // every authenticated user may view the server
  RebacTuple public_view {"user:*", RelationToString(Relation::CanView),
                          Object::Server().String()};
  st = mEngine->WriteTuples(mStoreId, {public_view}, {});

  if (!st.ok()) {
    return WrapStatus(st, "Failed to write server tuples");
  }

  warden_info("msg=\"loaded OpenFGA driver\" store=%s", mStoreId.c_str());
  return Status();
}

//------------------------------------------------------------------------------
// Resolve the caller into its user object and contextual tuples
//------------------------------------------------------------------------------
Status
OpenFgaAuthorizer::PrepareRequest(const RequestDetails& details,
                                  Relation relation, std::string& user,
                                  std::vector<RebacTuple>& contextual,
                                  bool& bypass)
{
  bypass = false;
  contextual.clear();

  if (details.isInternalOrUnix) {
    bypass = true;
    return Status();
  }

  if (details.authenticationProtocol != AUTH_METHOD_TLS) {
    return ForbiddenError("Only TLS supported");
  }

  if (!mCertificateCache || !mEngine) {
    return ConfigurationError("OpenFGA authorization driver is not loaded");
  }

  CertificateDetails cert;
  Status st = mCertificateCache->GetDetails(details.username, cert);

  if (!st.ok()) {
    return st;
  }

  if ((cert.type == CertificateType::Metrics) &&
      (relation == Relation::CanViewMetrics)) {
    bypass = true;
    return Status();
  }

  Object user_object;
  st = Object::New(ObjectType::User, "", {details.username}, user_object);

  if (!st.ok()) {
    return st;
  }

  user = user_object.String();

  if (cert.unrestricted) {
    contextual.push_back(RebacTuple {user, RelationToString(Relation::Admin),
                                     Object::Server().String()
                                    });
    return Status();
  }

  for (const auto& group : cert.groups) {
    Object group_object;
    st = Object::New(ObjectType::Group, "", {group}, group_object);

    if (!st.ok()) {
      return st;
    }

    contextual.push_back(RebacTuple {user, RelationToString(Relation::Member),
                                     group_object.String()
                                    });
  }

  for (const auto& project : cert.projects) {
    Object project_object;
    st = Object::New(ObjectType::Project, project, {}, project_object);

    if (!st.ok()) {
      return st;
    }

    contextual.push_back(RebacTuple {user, RelationToString(Relation::Operator),
                                     project_object.String()
                                    });
  }

  return Status();
}

//------------------------------------------------------------------------------
// Check a relation on an object
//------------------------------------------------------------------------------
Status
OpenFgaAuthorizer::CheckPermission(const RequestDetails& details,
                                   const Object& object, Relation relation)
{
  std::string user;
  std::vector<RebacTuple> contextual;
  bool bypass = false;
  Status st = PrepareRequest(details, relation, user, contextual, bypass);

  if (!st.ok() || bypass) {
    return st;
  }

  RebacTuple tuple {user, RelationToString(relation), object.String()};
  bool allowed = false;

  if (WARDEN_LOGS_DEBUG) {
    warden_debug("msg=\"checking OpenFGA relation\" user=\"%s\" relation=%s "
                 "object=\"%s\" contextual=%zu", user.c_str(),
                 tuple.relation.c_str(), tuple.object.c_str(), contextual.size());
  }

  st = mEngine->Check(mStoreId, tuple, contextual, allowed);

  if (!st.ok()) {
    return WrapStatus(st, "Failed to check OpenFGA relation");
  }

  if (!allowed) {
    return ForbiddenError(SSTR("User does not have entitlement \""
                               << tuple.relation << "\" on object \""
                               << tuple.object << "\""));
  }

  return Status();
}

//------------------------------------------------------------------------------
// Get a filter for a listing of objects of the given type
//------------------------------------------------------------------------------
Status
OpenFgaAuthorizer::BuildPermissionChecker(const RequestDetails& details,
                                          Relation relation, ObjectType type,
                                          std::unique_ptr<PermissionChecker>& checker)
{
  std::string user;
  std::vector<RebacTuple> contextual;
  bool bypass = false;
  Status st = PrepareRequest(details, relation, user, contextual, bypass);

  if (!st.ok()) {
    return st;
  }

  if (bypass) {
    checker.reset(new StaticPermissionChecker(true));
    return Status();
  }

  std::vector<std::string> objects;
  st = mEngine->ListObjects(mStoreId, ObjectTypeToString(type),
                            RelationToString(relation), user, contextual,
                            objects);

  if (!st.ok()) {
    return WrapStatus(st, SSTR("Failed to list OpenFGA objects of type \""
                               << ObjectTypeToString(type)
                               << "\" with relation \""
                               << RelationToString(relation)
                               << "\" for user \"" << details.username
                               << "\""));
  }

  checker.reset(new ObjectSetPermissionChecker(
                  std::set<std::string>(objects.begin(), objects.end())));
  return Status();
}

//------------------------------------------------------------------------------
// Build the parent tuple of an object
//------------------------------------------------------------------------------
Status
OpenFgaAuthorizer::ParentTuple(ObjectType type, const std::string& project,
                               const std::vector<std::string>& elements,
                               RebacTuple& tuple)
{
  Object child;
  Status st = Object::New(type, project, elements, child);

  if (!st.ok()) {
    return st;
  }

  if ((type == ObjectType::Project) ||
      !GetObjectTypeTraits(type).requireProject) {
    tuple = RebacTuple {Object::Server().String(),
                        RelationToString(Relation::Server), child.String()
                       };
    return Status();
  }

  Object parent;
  st = Object::New(ObjectType::Project, project, {}, parent);

  if (!st.ok()) {
    return st;
  }

  tuple = RebacTuple {parent.String(), RelationToString(Relation::Project),
                      child.String()
                     };
  return Status();
}

//------------------------------------------------------------------------------
// Write or delete the parent tuple of an object
//------------------------------------------------------------------------------
Status
OpenFgaAuthorizer::UpdateParent(ObjectType type, const std::string& project,
                                const std::vector<std::string>& elements,
                                bool add)
{
  if (!mEngine) {
    return ConfigurationError("OpenFGA authorization driver is not loaded");
  }

  RebacTuple tuple;
  Status st = ParentTuple(type, project, elements, tuple);

  if (!st.ok()) {
    return st;
  }

  if (add) {
    st = mEngine->WriteTuples(mStoreId, {tuple}, {});
  } else {
    st = mEngine->WriteTuples(mStoreId, {}, {tuple});
  }

  if (!st.ok()) {
    return WrapStatus(st, SSTR("Failed to " << (add ? "write" : "delete")
                               << " OpenFGA tuple for \"" << tuple.object
                               << "\""));
  }

  return Status();
}

//------------------------------------------------------------------------------
// Move the parent tuple of a renamed object
//------------------------------------------------------------------------------
Status
OpenFgaAuthorizer::RenameParent(ObjectType type, const std::string& project,
                                const std::vector<std::string>& oldElements,
                                const std::vector<std::string>& newElements)
{
  if (!mEngine) {
    return ConfigurationError("OpenFGA authorization driver is not loaded");
  }

  RebacTuple old_tuple;
  RebacTuple new_tuple;
  Status st = ParentTuple(type, project, oldElements, old_tuple);

  if (st.ok()) {
    st = ParentTuple(type, project, newElements, new_tuple);
  }

  if (!st.ok()) {
    return st;
  }

  st = mEngine->WriteTuples(mStoreId, {new_tuple}, {old_tuple});

  if (!st.ok()) {
    return WrapStatus(st, SSTR("Failed to rename OpenFGA tuple \""
                               << old_tuple.object << "\" to \""
                               << new_tuple.object << "\""));
  }

  return Status();
}

Status
OpenFgaAuthorizer::AddProject(int64_t projectId, const std::string& name)
{
  return UpdateParent(ObjectType::Project, name, {}, true);
}

Status
OpenFgaAuthorizer::DeleteProject(int64_t projectId, const std::string& name)
{
  return UpdateParent(ObjectType::Project, name, {}, false);
}

//------------------------------------------------------------------------------
// Rename a project, the tuples of its entities stay with the old name until
// the entities are renamed themselves
//------------------------------------------------------------------------------
Status
OpenFgaAuthorizer::RenameProject(int64_t projectId, const std::string& oldName,
                                 const std::string& newName)
{
  if (!mEngine) {
    return ConfigurationError("OpenFGA authorization driver is not loaded");
  }

  RebacTuple old_tuple;
  RebacTuple new_tuple;
  Status st = ParentTuple(ObjectType::Project, oldName, {}, old_tuple);

  if (st.ok()) {
    st = ParentTuple(ObjectType::Project, newName, {}, new_tuple);
  }

  if (!st.ok()) {
    return st;
  }

  st = mEngine->WriteTuples(mStoreId, {new_tuple}, {old_tuple});
  return (st.ok() ? st : WrapStatus(st, "Failed to rename OpenFGA project"));
}

Status
OpenFgaAuthorizer::AddCertificate(const std::string& fingerprint)
{
  return UpdateParent(ObjectType::Certificate, "", {fingerprint}, true);
}

Status
OpenFgaAuthorizer::DeleteCertificate(const std::string& fingerprint)
{
  return UpdateParent(ObjectType::Certificate, "", {fingerprint}, false);
}

Status
OpenFgaAuthorizer::AddStoragePool(const std::string& name)
{
  return UpdateParent(ObjectType::StoragePool, "", {name}, true);
}

Status
OpenFgaAuthorizer::DeleteStoragePool(const std::string& name)
{
  return UpdateParent(ObjectType::StoragePool, "", {name}, false);
}

Status
OpenFgaAuthorizer::AddImage(const std::string& project,
                            const std::string& fingerprint)
{
  return UpdateParent(ObjectType::Image, project, {fingerprint}, true);
}

Status
OpenFgaAuthorizer::DeleteImage(const std::string& project,
                               const std::string& fingerprint)
{
  return UpdateParent(ObjectType::Image, project, {fingerprint}, false);
}

Status
OpenFgaAuthorizer::AddImageAlias(const std::string& project,
                                 const std::string& name)
{
  return UpdateParent(ObjectType::ImageAlias, project, {name}, true);
}

Status
OpenFgaAuthorizer::DeleteImageAlias(const std::string& project,
                                    const std::string& name)
{
  return UpdateParent(ObjectType::ImageAlias, project, {name}, false);
}

Status
OpenFgaAuthorizer::RenameImageAlias(const std::string& project,
                                    const std::string& oldName,
                                    const std::string& newName)
{
  return RenameParent(ObjectType::ImageAlias, project, {oldName}, {newName});
}

Status
OpenFgaAuthorizer::AddInstance(const std::string& project,
                               const std::string& name)
{
  return UpdateParent(ObjectType::Instance, project, {name}, true);
}

Status
OpenFgaAuthorizer::DeleteInstance(const std::string& project,
                                  const std::string& name)
{
  return UpdateParent(ObjectType::Instance, project, {name}, false);
}

Status
OpenFgaAuthorizer::RenameInstance(const std::string& project,
                                  const std::string& oldName,
                                  const std::string& newName)
{
  return RenameParent(ObjectType::Instance, project, {oldName}, {newName});
}

Status
OpenFgaAuthorizer::AddNetwork(const std::string& project,
                              const std::string& name)
{
  return UpdateParent(ObjectType::Network, project, {name}, true);
}

Status
OpenFgaAuthorizer::DeleteNetwork(const std::string& project,
                                 const std::string& name)
{
  return UpdateParent(ObjectType::Network, project, {name}, false);
}

Status
OpenFgaAuthorizer::RenameNetwork(const std::string& project,
                                 const std::string& oldName,
                                 const std::string& newName)
{
  return RenameParent(ObjectType::Network, project, {oldName}, {newName});
}

Status
OpenFgaAuthorizer::AddNetworkZone(const std::string& project,
                                  const std::string& name)
{
  return UpdateParent(ObjectType::NetworkZone, project, {name}, true);
}

Status
OpenFgaAuthorizer::DeleteNetworkZone(const std::string& project,
                                     const std::string& name)
{
  return UpdateParent(ObjectType::NetworkZone, project, {name}, false);
}

Status
OpenFgaAuthorizer::AddNetworkACL(const std::string& project,
                                 const std::string& name)
{
  return UpdateParent(ObjectType::NetworkACL, project, {name}, true);
}

Status
OpenFgaAuthorizer::DeleteNetworkACL(const std::string& project,
                                    const std::string& name)
{
  return UpdateParent(ObjectType::NetworkACL, project, {name}, false);
}

Status
OpenFgaAuthorizer::RenameNetworkACL(const std::string& project,
                                    const std::string& oldName,
                                    const std::string& newName)
{
  return RenameParent(ObjectType::NetworkACL, project, {oldName}, {newName});
}

Status
OpenFgaAuthorizer::AddProfile(const std::string& project,
                              const std::string& name)
{
  return UpdateParent(ObjectType::Profile, project, {name}, true);
}

Status
OpenFgaAuthorizer::DeleteProfile(const std::string& project,
                                 const std::string& name)
{
  return UpdateParent(ObjectType::Profile, project, {name}, false);
}

Status
OpenFgaAuthorizer::RenameProfile(const std::string& project,
                                 const std::string& oldName,
                                 const std::string& newName)
{
  return RenameParent(ObjectType::Profile, project, {oldName}, {newName});
}

Status
OpenFgaAuthorizer::AddStoragePoolVolume(const std::string& project,
                                        const std::string& pool,
                                        const std::string& volumeType,
                                        const std::string& name,
                                        const std::string& location)
{
  return UpdateParent(ObjectType::StorageVolume, project,
  {pool, volumeType, name, location}, true);
}

Status
OpenFgaAuthorizer::DeleteStoragePoolVolume(const std::string& project,
    const std::string& pool, const std::string& volumeType,
    const std::string& name, const std::string& location)
{
  return UpdateParent(ObjectType::StorageVolume, project,
  {pool, volumeType, name, location}, false);
}

Status
OpenFgaAuthorizer::RenameStoragePoolVolume(const std::string& project,
    const std::string& pool, const std::string& volumeType,
    const std::string& oldName, const std::string& newName,
    const std::string& location)
{
  return RenameParent(ObjectType::StorageVolume, project,
  {pool, volumeType, oldName, location},
  {pool, volumeType, newName, location});
}

Status
OpenFgaAuthorizer::AddStorageBucket(const std::string& project,
                                    const std::string& pool,
                                    const std::string& bucket,
                                    const std::string& location)
{
  return UpdateParent(ObjectType::StorageBucket, project,
  {pool, bucket, location}, true);
}

Status
OpenFgaAuthorizer::DeleteStorageBucket(const std::string& project,
                                       const std::string& pool,
                                       const std::string& bucket,
                                       const std::string& location)
{
  return UpdateParent(ObjectType::StorageBucket, project,
  {pool, bucket, location}, false);
}

WARDENAUTHNAMESPACE_END
