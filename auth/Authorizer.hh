//------------------------------------------------------------------------------
// File: Authorizer.hh
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
#include "auth/Object.hh"
#include "auth/PermissionChecker.hh"
#include "auth/RequestDetails.hh"
#include "common/Status.hh"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

WARDENAUTHNAMESPACE_BEGIN

class CertificateCache;
class IRebacEngine;

//! Names of the built-in authorization drivers
static constexpr auto DRIVER_TLS = "tls";
static constexpr auto DRIVER_RBAC = "rbac";
static constexpr auto DRIVER_OPENFGA = "openfga";

//------------------------------------------------------------------------------
//! Callback enumerating the existing projects as id -> name
//------------------------------------------------------------------------------
using ProjectsGetFunc =
  std::function<warden::common::Status(std::map<int64_t, std::string>&)>;

//------------------------------------------------------------------------------
//! Options handed to a driver when it is loaded
//------------------------------------------------------------------------------
struct Opts {
  std::map<std::string, std::string> config;
  ProjectsGetFunc projectsGetFunc;
  std::shared_ptr<IRebacEngine> rebacEngine;
  std::shared_ptr<CertificateCache> certificateCache;
};

using Option = std::function<void(Opts&)>;

//------------------------------------------------------------------------------
//! Driver configuration as key -> value map
//------------------------------------------------------------------------------
inline Option
WithConfig(std::map<std::string, std::string> config)
{
  return [config](Opts & opts) {
    opts.config = config;
  };
}

//------------------------------------------------------------------------------
//! Callback used to enumerate the existing projects
//------------------------------------------------------------------------------
inline Option
WithProjectsGetFunc(ProjectsGetFunc func)
{
  return [func](Opts & opts) {
    opts.projectsGetFunc = func;
  };
}

//------------------------------------------------------------------------------
//! Relationship evaluation engine
//------------------------------------------------------------------------------
inline Option
WithRebacEngine(std::shared_ptr<IRebacEngine> engine)
{
  return [engine](Opts & opts) {
    opts.rebacEngine = engine;
  };
}

//------------------------------------------------------------------------------
//! Cache of the trusted certificates
//------------------------------------------------------------------------------
inline Option
WithCertificateCache(std::shared_ptr<CertificateCache> cache)
{
  return [cache](Opts & opts) {
    opts.certificateCache = cache;
  };
}

//------------------------------------------------------------------------------
//! @brief Authorization driver interface
//!
//! @description Answers if the caller of a request holds a relation on an
//! authorization object and produces filters for listings. The entity hooks
//! are called whenever an entity is created, renamed or deleted so that a
//! driver keeping state of its own can follow. All methods may be called
//! concurrently from request threads.
//------------------------------------------------------------------------------
class Authorizer
{
public:
  virtual ~Authorizer() = default;

  //----------------------------------------------------------------------------
  //! Name of the driver
  //----------------------------------------------------------------------------
  virtual std::string Driver() const = 0;

  //----------------------------------------------------------------------------
  //! Stop all background activity of the driver
  //----------------------------------------------------------------------------
  virtual warden::common::Status StopService() = 0;

  //----------------------------------------------------------------------------
  //! Check a relation on the object addressed by request parameters
  //!
  //! @param details caller context
  //! @param relation requested relation
  //! @param type object type
  //! @param project project query parameter
  //! @param location target member of the request
  //! @param pathArgs unescaped path variables of the request URL
  //!
  //! @return ok if allowed, InvalidArgument for a malformed object or
  //!         relation, Forbidden otherwise
  //----------------------------------------------------------------------------
  virtual warden::common::Status
  CheckPermission(const RequestDetails& details, Relation relation,
                  ObjectType type, const std::string& project,
                  const std::string& location,
                  const std::vector<std::string>& pathArgs) = 0;

  //----------------------------------------------------------------------------
  //! Check a relation on an object
  //!
  //! @return ok if allowed, Forbidden if not, any other error if the
  //!         decision could not be taken
  //----------------------------------------------------------------------------
  virtual warden::common::Status
  CheckPermission(const RequestDetails& details, const Object& object,
                  Relation relation) = 0;

  //----------------------------------------------------------------------------
  //! Get a filter for a listing of objects of the given type
  //!
  //! @param details caller context
  //! @param relation relation every listed object must grant
  //! @param type type of the listed objects
  //! @param checker set to the filter on success
  //----------------------------------------------------------------------------
  virtual warden::common::Status
  GetPermissionChecker(const RequestDetails& details, Relation relation,
                       ObjectType type,
                       std::unique_ptr<PermissionChecker>& checker) = 0;

  //----------------------------------------------------------------------------
  //! Entity hooks
  //----------------------------------------------------------------------------
  virtual warden::common::Status AddProject(int64_t projectId,
      const std::string& name) = 0;
  virtual warden::common::Status DeleteProject(int64_t projectId,
      const std::string& name) = 0;
  virtual warden::common::Status RenameProject(int64_t projectId,
      const std::string& oldName,
      const std::string& newName) = 0;

  virtual warden::common::Status AddCertificate(const std::string&
      fingerprint) = 0;
  virtual warden::common::Status DeleteCertificate(const std::string&
      fingerprint) = 0;

  virtual warden::common::Status AddStoragePool(const std::string& name) = 0;
  virtual warden::common::Status DeleteStoragePool(const std::string& name) = 0;

  virtual warden::common::Status AddImage(const std::string& project,
                                          const std::string& fingerprint) = 0;
  virtual warden::common::Status DeleteImage(const std::string& project,
      const std::string& fingerprint) = 0;

  virtual warden::common::Status AddImageAlias(const std::string& project,
      const std::string& name) = 0;
  virtual warden::common::Status DeleteImageAlias(const std::string& project,
      const std::string& name) = 0;
  virtual warden::common::Status RenameImageAlias(const std::string& project,
      const std::string& oldName,
      const std::string& newName) = 0;

  virtual warden::common::Status AddInstance(const std::string& project,
      const std::string& name) = 0;
  virtual warden::common::Status DeleteInstance(const std::string& project,
      const std::string& name) = 0;
  virtual warden::common::Status RenameInstance(const std::string& project,
      const std::string& oldName,
      const std::string& newName) = 0;

  virtual warden::common::Status AddNetwork(const std::string& project,
      const std::string& name) = 0;
  virtual warden::common::Status DeleteNetwork(const std::string& project,
      const std::string& name) = 0;
  virtual warden::common::Status RenameNetwork(const std::string& project,
      const std::string& oldName,
      const std::string& newName) = 0;

  virtual warden::common::Status AddNetworkZone(const std::string& project,
      const std::string& name) = 0;
  virtual warden::common::Status DeleteNetworkZone(const std::string& project,
      const std::string& name) = 0;

  virtual warden::common::Status AddNetworkACL(const std::string& project,
      const std::string& name) = 0;
  virtual warden::common::Status DeleteNetworkACL(const std::string& project,
      const std::string& name) = 0;
  virtual warden::common::Status RenameNetworkACL(const std::string& project,
      const std::string& oldName,
      const std::string& newName) = 0;

  virtual warden::common::Status AddProfile(const std::string& project,
      const std::string& name) = 0;
  virtual warden::common::Status DeleteProfile(const std::string& project,
      const std::string& name) = 0;
  virtual warden::common::Status RenameProfile(const std::string& project,
      const std::string& oldName,
      const std::string& newName) = 0;

  virtual warden::common::Status
  AddStoragePoolVolume(const std::string& project, const std::string& pool,
                       const std::string& volumeType, const std::string& name,
                       const std::string& location) = 0;
  virtual warden::common::Status
  DeleteStoragePoolVolume(const std::string& project, const std::string& pool,
                          const std::string& volumeType,
                          const std::string& name,
                          const std::string& location) = 0;
  virtual warden::common::Status
  RenameStoragePoolVolume(const std::string& project, const std::string& pool,
                          const std::string& volumeType,
                          const std::string& oldName,
                          const std::string& newName,
                          const std::string& location) = 0;

  virtual warden::common::Status
  AddStorageBucket(const std::string& project, const std::string& pool,
                   const std::string& bucket, const std::string& location) = 0;
  virtual warden::common::Status
  DeleteStorageBucket(const std::string& project, const std::string& pool,
                      const std::string& bucket,
                      const std::string& location) = 0;
};

WARDENAUTHNAMESPACE_END
