//------------------------------------------------------------------------------
// File: CommonAuthorizer.hh
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
#include "auth/Authorizer.hh"
#include "common/Logging.hh"

WARDENAUTHNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! @brief Base class of the authorization drivers
//!
//! @description Keeps the driver name, translates request parameters into
//! authorization objects and implements all entity hooks as no-ops. A driver
//! only overrides the hooks it needs together with Load and the object based
//! CheckPermission.
//------------------------------------------------------------------------------
class CommonAuthorizer : public Authorizer, public warden::common::LogId
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  CommonAuthorizer() = default;

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  virtual ~CommonAuthorizer() = default;

  //----------------------------------------------------------------------------
  //! Set the driver name, called once before Load
  //----------------------------------------------------------------------------
  virtual warden::common::Status Init(const std::string& driverName);

  //----------------------------------------------------------------------------
  //! Configure the driver and start its background activity
  //----------------------------------------------------------------------------
  virtual warden::common::Status Load(const Opts& opts) = 0;

  std::string Driver() const override
  {
    return mDriverName;
  }

  warden::common::Status StopService() override
  {
    return warden::common::Status();
  }

  //----------------------------------------------------------------------------
  //! Build the object from the request parameters, validate the relation and
  //! take the decision. Failures other than Forbidden are logged and reported
  //! as an opaque Forbidden.
  //----------------------------------------------------------------------------
  warden::common::Status
  CheckPermission(const RequestDetails& details, Relation relation,
                  ObjectType type, const std::string& project,
                  const std::string& location,
                  const std::vector<std::string>& pathArgs) override;

  using Authorizer::CheckPermission;

  //----------------------------------------------------------------------------
  //! Validate the relation and build the listing filter of the driver.
  //! Failures other than Forbidden are logged and reported as an opaque
  //! Forbidden.
  //----------------------------------------------------------------------------
  warden::common::Status
  GetPermissionChecker(const RequestDetails& details, Relation relation,
                       ObjectType type,
                       std::unique_ptr<PermissionChecker>& checker) override;

  warden::common::Status AddProject(int64_t, const std::string&) override;
  warden::common::Status DeleteProject(int64_t, const std::string&) override;
  warden::common::Status RenameProject(int64_t, const std::string&,
                                       const std::string&) override;
  warden::common::Status AddCertificate(const std::string&) override;
  warden::common::Status DeleteCertificate(const std::string&) override;
  warden::common::Status AddStoragePool(const std::string&) override;
  warden::common::Status DeleteStoragePool(const std::string&) override;
  warden::common::Status AddImage(const std::string&,
                                  const std::string&) override;
  warden::common::Status DeleteImage(const std::string&,
                                     const std::string&) override;
  warden::common::Status AddImageAlias(const std::string&,
                                       const std::string&) override;
  warden::common::Status DeleteImageAlias(const std::string&,
                                          const std::string&) override;
  warden::common::Status RenameImageAlias(const std::string&,
                                          const std::string&,
                                          const std::string&) override;
  warden::common::Status AddInstance(const std::string&,
                                     const std::string&) override;
  warden::common::Status DeleteInstance(const std::string&,
                                        const std::string&) override;
  warden::common::Status RenameInstance(const std::string&,
                                        const std::string&,
                                        const std::string&) override;
  warden::common::Status AddNetwork(const std::string&,
                                    const std::string&) override;
  warden::common::Status DeleteNetwork(const std::string&,
                                       const std::string&) override;
  warden::common::Status RenameNetwork(const std::string&,
                                       const std::string&,
                                       const std::string&) override;
  warden::common::Status AddNetworkZone(const std::string&,
                                        const std::string&) override;
  warden::common::Status DeleteNetworkZone(const std::string&,
      const std::string&) override;
  warden::common::Status AddNetworkACL(const std::string&,
                                       const std::string&) override;
  warden::common::Status DeleteNetworkACL(const std::string&,
                                          const std::string&) override;
  warden::common::Status RenameNetworkACL(const std::string&,
                                          const std::string&,
                                          const std::string&) override;
  warden::common::Status AddProfile(const std::string&,
                                    const std::string&) override;
  warden::common::Status DeleteProfile(const std::string&,
                                       const std::string&) override;
  warden::common::Status RenameProfile(const std::string&,
                                       const std::string&,
                                       const std::string&) override;
  warden::common::Status AddStoragePoolVolume(const std::string&,
      const std::string&, const std::string&, const std::string&,
      const std::string&) override;
  warden::common::Status DeleteStoragePoolVolume(const std::string&,
      const std::string&, const std::string&, const std::string&,
      const std::string&) override;
  warden::common::Status RenameStoragePoolVolume(const std::string&,
      const std::string&, const std::string&, const std::string&,
      const std::string&, const std::string&) override;
  warden::common::Status AddStorageBucket(const std::string&,
                                          const std::string&,
                                          const std::string&,
                                          const std::string&) override;
  warden::common::Status DeleteStorageBucket(const std::string&,
      const std::string&, const std::string&, const std::string&) override;

protected:
  //----------------------------------------------------------------------------
  //! Build the listing filter for a validated relation
  //!
  //! @param details caller context
  //! @param relation relation every listed object must grant
  //! @param type type of the listed objects
  //! @param checker set to the filter on success
  //!
  //! @return ok, Forbidden or the error that prevented the decision
  //----------------------------------------------------------------------------
  virtual warden::common::Status
  BuildPermissionChecker(const RequestDetails& details, Relation relation,
                         ObjectType type,
                         std::unique_ptr<PermissionChecker>& checker) = 0;

  //----------------------------------------------------------------------------
  //! Decision for a restricted caller on objects outside of any project
  //!
  //! Server objects grant the view relations, storage pools, certificates and
  //! groups grant can_view. Everything else is reserved to unrestricted
  //! callers.
  //!
  //! @param type object type
  //! @param relation requested relation
  //! @param allowed set to the decision
  //!
  //! @return true if the type is not project scoped and allowed was set
  //----------------------------------------------------------------------------
  static bool CheckNonProjectType(ObjectType type, Relation relation,
                                  bool& allowed);

  std::string mDriverName;
};

WARDENAUTHNAMESPACE_END
