//------------------------------------------------------------------------------
// File: OpenFgaAuthorizer.hh
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
#include "auth/CommonAuthorizer.hh"
#include "auth/certificate/CertificateCache.hh"
#include "auth/rebac/IRebacEngine.hh"
#include <memory>

WARDENAUTHNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! @brief Authorization evaluated by a relationship based engine
//!
//! @description Only callers authenticated with TLS are supported. The
//! restrictions of the client certificate are turned into contextual tuples
//! on every call: an unrestricted certificate is admin of the server, a
//! restricted one is operator of each of its projects and member of each of
//! its groups. The entity hooks persist the parent relations between
//! objects, never any membership.
//------------------------------------------------------------------------------
class OpenFgaAuthorizer : public CommonAuthorizer
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  OpenFgaAuthorizer() = default;

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  virtual ~OpenFgaAuthorizer() = default;

  //----------------------------------------------------------------------------
  //! Load the driver. Requires a certificate cache and either an engine or
  //! the openfga.api.url configuration key.
  //----------------------------------------------------------------------------
  warden::common::Status Load(const Opts& opts) override;

  using CommonAuthorizer::CheckPermission;

  warden::common::Status
  CheckPermission(const RequestDetails& details, const Object& object,
                  Relation relation) override;

  //! Store the model and the structural tuples live in
  const std::string& GetStoreId() const
  {
    return mStoreId;
  }

  warden::common::Status AddProject(int64_t projectId,
                                    const std::string& name) override;
  warden::common::Status DeleteProject(int64_t projectId,
                                       const std::string& name) override;
  warden::common::Status RenameProject(int64_t projectId,
                                       const std::string& oldName,
                                       const std::string& newName) override;
  warden::common::Status AddCertificate(const std::string& fingerprint) override;
  warden::common::Status DeleteCertificate(const std::string& fingerprint)
  override;
  warden::common::Status AddStoragePool(const std::string& name) override;
  warden::common::Status DeleteStoragePool(const std::string& name) override;
  warden::common::Status AddImage(const std::string& project,
                                  const std::string& fingerprint) override;
  warden::common::Status DeleteImage(const std::string& project,
                                     const std::string& fingerprint) override;
  warden::common::Status AddImageAlias(const std::string& project,
                                       const std::string& name) override;
  warden::common::Status DeleteImageAlias(const std::string& project,
                                          const std::string& name) override;
  warden::common::Status RenameImageAlias(const std::string& project,
                                          const std::string& oldName,
                                          const std::string& newName) override;
  warden::common::Status AddInstance(const std::string& project,
                                     const std::string& name) override;
  warden::common::Status DeleteInstance(const std::string& project,
                                        const std::string& name) override;
  warden::common::Status RenameInstance(const std::string& project,
                                        const std::string& oldName,
                                        const std::string& newName) override;
  warden::common::Status AddNetwork(const std::string& project,
                                    const std::string& name) override;
  warden::common::Status DeleteNetwork(const std::string& project,
                                       const std::string& name) override;
  warden::common::Status RenameNetwork(const std::string& project,
                                       const std::string& oldName,
                                       const std::string& newName) override;
  warden::common::Status AddNetworkZone(const std::string& project,
                                        const std::string& name) override;
  warden::common::Status DeleteNetworkZone(const std::string& project,
      const std::string& name) override;
  warden::common::Status AddNetworkACL(const std::string& project,
                                       const std::string& name) override;
  warden::common::Status DeleteNetworkACL(const std::string& project,
                                          const std::string& name) override;
  warden::common::Status RenameNetworkACL(const std::string& project,
                                          const std::string& oldName,
                                          const std::string& newName) override;
  warden::common::Status AddProfile(const std::string& project,
                                    const std::string& name) override;
  warden::common::Status DeleteProfile(const std::string& project,
                                       const std::string& name) override;
  warden::common::Status RenameProfile(const std::string& project,
                                       const std::string& oldName,
                                       const std::string& newName) override;
  warden::common::Status AddStoragePoolVolume(const std::string& project,
      const std::string& pool, const std::string& volumeType,
      const std::string& name, const std::string& location) override;
  warden::common::Status DeleteStoragePoolVolume(const std::string& project,
      const std::string& pool, const std::string& volumeType,
      const std::string& name, const std::string& location) override;
  warden::common::Status RenameStoragePoolVolume(const std::string& project,
      const std::string& pool, const std::string& volumeType,
      const std::string& oldName, const std::string& newName,
      const std::string& location) override;
  warden::common::Status AddStorageBucket(const std::string& project,
                                          const std::string& pool,
                                          const std::string& bucket,
                                          const std::string& location) override;
  warden::common::Status DeleteStorageBucket(const std::string& project,
      const std::string& pool, const std::string& bucket,
      const std::string& location) override;

protected:
  warden::common::Status
  BuildPermissionChecker(const RequestDetails& details, Relation relation,
                         ObjectType type,
                         std::unique_ptr<PermissionChecker>& checker) override;

private:
  //----------------------------------------------------------------------------
  //! Resolve the caller into its user object and contextual tuples
  //!
  //! @param details caller context
  //! @param relation requested relation
  //! @param user set to the user object string
  //! @param contextual set to the tuples describing the certificate
  //! @param bypass set to true if the decision is allowed without the engine
  //----------------------------------------------------------------------------
  warden::common::Status PrepareRequest(const RequestDetails& details,
                                        Relation relation, std::string& user,
                                        std::vector<RebacTuple>& contextual,
                                        bool& bypass);

  //----------------------------------------------------------------------------
  //! Write or delete the parent tuple of an object
  //!
  //! @param type child type
  //! @param project child project, empty for children of the server
  //! @param elements child identifier elements
  //! @param add write if true, delete otherwise
  //----------------------------------------------------------------------------
  warden::common::Status UpdateParent(ObjectType type,
                                      const std::string& project,
                                      const std::vector<std::string>& elements,
                                      bool add);

  //----------------------------------------------------------------------------
  //! Move the parent tuple of a renamed object
  //----------------------------------------------------------------------------
  warden::common::Status RenameParent(ObjectType type,
                                      const std::string& project,
                                      const std::vector<std::string>& oldElements,
                                      const std::vector<std::string>& newElements);

  //----------------------------------------------------------------------------
  //! Build the parent tuple of an object
  //----------------------------------------------------------------------------
  static warden::common::Status ParentTuple(ObjectType type,
      const std::string& project,
      const std::vector<std::string>& elements,
      RebacTuple& tuple);

  std::shared_ptr<CertificateCache> mCertificateCache;
  std::shared_ptr<IRebacEngine> mEngine;
  std::string mStoreId;
};

WARDENAUTHNAMESPACE_END
