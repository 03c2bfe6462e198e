//------------------------------------------------------------------------------
// File: TlsAuthorizer.hh
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
#include <memory>

WARDENAUTHNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! @brief Authorization based on the restrictions of client certificates
//!
//! @description An unrestricted client certificate grants everything. A
//! restricted one grants access to the projects it is bound to and read
//! access to the server and to storage pools, certificates and groups.
//! Metrics certificates only grant can_view_metrics. Callers which did not
//! authenticate with TLS are not subject to this driver and are allowed.
//------------------------------------------------------------------------------
class TlsAuthorizer : public CommonAuthorizer
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  TlsAuthorizer() = default;

  //----------------------------------------------------------------------------
  //! Destructor
  //----------------------------------------------------------------------------
  virtual ~TlsAuthorizer() = default;

  //----------------------------------------------------------------------------
  //! Load the driver, requires a certificate cache
  //----------------------------------------------------------------------------
  warden::common::Status Load(const Opts& opts) override;

  using CommonAuthorizer::CheckPermission;

  warden::common::Status
  CheckPermission(const RequestDetails& details, const Object& object,
                  Relation relation) override;

protected:
  warden::common::Status
  BuildPermissionChecker(const RequestDetails& details, Relation relation,
                         ObjectType type,
                         std::unique_ptr<PermissionChecker>& checker) override;

private:
  std::shared_ptr<CertificateCache> mCertificateCache;
};

WARDENAUTHNAMESPACE_END
