//------------------------------------------------------------------------------
// File: RequestDetails.hh
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
#include <string>

WARDENAUTHNAMESPACE_BEGIN

//! Authentication methods a caller can have used
static constexpr auto AUTH_METHOD_TLS = "tls";
static constexpr auto AUTH_METHOD_CANDID = "candid";
static constexpr auto AUTH_METHOD_OIDC = "oidc";

//------------------------------------------------------------------------------
//! Caller context of a single request. Filled in by the request handling layer
//! and never modified by the authorization drivers.
//------------------------------------------------------------------------------
struct RequestDetails {
  //! method the caller authenticated with (tls, candid, oidc)
  std::string authenticationProtocol;
  //! caller identity: certificate fingerprint for tls, user name otherwise
  std::string username;
  //! project the request is scoped to
  std::string projectName;
  //! request asked for objects of all projects
  bool isAllProjectsRequest = false;
  //! request came over the unix socket or from a cluster member
  bool isInternalOrUnix = false;
};

WARDENAUTHNAMESPACE_END
