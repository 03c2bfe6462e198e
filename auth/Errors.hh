//------------------------------------------------------------------------------
// File: Errors.hh
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
#include <cerrno>
#include <string>

WARDENAUTHNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Error codes used by the authorization layer
//!
//! EINVAL      malformed object, unknown type, wrong arity, invalid relation
//! EPERM       no matching grant
//! ENODEV      unknown authorization driver
//! ENOKEY      missing or invalid driver configuration
//! ECOMM       policy server unreachable or answering with an error
//! ECONNRESET  policy server dropped a long-poll connection
//! EFAULT      no coarse permission mapped to an object type and relation
//------------------------------------------------------------------------------
inline warden::common::Status
InvalidArgumentError(const std::string& msg)
{
  return warden::common::Status(EINVAL, msg);
}

inline warden::common::Status
ForbiddenError(const std::string& msg)
{
  return warden::common::Status(EPERM, msg);
}

inline warden::common::Status
UnknownDriverError(const std::string& msg)
{
  return warden::common::Status(ENODEV, msg);
}

inline warden::common::Status
ConfigurationError(const std::string& msg)
{
  return warden::common::Status(ENOKEY, msg);
}

inline warden::common::Status
RemoteUnavailableError(const std::string& msg)
{
  return warden::common::Status(ECOMM, msg);
}

inline warden::common::Status
MappingGapError(const std::string& msg)
{
  return warden::common::Status(EFAULT, msg);
}

inline bool
IsForbidden(const warden::common::Status& st)
{
  return (st.getErrc() == EPERM);
}

//------------------------------------------------------------------------------
//! Prefix the message of a failed status with some context, the error code
//! is kept. An ok status is returned unchanged.
//------------------------------------------------------------------------------
warden::common::Status WrapStatus(const warden::common::Status& st,
                                  const std::string& context);

//------------------------------------------------------------------------------
//! Convert a decision result into what is reported to a remote caller. A
//! clean Forbidden is passed through, any other failure is logged together
//! with the object, relation and protocol and replaced by an opaque
//! Forbidden.
//!
//! @param st decision result
//! @param object object the decision was about
//! @param relation requested relation
//! @param protocol authentication protocol of the caller
//!
//! @return status safe to return to the caller
//------------------------------------------------------------------------------
warden::common::Status ToClientStatus(const warden::common::Status& st,
                                      const std::string& object,
                                      const std::string& relation,
                                      const std::string& protocol);

WARDENAUTHNAMESPACE_END
