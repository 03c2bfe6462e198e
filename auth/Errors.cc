//------------------------------------------------------------------------------
// File: Errors.cc
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

#include "auth/Errors.hh"
#include "common/Logging.hh"

WARDENAUTHNAMESPACE_BEGIN

using warden::common::Status;

//------------------------------------------------------------------------------
// Prefix a failed status with context
//------------------------------------------------------------------------------
Status
WrapStatus(const Status& st, const std::string& context)
{
  if (st.ok()) {
    return st;
  }

  return Status(st.getErrc(), context + ": " + st.getMsg());
}

//------------------------------------------------------------------------------
// Convert a decision result for a remote caller
//------------------------------------------------------------------------------
Status
ToClientStatus(const Status& st, const std::string& object,
               const std::string& relation, const std::string& protocol)
{
  if (st.ok() || IsForbidden(st)) {
    return st;
  }

  warden_static_err("msg=\"authorization check failed\" object=\"%s\" "
                    "relation=%s protocol=%s errc=%d err=\"%s\"",
                    object.c_str(), relation.c_str(), protocol.c_str(),
                    st.getErrc(), st.getMsg().c_str());
  return ForbiddenError("Forbidden");
}

WARDENAUTHNAMESPACE_END
