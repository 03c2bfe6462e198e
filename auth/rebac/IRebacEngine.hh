//------------------------------------------------------------------------------
// File: IRebacEngine.hh
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
#include <string>
#include <vector>

WARDENAUTHNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Relationship tuple: <user> has <relation> on <object>
//------------------------------------------------------------------------------
struct RebacTuple {
  std::string user;
  std::string relation;
  std::string object;

  bool operator==(const RebacTuple& other) const
  {
    return (user == other.user) && (relation == other.relation) &&
           (object == other.object);
  }
};

//------------------------------------------------------------------------------
//! @brief Relationship based access control evaluation engine
//!
//! All methods are called concurrently from request threads and must be
//! thread-safe. Contextual tuples only exist for the duration of a single
//! call and are never persisted by the engine.
//------------------------------------------------------------------------------
class IRebacEngine
{
public:
  virtual ~IRebacEngine() = default;

  //----------------------------------------------------------------------------
  //! Install the authorization model for the given store
  //!
  //! @param storeId store identifier
  //! @param model authorization model in the engine's JSON schema form
  //----------------------------------------------------------------------------
  virtual warden::common::Status
  WriteAuthorizationModel(const std::string& storeId,
                          const std::string& model) = 0;

  //----------------------------------------------------------------------------
  //! Check if a tuple holds
  //!
  //! @param storeId store identifier
  //! @param tuple tuple to check
  //! @param contextual additional tuples valid only for this call
  //! @param allowed set to the answer of the engine
  //----------------------------------------------------------------------------
  virtual warden::common::Status
  Check(const std::string& storeId, const RebacTuple& tuple,
        const std::vector<RebacTuple>& contextual, bool& allowed) = 0;

  //----------------------------------------------------------------------------
  //! List the objects of a type on which the user holds the relation
  //!
  //! @param objects set to the string forms <type>:<identifier>
  //----------------------------------------------------------------------------
  virtual warden::common::Status
  ListObjects(const std::string& storeId, const std::string& type,
              const std::string& relation, const std::string& user,
              const std::vector<RebacTuple>& contextual,
              std::vector<std::string>& objects) = 0;

  //----------------------------------------------------------------------------
  //! Write and delete persisted tuples
  //----------------------------------------------------------------------------
  virtual warden::common::Status
  WriteTuples(const std::string& storeId, const std::vector<RebacTuple>& writes,
              const std::vector<RebacTuple>& deletes) = 0;
};

WARDENAUTHNAMESPACE_END
