//------------------------------------------------------------------------------
// File: PermissionChecker.hh
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
#include "auth/Object.hh"
#include <set>
#include <string>

WARDENAUTHNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! @brief Filter applied to the objects of a listing
//!
//! A checker is produced once per list request and then evaluated for every
//! object of that listing. It must not perform any remote call.
//------------------------------------------------------------------------------
class PermissionChecker
{
public:
  virtual ~PermissionChecker() = default;

  //----------------------------------------------------------------------------
  //! Check if the caller may see the given object
  //----------------------------------------------------------------------------
  virtual bool Allows(const Object& object) const = 0;
};

//------------------------------------------------------------------------------
//! Checker with a fixed answer
//------------------------------------------------------------------------------
class StaticPermissionChecker : public PermissionChecker
{
public:
  explicit StaticPermissionChecker(bool allow) : mAllow(allow) {}

  bool Allows(const Object& object) const override
  {
    return mAllow;
  }

private:
  bool mAllow;
};

//------------------------------------------------------------------------------
//! Checker allowing objects belonging to one of the given projects
//------------------------------------------------------------------------------
class ProjectPermissionChecker : public PermissionChecker
{
public:
  explicit ProjectPermissionChecker(std::set<std::string> projects) :
    mProjects(std::move(projects)) {}

  bool Allows(const Object& object) const override
  {
    return (mProjects.count(object.Project()) != 0);
  }

private:
  std::set<std::string> mProjects;
};

//------------------------------------------------------------------------------
//! Checker allowing objects whose string form is in the given set
//------------------------------------------------------------------------------
class ObjectSetPermissionChecker : public PermissionChecker
{
public:
  explicit ObjectSetPermissionChecker(std::set<std::string> objects) :
    mObjects(std::move(objects)) {}

  bool Allows(const Object& object) const override
  {
    return (mObjects.count(object.String()) != 0);
  }

private:
  std::set<std::string> mObjects;
};

WARDENAUTHNAMESPACE_END
