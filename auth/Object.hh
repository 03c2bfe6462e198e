//------------------------------------------------------------------------------
// File: Object.hh
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
#include "common/Status.hh"
#include <ostream>
#include <string>
#include <vector>

WARDENAUTHNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! @brief Authorization object
//!
//! @description An object always has the form <type>:<identifier> where the
//! identifier is a "/" delimited list of elements uniquely identifying a
//! resource. For project scoped types the first element is the project.
//!
//!   instance:default/c1                       instance c1 in project default
//!   storage_pool:local                        storage pool local
//!   storage_volume:default/local/custom/vol1/ custom volume without location
//!
//! A "/" inside an element is escaped as "%2F". A literal "%2F" is left as
//! is, so such an element reads back as "/" when the object is parsed from
//! its string form. Objects can only be built through the validating
//! factories, a default constructed object is empty and only serves as
//! placeholder for output arguments.
//------------------------------------------------------------------------------
class Object
{
public:
  //----------------------------------------------------------------------------
  //! Constructor of an empty object
  //----------------------------------------------------------------------------
  Object() : mType(ObjectType::Server) {}

  //----------------------------------------------------------------------------
  //! Build an object of the given type
  //!
  //! @param type object type
  //! @param project project name, ignored for types without project
  //! @param elements identifier elements in the order of the resource URL
  //! @param out built object
  //!
  //! @return InvalidArgument status if the element count does not match the
  //!         type or the project is missing
  //----------------------------------------------------------------------------
  static warden::common::Status New(ObjectType type, const std::string& project,
                                    const std::vector<std::string>& elements,
                                    Object& out);

  //----------------------------------------------------------------------------
  //! Parse an object from its string form
  //!
  //! @return InvalidArgument status for an unknown type, missing type
  //!         delimiter or wrong element count
  //----------------------------------------------------------------------------
  static warden::common::Status FromString(const std::string& str, Object& out);

  //----------------------------------------------------------------------------
  //! Named constructors. They throw std::invalid_argument when handed an
  //! empty project name.
  //----------------------------------------------------------------------------
  static Object User(const std::string& name);
  static Object Group(const std::string& name);
  static Object Server();
  static Object Certificate(const std::string& fingerprint);
  static Object StoragePool(const std::string& name);
  static Object Project(const std::string& project);
  static Object Image(const std::string& project, const std::string& fingerprint);
  static Object ImageAlias(const std::string& project, const std::string& name);
  static Object Instance(const std::string& project, const std::string& name);
  static Object Network(const std::string& project, const std::string& name);
  static Object NetworkACL(const std::string& project, const std::string& name);
  static Object NetworkZone(const std::string& project, const std::string& name);
  static Object Profile(const std::string& project, const std::string& name);
  static Object StorageBucket(const std::string& project, const std::string& pool,
                              const std::string& bucket,
                              const std::string& location);
  static Object StorageVolume(const std::string& project, const std::string& pool,
                              const std::string& type, const std::string& name,
                              const std::string& location);

  ObjectType Type() const
  {
    return mType;
  }

  //! Project of the object, empty for types without project
  const std::string& Project() const
  {
    return mProject;
  }

  //! Unescaped identifier elements, project excluded
  const std::vector<std::string>& Elements() const
  {
    return mElements;
  }

  //! Identifier without the type prefix
  std::string Ref() const;

  //! Full string form <type>:<identifier>
  const std::string& String() const
  {
    return mString;
  }

  bool empty() const
  {
    return mString.empty();
  }

  bool operator==(const Object& other) const
  {
    return mString == other.mString;
  }

  bool operator!=(const Object& other) const
  {
    return mString != other.mString;
  }

  bool operator<(const Object& other) const
  {
    return mString < other.mString;
  }

  //----------------------------------------------------------------------------
  //! Escape the element delimiter
  //----------------------------------------------------------------------------
  static std::string Escape(const std::string& element);

  //----------------------------------------------------------------------------
  //! Unescape the element delimiter
  //----------------------------------------------------------------------------
  static std::string Unescape(const std::string& element);

private:
  static Object MustNew(ObjectType type, const std::string& project,
                        const std::vector<std::string>& elements);

  ObjectType mType;
  std::string mProject;
  std::vector<std::string> mElements;
  std::string mString;
};

inline std::ostream&
operator<<(std::ostream& os, const Object& object)
{
  return os << object.String();
}

//------------------------------------------------------------------------------
//! Build the object an API request refers to
//!
//! @param type object type
//! @param project project query parameter, "default" if empty
//! @param location target member of the request, appended to storage volume
//!        and storage bucket objects
//! @param pathArgs unescaped path variables in URL order. For project
//!        objects the first one is the project name when present.
//! @param out built object
//!
//! @return InvalidArgument status if the object cannot be built
//------------------------------------------------------------------------------
warden::common::Status ObjectFromRequestParams(ObjectType type,
    const std::string& project,
    const std::string& location,
    const std::vector<std::string>& pathArgs,
    Object& out);

WARDENAUTHNAMESPACE_END
