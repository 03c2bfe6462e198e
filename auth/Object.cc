//------------------------------------------------------------------------------
// File: Object.cc
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

#include "auth/Object.hh"
#include "auth/Errors.hh"
#include "common/Logging.hh"
#include "common/StringConversion.hh"
#include <stdexcept>

WARDENAUTHNAMESPACE_BEGIN

using warden::common::Status;
using warden::common::StringConversion;

namespace
{
const char sTypeDelimiter = ':';
const char sElementDelimiter = '/';
const std::string sServerElement = "main";
const std::string sDefaultProject = "default";
}

//------------------------------------------------------------------------------
// Escape the element delimiter
//------------------------------------------------------------------------------
std::string
Object::Escape(const std::string& element)
{
  std::string escaped = element;
  StringConversion::ReplaceStringInPlace(escaped, "/", "%2F");
  return escaped;
}

//------------------------------------------------------------------------------
// Unescape the element delimiter
//------------------------------------------------------------------------------
std::string
Object::Unescape(const std::string& element)
{
  std::string unescaped = element;
  StringConversion::ReplaceStringInPlace(unescaped, "%2F", "/");
  return unescaped;
}

//------------------------------------------------------------------------------
// Build an object of the given type
//------------------------------------------------------------------------------
Status
Object::New(ObjectType type, const std::string& project,
            const std::vector<std::string>& elements, Object& out)
{
  const ObjectTypeTraits& traits = GetObjectTypeTraits(type);
  const char* type_name = ObjectTypeToString(type);

  if (traits.requireProject && project.empty()) {
    return InvalidArgumentError(SSTR("Authorization objects of type \""
                                     << type_name << "\" require a project"));
  }

  if (elements.size() != traits.nElements) {
    return InvalidArgumentError(SSTR("Authorization objects of type \""
                                     << type_name << "\" require "
                                     << traits.nElements
                                     << " components to be uniquely identifiable"));
  }

  std::vector<std::string> escaped;

  if (traits.requireProject) {
    escaped.push_back(Escape(project));
  }

  for (const auto& element : elements) {
    escaped.push_back(Escape(element));
  }

  Object object;
  object.mType = type;
  object.mProject = (traits.requireProject ? project : "");
  object.mElements = elements;
  object.mString = std::string(type_name) + sTypeDelimiter +
                   StringConversion::Join(escaped, std::string(1, sElementDelimiter));
  out = std::move(object);
  return Status();
}

//------------------------------------------------------------------------------
// Parse an object from its string form
//------------------------------------------------------------------------------
Status
Object::FromString(const std::string& str, Object& out)
{
  size_t pos = str.find(sTypeDelimiter);

  if (pos == std::string::npos) {
    return InvalidArgumentError(SSTR("Authorization object \"" << str
                                     << "\" is missing the type delimiter"));
  }

  ObjectType type;
  Status st = ObjectTypeFromString(str.substr(0, pos), type);

  if (!st.ok()) {
    return st;
  }

  const ObjectTypeTraits& traits = GetObjectTypeTraits(type);
  std::vector<std::string> components;
  StringConversion::EmptyTokenize(str.substr(pos + 1), components,
                                  std::string(1, sElementDelimiter));
  std::string project;
  std::vector<std::string> elements;

  for (size_t i = 0; i < components.size(); ++i) {
    if (traits.requireProject && (i == 0)) {
      project = Unescape(components[i]);
      continue;
    }

    elements.push_back(Unescape(components[i]));
  }

  return New(type, project, elements, out);
}

//------------------------------------------------------------------------------
// Identifier without the type prefix
//------------------------------------------------------------------------------
std::string
Object::Ref() const
{
  size_t pos = mString.find(sTypeDelimiter);
  return (pos == std::string::npos) ? "" : mString.substr(pos + 1);
}

//------------------------------------------------------------------------------
// Build an object which is known to be valid
//------------------------------------------------------------------------------
Object
Object::MustNew(ObjectType type, const std::string& project,
                const std::vector<std::string>& elements)
{
  Object object;
  Status st = New(type, project, elements, object);

  if (!st.ok()) {
    throw std::invalid_argument(st.getMsg());
  }

  return object;
}

Object
Object::User(const std::string& name)
{
  return MustNew(ObjectType::User, "", {name});
}

Object
Object::Group(const std::string& name)
{
  return MustNew(ObjectType::Group, "", {name});
}

Object
Object::Server()
{
  return MustNew(ObjectType::Server, "", {sServerElement});
}

Object
Object::Certificate(const std::string& fingerprint)
{
  return MustNew(ObjectType::Certificate, "", {fingerprint});
}

Object
Object::StoragePool(const std::string& name)
{
  return MustNew(ObjectType::StoragePool, "", {name});
}

Object
Object::Project(const std::string& project)
{
  return MustNew(ObjectType::Project, project, {});
}

Object
Object::Image(const std::string& project, const std::string& fingerprint)
{
  return MustNew(ObjectType::Image, project, {fingerprint});
}

Object
Object::ImageAlias(const std::string& project, const std::string& name)
{
  return MustNew(ObjectType::ImageAlias, project, {name});
}

Object
Object::Instance(const std::string& project, const std::string& name)
{
  return MustNew(ObjectType::Instance, project, {name});
}

Object
Object::Network(const std::string& project, const std::string& name)
{
  return MustNew(ObjectType::Network, project, {name});
}

Object
Object::NetworkACL(const std::string& project, const std::string& name)
{
  return MustNew(ObjectType::NetworkACL, project, {name});
}

Object
Object::NetworkZone(const std::string& project, const std::string& name)
{
  return MustNew(ObjectType::NetworkZone, project, {name});
}

Object
Object::Profile(const std::string& project, const std::string& name)
{
  return MustNew(ObjectType::Profile, project, {name});
}

Object
Object::StorageBucket(const std::string& project, const std::string& pool,
                      const std::string& bucket, const std::string& location)
{
  return MustNew(ObjectType::StorageBucket, project, {pool, bucket, location});
}

Object
Object::StorageVolume(const std::string& project, const std::string& pool,
                      const std::string& type, const std::string& name,
                      const std::string& location)
{
  return MustNew(ObjectType::StorageVolume, project,
                 {pool, type, name, location});
}

//------------------------------------------------------------------------------
// Build the object an API request refers to
//------------------------------------------------------------------------------
Status
ObjectFromRequestParams(ObjectType type, const std::string& project,
                        const std::string& location,
                        const std::vector<std::string>& pathArgs,
                        Object& out)
{
  // server objects don't require any argument
  if (type == ObjectType::Server) {
    out = Object::Server();
    return Status();
  }

  std::string project_name = (project.empty() ? sDefaultProject : project);

  for (const auto& arg : pathArgs) {
    if (arg.empty()) {
      return InvalidArgumentError(SSTR("Empty path argument for object type \""
                                       << ObjectTypeToString(type) << "\""));
    }
  }

  // the projects API passes the project as path argument
  if (type == ObjectType::Project) {
    if (!pathArgs.empty()) {
      project_name = pathArgs.front();
    }

    return Object::New(type, project_name, {}, out);
  }

  std::vector<std::string> elements = pathArgs;

  if ((type == ObjectType::StorageVolume) ||
      (type == ObjectType::StorageBucket)) {
    elements.push_back(location);
  }

  return Object::New(type, project_name, elements, out);
}

WARDENAUTHNAMESPACE_END
