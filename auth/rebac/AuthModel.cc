//------------------------------------------------------------------------------
// File: AuthModel.cc
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

#include "auth/rebac/AuthModel.hh"
#include <json/json.h>
#include <utility>
#include <vector>

WARDENAUTHNAMESPACE_BEGIN

namespace
{
//------------------------------------------------------------------------------
// Definition of one relation: the union of direct grants, relations of the
// same object and relations of a parent object
//------------------------------------------------------------------------------
struct RelationDef {
  std::string name;
  //! directly assignable user types, "type" or "type#relation"
  std::vector<std::string> direct;
  //! relations of the same object implying this one
  std::vector<std::string> computed;
  //! (parent relation, relation on the parent) implying this one
  std::vector<std::pair<std::string, std::string>> inherited;
};

struct TypeDef {
  std::string type;
  std::vector<RelationDef> relations;
};

const std::vector<std::string> sGrantees {"user", "group#member"};

//------------------------------------------------------------------------------
// Relation granted directly or through a relation of the same object
//------------------------------------------------------------------------------
RelationDef
Grant(const std::string& name, std::vector<std::string> computed = {},
      std::vector<std::pair<std::string, std::string>> inherited = {})
{
  return RelationDef {name, sGrantees, computed, inherited};
}

//------------------------------------------------------------------------------
// Relation only implied by other relations
//------------------------------------------------------------------------------
RelationDef
Implied(const std::string& name, std::vector<std::string> computed,
        std::vector<std::pair<std::string, std::string>> inherited = {})
{
  return RelationDef {name, {}, computed, inherited};
}

//------------------------------------------------------------------------------
// Parent relation
//------------------------------------------------------------------------------
RelationDef
Parent(const std::string& name)
{
  return RelationDef {name, {name}, {}, {}};
}

//------------------------------------------------------------------------------
// Project entity with can_edit and can_view
//------------------------------------------------------------------------------
TypeDef
ProjectEntity(const std::string& type, const std::string& manage_relation)
{
  return TypeDef {type, {
      Parent("project"),
      Grant("can_edit", {}, {{"project", manage_relation}}),
      Grant("can_view", {"can_edit"}, {{"project", "can_view"}})
    }
  };
}

//------------------------------------------------------------------------------
// Server entity with can_edit and can_view
//------------------------------------------------------------------------------
TypeDef
ServerEntity(const std::string& type, const std::string& manage_relation)
{
  return TypeDef {type, {
      Parent("server"),
      Grant("can_edit", {}, {{"server", manage_relation}}),
      Grant("can_view", {"can_edit"}, {{"server", "can_view"}})
    }
  };
}

std::vector<TypeDef>
ModelTypes()
{
  std::vector<TypeDef> types;
  types.push_back(TypeDef {"user", {}});
  TypeDef group = ServerEntity("group", "can_manage_permissions");
  group.relations.push_back(RelationDef {"member", {"user"}, {}, {}});
  types.push_back(group);
  types.push_back(TypeDef {"server", {
      Grant("admin"),
      Grant("operator", {"admin"}),
      Grant("viewer", {"operator"}),
      Implied("can_edit", {"admin"}),
      RelationDef {"can_view", {"user:*"}, {"viewer"}, {}},
      Implied("can_manage_permissions", {"admin"}),
      Implied("can_manage_storage_pools", {"admin"}),
      Implied("can_manage_projects", {"operator"}),
      Implied("can_view_resources", {"viewer"}),
      Implied("can_manage_certificates", {"admin"}),
      Implied("can_view_metrics", {"viewer"}),
      Implied("can_override_cluster_target_restriction", {"admin"}),
      Implied("can_view_privileged_events", {"admin"}),
      Implied("can_view_warnings", {"viewer"})
    }
  });
  types.push_back(ServerEntity("certificate", "can_manage_certificates"));
  types.push_back(ServerEntity("storage_pool", "can_manage_storage_pools"));
  types.push_back(TypeDef {"project", {
      Parent("server"),
      Grant("manager", {}, {{"server", "can_manage_projects"}}),
      Grant("operator", {"manager"}),
      Grant("viewer", {"operator"}, {{"server", "viewer"}}),
      Implied("can_edit", {"manager"}),
      Implied("can_view", {"viewer"}),
      Implied("can_manage_images", {"operator"}),
      Implied("can_manage_image_aliases", {"operator"}),
      Implied("can_manage_instances", {"operator"}),
      Implied("can_manage_networks", {"operator"}),
      Implied("can_manage_network_acls", {"operator"}),
      Implied("can_manage_network_zones", {"operator"}),
      Implied("can_manage_profiles", {"operator"}),
      Implied("can_manage_storage_volumes", {"operator"}),
      Implied("can_manage_storage_buckets", {"operator"}),
      Implied("can_view_operations", {"viewer"}),
      Implied("can_view_events", {"viewer"})
    }
  });
  types.push_back(TypeDef {"instance", {
      Parent("project"),
      Grant("manager", {}, {{"project", "can_manage_instances"}}),
      Grant("operator", {"manager"}),
      Grant("user", {"operator"}),
      Grant("viewer", {"user"}, {{"project", "can_view"}}),
      Implied("can_edit", {"manager"}),
      Implied("can_view", {"viewer"}),
      Implied("can_update_state", {"operator"}),
      Implied("can_manage_snapshots", {"operator"}),
      Implied("can_manage_backups", {"operator"}),
      Implied("can_connect_sftp", {"user"}),
      Implied("can_access_files", {"user"}),
      Implied("can_access_console", {"user"}),
      Implied("can_exec", {"user"})
    }
  });
  types.push_back(ProjectEntity("image", "can_manage_images"));
  types.push_back(ProjectEntity("image_alias", "can_manage_image_aliases"));
  types.push_back(ProjectEntity("network", "can_manage_networks"));
  types.push_back(ProjectEntity("network_acl", "can_manage_network_acls"));
  types.push_back(ProjectEntity("network_zone", "can_manage_network_zones"));
  types.push_back(ProjectEntity("profile", "can_manage_profiles"));
  types.push_back(ProjectEntity("storage_bucket", "can_manage_storage_buckets"));
  TypeDef volume = ProjectEntity("storage_volume", "can_manage_storage_volumes");
  volume.relations.push_back(Implied("can_manage_snapshots", {"can_edit"}));
  volume.relations.push_back(Implied("can_manage_backups", {"can_edit"}));
  types.push_back(volume);
  return types;
}

//------------------------------------------------------------------------------
// Convert a relation definition into its userset rewrite
//------------------------------------------------------------------------------
Json::Value
Rewrite(const RelationDef& def)
{
  std::vector<Json::Value> children;

  if (!def.direct.empty()) {
    Json::Value direct(Json::objectValue);
    direct["this"] = Json::Value(Json::objectValue);
    children.push_back(direct);
  }

  for (const auto& relation : def.computed) {
    Json::Value computed(Json::objectValue);
    computed["computedUserset"]["relation"] = relation;
    children.push_back(computed);
  }

  for (const auto& parent : def.inherited) {
    Json::Value ttu(Json::objectValue);
    ttu["tupleToUserset"]["tupleset"]["relation"] = parent.first;
    ttu["tupleToUserset"]["computedUserset"]["relation"] = parent.second;
    children.push_back(ttu);
  }

  if (children.size() == 1) {
    return children.front();
  }

  Json::Value rewrite(Json::objectValue);
  Json::Value& child = rewrite["union"]["child"];
  child = Json::Value(Json::arrayValue);

  for (const auto& elem : children) {
    child.append(elem);
  }

  return rewrite;
}

//------------------------------------------------------------------------------
// Directly related user types of a relation
//------------------------------------------------------------------------------
Json::Value
DirectTypes(const RelationDef& def)
{
  Json::Value types(Json::arrayValue);

  for (const auto& direct : def.direct) {
    Json::Value type(Json::objectValue);
    size_t pos = direct.find('#');

    if (pos != std::string::npos) {
      type["type"] = direct.substr(0, pos);
      type["relation"] = direct.substr(pos + 1);
    } else if ((pos = direct.find(":*")) != std::string::npos) {
      type["type"] = direct.substr(0, pos);
      type["wildcard"] = Json::Value(Json::objectValue);
    } else {
      type["type"] = direct;
    }

    types.append(type);
  }

  return types;
}
}

//------------------------------------------------------------------------------
// Built-in relationship model
//------------------------------------------------------------------------------
std::string
BuiltinAuthorizationModel()
{
  static const std::string sModel = []() {
    Json::Value root(Json::objectValue);
    root["schema_version"] = "1.1";
    Json::Value& definitions = root["type_definitions"];
    definitions = Json::Value(Json::arrayValue);

    for (const auto& type : ModelTypes()) {
      Json::Value definition(Json::objectValue);
      definition["type"] = type.type;

      if (!type.relations.empty()) {
        Json::Value relations(Json::objectValue);
        Json::Value metadata(Json::objectValue);

        for (const auto& relation : type.relations) {
          relations[relation.name] = Rewrite(relation);
          metadata["relations"][relation.name]["directly_related_user_types"] =
            DirectTypes(relation);
        }

        definition["relations"] = relations;
        definition["metadata"] = metadata;
      }

      definitions.append(definition);
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
  }();
  return sModel;
}

WARDENAUTHNAMESPACE_END
