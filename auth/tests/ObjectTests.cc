//------------------------------------------------------------------------------
// File: ObjectTests.cc
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

#include "gtest/gtest.h"
#include "auth/Errors.hh"
#include "auth/Object.hh"
#include <stdexcept>

using namespace warden::auth;
using warden::common::Status;

TEST(Object, NamedConstructors)
{
  ASSERT_EQ(Object::Server().String(), "server:main");
  ASSERT_EQ(Object::Project("default").String(), "project:default");
  ASSERT_EQ(Object::Instance("default", "c1").String(), "instance:default/c1");
  ASSERT_EQ(Object::StoragePool("local").String(), "storage_pool:local");
  ASSERT_EQ(Object::StorageVolume("default", "local", "custom", "vol1",
                                  "").String(),
            "storage_volume:default/local/custom/vol1/");
  ASSERT_EQ(Object::StorageBucket("p1", "pool", "b1", "node1").String(),
            "storage_bucket:p1/pool/b1/node1");
  ASSERT_EQ(Object::NetworkACL("default", "acl").String(),
            "network_acl:default/acl");
  ASSERT_THROW(Object::Instance("", "c1"), std::invalid_argument);
}

TEST(Object, Accessors)
{
  Object obj = Object::StorageVolume("p1", "pool", "custom", "vol", "node1");
  ASSERT_EQ(obj.Type(), ObjectType::StorageVolume);
  ASSERT_EQ(obj.Project(), "p1");
  ASSERT_EQ(obj.Elements(),
            std::vector<std::string>({"pool", "custom", "vol", "node1"}));
  ASSERT_EQ(obj.Ref(), "p1/pool/custom/vol/node1");
  ASSERT_TRUE(Object::Server().Project().empty());
  ASSERT_TRUE(Object().empty());
}

TEST(Object, EscapeDelimiter)
{
  Object obj = Object::Image("default", "a/b");
  ASSERT_EQ(obj.String(), "image:default/a%2Fb");
  Object parsed;
  ASSERT_TRUE(Object::FromString(obj.String(), parsed).ok());
  ASSERT_EQ(parsed.Elements().front(), "a/b");
  ASSERT_EQ(parsed, obj);
  // only the delimiter is escaped
  ASSERT_EQ(Object::Instance("default", "a b%20").String(),
            "instance:default/a b%20");
  // a literal %2F is indistinguishable from an escaped delimiter
  obj = Object::Image("default", "a%2Fb");
  ASSERT_EQ(obj.String(), "image:default/a%2Fb");
  ASSERT_TRUE(Object::FromString(obj.String(), parsed).ok());
  ASSERT_EQ(parsed.Elements().front(), "a/b");
}

TEST(Object, FromString)
{
  Object obj;
  ASSERT_TRUE(Object::FromString("instance:default/c1", obj).ok());
  ASSERT_EQ(obj.Type(), ObjectType::Instance);
  ASSERT_EQ(obj.Project(), "default");
  ASSERT_EQ(obj.Elements(), std::vector<std::string>({"c1"}));
  ASSERT_TRUE(Object::FromString("server:main", obj).ok());
  ASSERT_EQ(obj, Object::Server());
  // empty trailing location is kept as element
  ASSERT_TRUE(Object::FromString("storage_volume:default/local/custom/vol1/",
                                 obj).ok());
  ASSERT_EQ(obj.Elements().size(), 4u);
  ASSERT_TRUE(obj.Elements().back().empty());
}

TEST(Object, FromStringErrors)
{
  Object obj;
  Status st = Object::FromString("nonsense:default/c1", obj);
  ASSERT_EQ(st.getErrc(), EINVAL);
  st = Object::FromString("instance", obj);
  ASSERT_EQ(st.getErrc(), EINVAL);
  st = Object::FromString("instance:default/c1/extra", obj);
  ASSERT_EQ(st.getErrc(), EINVAL);
  ASSERT_NE(st.getMsg().find("require 1 components"), std::string::npos);
  st = Object::FromString("instance:/c1", obj);
  ASSERT_EQ(st.getErrc(), EINVAL);
  ASSERT_NE(st.getMsg().find("require a project"), std::string::npos);
}

TEST(Object, New)
{
  Object obj;
  ASSERT_TRUE(Object::New(ObjectType::Network, "p1", {"br0"}, obj).ok());
  ASSERT_EQ(obj.String(), "network:p1/br0");
  // the project of types without project is ignored
  ASSERT_TRUE(Object::New(ObjectType::Certificate, "p1", {"abc"}, obj).ok());
  ASSERT_EQ(obj.String(), "certificate:abc");
  ASSERT_TRUE(obj.Project().empty());
  ASSERT_EQ(Object::New(ObjectType::Project, "", {}, obj).getErrc(), EINVAL);
  ASSERT_EQ(Object::New(ObjectType::StorageBucket, "p1", {"pool", "b"},
                        obj).getErrc(), EINVAL);
}

TEST(Object, Ordering)
{
  ASSERT_LT(Object::Instance("a", "c1"), Object::Instance("b", "c1"));
  ASSERT_NE(Object::Instance("a", "c1"), Object::Profile("a", "c1"));
}

TEST(Object, FromRequestParams)
{
  Object obj;
  ASSERT_TRUE(ObjectFromRequestParams(ObjectType::Server, "p1", "", {},
                                      obj).ok());
  ASSERT_EQ(obj, Object::Server());
  ASSERT_TRUE(ObjectFromRequestParams(ObjectType::Instance, "", "", {"c1"},
                                      obj).ok());
  ASSERT_EQ(obj.String(), "instance:default/c1");
  ASSERT_TRUE(ObjectFromRequestParams(ObjectType::Project, "default", "",
                                      {"p2"}, obj).ok());
  ASSERT_EQ(obj.String(), "project:p2");
  ASSERT_TRUE(ObjectFromRequestParams(ObjectType::Project, "p3", "", {},
                                      obj).ok());
  ASSERT_EQ(obj.String(), "project:p3");
  ASSERT_TRUE(ObjectFromRequestParams(ObjectType::StorageVolume, "p1", "node2",
  {"local", "custom", "vol1"}, obj).ok());
  ASSERT_EQ(obj.String(), "storage_volume:p1/local/custom/vol1/node2");
  ASSERT_TRUE(ObjectFromRequestParams(ObjectType::StorageBucket, "p1", "",
  {"local", "b1"}, obj).ok());
  ASSERT_EQ(obj.String(), "storage_bucket:p1/local/b1/");
  ASSERT_EQ(ObjectFromRequestParams(ObjectType::Instance, "p1", "", {},
                                    obj).getErrc(), EINVAL);
}
