//------------------------------------------------------------------------------
// File: ConfigTests.cc
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
#include "common/Config.hh"
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <unistd.h>

using warden::common::Config;

TEST(Config, ParseChapters)
{
  Config cfg;
  auto st = cfg.LoadFromString(
              "# authorization setup\n"
              "[sysconfig]\n"
              "RBAC_HOST = rbac.example.org\n"
              "\n"
              "[authorization]\n"
              "driver = rbac\n"
              "rbac.api.url = https://${RBAC_HOST}:8443\n"
              "rbac.api.token=abc=def\n");
  ASSERT_TRUE(st.ok()) << st.toString();
  ASSERT_TRUE(cfg.Has("authorization"));
  ASSERT_FALSE(cfg.Has("missing"));
  auto map = cfg.AsMap("authorization");
  ASSERT_EQ(map.size(), 3u);
  ASSERT_EQ(map["driver"], "rbac");
  ASSERT_EQ(map["rbac.api.url"], "https://rbac.example.org:8443");
  ASSERT_EQ(map["rbac.api.token"], "abc=def");
  ASSERT_EQ(cfg.GetValueByKey("authorization", "missing", "dflt"), "dflt");
}

TEST(Config, Substitute)
{
  Config cfg;
  ASSERT_TRUE(cfg.LoadFromString("[sysconfig]\nA = x\nB = $A-y\n"));
  ASSERT_EQ(cfg.Substitute("${B}/$A"), "x-y/x");
  // unknown references are kept as they are
  ASSERT_EQ(cfg.Substitute("${UNKNOWN}-$A"), "${UNKNOWN}-x");
  ASSERT_FALSE(cfg.Substitute("$WARDENHOST").empty());
  ASSERT_NE(cfg.Substitute("$WARDENHOST"), "$WARDENHOST");
}

TEST(Config, LastDefinitionWins)
{
  Config cfg;
  ASSERT_TRUE(cfg.LoadFromString("[a]\nk = 1\nk = 2\n"));
  ASSERT_EQ(cfg.GetValueByKey("a", "k"), "2");
  ASSERT_EQ(cfg.AsMap("a")["k"], "2");
}

TEST(Config, Errors)
{
  Config cfg;
  auto st = cfg.LoadFromString("key = value\n");
  ASSERT_FALSE(st.ok());
  ASSERT_EQ(st.getErrc(), EINVAL);
  st = cfg.LoadFromString("[a]\nno separator here\n");
  ASSERT_FALSE(st.ok());
  ASSERT_EQ(st.getErrc(), EINVAL);
  st = cfg.LoadFromString("[a]\n = value\n");
  ASSERT_EQ(st.getErrc(), EINVAL);
  st = cfg.Load("/nonexistent/warden/config");
  ASSERT_EQ(st.getErrc(), ENOENT);
}

TEST(Config, LoadFile)
{
  char path[] = "/tmp/warden-config-test-XXXXXX";
  int fd = mkstemp(path);
  ASSERT_NE(fd, -1);
  close(fd);
  {
    std::ofstream out(path);
    out << "[authorization]\ndriver = tls\n";
  }
  Config cfg;
  auto st = cfg.Load(path);
  unlink(path);
  ASSERT_TRUE(st.ok()) << st.toString();
  ASSERT_EQ(cfg.GetValueByKey("authorization", "driver"), "tls");
  ASSERT_EQ(cfg.Dump("authorization"), "driver = tls\n");
}
