//------------------------------------------------------------------------------
// File: LoggingTests.cc
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
#include "common/Logging.hh"
#include <string>

using namespace warden::common;

//------------------------------------------------------------------------------
// Object logging through the member macros
//------------------------------------------------------------------------------
class LoggingClient : public LogId
{
public:
  LoggingClient()
  {
    SetLogId("0123-logid", "client:test");
  }

  std::string Hello()
  {
    return warden_log(LOG_SILENT, "msg=\"hello\" value=%d", 42);
  }
};

TEST(Logging, PriorityStrings)
{
  ASSERT_EQ(Logging::GetPriorityByString("debug"), LOG_DEBUG);
  ASSERT_EQ(Logging::GetPriorityByString("ERROR"), LOG_ERR);
  ASSERT_EQ(Logging::GetPriorityByString("loud"), -1);
  ASSERT_STREQ(Logging::GetPriorityString(LOG_WARNING), "WARN ");
}

TEST(Logging, PriorityAndFilter)
{
  Logging& g_logging = Logging::GetInstance();
  int old_priority = g_logging.GetLogPriority();
  g_logging.SetLogPriority(LOG_INFO);
  ASSERT_TRUE(g_logging.shouldlog("Load", LOG_INFO));
  ASSERT_FALSE(g_logging.shouldlog("Load", LOG_DEBUG));
  g_logging.SetFilter("FlushCache,PollChanges");
  ASSERT_FALSE(g_logging.shouldlog("FlushCache", LOG_INFO));
  ASSERT_TRUE(g_logging.shouldlog("Load", LOG_INFO));
  // errors pass any filter
  ASSERT_TRUE(g_logging.shouldlog("FlushCache", LOG_ERR));
  g_logging.SetFilter("PASS:Load");
  ASSERT_TRUE(g_logging.shouldlog("Load", LOG_INFO));
  ASSERT_FALSE(g_logging.shouldlog("Check", LOG_INFO));
  g_logging.SetFilter(nullptr);
  g_logging.SetLogPriority(old_priority);
}

TEST(Logging, Format)
{
  LoggingClient client;
  std::string line = client.Hello();
  ASSERT_NE(line.find("msg=\"hello\" value=42"), std::string::npos);
  ASSERT_NE(line.find("logid=0123-logid"), std::string::npos);
  ASSERT_NE(line.find("tident=client:test"), std::string::npos);
  ASSERT_NE(line.find("source=LoggingTests:"), std::string::npos);
}
