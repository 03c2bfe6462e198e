//------------------------------------------------------------------------------
// File: OpenFgaHttpEngine.hh
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
#include "auth/rebac/IRebacEngine.hh"
#include "auth/rbac/HttpClient.hh"
#include "common/Logging.hh"
#include <map>
#include <memory>
#include <mutex>
#include <string>

WARDENAUTHNAMESPACE_BEGIN

//! Configuration keys of the OpenFGA engine
static constexpr auto OPENFGA_API_URL = "openfga.api.url";
static constexpr auto OPENFGA_API_TOKEN = "openfga.api.token";
static constexpr auto OPENFGA_API_TIMEOUT = "openfga.api.timeout";

//------------------------------------------------------------------------------
//! @brief Relationship engine backed by an OpenFGA server
//!
//! @description The store identifiers handed in by the driver are used as
//! store names. The matching server side store is created on the first
//! model write and its id remembered together with the id of the model
//! written last, which is pinned in all following queries.
//------------------------------------------------------------------------------
class OpenFgaHttpEngine : public IRebacEngine, public warden::common::LogId
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param apiUrl base URL of the OpenFGA HTTP API
  //! @param client HTTP transport
  //! @param timeoutSec timeout of every request, 0 means none
  //----------------------------------------------------------------------------
  OpenFgaHttpEngine(const std::string& apiUrl,
                    std::shared_ptr<IHttpClient> client, long timeoutSec = 30);

  warden::common::Status
  WriteAuthorizationModel(const std::string& storeId,
                          const std::string& model) override;

  warden::common::Status
  Check(const std::string& storeId, const RebacTuple& tuple,
        const std::vector<RebacTuple>& contextual, bool& allowed) override;

  warden::common::Status
  ListObjects(const std::string& storeId, const std::string& type,
              const std::string& relation, const std::string& user,
              const std::vector<RebacTuple>& contextual,
              std::vector<std::string>& objects) override;

  warden::common::Status
  WriteTuples(const std::string& storeId, const std::vector<RebacTuple>& writes,
              const std::vector<RebacTuple>& deletes) override;

private:
  struct Store {
    std::string id;
    std::string modelId;
  };

  //----------------------------------------------------------------------------
  //! Resolve the server side store of a store name
  //----------------------------------------------------------------------------
  warden::common::Status GetStore(const std::string& storeId, Store& store);

  //----------------------------------------------------------------------------
  //! POST a JSON document and parse the JSON reply
  //----------------------------------------------------------------------------
  warden::common::Status PostJson(const std::string& path,
                                  const std::string& body,
                                  std::string& reply);

  std::string mApiUrl;
  std::shared_ptr<IHttpClient> mHttpClient;
  long mTimeoutSec;
  std::mutex mMutex;
  std::map<std::string, Store> mStores; ///< store name -> server side store
};

WARDENAUTHNAMESPACE_END
