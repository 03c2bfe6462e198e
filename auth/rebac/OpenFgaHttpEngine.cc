//------------------------------------------------------------------------------
// File: OpenFgaHttpEngine.cc
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

#include "auth/rebac/OpenFgaHttpEngine.hh"
#include "auth/Errors.hh"
#include <json/json.h>
#include <sstream>

WARDENAUTHNAMESPACE_BEGIN

using warden::common::Status;

namespace
{
//------------------------------------------------------------------------------
// Tuple key in the OpenFGA wire form
//------------------------------------------------------------------------------
Json::Value
TupleKey(const RebacTuple& tuple)
{
  Json::Value key(Json::objectValue);
  key["user"] = tuple.user;
  key["relation"] = tuple.relation;
  key["object"] = tuple.object;
  return key;
}

//------------------------------------------------------------------------------
// List of tuple keys in the OpenFGA wire form
//------------------------------------------------------------------------------
Json::Value
TupleKeys(const std::vector<RebacTuple>& tuples)
{
  Json::Value list(Json::objectValue);
  Json::Value& keys = list["tuple_keys"];
  keys = Json::Value(Json::arrayValue);

  for (const auto& tuple : tuples) {
    keys.append(TupleKey(tuple));
  }

  return list;
}

std::string
ToString(const Json::Value& root)
{
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, root);
}

bool
FromString(const std::string& data, Json::Value& root, std::string& errs)
{
  Json::CharReaderBuilder builder;
  std::istringstream iss(data);
  return Json::parseFromStream(builder, iss, &root, &errs);
}
}

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
OpenFgaHttpEngine::OpenFgaHttpEngine(const std::string& apiUrl,
                                     std::shared_ptr<IHttpClient> client,
                                     long timeoutSec):
  mApiUrl(apiUrl), mHttpClient(client), mTimeoutSec(timeoutSec)
{
  while (!mApiUrl.empty() && (mApiUrl.back() == '/')) {
    mApiUrl.pop_back();
  }

  SetLogId(nullptr, "OpenFgaHttpEngine");
}

//------------------------------------------------------------------------------
// POST a JSON document
//------------------------------------------------------------------------------
Status
OpenFgaHttpEngine::PostJson(const std::string& path, const std::string& body,
                            std::string& reply)
{
  HttpRequestOptions opts;
  opts.timeoutSec = mTimeoutSec;
  HttpResponse response;
  Status st = mHttpClient->Post(mApiUrl + path, body, opts, response);

  if (!st.ok()) {
    return RemoteUnavailableError(st.getMsg());
  }

  if ((response.code < 200) || (response.code >= 300)) {
    warden_debug("msg=\"OpenFGA request failed\" path=\"%s\" code=%ld "
                 "body=\"%s\"", path.c_str(), response.code,
                 response.body.c_str());
    return RemoteUnavailableError(SSTR("OpenFGA answered " << path
                                       << " with HTTP " << response.code));
  }

  reply = response.body;
  return Status();
}

//------------------------------------------------------------------------------
// Resolve the server side store of a store name
//------------------------------------------------------------------------------
Status
OpenFgaHttpEngine::GetStore(const std::string& storeId, Store& store)
{
  std::lock_guard<std::mutex> lock(mMutex);
  auto it = mStores.find(storeId);

  if (it == mStores.end()) {
    return InvalidArgumentError(SSTR("No authorization model written for "
                                     "store \"" << storeId << "\""));
  }

  store = it->second;
  return Status();
}

//------------------------------------------------------------------------------
// Install the authorization model
//------------------------------------------------------------------------------
Status
OpenFgaHttpEngine::WriteAuthorizationModel(const std::string& storeId,
    const std::string& model)
{
  Store store;
  Json::Value reply;
  std::string body;
  std::string errs;
  {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mStores.find(storeId);

    if (it != mStores.end()) {
      store = it->second;
    }
  }

  if (store.id.empty()) {
    Json::Value request(Json::objectValue);
    request["name"] = storeId;
    Status st = PostJson("/stores", ToString(request), body);

    if (!st.ok()) {
      return WrapStatus(st, "Failed to create OpenFGA store");
    }

    if (!FromString(body, reply, errs) || !reply.isObject() ||
        !reply["id"].isString()) {
      return RemoteUnavailableError(SSTR("Failed to parse OpenFGA store: "
                                         << errs));
    }

    store.id = reply["id"].asString();
  }

  Status st = PostJson("/stores/" + store.id + "/authorization-models",
                       model, body);

  if (!st.ok()) {
    return WrapStatus(st, "Failed to write OpenFGA authorization model");
  }

  if (!FromString(body, reply, errs) || !reply.isObject() ||
      !reply["authorization_model_id"].isString()) {
    return RemoteUnavailableError(SSTR("Failed to parse OpenFGA model: "
                                       << errs));
  }

  store.modelId = reply["authorization_model_id"].asString();
  warden_info("msg=\"wrote authorization model\" store=%s store_id=%s "
              "model_id=%s", storeId.c_str(), store.id.c_str(),
              store.modelId.c_str());
  std::lock_guard<std::mutex> lock(mMutex);
  mStores[storeId] = store;
  return Status();
}

//------------------------------------------------------------------------------
// Check if a tuple holds
//------------------------------------------------------------------------------
Status
OpenFgaHttpEngine::Check(const std::string& storeId, const RebacTuple& tuple,
                         const std::vector<RebacTuple>& contextual,
                         bool& allowed)
{
  Store store;
  Status st = GetStore(storeId, store);

  if (!st.ok()) {
    return st;
  }

  Json::Value request(Json::objectValue);
  request["tuple_key"] = TupleKey(tuple);
  request["contextual_tuples"] = TupleKeys(contextual);
  request["authorization_model_id"] = store.modelId;
  std::string body;
  st = PostJson("/stores/" + store.id + "/check", ToString(request), body);

  if (!st.ok()) {
    return st;
  }

  Json::Value reply;
  std::string errs;

  if (!FromString(body, reply, errs) || !reply.isObject()) {
    return RemoteUnavailableError(SSTR("Failed to parse OpenFGA check: "
                                       << errs));
  }

  allowed = reply.get("allowed", false).asBool();
  return Status();
}

//------------------------------------------------------------------------------
// List the objects on which the user holds the relation
//------------------------------------------------------------------------------
Status
OpenFgaHttpEngine::ListObjects(const std::string& storeId,
                               const std::string& type,
                               const std::string& relation,
                               const std::string& user,
                               const std::vector<RebacTuple>& contextual,
                               std::vector<std::string>& objects)
{
  Store store;
  Status st = GetStore(storeId, store);

  if (!st.ok()) {
    return st;
  }

  Json::Value request(Json::objectValue);
  request["type"] = type;
  request["relation"] = relation;
  request["user"] = user;
  request["contextual_tuples"] = TupleKeys(contextual);
  request["authorization_model_id"] = store.modelId;
  std::string body;
  st = PostJson("/stores/" + store.id + "/list-objects", ToString(request),
                body);

  if (!st.ok()) {
    return st;
  }

  Json::Value reply;
  std::string errs;

  if (!FromString(body, reply, errs) || !reply.isObject() ||
      !reply["objects"].isArray()) {
    return RemoteUnavailableError(SSTR("Failed to parse OpenFGA objects: "
                                       << errs));
  }

  objects.clear();

  for (const auto& object : reply["objects"]) {
    objects.push_back(object.asString());
  }

  return Status();
}

//------------------------------------------------------------------------------
// Write and delete persisted tuples
//------------------------------------------------------------------------------
Status
OpenFgaHttpEngine::WriteTuples(const std::string& storeId,
                               const std::vector<RebacTuple>& writes,
                               const std::vector<RebacTuple>& deletes)
{
  if (writes.empty() && deletes.empty()) {
    return Status();
  }

  Store store;
  Status st = GetStore(storeId, store);

  if (!st.ok()) {
    return st;
  }

  Json::Value request(Json::objectValue);

  if (!writes.empty()) {
    request["writes"] = TupleKeys(writes);
  }

  if (!deletes.empty()) {
    request["deletes"] = TupleKeys(deletes);
  }

  request["authorization_model_id"] = store.modelId;
  std::string body;
  return PostJson("/stores/" + store.id + "/write", ToString(request), body);
}

WARDENAUTHNAMESPACE_END
