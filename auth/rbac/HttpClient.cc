//------------------------------------------------------------------------------
// File: HttpClient.cc
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

#include "auth/rbac/HttpClient.hh"
#include "common/Logging.hh"
#include <curl/curl.h>
#include <curl/easy.h>
#include <cerrno>
#include <memory>
#include <mutex>

WARDENAUTHNAMESPACE_BEGIN

using warden::common::Status;

namespace
{
std::once_flag sCurlInitFlag;

//------------------------------------------------------------------------------
// Collect the response body
//------------------------------------------------------------------------------
size_t
WriteCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
  size_t realsize = size * nmemb;
  static_cast<std::string*>(userp)->append(static_cast<char*>(contents),
      realsize);
  return realsize;
}

//------------------------------------------------------------------------------
// Abort the transfer once the abort flag is raised
//------------------------------------------------------------------------------
int
ProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t,
                 curl_off_t)
{
  auto abort_flag = static_cast<const std::atomic<bool>*>(clientp);
  return (abort_flag && abort_flag->load()) ? 1 : 0;
}

struct CurlDeleter {
  void operator()(CURL* curl) const
  {
    curl_easy_cleanup(curl);
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const
  {
    curl_slist_free_all(list);
  }
};
}

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
CurlHttpClient::CurlHttpClient(const std::string& bearerToken):
  mBearerToken(bearerToken)
{
  std::call_once(sCurlInitFlag, []() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
  });
}

//------------------------------------------------------------------------------
// GET request
//------------------------------------------------------------------------------
Status
CurlHttpClient::Get(const std::string& url, const HttpRequestOptions& opts,
                    HttpResponse& response)
{
  return Perform("GET", url, nullptr, opts, response);
}

//------------------------------------------------------------------------------
// POST request with a JSON body
//------------------------------------------------------------------------------
Status
CurlHttpClient::Post(const std::string& url, const std::string& body,
                     const HttpRequestOptions& opts, HttpResponse& response)
{
  return Perform("POST", url, &body, opts, response);
}

//------------------------------------------------------------------------------
// Perform a request
//------------------------------------------------------------------------------
Status
CurlHttpClient::Perform(const std::string& method, const std::string& url,
                        const std::string* body,
                        const HttpRequestOptions& opts,
                        HttpResponse& response)
{
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());

  if (!curl) {
    return Status(ECOMM, "Failed to initialize curl handle");
  }

  response = HttpResponse();
  std::unique_ptr<curl_slist, SlistDeleter> headers;
  curl_slist* chunk = nullptr;

  if (!mBearerToken.empty()) {
    std::string auth = "Authorization: Bearer ";
    auth += mBearerToken;
    chunk = curl_slist_append(chunk, auth.c_str());
  }

  if (body) {
    chunk = curl_slist_append(chunk, "Content-Type: application/json");
  }

  headers.reset(chunk);
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  if (headers) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  }

  if (body) {
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, (long) body->size());
  }

  if (opts.timeoutSec > 0) {
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, opts.timeoutSec);
  }

  if (opts.abortFlag) {
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, ProgressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA,
                     const_cast<std::atomic<bool>*>(opts.abortFlag));
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  }

  if (WARDEN_LOGS_DEBUG) {
    curl_easy_setopt(curl.get(), CURLOPT_VERBOSE, 1L);
  }

  CURLcode rc = curl_easy_perform(curl.get());

  if (rc != CURLE_OK) {
    int errc = ECOMM;

    if (rc == CURLE_ABORTED_BY_CALLBACK) {
      errc = ECANCELED;
    } else if ((rc == CURLE_GOT_NOTHING) || (rc == CURLE_RECV_ERROR) ||
               (rc == CURLE_PARTIAL_FILE)) {
      errc = ECONNRESET;
    }

    warden_static_debug("msg=\"http request failed\" method=%s url=\"%s\" "
                        "err=\"%s\"", method.c_str(), url.c_str(),
                        curl_easy_strerror(rc));
    return Status(errc, SSTR("HTTP " << method << " request to \"" << url
                             << "\" failed: " << curl_easy_strerror(rc)));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.code);
  return Status();
}

WARDENAUTHNAMESPACE_END
