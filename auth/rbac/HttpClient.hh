//------------------------------------------------------------------------------
// File: HttpClient.hh
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
#include "common/Status.hh"
#include <atomic>
#include <string>

WARDENAUTHNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Response of a completed HTTP request
//------------------------------------------------------------------------------
struct HttpResponse {
  long code = 0;
  std::string body;
};

//------------------------------------------------------------------------------
//! Per request options
//------------------------------------------------------------------------------
struct HttpRequestOptions {
  //! overall transfer timeout in seconds, 0 means no timeout
  long timeoutSec = 0;
  //! request is aborted as soon as the flag becomes true
  const std::atomic<bool>* abortFlag = nullptr;
};

//------------------------------------------------------------------------------
//! @brief HTTP transport used to talk to a policy server
//!
//! A request that completed with any HTTP status code returns ok and the
//! caller interprets the code. A failed transfer returns
//!   ECANCELED   aborted through the abort flag
//!   ECONNRESET  connection dropped by the peer
//!   ECOMM       any other transport error
//------------------------------------------------------------------------------
class IHttpClient
{
public:
  virtual ~IHttpClient() = default;

  virtual warden::common::Status Get(const std::string& url,
                                     const HttpRequestOptions& opts,
                                     HttpResponse& response) = 0;

  //----------------------------------------------------------------------------
  //! POST a JSON document
  //----------------------------------------------------------------------------
  virtual warden::common::Status Post(const std::string& url,
                                      const std::string& body,
                                      const HttpRequestOptions& opts,
                                      HttpResponse& response) = 0;
};

//------------------------------------------------------------------------------
//! libcurl based HTTP transport
//------------------------------------------------------------------------------
class CurlHttpClient : public IHttpClient
{
public:
  //----------------------------------------------------------------------------
  //! Constructor
  //!
  //! @param bearerToken token sent in the Authorization header, none if empty
  //----------------------------------------------------------------------------
  explicit CurlHttpClient(const std::string& bearerToken = "");

  warden::common::Status Get(const std::string& url,
                             const HttpRequestOptions& opts,
                             HttpResponse& response) override;

  warden::common::Status Post(const std::string& url, const std::string& body,
                              const HttpRequestOptions& opts,
                              HttpResponse& response) override;

private:
  warden::common::Status Perform(const std::string& method,
                                 const std::string& url,
                                 const std::string* body,
                                 const HttpRequestOptions& opts,
                                 HttpResponse& response);

  std::string mBearerToken;
};

WARDENAUTHNAMESPACE_END
