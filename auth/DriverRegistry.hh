//------------------------------------------------------------------------------
// File: DriverRegistry.hh
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
#include "auth/CommonAuthorizer.hh"
#include "common/Config.hh"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

WARDENAUTHNAMESPACE_BEGIN

static constexpr auto AUTHORIZATION_CHAPTER = "authorization";

//------------------------------------------------------------------------------
//! @brief Registry of the authorization drivers
//!
//! Maps a driver name to a factory building an unconfigured instance. The
//! registry is filled once at startup and then only read.
//------------------------------------------------------------------------------
class DriverRegistry
{
public:
  typedef std::function<std::unique_ptr<CommonAuthorizer>()> Factory;

  //----------------------------------------------------------------------------
  //! Registry containing the tls, rbac and openfga drivers
  //----------------------------------------------------------------------------
  static DriverRegistry WithDefaultDrivers();

  //----------------------------------------------------------------------------
  //! Register a driver
  //!
  //! @return InvalidArgument status if the name is taken or the factory empty
  //----------------------------------------------------------------------------
  warden::common::Status Register(const std::string& name, Factory factory);

  bool Has(const std::string& name) const
  {
    return (mFactories.count(name) != 0);
  }

  //----------------------------------------------------------------------------
  //! Sorted list of the registered driver names
  //----------------------------------------------------------------------------
  std::vector<std::string> Names() const;

  //----------------------------------------------------------------------------
  //! Build an unconfigured driver instance
  //!
  //! @return nullptr if the driver is not registered
  //----------------------------------------------------------------------------
  std::unique_ptr<CommonAuthorizer> Create(const std::string& name) const;

private:
  std::map<std::string, Factory> mFactories;
};

//------------------------------------------------------------------------------
//! Build, initialize and load a driver
//!
//! @param registry driver registry
//! @param driver driver name
//! @param options options applied in order to build the driver options
//! @param out loaded driver on success
//!
//! @return UnknownDriver status if the driver is not registered, otherwise
//!         the wrapped Init or Load failure
//------------------------------------------------------------------------------
warden::common::Status LoadAuthorizer(const DriverRegistry& registry,
                                      const std::string& driver,
                                      const std::vector<Option>& options,
                                      std::unique_ptr<Authorizer>& out);

//------------------------------------------------------------------------------
//! Load the driver named by the "driver" key of the [authorization] chapter,
//! the whole chapter is handed to the driver as its configuration. Options
//! given by the caller are applied afterwards.
//------------------------------------------------------------------------------
warden::common::Status
LoadAuthorizerFromConfig(const DriverRegistry& registry,
                         const warden::common::Config& config,
                         const std::vector<Option>& options,
                         std::unique_ptr<Authorizer>& out);

WARDENAUTHNAMESPACE_END
