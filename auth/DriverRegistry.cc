//------------------------------------------------------------------------------
// File: DriverRegistry.cc
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

#include "auth/DriverRegistry.hh"
#include "auth/Errors.hh"
#include "auth/drivers/OpenFgaAuthorizer.hh"
#include "auth/drivers/RbacAuthorizer.hh"
#include "auth/drivers/TlsAuthorizer.hh"

WARDENAUTHNAMESPACE_BEGIN

using warden::common::Status;

//------------------------------------------------------------------------------
// Registry containing the built-in drivers
//------------------------------------------------------------------------------
DriverRegistry
DriverRegistry::WithDefaultDrivers()
{
  DriverRegistry registry;
  registry.mFactories[DRIVER_TLS] = []() {
    return std::unique_ptr<CommonAuthorizer>(new TlsAuthorizer());
  };
  registry.mFactories[DRIVER_RBAC] = []() {
    return std::unique_ptr<CommonAuthorizer>(new RbacAuthorizer());
  };
  registry.mFactories[DRIVER_OPENFGA] = []() {
    return std::unique_ptr<CommonAuthorizer>(new OpenFgaAuthorizer());
  };
  return registry;
}

//------------------------------------------------------------------------------
// Register a driver
//------------------------------------------------------------------------------
Status
DriverRegistry::Register(const std::string& name, Factory factory)
{
  if (name.empty() || !factory) {
    return InvalidArgumentError("Driver name and factory are required");
  }

  if (mFactories.count(name)) {
    return InvalidArgumentError(SSTR("Driver \"" << name
                                     << "\" is already registered"));
  }

  mFactories[name] = std::move(factory);
  return Status();
}

//------------------------------------------------------------------------------
// Sorted list of the registered driver names
//------------------------------------------------------------------------------
std::vector<std::string>
DriverRegistry::Names() const
{
  std::vector<std::string> names;

  for (const auto& elem : mFactories) {
    names.push_back(elem.first);
  }

  return names;
}

//------------------------------------------------------------------------------
// Build an unconfigured driver instance
//------------------------------------------------------------------------------
std::unique_ptr<CommonAuthorizer>
DriverRegistry::Create(const std::string& name) const
{
  auto it = mFactories.find(name);

  if (it == mFactories.end()) {
    return nullptr;
  }

  return it->second();
}

//------------------------------------------------------------------------------
// Build, initialize and load a driver
//------------------------------------------------------------------------------
Status
LoadAuthorizer(const DriverRegistry& registry, const std::string& driver,
               const std::vector<Option>& options,
               std::unique_ptr<Authorizer>& out)
{
  std::unique_ptr<CommonAuthorizer> authorizer = registry.Create(driver);

  if (!authorizer) {
    return UnknownDriverError(SSTR("Unknown driver \"" << driver << "\""));
  }

  Opts opts;

  for (const auto& option : options) {
    option(opts);
  }

  Status st = authorizer->Init(driver);

  if (!st.ok()) {
    return WrapStatus(st, "Failed to initialize authorizer");
  }

  st = authorizer->Load(opts);

  if (!st.ok()) {
    // release whatever the driver started before failing
    Status stop_st = authorizer->StopService();

    if (!stop_st.ok()) {
      warden_static_warning("msg=\"failed to stop authorizer\" driver=%s "
                            "err=\"%s\"", driver.c_str(),
                            stop_st.getMsg().c_str());
    }

    return WrapStatus(st, "Failed to load authorizer");
  }

  warden_static_info("msg=\"loaded authorizer\" driver=%s", driver.c_str());
  out = std::move(authorizer);
  return Status();
}

//------------------------------------------------------------------------------
// Build, initialize and load the driver named in a configuration file
//------------------------------------------------------------------------------
Status
LoadAuthorizerFromConfig(const DriverRegistry& registry,
                         const warden::common::Config& config,
                         const std::vector<Option>& options,
                         std::unique_ptr<Authorizer>& out)
{
  std::string driver = config.GetValueByKey(AUTHORIZATION_CHAPTER, "driver");

  if (driver.empty()) {
    return ConfigurationError(SSTR("Missing driver in [" << AUTHORIZATION_CHAPTER
                                   << "] configuration"));
  }

  std::vector<Option> all_options {
    WithConfig(config.AsMap(AUTHORIZATION_CHAPTER))
  };
  all_options.insert(all_options.end(), options.begin(), options.end());
  return LoadAuthorizer(registry, driver, all_options, out);
}

WARDENAUTHNAMESPACE_END
