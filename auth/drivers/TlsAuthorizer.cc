//------------------------------------------------------------------------------
// File: TlsAuthorizer.cc
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

#include "auth/drivers/TlsAuthorizer.hh"
#include "auth/Errors.hh"
#include <algorithm>

WARDENAUTHNAMESPACE_BEGIN

using warden::common::Status;

namespace
{
bool
Contains(const std::vector<std::string>& list, const std::string& value)
{
  return (std::find(list.begin(), list.end(), value) != list.end());
}
}

//------------------------------------------------------------------------------
// Load the driver
//------------------------------------------------------------------------------
Status
TlsAuthorizer::Load(const Opts& opts)
{
  if (!opts.certificateCache) {
    return ConfigurationError("TLS authorization driver requires a "
                              "certificate cache");
  }

  mCertificateCache = opts.certificateCache;
  return Status();
}

//------------------------------------------------------------------------------
// Check a relation on an object
//------------------------------------------------------------------------------
Status
TlsAuthorizer::CheckPermission(const RequestDetails& details,
                               const Object& object, Relation relation)
{
  if (details.isInternalOrUnix) {
    return Status();
  }

  if (details.authenticationProtocol != AUTH_METHOD_TLS) {
    // authenticated by a method without an authorization driver of its own
    warden_warning("msg=\"authentication protocol is not compatible with "
                   "authorization driver\" protocol=%s",
                   details.authenticationProtocol.c_str());
    return Status();
  }

  if (!mCertificateCache) {
    return ConfigurationError("TLS authorization driver is not loaded");
  }

  CertificateDetails cert;
  Status st = mCertificateCache->GetDetails(details.username, cert);

  if (!st.ok()) {
    return st;
  }

  if (cert.unrestricted || ((cert.type == CertificateType::Metrics) &&
                            (relation == Relation::CanViewMetrics))) {
    return Status();
  }

  if (details.isAllProjectsRequest) {
    return ForbiddenError("Certificate is restricted");
  }

  bool allowed = false;

  if (CheckNonProjectType(object.Type(), relation, allowed)) {
    return (allowed ? Status() : ForbiddenError("Certificate is restricted"));
  }

  if (!Contains(cert.projects, object.Project())) {
    return ForbiddenError(SSTR("User does not have permission for project \""
                               << object.Project() << "\""));
  }

  return Status();
}

//------------------------------------------------------------------------------
// Get a filter for a listing of objects of the given type
//------------------------------------------------------------------------------
Status
TlsAuthorizer::BuildPermissionChecker(const RequestDetails& details,
                                      Relation relation, ObjectType type,
                                      std::unique_ptr<PermissionChecker>& checker)
{
  if (details.isInternalOrUnix) {
    checker.reset(new StaticPermissionChecker(true));
    return Status();
  }

  if (details.authenticationProtocol != AUTH_METHOD_TLS) {
    warden_warning("msg=\"authentication protocol is not compatible with "
                   "authorization driver\" protocol=%s",
                   details.authenticationProtocol.c_str());
    checker.reset(new StaticPermissionChecker(true));
    return Status();
  }

  if (!mCertificateCache) {
    return ConfigurationError("TLS authorization driver is not loaded");
  }

  CertificateDetails cert;
  Status st = mCertificateCache->GetDetails(details.username, cert);

  if (!st.ok()) {
    return st;
  }

  if (cert.unrestricted || ((cert.type == CertificateType::Metrics) &&
                            (relation == Relation::CanViewMetrics))) {
    checker.reset(new StaticPermissionChecker(true));
    return Status();
  }

  if (details.isAllProjectsRequest) {
    return ForbiddenError("Certificate is restricted");
  }

  bool allowed = false;

  if (CheckNonProjectType(type, relation, allowed)) {
    if (!allowed) {
      return ForbiddenError("Certificate is restricted");
    }

    checker.reset(new StaticPermissionChecker(true));
    return Status();
  }

  // listing projects filters the result instead of failing
  if ((type != ObjectType::Project) &&
      !Contains(cert.projects, details.projectName)) {
    return ForbiddenError(SSTR("User does not have permissions for project \""
                               << details.projectName << "\""));
  }

  checker.reset(new ProjectPermissionChecker(
                  std::set<std::string>(cert.projects.begin(),
                                        cert.projects.end())));
  return Status();
}

WARDENAUTHNAMESPACE_END
