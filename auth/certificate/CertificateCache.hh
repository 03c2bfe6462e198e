//------------------------------------------------------------------------------
// File: CertificateCache.hh
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
#include "common/Logging.hh"
#include "common/RWMutex.hh"
#include "common/Status.hh"
#include <atomic>
#include <map>
#include <string>
#include <vector>

WARDENAUTHNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! Type of a trusted certificate
//------------------------------------------------------------------------------
enum class CertificateType {
  Client = 1,
  Server = 2,
  Metrics = 3
};

const char* CertificateTypeToString(CertificateType type);

warden::common::Status CertificateTypeFromString(const std::string& str,
    CertificateType& type);

//------------------------------------------------------------------------------
//! What a certificate is allowed to do
//------------------------------------------------------------------------------
struct CertificateDetails {
  CertificateType type = CertificateType::Client;
  //! no project or group restriction applies
  bool unrestricted = false;
  std::vector<std::string> projects;
  std::vector<std::string> groups;
};

//------------------------------------------------------------------------------
//! @brief Cache of the trusted certificates
//!
//! @description Holds the certificates of the trust store indexed by type and
//! fingerprint together with the optional project and group restrictions of
//! each client certificate. The cache is refreshed as a whole by the trust
//! store management and read for every TLS authenticated request.
//------------------------------------------------------------------------------
class CertificateCache : public warden::common::LogId
{
public:
  //! type -> fingerprint -> PEM
  using CertificateMap = std::map<CertificateType,
        std::map<std::string, std::string>>;
  //! fingerprint -> list of project or group names
  using RestrictionMap = std::map<std::string, std::vector<std::string>>;

  //----------------------------------------------------------------------------
  //! Constructor
  //----------------------------------------------------------------------------
  CertificateCache();

  //----------------------------------------------------------------------------
  //! Replace certificates, project restrictions and group restrictions
  //----------------------------------------------------------------------------
  void SetCertificatesProjectsAndGroups(const CertificateMap& certificates,
                                        const RestrictionMap& projects,
                                        const RestrictionMap& groups);

  //----------------------------------------------------------------------------
  //! Replace the certificates keeping the restrictions
  //----------------------------------------------------------------------------
  void SetCertificates(const CertificateMap& certificates);

  //----------------------------------------------------------------------------
  //! Get a copy of the certificates
  //----------------------------------------------------------------------------
  CertificateMap GetCertificates();

  //----------------------------------------------------------------------------
  //! Add a PEM encoded certificate
  //!
  //! @param type certificate type
  //! @param pem PEM encoded X509 certificate
  //! @param fingerprint set to the lower case hex SHA-256 fingerprint
  //!
  //! @return InvalidArgument status if the PEM can not be parsed
  //----------------------------------------------------------------------------
  warden::common::Status AddCertificatePEM(CertificateType type,
      const std::string& pem,
      std::string& fingerprint);

  //----------------------------------------------------------------------------
  //! Compute the SHA-256 fingerprint of a PEM encoded certificate
  //----------------------------------------------------------------------------
  static warden::common::Status Fingerprint(const std::string& pem,
      std::string& fingerprint);

  //----------------------------------------------------------------------------
  //! Trust certificates signed by the configured CA even when they are
  //! missing from the trust store
  //----------------------------------------------------------------------------
  void SetTrustCA(bool trust)
  {
    mTrustCA = trust;
  }

  bool TrustCA() const
  {
    return mTrustCA;
  }

  //----------------------------------------------------------------------------
  //! Get the restrictions of a certificate
  //!
  //! @param fingerprint certificate fingerprint
  //! @param details filled in on success
  //!
  //! @return Forbidden status if the certificate is unknown
  //----------------------------------------------------------------------------
  warden::common::Status GetDetails(const std::string& fingerprint,
                                    CertificateDetails& details);

private:
  warden::common::RWMutex mMutex;
  CertificateMap mCertificates;
  RestrictionMap mProjects;
  RestrictionMap mGroups;
  std::atomic<bool> mTrustCA;
};

WARDENAUTHNAMESPACE_END
