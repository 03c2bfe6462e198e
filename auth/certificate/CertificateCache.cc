//------------------------------------------------------------------------------
// File: CertificateCache.cc
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

#include "auth/certificate/CertificateCache.hh"
#include "auth/Errors.hh"
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <iomanip>
#include <sstream>

WARDENAUTHNAMESPACE_BEGIN

using warden::common::Status;
using warden::common::RWMutexReadLock;
using warden::common::RWMutexWriteLock;

//------------------------------------------------------------------------------
// Certificate type to string
//------------------------------------------------------------------------------
const char*
CertificateTypeToString(CertificateType type)
{
  switch (type) {
  case CertificateType::Client:
    return "client";

  case CertificateType::Server:
    return "server";

  case CertificateType::Metrics:
    return "metrics";
  }

  return "unknown";
}

//------------------------------------------------------------------------------
// Certificate type from string
//------------------------------------------------------------------------------
Status
CertificateTypeFromString(const std::string& str, CertificateType& type)
{
  if (str == "client") {
    type = CertificateType::Client;
  } else if (str == "server") {
    type = CertificateType::Server;
  } else if (str == "metrics") {
    type = CertificateType::Metrics;
  } else {
    return InvalidArgumentError(SSTR("Unknown certificate type \"" << str
                                     << "\""));
  }

  return Status();
}

//------------------------------------------------------------------------------
// Constructor
//------------------------------------------------------------------------------
CertificateCache::CertificateCache():
  mTrustCA(false)
{
  mMutex.SetName("CertificateCache");
  SetLogId(nullptr, "CertificateCache");
}

//------------------------------------------------------------------------------
// Replace certificates and restrictions
//------------------------------------------------------------------------------
void
CertificateCache::SetCertificatesProjectsAndGroups(const CertificateMap&
    certificates, const RestrictionMap& projects, const RestrictionMap& groups)
{
  RWMutexWriteLock wr_lock(mMutex);
  mCertificates = certificates;
  mProjects = projects;
  mGroups = groups;
}

//------------------------------------------------------------------------------
// Replace the certificates
//------------------------------------------------------------------------------
void
CertificateCache::SetCertificates(const CertificateMap& certificates)
{
  RWMutexWriteLock wr_lock(mMutex);
  mCertificates = certificates;
}

//------------------------------------------------------------------------------
// Get a copy of the certificates
//------------------------------------------------------------------------------
CertificateCache::CertificateMap
CertificateCache::GetCertificates()
{
  RWMutexReadLock rd_lock(mMutex);
  return mCertificates;
}

//------------------------------------------------------------------------------
// Compute the SHA-256 fingerprint of a PEM encoded certificate
//------------------------------------------------------------------------------
Status
CertificateCache::Fingerprint(const std::string& pem, std::string& fingerprint)
{
  BIO* certbio = BIO_new_mem_buf(pem.data(), (int) pem.size());

  if (!certbio) {
    return InvalidArgumentError("Failed to allocate certificate buffer");
  }

  X509* cert = PEM_read_bio_X509(certbio, nullptr, nullptr, nullptr);
  BIO_free_all(certbio);

  if (!cert) {
    return InvalidArgumentError("Failed to parse PEM certificate");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  int rc = X509_digest(cert, EVP_sha256(), digest, &digest_len);
  X509_free(cert);

  if (rc != 1) {
    return InvalidArgumentError("Failed to compute certificate fingerprint");
  }

  std::ostringstream oss;
  oss.fill('0');
  oss << std::hex;

  for (unsigned int i = 0; i < digest_len; ++i) {
    oss << std::setw(2) << (unsigned int) digest[i];
  }

  fingerprint = oss.str();
  return Status();
}

//------------------------------------------------------------------------------
// Add a PEM encoded certificate
//------------------------------------------------------------------------------
Status
CertificateCache::AddCertificatePEM(CertificateType type,
                                    const std::string& pem,
                                    std::string& fingerprint)
{
  Status st = Fingerprint(pem, fingerprint);

  if (!st.ok()) {
    return st;
  }

  RWMutexWriteLock wr_lock(mMutex);
  mCertificates[type][fingerprint] = pem;
  warden_debug("msg=\"added certificate\" type=%s fingerprint=%s",
               CertificateTypeToString(type), fingerprint.c_str());
  return Status();
}

//------------------------------------------------------------------------------
// Get the restrictions of a certificate
//------------------------------------------------------------------------------
Status
CertificateCache::GetDetails(const std::string& fingerprint,
                             CertificateDetails& details)
{
  RWMutexReadLock rd_lock(mMutex);
  details = CertificateDetails();
  auto it_client = mCertificates.find(CertificateType::Client);

  if ((it_client != mCertificates.end()) &&
      it_client->second.count(fingerprint)) {
    auto it_proj = mProjects.find(fingerprint);
    auto it_grp = mGroups.find(fingerprint);
    details.type = CertificateType::Client;

    if (it_proj != mProjects.end()) {
      details.projects = it_proj->second;
    }

    if (it_grp != mGroups.end()) {
      details.groups = it_grp->second;
    }

    details.unrestricted = (it_proj == mProjects.end()) &&
                           (it_grp == mGroups.end());
    return Status();
  }

  // metrics certificates are always restricted to the metrics endpoint
  auto it_metrics = mCertificates.find(CertificateType::Metrics);

  if ((it_metrics != mCertificates.end()) &&
      it_metrics->second.count(fingerprint)) {
    details.type = CertificateType::Metrics;
    return Status();
  }

  if (mTrustCA) {
    // signed by the trusted CA, verified by the transport layer
    details.type = CertificateType::Client;
    details.unrestricted = true;
    return Status();
  }

  return ForbiddenError("Client certificate not found");
}

WARDENAUTHNAMESPACE_END
