//------------------------------------------------------------------------------
// File: TestCertificate.hh
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
#include <string>

//! Self-signed EC client certificate used by the tests
static const std::string sTestCertificatePEM =
  "-----BEGIN CERTIFICATE-----\n"
  "MIIBkTCCATegAwIBAgIUFWANUbs7xN1omq89bOFonS4eB+owCgYIKoZIzj0EAwIw\n"
  "HTEbMBkGA1UEAwwSd2FyZGVuLXRlc3QtY2xpZW50MCAXDTI2MTAxOTE1NDcyM1oY\n"
  "DzIxMjYwOTI1MTU0NzIzWjAdMRswGQYDVQQDDBJ3YXJkZW4tdGVzdC1jbGllbnQw\n"
  "WTATBgcqhkjOPQIBBggqhkjOPQMBBwNCAAT/mr8i0IwYMS2uVV7ddVXSCN+VAQQ3\n"
  "BZbutVx6RQfSnOmjtT/UOVNDKIeXECizRqivat4CRbBJLRM+DLgCC2ZPo1MwUTAd\n"
  "BgNVHQ4EFgQUUYLt4KuNbwHZfpqlov7WxkczrvYwHwYDVR0jBBgwFoAUUYLt4KuN\n"
  "bwHZfpqlov7WxkczrvYwDwYDVR0TAQH/BAUwAwEB/zAKBggqhkjOPQQDAgNIADBF\n"
  "AiEAuF/aVdutyVXDb77PtZ97+bqgEC1yfLs1FvHIwxEdn3ECIEYKIm0ccaL4c6vw\n"
  "sfGFtoqYk7yoekzvMNHmH0aDYxBX\n"
  "-----END CERTIFICATE-----\n";

//! SHA-256 fingerprint of sTestCertificatePEM
static const std::string sTestCertificateFingerprint =
  "2e2c074637b6be8cd4f39d32d835a1f5d52c851f7d907cef039f8a144ec78807";
