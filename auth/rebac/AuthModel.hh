//------------------------------------------------------------------------------
// File: AuthModel.hh
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
#include <string>

WARDENAUTHNAMESPACE_BEGIN

//------------------------------------------------------------------------------
//! @brief Built-in relationship model
//!
//! @description Authorization model in the OpenFGA JSON schema 1.1 form.
//! Users hold relations directly or through membership of a group. Relations
//! are inherited downwards: server -> project -> project entities, and
//! server -> certificates, storage pools and groups. The parent relations
//! are named "server" and "project" and are written by the entity hooks.
//------------------------------------------------------------------------------
std::string BuiltinAuthorizationModel();

WARDENAUTHNAMESPACE_END
