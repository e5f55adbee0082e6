/*
 * HornerHash
 * Copyright (C) 2021-2023  Frank J. T. Wojcik
 *
 * This program is free software: you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see
 * <https://www.gnu.org/licenses/>.
 */
#pragma once

#include "Hashinfo.h"

#include <vector>

// Called from REGISTER_HASH; exits on a malformed or duplicate entry
unsigned register_hash( const HashInfo * hinfo );

// Lookup is case-insensitive, and "_" matches "-"
const HashInfo * findHash( const char * name );
std::vector<const HashInfo *> findAllHashes( void );
void listHashes( bool nameonly );

bool verifyHash( const HashInfo * hinfo, bool verbose, bool prefix );
bool verifyAllHashes( bool verbose );

// Exits on failure
int Mathmult_selftest( void );

//-----------------------------------------------------------------------------
// Usage, in a hashes/*.cpp file:
//
//   REGISTER_FAMILY(foo, $.src_url = "...");
//   REGISTER_HASH(foo_64, $.desc = "...", $.bits = 64, ...);
//
// Inside the braces, $ is the object being filled in.

#define CONCAT_INNER(x, y) x ## y
#define CONCAT(x, y) CONCAT_INNER(x, y)

#define REGISTER_FAMILY(N, ...)                        \
  static const HashFamilyInfo THIS_HASH_FAMILY = []{   \
    HashFamilyInfo $(#N);                              \
    __VA_ARGS__;                                       \
    return $;                                          \
  }();                                                 \
  unsigned CONCAT(N, _ref)

#define REGISTER_HASH(N, ...)                                       \
  static const HashInfo CONCAT(Hash_, N) = []{                      \
    HashInfo $(#N, THIS_HASH_FAMILY.name);                          \
    __VA_ARGS__;                                                    \
    return $;                                                       \
  }();                                                              \
  static const unsigned CONCAT(Hash_index_, N) = register_hash(&CONCAT(Hash_, N))
