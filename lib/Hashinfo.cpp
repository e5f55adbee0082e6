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
#include "Platform.h"
#include "Hashinfo.h"

#include <string>
#include <vector>

const char * HashInfo::dashed( const char * in ) {
    char * out = strdup(in);

    for (char * p = out; *p != '\0'; p++) {
        if (*p == '_') { *p = '-'; }
    }
    return out;
}

//-----------------------------------------------------------------------------
// Key i is the bytes { 0, 1, ..., i-1 }, hashed with seed 256-i, for i in
// [0, 255]. The 256 digests are laid end to end and hashed with seed 0,
// and the first 4 bytes of that, read as a little-endian integer, are
// the code.
uint32_t HashInfo::VerificationCode( void ) const {
    const size_t         hashbytes = bits / 8;
    std::vector<uint8_t> key( 256 );
    std::vector<uint8_t> digests( 256 * hashbytes );
    std::vector<uint8_t> total( hashbytes );

    for (size_t i = 0; i < 256; i++) {
        hashfn(&key[0], i, Seed(256 - i), &digests[i * hashbytes]);
        key[i] = (uint8_t)i;
    }
    hashfn(&digests[0], digests.size(), Seed(0), &total[0]);

    return (uint32_t)total[0] | ((uint32_t)total[1] << 8) |
           ((uint32_t)total[2] << 16) | ((uint32_t)total[3] << 24);
}
