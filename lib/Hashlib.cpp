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
#include "Hashlib.h"

#include <cstdio>
#include <cctype>
#include <string>
#include <map>
#include <algorithm>

//-----------------------------------------------------------------------------
// Registered hashes, keyed by their lookup form. Built during static
// initialization, so it has to be a function-local static.
typedef std::map<std::string, const HashInfo *> Registry;

static Registry & registry( void ) {
    static Registry * reg = new Registry;

    return *reg;
}

static std::string lookupName( const char * name ) {
    std::string s( name );

    for (size_t i = 0; i < s.size(); i++) {
        s[i] = (s[i] == '_') ? '-' : (char)tolower((unsigned char)s[i]);
    }
    return s;
}

unsigned register_hash( const HashInfo * hinfo ) {
    const std::string key = lookupName(hinfo->name);

    if (registry().count(key) != 0) {
        printf("ERROR: hash %s was registered more than once\n", hinfo->name);
        exit(1);
    }
    if ((hinfo->lanes != 1) && (hinfo->lanes != 4)) {
        printf("ERROR: hash %s has unsupported lane count %u\n", hinfo->name, hinfo->lanes);
        exit(1);
    }
    if ((hinfo->impl_flags & FLAG_IMPL_INCREMENTAL) && (hinfo->hashfn_chunked == NULL)) {
        printf("ERROR: hash %s is marked INCREMENTAL but has no chunked hash function\n", hinfo->name);
        exit(1);
    }
    for (const auto & kv: registry()) {
        if ((hinfo->verification != 0) && (kv.second->verification == hinfo->verification)) {
            printf("WARNING: hashes %s and %s share verification code %08x\n",
                    kv.second->name, hinfo->name, hinfo->verification);
        }
    }

    registry()[key] = hinfo;
    return (unsigned)registry().size();
}

//-----------------------------------------------------------------------------

// Families together, fewer lanes first, then by name
std::vector<const HashInfo *> findAllHashes( void ) {
    std::vector<const HashInfo *> all;

    for (const auto & kv: registry()) {
        all.push_back(kv.second);
    }
    std::stable_sort(all.begin(), all.end(), []( const HashInfo * a, const HashInfo * b ) {
            const std::string fa = lookupName(a->family), fb = lookupName(b->family);
            if (fa != fb) {
                return fa < fb;
            }
            return a->lanes < b->lanes;
        });
    return all;
}

const HashInfo * findHash( const char * name ) {
    const Registry::const_iterator it = registry().find(lookupName(name));

    return (it == registry().end()) ? NULL : it->second;
}

void listHashes( bool nameonly ) {
    if (!nameonly) {
        printf("%-20s %4s %5s  %-12s %s\n", "Name", "Bits", "Lanes", "Impl", "Description");
        printf("%-20s %4s %5s  %-12s %s\n", "----", "----", "-----", "----", "-----------");
    }
    for (const HashInfo * h: findAllHashes()) {
        if (nameonly) {
            printf("%s\n", h->name);
        } else {
            printf("%-20s %4u %5u  %-12s %s\n", h->name, h->bits, h->lanes, h->impl, h->desc);
        }
    }
}

//-----------------------------------------------------------------------------

bool verifyHash( const HashInfo * hinfo, bool verbose, bool prefix ) {
    const uint32_t actual = hinfo->VerificationCode();
    const uint32_t expect = hinfo->verification;
    bool           result = true;

    if (verbose) {
        if (prefix) {
            printf("%12s| %20s - ", hinfo->impl, hinfo->name);
        }
        printf("Verification value 0x%08X ...... ", actual);
    }

    if (expect == 0) {
        if (verbose) { printf("SKIP (unverifiable)\n"); }
    } else if (actual != expect) {
        if (verbose) { printf("FAIL! (Expected 0x%08x)\n", expect); }
        result = false;
    } else if (verbose) {
        printf("PASS\n");
    }

    return result;
}

bool verifyAllHashes( bool verbose ) {
    bool result = true;

    for (const HashInfo * h: findAllHashes()) {
        result &= verifyHash(h, verbose, true);
    }
    if (verbose) {
        printf("\n");
    }
    return result;
}

//-----------------------------------------------------------------------------
// The widening multiply is checked before any hash can use it
static const int mathmult_ok = Mathmult_selftest();
