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

bool OutputBoundsTest( const HashInfo * hinfo, flags_t flags );
bool BitFlipTest( const HashInfo * hinfo, flags_t flags );
bool SeedValidityTest( const HashInfo * hinfo, flags_t flags );
bool KnownAnswerTest( const HashInfo * hinfo, flags_t flags );

void SanityTestHeader( flags_t flags );
bool SanityTest( const HashInfo * hinfo, flags_t flags, bool oneline = false );
