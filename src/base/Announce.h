///////////////////////////////////////////////////////////////////////////////
///
///	\file    Announce.h
///	\version October 19, 2026
///
///	<summary>
///		Functions for making announcements to standard output safely when
///		using MPI or worker threads.
///	</summary>
///	<remarks>
///		Copyright 2000-2026 Paul Ullrich
///
///		This file is distributed as part of the GridRegimes source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _ANNOUNCE_H_
#define _ANNOUNCE_H_

#include <cstddef>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Set the verbosity level; messages with a higher level are dropped.
///	</summary>
void AnnounceSetVerbosityLevel(int iVerbosityLevel);

///	<summary>
///		Only write announcements from MPI rank zero.
///	</summary>
void AnnounceOnlyOutputOnRankZero();

///	<summary>
///		Begin a new announcement block.
///	</summary>
void AnnounceStartBlock(const char * szText, ...);

///	<summary>
///		Begin a new announcement block at the given verbosity.
///	</summary>
void AnnounceStartBlock(int iVerbosity, const char * szText);

///	<summary>
///		End an announcement block.
///	</summary>
void AnnounceEndBlock(const char * szText, ...);

///	<summary>
///		End an announcement block at the given verbosity.
///	</summary>
void AnnounceEndBlock(int iVerbosity, const char * szText);

///	<summary>
///		Make an announcement.
///	</summary>
void Announce(const char * szText, ...);

///	<summary>
///		Make an announcement at the given verbosity.
///	</summary>
void Announce(int iVerbosity, const char * szText, ...);

///	<summary>
///		Create a banner / separator containing the specified text.
///	</summary>
void AnnounceBanner(const char * szText = NULL);

///////////////////////////////////////////////////////////////////////////////

#endif

