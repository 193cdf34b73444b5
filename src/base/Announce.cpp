///////////////////////////////////////////////////////////////////////////////
///
///	\file    Announce.cpp
///	\version October 19, 2026
///
///	<remarks>
///		Copyright 2000-2026 Paul Ullrich
///
///		This file is distributed as part of the GridRegimes source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#if defined(REGIMES_MPIOMP)
#include <mpi.h>
#endif

#include "Announce.h"

#include <cstdio>
#include <cstring>
#include <cstdarg>
#include <mutex>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Verbosity level.
///	</summary>
int g_iVerbosityLevel = 0;

///	<summary>
///		Output buffer.
///	</summary>
FILE * g_fpAnnounceOutput = stdout;

///	<summary>
///		Only output on rank 0.
///	</summary>
bool g_fOnlyOutputOnRankZero = false;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Maximum announcement buffer size.
///	</summary>
static const int AnnouncementBufferSize = 1024;

///	<summary>
///		Maximum indentation level.
///	</summary>
static const int MaximumIndentationLevel = 16;

///	<summary>
///		Banner size.
///	</summary>
static const int BannerSize = 60;

///	<summary>
///		Current indentation level.
///	</summary>
static int s_nIndentationLevel = 0;

///	<summary>
///		Flag indicating whether a start block is still dangling.
///	</summary>
static bool s_fBlockFlag = false;

///	<summary>
///		Serializes output from worker threads.
///	</summary>
static std::recursive_mutex s_mutexAnnounce;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Returns true if this process should not write any output.
///	</summary>
static bool AnnounceSuppressedOnThisRank() {
#if defined(REGIMES_MPIOMP)
	if (g_fOnlyOutputOnRankZero) {
		int nRank;

		MPI_Comm_rank(MPI_COMM_WORLD, &nRank);

		if (nRank > 0) {
			return true;
		}
	}
#endif
	return false;
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Format into szBuffer, truncating with an ellipsis on overflow.
///	</summary>
static void AnnounceFormat(
	char * szBuffer,
	const char * szText,
	va_list arguments
) {
	int nc = vsnprintf(szBuffer, AnnouncementBufferSize, szText, arguments);
	if (nc > AnnouncementBufferSize-2) {
		szBuffer[AnnouncementBufferSize-4] = '.';
		szBuffer[AnnouncementBufferSize-3] = '.';
		szBuffer[AnnouncementBufferSize-2] = '.';
		szBuffer[AnnouncementBufferSize-1] = '\0';
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Write one indented line.
///	</summary>
static void AnnounceWriteLine(const char * szBuffer) {

	// Turn off the block flag
	if (s_fBlockFlag) {
		fprintf(g_fpAnnounceOutput, "\n");
		s_fBlockFlag = false;
	}

	// Output with proper indentation
	for (int i = 0; i < s_nIndentationLevel; i++) {
		fprintf(g_fpAnnounceOutput, "..");
	}
	fprintf(g_fpAnnounceOutput, "%s", szBuffer);
	fprintf(g_fpAnnounceOutput, "\n");

	fflush(g_fpAnnounceOutput);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceSetVerbosityLevel(int iVerbosityLevel) {
	g_iVerbosityLevel = iVerbosityLevel;
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceOnlyOutputOnRankZero() {
	g_fOnlyOutputOnRankZero = true;
}

///////////////////////////////////////////////////////////////////////////////

static void AnnounceStartBlockV(
	const char * szText,
	va_list arguments
) {
	// Do not start a block at maximum indentation level
	if (s_nIndentationLevel == MaximumIndentationLevel) {
		return;
	}
	if (szText == NULL) {
		return;
	}
	if (AnnounceSuppressedOnThisRank()) {
		return;
	}

	// Check the block flag
	if (s_fBlockFlag) {
		fprintf(g_fpAnnounceOutput, "\n");
	}

	// Build output string from variable argument list
	char szBuffer[AnnouncementBufferSize];
	AnnounceFormat(szBuffer, szText, arguments);

	// Output with proper indentation
	for (int i = 0; i < s_nIndentationLevel; i++) {
		fprintf(g_fpAnnounceOutput, "..");
	}
	fprintf(g_fpAnnounceOutput, "%s", szBuffer);

	s_fBlockFlag = true;
	s_nIndentationLevel++;

	fflush(g_fpAnnounceOutput);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceStartBlock(
	const char * szText,
	...
) {
	std::lock_guard<std::recursive_mutex> lock(s_mutexAnnounce);

	va_list arguments;
	va_start(arguments, szText);
	AnnounceStartBlockV(szText, arguments);
	va_end(arguments);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceStartBlock(
	int iVerbosity,
	const char * szText
) {
	if (iVerbosity > g_iVerbosityLevel) {
		return;
	}

	AnnounceStartBlock("%s", szText);
}

///////////////////////////////////////////////////////////////////////////////

static void AnnounceEndBlockV(
	const char * szText,
	va_list arguments
) {
	// Do not remove a block at minimum indentation level
	if (s_nIndentationLevel == 0) {
		return;
	}
	if (AnnounceSuppressedOnThisRank()) {
		return;
	}

	// Check block flag
	if (szText != NULL) {
		char szBuffer[AnnouncementBufferSize];
		AnnounceFormat(szBuffer, szText, arguments);

		if (s_fBlockFlag) {
			s_fBlockFlag = false;

			fprintf(g_fpAnnounceOutput, ".. ");
			fprintf(g_fpAnnounceOutput, "%s", szBuffer);
			fprintf(g_fpAnnounceOutput, "\n");

		} else {
			AnnounceWriteLine(szBuffer);
		}

	} else {
		if (s_fBlockFlag) {
			s_fBlockFlag = false;
			fprintf(g_fpAnnounceOutput, "\n");
		}
	}

	s_nIndentationLevel--;

	fflush(g_fpAnnounceOutput);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceEndBlock(
	const char * szText,
	...
) {
	std::lock_guard<std::recursive_mutex> lock(s_mutexAnnounce);

	va_list arguments;
	va_start(arguments, szText);
	AnnounceEndBlockV(szText, arguments);
	va_end(arguments);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceEndBlock(
	int iVerbosity,
	const char * szText
) {
	if (iVerbosity > g_iVerbosityLevel) {
		return;
	}

	if (szText == NULL) {
		AnnounceEndBlock(NULL);
	} else {
		AnnounceEndBlock("%s", szText);
	}
}

///////////////////////////////////////////////////////////////////////////////

void Announce(const char * szText, ...) {

	if (AnnounceSuppressedOnThisRank()) {
		return;
	}

	std::lock_guard<std::recursive_mutex> lock(s_mutexAnnounce);

	// If no text, only close the dangling block
	if (szText == NULL) {
		if (s_fBlockFlag) {
			fprintf(g_fpAnnounceOutput, "\n");
			s_fBlockFlag = false;
		}
		return;
	}

	char szBuffer[AnnouncementBufferSize];

	va_list arguments;
	va_start(arguments, szText);
	AnnounceFormat(szBuffer, szText, arguments);
	va_end(arguments);

	AnnounceWriteLine(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void Announce(
	int iVerbosity,
	const char * szText,
	...
) {
	// Check verbosity
	if (iVerbosity > g_iVerbosityLevel) {
		return;
	}
	if (AnnounceSuppressedOnThisRank()) {
		return;
	}

	std::lock_guard<std::recursive_mutex> lock(s_mutexAnnounce);

	if (szText == NULL) {
		return;
	}

	char szBuffer[AnnouncementBufferSize];

	va_list arguments;
	va_start(arguments, szText);
	AnnounceFormat(szBuffer, szText, arguments);
	va_end(arguments);

	AnnounceWriteLine(szBuffer);
}

///////////////////////////////////////////////////////////////////////////////

void AnnounceBanner(const char * szText) {

	if (AnnounceSuppressedOnThisRank()) {
		return;
	}

	std::lock_guard<std::recursive_mutex> lock(s_mutexAnnounce);

	// Turn off the block flag
	if (s_fBlockFlag) {
		fprintf(g_fpAnnounceOutput, "\n");
		s_fBlockFlag = false;
	}

	// No text in banner
	int i;
	if (szText == NULL) {
		for (i = 0; i < BannerSize; i++) {
			fprintf(g_fpAnnounceOutput, "-");
		}
		fprintf(g_fpAnnounceOutput, "\n");
		fflush(g_fpAnnounceOutput);
		return;
	}

	// Text in banner
	int nLen = static_cast<int>(strlen(szText)) + 2;
	fprintf(g_fpAnnounceOutput, "--");
	if (nLen > BannerSize - 2) {
		fprintf(g_fpAnnounceOutput, "%s", szText);
		fprintf(g_fpAnnounceOutput, "--");
	} else {
		fprintf(g_fpAnnounceOutput, " %s ", szText);
		for (i = 0; i < BannerSize - nLen - 2; i++) {
			fprintf(g_fpAnnounceOutput, "-");
		}
	}
	fprintf(g_fpAnnounceOutput, "\n");
	fflush(g_fpAnnounceOutput);
}

///////////////////////////////////////////////////////////////////////////////

