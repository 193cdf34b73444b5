///////////////////////////////////////////////////////////////////////////////
///
///	\file    ChunkExchange.h
///	\version October 19, 2026
///
///	<summary>
///		Broadcast of chunk results between MPI ranks.
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

#ifndef _CHUNKEXCHANGE_H_
#define _CHUNKEXCHANGE_H_

#if defined(REGIMES_MPIOMP)

#include "FeatureExtractor.h"

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Broadcast a chunk result from rank nRoot to all ranks of
///		MPI_COMM_WORLD.  On other ranks the result is overwritten.
///	</summary>
void BroadcastChunkResult(
	ChunkResult & result,
	size_t sFeatures,
	int nRoot
);

///////////////////////////////////////////////////////////////////////////////

#endif

#endif

