///////////////////////////////////////////////////////////////////////////////
///
///	\file    ChunkExchange.cpp
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

#include "ChunkExchange.h"
#include "Exception.h"

#include <vector>
#include <string>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Layout of the fixed-size header sent ahead of each chunk.
///	</summary>
enum ChunkHeaderField {
	ChunkHeader_Chunk,
	ChunkHeader_Begin,
	ChunkHeader_End,
	ChunkHeader_Attempts,
	ChunkHeader_Failed,
	ChunkHeader_Cancelled,
	ChunkHeader_DetailBytes,
	ChunkHeader_FailureBytes,
	ChunkHeader_Count
};

///////////////////////////////////////////////////////////////////////////////

void BroadcastChunkResult(
	ChunkResult & result,
	size_t sFeatures,
	int nRoot
) {
	int nRank;
	MPI_Comm_rank(MPI_COMM_WORLD, &nRank);

	const bool fRoot = (nRank == nRoot);

	// Unit details are sent as one buffer of NUL-terminated strings
	std::vector<char> vecDetail;
	if (fRoot) {
		for (size_t i = 0; i < result.vecErrorDetail.size(); i++) {
			const std::string & str = result.vecErrorDetail[i];
			vecDetail.insert(vecDetail.end(), str.begin(), str.end());
			vecDetail.push_back('\0');
		}
	}

	long lHeader[ChunkHeader_Count];
	if (fRoot) {
		lHeader[ChunkHeader_Chunk] = static_cast<long>(result.sChunk);
		lHeader[ChunkHeader_Begin] = static_cast<long>(result.sBegin);
		lHeader[ChunkHeader_End] = static_cast<long>(result.sEnd);
		lHeader[ChunkHeader_Attempts] = result.nAttempts;
		lHeader[ChunkHeader_Failed] = (result.fFailed)?(1):(0);
		lHeader[ChunkHeader_Cancelled] = (result.fCancelled)?(1):(0);
		lHeader[ChunkHeader_DetailBytes] = static_cast<long>(vecDetail.size());
		lHeader[ChunkHeader_FailureBytes] =
			static_cast<long>(result.strFailure.length());
	}

	int iErr = MPI_Bcast(
		lHeader, ChunkHeader_Count, MPI_LONG, nRoot, MPI_COMM_WORLD);
	if (iErr != MPI_SUCCESS) {
		_EXCEPTION1("MPI_Bcast of chunk header failed (%i)", iErr);
	}

	if (!fRoot) {
		result = ChunkResult();
		result.sChunk = static_cast<size_t>(lHeader[ChunkHeader_Chunk]);
		result.nAttempts = static_cast<int>(lHeader[ChunkHeader_Attempts]);
		result.fFailed = (lHeader[ChunkHeader_Failed] != 0);
		result.fCancelled = (lHeader[ChunkHeader_Cancelled] != 0);

		if (result.fCancelled) {
			result.sBegin = static_cast<size_t>(lHeader[ChunkHeader_Begin]);
			result.sEnd = static_cast<size_t>(lHeader[ChunkHeader_End]);
		} else {
			result.Initialize(
				static_cast<size_t>(lHeader[ChunkHeader_Begin]),
				static_cast<size_t>(lHeader[ChunkHeader_End]),
				sFeatures);
		}
		vecDetail.resize(lHeader[ChunkHeader_DetailBytes]);
	}

	// Cancelled chunks carry no unit data
	if (lHeader[ChunkHeader_Cancelled] == 0) {
		const size_t sUnits = result.GetUnitCount();

		if (sUnits * sFeatures != 0) {
			iErr = MPI_Bcast(
				result.dFeatures[0],
				static_cast<int>(sUnits * sFeatures),
				MPI_DOUBLE, nRoot, MPI_COMM_WORLD);
			if (iErr != MPI_SUCCESS) {
				_EXCEPTION1("MPI_Bcast of chunk features failed (%i)", iErr);
			}
		}

		std::vector<int> vecError(sUnits);
		if (fRoot) {
			for (size_t i = 0; i < sUnits; i++) {
				vecError[i] = static_cast<int>(result.vecError[i]);
			}
		}
		if (sUnits != 0) {
			iErr = MPI_Bcast(
				&(vecError[0]), static_cast<int>(sUnits),
				MPI_INT, nRoot, MPI_COMM_WORLD);
			if (iErr != MPI_SUCCESS) {
				_EXCEPTION1("MPI_Bcast of unit errors failed (%i)", iErr);
			}
		}

		if (vecDetail.size() != 0) {
			iErr = MPI_Bcast(
				&(vecDetail[0]), static_cast<int>(vecDetail.size()),
				MPI_CHAR, nRoot, MPI_COMM_WORLD);
			if (iErr != MPI_SUCCESS) {
				_EXCEPTION1("MPI_Bcast of unit details failed (%i)", iErr);
			}
		}

		if (!fRoot) {
			size_t sPos = 0;
			for (size_t i = 0; i < sUnits; i++) {
				result.vecError[i] =
					static_cast<ExtractionErrorKind>(vecError[i]);
				result.vecErrorDetail[i] = std::string(&(vecDetail[sPos]));
				sPos += result.vecErrorDetail[i].length() + 1;
			}
		}
	}

	// Failure reason
	std::vector<char> vecFailure(lHeader[ChunkHeader_FailureBytes] + 1, '\0');
	if (fRoot) {
		result.strFailure.copy(&(vecFailure[0]), result.strFailure.length());
	}
	if (lHeader[ChunkHeader_FailureBytes] != 0) {
		iErr = MPI_Bcast(
			&(vecFailure[0]),
			static_cast<int>(lHeader[ChunkHeader_FailureBytes]),
			MPI_CHAR, nRoot, MPI_COMM_WORLD);
		if (iErr != MPI_SUCCESS) {
			_EXCEPTION1("MPI_Bcast of chunk failure failed (%i)", iErr);
		}
	}
	if (!fRoot) {
		result.strFailure = std::string(&(vecFailure[0]));
	}
}

///////////////////////////////////////////////////////////////////////////////

#endif

