///////////////////////////////////////////////////////////////////////////////
///
///	\file    ChunkScheduler.cpp
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

#include "ChunkScheduler.h"
#include "ChunkExchange.h"
#include "Defines.h"
#include "Announce.h"
#include "Exception.h"

#include <exception>

///////////////////////////////////////////////////////////////////////////////

void PartitionUnits(
	size_t sUnits,
	size_t sChunkSize,
	std::vector<ChunkRange> & vecChunks
) {
	if (sChunkSize == 0) {
		_EXCEPTIONT("Chunk size must be positive");
	}

	vecChunks.clear();
	for (size_t sBegin = 0; sBegin < sUnits; sBegin += sChunkSize) {
		size_t sEnd = sBegin + sChunkSize;
		if (sEnd > sUnits) {
			sEnd = sUnits;
		}
		vecChunks.push_back(ChunkRange(vecChunks.size(), sBegin, sEnd));
	}
}

///////////////////////////////////////////////////////////////////////////////

ChunkScheduler::ChunkScheduler(
	size_t sChunkSize
) :
	m_sChunkSize(sChunkSize)
{
	if (sChunkSize == 0) {
		_EXCEPTIONT("Chunk size must be positive");
	}
}

///////////////////////////////////////////////////////////////////////////////

bool ChunkScheduler::AttemptChunk(
	const FeatureExtractor & extractor,
	const ChunkRange & range,
	ChunkResult & result
) {
	try {
		extractor.ExtractChunk(range.sBegin, range.sEnd, result);

	} catch(Exception & e) {
		result.strFailure = e.ToString();
		return false;

	} catch(std::exception & e) {
		result.strFailure = e.what();
		return false;
	}

	// A chunk of two or more units where no unit could be read at all is
	// treated as an I/O failure of the whole chunk
	if (result.GetUnitCount() < 2) {
		return true;
	}
	for (size_t i = 0; i < result.GetUnitCount(); i++) {
		if (result.vecError[i] != ExtractionError_SourceError) {
			return true;
		}
	}
	result.strFailure =
		std::string("every unit failed to read (")
		+ result.vecErrorDetail[0] + ")";

	return false;
}

///////////////////////////////////////////////////////////////////////////////

ChunkResult ChunkScheduler::RunChunk(
	const FeatureExtractor & extractor,
	const ChunkRange & range,
	const CancelFlag * pcancel
) const {
	ChunkResult result;
	result.sChunk = range.sChunk;
	result.sBegin = range.sBegin;
	result.sEnd = range.sEnd;

	if (IsCancelled(pcancel)) {
		result.fCancelled = true;
		return result;
	}

	for (int a = 0; a < ChunkExtractionAttempts; a++) {
		result.nAttempts = a + 1;
		if (AttemptChunk(extractor, range, result)) {
			return result;
		}
		Announce(1, "Chunk %lu [%lu, %lu) attempt %i failed: %s",
			static_cast<unsigned long>(range.sChunk),
			static_cast<unsigned long>(range.sBegin),
			static_cast<unsigned long>(range.sEnd),
			a + 1,
			result.strFailure.c_str());
	}

	// Units of a failed chunk carry no features
	std::string strFailure = result.strFailure;
	result.Initialize(range.sBegin, range.sEnd, extractor.GetFeatureCount());
	result.fFailed = true;
	result.strFailure = strFailure;

	Announce("WARNING: Chunk %lu [%lu, %lu) failed after %i attempts: %s",
		static_cast<unsigned long>(range.sChunk),
		static_cast<unsigned long>(range.sBegin),
		static_cast<unsigned long>(range.sEnd),
		result.nAttempts,
		strFailure.c_str());

	return result;
}

///////////////////////////////////////////////////////////////////////////////

void ChunkScheduler::RunLocalChunks(
	const FeatureExtractor & extractor,
	const std::vector<ChunkRange> & vecChunks,
	const std::vector<bool> & vecLocal,
	const CancelFlag * pcancel,
	std::vector<ChunkResult> & vecResults
) const {
	const size_t sChunks = vecChunks.size();

	std::vector<std::exception_ptr> vecErrors(sChunks);

	// Each iteration writes only its own pre-sized entry, so the result
	// does not depend on completion order
#pragma omp parallel for schedule(dynamic)
	for (size_t c = 0; c < sChunks; c++) {
		if (!vecLocal[c]) {
			continue;
		}
		try {
			vecResults[c] = RunChunk(extractor, vecChunks[c], pcancel);
		} catch(...) {
			vecErrors[c] = std::current_exception();
		}
	}

	// Exceptions cannot leave the parallel region
	for (size_t c = 0; c < vecErrors.size(); c++) {
		if (vecErrors[c]) {
			std::rethrow_exception(vecErrors[c]);
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void ChunkScheduler::Run(
	const FeatureExtractor & extractor,
	const CancelFlag * pcancel,
	std::vector<ChunkResult> & vecResults
) const {

	std::vector<ChunkRange> vecChunks;
	PartitionUnits(extractor.GetUnitCount(), m_sChunkSize, vecChunks);

	vecResults.clear();
	vecResults.resize(vecChunks.size());

	std::vector<bool> vecLocal(vecChunks.size(), true);

#if defined(REGIMES_MPIOMP)
	// Distribute chunks across ranks when running under MPI
	int nMPIInitialized = 0;
	MPI_Initialized(&nMPIInitialized);

	int nMPIRank = 0;
	int nMPISize = 1;
	if (nMPIInitialized) {
		MPI_Comm_rank(MPI_COMM_WORLD, &nMPIRank);
		MPI_Comm_size(MPI_COMM_WORLD, &nMPISize);
	}

	for (size_t c = 0; c < vecChunks.size(); c++) {
		vecLocal[c] = ((c % nMPISize) == static_cast<size_t>(nMPIRank));
	}

	RunLocalChunks(extractor, vecChunks, vecLocal, pcancel, vecResults);

	if (nMPISize > 1) {
		for (size_t c = 0; c < vecChunks.size(); c++) {
			BroadcastChunkResult(
				vecResults[c],
				extractor.GetFeatureCount(),
				static_cast<int>(c % nMPISize));
		}
	}
#else
	RunLocalChunks(extractor, vecChunks, vecLocal, pcancel, vecResults);
#endif

	// Abort only when every chunk failed
	size_t sFailed = 0;
	for (size_t c = 0; c < vecResults.size(); c++) {
		if (vecResults[c].fFailed) {
			sFailed++;
		}
	}
	if ((vecResults.size() != 0) && (sFailed == vecResults.size())) {
		_SOURCEERROR2("All %lu chunks failed; first failure: %s",
			static_cast<unsigned long>(vecResults.size()),
			vecResults[0].strFailure.c_str());
	}
}

///////////////////////////////////////////////////////////////////////////////

