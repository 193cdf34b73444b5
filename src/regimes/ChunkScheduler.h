///////////////////////////////////////////////////////////////////////////////
///
///	\file    ChunkScheduler.h
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

#ifndef _CHUNKSCHEDULER_H_
#define _CHUNKSCHEDULER_H_

#include "FeatureExtractor.h"
#include "CancelFlag.h"

#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A contiguous range [sBegin, sEnd) of units.
///	</summary>
struct ChunkRange {

	ChunkRange() :
		sChunk(0),
		sBegin(0),
		sEnd(0)
	{ }

	ChunkRange(
		size_t sChunkArg,
		size_t sBeginArg,
		size_t sEndArg
	) :
		sChunk(sChunkArg),
		sBegin(sBeginArg),
		sEnd(sEndArg)
	{ }

	size_t sChunk;

	size_t sBegin;

	size_t sEnd;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Split [0, sUnits) into consecutive chunks of at most sChunkSize
///		units.  Throws an Exception if sChunkSize is zero.
///	</summary>
void PartitionUnits(
	size_t sUnits,
	size_t sChunkSize,
	std::vector<ChunkRange> & vecChunks
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Drives chunk-local feature extraction on the OpenMP threads of each
///		rank and returns the chunk results in ascending unit order.  A chunk
///		that fails entirely is retried once before its units are marked
///		failed.
///	</summary>
class ChunkScheduler {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	explicit ChunkScheduler(
		size_t sChunkSize
	);

	size_t GetChunkSize() const {
		return m_sChunkSize;
	}

	///	<summary>
	///		Extract every chunk.  Throws SourceError if every chunk failed.
	///		Chunks not started because of cancellation are returned with
	///		fCancelled set.  Under MPI each rank extracts its share of the
	///		chunks and every rank receives the full ordered result.
	///	</summary>
	void Run(
		const FeatureExtractor & extractor,
		const CancelFlag * pcancel,
		std::vector<ChunkResult> & vecResults
	) const;

	///	<summary>
	///		Extract one chunk, retrying once on complete failure.
	///	</summary>
	ChunkResult RunChunk(
		const FeatureExtractor & extractor,
		const ChunkRange & range,
		const CancelFlag * pcancel
	) const;

protected:
	///	<summary>
	///		Make one extraction attempt.
	///	</summary>
	///	<returns>
	///		false if the chunk failed entirely: extraction threw, or a chunk
	///		of two or more units had every unit fail with a source read
	///		error.  A single unit that cannot be read is an extraction
	///		failure of that unit.
	///	</returns>
	static bool AttemptChunk(
		const FeatureExtractor & extractor,
		const ChunkRange & range,
		ChunkResult & result
	);

	///	<summary>
	///		Extract the chunks for which fLocal is set, in parallel over the
	///		OpenMP threads.  Other entries are left untouched.
	///	</summary>
	void RunLocalChunks(
		const FeatureExtractor & extractor,
		const std::vector<ChunkRange> & vecChunks,
		const std::vector<bool> & vecLocal,
		const CancelFlag * pcancel,
		std::vector<ChunkResult> & vecResults
	) const;

private:
	///	<summary>
	///		Maximum number of units per chunk.
	///	</summary>
	size_t m_sChunkSize;
};

///////////////////////////////////////////////////////////////////////////////

#endif

