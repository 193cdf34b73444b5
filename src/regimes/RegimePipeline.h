///////////////////////////////////////////////////////////////////////////////
///
///	\file    RegimePipeline.h
///	\version October 19, 2026
///
///	<summary>
///		End-to-end regime clustering: extraction, normalization,
///		clustering and aggregation.
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

#ifndef _REGIMEPIPELINE_H_
#define _REGIMEPIPELINE_H_

#include "RegimeParam.h"
#include "ResultAggregator.h"
#include "ClusteringEngine.h"
#include "FeatureExtractor.h"
#include "TableSink.h"
#include "CancelFlag.h"

#include <memory>
#include <string>
#include <vector>

class ArraySource;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Outcome of a pipeline run.
///	</summary>
class PipelineResult {

public:
	PipelineResult() :
		fCancelled(false)
	{ }

	///	<summary>
	///		One row per unit in unit order, or only the units whose chunks
	///		finished if the run was cancelled.
	///	</summary>
	std::vector<ResultRow> vecRows;

	///	<summary>
	///		Selected model; NULL if the run was cancelled.
	///	</summary>
	std::unique_ptr<ClusterModel> pmodel;

	std::vector<std::string> vecFeatureNames;

	std::vector<std::string> vecUnitDims;

	///	<summary>
	///		Scaling applied to the features before clustering.
	///	</summary>
	FeatureScaling scaling;

	std::vector<CandidateScore> vecScores;

	bool fCancelled;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Drives a regime clustering run over an array source.
///	</summary>
class RegimePipeline {

public:
	///	<summary>
	///		Constructor.  Throws an Exception if the parameters are invalid.
	///	</summary>
	explicit RegimePipeline(
		const RegimeParam & param
	);

	const RegimeParam & GetParam() const {
		return m_param;
	}

	///	<summary>
	///		Run the pipeline.  Throws SourceError if the source cannot be
	///		used and InsufficientDataError if too few units have valid
	///		features.
	///	</summary>
	void Run(
		const ArraySource & source,
		const CancelFlag * pcancel,
		PipelineResult & result
	) const;

private:
	RegimeParam m_param;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Write the result table and, where a path is given, the centroid
///		and candidate score tables.
///	</summary>
void WritePipelineResult(
	const PipelineResult & result,
	const TableSink & sink,
	const std::string & strOutFile,
	const std::string & strOutCentroidsFile,
	const std::string & strOutScoresFile
);

///////////////////////////////////////////////////////////////////////////////

#endif

