///////////////////////////////////////////////////////////////////////////////
///
///	\file    RegimePipeline.cpp
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

#include "RegimePipeline.h"
#include "ArraySource.h"
#include "ChunkScheduler.h"
#include "STLStringHelper.h"
#include "FunctionTimer.h"
#include "Announce.h"
#include "Exception.h"

#include <algorithm>

#include <omp.h>

///////////////////////////////////////////////////////////////////////////////

RegimePipeline::RegimePipeline(
	const RegimeParam & param
) :
	m_param(param)
{
	m_param.Validate();
}

///////////////////////////////////////////////////////////////////////////////

void RegimePipeline::Run(
	const ArraySource & source,
	const CancelFlag * pcancel,
	PipelineResult & result
) const {

	result.vecRows.clear();
	result.pmodel.reset();
	result.vecScores.clear();
	result.fCancelled = false;

	if (!source.IsOpen()) {
		_SOURCEERRORT("Array source is not open");
	}

	// Build the extractor
	AnnounceStartBlock("Configuring feature extraction");

	std::vector<FeatureSpec> vecFeatureSpecs;
	m_param.BuildFeatureSpecs(vecFeatureSpecs);

	FeatureExtractor extractor(source, m_param.vecUnitDims, vecFeatureSpecs);

	result.vecFeatureNames = extractor.GetFeatureNames();
	result.vecUnitDims = m_param.vecUnitDims;

	Announce("Units: %lu along (%s)",
		static_cast<unsigned long>(extractor.GetUnitCount()),
		STLStringHelper::ConcatenateStringVector(
			m_param.vecUnitDims, ", ").c_str());
	Announce("Features: %s",
		STLStringHelper::ConcatenateStringVector(
			result.vecFeatureNames, ", ").c_str());

	AnnounceEndBlock("Done");

	if (m_param.nThreads > 0) {
		omp_set_num_threads(m_param.nThreads);
	}

	// Extract features chunk by chunk
	AnnounceStartBlock("Extracting features (%i threads)",
		omp_get_max_threads());

	FunctionTimer timerExtract("Extraction");

	std::vector<ChunkResult> vecChunks;
	ChunkScheduler scheduler(static_cast<size_t>(m_param.nChunkSize));
	scheduler.Run(extractor, pcancel, vecChunks);

	ResultAggregator aggregator(extractor);
	aggregator.MergeChunks(vecChunks);

	Announce("%lu chunks in %1.3f s",
		static_cast<unsigned long>(vecChunks.size()),
		timerExtract.Seconds(true));

	AnnounceEndBlock("Done");

	if (IsCancelled(pcancel) || (aggregator.GetUnfinishedCount() != 0)) {
		Announce("Run cancelled during extraction");
		result.fCancelled = true;
		aggregator.BuildCancelledRows(result.vecRows);
		return;
	}

	// Normalize
	const size_t sFeatures = extractor.GetFeatureCount();

	if (m_param.fNormalize) {
		AnnounceStartBlock("Normalizing features");

		std::vector<bool> vecUsable;
		aggregator.GetUsableMask(vecUsable);
		result.scaling.Compute(aggregator.GetFeatures(), vecUsable);

		for (size_t f = 0; f < sFeatures; f++) {
			if (result.scaling.IsConstant(f)) {
				Announce("WARNING: Feature \"%s\" is constant and does not "
					"contribute to distances",
					result.vecFeatureNames[f].c_str());
			} else {
				Announce(1, "%s: mean %1.6e, standard deviation %1.6e",
					result.vecFeatureNames[f].c_str(),
					result.scaling.GetMean(f),
					result.scaling.GetStdDev(f));
			}
		}
		AnnounceEndBlock("Done");

	} else {
		result.scaling.SetIdentity(sFeatures);
	}

	DataArray2D<double> dPoints;
	aggregator.SelectPoints(result.scaling, dPoints);

	const size_t sExtraction =
		aggregator.GetStatusCount(UnitStatus_ExtractionFailure);
	const size_t sChunk =
		aggregator.GetStatusCount(UnitStatus_ChunkFailure);
	const size_t sNonFinite =
		aggregator.GetStatusCount(UnitStatus_NonFiniteFeature);

	Announce("Valid feature vectors: %lu of %lu",
		static_cast<unsigned long>(aggregator.GetPointCount()),
		static_cast<unsigned long>(aggregator.GetUnitCount()));
	if (sExtraction + sChunk + sNonFinite != 0) {
		Announce("Excluded: %lu extraction failure, %lu chunk failure, "
			"%lu non-finite feature",
			static_cast<unsigned long>(sExtraction),
			static_cast<unsigned long>(sChunk),
			static_cast<unsigned long>(sNonFinite));
	}

	// Cluster
	ClusteringParam cparam;
	m_param.BuildClusteringParam(cparam);

	const int nMinK =
		*std::min_element(cparam.vecCandidateK.begin(), cparam.vecCandidateK.end());

	if (aggregator.GetPointCount() < static_cast<size_t>(nMinK)) {
		_INSUFFICIENTDATA5("%lu valid feature vectors, fewer than the smallest "
			"candidate number of clusters (%i); excluded units: "
			"%lu extraction failure, %lu chunk failure, %lu non-finite feature",
			static_cast<unsigned long>(aggregator.GetPointCount()),
			nMinK,
			static_cast<unsigned long>(sExtraction),
			static_cast<unsigned long>(sChunk),
			static_cast<unsigned long>(sNonFinite));
	}

	AnnounceStartBlock("Clustering (%s initialization, seed %i, %s validity)",
		InitializationMethodToString(cparam.eInit),
		cparam.nSeed,
		ValidityPolicyToString(cparam.eValidity));

	FunctionTimer timerCluster("Clustering");

	DataArray1D<double> dWeights;
	result.scaling.GetDistanceWeights(dWeights);

	ClusteringEngine engine(cparam);
	bool fFit = engine.Fit(dPoints, dWeights, pcancel);

	Announce("Clustering completed in %1.3f s", timerCluster.Seconds(true));

	AnnounceEndBlock("Done");

	if (!fFit) {
		Announce("Run cancelled during clustering");
		result.fCancelled = true;
		aggregator.BuildCancelledRows(result.vecRows);
		return;
	}

	result.vecScores = engine.GetScores();
	result.pmodel.reset(new ClusterModel(engine.GetModel()));

	// Aggregate
	aggregator.BuildRows(*(result.pmodel), result.vecRows);
}

///////////////////////////////////////////////////////////////////////////////

void WritePipelineResult(
	const PipelineResult & result,
	const TableSink & sink,
	const std::string & strOutFile,
	const std::string & strOutCentroidsFile,
	const std::string & strOutScoresFile
) {
	Table table;

	AnnounceStartBlock("Writing result table \"%s\"", strOutFile.c_str());
	BuildResultTable(result.vecRows, result.vecUnitDims, table);
	sink.Write(strOutFile, table);
	AnnounceEndBlock("Done");

	if (result.pmodel.get() == NULL) {
		if ((strOutCentroidsFile != "") || (strOutScoresFile != "")) {
			Announce("No cluster model; centroid and score tables not written");
		}
		return;
	}

	if (strOutCentroidsFile != "") {
		AnnounceStartBlock("Writing centroid table \"%s\"",
			strOutCentroidsFile.c_str());
		BuildCentroidTable(
			*(result.pmodel), result.scaling, result.vecFeatureNames, table);
		sink.Write(strOutCentroidsFile, table);
		AnnounceEndBlock("Done");
	}

	if (strOutScoresFile != "") {
		AnnounceStartBlock("Writing score table \"%s\"",
			strOutScoresFile.c_str());
		BuildScoreTable(result.vecScores, table);
		sink.Write(strOutScoresFile, table);
		AnnounceEndBlock("Done");
	}
}

///////////////////////////////////////////////////////////////////////////////

