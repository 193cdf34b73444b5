///////////////////////////////////////////////////////////////////////////////
///
///	\file    TestResultAggregator.cpp
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

#include <gtest/gtest.h>

#include "ResultAggregator.h"
#include "ChunkScheduler.h"
#include "ClusteringEngine.h"
#include "MemoryArraySource.h"
#include "RegimeTestData.h"
#include "Exception.h"

#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace {

///	<summary>
///		Eight time steps: two tight pairs, a fill value, a NaN and two
///		units whose chunk is later marked failed.
///	</summary>
void BuildMixedSource(MemoryArraySource & source) {
	std::vector<double> vecTime;
	for (int t = 0; t < 8; t++) {
		vecTime.push_back(100.0 + 6.0 * static_cast<double>(t));
	}
	source.AddDimension(DimensionInfo("time", vecTime));

	std::vector<double> vecValues;
	vecValues.push_back(0.0);
	vecValues.push_back(0.1);
	vecValues.push_back(10.0);
	vecValues.push_back(10.1);
	vecValues.push_back(-999.0);
	vecValues.push_back(std::numeric_limits<double>::quiet_NaN());
	vecValues.push_back(5.0);
	vecValues.push_back(5.0);

	VariableInfo var("X", std::vector<std::string>(1, "time"));
	var.SetFillValue(-999.0);
	source.AddVariable(var, vecValues);
}

///	<summary>
///		Extract chunks of two units and mark the last chunk failed.
///	</summary>
void ExtractMixedChunks(
	const FeatureExtractor & extractor,
	std::vector<ChunkResult> & vecChunks
) {
	std::vector<ChunkRange> vecRanges;
	PartitionUnits(extractor.GetUnitCount(), 2, vecRanges);

	vecChunks.resize(vecRanges.size());
	for (size_t c = 0; c < vecRanges.size(); c++) {
		vecChunks[c].sChunk = c;
		extractor.ExtractChunk(vecRanges[c].sBegin, vecRanges[c].sEnd, vecChunks[c]);
	}

	ChunkResult & chunkFailed = vecChunks.back();
	chunkFailed.Initialize(chunkFailed.sBegin, chunkFailed.sEnd, 1);
	chunkFailed.fFailed = true;
	chunkFailed.nAttempts = 2;
	chunkFailed.strFailure = "disk error";
}

std::vector<FeatureSpec> MakeSpecs() {
	return std::vector<FeatureSpec>(1, FeatureSpec("X", ReductionMode_RawScalar));
}

}  // namespace

///////////////////////////////////////////////////////////////////////////////

TEST(ResultAggregator, MergeAssignsStatus) {
	MemoryArraySource source;
	BuildMixedSource(source);

	FeatureExtractor extractor(
		source, std::vector<std::string>(1, "time"), MakeSpecs());

	std::vector<ChunkResult> vecChunks;
	ExtractMixedChunks(extractor, vecChunks);

	ResultAggregator aggregator(extractor);
	EXPECT_EQ(aggregator.GetUnfinishedCount(), 8u);

	aggregator.MergeChunks(vecChunks);
	EXPECT_EQ(aggregator.GetUnfinishedCount(), 0u);
	EXPECT_EQ(aggregator.GetStatusCount(UnitStatus_ExtractionFailure), 1u);
	EXPECT_EQ(aggregator.GetStatusCount(UnitStatus_ChunkFailure), 2u);

	std::vector<bool> vecUsable;
	aggregator.GetUsableMask(vecUsable);
	ASSERT_EQ(vecUsable.size(), 8u);
	for (size_t u = 0; u < 4; u++) {
		EXPECT_TRUE(vecUsable[u]);
	}
	for (size_t u = 4; u < 8; u++) {
		EXPECT_FALSE(vecUsable[u]);
	}

	FeatureScaling scaling;
	scaling.SetIdentity(1);

	DataArray2D<double> dPoints;
	aggregator.SelectPoints(scaling, dPoints);

	ASSERT_EQ(dPoints.GetRows(), 4u);
	EXPECT_EQ(aggregator.GetPointCount(), 4u);
	EXPECT_EQ(aggregator.GetPointUnits()[3], 3u);
	EXPECT_DOUBLE_EQ(dPoints(3,0), 10.1);
	EXPECT_EQ(aggregator.GetStatusCount(UnitStatus_NonFiniteFeature), 1u);
	EXPECT_EQ(aggregator.GetStatusCount(UnitStatus_Clustered), 4u);
}

TEST(ResultAggregator, BuildsOneRowPerUnit) {
	MemoryArraySource source;
	BuildMixedSource(source);

	FeatureExtractor extractor(
		source, std::vector<std::string>(1, "time"), MakeSpecs());

	std::vector<ChunkResult> vecChunks;
	ExtractMixedChunks(extractor, vecChunks);

	ResultAggregator aggregator(extractor);
	aggregator.MergeChunks(vecChunks);

	FeatureScaling scaling;
	scaling.SetIdentity(1);

	DataArray2D<double> dPoints;
	aggregator.SelectPoints(scaling, dPoints);

	DataArray1D<double> dWeights;
	BuildUnitWeights(1, dWeights);

	ClusteringParam param;
	KMeansFit fit;
	ClusteringEngine::FitK(dPoints, dWeights, 2, param, NULL, fit);
	ClusterModel model(fit, std::vector<CandidateScore>());

	std::vector<ResultRow> vecRows;
	aggregator.BuildRows(model, vecRows);

	ASSERT_EQ(vecRows.size(), 8u);
	for (size_t u = 0; u < 8; u++) {
		EXPECT_EQ(vecRows[u].sUnitId, u);
		ASSERT_EQ(vecRows[u].vecCoord.size(), 1u);
		EXPECT_DOUBLE_EQ(vecRows[u].vecCoord[0], 100.0 + 6.0 * static_cast<double>(u));
	}

	EXPECT_TRUE(vecRows[0].IsClustered());
	EXPECT_EQ(vecRows[0].iCluster, vecRows[1].iCluster);
	EXPECT_EQ(vecRows[2].iCluster, vecRows[3].iCluster);
	EXPECT_NE(vecRows[0].iCluster, vecRows[2].iCluster);
	EXPECT_NEAR(vecRows[1].dDistance, 0.05, 1.0e-12);

	EXPECT_EQ(vecRows[4].eStatus, UnitStatus_ExtractionFailure);
	EXPECT_EQ(vecRows[4].strDetail, "X: fill value");
	EXPECT_EQ(vecRows[4].iCluster, -1);
	EXPECT_EQ(vecRows[5].eStatus, UnitStatus_NonFiniteFeature);
	EXPECT_EQ(vecRows[5].strDetail, "X");
	EXPECT_EQ(vecRows[6].eStatus, UnitStatus_ChunkFailure);
	EXPECT_EQ(vecRows[7].strDetail, "disk error");

	// Result table
	Table table;
	BuildResultTable(vecRows, std::vector<std::string>(1, "time"), table);

	ASSERT_EQ(table.GetColumnCount(), 5u);
	EXPECT_EQ(table.vecColumns[0], "unit_id");
	EXPECT_EQ(table.vecColumns[1], "time");
	EXPECT_EQ(table.vecColumns[4], "status");
	ASSERT_EQ(table.GetRowCount(), 8u);
	EXPECT_EQ(table.vecRows[2][1], "112");
	EXPECT_EQ(table.vecRows[0][4], "clustered");
	EXPECT_EQ(table.vecRows[4][2], "");
	EXPECT_EQ(table.vecRows[4][3], "");
	EXPECT_EQ(table.vecRows[4][4], "unclustered: extraction failure");
	EXPECT_EQ(table.vecRows[6][4], "unclustered: chunk failure");

	// A model of different size is rejected
	DataArray2D<double> dOther(3, 1);
	dOther(0,0) = 0.0;
	dOther(1,0) = 5.0;
	dOther(2,0) = 10.0;
	KMeansFit fitOther;
	ClusteringEngine::FitK(dOther, dWeights, 2, param, NULL, fitOther);
	ClusterModel modelOther(fitOther, std::vector<CandidateScore>());
	EXPECT_THROW(aggregator.BuildRows(modelOther, vecRows), Exception);
}

TEST(ResultAggregator, CentroidTableIsInPhysicalUnits) {
	MemoryArraySource source;
	BuildMixedSource(source);

	FeatureExtractor extractor(
		source, std::vector<std::string>(1, "time"), MakeSpecs());

	std::vector<ChunkResult> vecChunks;
	ExtractMixedChunks(extractor, vecChunks);

	ResultAggregator aggregator(extractor);
	aggregator.MergeChunks(vecChunks);

	std::vector<bool> vecUsable;
	aggregator.GetUsableMask(vecUsable);

	FeatureScaling scaling;
	scaling.Compute(aggregator.GetFeatures(), vecUsable);
	EXPECT_NEAR(scaling.GetMean(0), 5.05, 1.0e-12);

	DataArray2D<double> dPoints;
	aggregator.SelectPoints(scaling, dPoints);
	ASSERT_EQ(dPoints.GetRows(), 4u);
	EXPECT_LT(dPoints(0,0), 0.0);

	DataArray1D<double> dWeights;
	scaling.GetDistanceWeights(dWeights);

	ClusteringParam param;
	KMeansFit fit;
	ClusteringEngine::FitK(dPoints, dWeights, 2, param, NULL, fit);
	ClusterModel model(fit, std::vector<CandidateScore>());

	Table table;
	BuildCentroidTable(
		model, scaling, extractor.GetFeatureNames(), table);

	ASSERT_EQ(table.GetColumnCount(), 4u);
	EXPECT_EQ(table.vecColumns[3], "X");
	ASSERT_EQ(table.GetRowCount(), 2u);

	std::vector<std::string> vecCentroids;
	for (size_t r = 0; r < 2; r++) {
		EXPECT_EQ(table.vecRows[r][0], FormatTableInteger(static_cast<long>(r)));
		EXPECT_EQ(table.vecRows[r][1], "2");
		vecCentroids.push_back(table.vecRows[r][3]);
	}
	EXPECT_TRUE(
		((vecCentroids[0] == "0.05") && (vecCentroids[1] == "10.05"))
		|| ((vecCentroids[0] == "10.05") && (vecCentroids[1] == "0.05")));
}

TEST(ResultAggregator, CancelledChunksAreLeftOut) {
	MemoryArraySource source;
	BuildMixedSource(source);

	FeatureExtractor extractor(
		source, std::vector<std::string>(1, "time"), MakeSpecs());

	std::vector<ChunkResult> vecChunks;
	ExtractMixedChunks(extractor, vecChunks);

	// Chunks 2 and 3 were never started
	for (size_t c = 2; c < 4; c++) {
		const size_t sBegin = vecChunks[c].sBegin;
		const size_t sEnd = vecChunks[c].sEnd;
		vecChunks[c] = ChunkResult();
		vecChunks[c].sChunk = c;
		vecChunks[c].sBegin = sBegin;
		vecChunks[c].sEnd = sEnd;
		vecChunks[c].fCancelled = true;
	}

	ResultAggregator aggregator(extractor);
	aggregator.MergeChunks(vecChunks);
	EXPECT_EQ(aggregator.GetUnfinishedCount(), 4u);
	EXPECT_EQ(aggregator.GetStatusCount(UnitStatus_Cancelled), 0u);

	std::vector<ResultRow> vecRows;
	aggregator.BuildCancelledRows(vecRows);
	ASSERT_EQ(vecRows.size(), 4u);
	for (size_t r = 0; r < vecRows.size(); r++) {
		EXPECT_EQ(vecRows[r].sUnitId, r);
		EXPECT_EQ(vecRows[r].eStatus, UnitStatus_Cancelled);
		EXPECT_FALSE(vecRows[r].IsClustered());
	}

	Table table;
	BuildResultTable(vecRows, std::vector<std::string>(1, "time"), table);
	EXPECT_EQ(table.vecRows[0][4], "unclustered: cancelled");
}

TEST(ResultAggregator, CancelledRowsKeepFailureStatus) {
	MemoryArraySource source;
	BuildMixedSource(source);

	FeatureExtractor extractor(
		source, std::vector<std::string>(1, "time"), MakeSpecs());

	std::vector<ChunkResult> vecChunks;
	ExtractMixedChunks(extractor, vecChunks);

	// Only chunk 1 was never started
	const size_t sBegin = vecChunks[1].sBegin;
	const size_t sEnd = vecChunks[1].sEnd;
	vecChunks[1] = ChunkResult();
	vecChunks[1].sChunk = 1;
	vecChunks[1].sBegin = sBegin;
	vecChunks[1].sEnd = sEnd;
	vecChunks[1].fCancelled = true;

	ResultAggregator aggregator(extractor);
	aggregator.MergeChunks(vecChunks);
	EXPECT_EQ(aggregator.GetUnfinishedCount(), 2u);

	std::vector<ResultRow> vecRows;
	aggregator.BuildCancelledRows(vecRows);
	ASSERT_EQ(vecRows.size(), 6u);

	EXPECT_EQ(vecRows[0].sUnitId, 0u);
	EXPECT_EQ(vecRows[0].eStatus, UnitStatus_Cancelled);
	EXPECT_EQ(vecRows[1].sUnitId, 1u);
	EXPECT_EQ(vecRows[1].eStatus, UnitStatus_Cancelled);

	// Units that could not have been clustered keep their reason
	EXPECT_EQ(vecRows[2].sUnitId, 4u);
	EXPECT_EQ(vecRows[2].eStatus, UnitStatus_ExtractionFailure);
	EXPECT_EQ(vecRows[4].sUnitId, 6u);
	EXPECT_EQ(vecRows[4].eStatus, UnitStatus_ChunkFailure);
	EXPECT_EQ(vecRows[5].sUnitId, 7u);
	EXPECT_EQ(vecRows[5].eStatus, UnitStatus_ChunkFailure);

	for (size_t r = 0; r < vecRows.size(); r++) {
		EXPECT_FALSE(vecRows[r].IsClustered());
	}

	Table table;
	BuildResultTable(vecRows, std::vector<std::string>(1, "time"), table);
	EXPECT_EQ(table.vecRows[0][4], "unclustered: cancelled");
	EXPECT_NE(table.vecRows[4][4], "unclustered: cancelled");
}

TEST(ResultAggregator, ScoreTableMarksSkippedCandidates) {
	std::vector<CandidateScore> vecScores(2);
	vecScores[0].nK = 2;
	vecScores[0].fEvaluated = true;
	vecScores[0].dValidity = 0.25;
	vecScores[0].dSilhouette = 0.75;
	vecScores[0].dNormSilhouette = 1.0;
	vecScores[0].dTotalScore = 0.5;
	vecScores[0].nIterations = 3;
	vecScores[0].fConverged = true;
	vecScores[0].fSelected = true;
	vecScores[1].nK = 9;

	Table table;
	BuildScoreTable(vecScores, table);

	ASSERT_EQ(table.GetColumnCount(), 13u);
	EXPECT_EQ(table.vecColumns[1], "validity");
	EXPECT_EQ(table.vecColumns[5], "silhouette_norm");
	EXPECT_EQ(table.vecColumns[8], "total_score");
	ASSERT_EQ(table.GetRowCount(), 2u);
	EXPECT_EQ(table.vecRows[0][0], "2");
	EXPECT_EQ(table.vecRows[0][1], "0.25");
	EXPECT_EQ(table.vecRows[0][5], "1");
	EXPECT_EQ(table.vecRows[0][8], "0.5");
	EXPECT_EQ(table.vecRows[0][10], "3");
	EXPECT_EQ(table.vecRows[0][11], "true");
	EXPECT_EQ(table.vecRows[0][12], "true");
	EXPECT_EQ(table.vecRows[1][0], "9");
	for (size_t f = 1; f < 11; f++) {
		EXPECT_EQ(table.vecRows[1][f], "");
	}
	EXPECT_EQ(table.vecRows[1][11], "false");
	EXPECT_EQ(table.vecRows[1][12], "false");
}

///////////////////////////////////////////////////////////////////////////////

