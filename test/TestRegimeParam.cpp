///////////////////////////////////////////////////////////////////////////////
///
///	\file    TestRegimeParam.cpp
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

#include "RegimeParam.h"
#include "Exception.h"

#include <map>
#include <string>
#include <vector>

namespace {

RegimeParam MakeParam() {
	RegimeParam param;
	param.vecVariables.push_back("T");
	param.vecVariables.push_back("P");
	return param;
}

}  // namespace

///////////////////////////////////////////////////////////////////////////////

TEST(RegimeParam, ParsesReduceCommand) {
	std::map<std::string, ReductionMode> mapReduction;
	ParseReduceCommand("T,mean; P , MAX", mapReduction);

	ASSERT_EQ(mapReduction.size(), 2u);
	EXPECT_EQ(mapReduction["T"], ReductionMode_Mean);
	EXPECT_EQ(mapReduction["P"], ReductionMode_Max);

	ParseReduceCommand("", mapReduction);
	EXPECT_EQ(mapReduction.size(), 0u);

	EXPECT_THROW(ParseReduceCommand("T", mapReduction), Exception);
	EXPECT_THROW(ParseReduceCommand("T,mean,max", mapReduction), Exception);
	EXPECT_THROW(ParseReduceCommand("T,median", mapReduction), Exception);
	EXPECT_THROW(ParseReduceCommand("T,mean;T,max", mapReduction), Exception);
	EXPECT_THROW(ParseReduceCommand("T,mean;", mapReduction), Exception);
}

TEST(RegimeParam, DefaultsAreValid) {
	RegimeParam param = MakeParam();
	EXPECT_NO_THROW(param.Validate());

	ASSERT_EQ(param.vecUnitDims.size(), 1u);
	EXPECT_EQ(param.vecUnitDims[0], "time");
	EXPECT_EQ(param.nChunkSize, DefaultChunkSize);
	EXPECT_EQ(param.eInit, InitializationMethod_Random);
	EXPECT_FALSE(param.fNormalize);
	EXPECT_EQ(param.eValidity, ValidityPolicy_Silhouette);
	EXPECT_EQ(param.eNormalization, ScoreNormalization_Probability);
	EXPECT_DOUBLE_EQ(param.dWeightSilhouette, 0.34);
	EXPECT_DOUBLE_EQ(param.dWeightCalinskiHarabasz, 0.33);
	EXPECT_DOUBLE_EQ(param.dWeightDaviesBouldin, 0.33);
}

TEST(RegimeParam, RejectsInvalidConfiguration) {
	RegimeParam param;
	EXPECT_THROW(param.Validate(), Exception);

	param = MakeParam();
	param.vecVariables.push_back("T");
	EXPECT_THROW(param.Validate(), Exception);

	param = MakeParam();
	param.mapReduction["Q"] = ReductionMode_Mean;
	EXPECT_THROW(param.Validate(), Exception);

	param = MakeParam();
	param.vecUnitDims.clear();
	EXPECT_THROW(param.Validate(), Exception);

	param = MakeParam();
	param.nK = -1;
	EXPECT_THROW(param.Validate(), Exception);

	param = MakeParam();
	param.nKMin = 0;
	EXPECT_THROW(param.Validate(), Exception);

	param = MakeParam();
	param.nKMin = 4;
	param.nKMax = 3;
	EXPECT_THROW(param.Validate(), Exception);

	// A fixed k ignores the range
	param.nK = 3;
	EXPECT_NO_THROW(param.Validate());

	param = MakeParam();
	param.nChunkSize = 0;
	EXPECT_THROW(param.Validate(), Exception);

	param = MakeParam();
	param.nMaxIterations = 0;
	EXPECT_THROW(param.Validate(), Exception);

	param = MakeParam();
	param.dTolerance = -1.0e-3;
	EXPECT_THROW(param.Validate(), Exception);

	param = MakeParam();
	param.nSilhouetteSamples = 1;
	EXPECT_THROW(param.Validate(), Exception);

	param = MakeParam();
	param.nThreads = -2;
	EXPECT_THROW(param.Validate(), Exception);

	param = MakeParam();
	param.dWeightCalinskiHarabasz = -0.5;
	EXPECT_THROW(param.Validate(), Exception);

	param = MakeParam();
	param.dWeightSilhouette = 0.0;
	param.dWeightCalinskiHarabasz = 0.0;
	param.dWeightDaviesBouldin = 0.0;
	EXPECT_THROW(param.Validate(), Exception);

	// A single index may carry all of the weight
	param.dWeightDaviesBouldin = 2.0;
	EXPECT_NO_THROW(param.Validate());
}

TEST(RegimeParam, FeatureSpecsFollowVariableOrder) {
	RegimeParam param = MakeParam();
	param.mapReduction["P"] = ReductionMode_Variance;

	std::vector<FeatureSpec> vecSpecs;
	param.BuildFeatureSpecs(vecSpecs);

	ASSERT_EQ(vecSpecs.size(), 2u);
	EXPECT_EQ(vecSpecs[0].strVariable, "T");
	EXPECT_EQ(vecSpecs[0].eMode, ReductionMode_RawScalar);
	EXPECT_EQ(vecSpecs[1].strVariable, "P");
	EXPECT_EQ(vecSpecs[1].eMode, ReductionMode_Variance);
}

TEST(RegimeParam, CandidateKAndClusteringParam) {
	RegimeParam param = MakeParam();
	param.nKMin = 2;
	param.nKMax = 5;

	std::vector<int> vecCandidateK;
	param.GetCandidateK(vecCandidateK);
	ASSERT_EQ(vecCandidateK.size(), 4u);
	EXPECT_EQ(vecCandidateK[0], 2);
	EXPECT_EQ(vecCandidateK[3], 5);

	param.nK = 7;
	param.GetCandidateK(vecCandidateK);
	ASSERT_EQ(vecCandidateK.size(), 1u);
	EXPECT_EQ(vecCandidateK[0], 7);

	param.nMaxIterations = 25;
	param.dTolerance = 1.0e-6;
	param.nSeed = 11;
	param.eInit = InitializationMethod_KMeansPlusPlus;
	param.nSilhouetteSamples = 100;
	param.eValidity = ValidityPolicy_Combined;
	param.eNormalization = ScoreNormalization_ZScore;
	param.dWeightSilhouette = 0.5;
	param.dWeightCalinskiHarabasz = 0.25;
	param.dWeightDaviesBouldin = 0.0;

	ClusteringParam paramClustering;
	param.BuildClusteringParam(paramClustering);

	ASSERT_EQ(paramClustering.vecCandidateK.size(), 1u);
	EXPECT_EQ(paramClustering.vecCandidateK[0], 7);
	EXPECT_EQ(paramClustering.nMaxIterations, 25);
	EXPECT_DOUBLE_EQ(paramClustering.dTolerance, 1.0e-6);
	EXPECT_EQ(paramClustering.nSeed, 11);
	EXPECT_EQ(paramClustering.eInit, InitializationMethod_KMeansPlusPlus);
	EXPECT_EQ(paramClustering.nSilhouetteSamples, 100);
	EXPECT_EQ(paramClustering.eValidity, ValidityPolicy_Combined);
	EXPECT_EQ(paramClustering.eNormalization, ScoreNormalization_ZScore);
	EXPECT_DOUBLE_EQ(paramClustering.dWeightSilhouette, 0.5);
	EXPECT_DOUBLE_EQ(paramClustering.dWeightCalinskiHarabasz, 0.25);
	EXPECT_DOUBLE_EQ(paramClustering.dWeightDaviesBouldin, 0.0);
}

///////////////////////////////////////////////////////////////////////////////

