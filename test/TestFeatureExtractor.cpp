///////////////////////////////////////////////////////////////////////////////
///
///	\file    TestFeatureExtractor.cpp
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

#include "FeatureExtractor.h"
#include "MemoryArraySource.h"
#include "RegimeTestData.h"
#include "Exception.h"

#include <cmath>
#include <string>
#include <vector>

namespace {

std::vector<FeatureSpec> MakeSpecs(
	const char * szVar,
	ReductionMode eMode,
	const char * szVar2 = NULL,
	ReductionMode eMode2 = ReductionMode_RawScalar
) {
	std::vector<FeatureSpec> vecSpecs;
	vecSpecs.push_back(FeatureSpec(szVar, eMode));
	if (szVar2 != NULL) {
		vecSpecs.push_back(FeatureSpec(szVar2, eMode2));
	}
	return vecSpecs;
}

///	<summary>
///		Four time steps of a 2x2 field; step t holds t, t+1, t+2, t+3, with
///		a fill value in step 2.
///	</summary>
void BuildFieldSource(MemoryArraySource & source) {
	source.AddDimension("time", 4);
	source.AddDimension("lat", 2);
	source.AddDimension("lon", 2);

	std::vector<std::string> vecDims;
	vecDims.push_back("time");
	vecDims.push_back("lat");
	vecDims.push_back("lon");

	std::vector<double> vecData;
	for (int t = 0; t < 4; t++) {
		for (int i = 0; i < 4; i++) {
			vecData.push_back(static_cast<double>(t + i));
		}
	}
	vecData[2 * 4 + 3] = 1.0e20;

	VariableInfo var("Z", vecDims);
	var.SetFillValue(1.0e20);
	source.AddVariable(var, vecData);
}

}  // namespace

///////////////////////////////////////////////////////////////////////////////

TEST(FeatureExtractor, RawScalarFeatures) {
	MemoryArraySource source;
	BuildThreeStepSource(source);

	FeatureExtractor extractor(
		source,
		std::vector<std::string>(1, "time"),
		MakeSpecs("temperature", ReductionMode_RawScalar,
			"pressure", ReductionMode_RawScalar));

	EXPECT_EQ(extractor.GetUnitCount(), 3u);
	ASSERT_EQ(extractor.GetFeatureCount(), 2u);
	EXPECT_EQ(extractor.GetFeatureNames()[0], "temperature");
	EXPECT_EQ(extractor.GetFeatureNames()[1], "pressure");

	UnitExtraction ue;
	extractor.ExtractUnit(1, ue);
	EXPECT_TRUE(ue.IsValid());
	EXPECT_EQ(ue.unit.sIndex, 1u);
	ASSERT_EQ(ue.unit.vecCoord.size(), 1u);
	EXPECT_DOUBLE_EQ(ue.unit.vecCoord[0], 6.0);
	EXPECT_DOUBLE_EQ(ue.vecFeatures[0], 10.2);
	EXPECT_DOUBLE_EQ(ue.vecFeatures[1], 1.1);
}

TEST(FeatureExtractor, ReducedFeaturesAndFill) {
	MemoryArraySource source;
	BuildFieldSource(source);

	FeatureExtractor extractor(
		source,
		std::vector<std::string>(1, "time"),
		MakeSpecs("Z", ReductionMode_Mean));

	EXPECT_EQ(extractor.GetFeatureNames()[0], "Z_mean");

	UnitExtraction ue;
	extractor.ExtractUnit(3, ue);
	EXPECT_TRUE(ue.IsValid());
	EXPECT_DOUBLE_EQ(ue.vecFeatures[0], 4.5);

	// Step 2 has one fill value; mean of 2, 3, 4
	extractor.ExtractUnit(2, ue);
	EXPECT_TRUE(ue.IsValid());
	EXPECT_DOUBLE_EQ(ue.vecFeatures[0], 3.0);
}

TEST(FeatureExtractor, FillValueIsExtractionFailure) {
	MemoryArraySource source;
	source.AddDimension("time", 5);

	std::vector<double> vecValues(5, 1.0);
	vecValues[4] = -999.0;

	VariableInfo var("X", std::vector<std::string>(1, "time"));
	var.SetFillValue(-999.0);
	source.AddVariable(var, vecValues);

	FeatureExtractor extractor(
		source,
		std::vector<std::string>(1, "time"),
		MakeSpecs("X", ReductionMode_RawScalar));

	UnitExtraction ue;
	extractor.ExtractUnit(4, ue);
	EXPECT_FALSE(ue.IsValid());
	EXPECT_EQ(ue.eError, ExtractionError_FillValue);
	EXPECT_EQ(ue.strErrorDetail, "X: fill value");
	EXPECT_TRUE(std::isnan(ue.vecFeatures[0]));

	extractor.ExtractUnit(3, ue);
	EXPECT_TRUE(ue.IsValid());
}

TEST(FeatureExtractor, RejectsInvalidConfiguration) {
	MemoryArraySource source;
	BuildFieldSource(source);
	AddTimeSeries(source, "S", std::vector<double>(4, 0.0));

	std::vector<std::string> vecUnitDims(1, "time");

	// Raw-scalar of a gridded variable
	EXPECT_THROW(
		FeatureExtractor(source, vecUnitDims,
			MakeSpecs("Z", ReductionMode_RawScalar)),
		Exception);

	EXPECT_THROW(
		FeatureExtractor(source, vecUnitDims,
			MakeSpecs("missing", ReductionMode_Mean)),
		SourceError);

	EXPECT_THROW(
		FeatureExtractor(source, std::vector<std::string>(1, "depth"),
			MakeSpecs("Z", ReductionMode_Mean)),
		SourceError);

	// S does not span lat
	EXPECT_THROW(
		FeatureExtractor(source, std::vector<std::string>(1, "lat"),
			MakeSpecs("S", ReductionMode_Mean)),
		Exception);

	EXPECT_THROW(
		FeatureExtractor(source, vecUnitDims,
			MakeSpecs("Z", ReductionMode_Mean, "Z", ReductionMode_Max)),
		Exception);

	EXPECT_THROW(
		FeatureExtractor(source, vecUnitDims, std::vector<FeatureSpec>()),
		Exception);
}

TEST(FeatureExtractor, SpatialUnitAxis) {
	MemoryArraySource source;
	BuildFieldSource(source);

	std::vector<std::string> vecUnitDims;
	vecUnitDims.push_back("lat");
	vecUnitDims.push_back("lon");

	FeatureExtractor extractor(
		source, vecUnitDims, MakeSpecs("Z", ReductionMode_Max));

	ASSERT_EQ(extractor.GetUnitCount(), 4u);

	// Cell (0, 1) holds 1, 2, 3, 4 over time
	UnitExtraction ue;
	extractor.ExtractUnit(1, ue);
	EXPECT_TRUE(ue.IsValid());
	EXPECT_EQ(ue.unit.vecDimIndex[0], 0);
	EXPECT_EQ(ue.unit.vecDimIndex[1], 1);
	EXPECT_DOUBLE_EQ(ue.vecFeatures[0], 4.0);

	// Cell (1, 1) has the fill value at time 2
	extractor.ExtractUnit(3, ue);
	EXPECT_TRUE(ue.IsValid());
	EXPECT_DOUBLE_EQ(ue.vecFeatures[0], 6.0);
}

TEST(FeatureExtractor, CursorIsRestartable) {
	MemoryArraySource source;
	BuildThreeStepSource(source);

	FeatureExtractor extractor(
		source,
		std::vector<std::string>(1, "time"),
		MakeSpecs("temperature", ReductionMode_RawScalar));

	FeatureExtractor::Cursor cursor = extractor.GetCursor(1, 3);

	UnitExtraction ue;
	std::vector<double> vecFirst;
	while (cursor.Next(ue)) {
		vecFirst.push_back(ue.vecFeatures[0]);
	}
	ASSERT_EQ(vecFirst.size(), 2u);
	EXPECT_DOUBLE_EQ(vecFirst[0], 10.2);
	EXPECT_DOUBLE_EQ(vecFirst[1], 50.0);
	EXPECT_FALSE(cursor.Next(ue));

	cursor.Reset();
	EXPECT_EQ(cursor.GetPosition(), 1u);
	ASSERT_TRUE(cursor.Next(ue));
	EXPECT_EQ(ue.unit.sIndex, 1u);

	size_t sCount = 0;
	FeatureExtractor::Cursor cursorAll = extractor.GetCursor();
	while (cursorAll.Next(ue)) {
		sCount++;
	}
	EXPECT_EQ(sCount, 3u);
}

TEST(FeatureExtractor, ExtractChunk) {
	MemoryArraySource source;
	BuildFieldSource(source);

	FeatureExtractor extractor(
		source,
		std::vector<std::string>(1, "time"),
		MakeSpecs("Z", ReductionMode_Min));

	ChunkResult result;
	extractor.ExtractChunk(1, 4, result);

	ASSERT_EQ(result.GetUnitCount(), 3u);
	EXPECT_EQ(result.sBegin, 1u);
	EXPECT_DOUBLE_EQ(result.dFeatures(0,0), 1.0);
	EXPECT_DOUBLE_EQ(result.dFeatures(2,0), 3.0);
	EXPECT_EQ(result.vecError[1], ExtractionError_None);

	EXPECT_THROW(extractor.ExtractChunk(2, 5, result), SourceError);
}

///////////////////////////////////////////////////////////////////////////////

TEST(FeatureScaling, NormalizesAndRestores) {
	DataArray2D<double> dFeatures(4, 2);
	dFeatures(0,0) = 1.0;  dFeatures(0,1) = 5.0;
	dFeatures(1,0) = 3.0;  dFeatures(1,1) = 5.0;
	dFeatures(2,0) = 1.0e6; dFeatures(2,1) = 5.0;
	dFeatures(3,0) = 5.0;  dFeatures(3,1) = 5.0;

	// Row 2 is excluded
	std::vector<bool> vecUse(4, true);
	vecUse[2] = false;

	FeatureScaling scaling;
	scaling.Compute(dFeatures, vecUse);

	EXPECT_TRUE(scaling.IsNormalizing());
	EXPECT_DOUBLE_EQ(scaling.GetMean(0), 3.0);
	EXPECT_NEAR(scaling.GetStdDev(0), std::sqrt(8.0 / 3.0), 1.0e-12);
	EXPECT_FALSE(scaling.IsConstant(0));
	EXPECT_TRUE(scaling.IsConstant(1));

	double dRow[2] = { 5.0, 5.0 };
	scaling.Normalize(dRow);
	EXPECT_NEAR(dRow[0], 2.0 / std::sqrt(8.0 / 3.0), 1.0e-12);
	EXPECT_DOUBLE_EQ(dRow[1], 5.0);

	scaling.Denormalize(dRow);
	EXPECT_NEAR(dRow[0], 5.0, 1.0e-12);
	EXPECT_DOUBLE_EQ(dRow[1], 5.0);

	DataArray1D<double> dWeights;
	scaling.GetDistanceWeights(dWeights);
	EXPECT_DOUBLE_EQ(dWeights[0], 1.0);
	EXPECT_DOUBLE_EQ(dWeights[1], 0.0);
}

TEST(FeatureScaling, IdentityLeavesValues) {
	FeatureScaling scaling;
	scaling.SetIdentity(2);

	double dRow[2] = { 7.0, -3.0 };
	scaling.Normalize(dRow);
	EXPECT_DOUBLE_EQ(dRow[0], 7.0);
	EXPECT_DOUBLE_EQ(dRow[1], -3.0);

	DataArray1D<double> dWeights;
	scaling.GetDistanceWeights(dWeights);
	EXPECT_DOUBLE_EQ(dWeights[0], 1.0);
	EXPECT_DOUBLE_EQ(dWeights[1], 1.0);

	DataArray2D<double> dFeatures(3, 2);
	EXPECT_THROW(scaling.Compute(dFeatures, std::vector<bool>(2, true)), Exception);
}

///////////////////////////////////////////////////////////////////////////////

