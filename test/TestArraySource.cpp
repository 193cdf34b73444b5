///////////////////////////////////////////////////////////////////////////////
///
///	\file    TestArraySource.cpp
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

#include "MemoryArraySource.h"
#include "Exception.h"

#include <string>
#include <vector>

namespace {

std::vector<std::string> MakeDims(
	const char * szA,
	const char * szB = NULL,
	const char * szC = NULL
) {
	std::vector<std::string> vecDims;
	vecDims.push_back(szA);
	if (szB != NULL) {
		vecDims.push_back(szB);
	}
	if (szC != NULL) {
		vecDims.push_back(szC);
	}
	return vecDims;
}

std::vector<double> MakeRange(size_t sCount) {
	std::vector<double> vecValues(sCount);
	for (size_t i = 0; i < sCount; i++) {
		vecValues[i] = static_cast<double>(i);
	}
	return vecValues;
}

}  // namespace

///////////////////////////////////////////////////////////////////////////////

TEST(Dataset, DimensionDefaultsToIndexCoordinates) {
	MemoryArraySource source;
	source.AddDimension("time", 4);

	const DimensionInfo & dim = source.GetDataset().GetDimension("time");
	EXPECT_EQ(dim.lSize, 4);
	ASSERT_EQ(dim.vecCoord.size(), 4u);
	EXPECT_DOUBLE_EQ(dim.vecCoord[3], 3.0);
	EXPECT_EQ(source.GetDataset().FindDimension("lat"), (const DimensionInfo *)NULL);
}

TEST(Dataset, RejectsMalformedDimensions) {
	Dataset dataset;
	dataset.AddDimension(DimensionInfo("time", 2));

	EXPECT_THROW(dataset.AddDimension(DimensionInfo("time", 3)), SourceError);
	EXPECT_THROW(dataset.AddDimension(DimensionInfo("", 3)), SourceError);
	EXPECT_THROW(DimensionInfo("lat", -1), SourceError);

	DimensionInfo dimBad("lat", 3);
	dimBad.vecCoord.pop_back();
	EXPECT_THROW(dataset.AddDimension(dimBad), SourceError);
}

TEST(Dataset, RejectsMalformedVariables) {
	Dataset dataset;
	dataset.AddDimension(DimensionInfo("time", 2));
	dataset.AddDimension(DimensionInfo("lat", 3));

	dataset.AddVariable(VariableInfo("T", MakeDims("time", "lat")));
	EXPECT_EQ(dataset.GetVariable("T").vecShape[1], 3);
	EXPECT_EQ(dataset.GetVariable("T").GetTotalSize(), 6u);

	EXPECT_THROW(
		dataset.AddVariable(VariableInfo("T", MakeDims("time"))),
		SourceError);
	EXPECT_THROW(
		dataset.AddVariable(VariableInfo("U", MakeDims("time", "lon"))),
		SourceError);
	EXPECT_THROW(
		dataset.AddVariable(VariableInfo("V", MakeDims("time", "time"))),
		SourceError);

	VariableInfo varShape("W", MakeDims("time", "lat"));
	varShape.vecShape.push_back(2);
	varShape.vecShape.push_back(4);
	EXPECT_THROW(dataset.AddVariable(varShape), SourceError);

	EXPECT_THROW(dataset.GetVariable("missing"), SourceError);
	EXPECT_EQ(dataset.GetVariableCount(), 1u);
}

TEST(Dataset, UnitIndicesAreRowMajor) {
	Dataset dataset;
	dataset.AddDimension(DimensionInfo("a", 2));
	dataset.AddDimension(DimensionInfo("b", 3));

	std::vector<std::string> vecUnitDims = MakeDims("a", "b");
	EXPECT_EQ(dataset.GetUnitCount(vecUnitDims), 6u);

	std::vector<long> vecIx;
	dataset.GetUnitDimIndices(vecUnitDims, 4, vecIx);
	ASSERT_EQ(vecIx.size(), 2u);
	EXPECT_EQ(vecIx[0], 1);
	EXPECT_EQ(vecIx[1], 1);

	EXPECT_THROW(dataset.GetUnitDimIndices(vecUnitDims, 6, vecIx), SourceError);
	EXPECT_THROW(dataset.GetUnitCount(MakeDims("c")), SourceError);
}

///////////////////////////////////////////////////////////////////////////////

TEST(MemoryArraySource, ReadSliceAlongLeadingDimension) {
	MemoryArraySource source;
	source.AddDimension("time", 2);
	source.AddDimension("y", 2);
	source.AddDimension("x", 3);
	source.AddVariable(
		VariableInfo("T", MakeDims("time", "y", "x")), MakeRange(12));

	std::vector<double> vecValues;
	source.ReadSlice("T", MakeDims("time"), 1, vecValues);

	ASSERT_EQ(vecValues.size(), 6u);
	for (size_t i = 0; i < 6; i++) {
		EXPECT_DOUBLE_EQ(vecValues[i], static_cast<double>(6 + i));
	}
}

TEST(MemoryArraySource, ReadSliceAlongInnerDimension) {
	MemoryArraySource source;
	source.AddDimension("y", 2);
	source.AddDimension("time", 3);
	source.AddDimension("x", 2);
	source.AddVariable(
		VariableInfo("T", MakeDims("y", "time", "x")), MakeRange(12));

	// Offsets of (y, time=2, x) are 4+0, 4+1, 10+0, 10+1
	std::vector<double> vecValues;
	source.ReadSlice("T", MakeDims("time"), 2, vecValues);

	ASSERT_EQ(vecValues.size(), 4u);
	EXPECT_DOUBLE_EQ(vecValues[0], 4.0);
	EXPECT_DOUBLE_EQ(vecValues[1], 5.0);
	EXPECT_DOUBLE_EQ(vecValues[2], 10.0);
	EXPECT_DOUBLE_EQ(vecValues[3], 11.0);
}

TEST(MemoryArraySource, ReadSliceOverTwoUnitDimensions) {
	MemoryArraySource source;
	source.AddDimension("lat", 2);
	source.AddDimension("lon", 3);
	source.AddDimension("time", 4);
	source.AddVariable(
		VariableInfo("T", MakeDims("lat", "lon", "time")), MakeRange(24));

	// Unit 5 is (lat=1, lon=2), values 20..23
	std::vector<double> vecValues;
	source.ReadSlice("T", MakeDims("lat", "lon"), 5, vecValues);

	ASSERT_EQ(vecValues.size(), 4u);
	EXPECT_DOUBLE_EQ(vecValues[0], 20.0);
	EXPECT_DOUBLE_EQ(vecValues[3], 23.0);
}

TEST(MemoryArraySource, ReadSliceErrors) {
	MemoryArraySource source;
	source.AddDimension("time", 3);
	source.AddDimension("lat", 2);
	source.AddVariable(VariableInfo("T", MakeDims("time")), MakeRange(3));
	source.AddVariable(VariableInfo("Z", MakeDims("lat")), MakeRange(2));

	std::vector<double> vecValues;
	EXPECT_THROW(
		source.ReadSlice("missing", MakeDims("time"), 0, vecValues),
		SourceError);
	EXPECT_THROW(
		source.ReadSlice("T", MakeDims("time"), 3, vecValues),
		SourceError);
	EXPECT_THROW(
		source.ReadSlice("Z", MakeDims("time"), 0, vecValues),
		SourceError);

	source.Close();
	EXPECT_FALSE(source.IsOpen());
	EXPECT_THROW(
		source.ReadSlice("T", MakeDims("time"), 0, vecValues),
		SourceError);

	source.Reopen();
	source.ReadSlice("T", MakeDims("time"), 2, vecValues);
	ASSERT_EQ(vecValues.size(), 1u);
	EXPECT_DOUBLE_EQ(vecValues[0], 2.0);
}

TEST(MemoryArraySource, DataLengthMustMatchShape) {
	MemoryArraySource source;
	source.AddDimension("time", 3);

	EXPECT_THROW(
		source.AddVariable(VariableInfo("T", MakeDims("time")), MakeRange(4)),
		SourceError);
	EXPECT_EQ(source.GetDataset().FindVariable("T"), (const VariableInfo *)NULL);

	EXPECT_THROW(
		source.AddVariable(VariableInfo("U", MakeDims("lat")), MakeRange(3)),
		SourceError);
}

///////////////////////////////////////////////////////////////////////////////

