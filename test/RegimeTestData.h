///////////////////////////////////////////////////////////////////////////////
///
///	\file    RegimeTestData.h
///	\version October 19, 2026
///
///	<summary>
///		Small in-memory datasets shared by the test programs.
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

#ifndef _REGIMETESTDATA_H_
#define _REGIMETESTDATA_H_

#include "MemoryArraySource.h"
#include "DataArray1D.h"
#include "DataArray2D.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Add a variable spanning only the "time" dimension.
///	</summary>
inline void AddTimeSeries(
	MemoryArraySource & source,
	const std::string & strName,
	const std::vector<double> & vecValues
) {
	std::vector<std::string> vecDims(1, "time");
	source.AddVariable(VariableInfo(strName, vecDims), vecValues);
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Three time steps on a 10x10 grid.  temperature and pressure are
///		scalar per time step with feature vectors [10.0, 1.0], [10.2, 1.1]
///		and [50.0, 9.0].
///	</summary>
inline void BuildThreeStepSource(
	MemoryArraySource & source
) {
	std::vector<double> vecTime;
	vecTime.push_back(0.0);
	vecTime.push_back(6.0);
	vecTime.push_back(12.0);

	source.AddDimension(DimensionInfo("time", vecTime, "hours"));
	source.AddDimension("lat", 10);
	source.AddDimension("lon", 10);

	std::vector<double> vecTemperature;
	vecTemperature.push_back(10.0);
	vecTemperature.push_back(10.2);
	vecTemperature.push_back(50.0);

	std::vector<double> vecPressure;
	vecPressure.push_back(1.0);
	vecPressure.push_back(1.1);
	vecPressure.push_back(9.0);

	AddTimeSeries(source, "temperature", vecTemperature);
	AddTimeSeries(source, "pressure", vecPressure);
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Copy a list of rows into a point matrix.
///	</summary>
inline void BuildPoints(
	const std::vector< std::vector<double> > & vecRows,
	DataArray2D<double> & dPoints
) {
	const size_t sFeatures = (vecRows.size() == 0)?(0):(vecRows[0].size());
	dPoints.Allocate(vecRows.size(), sFeatures);
	for (size_t i = 0; i < vecRows.size(); i++) {
		for (size_t f = 0; f < sFeatures; f++) {
			dPoints(i,f) = vecRows[i][f];
		}
	}
}

///	<summary>
///		Unit weight on every component.
///	</summary>
inline void BuildUnitWeights(
	size_t sFeatures,
	DataArray1D<double> & dWeights
) {
	dWeights.Allocate(sFeatures);
	for (size_t f = 0; f < sFeatures; f++) {
		dWeights[f] = 1.0;
	}
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Points in three well separated groups of nPerGroup points each in
///		two dimensions, jittered by a fixed pattern.
///	</summary>
inline void BuildThreeGroupPoints(
	int nPerGroup,
	DataArray2D<double> & dPoints
) {
	static const double s_dCenter[3][2] = {
		{ 0.0, 0.0 },
		{ 20.0, 0.0 },
		{ 0.0, 20.0 }
	};

	dPoints.Allocate(3 * nPerGroup, 2);
	for (int g = 0; g < 3; g++) {
		for (int i = 0; i < nPerGroup; i++) {
			const size_t p = static_cast<size_t>(g * nPerGroup + i);
			dPoints(p,0) = s_dCenter[g][0] + 0.1 * static_cast<double>(i % 5);
			dPoints(p,1) = s_dCenter[g][1] + 0.1 * static_cast<double>(i / 5);
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

#endif

