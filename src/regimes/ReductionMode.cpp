///////////////////////////////////////////////////////////////////////////////
///
///	\file    ReductionMode.cpp
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

#include "ReductionMode.h"
#include "ArraySource.h"
#include "STLStringHelper.h"
#include "Exception.h"

#include <cmath>
#include <limits>

///////////////////////////////////////////////////////////////////////////////

bool IsFillValue(
	const VariableInfo & var,
	double dValue
) {
	if (!var.fHasFillValue) {
		return false;
	}
	if (std::isnan(var.dFillValue)) {
		return std::isnan(dValue);
	}
	return (dValue == var.dFillValue);
}

///////////////////////////////////////////////////////////////////////////////

static ExtractionErrorKind ReduceRawScalar(
	const VariableInfo & var,
	const std::vector<double> & vecValues,
	double & dResult
) {
	if (vecValues.size() != 1) {
		return ExtractionError_NoValidData;
	}
	if (IsFillValue(var, vecValues[0])) {
		return ExtractionError_FillValue;
	}
	dResult = vecValues[0];
	return ExtractionError_None;
}

///////////////////////////////////////////////////////////////////////////////

static ExtractionErrorKind ReduceMean(
	const VariableInfo & var,
	const std::vector<double> & vecValues,
	double & dResult
) {
	double dSum = 0.0;
	size_t sCount = 0;
	for (size_t i = 0; i < vecValues.size(); i++) {
		if (IsFillValue(var, vecValues[i])) {
			continue;
		}
		dSum += vecValues[i];
		sCount++;
	}
	if (sCount == 0) {
		return ExtractionError_NoValidData;
	}
	dResult = dSum / static_cast<double>(sCount);
	return ExtractionError_None;
}

///////////////////////////////////////////////////////////////////////////////

static ExtractionErrorKind ReduceVariance(
	const VariableInfo & var,
	const std::vector<double> & vecValues,
	double & dResult
) {
	double dMean;
	ExtractionErrorKind eError = ReduceMean(var, vecValues, dMean);
	if (eError != ExtractionError_None) {
		return eError;
	}

	// Population variance
	double dSumSq = 0.0;
	size_t sCount = 0;
	for (size_t i = 0; i < vecValues.size(); i++) {
		if (IsFillValue(var, vecValues[i])) {
			continue;
		}
		double dDiff = vecValues[i] - dMean;
		dSumSq += dDiff * dDiff;
		sCount++;
	}
	dResult = dSumSq / static_cast<double>(sCount);
	return ExtractionError_None;
}

///////////////////////////////////////////////////////////////////////////////

static ExtractionErrorKind ReduceMin(
	const VariableInfo & var,
	const std::vector<double> & vecValues,
	double & dResult
) {
	bool fFound = false;
	for (size_t i = 0; i < vecValues.size(); i++) {
		if (IsFillValue(var, vecValues[i])) {
			continue;
		}
		if (std::isnan(vecValues[i])) {
			dResult = std::numeric_limits<double>::quiet_NaN();
			return ExtractionError_None;
		}
		if ((!fFound) || (vecValues[i] < dResult)) {
			dResult = vecValues[i];
		}
		fFound = true;
	}
	if (!fFound) {
		return ExtractionError_NoValidData;
	}
	return ExtractionError_None;
}

///////////////////////////////////////////////////////////////////////////////

static ExtractionErrorKind ReduceMax(
	const VariableInfo & var,
	const std::vector<double> & vecValues,
	double & dResult
) {
	bool fFound = false;
	for (size_t i = 0; i < vecValues.size(); i++) {
		if (IsFillValue(var, vecValues[i])) {
			continue;
		}
		if (std::isnan(vecValues[i])) {
			dResult = std::numeric_limits<double>::quiet_NaN();
			return ExtractionError_None;
		}
		if ((!fFound) || (vecValues[i] > dResult)) {
			dResult = vecValues[i];
		}
		fFound = true;
	}
	if (!fFound) {
		return ExtractionError_NoValidData;
	}
	return ExtractionError_None;
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		The reduction mode table, indexed by ReductionMode.
///	</summary>
static const ReductionModeEntry s_tableReductionModes[] = {
	{ ReductionMode_RawScalar, "raw-scalar", true,  &ReduceRawScalar },
	{ ReductionMode_Mean,      "mean",       false, &ReduceMean },
	{ ReductionMode_Variance,  "variance",   false, &ReduceVariance },
	{ ReductionMode_Min,       "min",        false, &ReduceMin },
	{ ReductionMode_Max,       "max",        false, &ReduceMax }
};

static const size_t s_sReductionModeCount =
	sizeof(s_tableReductionModes) / sizeof(s_tableReductionModes[0]);

///////////////////////////////////////////////////////////////////////////////

const ReductionModeEntry & GetReductionModeEntry(
	ReductionMode eMode
) {
	size_t sMode = static_cast<size_t>(eMode);
	if ((sMode >= s_sReductionModeCount) ||
	    (s_tableReductionModes[sMode].eMode != eMode)
	) {
		_EXCEPTION1("Invalid reduction mode (%i)", static_cast<int>(eMode));
	}
	return s_tableReductionModes[sMode];
}

///////////////////////////////////////////////////////////////////////////////

ReductionMode ParseReductionMode(
	const std::string & strMode
) {
	std::string strModeLower = strMode;
	STLStringHelper::RemoveWhitespaceInPlace(strModeLower);
	STLStringHelper::ToLower(strModeLower);

	for (size_t m = 0; m < s_sReductionModeCount; m++) {
		if (strModeLower == s_tableReductionModes[m].szName) {
			return s_tableReductionModes[m].eMode;
		}
	}

	_EXCEPTION1("Unknown reduction mode \"%s\"; expected one of "
		"raw-scalar, mean, variance, min, max", strMode.c_str());
}

///////////////////////////////////////////////////////////////////////////////

