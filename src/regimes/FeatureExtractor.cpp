///////////////////////////////////////////////////////////////////////////////
///
///	\file    FeatureExtractor.cpp
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

#include "FeatureExtractor.h"
#include "Defines.h"
#include "Exception.h"

#include <algorithm>
#include <cmath>
#include <limits>

///////////////////////////////////////////////////////////////////////////////
// ChunkResult
///////////////////////////////////////////////////////////////////////////////

void ChunkResult::Initialize(
	size_t sBeginArg,
	size_t sEndArg,
	size_t sFeatures
) {
	if (sEndArg < sBeginArg) {
		_EXCEPTION2("Invalid chunk range [%lu, %lu)",
			static_cast<unsigned long>(sBeginArg),
			static_cast<unsigned long>(sEndArg));
	}

	sBegin = sBeginArg;
	sEnd = sEndArg;

	const size_t sUnits = sEndArg - sBeginArg;

	dFeatures.Allocate(sUnits, sFeatures);
	vecError.assign(sUnits, ExtractionError_None);
	vecErrorDetail.assign(sUnits, std::string(""));
}

///////////////////////////////////////////////////////////////////////////////
// FeatureExtractor
///////////////////////////////////////////////////////////////////////////////

FeatureExtractor::FeatureExtractor(
	const ArraySource & source,
	const std::vector<std::string> & vecUnitDims,
	const std::vector<FeatureSpec> & vecFeatureSpecs
) :
	m_source(source),
	m_vecUnitDims(vecUnitDims),
	m_vecFeatureSpecs(vecFeatureSpecs),
	m_sUnits(0)
{
	const Dataset & dataset = source.GetDataset();

	if (vecFeatureSpecs.size() == 0) {
		_EXCEPTIONT("At least one feature variable is required");
	}
	if (vecUnitDims.size() == 0) {
		_EXCEPTIONT("At least one unit dimension is required");
	}

	// Unit dimensions
	for (size_t d = 0; d < vecUnitDims.size(); d++) {
		for (size_t e = 0; e < d; e++) {
			if (vecUnitDims[e] == vecUnitDims[d]) {
				_EXCEPTION1("Unit dimension \"%s\" listed twice",
					vecUnitDims[d].c_str());
			}
		}
		m_vecUnitDimInfo.push_back(dataset.GetDimension(vecUnitDims[d]));
	}

	m_sUnits = dataset.GetUnitCount(vecUnitDims);

	// Resolve each variable and its reduction operator
	for (size_t f = 0; f < vecFeatureSpecs.size(); f++) {
		const FeatureSpec & spec = vecFeatureSpecs[f];

		for (size_t g = 0; g < f; g++) {
			if (vecFeatureSpecs[g].strVariable == spec.strVariable) {
				_EXCEPTION1("Variable \"%s\" listed twice",
					spec.strVariable.c_str());
			}
		}

		const VariableInfo & var = dataset.GetVariable(spec.strVariable);

		size_t sSliceSize = 1;
		for (size_t d = 0; d < var.vecDimNames.size(); d++) {
			bool fUnitDim = false;
			for (size_t e = 0; e < vecUnitDims.size(); e++) {
				if (var.vecDimNames[d] == vecUnitDims[e]) {
					fUnitDim = true;
				}
			}
			if (!fUnitDim) {
				sSliceSize *= static_cast<size_t>(var.vecShape[d]);
			}
		}
		for (size_t e = 0; e < vecUnitDims.size(); e++) {
			if (var.GetDimIndex(vecUnitDims[e]) < 0) {
				_EXCEPTION2("Variable \"%s\" does not span unit dimension \"%s\"",
					spec.strVariable.c_str(), vecUnitDims[e].c_str());
			}
		}

		const ReductionModeEntry & entry = GetReductionModeEntry(spec.eMode);
		if (entry.fRequiresScalar && (sSliceSize != 1)) {
			_EXCEPTION2("Variable \"%s\" has %lu values per unit; "
				"raw-scalar requires exactly one (use mean, variance, min "
				"or max)",
				spec.strVariable.c_str(),
				static_cast<unsigned long>(sSliceSize));
		}

		m_vecVariables.push_back(var);
		m_vecReduce.push_back(entry.pfnReduce);

		if (entry.eMode == ReductionMode_RawScalar) {
			m_vecFeatureNames.push_back(spec.strVariable);
		} else {
			m_vecFeatureNames.push_back(
				spec.strVariable + "_" + entry.szName);
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void FeatureExtractor::ResolveUnit(
	size_t sUnit,
	ReductionUnit & unit
) const {
	if (sUnit >= m_sUnits) {
		_SOURCEERROR2("Unit index %lu out of range [0, %lu)",
			static_cast<unsigned long>(sUnit),
			static_cast<unsigned long>(m_sUnits));
	}

	const size_t sDims = m_vecUnitDimInfo.size();

	unit.sIndex = sUnit;
	unit.vecDimIndex.resize(sDims);
	unit.vecCoord.resize(sDims);

	size_t sRemainder = sUnit;
	for (size_t d = sDims; d-- > 0;) {
		const DimensionInfo & dim = m_vecUnitDimInfo[d];
		long lIx = static_cast<long>(
			sRemainder % static_cast<size_t>(dim.lSize));
		sRemainder /= static_cast<size_t>(dim.lSize);

		unit.vecDimIndex[d] = lIx;
		unit.vecCoord[d] = dim.vecCoord[lIx];
	}
}

///////////////////////////////////////////////////////////////////////////////

void FeatureExtractor::ExtractUnit(
	size_t sUnit,
	UnitExtraction & ue
) const {
	ResolveUnit(sUnit, ue.unit);

	ue.vecFeatures.assign(
		m_vecFeatureSpecs.size(),
		std::numeric_limits<double>::quiet_NaN());
	ue.eError = ExtractionError_None;
	ue.strErrorDetail = "";

	std::vector<double> vecValues;

	for (size_t f = 0; f < m_vecFeatureSpecs.size(); f++) {
		const std::string & strVariable = m_vecFeatureSpecs[f].strVariable;

		try {
			m_source.ReadSlice(strVariable, m_vecUnitDims, sUnit, vecValues);

		} catch(SourceError & e) {
			ue.eError = ExtractionError_SourceError;
			ue.strErrorDetail = strVariable + ": " + e.GetText();
			return;
		}

		double dValue = 0.0;
		ExtractionErrorKind eError =
			(*m_vecReduce[f])(m_vecVariables[f], vecValues, dValue);

		if (eError != ExtractionError_None) {
			ue.eError = eError;
			ue.strErrorDetail =
				strVariable + ": " + ExtractionErrorKindToString(eError);
			return;
		}

		ue.vecFeatures[f] = dValue;
	}
}

///////////////////////////////////////////////////////////////////////////////

void FeatureExtractor::ExtractChunk(
	size_t sBegin,
	size_t sEnd,
	ChunkResult & result
) const {
	if (sEnd > m_sUnits) {
		_SOURCEERROR2("Chunk end %lu beyond unit count %lu",
			static_cast<unsigned long>(sEnd),
			static_cast<unsigned long>(m_sUnits));
	}

	result.Initialize(sBegin, sEnd, m_vecFeatureSpecs.size());

	Cursor cursor = GetCursor(sBegin, sEnd);

	UnitExtraction ue;
	while (cursor.Next(ue)) {
		const size_t i = ue.unit.sIndex - sBegin;

		result.vecError[i] = ue.eError;
		if (!ue.IsValid()) {
			result.vecErrorDetail[i] = ue.strErrorDetail;
			continue;
		}

		double * dRow = result.dFeatures[i];
		for (size_t f = 0; f < ue.vecFeatures.size(); f++) {
			dRow[f] = ue.vecFeatures[f];
		}
	}
}

///////////////////////////////////////////////////////////////////////////////
// FeatureScaling
///////////////////////////////////////////////////////////////////////////////

void FeatureScaling::SetIdentity(
	size_t sFeatures
) {
	m_fNormalize = false;

	m_dMean.Allocate(sFeatures);
	m_dStdDev.Allocate(sFeatures);
	for (size_t f = 0; f < sFeatures; f++) {
		m_dStdDev[f] = 1.0;
	}
	m_vecConstant.assign(sFeatures, false);
}

///////////////////////////////////////////////////////////////////////////////

void FeatureScaling::Compute(
	const DataArray2D<double> & dFeatures,
	const std::vector<bool> & vecUse
) {
	const size_t sFeatures = dFeatures.GetColumns();

	if (vecUse.size() != dFeatures.GetRows()) {
		_EXCEPTION2("Row mask length %lu does not match row count %lu",
			static_cast<unsigned long>(vecUse.size()),
			static_cast<unsigned long>(dFeatures.GetRows()));
	}

	SetIdentity(sFeatures);
	m_fNormalize = true;

	size_t sCount = 0;
	for (size_t i = 0; i < dFeatures.GetRows(); i++) {
		if (!vecUse[i]) {
			continue;
		}
		for (size_t f = 0; f < sFeatures; f++) {
			m_dMean[f] += dFeatures(i,f);
		}
		sCount++;
	}
	if (sCount == 0) {
		return;
	}
	for (size_t f = 0; f < sFeatures; f++) {
		m_dMean[f] /= static_cast<double>(sCount);
	}

	// Population standard deviation
	DataArray1D<double> dSumSq(sFeatures);
	for (size_t i = 0; i < dFeatures.GetRows(); i++) {
		if (!vecUse[i]) {
			continue;
		}
		for (size_t f = 0; f < sFeatures; f++) {
			double dDiff = dFeatures(i,f) - m_dMean[f];
			dSumSq[f] += dDiff * dDiff;
		}
	}

	for (size_t f = 0; f < sFeatures; f++) {
		double dStdDev = sqrt(dSumSq[f] / static_cast<double>(sCount));
		double dScale = std::max(1.0, fabs(m_dMean[f]));

		if (dStdDev <= HighTolerance * dScale) {
			m_vecConstant[f] = true;
			m_dStdDev[f] = 1.0;
		} else {
			m_dStdDev[f] = dStdDev;
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void FeatureScaling::Normalize(
	double * dRow
) const {
	if (!m_fNormalize) {
		return;
	}
	for (size_t f = 0; f < m_vecConstant.size(); f++) {
		if (m_vecConstant[f]) {
			continue;
		}
		dRow[f] = (dRow[f] - m_dMean[f]) / m_dStdDev[f];
	}
}

///////////////////////////////////////////////////////////////////////////////

void FeatureScaling::Denormalize(
	double * dRow
) const {
	if (!m_fNormalize) {
		return;
	}
	for (size_t f = 0; f < m_vecConstant.size(); f++) {
		if (m_vecConstant[f]) {
			continue;
		}
		dRow[f] = dRow[f] * m_dStdDev[f] + m_dMean[f];
	}
}

///////////////////////////////////////////////////////////////////////////////

void FeatureScaling::GetDistanceWeights(
	DataArray1D<double> & dWeights
) const {
	dWeights.Allocate(m_vecConstant.size());
	for (size_t f = 0; f < m_vecConstant.size(); f++) {
		if (m_fNormalize && m_vecConstant[f]) {
			dWeights[f] = 0.0;
		} else {
			dWeights[f] = 1.0;
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

