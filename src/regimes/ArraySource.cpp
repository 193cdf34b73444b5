///////////////////////////////////////////////////////////////////////////////
///
///	\file    ArraySource.cpp
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

#include "ArraySource.h"
#include "Exception.h"

///////////////////////////////////////////////////////////////////////////////
// DimensionInfo
///////////////////////////////////////////////////////////////////////////////

DimensionInfo::DimensionInfo(
	const std::string & strNameArg,
	long lSizeArg
) :
	strName(strNameArg),
	lSize(lSizeArg)
{
	if (lSizeArg < 0) {
		_SOURCEERROR2("Dimension \"%s\" has negative length %li",
			strNameArg.c_str(), lSizeArg);
	}
	vecCoord.resize(lSizeArg);
	for (long l = 0; l < lSizeArg; l++) {
		vecCoord[l] = static_cast<double>(l);
	}
}

///////////////////////////////////////////////////////////////////////////////

DimensionInfo::DimensionInfo(
	const std::string & strNameArg,
	const std::vector<double> & vecCoordArg,
	const std::string & strUnitsArg
) :
	strName(strNameArg),
	lSize(static_cast<long>(vecCoordArg.size())),
	vecCoord(vecCoordArg),
	strUnits(strUnitsArg)
{ }

///////////////////////////////////////////////////////////////////////////////
// VariableInfo
///////////////////////////////////////////////////////////////////////////////

int VariableInfo::GetDimIndex(
	const std::string & strDimName
) const {
	for (size_t d = 0; d < vecDimNames.size(); d++) {
		if (vecDimNames[d] == strDimName) {
			return static_cast<int>(d);
		}
	}
	return (-1);
}

///////////////////////////////////////////////////////////////////////////////

size_t VariableInfo::GetTotalSize() const {
	size_t sSize = 1;
	for (size_t d = 0; d < vecShape.size(); d++) {
		sSize *= static_cast<size_t>(vecShape[d]);
	}
	return sSize;
}

///////////////////////////////////////////////////////////////////////////////
// Dataset
///////////////////////////////////////////////////////////////////////////////

void Dataset::AddDimension(
	const DimensionInfo & dim
) {
	if (dim.strName.length() == 0) {
		_SOURCEERRORT("Dimension with empty name");
	}
	if (m_mapDimensionIx.find(dim.strName) != m_mapDimensionIx.end()) {
		_SOURCEERROR1("Duplicate dimension \"%s\"", dim.strName.c_str());
	}
	if (dim.lSize < 0) {
		_SOURCEERROR2("Dimension \"%s\" has negative length %li",
			dim.strName.c_str(), dim.lSize);
	}
	if (static_cast<long>(dim.vecCoord.size()) != dim.lSize) {
		_SOURCEERROR3("Dimension \"%s\" declares length %li but has %lu "
			"coordinate values",
			dim.strName.c_str(), dim.lSize,
			static_cast<unsigned long>(dim.vecCoord.size()));
	}

	m_mapDimensionIx.insert(
		std::pair<std::string, size_t>(dim.strName, m_vecDimensions.size()));
	m_vecDimensions.push_back(dim);
}

///////////////////////////////////////////////////////////////////////////////

void Dataset::AddVariable(
	const VariableInfo & var
) {
	if (var.strName.length() == 0) {
		_SOURCEERRORT("Variable with empty name");
	}
	if (m_mapVariableIx.find(var.strName) != m_mapVariableIx.end()) {
		_SOURCEERROR1("Duplicate variable \"%s\"", var.strName.c_str());
	}

	VariableInfo varResolved(var);
	varResolved.vecShape.resize(var.vecDimNames.size());

	for (size_t d = 0; d < var.vecDimNames.size(); d++) {
		const DimensionInfo * pdim = FindDimension(var.vecDimNames[d]);
		if (pdim == NULL) {
			_SOURCEERROR2("Variable \"%s\" references unknown dimension \"%s\"",
				var.strName.c_str(), var.vecDimNames[d].c_str());
		}
		for (size_t e = 0; e < d; e++) {
			if (var.vecDimNames[e] == var.vecDimNames[d]) {
				_SOURCEERROR2("Variable \"%s\" repeats dimension \"%s\"",
					var.strName.c_str(), var.vecDimNames[d].c_str());
			}
		}
		if ((var.vecShape.size() == var.vecDimNames.size()) &&
		    (var.vecShape[d] != pdim->lSize)
		) {
			_SOURCEERROR4("Variable \"%s\" has length %li along \"%s\" "
				"but the dimension declares %li",
				var.strName.c_str(), var.vecShape[d],
				var.vecDimNames[d].c_str(), pdim->lSize);
		}
		varResolved.vecShape[d] = pdim->lSize;
	}

	m_mapVariableIx.insert(
		std::pair<std::string, size_t>(var.strName, m_vecVariables.size()));
	m_vecVariables.push_back(varResolved);
}

///////////////////////////////////////////////////////////////////////////////

const DimensionInfo * Dataset::FindDimension(
	const std::string & strName
) const {
	std::map<std::string, size_t>::const_iterator iter =
		m_mapDimensionIx.find(strName);
	if (iter == m_mapDimensionIx.end()) {
		return NULL;
	}
	return &(m_vecDimensions[iter->second]);
}

///////////////////////////////////////////////////////////////////////////////

const DimensionInfo & Dataset::GetDimension(
	const std::string & strName
) const {
	const DimensionInfo * pdim = FindDimension(strName);
	if (pdim == NULL) {
		_SOURCEERROR1("Unknown dimension \"%s\"", strName.c_str());
	}
	return (*pdim);
}

///////////////////////////////////////////////////////////////////////////////

const VariableInfo * Dataset::FindVariable(
	const std::string & strName
) const {
	std::map<std::string, size_t>::const_iterator iter =
		m_mapVariableIx.find(strName);
	if (iter == m_mapVariableIx.end()) {
		return NULL;
	}
	return &(m_vecVariables[iter->second]);
}

///////////////////////////////////////////////////////////////////////////////

const VariableInfo & Dataset::GetVariable(
	const std::string & strName
) const {
	const VariableInfo * pvar = FindVariable(strName);
	if (pvar == NULL) {
		_SOURCEERROR1("Unknown variable \"%s\"", strName.c_str());
	}
	return (*pvar);
}

///////////////////////////////////////////////////////////////////////////////

std::vector<std::string> Dataset::GetVariableNames() const {
	std::vector<std::string> vecNames;
	for (size_t v = 0; v < m_vecVariables.size(); v++) {
		vecNames.push_back(m_vecVariables[v].strName);
	}
	return vecNames;
}

///////////////////////////////////////////////////////////////////////////////

size_t Dataset::GetUnitCount(
	const std::vector<std::string> & vecUnitDims
) const {
	if (vecUnitDims.size() == 0) {
		_SOURCEERRORT("No unit dimension specified");
	}

	size_t sUnits = 1;
	for (size_t d = 0; d < vecUnitDims.size(); d++) {
		sUnits *= static_cast<size_t>(GetDimension(vecUnitDims[d]).lSize);
	}
	return sUnits;
}

///////////////////////////////////////////////////////////////////////////////

void Dataset::GetUnitDimIndices(
	const std::vector<std::string> & vecUnitDims,
	size_t sUnit,
	std::vector<long> & vecDimIndices
) const {
	size_t sUnits = GetUnitCount(vecUnitDims);
	if (sUnit >= sUnits) {
		_SOURCEERROR2("Unit index %lu out of range [0, %lu)",
			static_cast<unsigned long>(sUnit),
			static_cast<unsigned long>(sUnits));
	}

	vecDimIndices.resize(vecUnitDims.size());

	size_t sRemainder = sUnit;
	for (size_t d = vecUnitDims.size(); d-- > 0;) {
		size_t sDimSize =
			static_cast<size_t>(GetDimension(vecUnitDims[d]).lSize);
		vecDimIndices[d] = static_cast<long>(sRemainder % sDimSize);
		sRemainder /= sDimSize;
	}
}

///////////////////////////////////////////////////////////////////////////////
// ArraySource
///////////////////////////////////////////////////////////////////////////////

void ArraySource::ReadSlice(
	const std::string & strVariable,
	const std::vector<std::string> & vecUnitDims,
	size_t sUnit,
	std::vector<double> & vecValues
) const {
	if (!IsOpen()) {
		_SOURCEERROR1("Reading \"%s\" from a closed source",
			strVariable.c_str());
	}

	const VariableInfo & var = m_dataset.GetVariable(strVariable);

	std::vector<long> vecUnitIx;
	m_dataset.GetUnitDimIndices(vecUnitDims, sUnit, vecUnitIx);

	// Unit dimensions are fixed, all others are read in full
	std::vector<long> vecStart(var.vecDimNames.size(), 0);
	std::vector<long> vecCount(var.vecShape);

	for (size_t d = 0; d < vecUnitDims.size(); d++) {
		int iDim = var.GetDimIndex(vecUnitDims[d]);
		if (iDim < 0) {
			_SOURCEERROR2("Variable \"%s\" does not span unit dimension \"%s\"",
				strVariable.c_str(), vecUnitDims[d].c_str());
		}
		vecStart[iDim] = vecUnitIx[d];
		vecCount[iDim] = 1;
	}

	ReadHyperslab(var, vecStart, vecCount, vecValues);
}

///////////////////////////////////////////////////////////////////////////////

