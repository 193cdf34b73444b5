///////////////////////////////////////////////////////////////////////////////
///
///	\file    MemoryArraySource.cpp
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

#include "MemoryArraySource.h"
#include "Exception.h"

///////////////////////////////////////////////////////////////////////////////

MemoryArraySource::MemoryArraySource() :
	m_fOpen(true)
{ }

///////////////////////////////////////////////////////////////////////////////

void MemoryArraySource::AddDimension(
	const std::string & strName,
	long lSize
) {
	m_dataset.AddDimension(DimensionInfo(strName, lSize));
}

///////////////////////////////////////////////////////////////////////////////

void MemoryArraySource::AddDimension(
	const DimensionInfo & dim
) {
	m_dataset.AddDimension(dim);
}

///////////////////////////////////////////////////////////////////////////////

void MemoryArraySource::AddVariable(
	const VariableInfo & var,
	const std::vector<double> & vecData
) {
	size_t sExpected = 1;
	for (size_t d = 0; d < var.vecDimNames.size(); d++) {
		sExpected *= static_cast<size_t>(
			m_dataset.GetDimension(var.vecDimNames[d]).lSize);
	}
	if (vecData.size() != sExpected) {
		_SOURCEERROR3("Variable \"%s\" expects %lu values (given %lu)",
			var.strName.c_str(),
			static_cast<unsigned long>(sExpected),
			static_cast<unsigned long>(vecData.size()));
	}

	m_dataset.AddVariable(var);

	m_mapData[var.strName] = vecData;
}

///////////////////////////////////////////////////////////////////////////////

void MemoryArraySource::ReadHyperslab(
	const VariableInfo & var,
	const std::vector<long> & vecStart,
	const std::vector<long> & vecCount,
	std::vector<double> & vecValues
) const {
	std::map< std::string, std::vector<double> >::const_iterator iter =
		m_mapData.find(var.strName);
	if (iter == m_mapData.end()) {
		_SOURCEERROR1("No data for variable \"%s\"", var.strName.c_str());
	}
	const std::vector<double> & vecData = iter->second;

	const size_t sDims = var.vecShape.size();

	size_t sTotal = 1;
	for (size_t d = 0; d < sDims; d++) {
		sTotal *= static_cast<size_t>(vecCount[d]);
	}
	vecValues.resize(sTotal);

	// Odometer over the hyperslab in row-major order
	std::vector<long> vecIx(sDims, 0);
	for (size_t i = 0; i < sTotal; i++) {
		size_t sOffset = 0;
		for (size_t d = 0; d < sDims; d++) {
			sOffset = sOffset * static_cast<size_t>(var.vecShape[d])
				+ static_cast<size_t>(vecStart[d] + vecIx[d]);
		}
		vecValues[i] = vecData[sOffset];

		for (size_t d = sDims; d-- > 0;) {
			vecIx[d]++;
			if (vecIx[d] < vecCount[d]) {
				break;
			}
			vecIx[d] = 0;
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

