///////////////////////////////////////////////////////////////////////////////
///
///	\file    NcArraySource.cpp
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

#include "NcArraySource.h"
#include "NetCDFUtilities.h"
#include "Exception.h"
#include "Announce.h"

#include <cstring>

///////////////////////////////////////////////////////////////////////////////

NcArraySource::NcArraySource() :
	m_pncfile(NULL)
{ }

///////////////////////////////////////////////////////////////////////////////

NcArraySource::~NcArraySource() {
	Close();
}

///////////////////////////////////////////////////////////////////////////////

bool NcArraySource::IsOpen() const {
	std::lock_guard<std::mutex> lock(m_mutexFile);
	return (m_pncfile != NULL);
}

///////////////////////////////////////////////////////////////////////////////

void NcArraySource::Close() {
	std::lock_guard<std::mutex> lock(m_mutexFile);
	if (m_pncfile != NULL) {
		delete m_pncfile;
		m_pncfile = NULL;
	}
}

///////////////////////////////////////////////////////////////////////////////

void NcArraySource::LoadCoordinate(
	NcVar * var,
	DimensionInfo & dim
) {
	if ((var->num_dims() != 1) ||
	    (strcmp(var->get_dim(0)->name(), dim.strName.c_str()) != 0)
	) {
		_SOURCEERROR2("Coordinate variable \"%s\" in \"%s\" must be "
			"one-dimensional over its own dimension",
			dim.strName.c_str(), m_strPath.c_str());
	}
	if (!NcIsNumericType(var->type())) {
		return;
	}
	if (dim.lSize == 0) {
		return;
	}

	long lStart = 0;
	if (!var->set_cur(&lStart)) {
		_SOURCEERROR1("Unable to position coordinate variable \"%s\"",
			dim.strName.c_str());
	}
	if (!var->get(&(dim.vecCoord[0]), dim.lSize)) {
		_SOURCEERROR1("Unable to read coordinate variable \"%s\"",
			dim.strName.c_str());
	}

	double dScaleFactor;
	double dAddOffset;
	if (NcGetVarScaleFactorAndOffset(var, dScaleFactor, dAddOffset)) {
		for (long l = 0; l < dim.lSize; l++) {
			dim.vecCoord[l] = dim.vecCoord[l] * dScaleFactor + dAddOffset;
		}
	}

	dim.strUnits = NcGetVarAttributeString(var, "units");
}

///////////////////////////////////////////////////////////////////////////////

void NcArraySource::Open(
	const std::string & strPath
) {
	Close();

	m_dataset = Dataset();
	m_mapPacking.clear();
	m_strPath = strPath;

	// Turn off fatal NetCDF errors; failures are checked explicitly
	NcError error(NcError::silent_nonfatal);

	NcFile * pncfile = new NcFile(strPath.c_str(), NcFile::ReadOnly);
	if (!pncfile->is_valid()) {
		delete pncfile;
		_SOURCEERROR1("Unable to open NetCDF file \"%s\"", strPath.c_str());
	}

	try {
		AnnounceStartBlock(2, "Loading dimensions");

		// Dimensions, with coordinates from the variable of the same name
		for (int d = 0; d < pncfile->num_dims(); d++) {
			NcDim * ncdim = pncfile->get_dim(d);
			if ((ncdim == NULL) || (!ncdim->is_valid())) {
				_SOURCEERROR2("Malformed dimension %i in \"%s\"",
					d, strPath.c_str());
			}

			DimensionInfo dim(ncdim->name(), ncdim->size());

			for (int v = 0; v < pncfile->num_vars(); v++) {
				NcVar * var = pncfile->get_var(v);
				if (strcmp(var->name(), ncdim->name()) == 0) {
					LoadCoordinate(var, dim);
					break;
				}
			}

			Announce(2, "%s (%li)", dim.strName.c_str(), dim.lSize);
			m_dataset.AddDimension(dim);
		}

		AnnounceEndBlock(2, NULL);

		// Numeric variables
		for (int v = 0; v < pncfile->num_vars(); v++) {
			NcVar * ncvar = pncfile->get_var(v);
			if ((ncvar == NULL) || (!ncvar->is_valid())) {
				_SOURCEERROR2("Malformed variable %i in \"%s\"",
					v, strPath.c_str());
			}
			if (!NcIsNumericType(ncvar->type())) {
				continue;
			}

			std::vector<std::string> vecDimNames;
			std::vector<long> vecShape;
			for (int d = 0; d < ncvar->num_dims(); d++) {
				vecDimNames.push_back(ncvar->get_dim(d)->name());
				vecShape.push_back(ncvar->get_dim(d)->size());
			}

			VariableInfo var(ncvar->name(), vecDimNames);
			var.vecShape = vecShape;

			double dFillValue;
			if (NcGetVarFillValue(ncvar, dFillValue)) {
				var.SetFillValue(dFillValue);
			}

			Packing packing;
			if (NcGetVarScaleFactorAndOffset(
					ncvar, packing.dScaleFactor, packing.dAddOffset)
			) {
				if (var.fHasFillValue) {
					var.dFillValue =
						var.dFillValue * packing.dScaleFactor
						+ packing.dAddOffset;
				}
				m_mapPacking[var.strName] = packing;
			}

			var.strUnits = NcGetVarAttributeString(ncvar, "units");

			m_dataset.AddVariable(var);
		}

	} catch(...) {
		delete pncfile;
		m_dataset = Dataset();
		m_mapPacking.clear();
		throw;
	}

	std::lock_guard<std::mutex> lock(m_mutexFile);
	m_pncfile = pncfile;
}

///////////////////////////////////////////////////////////////////////////////

std::string NcArraySource::FindTimeDimensionName() const {
	std::lock_guard<std::mutex> lock(m_mutexFile);
	if (m_pncfile == NULL) {
		return std::string("");
	}

	NcError error(NcError::silent_nonfatal);

	NcDim * dim = NcGetTimeDimension(*m_pncfile);
	if (dim == NULL) {
		return std::string("");
	}
	return std::string(dim->name());
}

///////////////////////////////////////////////////////////////////////////////

void NcArraySource::ReadHyperslab(
	const VariableInfo & var,
	const std::vector<long> & vecStart,
	const std::vector<long> & vecCount,
	std::vector<double> & vecValues
) const {
	size_t sTotal = 1;
	for (size_t d = 0; d < vecCount.size(); d++) {
		sTotal *= static_cast<size_t>(vecCount[d]);
	}
	vecValues.resize(sTotal);
	if (sTotal == 0) {
		return;
	}

	{
		std::lock_guard<std::mutex> lock(m_mutexFile);
		if (m_pncfile == NULL) {
			_SOURCEERROR1("Reading \"%s\" from a closed file",
				var.strName.c_str());
		}

		NcError error(NcError::silent_nonfatal);

		NcVar * ncvar = m_pncfile->get_var(var.strName.c_str());
		if (ncvar == NULL) {
			_SOURCEERROR2("Variable \"%s\" not found in \"%s\"",
				var.strName.c_str(), m_strPath.c_str());
		}

		if (vecStart.size() != 0) {
			std::vector<long> vecCur(vecStart);
			if (!ncvar->set_cur(&(vecCur[0]))) {
				_SOURCEERROR2("Unable to position variable \"%s\" (%i)",
					var.strName.c_str(), error.get_err());
			}
			if (!ncvar->get(&(vecValues[0]), &(vecCount[0]))) {
				_SOURCEERROR2("Unable to read variable \"%s\" (%i)",
					var.strName.c_str(), error.get_err());
			}
		} else {
			if (!ncvar->get(&(vecValues[0]))) {
				_SOURCEERROR2("Unable to read variable \"%s\" (%i)",
					var.strName.c_str(), error.get_err());
			}
		}
	}

	// Unpack, leaving fill values in their transformed form
	std::map<std::string, Packing>::const_iterator iterPacking =
		m_mapPacking.find(var.strName);
	if (iterPacking != m_mapPacking.end()) {
		const Packing & packing = iterPacking->second;
		for (size_t i = 0; i < sTotal; i++) {
			vecValues[i] =
				vecValues[i] * packing.dScaleFactor + packing.dAddOffset;
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

