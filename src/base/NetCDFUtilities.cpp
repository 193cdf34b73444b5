///////////////////////////////////////////////////////////////////////////////
///
///	\file    NetCDFUtilities.cpp
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

#include "NetCDFUtilities.h"
#include "Exception.h"

#include <cstring>

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Names recognized as the time dimension, in order of preference.
///	</summary>
static const char * s_szTimeDimensionNames[] = {
	"time",
	"Time",
	"xtime",
	"initial_time0_hours",
	"valid_time",
	"day"
};

static const size_t s_sTimeDimensionNameCount =
	sizeof(s_szTimeDimensionNames) / sizeof(s_szTimeDimensionNames[0]);

////////////////////////////////////////////////////////////////////////////////

bool NcIsTimeDimension(
	NcDim * dim
) {
	if (dim == NULL) {
		return false;
	}
	for (size_t i = 0; i < s_sTimeDimensionNameCount; i++) {
		if (strcmp(dim->name(), s_szTimeDimensionNames[i]) == 0) {
			return true;
		}
	}
	return false;
}

////////////////////////////////////////////////////////////////////////////////

NcDim * NcGetTimeDimension(
	NcFile & ncFile
) {
	for (int d = 0; d < ncFile.num_dims(); d++) {
		NcDim * dim = ncFile.get_dim(d);
		if (NcIsTimeDimension(dim)) {
			return dim;
		}
	}
	return NULL;
}

////////////////////////////////////////////////////////////////////////////////

bool NcIsNumericType(
	NcType nctype
) {
	switch (nctype) {
		case ncByte:
		case ncShort:
		case ncInt:
		case ncFloat:
		case ncDouble:
			return true;
		default:
			return false;
	}
}

////////////////////////////////////////////////////////////////////////////////

std::string NcGetVarAttributeString(
	NcVar * var,
	const std::string & strAttName,
	const std::string & strDefault
) {
	NcAtt * att = var->get_att(strAttName.c_str());
	if (att == NULL) {
		return strDefault;
	}

	std::string strValue;
	if (att->type() == ncChar) {
		char * szValue = att->as_string(0);
		if (szValue != NULL) {
			strValue = szValue;
			delete[] szValue;
		}
	} else {
		strValue = strDefault;
	}
	delete att;

	return strValue;
}

////////////////////////////////////////////////////////////////////////////////

bool NcGetVarFillValue(
	NcVar * var,
	double & dFillValue
) {
	NcAtt * attFillValue = var->get_att("_FillValue");
	if (attFillValue == NULL) {
		attFillValue = var->get_att("missing_value");
	}
	if (attFillValue == NULL) {
		return false;
	}

	if (!NcIsNumericType(attFillValue->type())) {
		delete attFillValue;
		_EXCEPTION1("Fill value of variable \"%s\" is not numeric",
			var->name());
	}

	dFillValue = attFillValue->as_double(0);
	delete attFillValue;

	return true;
}

////////////////////////////////////////////////////////////////////////////////

bool NcGetVarScaleFactorAndOffset(
	NcVar * var,
	double & dScaleFactor,
	double & dAddOffset
) {
	dScaleFactor = 1.0;
	dAddOffset = 0.0;

	NcAtt * attScaleFactor = var->get_att("scale_factor");
	NcAtt * attAddOffset = var->get_att("add_offset");

	bool fHasPacking = ((attScaleFactor != NULL) || (attAddOffset != NULL));

	if (attScaleFactor != NULL) {
		dScaleFactor = attScaleFactor->as_double(0);
		delete attScaleFactor;
	}
	if (attAddOffset != NULL) {
		dAddOffset = attAddOffset->as_double(0);
		delete attAddOffset;
	}

	return fHasPacking;
}

////////////////////////////////////////////////////////////////////////////////

