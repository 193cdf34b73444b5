///////////////////////////////////////////////////////////////////////////////
///
///	\file    NetCDFUtilities.h
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

#ifndef _NETCDFUTILITIES_H_
#define _NETCDFUTILITIES_H_

#include "netcdfcpp.h"

#include <string>
#include <vector>

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Determine if a given NcDim is a time dimension.
///	</summary>
bool NcIsTimeDimension(
	NcDim * dim
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get the time dimension from the NetCDF file, or NULL if none of the
///		recognized time dimension names is present.
///	</summary>
NcDim * NcGetTimeDimension(
	NcFile & ncFile
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Determine if values of the given type can be read as floating point.
///	</summary>
bool NcIsNumericType(
	NcType nctype
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get a text attribute of a variable, or strDefault if the attribute
///		is not present.
///	</summary>
std::string NcGetVarAttributeString(
	NcVar * var,
	const std::string & strAttName,
	const std::string & strDefault = std::string("")
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get the fill value of a variable from _FillValue, falling back to
///		missing_value.
///	</summary>
///	<returns>
///		true if the variable has a fill value.
///	</returns>
bool NcGetVarFillValue(
	NcVar * var,
	double & dFillValue
);

////////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get the packing attributes scale_factor and add_offset of a
///		variable.  Absent attributes give 1 and 0.
///	</summary>
///	<returns>
///		true if either attribute is present.
///	</returns>
bool NcGetVarScaleFactorAndOffset(
	NcVar * var,
	double & dScaleFactor,
	double & dAddOffset
);

////////////////////////////////////////////////////////////////////////////////

#endif

