///////////////////////////////////////////////////////////////////////////////
///
///	\file    ReductionMode.h
///	\version October 19, 2026
///
///	<summary>
///		Table of operators collapsing the values of one variable over one
///		reduction unit into a single feature component.
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

#ifndef _REDUCTIONMODE_H_
#define _REDUCTIONMODE_H_

#include "UnitStatus.h"

#include <string>
#include <vector>

class VariableInfo;

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Available reduction modes.
///	</summary>
enum ReductionMode {
	ReductionMode_RawScalar,
	ReductionMode_Mean,
	ReductionMode_Variance,
	ReductionMode_Min,
	ReductionMode_Max
};

///	<summary>
///		A function reducing the values of one unit to a scalar.
///	</summary>
///	<returns>
///		ExtractionError_None on success, otherwise the reason the unit
///		could not be reduced.
///	</returns>
typedef ExtractionErrorKind (*ReductionFunction)(
	const VariableInfo & var,
	const std::vector<double> & vecValues,
	double & dResult
);

///	<summary>
///		One row of the reduction mode table.
///	</summary>
struct ReductionModeEntry {

	///	<summary>
	///		Mode identifier.
	///	</summary>
	ReductionMode eMode;

	///	<summary>
	///		Name used on the command line and in feature names.
	///	</summary>
	const char * szName;

	///	<summary>
	///		Mode requires exactly one value per unit.
	///	</summary>
	bool fRequiresScalar;

	///	<summary>
	///		Reduction operator.
	///	</summary>
	ReductionFunction pfnReduce;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Get the table entry of a reduction mode.
///	</summary>
const ReductionModeEntry & GetReductionModeEntry(
	ReductionMode eMode
);

///	<summary>
///		Parse a reduction mode name (case-insensitive).  Throws an
///		Exception for an unknown name.
///	</summary>
ReductionMode ParseReductionMode(
	const std::string & strMode
);

///	<summary>
///		Determine if a value equals the fill marker of a variable.  A NaN
///		fill marker matches NaN values.
///	</summary>
bool IsFillValue(
	const VariableInfo & var,
	double dValue
);

///////////////////////////////////////////////////////////////////////////////

#endif

