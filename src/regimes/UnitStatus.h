///////////////////////////////////////////////////////////////////////////////
///
///	\file    UnitStatus.h
///	\version October 19, 2026
///
///	<summary>
///		Outcome codes attached to every reduction unit of a run.
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

#ifndef _UNITSTATUS_H_
#define _UNITSTATUS_H_

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Final status of a reduction unit.
///	</summary>
enum UnitStatus {
	UnitStatus_Clustered,
	UnitStatus_NonFiniteFeature,
	UnitStatus_ExtractionFailure,
	UnitStatus_ChunkFailure,
	UnitStatus_Cancelled
};

///	<summary>
///		Text written to the status column.
///	</summary>
inline const char * UnitStatusToString(UnitStatus eStatus) {
	switch (eStatus) {
		case UnitStatus_Clustered:
			return "clustered";
		case UnitStatus_NonFiniteFeature:
			return "unclustered: non-finite feature";
		case UnitStatus_ExtractionFailure:
			return "unclustered: extraction failure";
		case UnitStatus_ChunkFailure:
			return "unclustered: chunk failure";
		case UnitStatus_Cancelled:
			return "unclustered: cancelled";
	}
	return "unknown";
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Reason a single unit could not be reduced to a feature vector.
///	</summary>
enum ExtractionErrorKind {
	ExtractionError_None,
	ExtractionError_FillValue,
	ExtractionError_NoValidData,
	ExtractionError_SourceError
};

inline const char * ExtractionErrorKindToString(ExtractionErrorKind eKind) {
	switch (eKind) {
		case ExtractionError_None:
			return "none";
		case ExtractionError_FillValue:
			return "fill value";
		case ExtractionError_NoValidData:
			return "no valid data";
		case ExtractionError_SourceError:
			return "source error";
	}
	return "unknown";
}

///////////////////////////////////////////////////////////////////////////////

#endif

