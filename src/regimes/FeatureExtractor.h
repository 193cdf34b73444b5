///////////////////////////////////////////////////////////////////////////////
///
///	\file    FeatureExtractor.h
///	\version October 19, 2026
///
///	<summary>
///		Reduction of each unit of the unit axis to a fixed-length feature
///		vector, and the per-component normalization of those vectors.
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

#ifndef _FEATUREEXTRACTOR_H_
#define _FEATUREEXTRACTOR_H_

#include "ArraySource.h"
#include "ReductionMode.h"
#include "UnitStatus.h"
#include "DataArray1D.h"
#include "DataArray2D.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A variable and the reduction applied to it.
///	</summary>
struct FeatureSpec {

	FeatureSpec() :
		eMode(ReductionMode_RawScalar)
	{ }

	FeatureSpec(
		const std::string & strVariableArg,
		ReductionMode eModeArg
	) :
		strVariable(strVariableArg),
		eMode(eModeArg)
	{ }

	std::string strVariable;

	ReductionMode eMode;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		One addressable slice along the unit axis.
///	</summary>
struct ReductionUnit {

	ReductionUnit() :
		sIndex(0)
	{ }

	///	<summary>
	///		Flat unit index in [0, N).
	///	</summary>
	size_t sIndex;

	///	<summary>
	///		Index along each unit dimension.
	///	</summary>
	std::vector<long> vecDimIndex;

	///	<summary>
	///		Coordinate value along each unit dimension.
	///	</summary>
	std::vector<double> vecCoord;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		The feature vector of one unit, or the reason it could not be
///		extracted.
///	</summary>
struct UnitExtraction {

	UnitExtraction() :
		eError(ExtractionError_None)
	{ }

	bool IsValid() const {
		return (eError == ExtractionError_None);
	}

	ReductionUnit unit;

	std::vector<double> vecFeatures;

	ExtractionErrorKind eError;

	///	<summary>
	///		Variable and message of the failed read.
	///	</summary>
	std::string strErrorDetail;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Feature vectors of a contiguous range [sBegin, sEnd) of units.
///	</summary>
class ChunkResult {

public:
	ChunkResult() :
		sChunk(0),
		sBegin(0),
		sEnd(0),
		nAttempts(0),
		fFailed(false),
		fCancelled(false)
	{ }

	///	<summary>
	///		Number of units in this chunk.
	///	</summary>
	size_t GetUnitCount() const {
		return (sEnd - sBegin);
	}

	///	<summary>
	///		Allocate storage for the given range and feature count.
	///	</summary>
	void Initialize(
		size_t sBeginArg,
		size_t sEndArg,
		size_t sFeatures
	);

public:
	///	<summary>
	///		Position of this chunk in the partition.
	///	</summary>
	size_t sChunk;

	size_t sBegin;

	size_t sEnd;

	///	<summary>
	///		Features of each unit (unit-major).
	///	</summary>
	DataArray2D<double> dFeatures;

	///	<summary>
	///		Extraction outcome of each unit.
	///	</summary>
	std::vector<ExtractionErrorKind> vecError;

	///	<summary>
	///		Detail of each failed unit (empty on success).
	///	</summary>
	std::vector<std::string> vecErrorDetail;

	///	<summary>
	///		Number of extraction attempts made.
	///	</summary>
	int nAttempts;

	///	<summary>
	///		Flag indicating every attempt failed; units carry no features.
	///	</summary>
	bool fFailed;

	///	<summary>
	///		Flag indicating the chunk was not started due to cancellation.
	///	</summary>
	bool fCancelled;

	///	<summary>
	///		Reason of the last failed attempt.
	///	</summary>
	std::string strFailure;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Reduces units of the unit axis to feature vectors.  The reduction
///		function of each variable is resolved once at construction; the
///		extractor is immutable afterwards and may be shared by workers.
///	</summary>
class FeatureExtractor {

public:
	///	<summary>
	///		A lazy, finite and restartable sequence of unit extractions
	///		over [sBegin, sEnd).
	///	</summary>
	class Cursor {

	public:
		Cursor(
			const FeatureExtractor & extractor,
			size_t sBegin,
			size_t sEnd
		) :
			m_extractor(extractor),
			m_sBegin(sBegin),
			m_sEnd(sEnd),
			m_sNext(sBegin)
		{ }

		///	<summary>
		///		Extract the next unit.
		///	</summary>
		///	<returns>
		///		false once the range is exhausted.
		///	</returns>
		bool Next(UnitExtraction & ue) {
			if (m_sNext >= m_sEnd) {
				return false;
			}
			m_extractor.ExtractUnit(m_sNext, ue);
			m_sNext++;
			return true;
		}

		///	<summary>
		///		Restart the sequence from the first unit.
		///	</summary>
		void Reset() {
			m_sNext = m_sBegin;
		}

		///	<summary>
		///		Index of the unit returned by the next call to Next().
		///	</summary>
		size_t GetPosition() const {
			return m_sNext;
		}

	private:
		const FeatureExtractor & m_extractor;

		size_t m_sBegin;

		size_t m_sEnd;

		size_t m_sNext;
	};

public:
	///	<summary>
	///		Constructor.  Throws SourceError for an unknown variable or unit
	///		dimension, and Exception for a variable that does not span every
	///		unit dimension or a raw-scalar variable with more than one value
	///		per unit.
	///	</summary>
	FeatureExtractor(
		const ArraySource & source,
		const std::vector<std::string> & vecUnitDims,
		const std::vector<FeatureSpec> & vecFeatureSpecs
	);

	///	<summary>
	///		Number of units N along the unit axis.
	///	</summary>
	size_t GetUnitCount() const {
		return m_sUnits;
	}

	///	<summary>
	///		Length of every feature vector.
	///	</summary>
	size_t GetFeatureCount() const {
		return m_vecFeatureSpecs.size();
	}

	///	<summary>
	///		Name of each feature component.
	///	</summary>
	const std::vector<std::string> & GetFeatureNames() const {
		return m_vecFeatureNames;
	}

	///	<summary>
	///		Unit dimension names.
	///	</summary>
	const std::vector<std::string> & GetUnitDimensions() const {
		return m_vecUnitDims;
	}

	///	<summary>
	///		Resolve the indices and coordinates of a unit.
	///	</summary>
	void ResolveUnit(
		size_t sUnit,
		ReductionUnit & unit
	) const;

	///	<summary>
	///		Extract the feature vector of one unit.  Read failures are
	///		reported in ue.eError rather than thrown.
	///	</summary>
	void ExtractUnit(
		size_t sUnit,
		UnitExtraction & ue
	) const;

	///	<summary>
	///		Extract all units of [sBegin, sEnd) into a chunk result.
	///	</summary>
	void ExtractChunk(
		size_t sBegin,
		size_t sEnd,
		ChunkResult & result
	) const;

	///	<summary>
	///		A cursor over [sBegin, sEnd).
	///	</summary>
	Cursor GetCursor(
		size_t sBegin,
		size_t sEnd
	) const {
		return Cursor(*this, sBegin, sEnd);
	}

	///	<summary>
	///		A cursor over the full unit axis.
	///	</summary>
	Cursor GetCursor() const {
		return Cursor(*this, 0, m_sUnits);
	}

private:
	///	<summary>
	///		Source of the data.
	///	</summary>
	const ArraySource & m_source;

	std::vector<std::string> m_vecUnitDims;

	std::vector<FeatureSpec> m_vecFeatureSpecs;

	///	<summary>
	///		Metadata of each feature variable.
	///	</summary>
	std::vector<VariableInfo> m_vecVariables;

	///	<summary>
	///		Reduction operator of each feature variable.
	///	</summary>
	std::vector<ReductionFunction> m_vecReduce;

	std::vector<std::string> m_vecFeatureNames;

	///	<summary>
	///		Coordinates of each unit dimension.
	///	</summary>
	std::vector<DimensionInfo> m_vecUnitDimInfo;

	size_t m_sUnits;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Per-component z-score normalization.  A component whose standard
///		deviation vanishes is flagged constant, left unscaled and given
///		zero weight in distances.
///	</summary>
class FeatureScaling {

public:
	FeatureScaling() :
		m_fNormalize(false)
	{ }

	///	<summary>
	///		Configure a scaling that leaves values unchanged with unit
	///		distance weights.
	///	</summary>
	void SetIdentity(
		size_t sFeatures
	);

	///	<summary>
	///		Compute the mean and standard deviation of each component over
	///		the rows with vecUse[i] set.  Rows with non-finite values must
	///		not be marked for use.
	///	</summary>
	void Compute(
		const DataArray2D<double> & dFeatures,
		const std::vector<bool> & vecUse
	);

	///	<summary>
	///		Normalize one feature vector in place.
	///	</summary>
	void Normalize(
		double * dRow
	) const;

	///	<summary>
	///		Restore one normalized feature vector to physical units in place.
	///	</summary>
	void Denormalize(
		double * dRow
	) const;

	///	<summary>
	///		Weight of each component in distances.
	///	</summary>
	void GetDistanceWeights(
		DataArray1D<double> & dWeights
	) const;

	bool IsNormalizing() const {
		return m_fNormalize;
	}

	size_t GetFeatureCount() const {
		return m_vecConstant.size();
	}

	double GetMean(size_t f) const {
		return m_dMean[f];
	}

	double GetStdDev(size_t f) const {
		return m_dStdDev[f];
	}

	bool IsConstant(size_t f) const {
		return m_vecConstant[f];
	}

private:
	///	<summary>
	///		Flag indicating values are normalized.
	///	</summary>
	bool m_fNormalize;

	DataArray1D<double> m_dMean;

	DataArray1D<double> m_dStdDev;

	std::vector<bool> m_vecConstant;
};

///////////////////////////////////////////////////////////////////////////////

#endif

