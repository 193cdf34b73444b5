///////////////////////////////////////////////////////////////////////////////
///
///	\file    ArraySource.h
///	\version October 19, 2026
///
///	<summary>
///		Read-only access to named multidimensional variables together with
///		their dimension and coordinate metadata.
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

#ifndef _ARRAYSOURCE_H_
#define _ARRAYSOURCE_H_

#include <string>
#include <vector>
#include <map>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A named dimension with its declared length and coordinate values.
///	</summary>
class DimensionInfo {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	DimensionInfo() :
		lSize(0)
	{ }

	///	<summary>
	///		Constructor with index coordinates 0..lSize-1.
	///	</summary>
	DimensionInfo(
		const std::string & strNameArg,
		long lSizeArg
	);

	///	<summary>
	///		Constructor with explicit coordinates.
	///	</summary>
	DimensionInfo(
		const std::string & strNameArg,
		const std::vector<double> & vecCoordArg,
		const std::string & strUnitsArg = std::string("")
	);

public:
	///	<summary>
	///		Name of the dimension.
	///	</summary>
	std::string strName;

	///	<summary>
	///		Declared length.
	///	</summary>
	long lSize;

	///	<summary>
	///		Coordinate value of each index.
	///	</summary>
	std::vector<double> vecCoord;

	///	<summary>
	///		Units of the coordinate values.
	///	</summary>
	std::string strUnits;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Metadata of a floating point variable.
///	</summary>
class VariableInfo {

public:
	VariableInfo() :
		fHasFillValue(false),
		dFillValue(0.0)
	{ }

	///	<summary>
	///		Constructor.  The shape is filled in when the variable is added
	///		to a Dataset.
	///	</summary>
	VariableInfo(
		const std::string & strNameArg,
		const std::vector<std::string> & vecDimNamesArg
	) :
		strName(strNameArg),
		vecDimNames(vecDimNamesArg),
		fHasFillValue(false),
		dFillValue(0.0)
	{ }

	///	<summary>
	///		Set the fill value.
	///	</summary>
	void SetFillValue(double dFillValueArg) {
		fHasFillValue = true;
		dFillValue = dFillValueArg;
	}

	///	<summary>
	///		Get the index of the named dimension in this variable, or -1.
	///	</summary>
	int GetDimIndex(const std::string & strDimName) const;

	///	<summary>
	///		Total number of values in this variable.
	///	</summary>
	size_t GetTotalSize() const;

public:
	std::string strName;

	///	<summary>
	///		Ordered dimension names (defines axis order).
	///	</summary>
	std::vector<std::string> vecDimNames;

	///	<summary>
	///		Length along each dimension.
	///	</summary>
	std::vector<long> vecShape;

	bool fHasFillValue;

	double dFillValue;

	std::string strUnits;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		An ordered set of named variables plus the dimension table.  Every
///		dimension name of every variable resolves in the dimension table.
///	</summary>
class Dataset {

public:
	///	<summary>
	///		Add a dimension.  Throws SourceError if a dimension of the same
	///		name is already present or the coordinate count does not match
	///		the declared length.
	///	</summary>
	void AddDimension(
		const DimensionInfo & dim
	);

	///	<summary>
	///		Add a variable.  The variable shape is resolved from the
	///		dimension table; throws SourceError if a dimension is unknown,
	///		a dimension repeats or the variable name is already present.
	///	</summary>
	void AddVariable(
		const VariableInfo & var
	);

	///	<summary>
	///		Number of dimensions.
	///	</summary>
	size_t GetDimensionCount() const {
		return m_vecDimensions.size();
	}

	///	<summary>
	///		Get a dimension by position.
	///	</summary>
	const DimensionInfo & GetDimension(size_t d) const {
		return m_vecDimensions[d];
	}

	///	<summary>
	///		Find a dimension by name, or NULL.
	///	</summary>
	const DimensionInfo * FindDimension(
		const std::string & strName
	) const;

	///	<summary>
	///		Get a dimension by name; throws SourceError if unknown.
	///	</summary>
	const DimensionInfo & GetDimension(
		const std::string & strName
	) const;

	///	<summary>
	///		Number of variables.
	///	</summary>
	size_t GetVariableCount() const {
		return m_vecVariables.size();
	}

	///	<summary>
	///		Get a variable by position.
	///	</summary>
	const VariableInfo & GetVariable(size_t v) const {
		return m_vecVariables[v];
	}

	///	<summary>
	///		Find a variable by name, or NULL.
	///	</summary>
	const VariableInfo * FindVariable(
		const std::string & strName
	) const;

	///	<summary>
	///		Get a variable by name; throws SourceError if unknown.
	///	</summary>
	const VariableInfo & GetVariable(
		const std::string & strName
	) const;

	///	<summary>
	///		Names of all variables in order.
	///	</summary>
	std::vector<std::string> GetVariableNames() const;

	///	<summary>
	///		Number of reduction units spanned by the given unit dimensions,
	///		the product of their lengths.
	///	</summary>
	size_t GetUnitCount(
		const std::vector<std::string> & vecUnitDims
	) const;

	///	<summary>
	///		Convert a flat unit index into one index per unit dimension,
	///		row-major over vecUnitDims.  Throws SourceError if out of range.
	///	</summary>
	void GetUnitDimIndices(
		const std::vector<std::string> & vecUnitDims,
		size_t sUnit,
		std::vector<long> & vecDimIndices
	) const;

private:
	///	<summary>
	///		Dimensions in declaration order.
	///	</summary>
	std::vector<DimensionInfo> m_vecDimensions;

	///	<summary>
	///		Variables in declaration order.
	///	</summary>
	std::vector<VariableInfo> m_vecVariables;

	///	<summary>
	///		Map from dimension name to position.
	///	</summary>
	std::map<std::string, size_t> m_mapDimensionIx;

	///	<summary>
	///		Map from variable name to position.
	///	</summary>
	std::map<std::string, size_t> m_mapVariableIx;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Abstract read-only source of array data.  ReadSlice may be called
///		concurrently from several worker threads.
///	</summary>
class ArraySource {

public:
	///	<summary>
	///		Virtual destructor.
	///	</summary>
	virtual ~ArraySource() { }

	///	<summary>
	///		Determine if the source is open for reading.
	///	</summary>
	virtual bool IsOpen() const = 0;

	///	<summary>
	///		Release the underlying handle.  Further reads fail until the
	///		source is opened again.
	///	</summary>
	virtual void Close() = 0;

	///	<summary>
	///		Dataset metadata.
	///	</summary>
	const Dataset & GetDataset() const {
		return m_dataset;
	}

	///	<summary>
	///		Read all values of a variable belonging to one reduction unit,
	///		in the row-major order of the variable's remaining dimensions.
	///		Throws SourceError if the variable is unknown, does not span a
	///		unit dimension, or the unit index is out of range.
	///	</summary>
	void ReadSlice(
		const std::string & strVariable,
		const std::vector<std::string> & vecUnitDims,
		size_t sUnit,
		std::vector<double> & vecValues
	) const;

protected:
	///	<summary>
	///		Read a hyperslab of a variable with the given start and count
	///		along each variable dimension.  Values are unpacked and written
	///		in row-major order.
	///	</summary>
	virtual void ReadHyperslab(
		const VariableInfo & var,
		const std::vector<long> & vecStart,
		const std::vector<long> & vecCount,
		std::vector<double> & vecValues
	) const = 0;

protected:
	///	<summary>
	///		Dataset metadata, populated by the concrete source.
	///	</summary>
	Dataset m_dataset;
};

///////////////////////////////////////////////////////////////////////////////

#endif

