///////////////////////////////////////////////////////////////////////////////
///
///	\file    MemoryArraySource.h
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

#ifndef _MEMORYARRAYSOURCE_H_
#define _MEMORYARRAYSOURCE_H_

#include "ArraySource.h"

#include <string>
#include <vector>
#include <map>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		An ArraySource holding row-major variable data in memory.
///	</summary>
class MemoryArraySource : public ArraySource {

public:
	///	<summary>
	///		Constructor.  The source starts open with an empty Dataset.
	///	</summary>
	MemoryArraySource();

	///	<summary>
	///		Add a dimension with index coordinates.
	///	</summary>
	void AddDimension(
		const std::string & strName,
		long lSize
	);

	///	<summary>
	///		Add a dimension with explicit coordinates.
	///	</summary>
	void AddDimension(
		const DimensionInfo & dim
	);

	///	<summary>
	///		Add a variable with its data in row-major order.  Throws
	///		SourceError if the data length does not match the shape.
	///	</summary>
	void AddVariable(
		const VariableInfo & var,
		const std::vector<double> & vecData
	);

	///	<summary>
	///		Reopen after Close().
	///	</summary>
	void Reopen() {
		m_fOpen = true;
	}

public:
	virtual bool IsOpen() const {
		return m_fOpen;
	}

	virtual void Close() {
		m_fOpen = false;
	}

protected:
	virtual void ReadHyperslab(
		const VariableInfo & var,
		const std::vector<long> & vecStart,
		const std::vector<long> & vecCount,
		std::vector<double> & vecValues
	) const;

private:
	///	<summary>
	///		Flag indicating reads are permitted.
	///	</summary>
	bool m_fOpen;

	///	<summary>
	///		Data of each variable, keyed by name.
	///	</summary>
	std::map< std::string, std::vector<double> > m_mapData;
};

///////////////////////////////////////////////////////////////////////////////

#endif

