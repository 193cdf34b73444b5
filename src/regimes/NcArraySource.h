///////////////////////////////////////////////////////////////////////////////
///
///	\file    NcArraySource.h
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

#ifndef _NCARRAYSOURCE_H_
#define _NCARRAYSOURCE_H_

#include "ArraySource.h"

#include "netcdfcpp.h"

#include <string>
#include <map>
#include <mutex>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		An ArraySource reading a NetCDF file.  Packed variables are
///		unpacked on read.  All NetCDF calls are serialized.
///	</summary>
class NcArraySource : public ArraySource {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	NcArraySource();

	///	<summary>
	///		Destructor; closes the file.
	///	</summary>
	virtual ~NcArraySource();

	///	<summary>
	///		Open a NetCDF file and load its metadata.  Throws SourceError if
	///		the file cannot be read or its dimensions are inconsistent.
	///	</summary>
	void Open(
		const std::string & strPath
	);

	///	<summary>
	///		Name of the time dimension of the open file, or an empty string.
	///	</summary>
	std::string FindTimeDimensionName() const;

	///	<summary>
	///		Path of the open file.
	///	</summary>
	const std::string & GetPath() const {
		return m_strPath;
	}

public:
	virtual bool IsOpen() const;

	virtual void Close();

protected:
	virtual void ReadHyperslab(
		const VariableInfo & var,
		const std::vector<long> & vecStart,
		const std::vector<long> & vecCount,
		std::vector<double> & vecValues
	) const;

private:
	NcArraySource(const NcArraySource &);
	NcArraySource & operator=(const NcArraySource &);

private:
	///	<summary>
	///		Packing of a variable.
	///	</summary>
	struct Packing {
		double dScaleFactor;
		double dAddOffset;
	};

	///	<summary>
	///		Read a one-dimensional coordinate variable into a DimensionInfo.
	///	</summary>
	void LoadCoordinate(
		NcVar * var,
		DimensionInfo & dim
	);

private:
	///	<summary>
	///		Path of the open file.
	///	</summary>
	std::string m_strPath;

	///	<summary>
	///		Open file, or NULL.
	///	</summary>
	NcFile * m_pncfile;

	///	<summary>
	///		Packing of packed variables, keyed by name.
	///	</summary>
	std::map<std::string, Packing> m_mapPacking;

	///	<summary>
	///		Serializes access to m_pncfile.
	///	</summary>
	mutable std::mutex m_mutexFile;
};

///////////////////////////////////////////////////////////////////////////////

#endif

