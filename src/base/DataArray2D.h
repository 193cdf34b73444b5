///////////////////////////////////////////////////////////////////////////////
///
///	\file    DataArray2D.h
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

#ifndef _DATAARRAY2D_H_
#define _DATAARRAY2D_H_

///////////////////////////////////////////////////////////////////////////////

#include "Exception.h"

#include <cstdlib>
#include <cstring>

///	<summary>
///		A contiguous, owning row-major two-dimensional array of plain values.
///	</summary>
template <typename T>
class DataArray2D {

public:
	typedef T ValueType;

	///	<summary>
	///		Constructor.
	///	</summary>
	DataArray2D() :
		m_data1D(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;
	}

	///	<summary>
	///		Constructor allowing specification of size.  Data is zeroed.
	///	</summary>
	DataArray2D(
		size_t sSize0,
		size_t sSize1
	) :
		m_data1D(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;

		Allocate(sSize0, sSize1);
	}

	///	<summary>
	///		Copy constructor.
	///	</summary>
	DataArray2D(const DataArray2D<T> & da) :
		m_data1D(NULL)
	{
		m_sSize[0] = 0;
		m_sSize[1] = 0;

		Assign(da);
	}

	///	<summary>
	///		Destructor.
	///	</summary>
	virtual ~DataArray2D() {
		Deallocate();
	}

	///	<summary>
	///		Allocate data in this DataArray2D and set it to zero.  A zero
	///		extent in either dimension leaves the array empty but records
	///		the column count.
	///	</summary>
	void Allocate(
		size_t sSize0,
		size_t sSize1
	) {
		Deallocate();

		m_sSize[0] = sSize0;
		m_sSize[1] = sSize1;

		if ((sSize0 == 0) || (sSize1 == 0)) {
			return;
		}

		size_t sBytes = sSize0 * sSize1 * sizeof(T);
		m_data1D = reinterpret_cast<T *>(malloc(sBytes));
		if (m_data1D == NULL) {
			m_sSize[0] = 0;
			m_sSize[1] = 0;
			_EXCEPTION1("Failed malloc call (%lu bytes)",
				static_cast<unsigned long>(sBytes));
		}

		Zero();
	}

	///	<summary>
	///		Release the data held by this DataArray2D.
	///	</summary>
	void Deallocate() {
		if (m_data1D != NULL) {
			free(m_data1D);
		}
		m_data1D = NULL;
		m_sSize[0] = 0;
		m_sSize[1] = 0;
	}

	///	<summary>
	///		Determine if this DataArray2D holds data.
	///	</summary>
	bool IsAttached() const {
		return (m_data1D != NULL);
	}

	///	<summary>
	///		Get the size of the data.
	///	</summary>
	size_t GetTotalSize() const {
		return (m_sSize[0] * m_sSize[1]);
	}

	///	<summary>
	///		Get the number of rows in this DataArray2D.
	///	</summary>
	inline size_t GetRows() const {
		return m_sSize[0];
	}

	///	<summary>
	///		Get the number of columns in this DataArray2D.
	///	</summary>
	inline size_t GetColumns() const {
		return m_sSize[1];
	}

public:
	///	<summary>
	///		Copy the contents of another DataArray2D.
	///	</summary>
	void Assign(const DataArray2D<T> & da) {
		if (this == &da) {
			return;
		}
		if ((m_sSize[0] != da.m_sSize[0]) ||
		    (m_sSize[1] != da.m_sSize[1]) ||
		    (m_data1D == NULL)
		) {
			Allocate(da.m_sSize[0], da.m_sSize[1]);
		}
		if (GetTotalSize() != 0) {
			memcpy(m_data1D, da.m_data1D, GetTotalSize() * sizeof(T));
		}
	}

	///	<summary>
	///		Assignment operator.
	///	</summary>
	DataArray2D<T> & operator= (const DataArray2D<T> & da) {
		Assign(da);
		return (*this);
	}

	///	<summary>
	///		Zero the data content of this object.
	///	</summary>
	void Zero() {
		if (GetTotalSize() != 0) {
			memset(m_data1D, 0, GetTotalSize() * sizeof(T));
		}
	}

public:
	///	<summary>
	///		Parenthetical array accessor.
	///	</summary>
	inline const T & operator()(size_t i, size_t j) const {
#if defined(REGIMES_DEBUG)
		if ((i >= m_sSize[0]) || (j >= m_sSize[1])) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return (*(m_data1D + i * m_sSize[1] + j));
	}

	inline T & operator()(size_t i, size_t j) {
#if defined(REGIMES_DEBUG)
		if ((i >= m_sSize[0]) || (j >= m_sSize[1])) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return (*(m_data1D + i * m_sSize[1] + j));
	}

	///	<summary>
	///		Row accessor (unit-stride slicer).
	///	</summary>
	inline T const* operator[](size_t i) const {
#if defined(REGIMES_DEBUG)
		if (i >= m_sSize[0]) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return m_data1D + i * m_sSize[1];
	}

	inline T* operator[](size_t i) {
#if defined(REGIMES_DEBUG)
		if (i >= m_sSize[0]) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return m_data1D + i * m_sSize[1];
	}

private:
	///	<summary>
	///		The size of each dimension of this DataArray2D.
	///	</summary>
	size_t m_sSize[2];

	///	<summary>
	///		A pointer to the data for this DataArray2D.
	///	</summary>
	T * m_data1D;
};

///////////////////////////////////////////////////////////////////////////////

#endif

