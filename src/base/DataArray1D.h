///////////////////////////////////////////////////////////////////////////////
///
///	\file    DataArray1D.h
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

#ifndef _DATAARRAY1D_H_
#define _DATAARRAY1D_H_

///////////////////////////////////////////////////////////////////////////////

#include "Exception.h"

#include <cstdlib>
#include <cstring>

///	<summary>
///		A contiguous, owning one-dimensional array of plain values.
///	</summary>
template <typename T>
class DataArray1D {

public:
	typedef T ValueType;

	///	<summary>
	///		Constructor.
	///	</summary>
	DataArray1D() :
		m_sSize(0),
		m_data(NULL)
	{ }

	///	<summary>
	///		Constructor allowing specification of size.  Data is zeroed.
	///	</summary>
	explicit DataArray1D(
		size_t sSize
	) :
		m_sSize(0),
		m_data(NULL)
	{
		Allocate(sSize);
	}

	///	<summary>
	///		Copy constructor.
	///	</summary>
	DataArray1D(const DataArray1D<T> & da) :
		m_sSize(0),
		m_data(NULL)
	{
		Assign(da);
	}

	///	<summary>
	///		Destructor.
	///	</summary>
	virtual ~DataArray1D() {
		Deallocate();
	}

	///	<summary>
	///		Allocate data in this DataArray1D and set it to zero.
	///	</summary>
	void Allocate(
		size_t sSize
	) {
		Deallocate();

		if (sSize == 0) {
			return;
		}

		m_data = reinterpret_cast<T *>(malloc(sSize * sizeof(T)));
		if (m_data == NULL) {
			_EXCEPTION1("Failed malloc call (%lu bytes)",
				static_cast<unsigned long>(sSize * sizeof(T)));
		}
		m_sSize = sSize;

		Zero();
	}

	///	<summary>
	///		Release the data held by this DataArray1D.
	///	</summary>
	void Deallocate() {
		if (m_data != NULL) {
			free(m_data);
		}
		m_data = NULL;
		m_sSize = 0;
	}

	///	<summary>
	///		Determine if this DataArray1D holds data.
	///	</summary>
	bool IsAttached() const {
		return (m_data != NULL);
	}

	///	<summary>
	///		Get the number of elements in this DataArray1D.
	///	</summary>
	inline size_t GetRows() const {
		return m_sSize;
	}

public:
	///	<summary>
	///		Copy the contents of another DataArray1D.
	///	</summary>
	void Assign(const DataArray1D<T> & da) {
		if (this == &da) {
			return;
		}
		if (m_sSize != da.m_sSize) {
			Allocate(da.m_sSize);
		}
		if (m_sSize != 0) {
			memcpy(m_data, da.m_data, m_sSize * sizeof(T));
		}
	}

	///	<summary>
	///		Assignment operator.
	///	</summary>
	DataArray1D<T> & operator= (const DataArray1D<T> & da) {
		Assign(da);
		return (*this);
	}

	///	<summary>
	///		Zero the data content of this object.
	///	</summary>
	void Zero() {
		if (m_sSize != 0) {
			memset(m_data, 0, m_sSize * sizeof(T));
		}
	}

public:
	///	<summary>
	///		Implicit conversion to a pointer.
	///	</summary>
	inline operator T const*() const {
		return m_data;
	}

	inline operator T*() {
		return m_data;
	}

	///	<summary>
	///		Parenthetical array accessor.
	///	</summary>
	inline T & operator()(size_t i) {
#if defined(REGIMES_DEBUG)
		if (i >= m_sSize) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return m_data[i];
	}

	inline const T & operator()(size_t i) const {
#if defined(REGIMES_DEBUG)
		if (i >= m_sSize) {
			_EXCEPTIONT("Array access out of bounds");
		}
#endif
		return m_data[i];
	}

private:
	///	<summary>
	///		The number of rows in this DataArray1D.
	///	</summary>
	size_t m_sSize;

	///	<summary>
	///		A pointer to the data for this DataArray1D.
	///	</summary>
	T * m_data;
};

///////////////////////////////////////////////////////////////////////////////

#endif

