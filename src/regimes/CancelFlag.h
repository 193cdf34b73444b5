///////////////////////////////////////////////////////////////////////////////
///
///	\file    CancelFlag.h
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

#ifndef _CANCELFLAG_H_
#define _CANCELFLAG_H_

#include <atomic>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A pipeline-wide cancellation signal.  Checked between chunks and
///		between fitting iterations.
///	</summary>
class CancelFlag {

public:
	CancelFlag() :
		m_fCancelled(false)
	{ }

	///	<summary>
	///		Request cancellation.
	///	</summary>
	void Cancel() {
		m_fCancelled.store(true);
	}

	///	<summary>
	///		Determine if cancellation was requested.
	///	</summary>
	bool IsCancelled() const {
		return m_fCancelled.load();
	}

private:
	CancelFlag(const CancelFlag &);
	CancelFlag & operator=(const CancelFlag &);

private:
	std::atomic<bool> m_fCancelled;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Check an optional cancellation flag.
///	</summary>
inline bool IsCancelled(const CancelFlag * pcancel) {
	return ((pcancel != NULL) && (pcancel->IsCancelled()));
}

///////////////////////////////////////////////////////////////////////////////

#endif

