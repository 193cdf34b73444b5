///////////////////////////////////////////////////////////////////////////////
///
///	\file    FunctionTimer.h
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

#ifndef _FUNCTIONTIMER_H_
#define _FUNCTIONTIMER_H_

#include <cstddef>
#include <string>
#include <vector>
#include <map>
#include <sys/time.h>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Wall clock timer of one phase of a run.  Timers constructed with a
///		phase name add their elapsed time to a process-wide record of that
///		phase when stopped; the record may be updated from several threads.
///	</summary>
class FunctionTimer {

public:
	static const unsigned long long MICROSECONDS_PER_SECOND = 1000000;

public:
	///	<summary>
	///		Constructor.  The timer starts immediately.
	///	</summary>
	explicit FunctionTimer(const char * szPhase = NULL);

	///	<summary>
	///		Destructor.  Stops the timer.
	///	</summary>
	~FunctionTimer() {
		Time(true);
	}

	///	<summary>
	///		Microseconds elapsed since the timer started.  If fDone is set
	///		the timer is stopped and the elapsed time is recorded against
	///		the phase.
	///	</summary>
	unsigned long long Time(bool fDone = false);

	///	<summary>
	///		Seconds elapsed since the timer started.
	///	</summary>
	double Seconds(bool fDone = false) {
		return static_cast<double>(Time(fDone))
			/ static_cast<double>(MICROSECONDS_PER_SECOND);
	}

public:
	///	<summary>
	///		Total recorded microseconds of a phase, or zero if the phase
	///		has no record.
	///	</summary>
	static unsigned long long GetPhaseTime(const std::string & strPhase);

	///	<summary>
	///		Names of all phases with a record, in order of first record.
	///	</summary>
	static std::vector<std::string> GetPhaseNames();

private:
	///	<summary>
	///		Flag indicating the timer has been stopped.
	///	</summary>
	bool m_fStopped;

	timeval m_tvStart;

	timeval m_tvStop;

	///	<summary>
	///		Phase name, or empty if the time is not recorded.
	///	</summary>
	std::string m_strPhase;
};

///////////////////////////////////////////////////////////////////////////////

#endif

