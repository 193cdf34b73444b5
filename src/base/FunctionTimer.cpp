///////////////////////////////////////////////////////////////////////////////
///
///	\file    FunctionTimer.cpp
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

#include "FunctionTimer.h"

#include <mutex>

///////////////////////////////////////////////////////////////////////////////

namespace {

///	<summary>
///		Recorded time of each phase, with phase names in order of first
///		record.
///	</summary>
struct PhaseRecords {
	std::mutex mutex;
	std::map<std::string, unsigned long long> mapTime;
	std::vector<std::string> vecNames;
};

PhaseRecords & GetPhaseRecords() {
	static PhaseRecords s_records;
	return s_records;
}

}

///////////////////////////////////////////////////////////////////////////////

FunctionTimer::FunctionTimer(const char * szPhase) :
	m_fStopped(false)
{
	if (szPhase != NULL) {
		m_strPhase = szPhase;
	}

	gettimeofday(&m_tvStart, NULL);
	m_tvStop = m_tvStart;
}

///////////////////////////////////////////////////////////////////////////////

unsigned long long FunctionTimer::Time(bool fDone) {

	if (!m_fStopped) {
		gettimeofday(&m_tvStop, NULL);
	}

	unsigned long long iTime =
		MICROSECONDS_PER_SECOND * (m_tvStop.tv_sec - m_tvStart.tv_sec)
		+ (m_tvStop.tv_usec - m_tvStart.tv_usec);

	if (!fDone || m_fStopped) {
		return iTime;
	}

	m_fStopped = true;

	if (m_strPhase == "") {
		return iTime;
	}

	PhaseRecords & records = GetPhaseRecords();
	std::lock_guard<std::mutex> lock(records.mutex);

	std::map<std::string, unsigned long long>::iterator iter =
		records.mapTime.find(m_strPhase);

	if (iter == records.mapTime.end()) {
		records.mapTime.insert(
			std::pair<std::string, unsigned long long>(m_strPhase, iTime));
		records.vecNames.push_back(m_strPhase);
	} else {
		iter->second += iTime;
	}

	return iTime;
}

///////////////////////////////////////////////////////////////////////////////

unsigned long long FunctionTimer::GetPhaseTime(const std::string & strPhase) {
	PhaseRecords & records = GetPhaseRecords();
	std::lock_guard<std::mutex> lock(records.mutex);

	std::map<std::string, unsigned long long>::const_iterator iter =
		records.mapTime.find(strPhase);
	if (iter == records.mapTime.end()) {
		return 0;
	}
	return iter->second;
}

///////////////////////////////////////////////////////////////////////////////

std::vector<std::string> FunctionTimer::GetPhaseNames() {
	PhaseRecords & records = GetPhaseRecords();
	std::lock_guard<std::mutex> lock(records.mutex);
	return records.vecNames;
}

///////////////////////////////////////////////////////////////////////////////

