///////////////////////////////////////////////////////////////////////////////
///
///	\file    RegimeParam.cpp
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

#include "RegimeParam.h"
#include "STLStringHelper.h"
#include "Exception.h"

///////////////////////////////////////////////////////////////////////////////

void ParseReduceCommand(
	const std::string & strReduceCmd,
	std::map<std::string, ReductionMode> & mapReduction
) {
	mapReduction.clear();

	std::vector<std::string> vecCommands;
	STLStringHelper::ParseVariableList(strReduceCmd, vecCommands, ";");

	for (size_t i = 0; i < vecCommands.size(); i++) {
		std::vector<std::string> vecArgs;
		STLStringHelper::ParseVariableList(vecCommands[i], vecArgs, ",");

		if (vecArgs.size() != 2) {
			_EXCEPTION1("Malformed reduction command \"%s\" "
				"(expected \"var,mode\")", vecCommands[i].c_str());
		}

		ReductionMode eMode = ParseReductionMode(vecArgs[1]);

		if (mapReduction.find(vecArgs[0]) != mapReduction.end()) {
			_EXCEPTION1("Variable \"%s\" given more than one reduction mode",
				vecArgs[0].c_str());
		}
		mapReduction.insert(
			std::pair<std::string, ReductionMode>(vecArgs[0], eMode));
	}
}

///////////////////////////////////////////////////////////////////////////////

void RegimeParam::Validate() const {
	if (vecVariables.size() == 0) {
		_EXCEPTIONT("No feature variables specified");
	}
	for (size_t v = 0; v < vecVariables.size(); v++) {
		for (size_t w = 0; w < v; w++) {
			if (vecVariables[v] == vecVariables[w]) {
				_EXCEPTION1("Variable \"%s\" specified more than once",
					vecVariables[v].c_str());
			}
		}
	}

	std::map<std::string, ReductionMode>::const_iterator iter =
		mapReduction.begin();
	for (; iter != mapReduction.end(); iter++) {
		bool fFound = false;
		for (size_t v = 0; v < vecVariables.size(); v++) {
			if (vecVariables[v] == iter->first) {
				fFound = true;
				break;
			}
		}
		if (!fFound) {
			_EXCEPTION1("Reduction command refers to variable \"%s\" "
				"which is not a feature variable", iter->first.c_str());
		}
	}

	if (vecUnitDims.size() == 0) {
		_EXCEPTIONT("No unit dimension specified");
	}

	if (nK < 0) {
		_EXCEPTION1("Number of clusters must be non-negative (%i)", nK);
	}
	if (nK == 0) {
		if (nKMin < 1) {
			_EXCEPTION1("Minimum number of clusters must be positive (%i)",
				nKMin);
		}
		if (nKMax < nKMin) {
			_EXCEPTION2("Maximum number of clusters (%i) is less than "
				"the minimum (%i)", nKMax, nKMin);
		}
	}
	if (nChunkSize < 1) {
		_EXCEPTION1("Chunk size must be positive (%i)", nChunkSize);
	}
	if (nMaxIterations < 1) {
		_EXCEPTION1("Maximum iterations must be positive (%i)",
			nMaxIterations);
	}
	if (!(dTolerance >= 0.0)) {
		_EXCEPTION1("Tolerance must be non-negative (%1.5e)", dTolerance);
	}
	if (nSilhouetteSamples < 2) {
		_EXCEPTION1("Silhouette sample size must be at least 2 (%i)",
			nSilhouetteSamples);
	}
	if (!(dWeightSilhouette >= 0.0)
	 || !(dWeightCalinskiHarabasz >= 0.0)
	 || !(dWeightDaviesBouldin >= 0.0)
	) {
		_EXCEPTIONT("Index weights must be non-negative");
	}
	if (dWeightSilhouette + dWeightCalinskiHarabasz + dWeightDaviesBouldin <= 0.0) {
		_EXCEPTIONT("At least one index weight must be positive");
	}
	if (nThreads < 0) {
		_EXCEPTION1("Thread count must be non-negative (%i)", nThreads);
	}
}

///////////////////////////////////////////////////////////////////////////////

void RegimeParam::BuildFeatureSpecs(
	std::vector<FeatureSpec> & vecFeatureSpecs
) const {
	vecFeatureSpecs.clear();
	for (size_t v = 0; v < vecVariables.size(); v++) {
		ReductionMode eMode = ReductionMode_RawScalar;

		std::map<std::string, ReductionMode>::const_iterator iter =
			mapReduction.find(vecVariables[v]);
		if (iter != mapReduction.end()) {
			eMode = iter->second;
		}

		vecFeatureSpecs.push_back(FeatureSpec(vecVariables[v], eMode));
	}
}

///////////////////////////////////////////////////////////////////////////////

void RegimeParam::GetCandidateK(
	std::vector<int> & vecCandidateK
) const {
	vecCandidateK.clear();
	if (nK != 0) {
		vecCandidateK.push_back(nK);
		return;
	}
	for (int k = nKMin; k <= nKMax; k++) {
		vecCandidateK.push_back(k);
	}
}

///////////////////////////////////////////////////////////////////////////////

void RegimeParam::BuildClusteringParam(
	ClusteringParam & param
) const {
	GetCandidateK(param.vecCandidateK);
	param.nMaxIterations = nMaxIterations;
	param.dTolerance = dTolerance;
	param.nSeed = nSeed;
	param.eInit = eInit;
	param.nSilhouetteSamples = nSilhouetteSamples;
	param.eValidity = eValidity;
	param.eNormalization = eNormalization;
	param.dWeightSilhouette = dWeightSilhouette;
	param.dWeightCalinskiHarabasz = dWeightCalinskiHarabasz;
	param.dWeightDaviesBouldin = dWeightDaviesBouldin;
}

///////////////////////////////////////////////////////////////////////////////

