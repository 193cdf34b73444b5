///////////////////////////////////////////////////////////////////////////////
///
///	\file    RegimeParam.h
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

#ifndef _REGIMEPARAM_H_
#define _REGIMEPARAM_H_

#include "FeatureExtractor.h"
#include "ClusteringEngine.h"
#include "ReductionMode.h"
#include "Defines.h"

#include <map>
#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Parse a reduction command of the form "var,mode;var,mode".
///	</summary>
void ParseReduceCommand(
	const std::string & strReduceCmd,
	std::map<std::string, ReductionMode> & mapReduction
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Parameters of a regime clustering run.
///	</summary>
class RegimeParam {

public:
	RegimeParam() :
		fNormalize(false),
		nK(0),
		nKMin(DefaultMinimumK),
		nKMax(DefaultMaximumK),
		nChunkSize(DefaultChunkSize),
		nMaxIterations(DefaultMaximumIterations),
		dTolerance(0.0),
		nSeed(0),
		eInit(InitializationMethod_Random),
		nSilhouetteSamples(DefaultSilhouetteSamples),
		eValidity(ValidityPolicy_Silhouette),
		eNormalization(ScoreNormalization_Probability),
		dWeightSilhouette(DefaultWeightSilhouette),
		dWeightCalinskiHarabasz(DefaultWeightCalinskiHarabasz),
		dWeightDaviesBouldin(DefaultWeightDaviesBouldin),
		nThreads(0)
	{
		vecUnitDims.push_back("time");
	}

	///	<summary>
	///		Check the parameters for consistency.  Throws an Exception.
	///	</summary>
	void Validate() const;

	///	<summary>
	///		Feature specifications in variable order.  Variables without
	///		a reduction command are raw-scalar.
	///	</summary>
	void BuildFeatureSpecs(
		std::vector<FeatureSpec> & vecFeatureSpecs
	) const;

	///	<summary>
	///		Candidate numbers of clusters: nK if fixed, otherwise the
	///		inclusive range [nKMin, nKMax].
	///	</summary>
	void GetCandidateK(
		std::vector<int> & vecCandidateK
	) const;

	///	<summary>
	///		Clustering engine configuration.
	///	</summary>
	void BuildClusteringParam(
		ClusteringParam & param
	) const;

public:
	///	<summary>
	///		Feature variables, in feature order.
	///	</summary>
	std::vector<std::string> vecVariables;

	///	<summary>
	///		Dimensions enumerating the reduction units.
	///	</summary>
	std::vector<std::string> vecUnitDims;

	///	<summary>
	///		Reduction mode of variables that are not raw-scalar.
	///	</summary>
	std::map<std::string, ReductionMode> mapReduction;

	bool fNormalize;

	///	<summary>
	///		Fixed number of clusters, or 0 to sweep [nKMin, nKMax].
	///	</summary>
	int nK;

	int nKMin;

	int nKMax;

	int nChunkSize;

	int nMaxIterations;

	double dTolerance;

	int nSeed;

	InitializationMethod eInit;

	int nSilhouetteSamples;

	ValidityPolicy eValidity;

	ScoreNormalization eNormalization;

	double dWeightSilhouette;

	double dWeightCalinskiHarabasz;

	double dWeightDaviesBouldin;

	///	<summary>
	///		OpenMP threads per rank (0 for the OpenMP default).
	///	</summary>
	int nThreads;
};

///////////////////////////////////////////////////////////////////////////////

#endif

