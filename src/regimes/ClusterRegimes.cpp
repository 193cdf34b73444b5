///////////////////////////////////////////////////////////////////////////////
///
///	\file    ClusterRegimes.cpp
///	\version October 19, 2026
///
///	<summary>
///		Classify the units of a gridded dataset (typically time steps) into
///		recurring regimes by clustering reduced feature vectors.
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

#if defined(REGIMES_MPIOMP)
#include <mpi.h>
#endif

#include "RegimePipeline.h"
#include "RegimeParam.h"
#include "NcArraySource.h"
#include "TableSink.h"
#include "CommandLine.h"
#include "STLStringHelper.h"
#include "FunctionTimer.h"
#include "Announce.h"
#include "Exception.h"

#include "netcdfcpp.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

int main(int argc, char** argv) {

#if defined(REGIMES_MPIOMP)
	// Initialize MPI
	MPI_Init(&argc, &argv);
#endif

	// Turn off fatal errors in NetCDF
	NcError error(NcError::silent_nonfatal);

	// Enable output only on rank zero
	AnnounceOnlyOutputOnRankZero();

	int iReturn = 0;

try {
	// Parameters of the run
	RegimeParam param;

	// Input data file
	std::string strInputFile;

	// Output result table
	std::string strOutputFile;

	// Output centroid table
	std::string strOutputCentroids;

	// Output candidate score table
	std::string strOutputScores;

	// Feature variables
	std::string strVariables;

	// Reduction commands
	std::string strReduceCmd;

	// Unit dimensions
	std::string strUnitDims;

	// Initialization method
	std::string strInit;

	// Selection of the number of clusters
	std::string strValidity;

	// Normalization of the validity indices
	std::string strNormMethod;

	// Delimiter of the output tables
	std::string strDelimiter;

	// Verbosity level
	int iVerbosityLevel;

	// Parse the command line
	BeginCommandLine()
		CommandLineString(strInputFile, "in_data", "");
		CommandLineString(strOutputFile, "out", "");
		CommandLineString(strOutputCentroids, "out_centroids", "");
		CommandLineString(strOutputScores, "out_scores", "");
		CommandLineStringD(strVariables, "var", "", "[var,var,...]");
		CommandLineStringD(strReduceCmd, "reducecmd", "", "[var,mode;...] mode is raw-scalar|mean|variance|min|max");
		CommandLineStringD(strUnitDims, "unitdim", "time", "[dim,dim,...]");
		CommandLineBool(param.fNormalize, "normalize");
		CommandLineIntD(param.nK, "k", 0, "(0 to sweep kmin to kmax)");
		CommandLineInt(param.nKMin, "kmin", DefaultMinimumK);
		CommandLineInt(param.nKMax, "kmax", DefaultMaximumK);
		CommandLineInt(param.nChunkSize, "chunksize", DefaultChunkSize);
		CommandLineInt(param.nMaxIterations, "maxiter", DefaultMaximumIterations);
		CommandLineDouble(param.dTolerance, "tolerance", 0.0);
		CommandLineInt(param.nSeed, "seed", 0);
		CommandLineStringD(strInit, "init", "random", "[random|kmeans++]");
		CommandLineInt(param.nSilhouetteSamples, "silhouette_samples", DefaultSilhouetteSamples);
		CommandLineStringD(strValidity, "validity", "silhouette", "[silhouette|combined]");
		CommandLineStringD(strNormMethod, "norm_method", "probability", "[probability|minmax|scale|zscore]");
		CommandLineDouble(param.dWeightSilhouette, "weight_s", DefaultWeightSilhouette);
		CommandLineDouble(param.dWeightCalinskiHarabasz, "weight_ch", DefaultWeightCalinskiHarabasz);
		CommandLineDouble(param.dWeightDaviesBouldin, "weight_db", DefaultWeightDaviesBouldin);
		CommandLineIntD(param.nThreads, "threads", 0, "(0 for the OpenMP default)");
		CommandLineStringD(strDelimiter, "delim", ",", "[,|tab]");
		CommandLineInt(iVerbosityLevel, "verbosity", 0);

		ParseCommandLine(argc, argv);
	EndCommandLine(argv)

	AnnounceBanner();

	// Set verbosity level
	AnnounceSetVerbosityLevel(iVerbosityLevel);

	// Check input and output
	if (strInputFile.length() == 0) {
		_EXCEPTIONT("No input data file (--in_data) specified");
	}
	if (strOutputFile.length() == 0) {
		_EXCEPTIONT("No output file (--out) specified");
	}
	if (strVariables.length() == 0) {
		_EXCEPTIONT("No variables (--var) specified");
	}

	// Parse the variable list and reduction commands
	STLStringHelper::ParseVariableList(strVariables, param.vecVariables, ",");

	if (strReduceCmd != "") {
		ParseReduceCommand(strReduceCmd, param.mapReduction);
	}

	param.eInit = ParseInitializationMethod(strInit);
	param.eValidity = ParseValidityPolicy(strValidity);
	param.eNormalization = ParseScoreNormalization(strNormMethod);

	DelimitedTableSink sink(DelimitedTableSink::ParseDelimiter(strDelimiter));

	// Open the input
	AnnounceStartBlock("Loading \"%s\"", strInputFile.c_str());

	NcArraySource source;
	source.Open(strInputFile);

	// Unit dimensions
	param.vecUnitDims.clear();
	STLStringHelper::ParseVariableList(strUnitDims, param.vecUnitDims, ",");

	if ((param.vecUnitDims.size() == 1)
	 && (param.vecUnitDims[0] == "time")
	 && (source.GetDataset().FindDimension("time") == NULL)
	) {
		std::string strTimeDim = source.FindTimeDimensionName();
		if (strTimeDim == "") {
			_EXCEPTION1("No unit dimension \"time\" in \"%s\"; "
				"specify --unitdim", strInputFile.c_str());
		}
		Announce("Using time dimension \"%s\"", strTimeDim.c_str());
		param.vecUnitDims[0] = strTimeDim;
	}

	AnnounceEndBlock("Done");

	// Run
	RegimePipeline pipeline(param);

	PipelineResult result;
	pipeline.Run(source, NULL, result);

	source.Close();

	// Write output
	int nMPIRank = 0;
#if defined(REGIMES_MPIOMP)
	MPI_Comm_rank(MPI_COMM_WORLD, &nMPIRank);
#endif

	if (nMPIRank == 0) {
		WritePipelineResult(
			result,
			sink,
			strOutputFile,
			strOutputCentroids,
			strOutputScores);
	}

	// Timing summary
	AnnounceStartBlock("Timing");
	std::vector<std::string> vecPhases = FunctionTimer::GetPhaseNames();
	for (size_t i = 0; i < vecPhases.size(); i++) {
		Announce("%s: %1.3f s", vecPhases[i].c_str(),
			static_cast<double>(FunctionTimer::GetPhaseTime(vecPhases[i]))
			/ static_cast<double>(FunctionTimer::MICROSECONDS_PER_SECOND));
	}
	AnnounceEndBlock(NULL);

	AnnounceBanner();

} catch(Exception & e) {
	Announce("%s", e.ToString().c_str());
	iReturn = 1;
}

#if defined(REGIMES_MPIOMP)
	// Deinitialize MPI
	MPI_Finalize();
#endif

	return iReturn;
}

///////////////////////////////////////////////////////////////////////////////

