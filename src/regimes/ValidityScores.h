///////////////////////////////////////////////////////////////////////////////
///
///	\file    ValidityScores.h
///	\version October 19, 2026
///
///	<summary>
///		Internal cluster validity indices used to compare candidate
///		cluster counts.
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

#ifndef _VALIDITYSCORES_H_
#define _VALIDITYSCORES_H_

#include "DataArray1D.h"
#include "DataArray2D.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Squared Euclidean distance with per-component weights.
///	</summary>
inline double WeightedDistanceSq(
	const double * dA,
	const double * dB,
	const double * dWeights,
	size_t sFeatures
) {
	double dDistSq = 0.0;
	for (size_t f = 0; f < sFeatures; f++) {
		double dDiff = dA[f] - dB[f];
		dDistSq += dWeights[f] * dDiff * dDiff;
	}
	return dDistSq;
}

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Choose the points on which the silhouette is evaluated.  All points
///		are used when there are no more than sMaxSamples of them; otherwise
///		a seeded random subset of size sMaxSamples is returned in ascending
///		order.
///	</summary>
void SelectSilhouetteSample(
	size_t sPoints,
	size_t sMaxSamples,
	int nSeed,
	std::vector<size_t> & vecSample
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Mean silhouette width over the sampled points, using only sampled
///		points as neighbours.  Members of a singleton cluster contribute
///		zero, as does every point when fewer than two clusters are
///		occupied.
///	</summary>
double ComputeSilhouette(
	const DataArray2D<double> & dPoints,
	const DataArray1D<double> & dWeights,
	const std::vector<int> & vecAssignment,
	int nK,
	const std::vector<size_t> & vecSample
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Calinski-Harabasz index (between-cluster over within-cluster
///		dispersion, each per degree of freedom).  Larger is better.
///		Zero when undefined.
///	</summary>
double ComputeCalinskiHarabasz(
	const DataArray2D<double> & dPoints,
	const DataArray1D<double> & dWeights,
	const std::vector<int> & vecAssignment,
	const DataArray2D<double> & dCentroids
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Davies-Bouldin index over occupied clusters.  Smaller is better.
///		Zero when undefined.
///	</summary>
double ComputeDaviesBouldin(
	const DataArray2D<double> & dPoints,
	const DataArray1D<double> & dWeights,
	const std::vector<int> & vecAssignment,
	const DataArray2D<double> & dCentroids
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Normalization applied to an index across the candidates before the
///		indices are combined.
///	</summary>
enum ScoreNormalization {
	ScoreNormalization_Probability,
	ScoreNormalization_MinMax,
	ScoreNormalization_Scale,
	ScoreNormalization_ZScore
};

///	<summary>
///		Parse "probability", "minmax", "scale" or "zscore".
///	</summary>
ScoreNormalization ParseScoreNormalization(
	const std::string & strNormalization
);

const char * ScoreNormalizationToString(
	ScoreNormalization eNormalization
);

///	<summary>
///		Normalize the values of one index across the candidates.
///		probability divides by the sum, minmax maps onto [0,1], scale
///		divides by the largest magnitude and zscore subtracts the mean and
///		divides by the standard deviation.  If fLowerIsBetter is set the
///		minmax scale is reversed so that 1 marks the best value; the other
///		methods keep the orientation of the index.  An index that does not
///		vary normalizes to 1/n (probability), 1 (minmax, scale) or 0
///		(zscore).
///	</summary>
void NormalizeIndex(
	const std::vector<double> & vecValues,
	ScoreNormalization eNormalization,
	bool fLowerIsBetter,
	std::vector<double> & vecNormalized
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Entropy weight of each index.  vecIndices holds one vector of
///		values per index, all of the same length; vecLowerIsBetter marks
///		the indices where smaller values are better.  Indices that vary
///		more across the candidates receive more weight.  The weights sum
///		to one; indices that carry no information share the weight equally.
///	</summary>
void ComputeEntropyWeights(
	const std::vector< std::vector<double> > & vecIndices,
	const std::vector<bool> & vecLowerIsBetter,
	std::vector<double> & vecWeights
);

///////////////////////////////////////////////////////////////////////////////

#endif

