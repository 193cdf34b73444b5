///////////////////////////////////////////////////////////////////////////////
///
///	\file    ValidityScores.cpp
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

#include "ValidityScores.h"
#include "STLStringHelper.h"
#include "Defines.h"
#include "Exception.h"

#include <algorithm>
#include <cmath>
#include <random>

///////////////////////////////////////////////////////////////////////////////

void SelectSilhouetteSample(
	size_t sPoints,
	size_t sMaxSamples,
	int nSeed,
	std::vector<size_t> & vecSample
) {
	vecSample.resize(sPoints);
	for (size_t i = 0; i < sPoints; i++) {
		vecSample[i] = i;
	}
	if (sPoints <= sMaxSamples) {
		return;
	}

	// Partial Fisher-Yates shuffle
	std::seed_seq seq{static_cast<unsigned int>(nSeed)};
	std::mt19937_64 rng(seq);

	for (size_t i = 0; i < sMaxSamples; i++) {
		size_t j = i + static_cast<size_t>(rng() % (sPoints - i));
		std::swap(vecSample[i], vecSample[j]);
	}
	vecSample.resize(sMaxSamples);

	std::sort(vecSample.begin(), vecSample.end());
}

///////////////////////////////////////////////////////////////////////////////

double ComputeSilhouette(
	const DataArray2D<double> & dPoints,
	const DataArray1D<double> & dWeights,
	const std::vector<int> & vecAssignment,
	int nK,
	const std::vector<size_t> & vecSample
) {
	const size_t sSamples = vecSample.size();
	const size_t sFeatures = dPoints.GetColumns();

	if ((sSamples == 0) || (nK < 2)) {
		return 0.0;
	}

	// Number of sampled members of each cluster
	std::vector<size_t> vecMembers(nK, 0);
	for (size_t s = 0; s < sSamples; s++) {
		int iCluster = vecAssignment[vecSample[s]];
		if ((iCluster < 0) || (iCluster >= nK)) {
			_EXCEPTION1("Invalid cluster assignment %i", iCluster);
		}
		vecMembers[iCluster]++;
	}

	size_t sOccupied = 0;
	for (int c = 0; c < nK; c++) {
		if (vecMembers[c] != 0) {
			sOccupied++;
		}
	}
	if (sOccupied < 2) {
		return 0.0;
	}

	// Contributions are summed in sample order after the parallel loop
	// so the result does not depend on the number of threads
	std::vector<double> vecWidth(sSamples, 0.0);

#pragma omp parallel for schedule(static)
	for (size_t s = 0; s < sSamples; s++) {
		const size_t i = vecSample[s];
		const int iOwn = vecAssignment[i];

		if (vecMembers[iOwn] == 1) {
			continue;
		}

		std::vector<double> vecDistSum(nK, 0.0);
		for (size_t t = 0; t < sSamples; t++) {
			const size_t j = vecSample[t];
			if (i == j) {
				continue;
			}
			vecDistSum[vecAssignment[j]] +=
				sqrt(WeightedDistanceSq(
					dPoints[i], dPoints[j], dWeights, sFeatures));
		}

		double dA = vecDistSum[iOwn] / static_cast<double>(vecMembers[iOwn] - 1);

		double dB = 0.0;
		bool fFirst = true;
		for (int c = 0; c < nK; c++) {
			if ((c == iOwn) || (vecMembers[c] == 0)) {
				continue;
			}
			double dMean = vecDistSum[c] / static_cast<double>(vecMembers[c]);
			if (fFirst || (dMean < dB)) {
				dB = dMean;
				fFirst = false;
			}
		}

		double dMax = std::max(dA, dB);
		if (dMax > 0.0) {
			vecWidth[s] = (dB - dA) / dMax;
		}
	}

	double dSum = 0.0;
	for (size_t s = 0; s < sSamples; s++) {
		dSum += vecWidth[s];
	}

	return (dSum / static_cast<double>(sSamples));
}

///////////////////////////////////////////////////////////////////////////////

double ComputeCalinskiHarabasz(
	const DataArray2D<double> & dPoints,
	const DataArray1D<double> & dWeights,
	const std::vector<int> & vecAssignment,
	const DataArray2D<double> & dCentroids
) {
	const size_t sPoints = dPoints.GetRows();
	const size_t sFeatures = dPoints.GetColumns();
	const size_t sK = dCentroids.GetRows();

	if ((sK < 2) || (sPoints <= sK)) {
		return 0.0;
	}

	// Global mean
	DataArray1D<double> dMean(sFeatures);
	for (size_t i = 0; i < sPoints; i++) {
		for (size_t f = 0; f < sFeatures; f++) {
			dMean[f] += dPoints(i,f);
		}
	}
	for (size_t f = 0; f < sFeatures; f++) {
		dMean[f] /= static_cast<double>(sPoints);
	}

	std::vector<size_t> vecCount(sK, 0);
	double dWithin = 0.0;
	for (size_t i = 0; i < sPoints; i++) {
		const int iCluster = vecAssignment[i];
		vecCount[iCluster]++;
		dWithin += WeightedDistanceSq(
			dPoints[i], dCentroids[iCluster], dWeights, sFeatures);
	}

	double dBetween = 0.0;
	for (size_t c = 0; c < sK; c++) {
		dBetween += static_cast<double>(vecCount[c])
			* WeightedDistanceSq(dCentroids[c], dMean, dWeights, sFeatures);
	}

	if (dWithin <= 0.0) {
		return 0.0;
	}

	return (dBetween / static_cast<double>(sK - 1))
		/ (dWithin / static_cast<double>(sPoints - sK));
}

///////////////////////////////////////////////////////////////////////////////

double ComputeDaviesBouldin(
	const DataArray2D<double> & dPoints,
	const DataArray1D<double> & dWeights,
	const std::vector<int> & vecAssignment,
	const DataArray2D<double> & dCentroids
) {
	const size_t sPoints = dPoints.GetRows();
	const size_t sFeatures = dPoints.GetColumns();
	const size_t sK = dCentroids.GetRows();

	// Mean distance of members to their centroid
	std::vector<size_t> vecCount(sK, 0);
	std::vector<double> vecScatter(sK, 0.0);
	for (size_t i = 0; i < sPoints; i++) {
		const int iCluster = vecAssignment[i];
		vecCount[iCluster]++;
		vecScatter[iCluster] += sqrt(WeightedDistanceSq(
			dPoints[i], dCentroids[iCluster], dWeights, sFeatures));
	}

	size_t sOccupied = 0;
	for (size_t c = 0; c < sK; c++) {
		if (vecCount[c] != 0) {
			vecScatter[c] /= static_cast<double>(vecCount[c]);
			sOccupied++;
		}
	}
	if (sOccupied < 2) {
		return 0.0;
	}

	double dSum = 0.0;
	for (size_t c = 0; c < sK; c++) {
		if (vecCount[c] == 0) {
			continue;
		}
		double dWorst = 0.0;
		for (size_t d = 0; d < sK; d++) {
			if ((d == c) || (vecCount[d] == 0)) {
				continue;
			}
			double dSeparation = sqrt(WeightedDistanceSq(
				dCentroids[c], dCentroids[d], dWeights, sFeatures));

			// Coincident centroids carry no separation information
			if (dSeparation <= 0.0) {
				continue;
			}
			double dRatio = (vecScatter[c] + vecScatter[d]) / dSeparation;
			if (dRatio > dWorst) {
				dWorst = dRatio;
			}
		}
		dSum += dWorst;
	}

	return (dSum / static_cast<double>(sOccupied));
}

///////////////////////////////////////////////////////////////////////////////

ScoreNormalization ParseScoreNormalization(
	const std::string & strNormalization
) {
	std::string strLower = strNormalization;
	STLStringHelper::ToLower(strLower);

	if (strLower == "probability") {
		return ScoreNormalization_Probability;
	}
	if (strLower == "minmax") {
		return ScoreNormalization_MinMax;
	}
	if (strLower == "scale") {
		return ScoreNormalization_Scale;
	}
	if (strLower == "zscore") {
		return ScoreNormalization_ZScore;
	}
	_EXCEPTION1("Unknown score normalization \"%s\" (expected "
		"\"probability\", \"minmax\", \"scale\" or \"zscore\")",
		strNormalization.c_str());
}

///////////////////////////////////////////////////////////////////////////////

const char * ScoreNormalizationToString(
	ScoreNormalization eNormalization
) {
	switch (eNormalization) {
		case ScoreNormalization_MinMax:
			return "minmax";
		case ScoreNormalization_Scale:
			return "scale";
		case ScoreNormalization_ZScore:
			return "zscore";
		default:
			return "probability";
	}
}

///////////////////////////////////////////////////////////////////////////////

void NormalizeIndex(
	const std::vector<double> & vecValues,
	ScoreNormalization eNormalization,
	bool fLowerIsBetter,
	std::vector<double> & vecNormalized
) {
	const size_t sValues = vecValues.size();

	vecNormalized.resize(sValues);
	if (sValues == 0) {
		return;
	}

	double dSum = 0.0;
	double dMin = vecValues[0];
	double dMax = vecValues[0];
	double dMaxAbs = 0.0;
	for (size_t i = 0; i < sValues; i++) {
		dSum += vecValues[i];
		dMin = std::min(dMin, vecValues[i]);
		dMax = std::max(dMax, vecValues[i]);
		dMaxAbs = std::max(dMaxAbs, fabs(vecValues[i]));
	}

	if (eNormalization == ScoreNormalization_Probability) {
		for (size_t i = 0; i < sValues; i++) {
			if (fabs(dSum) < ReferenceTolerance) {
				vecNormalized[i] = 1.0 / static_cast<double>(sValues);
			} else {
				vecNormalized[i] = vecValues[i] / dSum;
			}
		}

	} else if (eNormalization == ScoreNormalization_MinMax) {
		const double dRange = dMax - dMin;
		for (size_t i = 0; i < sValues; i++) {
			if (dRange < ReferenceTolerance) {
				vecNormalized[i] = 1.0;
			} else if (fLowerIsBetter) {
				vecNormalized[i] = (dMax - vecValues[i]) / dRange;
			} else {
				vecNormalized[i] = (vecValues[i] - dMin) / dRange;
			}
		}

	} else if (eNormalization == ScoreNormalization_Scale) {
		for (size_t i = 0; i < sValues; i++) {
			if (dMaxAbs < ReferenceTolerance) {
				vecNormalized[i] = 1.0;
			} else {
				vecNormalized[i] = vecValues[i] / dMaxAbs;
			}
		}

	} else {
		const double dMean = dSum / static_cast<double>(sValues);
		double dVariance = 0.0;
		for (size_t i = 0; i < sValues; i++) {
			dVariance += (vecValues[i] - dMean) * (vecValues[i] - dMean);
		}
		const double dStdDev = sqrt(dVariance / static_cast<double>(sValues));

		for (size_t i = 0; i < sValues; i++) {
			if (dStdDev < ReferenceTolerance) {
				vecNormalized[i] = 0.0;
			} else {
				vecNormalized[i] = (vecValues[i] - dMean) / dStdDev;
			}
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void ComputeEntropyWeights(
	const std::vector< std::vector<double> > & vecIndices,
	const std::vector<bool> & vecLowerIsBetter,
	std::vector<double> & vecWeights
) {
	const size_t sIndices = vecIndices.size();

	if (vecLowerIsBetter.size() != sIndices) {
		_EXCEPTION2("%lu orientations given for %lu indices",
			static_cast<unsigned long>(vecLowerIsBetter.size()),
			static_cast<unsigned long>(sIndices));
	}

	vecWeights.assign(sIndices, 0.0);
	if (sIndices == 0) {
		return;
	}

	const size_t sSamples = vecIndices[0].size();
	for (size_t j = 1; j < sIndices; j++) {
		if (vecIndices[j].size() != sSamples) {
			_EXCEPTION3("Index %lu has %lu values; expected %lu",
				static_cast<unsigned long>(j),
				static_cast<unsigned long>(vecIndices[j].size()),
				static_cast<unsigned long>(sSamples));
		}
	}

	const double dEqual = 1.0 / static_cast<double>(sIndices);

	// A single candidate does not discriminate between indices
	if (sSamples < 2) {
		vecWeights.assign(sIndices, dEqual);
		return;
	}

	const double dEntropyScale = 1.0 / log(static_cast<double>(sSamples));

	std::vector<double> vecNormalized(sSamples);

	double dTotalDivergence = 0.0;
	for (size_t j = 0; j < sIndices; j++) {
		const std::vector<double> & vecValues = vecIndices[j];

		// Min-max normalize in the direction of improvement; a constant
		// index has maximum entropy
		double dMin = vecValues[0];
		double dMax = vecValues[0];
		for (size_t i = 1; i < sSamples; i++) {
			dMin = std::min(dMin, vecValues[i]);
			dMax = std::max(dMax, vecValues[i]);
		}
		const double dRange = dMax - dMin;

		double dSum = 0.0;
		for (size_t i = 0; i < sSamples; i++) {
			if (fabs(dRange) < ReferenceTolerance) {
				vecNormalized[i] = 1.0;
			} else if (vecLowerIsBetter[j]) {
				vecNormalized[i] = (dMax - vecValues[i]) / dRange;
			} else {
				vecNormalized[i] = (vecValues[i] - dMin) / dRange;
			}
			vecNormalized[i] = std::max(0.0, std::min(1.0, vecNormalized[i]));
			dSum += vecNormalized[i];
		}

		double dEntropySum = 0.0;
		for (size_t i = 0; i < sSamples; i++) {
			double dP;
			if (fabs(dSum) < ReferenceTolerance) {
				dP = 1.0 / static_cast<double>(sSamples);
			} else {
				dP = vecNormalized[i] / dSum;
			}
			if (dP > ReferenceTolerance) {
				dEntropySum += dP * log(dP);
			}
		}

		double dEntropy = -dEntropyScale * dEntropySum;
		dEntropy = std::max(0.0, std::min(1.0, dEntropy));

		vecWeights[j] = 1.0 - dEntropy;
		dTotalDivergence += vecWeights[j];
	}

	if (fabs(dTotalDivergence) < ReferenceTolerance) {
		vecWeights.assign(sIndices, dEqual);
		return;
	}
	for (size_t j = 0; j < sIndices; j++) {
		vecWeights[j] /= dTotalDivergence;
	}
}

///////////////////////////////////////////////////////////////////////////////
