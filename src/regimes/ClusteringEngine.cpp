///////////////////////////////////////////////////////////////////////////////
///
///	\file    ClusteringEngine.cpp
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

#include "ClusteringEngine.h"
#include "STLStringHelper.h"
#include "Announce.h"
#include "Exception.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <random>

///////////////////////////////////////////////////////////////////////////////

InitializationMethod ParseInitializationMethod(
	const std::string & strMethod
) {
	std::string strLower = strMethod;
	STLStringHelper::ToLower(strLower);

	if (strLower == "random") {
		return InitializationMethod_Random;
	}
	if ((strLower == "kmeans++") || (strLower == "kmeanspp")) {
		return InitializationMethod_KMeansPlusPlus;
	}
	_EXCEPTION1("Unknown initialization method \"%s\" "
		"(expected \"random\" or \"kmeans++\")", strMethod.c_str());
}

///////////////////////////////////////////////////////////////////////////////

const char * InitializationMethodToString(
	InitializationMethod eMethod
) {
	if (eMethod == InitializationMethod_KMeansPlusPlus) {
		return "kmeans++";
	}
	return "random";
}

///////////////////////////////////////////////////////////////////////////////

ValidityPolicy ParseValidityPolicy(
	const std::string & strPolicy
) {
	std::string strLower = strPolicy;
	STLStringHelper::ToLower(strLower);

	if (strLower == "silhouette") {
		return ValidityPolicy_Silhouette;
	}
	if (strLower == "combined") {
		return ValidityPolicy_Combined;
	}
	_EXCEPTION1("Unknown validity policy \"%s\" "
		"(expected \"silhouette\" or \"combined\")", strPolicy.c_str());
}

///////////////////////////////////////////////////////////////////////////////

const char * ValidityPolicyToString(
	ValidityPolicy ePolicy
) {
	if (ePolicy == ValidityPolicy_Combined) {
		return "combined";
	}
	return "silhouette";
}

///////////////////////////////////////////////////////////////////////////////

ClusteringEngine::ClusteringEngine(
	const ClusteringParam & param
) :
	m_param(param),
	m_eState(ClusteringEngineState_Uninitialized)
{
	if (m_param.vecCandidateK.size() == 0) {
		_EXCEPTIONT("No candidate number of clusters given");
	}
	for (size_t c = 0; c < m_param.vecCandidateK.size(); c++) {
		if (m_param.vecCandidateK[c] < 1) {
			_EXCEPTION1("Candidate number of clusters must be positive (%i)",
				m_param.vecCandidateK[c]);
		}
	}
	if (m_param.nMaxIterations < 1) {
		_EXCEPTION1("Maximum iterations must be positive (%i)",
			m_param.nMaxIterations);
	}
	if (!(m_param.dTolerance >= 0.0)) {
		_EXCEPTION1("Tolerance must be non-negative (%1.5e)",
			m_param.dTolerance);
	}
	if (m_param.nSilhouetteSamples < 2) {
		_EXCEPTION1("Silhouette sample size must be at least 2 (%i)",
			m_param.nSilhouetteSamples);
	}
	if (!(m_param.dWeightSilhouette >= 0.0)
	 || !(m_param.dWeightCalinskiHarabasz >= 0.0)
	 || !(m_param.dWeightDaviesBouldin >= 0.0)
	) {
		_EXCEPTIONT("Index weights must be non-negative");
	}
	if (m_param.dWeightSilhouette
	  + m_param.dWeightCalinskiHarabasz
	  + m_param.dWeightDaviesBouldin <= 0.0
	) {
		_EXCEPTIONT("At least one index weight must be positive");
	}

	std::sort(m_param.vecCandidateK.begin(), m_param.vecCandidateK.end());
	m_param.vecCandidateK.erase(
		std::unique(m_param.vecCandidateK.begin(), m_param.vecCandidateK.end()),
		m_param.vecCandidateK.end());
}

///////////////////////////////////////////////////////////////////////////////

const ClusterModel & ClusteringEngine::GetModel() const {
	if (m_pmodel.get() == NULL) {
		_EXCEPTIONT("No cluster model has been produced");
	}
	return (*m_pmodel);
}

///////////////////////////////////////////////////////////////////////////////

void ClusteringEngine::InitializeCentroids(
	const DataArray2D<double> & dPoints,
	const DataArray1D<double> & dWeights,
	int nK,
	InitializationMethod eInit,
	int nSeed,
	DataArray2D<double> & dCentroids
) {
	const size_t sPoints = dPoints.GetRows();
	const size_t sFeatures = dPoints.GetColumns();
	const size_t sK = static_cast<size_t>(nK);

	if ((nK < 1) || (sPoints < sK)) {
		_INSUFFICIENTDATA2("Cannot choose %i initial centroids from %lu points",
			nK, static_cast<unsigned long>(sPoints));
	}

	// The stream depends only on the seed and k
	std::seed_seq seq{
		static_cast<unsigned int>(nSeed),
		static_cast<unsigned int>(nK)};
	std::mt19937_64 rng(seq);

	std::vector<size_t> vecChosen;
	std::vector<bool> vecUsed(sPoints, false);

	if (eInit == InitializationMethod_Random) {

		std::vector<size_t> vecOrder(sPoints);
		for (size_t i = 0; i < sPoints; i++) {
			vecOrder[i] = i;
		}
		for (size_t i = sPoints; i-- > 1;) {
			size_t j = static_cast<size_t>(rng() % (i + 1));
			std::swap(vecOrder[i], vecOrder[j]);
		}

		// Prefer points with distinct values
		for (size_t p = 0; p < sPoints; p++) {
			if (vecChosen.size() == sK) {
				break;
			}
			const size_t i = vecOrder[p];

			bool fDuplicate = false;
			for (size_t c = 0; c < vecChosen.size(); c++) {
				bool fSame = true;
				for (size_t f = 0; f < sFeatures; f++) {
					if (dPoints(i,f) != dPoints(vecChosen[c],f)) {
						fSame = false;
						break;
					}
				}
				if (fSame) {
					fDuplicate = true;
					break;
				}
			}
			if (!fDuplicate) {
				vecChosen.push_back(i);
				vecUsed[i] = true;
			}
		}

		// Fewer distinct values than k
		for (size_t p = 0; p < sPoints; p++) {
			if (vecChosen.size() == sK) {
				break;
			}
			if (!vecUsed[vecOrder[p]]) {
				vecChosen.push_back(vecOrder[p]);
				vecUsed[vecOrder[p]] = true;
			}
		}

	} else {
		std::vector<double> vecDistSq(sPoints, 0.0);

		size_t iFirst = static_cast<size_t>(rng() % sPoints);
		vecChosen.push_back(iFirst);
		vecUsed[iFirst] = true;

		for (size_t i = 0; i < sPoints; i++) {
			vecDistSq[i] = WeightedDistanceSq(
				dPoints[i], dPoints[iFirst], dWeights, sFeatures);
		}

		while (vecChosen.size() < sK) {
			double dTotal = 0.0;
			for (size_t i = 0; i < sPoints; i++) {
				if (!vecUsed[i]) {
					dTotal += vecDistSq[i];
				}
			}

			size_t iNext = sPoints;

			if (dTotal > 0.0) {
				double dU = static_cast<double>(rng() >> 11)
					* (1.0 / 9007199254740992.0) * dTotal;

				size_t iLastPositive = sPoints;
				double dCumulative = 0.0;
				for (size_t i = 0; i < sPoints; i++) {
					if (vecUsed[i] || (vecDistSq[i] <= 0.0)) {
						continue;
					}
					iLastPositive = i;
					dCumulative += vecDistSq[i];
					if (dCumulative > dU) {
						iNext = i;
						break;
					}
				}
				if (iNext == sPoints) {
					iNext = iLastPositive;
				}

			// All remaining points coincide with a chosen centroid
			} else {
				size_t sRemaining = sPoints - vecChosen.size();
				size_t sPick = static_cast<size_t>(rng() % sRemaining);
				for (size_t i = 0; i < sPoints; i++) {
					if (vecUsed[i]) {
						continue;
					}
					if (sPick == 0) {
						iNext = i;
						break;
					}
					sPick--;
				}
			}

			vecChosen.push_back(iNext);
			vecUsed[iNext] = true;

			for (size_t i = 0; i < sPoints; i++) {
				double dDistSq = WeightedDistanceSq(
					dPoints[i], dPoints[iNext], dWeights, sFeatures);
				if (dDistSq < vecDistSq[i]) {
					vecDistSq[i] = dDistSq;
				}
			}
		}
	}

	dCentroids.Allocate(sK, sFeatures);
	for (size_t c = 0; c < sK; c++) {
		for (size_t f = 0; f < sFeatures; f++) {
			dCentroids(c,f) = dPoints(vecChosen[c],f);
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

size_t ClusteringEngine::AssignPoints(
	const DataArray2D<double> & dPoints,
	const DataArray1D<double> & dWeights,
	const DataArray2D<double> & dCentroids,
	std::vector<int> & vecAssignment,
	DataArray1D<double> & dDistSq
) {
	const size_t sPoints = dPoints.GetRows();
	const size_t sFeatures = dPoints.GetColumns();
	const size_t sK = dCentroids.GetRows();

	if (vecAssignment.size() != sPoints) {
		vecAssignment.assign(sPoints, -1);
	}
	if (dDistSq.GetRows() != sPoints) {
		dDistSq.Allocate(sPoints);
	}

	size_t sChanged = 0;

	// Points are independent; only the change count is shared
#pragma omp parallel for schedule(static) reduction(+:sChanged)
	for (size_t i = 0; i < sPoints; i++) {
		int iBest = 0;
		double dBest = 0.0;
		for (size_t c = 0; c < sK; c++) {
			double dDist =
				WeightedDistanceSq(
					dPoints[i], dCentroids[c], dWeights, sFeatures);

			// Strictly closer only, so exact ties keep the lowest index
			if ((c == 0) || (dDist < dBest)) {
				iBest = static_cast<int>(c);
				dBest = dDist;
			}
		}

		if (vecAssignment[i] != iBest) {
			vecAssignment[i] = iBest;
			sChanged++;
		}
		dDistSq[i] = dBest;
	}

	return sChanged;
}

///////////////////////////////////////////////////////////////////////////////

void ClusteringEngine::UpdateCentroids(
	const DataArray2D<double> & dPoints,
	const DataArray1D<double> & dWeights,
	const std::vector<int> & vecAssignment,
	DataArray2D<double> & dCentroids
) {
	const size_t sPoints = dPoints.GetRows();
	const size_t sFeatures = dPoints.GetColumns();
	const size_t sK = dCentroids.GetRows();

	std::vector<size_t> vecCount(sK, 0);

	DataArray2D<double> dSum(sK, sFeatures);
	for (size_t i = 0; i < sPoints; i++) {
		const int iCluster = vecAssignment[i];
		vecCount[iCluster]++;
		for (size_t f = 0; f < sFeatures; f++) {
			dSum(iCluster,f) += dPoints(i,f);
		}
	}

	for (size_t c = 0; c < sK; c++) {
		if (vecCount[c] == 0) {
			continue;
		}
		for (size_t f = 0; f < sFeatures; f++) {
			dCentroids(c,f) = dSum(c,f) / static_cast<double>(vecCount[c]);
		}
	}

	// Reseed empty centroids in ascending order from the points farthest
	// from their own updated centroid
	std::vector<bool> vecUsed;
	std::vector<double> vecDistSq;

	for (size_t c = 0; c < sK; c++) {
		if (vecCount[c] != 0) {
			continue;
		}

		if (vecDistSq.size() == 0) {
			vecUsed.assign(sPoints, false);
			vecDistSq.resize(sPoints);
			for (size_t i = 0; i < sPoints; i++) {
				vecDistSq[i] = WeightedDistanceSq(
					dPoints[i], dCentroids[vecAssignment[i]],
					dWeights, sFeatures);
			}
		}

		size_t iWorst = sPoints;
		for (size_t i = 0; i < sPoints; i++) {
			if (vecUsed[i]) {
				continue;
			}
			if ((iWorst == sPoints) || (vecDistSq[i] > vecDistSq[iWorst])) {
				iWorst = i;
			}
		}
		if (iWorst == sPoints) {
			break;
		}

		vecUsed[iWorst] = true;
		for (size_t f = 0; f < sFeatures; f++) {
			dCentroids(c,f) = dPoints(iWorst,f);
		}

		Announce(2, "Reseeded empty centroid %lu from point %lu",
			static_cast<unsigned long>(c),
			static_cast<unsigned long>(iWorst));
	}
}

///////////////////////////////////////////////////////////////////////////////

void ClusteringEngine::FitK(
	const DataArray2D<double> & dPoints,
	const DataArray1D<double> & dWeights,
	int nK,
	const ClusteringParam & param,
	const CancelFlag * pcancel,
	KMeansFit & fit
) {
	const size_t sPoints = dPoints.GetRows();
	const size_t sFeatures = dPoints.GetColumns();
	const size_t sK = static_cast<size_t>(nK);

	if (dWeights.GetRows() != sFeatures) {
		_EXCEPTION2("Weight count %lu does not match feature count %lu",
			static_cast<unsigned long>(dWeights.GetRows()),
			static_cast<unsigned long>(sFeatures));
	}

	fit = KMeansFit();
	fit.nK = nK;

	InitializeCentroids(
		dPoints, dWeights, nK, param.eInit, param.nSeed, fit.dCentroids);

	DataArray1D<double> dDistSq;

	size_t sChanged =
		AssignPoints(
			dPoints, dWeights, fit.dCentroids, fit.vecAssignment, dDistSq);

	fit.nIterations = 1;

	double dDispersion = 0.0;
	for (size_t i = 0; i < sPoints; i++) {
		dDispersion += dDistSq[i];
	}
	fit.vecDispersion.push_back(dDispersion);

	// The assignment is always the last step of a pass, so the recorded
	// assignment is consistent with the final centroids
	for (;;) {
		if (fit.nIterations > 1) {
			const size_t sLast = fit.vecDispersion.size() - 1;
			const double dDecrease =
				fit.vecDispersion[sLast-1] - fit.vecDispersion[sLast];

			if ((sChanged == 0)
			 || ((param.dTolerance > 0.0)
			  && (dDecrease <= param.dTolerance * fit.vecDispersion[sLast-1]))
			) {
				fit.fConverged = true;
				break;
			}
		}
		if (fit.nIterations >= param.nMaxIterations) {
			break;
		}
		if (IsCancelled(pcancel)) {
			fit.fCancelled = true;
			break;
		}

		UpdateCentroids(dPoints, dWeights, fit.vecAssignment, fit.dCentroids);

		sChanged =
			AssignPoints(
				dPoints, dWeights, fit.dCentroids, fit.vecAssignment, dDistSq);

		fit.nIterations++;

		dDispersion = 0.0;
		for (size_t i = 0; i < sPoints; i++) {
			dDispersion += dDistSq[i];
		}
		fit.vecDispersion.push_back(dDispersion);
	}

	// Per-centroid summary
	fit.vecCount.assign(sK, 0);
	fit.vecSSE.assign(sK, 0.0);
	fit.vecEmpty.assign(sK, false);
	fit.dDistance.Allocate(sPoints);

	for (size_t i = 0; i < sPoints; i++) {
		const int iCluster = fit.vecAssignment[i];
		fit.vecCount[iCluster]++;
		fit.vecSSE[iCluster] += dDistSq[i];
		fit.dDistance[i] = sqrt(dDistSq[i]);
	}
	for (size_t c = 0; c < sK; c++) {
		fit.vecEmpty[c] = (fit.vecCount[c] == 0);
	}
}

///////////////////////////////////////////////////////////////////////////////

void ClusteringEngine::ScoreFit(
	const DataArray2D<double> & dPoints,
	const DataArray1D<double> & dWeights,
	const KMeansFit & fit,
	const std::vector<size_t> & vecSample,
	CandidateScore & score
) {
	score.nK = fit.nK;
	score.fEvaluated = true;
	score.nIterations = fit.nIterations;
	score.fConverged = fit.fConverged;

	score.dWithinSS = 0.0;
	for (size_t c = 0; c < fit.vecSSE.size(); c++) {
		score.dWithinSS += fit.vecSSE[c];
	}

	score.dSilhouette =
		ComputeSilhouette(
			dPoints, dWeights, fit.vecAssignment, fit.nK, vecSample);

	score.dValidity = 1.0 - score.dSilhouette;

	score.dCalinskiHarabasz =
		ComputeCalinskiHarabasz(
			dPoints, dWeights, fit.vecAssignment, fit.dCentroids);

	score.dDaviesBouldin =
		ComputeDaviesBouldin(
			dPoints, dWeights, fit.vecAssignment, fit.dCentroids);
}

///////////////////////////////////////////////////////////////////////////////

std::vector<double> ClusteringEngine::CombineScores(
	const ClusteringParam & param,
	std::vector<CandidateScore> & vecScores
) {
	std::vector<size_t> vecEvaluated;
	for (size_t c = 0; c < vecScores.size(); c++) {
		if (vecScores[c].fEvaluated) {
			vecEvaluated.push_back(c);
		}
	}

	// Silhouette, Calinski-Harabasz, Davies-Bouldin
	std::vector< std::vector<double> > vecIndices(
		3, std::vector<double>(vecEvaluated.size()));

	for (size_t e = 0; e < vecEvaluated.size(); e++) {
		const CandidateScore & score = vecScores[vecEvaluated[e]];
		vecIndices[0][e] = score.dSilhouette;
		vecIndices[1][e] = score.dCalinskiHarabasz;
		vecIndices[2][e] = score.dDaviesBouldin;
	}

	std::vector<bool> vecLowerIsBetter(3, false);
	vecLowerIsBetter[2] = true;

	std::vector<double> vecEntropyWeights;
	ComputeEntropyWeights(vecIndices, vecLowerIsBetter, vecEntropyWeights);

	// Entropy weights scaled by the user weights
	std::vector<double> vecUserWeights(3);
	vecUserWeights[0] = param.dWeightSilhouette;
	vecUserWeights[1] = param.dWeightCalinskiHarabasz;
	vecUserWeights[2] = param.dWeightDaviesBouldin;

	std::vector<double> vecWeights(3);
	double dWeightSum = 0.0;
	for (size_t j = 0; j < 3; j++) {
		vecWeights[j] = vecUserWeights[j] * vecEntropyWeights[j];
		dWeightSum += vecWeights[j];
	}
	if (dWeightSum <= 0.0) {
		vecWeights = vecUserWeights;
		dWeightSum = vecUserWeights[0] + vecUserWeights[1] + vecUserWeights[2];
	}
	for (size_t j = 0; j < 3; j++) {
		vecWeights[j] /= dWeightSum;
	}

	std::vector< std::vector<double> > vecNormalized(3);
	for (size_t j = 0; j < 3; j++) {
		NormalizeIndex(
			vecIndices[j],
			param.eNormalization,
			vecLowerIsBetter[j],
			vecNormalized[j]);
	}

	// Only minmax reverses Davies-Bouldin; otherwise it counts against
	// the total
	const double dSignDB =
		(param.eNormalization == ScoreNormalization_MinMax)?(1.0):(-1.0);

	for (size_t e = 0; e < vecEvaluated.size(); e++) {
		CandidateScore & score = vecScores[vecEvaluated[e]];

		score.dNormSilhouette = vecNormalized[0][e];
		score.dNormCalinskiHarabasz = vecNormalized[1][e];
		score.dNormDaviesBouldin = vecNormalized[2][e];

		score.dTotalScore =
			vecWeights[0] * score.dNormSilhouette
			+ vecWeights[1] * score.dNormCalinskiHarabasz
			+ dSignDB * vecWeights[2] * score.dNormDaviesBouldin;

		if (param.eValidity == ValidityPolicy_Combined) {
			score.dValidity = 1.0 - score.dTotalScore;
		} else {
			score.dValidity = 1.0 - score.dSilhouette;
		}
	}

	return vecWeights;
}

///////////////////////////////////////////////////////////////////////////////

bool ClusteringEngine::Fit(
	const DataArray2D<double> & dPoints,
	const DataArray1D<double> & dWeights,
	const CancelFlag * pcancel
) {
	if (m_eState != ClusteringEngineState_Uninitialized) {
		_EXCEPTIONT("ClusteringEngine has already been fit; "
			"construct a new engine to refit");
	}

	const size_t sPoints = dPoints.GetRows();
	const std::vector<int> & vecCandidateK = m_param.vecCandidateK;

	if (sPoints < static_cast<size_t>(vecCandidateK[0])) {
		_INSUFFICIENTDATA2("%lu valid feature vectors, fewer than the "
			"smallest candidate number of clusters (%i)",
			static_cast<unsigned long>(sPoints), vecCandidateK[0]);
	}
	if (dWeights.GetRows() != dPoints.GetColumns()) {
		_EXCEPTION2("Weight count %lu does not match feature count %lu",
			static_cast<unsigned long>(dWeights.GetRows()),
			static_cast<unsigned long>(dPoints.GetColumns()));
	}

	m_eState = ClusteringEngineState_CandidateSweep;

	std::vector<size_t> vecSample;
	SelectSilhouetteSample(
		sPoints,
		static_cast<size_t>(m_param.nSilhouetteSamples),
		m_param.nSeed,
		vecSample);

	m_vecScores.resize(vecCandidateK.size());
	std::vector<KMeansFit> vecFits(vecCandidateK.size());

	for (size_t c = 0; c < vecCandidateK.size(); c++) {
		m_vecScores[c].nK = vecCandidateK[c];

		if (static_cast<size_t>(vecCandidateK[c]) > sPoints) {
			Announce("k = %i exceeds the number of valid feature vectors; "
				"skipped", vecCandidateK[c]);
		}
	}

	m_eState = ClusteringEngineState_Fitting;

	// Candidate fits are independent; each iteration owns its fit and
	// score.  A single candidate leaves the threads to the assignment step.
	const size_t sCandidates = vecCandidateK.size();

	std::vector<std::exception_ptr> vecErrors(sCandidates);

#pragma omp parallel for schedule(dynamic) if(sCandidates > 1)
	for (size_t c = 0; c < sCandidates; c++) {
		const int nK = vecCandidateK[c];
		if (static_cast<size_t>(nK) > sPoints) {
			continue;
		}
		try {
			FitK(dPoints, dWeights, nK, m_param, pcancel, vecFits[c]);
			if (!vecFits[c].fCancelled) {
				ScoreFit(dPoints, dWeights, vecFits[c], vecSample, m_vecScores[c]);
			}
		} catch(...) {
			vecErrors[c] = std::current_exception();
		}
	}

	// Exceptions cannot leave the parallel region
	for (size_t c = 0; c < vecErrors.size(); c++) {
		if (vecErrors[c]) {
			std::rethrow_exception(vecErrors[c]);
		}
	}

	bool fCancelled = IsCancelled(pcancel);
	for (size_t c = 0; c < vecFits.size(); c++) {
		if (vecFits[c].fCancelled) {
			fCancelled = true;
		}
	}
	if (fCancelled) {
		m_eState = ClusteringEngineState_Finalized;
		return false;
	}

	m_eState = ClusteringEngineState_Scored;

	m_vecIndexWeights = CombineScores(m_param, m_vecScores);

	Announce("Index weights: silhouette %1.4f, Calinski-Harabasz %1.4f, "
		"Davies-Bouldin %1.4f (%s normalization)",
		m_vecIndexWeights[0],
		m_vecIndexWeights[1],
		m_vecIndexWeights[2],
		ScoreNormalizationToString(m_param.eNormalization));

	// Lowest validity; candidates are in ascending k so ties keep the
	// smaller k
	size_t iBest = vecCandidateK.size();
	for (size_t c = 0; c < vecCandidateK.size(); c++) {
		const CandidateScore & score = m_vecScores[c];
		if (!score.fEvaluated) {
			continue;
		}
		Announce("k = %i: validity %1.6f (silhouette %1.6f, "
			"Calinski-Harabasz %1.6e, Davies-Bouldin %1.6f, total %1.6f) "
			"after %i iterations%s",
			score.nK,
			score.dValidity,
			score.dSilhouette,
			score.dCalinskiHarabasz,
			score.dDaviesBouldin,
			score.dTotalScore,
			score.nIterations,
			(score.fConverged)?(""):(" (not converged)"));

		if ((iBest == vecCandidateK.size())
		 || (score.dValidity < m_vecScores[iBest].dValidity)
		) {
			iBest = c;
		}
	}
	if (iBest == vecCandidateK.size()) {
		_EXCEPTIONT("No candidate number of clusters was evaluated");
	}

	m_vecScores[iBest].fSelected = true;

	Announce("Selected k = %i by %s validity",
		m_vecScores[iBest].nK,
		ValidityPolicyToString(m_param.eValidity));

	m_pmodel.reset(new ClusterModel(vecFits[iBest], m_vecScores));

	m_eState = ClusteringEngineState_Finalized;

	return true;
}

///////////////////////////////////////////////////////////////////////////////

