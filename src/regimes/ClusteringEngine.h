///////////////////////////////////////////////////////////////////////////////
///
///	\file    ClusteringEngine.h
///	\version October 19, 2026
///
///	<summary>
///		Centroid-based partitioning of feature vectors with a sweep over
///		candidate cluster counts.
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

#ifndef _CLUSTERINGENGINE_H_
#define _CLUSTERINGENGINE_H_

#include "DataArray1D.h"
#include "DataArray2D.h"
#include "CancelFlag.h"
#include "ValidityScores.h"
#include "Defines.h"

#include <memory>
#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Method used to choose the initial centroids.
///	</summary>
enum InitializationMethod {
	InitializationMethod_Random,
	InitializationMethod_KMeansPlusPlus
};

///	<summary>
///		Parse "random" or "kmeans++".
///	</summary>
InitializationMethod ParseInitializationMethod(
	const std::string & strMethod
);

///	<summary>
///		Name of an initialization method.
///	</summary>
const char * InitializationMethodToString(
	InitializationMethod eMethod
);

///	<summary>
///		Score minimized when selecting the number of clusters.
///	</summary>
enum ValidityPolicy {
	ValidityPolicy_Silhouette,
	ValidityPolicy_Combined
};

///	<summary>
///		Parse "silhouette" or "combined".
///	</summary>
ValidityPolicy ParseValidityPolicy(
	const std::string & strPolicy
);

const char * ValidityPolicyToString(
	ValidityPolicy ePolicy
);

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Configuration of the clustering engine.
///	</summary>
struct ClusteringParam {

	ClusteringParam() :
		nMaxIterations(DefaultMaximumIterations),
		dTolerance(0.0),
		nSeed(0),
		eInit(InitializationMethod_Random),
		nSilhouetteSamples(DefaultSilhouetteSamples),
		eValidity(ValidityPolicy_Silhouette),
		eNormalization(ScoreNormalization_Probability),
		dWeightSilhouette(DefaultWeightSilhouette),
		dWeightCalinskiHarabasz(DefaultWeightCalinskiHarabasz),
		dWeightDaviesBouldin(DefaultWeightDaviesBouldin)
	{ }

	///	<summary>
	///		Candidate numbers of clusters (a single entry for a fixed k).
	///	</summary>
	std::vector<int> vecCandidateK;

	///	<summary>
	///		Maximum number of assignment passes per fit.
	///	</summary>
	int nMaxIterations;

	///	<summary>
	///		A pass whose relative decrease in dispersion does not exceed
	///		this tolerance ends the fit as converged.  Zero requires that
	///		no assignment changes.
	///	</summary>
	double dTolerance;

	int nSeed;

	InitializationMethod eInit;

	///	<summary>
	///		Maximum number of points used to evaluate the silhouette.
	///	</summary>
	int nSilhouetteSamples;

	ValidityPolicy eValidity;

	///	<summary>
	///		Normalization of each index across the candidates.
	///	</summary>
	ScoreNormalization eNormalization;

	///	<summary>
	///		User weights of the indices in the combined score, applied on
	///		top of the entropy weights.
	///	</summary>
	double dWeightSilhouette;

	double dWeightCalinskiHarabasz;

	double dWeightDaviesBouldin;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Outcome of a single fit with a fixed number of clusters.
///	</summary>
struct KMeansFit {

	KMeansFit() :
		nK(0),
		nIterations(0),
		fConverged(false),
		fCancelled(false)
	{ }

	int nK;

	///	<summary>
	///		Centroids in the clustering (normalized) feature space.
	///	</summary>
	DataArray2D<double> dCentroids;

	///	<summary>
	///		Centroid index of each point.
	///	</summary>
	std::vector<int> vecAssignment;

	///	<summary>
	///		Distance of each point to its centroid.
	///	</summary>
	DataArray1D<double> dDistance;

	///	<summary>
	///		Number of members of each centroid.
	///	</summary>
	std::vector<size_t> vecCount;

	///	<summary>
	///		Sum of squared member distances of each centroid.
	///	</summary>
	std::vector<double> vecSSE;

	///	<summary>
	///		Flag indicating a centroid was left without members.
	///	</summary>
	std::vector<bool> vecEmpty;

	///	<summary>
	///		Total within-cluster dispersion after every assignment pass.
	///	</summary>
	std::vector<double> vecDispersion;

	int nIterations;

	bool fConverged;

	bool fCancelled;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Scores of one candidate number of clusters.
///	</summary>
struct CandidateScore {

	CandidateScore() :
		nK(0),
		fEvaluated(false),
		dValidity(0.0),
		dSilhouette(0.0),
		dCalinskiHarabasz(0.0),
		dDaviesBouldin(0.0),
		dNormSilhouette(0.0),
		dNormCalinskiHarabasz(0.0),
		dNormDaviesBouldin(0.0),
		dTotalScore(0.0),
		dWithinSS(0.0),
		nIterations(0),
		fConverged(false),
		fSelected(false)
	{ }

	int nK;

	///	<summary>
	///		false if k exceeded the number of valid points.
	///	</summary>
	bool fEvaluated;

	///	<summary>
	///		One minus the mean silhouette, or one minus the total score
	///		under the combined policy; lower is better.
	///	</summary>
	double dValidity;

	double dSilhouette;

	double dCalinskiHarabasz;

	double dDaviesBouldin;

	///	<summary>
	///		Indices normalized across the evaluated candidates.
	///	</summary>
	double dNormSilhouette;

	double dNormCalinskiHarabasz;

	double dNormDaviesBouldin;

	///	<summary>
	///		Weighted combination of the normalized indices; higher is better.
	///	</summary>
	double dTotalScore;

	double dWithinSS;

	int nIterations;

	bool fConverged;

	bool fSelected;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		The selected partition.  Immutable once constructed.
///	</summary>
class ClusterModel {

public:
	ClusterModel(
		const KMeansFit & fit,
		const std::vector<CandidateScore> & vecScores
	) :
		m_fit(fit),
		m_vecScores(vecScores)
	{ }

	int GetK() const {
		return m_fit.nK;
	}

	///	<summary>
	///		Centroids (k x F) in the clustering feature space.
	///	</summary>
	const DataArray2D<double> & GetCentroids() const {
		return m_fit.dCentroids;
	}

	size_t GetPointCount() const {
		return m_fit.vecAssignment.size();
	}

	int GetAssignment(size_t i) const {
		return m_fit.vecAssignment[i];
	}

	double GetDistance(size_t i) const {
		return m_fit.dDistance[i];
	}

	size_t GetCount(int c) const {
		return m_fit.vecCount[c];
	}

	double GetSSE(int c) const {
		return m_fit.vecSSE[c];
	}

	bool IsEmpty(int c) const {
		return m_fit.vecEmpty[c];
	}

	int GetIterations() const {
		return m_fit.nIterations;
	}

	bool IsConverged() const {
		return m_fit.fConverged;
	}

	const std::vector<double> & GetDispersionHistory() const {
		return m_fit.vecDispersion;
	}

	///	<summary>
	///		Scores of every candidate, in ascending k.
	///	</summary>
	const std::vector<CandidateScore> & GetScores() const {
		return m_vecScores;
	}

private:
	const KMeansFit m_fit;

	const std::vector<CandidateScore> m_vecScores;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		States of the clustering engine.
///	</summary>
enum ClusteringEngineState {
	ClusteringEngineState_Uninitialized,
	ClusteringEngineState_CandidateSweep,
	ClusteringEngineState_Fitting,
	ClusteringEngineState_Scored,
	ClusteringEngineState_Finalized
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Fits a ClusterModel to a set of feature vectors.  An engine fits
///		once; refitting requires a new engine.
///	</summary>
class ClusteringEngine {

public:
	///	<summary>
	///		Constructor.  Throws an Exception for an invalid configuration.
	///	</summary>
	explicit ClusteringEngine(
		const ClusteringParam & param
	);

	ClusteringEngineState GetState() const {
		return m_eState;
	}

	const ClusteringParam & GetParam() const {
		return m_param;
	}

	///	<summary>
	///		Fit every candidate and select the best.  Points are rows of
	///		dPoints; dWeights scales each component of the squared distance.
	///		Throws InsufficientDataError if there are fewer points than the
	///		smallest candidate k.
	///	</summary>
	///	<returns>
	///		false if the fit was cancelled; no model is produced.
	///	</returns>
	bool Fit(
		const DataArray2D<double> & dPoints,
		const DataArray1D<double> & dWeights,
		const CancelFlag * pcancel
	);

	///	<summary>
	///		true once a model has been selected.
	///	</summary>
	bool HasModel() const {
		return (m_pmodel.get() != NULL);
	}

	///	<summary>
	///		The selected model.  Throws if no model exists.
	///	</summary>
	const ClusterModel & GetModel() const;

	///	<summary>
	///		Scores of every candidate, in ascending k.
	///	</summary>
	const std::vector<CandidateScore> & GetScores() const {
		return m_vecScores;
	}

	///	<summary>
	///		Weights of the silhouette, Calinski-Harabasz and Davies-Bouldin
	///		indices in the total score.
	///	</summary>
	const std::vector<double> & GetIndexWeights() const {
		return m_vecIndexWeights;
	}

public:
	///	<summary>
	///		Choose nK distinct initial centroids from the points.
	///	</summary>
	static void InitializeCentroids(
		const DataArray2D<double> & dPoints,
		const DataArray1D<double> & dWeights,
		int nK,
		InitializationMethod eInit,
		int nSeed,
		DataArray2D<double> & dCentroids
	);

	///	<summary>
	///		Assign every point to its nearest centroid, exact ties to the
	///		lowest centroid index.
	///	</summary>
	///	<returns>
	///		Number of points whose assignment changed.
	///	</returns>
	static size_t AssignPoints(
		const DataArray2D<double> & dPoints,
		const DataArray1D<double> & dWeights,
		const DataArray2D<double> & dCentroids,
		std::vector<int> & vecAssignment,
		DataArray1D<double> & dDistSq
	);

	///	<summary>
	///		Fit a fixed number of clusters.
	///	</summary>
	static void FitK(
		const DataArray2D<double> & dPoints,
		const DataArray1D<double> & dWeights,
		int nK,
		const ClusteringParam & param,
		const CancelFlag * pcancel,
		KMeansFit & fit
	);

	///	<summary>
	///		Evaluate the validity indices of a completed fit.
	///	</summary>
	static void ScoreFit(
		const DataArray2D<double> & dPoints,
		const DataArray1D<double> & dWeights,
		const KMeansFit & fit,
		const std::vector<size_t> & vecSample,
		CandidateScore & score
	);

	///	<summary>
	///		Normalize the indices of the evaluated candidates, weight them
	///		and fill in the total score and the validity of each.
	///	</summary>
	///	<returns>
	///		Weights of the three indices.
	///	</returns>
	static std::vector<double> CombineScores(
		const ClusteringParam & param,
		std::vector<CandidateScore> & vecScores
	);

protected:
	///	<summary>
	///		Recompute each centroid as the mean of its members and reseed
	///		centroids without members from the worst-fit points.
	///	</summary>
	static void UpdateCentroids(
		const DataArray2D<double> & dPoints,
		const DataArray1D<double> & dWeights,
		const std::vector<int> & vecAssignment,
		DataArray2D<double> & dCentroids
	);

private:
	///	<summary>
	///		Configuration, with candidates sorted and unique.
	///	</summary>
	ClusteringParam m_param;

	ClusteringEngineState m_eState;

	std::vector<CandidateScore> m_vecScores;

	std::vector<double> m_vecIndexWeights;

	std::unique_ptr<ClusterModel> m_pmodel;
};

///////////////////////////////////////////////////////////////////////////////

#endif

