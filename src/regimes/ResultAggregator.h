///////////////////////////////////////////////////////////////////////////////
///
///	\file    ResultAggregator.h
///	\version October 19, 2026
///
///	<summary>
///		Merge of chunk results and the cluster model into one result row
///		per unit.
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

#ifndef _RESULTAGGREGATOR_H_
#define _RESULTAGGREGATOR_H_

#include "FeatureExtractor.h"
#include "ClusteringEngine.h"
#include "TableSink.h"
#include "UnitStatus.h"

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		The outcome for one unit.
///	</summary>
struct ResultRow {

	ResultRow() :
		sUnitId(0),
		eStatus(UnitStatus_Clustered),
		iCluster(-1),
		dDistance(0.0)
	{ }

	bool IsClustered() const {
		return (eStatus == UnitStatus_Clustered);
	}

	size_t sUnitId;

	///	<summary>
	///		Coordinate along each unit dimension.
	///	</summary>
	std::vector<double> vecCoord;

	UnitStatus eStatus;

	///	<summary>
	///		Cluster index, or -1 if unclustered.
	///	</summary>
	int iCluster;

	double dDistance;

	///	<summary>
	///		Reason a unit is unclustered.
	///	</summary>
	std::string strDetail;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Collects chunk results in unit order and tracks the status of every
///		unit through normalization and clustering.
///	</summary>
class ResultAggregator {

public:
	///	<summary>
	///		Constructor.
	///	</summary>
	explicit ResultAggregator(
		const FeatureExtractor & extractor
	);

	///	<summary>
	///		Merge the chunk results.  Units of failed chunks are marked with
	///		a chunk failure and units of unstarted chunks are left
	///		unfinished.
	///	</summary>
	void MergeChunks(
		const std::vector<ChunkResult> & vecChunks
	);

	size_t GetUnitCount() const {
		return m_vecStatus.size();
	}

	///	<summary>
	///		Raw features of every unit (zero where not extracted).
	///	</summary>
	const DataArray2D<double> & GetFeatures() const {
		return m_dFeatures;
	}

	///	<summary>
	///		Mask of units with a successfully extracted, finite feature
	///		vector.
	///	</summary>
	void GetUsableMask(
		std::vector<bool> & vecUsable
	) const;

	///	<summary>
	///		Normalize the usable features and collect the finite ones as
	///		clustering points.  Units with a non-finite component are
	///		marked as such.
	///	</summary>
	void SelectPoints(
		const FeatureScaling & scaling,
		DataArray2D<double> & dPoints
	);

	///	<summary>
	///		Number of units currently carrying the given status.
	///	</summary>
	size_t GetStatusCount(
		UnitStatus eStatus
	) const;

	///	<summary>
	///		Number of units whose chunk was not run.
	///	</summary>
	size_t GetUnfinishedCount() const;

	///	<summary>
	///		Number of clustering points selected.
	///	</summary>
	size_t GetPointCount() const {
		return m_vecPointUnit.size();
	}

	///	<summary>
	///		Unit of each clustering point.
	///	</summary>
	const std::vector<size_t> & GetPointUnits() const {
		return m_vecPointUnit;
	}

	///	<summary>
	///		Build one row per unit in unit order from the model.
	///	</summary>
	void BuildRows(
		const ClusterModel & model,
		std::vector<ResultRow> & vecRows
	) const;

	///	<summary>
	///		Build the rows of a cancelled run: one row for every unit whose
	///		chunk finished.  Units that would have been clustered are marked
	///		as cancelled; the others keep the reason they were excluded.
	///	</summary>
	void BuildCancelledRows(
		std::vector<ResultRow> & vecRows
	) const;

protected:
	///	<summary>
	///		Initialize a row with the unit identifier and coordinates.
	///	</summary>
	void InitializeRow(
		size_t sUnit,
		ResultRow & row
	) const;

private:
	const FeatureExtractor & m_extractor;

	///	<summary>
	///		Status of each unit.
	///	</summary>
	std::vector<UnitStatus> m_vecStatus;

	///	<summary>
	///		Detail of each unclustered unit.
	///	</summary>
	std::vector<std::string> m_vecDetail;

	///	<summary>
	///		Flag indicating the chunk of each unit was run.
	///	</summary>
	std::vector<bool> m_vecFinished;

	DataArray2D<double> m_dFeatures;

	///	<summary>
	///		Unit of each clustering point.
	///	</summary>
	std::vector<size_t> m_vecPointUnit;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Build the result table: unit_id, one column per unit dimension,
///		cluster_index, distance_to_centroid and status.
///	</summary>
void BuildResultTable(
	const std::vector<ResultRow> & vecRows,
	const std::vector<std::string> & vecUnitDims,
	Table & table
);

///	<summary>
///		Build the centroid summary table with centroids in physical units.
///	</summary>
void BuildCentroidTable(
	const ClusterModel & model,
	const FeatureScaling & scaling,
	const std::vector<std::string> & vecFeatureNames,
	Table & table
);

///	<summary>
///		Build the candidate score table, with the raw and normalized
///		indices and the total score of each candidate.
///	</summary>
void BuildScoreTable(
	const std::vector<CandidateScore> & vecScores,
	Table & table
);

///////////////////////////////////////////////////////////////////////////////

#endif

