///////////////////////////////////////////////////////////////////////////////
///
///	\file    ResultAggregator.cpp
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

#include "ResultAggregator.h"
#include "Exception.h"

#include <cmath>

///////////////////////////////////////////////////////////////////////////////

ResultAggregator::ResultAggregator(
	const FeatureExtractor & extractor
) :
	m_extractor(extractor),
	m_vecStatus(extractor.GetUnitCount(), UnitStatus_Cancelled),
	m_vecDetail(extractor.GetUnitCount()),
	m_vecFinished(extractor.GetUnitCount(), false)
{
	m_dFeatures.Allocate(extractor.GetUnitCount(), extractor.GetFeatureCount());
}

///////////////////////////////////////////////////////////////////////////////

void ResultAggregator::MergeChunks(
	const std::vector<ChunkResult> & vecChunks
) {
	const size_t sUnits = m_vecStatus.size();
	const size_t sFeatures = m_extractor.GetFeatureCount();

	for (size_t c = 0; c < vecChunks.size(); c++) {
		const ChunkResult & chunk = vecChunks[c];

		if ((chunk.sEnd > sUnits) || (chunk.sBegin > chunk.sEnd)) {
			_EXCEPTION3("Chunk %lu range [%lu, %lu) outside the unit axis",
				static_cast<unsigned long>(chunk.sChunk),
				static_cast<unsigned long>(chunk.sBegin),
				static_cast<unsigned long>(chunk.sEnd));
		}

		if (chunk.fCancelled) {
			continue;
		}

		for (size_t i = 0; i < chunk.GetUnitCount(); i++) {
			const size_t sUnit = chunk.sBegin + i;

			m_vecFinished[sUnit] = true;

			if (chunk.fFailed) {
				m_vecStatus[sUnit] = UnitStatus_ChunkFailure;
				m_vecDetail[sUnit] = chunk.strFailure;
				continue;
			}

			if (chunk.vecError[i] != ExtractionError_None) {
				m_vecStatus[sUnit] = UnitStatus_ExtractionFailure;
				m_vecDetail[sUnit] = chunk.vecErrorDetail[i];
				continue;
			}

			m_vecStatus[sUnit] = UnitStatus_Clustered;
			for (size_t f = 0; f < sFeatures; f++) {
				m_dFeatures(sUnit,f) = chunk.dFeatures(i,f);
			}
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void ResultAggregator::GetUsableMask(
	std::vector<bool> & vecUsable
) const {
	const size_t sFeatures = m_dFeatures.GetColumns();

	vecUsable.assign(m_vecStatus.size(), false);
	for (size_t u = 0; u < m_vecStatus.size(); u++) {
		if (m_vecStatus[u] != UnitStatus_Clustered) {
			continue;
		}
		bool fFinite = true;
		for (size_t f = 0; f < sFeatures; f++) {
			if (!std::isfinite(m_dFeatures(u,f))) {
				fFinite = false;
				break;
			}
		}
		vecUsable[u] = fFinite;
	}
}

///////////////////////////////////////////////////////////////////////////////

void ResultAggregator::SelectPoints(
	const FeatureScaling & scaling,
	DataArray2D<double> & dPoints
) {
	const size_t sFeatures = m_dFeatures.GetColumns();

	if (scaling.GetFeatureCount() != sFeatures) {
		_EXCEPTION2("Scaling has %lu components but features have %lu",
			static_cast<unsigned long>(scaling.GetFeatureCount()),
			static_cast<unsigned long>(sFeatures));
	}

	std::vector<double> vecRow(sFeatures);

	m_vecPointUnit.clear();
	for (size_t u = 0; u < m_vecStatus.size(); u++) {
		if (m_vecStatus[u] != UnitStatus_Clustered) {
			continue;
		}

		for (size_t f = 0; f < sFeatures; f++) {
			vecRow[f] = m_dFeatures(u,f);
		}
		scaling.Normalize(&(vecRow[0]));

		bool fFinite = true;
		for (size_t f = 0; f < sFeatures; f++) {
			if (!std::isfinite(vecRow[f])) {
				fFinite = false;
				m_vecDetail[u] = m_extractor.GetFeatureNames()[f];
				break;
			}
		}
		if (!fFinite) {
			m_vecStatus[u] = UnitStatus_NonFiniteFeature;
			continue;
		}

		m_vecPointUnit.push_back(u);
	}

	dPoints.Allocate(m_vecPointUnit.size(), sFeatures);
	for (size_t p = 0; p < m_vecPointUnit.size(); p++) {
		for (size_t f = 0; f < sFeatures; f++) {
			dPoints(p,f) = m_dFeatures(m_vecPointUnit[p],f);
		}
		scaling.Normalize(dPoints[p]);
	}
}

///////////////////////////////////////////////////////////////////////////////

size_t ResultAggregator::GetStatusCount(
	UnitStatus eStatus
) const {
	size_t sCount = 0;
	for (size_t u = 0; u < m_vecStatus.size(); u++) {
		if (m_vecFinished[u] && (m_vecStatus[u] == eStatus)) {
			sCount++;
		}
	}
	return sCount;
}

///////////////////////////////////////////////////////////////////////////////

size_t ResultAggregator::GetUnfinishedCount() const {
	size_t sCount = 0;
	for (size_t u = 0; u < m_vecFinished.size(); u++) {
		if (!m_vecFinished[u]) {
			sCount++;
		}
	}
	return sCount;
}

///////////////////////////////////////////////////////////////////////////////

void ResultAggregator::InitializeRow(
	size_t sUnit,
	ResultRow & row
) const {
	ReductionUnit unit;
	m_extractor.ResolveUnit(sUnit, unit);

	row = ResultRow();
	row.sUnitId = sUnit;
	row.vecCoord = unit.vecCoord;
	row.eStatus = m_vecStatus[sUnit];
	row.strDetail = m_vecDetail[sUnit];
}

///////////////////////////////////////////////////////////////////////////////

void ResultAggregator::BuildRows(
	const ClusterModel & model,
	std::vector<ResultRow> & vecRows
) const {
	if (model.GetPointCount() != m_vecPointUnit.size()) {
		_EXCEPTION2("Model has %lu points but %lu were selected",
			static_cast<unsigned long>(model.GetPointCount()),
			static_cast<unsigned long>(m_vecPointUnit.size()));
	}
	if (GetUnfinishedCount() != 0) {
		_EXCEPTION1("%lu units were not extracted",
			static_cast<unsigned long>(GetUnfinishedCount()));
	}

	vecRows.resize(m_vecStatus.size());
	for (size_t u = 0; u < m_vecStatus.size(); u++) {
		InitializeRow(u, vecRows[u]);
	}

	for (size_t p = 0; p < m_vecPointUnit.size(); p++) {
		ResultRow & row = vecRows[m_vecPointUnit[p]];
		row.iCluster = model.GetAssignment(p);
		row.dDistance = model.GetDistance(p);
	}
}

///////////////////////////////////////////////////////////////////////////////

void ResultAggregator::BuildCancelledRows(
	std::vector<ResultRow> & vecRows
) const {
	vecRows.clear();
	for (size_t u = 0; u < m_vecStatus.size(); u++) {
		if (!m_vecFinished[u]) {
			continue;
		}
		vecRows.push_back(ResultRow());
		InitializeRow(u, vecRows.back());
		if (m_vecStatus[u] == UnitStatus_Clustered) {
			vecRows.back().eStatus = UnitStatus_Cancelled;
		}
	}
}

///////////////////////////////////////////////////////////////////////////////

void BuildResultTable(
	const std::vector<ResultRow> & vecRows,
	const std::vector<std::string> & vecUnitDims,
	Table & table
) {
	table = Table();
	table.vecColumns.push_back("unit_id");
	for (size_t d = 0; d < vecUnitDims.size(); d++) {
		table.vecColumns.push_back(vecUnitDims[d]);
	}
	table.vecColumns.push_back("cluster_index");
	table.vecColumns.push_back("distance_to_centroid");
	table.vecColumns.push_back("status");

	std::vector<std::string> vecFields;
	for (size_t r = 0; r < vecRows.size(); r++) {
		const ResultRow & row = vecRows[r];

		if (row.vecCoord.size() != vecUnitDims.size()) {
			_EXCEPTION2("Row for unit %lu has %lu coordinates",
				static_cast<unsigned long>(row.sUnitId),
				static_cast<unsigned long>(row.vecCoord.size()));
		}

		vecFields.clear();
		vecFields.push_back(FormatTableInteger(static_cast<long>(row.sUnitId)));
		for (size_t d = 0; d < row.vecCoord.size(); d++) {
			vecFields.push_back(FormatTableReal(row.vecCoord[d]));
		}
		if (row.IsClustered()) {
			vecFields.push_back(FormatTableInteger(row.iCluster));
			vecFields.push_back(FormatTableReal(row.dDistance, "%.8g"));
		} else {
			vecFields.push_back("");
			vecFields.push_back("");
		}
		vecFields.push_back(UnitStatusToString(row.eStatus));

		table.AddRow(vecFields);
	}
}

///////////////////////////////////////////////////////////////////////////////

void BuildCentroidTable(
	const ClusterModel & model,
	const FeatureScaling & scaling,
	const std::vector<std::string> & vecFeatureNames,
	Table & table
) {
	const DataArray2D<double> & dCentroids = model.GetCentroids();
	const size_t sFeatures = dCentroids.GetColumns();

	if (vecFeatureNames.size() != sFeatures) {
		_EXCEPTION2("%lu feature names given for %lu features",
			static_cast<unsigned long>(vecFeatureNames.size()),
			static_cast<unsigned long>(sFeatures));
	}

	table = Table();
	table.vecColumns.push_back("cluster_index");
	table.vecColumns.push_back("count");
	table.vecColumns.push_back("sse");
	for (size_t f = 0; f < sFeatures; f++) {
		table.vecColumns.push_back(vecFeatureNames[f]);
	}

	std::vector<double> vecCentroid(sFeatures);
	std::vector<std::string> vecFields;

	for (int c = 0; c < model.GetK(); c++) {
		for (size_t f = 0; f < sFeatures; f++) {
			vecCentroid[f] = dCentroids(c,f);
		}
		scaling.Denormalize(&(vecCentroid[0]));

		vecFields.clear();
		vecFields.push_back(FormatTableInteger(c));
		vecFields.push_back(
			FormatTableInteger(static_cast<long>(model.GetCount(c))));
		vecFields.push_back(FormatTableReal(model.GetSSE(c), "%.8g"));
		for (size_t f = 0; f < sFeatures; f++) {
			vecFields.push_back(FormatTableReal(vecCentroid[f]));
		}
		table.AddRow(vecFields);
	}
}

///////////////////////////////////////////////////////////////////////////////

void BuildScoreTable(
	const std::vector<CandidateScore> & vecScores,
	Table & table
) {
	table = Table();
	table.vecColumns.push_back("k");
	table.vecColumns.push_back("validity");
	table.vecColumns.push_back("silhouette");
	table.vecColumns.push_back("calinski_harabasz");
	table.vecColumns.push_back("davies_bouldin");
	table.vecColumns.push_back("silhouette_norm");
	table.vecColumns.push_back("calinski_harabasz_norm");
	table.vecColumns.push_back("davies_bouldin_norm");
	table.vecColumns.push_back("total_score");
	table.vecColumns.push_back("within_ss");
	table.vecColumns.push_back("iterations");
	table.vecColumns.push_back("converged");
	table.vecColumns.push_back("selected");

	std::vector<std::string> vecFields;
	for (size_t s = 0; s < vecScores.size(); s++) {
		const CandidateScore & score = vecScores[s];

		vecFields.clear();
		vecFields.push_back(FormatTableInteger(score.nK));

		// Candidates that were not evaluated carry empty scores
		if (score.fEvaluated) {
			vecFields.push_back(FormatTableReal(score.dValidity, "%.8g"));
			vecFields.push_back(FormatTableReal(score.dSilhouette, "%.8g"));
			vecFields.push_back(FormatTableReal(score.dCalinskiHarabasz, "%.8g"));
			vecFields.push_back(FormatTableReal(score.dDaviesBouldin, "%.8g"));
			vecFields.push_back(FormatTableReal(score.dNormSilhouette, "%.8g"));
			vecFields.push_back(FormatTableReal(score.dNormCalinskiHarabasz, "%.8g"));
			vecFields.push_back(FormatTableReal(score.dNormDaviesBouldin, "%.8g"));
			vecFields.push_back(FormatTableReal(score.dTotalScore, "%.8g"));
			vecFields.push_back(FormatTableReal(score.dWithinSS, "%.8g"));
			vecFields.push_back(FormatTableInteger(score.nIterations));
			vecFields.push_back((score.fConverged)?("true"):("false"));
		} else {
			for (int i = 0; i < 10; i++) {
				vecFields.push_back("");
			}
			vecFields.push_back("false");
		}
		vecFields.push_back((score.fSelected)?("true"):("false"));

		table.AddRow(vecFields);
	}
}

///////////////////////////////////////////////////////////////////////////////

