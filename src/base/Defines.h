///////////////////////////////////////////////////////////////////////////////
///
///	\file    Defines.h
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

#ifndef _DEFINES_H_
#define _DEFINES_H_

///////////////////////////////////////////////////////////////////////////////

typedef double Real;

///////////////////////////////////////////////////////////////////////////////
//
// Defines for floating point tolerance.
//
static const Real HighTolerance      = 1.0e-10;
static const Real ReferenceTolerance = 1.0e-12;

///////////////////////////////////////////////////////////////////////////////
//
// Defaults for the regime clustering run.
//
static const int DefaultChunkSize         = 1024;
static const int DefaultMaximumIterations = 100;
static const int DefaultMinimumK          = 2;
static const int DefaultMaximumK          = 6;
static const int DefaultSilhouetteSamples = 4000;

///////////////////////////////////////////////////////////////////////////////
//
// Default weights of the silhouette, Calinski-Harabasz and Davies-Bouldin
// indices in the combined score.
//
static const Real DefaultWeightSilhouette        = 0.34;
static const Real DefaultWeightCalinskiHarabasz  = 0.33;
static const Real DefaultWeightDaviesBouldin     = 0.33;

///////////////////////////////////////////////////////////////////////////////
//
// Number of attempts made to extract a chunk before its units are marked
// as failed.
//
static const int ChunkExtractionAttempts  = 2;

///////////////////////////////////////////////////////////////////////////////

#endif

