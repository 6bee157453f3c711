/*************************************************
*	ModelFile.h
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#pragma once

#include "AxisTable.h"
#include "SphericalProjector.h"

// rectangle model of one species and hemisphere side
struct SpeciesModel
{
	SpeciesModel(void): longitude(AxisKind::Longitude), latitude(AxisKind::Latitude)
	{
		dim.longitude = dim.latitude = 0;
		band = kDefaultLatitudeBand;
	}
	const AxisTable &axes(AxisKind kind) const { return kind == AxisKind::Longitude ? longitude : latitude; }

	RectangleDimensions dim;
	LatitudeBand band;
	AxisTable longitude;
	AxisTable latitude;
};

namespace ModelFile
{
	// "dimRect:", "latitudeRange:", "longitude:" and "latitude:" records; '#' starts a comment line
	SpeciesModel loadModel(const char *filename);
	// "longitude1:", "longitude2:", "latitude1:" and "latitude2:" sulcus id lists
	CorrespondenceTable loadCorrespondence(const char *filename);
}
