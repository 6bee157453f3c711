/*************************************************
*	SphericalProjector.h
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#pragma once

#include <vector>

using std::vector;

struct RectangleDimensions
{
	double longitude;	// length along the longitude axis
	double latitude;	// length along the latitude axis
};

struct LatitudeBand
{
	double min;
	double max;
	bool isDefault(void) const { return min == 30 && max == 150; }
};

const LatitudeBand kDefaultLatitudeBand = {30, 150};

// sphere coordinates of one species, aligned with its axis tables
struct SphereCoordinateSet
{
	vector<double> longitude;
	vector<double> latitude;
};

class SphericalProjector
{
public:
	SphericalProjector(const RectangleDimensions &dim, const LatitudeBand &band = kDefaultLatitudeBand);
	double longitude(double x) const;	// [0, 360) for x in (-L, L)
	double latitude(double y) const;	// polar caps are passed through
	SphereCoordinateSet project(const vector<double> &longitude, const vector<double> &latitude) const;

private:
	RectangleDimensions m_dim;
	LatitudeBand m_band;
};
