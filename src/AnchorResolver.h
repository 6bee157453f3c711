/*************************************************
*	AnchorResolver.h
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#pragma once

#include <vector>
#include "AxisTable.h"

using std::vector;

struct AnchorPair
{
	double coord1;		// sphere coordinate in species 1
	double coord2;		// sphere coordinate in species 2
	int landmark1;		// sulcus id in species 1
	int landmark2;		// sulcus id in species 2
};

class AnchorResolver
{
public:
	// sphere1/sphere2 are the sphere coordinates of axes1/axes2, position by position;
	// tables and coordinates are copied
	AnchorResolver(const AxisTable &axes1, const vector<double> &sphere1, const AxisTable &axes2, const vector<double> &sphere2);
	vector<AnchorPair> resolve(const vector<int> &landmarks1, const vector<int> &landmarks2) const;
	vector<AnchorPair> resolve(const CorrespondenceTable &corr) const;

private:
	double sphereCoord(const AxisTable &axes, const vector<double> &sphere, int sulcus, int species) const;

private:
	AxisTable m_axes1, m_axes2;
	vector<double> m_sphere1, m_sphere2;
	AxisKind m_kind;
};

// swap the roles of species 1 and 2 and re-sort by the new coord1;
// non-finite coordinates are NonMonotonicAnchors
vector<AnchorPair> reversed(const vector<AnchorPair> &anchors, AxisKind kind = AxisKind::Longitude);
