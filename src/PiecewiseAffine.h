/*************************************************
*	PiecewiseAffine.h
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#pragma once

#include <vector>
#include "AnchorResolver.h"

using std::vector;

// y = scale * x + offset
struct AffineSegment
{
	double scale;
	double offset;
	double operator ()(double x) const { return x * scale + offset; }
};

// N boundaries (anchor coordinates) and N + 1 segments:
// segments[0] below boundaries[0], segments[i] on [boundaries[i - 1], boundaries[i]),
// segments[N] at and beyond boundaries[N - 1]
struct PiecewiseAffineTransform
{
	vector<double> boundaries;
	vector<AffineSegment> segments;
};

enum class FirstSegmentPolicy
{
	OriginAnchored,			// line through (0, 0) and the first anchor
	ExtendFirstInterval		// reuse the segment between the first two anchors
};

class PiecewiseAffineBuilder
{
public:
	PiecewiseAffineBuilder(FirstSegmentPolicy policy = FirstSegmentPolicy::OriginAnchored);
	// anchors sorted by coord1; maps coord1 onto coord2
	PiecewiseAffineTransform build(const vector<AnchorPair> &anchors, AxisKind kind = AxisKind::Longitude) const;

private:
	FirstSegmentPolicy m_policy;
};
