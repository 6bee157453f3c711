/*************************************************
*	PiecewiseAffine.cpp
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#include <cmath>
#include <sstream>
#include "PiecewiseAffine.h"

PiecewiseAffineBuilder::PiecewiseAffineBuilder(FirstSegmentPolicy policy)
{
	m_policy = policy;
}

PiecewiseAffineTransform PiecewiseAffineBuilder::build(const vector<AnchorPair> &anchors, AxisKind kind) const
{
	int n = (int)anchors.size();
	if (n == 0)
	{
		std::ostringstream msg;
		msg << "no " << axisName(kind) << " anchors to build a transform from";
		throw RegistrationError(ErrorCode::DimensionMismatch, msg.str());
	}

	for (int k = 0; k < n; k++)
	{
		if (!std::isfinite(anchors[k].coord1) || !std::isfinite(anchors[k].coord2))
		{
			std::ostringstream msg;
			msg << axisName(kind) << " anchor " << k << " (" << anchors[k].coord1 << " -> "
				<< anchors[k].coord2 << ") is not finite";
			throw RegistrationError(ErrorCode::NonMonotonicAnchors, msg.str());
		}
	}

	// strictly increasing coord1
	for (int k = 0; k + 1 < n; k++)
	{
		if (anchors[k].coord1 < anchors[k + 1].coord1) continue;
		if (anchors[k + 1].coord1 == anchors[k].coord1)
		{
			std::ostringstream msg;
			msg << axisName(kind) << " anchors " << k << " and " << k + 1
				<< " share the coordinate " << anchors[k].coord1 << " (landmarks "
				<< anchors[k].landmark1 << ", " << anchors[k + 1].landmark1 << ")";
			throw RegistrationError(ErrorCode::DegenerateInterval, msg.str());
		}
		std::ostringstream msg;
		msg << axisName(kind) << " anchor " << k + 1 << " (" << anchors[k + 1].coord1
			<< ") precedes anchor " << k << " (" << anchors[k].coord1 << ")";
		throw RegistrationError(ErrorCode::NonMonotonicAnchors, msg.str());
	}

	PiecewiseAffineTransform transform;
	for (int k = 0; k < n; k++)
		transform.boundaries.push_back(anchors[k].coord1);

	// interior intervals
	vector<AffineSegment> interior;
	for (int k = 0; k + 1 < n; k++)
	{
		AffineSegment seg;
		seg.scale = (anchors[k + 1].coord2 - anchors[k].coord2) / (anchors[k + 1].coord1 - anchors[k].coord1);
		seg.offset = anchors[k].coord2 - anchors[k].coord1 * seg.scale;
		interior.push_back(seg);
	}

	AffineSegment first;
	if (m_policy == FirstSegmentPolicy::ExtendFirstInterval && !interior.empty())
	{
		first = interior[0];
	}
	else
	{
		if (anchors[0].coord1 == 0)
		{
			std::ostringstream msg;
			msg << "first " << axisName(kind) << " anchor lies at the origin (landmark " << anchors[0].landmark1 << ")";
			throw RegistrationError(ErrorCode::DegenerateInterval, msg.str());
		}
		first.scale = anchors[0].coord2 / anchors[0].coord1;
		first.offset = 0;
	}

	transform.segments.push_back(first);
	transform.segments.insert(transform.segments.end(), interior.begin(), interior.end());
	transform.segments.push_back(transform.segments.back());	// unbounded tail

	return transform;
}
