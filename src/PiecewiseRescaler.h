/*************************************************
*	PiecewiseRescaler.h
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#pragma once

#include <vector>
#include "PiecewiseAffine.h"

using std::vector;

class PiecewiseRescaler
{
public:
	// kind only names the axis in error messages
	PiecewiseRescaler(const vector<AffineSegment> &segments, const vector<double> &boundaries, AxisKind kind = AxisKind::Longitude);
	PiecewiseRescaler(const PiecewiseAffineTransform &transform, AxisKind kind = AxisKind::Longitude);
	void setThreads(int nThreads);		// 0: OpenMP default
	int segment(double v) const;		// index of the segment applied to v
	double operator ()(double v) const;
	vector<double> apply(const vector<double> &values) const;

private:
	void validate(void) const;

private:
	vector<AffineSegment> m_segments;
	vector<double> m_boundaries;
	AxisKind m_kind;
	int m_nThreads;
};
