/*************************************************
*	PiecewiseRescaler.cpp
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#include <algorithm>
#include <sstream>
#ifdef _OPENMP
#include <omp.h>
#endif
#include "PiecewiseRescaler.h"

PiecewiseRescaler::PiecewiseRescaler(const vector<AffineSegment> &segments, const vector<double> &boundaries, AxisKind kind)
	: m_segments(segments), m_boundaries(boundaries), m_kind(kind), m_nThreads(0)
{
	validate();
}

PiecewiseRescaler::PiecewiseRescaler(const PiecewiseAffineTransform &transform, AxisKind kind)
	: m_segments(transform.segments), m_boundaries(transform.boundaries), m_kind(kind), m_nThreads(0)
{
	validate();
}

void PiecewiseRescaler::validate(void) const
{
	if (m_segments.size() != m_boundaries.size() + 1)
	{
		std::ostringstream msg;
		msg << axisName(m_kind) << " transform has " << m_segments.size() << " segments for " << m_boundaries.size() << " boundaries";
		throw RegistrationError(ErrorCode::SegmentCountMismatch, msg.str());
	}
	for (int i = 0; i + 1 < m_boundaries.size(); i++)
	{
		if (!(m_boundaries[i] < m_boundaries[i + 1]))
		{
			std::ostringstream msg;
			msg << axisName(m_kind) << " boundary " << i + 1 << " (" << m_boundaries[i + 1] << ") does not exceed boundary "
				<< i << " (" << m_boundaries[i] << ")";
			throw RegistrationError(ErrorCode::NonMonotonicAnchors, msg.str());
		}
	}
}

void PiecewiseRescaler::setThreads(int nThreads)
{
	m_nThreads = nThreads;
}

int PiecewiseRescaler::segment(double v) const
{
	// number of boundaries <= v; a value on a boundary starts the next segment
	return (int)(std::upper_bound(m_boundaries.begin(), m_boundaries.end(), v) - m_boundaries.begin());
}

double PiecewiseRescaler::operator ()(double v) const
{
	return m_segments[segment(v)](v);
}

vector<double> PiecewiseRescaler::apply(const vector<double> &values) const
{
	int n = (int)values.size();
	vector<double> rescaled(n);

#ifdef _OPENMP
	int nThreads = (m_nThreads > 0) ? m_nThreads: omp_get_max_threads();
#endif
	#pragma omp parallel for num_threads(nThreads)
	for (int i = 0; i < n; i++)
		rescaled[i] = (*this)(values[i]);

	return rescaled;
}
