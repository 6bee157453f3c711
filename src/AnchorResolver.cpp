/*************************************************
*	AnchorResolver.cpp
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#include <algorithm>
#include <cmath>
#include <sstream>
#include "AnchorResolver.h"

static bool lessCoord1(const AnchorPair &a, const AnchorPair &b)
{
	return a.coord1 < b.coord1;
}

// NaN would break the ordering used by the sort
static void checkFinite(const vector<AnchorPair> &anchors, AxisKind kind)
{
	for (int i = 0; i < anchors.size(); i++)
	{
		if (!std::isfinite(anchors[i].coord1) || !std::isfinite(anchors[i].coord2))
		{
			std::ostringstream msg;
			msg << axisName(kind) << " anchor " << i << " (landmarks " << anchors[i].landmark1 << ", "
				<< anchors[i].landmark2 << ") has a non-finite coordinate";
			throw RegistrationError(ErrorCode::NonMonotonicAnchors, msg.str());
		}
	}
}

AnchorResolver::AnchorResolver(const AxisTable &axes1, const vector<double> &sphere1, const AxisTable &axes2, const vector<double> &sphere2)
	: m_axes1(axes1), m_axes2(axes2), m_sphere1(sphere1), m_sphere2(sphere2)
{
	m_kind = axes1.kind();
	if (axes2.kind() != m_kind)
		throw RegistrationError(ErrorCode::DimensionMismatch, "axis tables of different kinds cannot be paired");
	if ((size_t)axes1.size() != sphere1.size() || (size_t)axes2.size() != sphere2.size())
	{
		std::ostringstream msg;
		msg << axisName(m_kind) << " sphere coordinates do not match the axis tables ("
			<< sphere1.size() << "/" << axes1.size() << ", " << sphere2.size() << "/" << axes2.size() << ")";
		throw RegistrationError(ErrorCode::DimensionMismatch, msg.str());
	}
}

vector<AnchorPair> AnchorResolver::resolve(const CorrespondenceTable &corr) const
{
	return resolve(corr.species1(m_kind), corr.species2(m_kind));
}

vector<AnchorPair> AnchorResolver::resolve(const vector<int> &landmarks1, const vector<int> &landmarks2) const
{
	if (landmarks1.size() != landmarks2.size())
	{
		std::ostringstream msg;
		msg << axisName(m_kind) << " correspondence has " << landmarks1.size()
			<< " landmarks for species 1 but " << landmarks2.size() << " for species 2";
		throw RegistrationError(ErrorCode::DimensionMismatch, msg.str());
	}

	vector<AnchorPair> anchors;
	for (int i = 0; i < landmarks1.size(); i++)
	{
		AnchorPair anchor;
		anchor.landmark1 = landmarks1[i];
		anchor.landmark2 = landmarks2[i];
		anchor.coord1 = sphereCoord(m_axes1, m_sphere1, landmarks1[i], 1);
		anchor.coord2 = sphereCoord(m_axes2, m_sphere2, landmarks2[i], 2);
		anchors.push_back(anchor);
	}
	// table order is not trusted
	checkFinite(anchors, m_kind);
	std::stable_sort(anchors.begin(), anchors.end(), lessCoord1);

	return anchors;
}

double AnchorResolver::sphereCoord(const AxisTable &axes, const vector<double> &sphere, int sulcus, int species) const
{
	if (!axes.hasSulcus(sulcus))
	{
		std::ostringstream msg;
		msg << axisName(m_kind) << " landmark " << sulcus << " of species " << species << " has no axis";
		throw RegistrationError(ErrorCode::IndexOutOfRange, msg.str());
	}
	int id = axes.representativeAxis(sulcus);
	int pos = axes.position(id);

	return sphere[pos];
}

vector<AnchorPair> reversed(const vector<AnchorPair> &anchors, AxisKind kind)
{
	vector<AnchorPair> rev;
	for (int i = 0; i < anchors.size(); i++)
	{
		AnchorPair anchor;
		anchor.coord1 = anchors[i].coord2;
		anchor.coord2 = anchors[i].coord1;
		anchor.landmark1 = anchors[i].landmark2;
		anchor.landmark2 = anchors[i].landmark1;
		rev.push_back(anchor);
	}
	checkFinite(rev, kind);
	std::stable_sort(rev.begin(), rev.end(), lessCoord1);

	return rev;
}
