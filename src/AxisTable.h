/*************************************************
*	AxisTable.h
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#pragma once

#include <map>
#include <vector>
#include "RegistrationError.h"

using std::map;
using std::vector;

// Sulcal axes of one species along one axis kind, in model order.
// Filled once by the model loader and read-only afterwards.
class AxisTable
{
public:
	AxisTable(AxisKind kind = AxisKind::Longitude);
	void add(int axis, double coord, const vector<int> &sulci);	// fails on a duplicate axis id
	AxisKind kind(void) const;
	int size(void) const;
	const vector<double> &coords(void) const;
	int axis(int pos) const;
	const vector<int> &sulci(int axis) const;
	int position(int axis) const;					// axis id -> position in model order
	int representativeAxis(int sulcus) const;		// first axis associated with the sulcus
	bool hasAxis(int axis) const;
	bool hasSulcus(int sulcus) const;

private:
	AxisKind m_kind;
	vector<int> m_axis;				// position -> axis id
	vector<double> m_coord;			// position -> rectangle coordinate
	map<int, int> m_position;		// axis id -> position
	map<int, vector<int> > m_sulci;		// axis id -> sulcus ids
	map<int, vector<int> > m_sulcusAxes;	// sulcus id -> axis ids
};

// Landmark (sulcus id) correspondences between species 1 and species 2.
// Pair k of an axis kind is (species1[k], species2[k]).
struct CorrespondenceTable
{
	vector<int> longitude1, longitude2;
	vector<int> latitude1, latitude2;

	const vector<int> &species1(AxisKind kind) const { return kind == AxisKind::Longitude ? longitude1 : latitude1; }
	const vector<int> &species2(AxisKind kind) const { return kind == AxisKind::Longitude ? longitude2 : latitude2; }
};
