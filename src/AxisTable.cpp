/*************************************************
*	AxisTable.cpp
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#include <sstream>
#include "AxisTable.h"

AxisTable::AxisTable(AxisKind kind)
{
	m_kind = kind;
}

void AxisTable::add(int axis, double coord, const vector<int> &sulci)
{
	if (hasAxis(axis))
	{
		std::ostringstream msg;
		msg << "duplicate " << axisName(m_kind) << " axis " << axis;
		throw RegistrationError(ErrorCode::ParseError, msg.str());
	}
	m_position[axis] = (int)m_axis.size();
	m_axis.push_back(axis);
	m_coord.push_back(coord);
	m_sulci[axis] = sulci;
	for (int i = 0; i < sulci.size(); i++)
		m_sulcusAxes[sulci[i]].push_back(axis);
}

AxisKind AxisTable::kind(void) const
{
	return m_kind;
}

int AxisTable::size(void) const
{
	return (int)m_axis.size();
}

const vector<double> &AxisTable::coords(void) const
{
	return m_coord;
}

int AxisTable::axis(int pos) const
{
	if (pos < 0 || pos >= size())
	{
		std::ostringstream msg;
		msg << axisName(m_kind) << " position " << pos << " is outside [0, " << size() << ")";
		throw RegistrationError(ErrorCode::IndexOutOfRange, msg.str());
	}
	return m_axis[pos];
}

const vector<int> &AxisTable::sulci(int axis) const
{
	map<int, vector<int> >::const_iterator it = m_sulci.find(axis);
	if (it == m_sulci.end())
	{
		std::ostringstream msg;
		msg << "unknown " << axisName(m_kind) << " axis " << axis;
		throw RegistrationError(ErrorCode::IndexOutOfRange, msg.str());
	}
	return it->second;
}

int AxisTable::position(int axis) const
{
	map<int, int>::const_iterator it = m_position.find(axis);
	if (it == m_position.end())
	{
		std::ostringstream msg;
		msg << "unknown " << axisName(m_kind) << " axis " << axis;
		throw RegistrationError(ErrorCode::IndexOutOfRange, msg.str());
	}
	return it->second;
}

int AxisTable::representativeAxis(int sulcus) const
{
	map<int, vector<int> >::const_iterator it = m_sulcusAxes.find(sulcus);
	if (it == m_sulcusAxes.end())
	{
		std::ostringstream msg;
		msg << "sulcus " << sulcus << " is not associated with any " << axisName(m_kind) << " axis";
		throw RegistrationError(ErrorCode::IndexOutOfRange, msg.str());
	}
	return it->second[0];
}

bool AxisTable::hasAxis(int axis) const
{
	return m_position.find(axis) != m_position.end();
}

bool AxisTable::hasSulcus(int sulcus) const
{
	return m_sulcusAxes.find(sulcus) != m_sulcusAxes.end();
}
