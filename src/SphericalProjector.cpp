/*************************************************
*	SphericalProjector.cpp
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#include <sstream>
#include "SphericalProjector.h"
#include "RegistrationError.h"

SphericalProjector::SphericalProjector(const RectangleDimensions &dim, const LatitudeBand &band)
{
	if (!(dim.longitude > 0) || !(dim.latitude > 0))
	{
		std::ostringstream msg;
		msg << "rectangle dimensions must be positive (" << dim.longitude << ", " << dim.latitude << ")";
		throw RegistrationError(ErrorCode::InvalidModel, msg.str());
	}
	if (!(band.min < band.max))
	{
		std::ostringstream msg;
		msg << "latitude band [" << band.min << ", " << band.max << "] is empty";
		throw RegistrationError(ErrorCode::InvalidModel, msg.str());
	}
	m_dim = dim;
	m_band = band;
}

double SphericalProjector::longitude(double x) const
{
	double lon = x * 360 / m_dim.longitude;
	if (x < 0) lon += 360;
	return lon;
}

double SphericalProjector::latitude(double y) const
{
	// only the non-polar band is stretched; the caps stay where they are
	if (m_band.min < y && y < m_band.max)
		return y * (m_band.max - m_band.min) / m_dim.latitude + m_band.min;
	return y;
}

SphereCoordinateSet SphericalProjector::project(const vector<double> &longitude, const vector<double> &latitude) const
{
	SphereCoordinateSet sphere;
	sphere.longitude.reserve(longitude.size());
	sphere.latitude.reserve(latitude.size());
	for (int i = 0; i < longitude.size(); i++)
		sphere.longitude.push_back(this->longitude(longitude[i]));
	for (int i = 0; i < latitude.size(); i++)
		sphere.latitude.push_back(this->latitude(latitude[i]));

	return sphere;
}
