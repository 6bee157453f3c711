/*************************************************
*	RegistrationError.cpp
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#include "RegistrationError.h"

const char *axisName(AxisKind kind)
{
	switch (kind)
	{
		case AxisKind::Longitude: return "longitude";
		case AxisKind::Latitude: return "latitude";
	}
	return "unknown";
}

const char *errorName(ErrorCode code)
{
	switch (code)
	{
		case ErrorCode::DimensionMismatch: return "DimensionMismatch";
		case ErrorCode::IndexOutOfRange: return "IndexOutOfRange";
		case ErrorCode::DegenerateInterval: return "DegenerateInterval";
		case ErrorCode::SegmentCountMismatch: return "SegmentCountMismatch";
		case ErrorCode::NonMonotonicAnchors: return "NonMonotonicAnchors";
		case ErrorCode::InvalidModel: return "InvalidModel";
		case ErrorCode::ParseError: return "ParseError";
		case ErrorCode::IOError: return "IOError";
	}
	return "UnknownError";
}
