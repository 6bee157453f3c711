/*************************************************
*	RegistrationError.h
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#pragma once

#include <stdexcept>
#include <string>

enum class AxisKind { Longitude, Latitude };

enum class ErrorCode
{
	DimensionMismatch,		// sequence lengths disagree
	IndexOutOfRange,		// sulcus/axis id does not resolve
	DegenerateInterval,		// zero-width interval between anchors
	SegmentCountMismatch,	// #segments != #boundaries + 1
	NonMonotonicAnchors,	// anchors/boundaries not strictly increasing
	InvalidModel,			// rectangle or latitude band out of domain
	ParseError,				// malformed model/correspondence/texture file
	IOError					// file cannot be opened
};

const char *axisName(AxisKind kind);
const char *errorName(ErrorCode code);

// what() is prefixed with the error name, e.g. "IndexOutOfRange: ..."
class RegistrationError: public std::runtime_error
{
public:
	RegistrationError(ErrorCode code, const std::string &msg): std::runtime_error(std::string(errorName(code)) + ": " + msg), m_code(code) {}
	ErrorCode code(void) const { return m_code; }

private:
	ErrorCode m_code;
};
