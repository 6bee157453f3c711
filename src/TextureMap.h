/*************************************************
*	TextureMap.h
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#pragma once

#include <vector>

using std::vector;

// per-vertex scalar map: one value per line in vertex order, written with 17 significant digits
namespace TextureMap
{
	vector<double> load(const char *filename);
	void save(const char *filename, const vector<double> &values);
}
