/*************************************************
*	TextureMap.cpp
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#include <cstdio>
#include <sstream>
#include <string>
#include "TextureMap.h"
#include "RegistrationError.h"

vector<double> TextureMap::load(const char *filename)
{
	FILE *fp = fopen(filename, "r");
	if (fp == NULL)
		throw RegistrationError(ErrorCode::IOError, std::string("cannot open ") + filename);

	vector<double> values;
	double v;
	int ret;
	while ((ret = fscanf(fp, "%lf", &v)) == 1)
		values.push_back(v);
	bool failed = ferror(fp) != 0;
	fclose(fp);

	if (failed)
		throw RegistrationError(ErrorCode::IOError, std::string("read failure in ") + filename);
	if (ret != EOF)
	{
		std::ostringstream msg;
		msg << filename << ": vertex " << values.size() << " is not a number";
		throw RegistrationError(ErrorCode::ParseError, msg.str());
	}

	return values;
}

void TextureMap::save(const char *filename, const vector<double> &values)
{
	FILE *fp = fopen(filename, "w");
	if (fp == NULL)
		throw RegistrationError(ErrorCode::IOError, std::string("cannot write ") + filename);
	for (int i = 0; i < values.size(); i++)
		fprintf(fp, "%.17g\n", values[i]);	// round-trips exactly
	bool failed = ferror(fp) != 0;
	if (fclose(fp) != 0 || failed)
		throw RegistrationError(ErrorCode::IOError, std::string("write failure in ") + filename);
}
