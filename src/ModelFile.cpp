/*************************************************
*	ModelFile.cpp
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include "ModelFile.h"

using std::string;

namespace
{
	class LineReader
	{
	public:
		LineReader(const char *filename): m_filename(filename), m_line(0)
		{
			m_fin.open(filename);
			if (!m_fin.is_open())
				throw RegistrationError(ErrorCode::IOError, string("cannot open ") + filename);
		}
		// next non-empty, non-comment line split into whitespace tokens
		bool next(vector<string> &tokens)
		{
			string buf;
			while (std::getline(m_fin, buf))
			{
				m_line++;
				tokens.clear();
				char *line = &buf[0];
				for (char *ptr = strtok(line, " \t\r\n"); ptr != NULL; ptr = strtok(NULL, " \t\r\n"))
					tokens.push_back(ptr);
				if (tokens.empty() || tokens[0][0] == '#') continue;
				return true;
			}
			if (m_fin.bad())
				throw RegistrationError(ErrorCode::IOError, string("read failure in ") + m_filename);
			return false;
		}
		RegistrationError error(const string &what) const
		{
			std::ostringstream msg;
			msg << m_filename << ":" << m_line << ": " << what;
			return RegistrationError(ErrorCode::ParseError, msg.str());
		}
		double toDouble(const string &token) const
		{
			char *end;
			errno = 0;
			double v = strtod(token.c_str(), &end);
			if (*end != '\0' || errno == ERANGE) throw error("'" + token + "' is not a number");
			if (!std::isfinite(v)) throw error("'" + token + "' is not a finite number");
			return v;
		}
		int toInt(const string &token) const
		{
			char *end;
			errno = 0;
			long v = strtol(token.c_str(), &end, 10);
			if (*end != '\0' || errno == ERANGE || v != (int)v) throw error("'" + token + "' is not an integer");
			return (int)v;
		}

	private:
		std::ifstream m_fin;
		string m_filename;
		int m_line;
	};
}

SpeciesModel ModelFile::loadModel(const char *filename)
{
	SpeciesModel model;
	bool hasDim = false;

	LineReader reader(filename);
	vector<string> tokens;
	while (reader.next(tokens))
	{
		const string &key = tokens[0];
		if (key == "dimRect:")
		{
			if (tokens.size() != 3) throw reader.error("dimRect expects two values");
			model.dim.longitude = reader.toDouble(tokens[1]);
			model.dim.latitude = reader.toDouble(tokens[2]);
			if (!(model.dim.longitude > 0) || !(model.dim.latitude > 0))
				throw reader.error("rectangle dimensions must be positive");
			hasDim = true;
		}
		else if (key == "latitudeRange:")
		{
			if (tokens.size() != 3) throw reader.error("latitudeRange expects two values");
			model.band.min = reader.toDouble(tokens[1]);
			model.band.max = reader.toDouble(tokens[2]);
			if (!(model.band.min < model.band.max))
				throw reader.error("latitudeRange is empty");
		}
		else if (key == "longitude:" || key == "latitude:")
		{
			if (tokens.size() < 3) throw reader.error(key + " expects an axis id and a coordinate");
			int axis = reader.toInt(tokens[1]);
			double coord = reader.toDouble(tokens[2]);
			vector<int> sulci;
			for (int i = 3; i < tokens.size(); i++)
				sulci.push_back(reader.toInt(tokens[i]));

			AxisTable &table = (key == "longitude:") ? model.longitude: model.latitude;
			if (table.hasAxis(axis))
			{
				std::ostringstream msg;
				msg << "duplicate " << axisName(table.kind()) << " axis " << axis;
				throw reader.error(msg.str());
			}
			table.add(axis, coord, sulci);
		}
		else
		{
			throw reader.error("unknown record '" + key + "'");
		}
	}
	if (!hasDim) throw RegistrationError(ErrorCode::ParseError, string(filename) + ": missing dimRect record");

	return model;
}

CorrespondenceTable ModelFile::loadCorrespondence(const char *filename)
{
	CorrespondenceTable corr;

	LineReader reader(filename);
	vector<string> tokens;
	while (reader.next(tokens))
	{
		const string &key = tokens[0];
		vector<int> *list;
		if (key == "longitude1:") list = &corr.longitude1;
		else if (key == "longitude2:") list = &corr.longitude2;
		else if (key == "latitude1:") list = &corr.latitude1;
		else if (key == "latitude2:") list = &corr.latitude2;
		else throw reader.error("unknown record '" + key + "'");

		for (int i = 1; i < tokens.size(); i++)
			list->push_back(reader.toInt(tokens[i]));
	}

	return corr;
}
