/*************************************************
*	SulcalRegistration.h
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#pragma once

#include <ctime>
#include <string>
#include <vector>
#include "ModelFile.h"
#include "PiecewiseAffine.h"

using std::vector;

// progress sink owned by the caller; all methods are optional to override
class ProgressObserver
{
public:
	virtual ~ProgressObserver(void) {}
	virtual void stage(const std::string &name) {}
	virtual void done(double elapse) {}		// seconds since the last stage()
	virtual void warning(const std::string &msg) {}
};

enum class WarpDirection
{
	Species1ToSpecies2,		// species-1 textures into the species-2 frame
	Species2ToSpecies1		// species-2 textures into the species-1 frame
};

class SulcalRegistration
{
public:
	SulcalRegistration(void);
	void open(const char *model1, const char *model2, const char *corr);
	void open(const SpeciesModel &model1, const SpeciesModel &model2, const CorrespondenceTable &corr);
	void openTexture(const char *lon, const char *lat);
	void setTexture(const vector<double> &lon, const vector<double> &lat);
	void checkMesh(const char *mesh);
	void setFirstSegmentPolicy(FirstSegmentPolicy policy);
	void setDirection(WarpDirection direction);
	void setThreads(int nThreads);
	void setObserver(ProgressObserver *observer);
	void run(void);
	void saveTexture(const char *lon, const char *lat);
	const SphereCoordinateSet &sphere(int species) const;
	const vector<AnchorPair> &anchors(AxisKind kind) const;
	const PiecewiseAffineTransform &transform(AxisKind kind) const;
	const vector<double> &texture(AxisKind kind) const;		// rescaled texture

private:
	void beginStage(const std::string &name);
	void endStage(void);
	void checkBands(void);
	void requireRun(void) const;

private:
	SpeciesModel m_model1, m_model2;
	CorrespondenceTable m_corr;
	SphereCoordinateSet m_sphere1, m_sphere2;
	vector<double> m_texLon, m_texLat;			// input textures
	vector<AnchorPair> m_anchorLon, m_anchorLat;		// sorted by source coordinate
	PiecewiseAffineTransform m_transLon, m_transLat;
	vector<double> m_newLon, m_newLat;			// rescaled textures
	FirstSegmentPolicy m_policy;
	WarpDirection m_direction;
	int m_nThreads;
	bool m_opened, m_done;
	ProgressObserver *m_observer;	// not owned, may be NULL
	clock_t m_tstart;
};
