/*************************************************
*	SulcalRegistration.cpp
*
*	Release: October 2026
*
*	University of North Carolina at Chapel Hill
*	Department of Computer Science
*************************************************/

#include <sstream>
#include <stdexcept>
#include "Mesh.h"
#include "SulcalRegistration.h"
#include "AnchorResolver.h"
#include "PiecewiseRescaler.h"
#include "TextureMap.h"

SulcalRegistration::SulcalRegistration(void)
{
	m_policy = FirstSegmentPolicy::OriginAnchored;
	m_direction = WarpDirection::Species2ToSpecies1;
	m_nThreads = 0;
	m_opened = false;
	m_done = false;
	m_observer = NULL;
	m_tstart = 0;
}

void SulcalRegistration::open(const char *model1, const char *model2, const char *corr)
{
	beginStage("Loading: models");
	SpeciesModel m1 = ModelFile::loadModel(model1);
	SpeciesModel m2 = ModelFile::loadModel(model2);
	CorrespondenceTable c = ModelFile::loadCorrespondence(corr);
	endStage();

	open(m1, m2, c);
}

void SulcalRegistration::open(const SpeciesModel &model1, const SpeciesModel &model2, const CorrespondenceTable &corr)
{
	m_model1 = model1;
	m_model2 = model2;
	m_corr = corr;
	m_done = false;
	checkBands();

	beginStage("Spherical Projection");
	SphericalProjector proj1(m_model1.dim, m_model1.band);
	SphericalProjector proj2(m_model2.dim, m_model2.band);
	m_sphere1 = proj1.project(m_model1.longitude.coords(), m_model1.latitude.coords());
	m_sphere2 = proj2.project(m_model2.longitude.coords(), m_model2.latitude.coords());
	endStage();

	m_opened = true;
}

void SulcalRegistration::checkBands(void)
{
	if (!m_model1.band.isDefault() || !m_model2.band.isDefault())
	{
		std::ostringstream msg;
		msg << "Latitudes on spheres are not the default value [30, 150]: ["
			<< m_model1.band.min << ", " << m_model1.band.max << "] and ["
			<< m_model2.band.min << ", " << m_model2.band.max << "]";
		if (m_observer != NULL) m_observer->warning(msg.str());
	}
}

void SulcalRegistration::openTexture(const char *lon, const char *lat)
{
	beginStage("Loading: textures");
	vector<double> texLon = TextureMap::load(lon);
	vector<double> texLat = TextureMap::load(lat);
	endStage();

	setTexture(texLon, texLat);
}

void SulcalRegistration::setTexture(const vector<double> &lon, const vector<double> &lat)
{
	if (lon.size() != lat.size())
	{
		std::ostringstream msg;
		msg << "longitude texture has " << lon.size() << " vertices but latitude texture has " << lat.size();
		throw RegistrationError(ErrorCode::DimensionMismatch, msg.str());
	}
	m_texLon = lon;
	m_texLat = lat;
	m_done = false;
}

void SulcalRegistration::checkMesh(const char *mesh)
{
	beginStage("Loading: mesh");
	Mesh surf;
	surf.openFile(mesh);
	endStage();

	if ((size_t)surf.nVertex() != m_texLon.size())
	{
		std::ostringstream msg;
		msg << mesh << " has " << surf.nVertex() << " vertices but the textures have " << m_texLon.size();
		throw RegistrationError(ErrorCode::DimensionMismatch, msg.str());
	}
}

void SulcalRegistration::setFirstSegmentPolicy(FirstSegmentPolicy policy)
{
	m_policy = policy;
}

void SulcalRegistration::setDirection(WarpDirection direction)
{
	m_direction = direction;
}

void SulcalRegistration::setThreads(int nThreads)
{
	m_nThreads = nThreads;
}

void SulcalRegistration::setObserver(ProgressObserver *observer)
{
	m_observer = observer;
}

void SulcalRegistration::run(void)
{
	if (!m_opened)
		throw std::logic_error("SulcalRegistration::run: no models opened");
	m_done = false;

	beginStage("Anchor Resolution");
	AnchorResolver lon(m_model1.longitude, m_sphere1.longitude, m_model2.longitude, m_sphere2.longitude);
	AnchorResolver lat(m_model1.latitude, m_sphere1.latitude, m_model2.latitude, m_sphere2.latitude);
	m_anchorLon = lon.resolve(m_corr);
	m_anchorLat = lat.resolve(m_corr);
	if (m_direction == WarpDirection::Species2ToSpecies1)
	{
		m_anchorLon = reversed(m_anchorLon, AxisKind::Longitude);
		m_anchorLat = reversed(m_anchorLat, AxisKind::Latitude);
	}
	endStage();

	beginStage("Piecewise Affine Transform");
	PiecewiseAffineBuilder builder(m_policy);
	m_transLon = builder.build(m_anchorLon, AxisKind::Longitude);
	m_transLat = builder.build(m_anchorLat, AxisKind::Latitude);
	endStage();

	beginStage("Processing: longitude");
	PiecewiseRescaler rescaleLon(m_transLon, AxisKind::Longitude);
	rescaleLon.setThreads(m_nThreads);
	vector<double> newLon = rescaleLon.apply(m_texLon);
	endStage();

	beginStage("Processing: latitude");
	PiecewiseRescaler rescaleLat(m_transLat, AxisKind::Latitude);
	rescaleLat.setThreads(m_nThreads);
	vector<double> newLat = rescaleLat.apply(m_texLat);
	endStage();

	m_newLon.swap(newLon);
	m_newLat.swap(newLat);
	m_done = true;
}

void SulcalRegistration::saveTexture(const char *lon, const char *lat)
{
	requireRun();

	beginStage("Writing: textures");
	TextureMap::save(lon, m_newLon);
	TextureMap::save(lat, m_newLat);
	endStage();
}

const SphereCoordinateSet &SulcalRegistration::sphere(int species) const
{
	return (species == 1) ? m_sphere1: m_sphere2;
}

const vector<AnchorPair> &SulcalRegistration::anchors(AxisKind kind) const
{
	return (kind == AxisKind::Longitude) ? m_anchorLon: m_anchorLat;
}

const PiecewiseAffineTransform &SulcalRegistration::transform(AxisKind kind) const
{
	return (kind == AxisKind::Longitude) ? m_transLon: m_transLat;
}

const vector<double> &SulcalRegistration::texture(AxisKind kind) const
{
	requireRun();
	return (kind == AxisKind::Longitude) ? m_newLon: m_newLat;
}

void SulcalRegistration::requireRun(void) const
{
	if (!m_done)
		throw std::logic_error("SulcalRegistration: registration has not been run");
}

void SulcalRegistration::beginStage(const std::string &name)
{
	m_tstart = clock();
	if (m_observer != NULL) m_observer->stage(name);
}

void SulcalRegistration::endStage(void)
{
	double elapse = (double)(clock() - m_tstart) / CLOCKS_PER_SEC;
	if (m_observer != NULL) m_observer->done(elapse);
}
