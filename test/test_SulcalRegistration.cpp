#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include "SulcalRegistration.h"
#include "TextureMap.h"

namespace {

// Species 1: rectangle (100, 50); species 2: rectangle (200, 80).
// Longitude anchors land on the sphere at 10 -> 30 and 40 -> 90,
// latitude anchors at 114 -> 90 and 138 -> 120.
SpeciesModel species1() {
    SpeciesModel model;
    model.dim.longitude = 100;
    model.dim.latitude = 50;
    model.longitude.add(1, 100.0 / 36, {1});
    model.longitude.add(2, 100.0 / 9, {2});
    model.latitude.add(1, 35, {5});
    model.latitude.add(2, 45, {6});
    return model;
}

SpeciesModel species2() {
    SpeciesModel model;
    model.dim.longitude = 200;
    model.dim.latitude = 80;
    model.longitude.add(10, 50, {12});
    model.longitude.add(11, 50.0 / 3, {11});
    model.latitude.add(10, 40, {15});
    model.latitude.add(11, 60, {16});
    return model;
}

CorrespondenceTable correspondence() {
    CorrespondenceTable corr;
    corr.longitude1 = {2, 1};
    corr.longitude2 = {12, 11};
    corr.latitude1 = {5, 6};
    corr.latitude2 = {15, 16};
    return corr;
}

class RecordingObserver : public ProgressObserver {
public:
    void stage(const std::string& name) override { stages.push_back(name); }
    void done(double elapse) override { timings++; }
    void warning(const std::string& msg) override { warnings.push_back(msg); }

    std::vector<std::string> stages, warnings;
    int timings = 0;
};

}  // namespace

TEST(SulcalRegistrationTest, ProjectsBothSpecies) {
    SulcalRegistration reg;
    reg.open(species1(), species2(), correspondence());

    EXPECT_NEAR(10.0, reg.sphere(1).longitude[0], 1e-9);
    EXPECT_NEAR(40.0, reg.sphere(1).longitude[1], 1e-9);
    EXPECT_NEAR(90.0, reg.sphere(2).longitude[0], 1e-9);
    EXPECT_NEAR(30.0, reg.sphere(2).longitude[1], 1e-9);
    EXPECT_DOUBLE_EQ(114.0, reg.sphere(1).latitude[0]);
    EXPECT_DOUBLE_EQ(120.0, reg.sphere(2).latitude[1]);
}

TEST(SulcalRegistrationTest, Species1TexturesIntoSpecies2Frame) {
    SulcalRegistration reg;
    reg.open(species1(), species2(), correspondence());
    reg.setDirection(WarpDirection::Species1ToSpecies2);
    reg.setTexture({25, 5, 40, 200}, {126, 20, 138, 170});
    reg.run();

    const std::vector<double>& lon = reg.texture(AxisKind::Longitude);
    ASSERT_EQ(4u, lon.size());
    EXPECT_NEAR(60.0, lon[0], 1e-9);
    EXPECT_NEAR(15.0, lon[1], 1e-9);
    EXPECT_NEAR(90.0, lon[2], 1e-9);
    EXPECT_NEAR(410.0, lon[3], 1e-9);

    // [114, 138) -> scale 1.25, offset -52.5
    const std::vector<double>& lat = reg.texture(AxisKind::Latitude);
    ASSERT_EQ(4u, lat.size());
    EXPECT_NEAR(105.0, lat[0], 1e-9);
    EXPECT_NEAR(20.0 * 90 / 114, lat[1], 1e-9);
    EXPECT_NEAR(120.0, lat[2], 1e-9);
    EXPECT_NEAR(170.0 * 1.25 - 52.5, lat[3], 1e-9);

    const PiecewiseAffineTransform& t = reg.transform(AxisKind::Longitude);
    ASSERT_EQ(3u, t.segments.size());
    EXPECT_NEAR(2.0, t.segments[1].scale, 1e-12);
    EXPECT_NEAR(10.0, t.segments[1].offset, 1e-9);
}

TEST(SulcalRegistrationTest, Species2TexturesIntoSpecies1Frame) {
    SulcalRegistration reg;
    reg.open(species1(), species2(), correspondence());
    reg.setTexture({60, 15, 90}, {105, 90, 120});
    reg.run();

    // boundaries are species-2 coordinates
    const std::vector<AnchorPair>& anchors = reg.anchors(AxisKind::Longitude);
    ASSERT_EQ(2u, anchors.size());
    EXPECT_NEAR(30.0, anchors[0].coord1, 1e-9);
    EXPECT_EQ(11, anchors[0].landmark1);

    const std::vector<double>& lon = reg.texture(AxisKind::Longitude);
    EXPECT_NEAR(25.0, lon[0], 1e-9);
    EXPECT_NEAR(5.0, lon[1], 1e-9);
    EXPECT_NEAR(40.0, lon[2], 1e-9);

    const std::vector<double>& lat = reg.texture(AxisKind::Latitude);
    EXPECT_NEAR(126.0, lat[0], 1e-9);
    EXPECT_NEAR(114.0, lat[1], 1e-9);
    EXPECT_NEAR(138.0, lat[2], 1e-9);
}

TEST(SulcalRegistrationTest, MalformedCorrespondenceAborts) {
    CorrespondenceTable corr = correspondence();
    corr.latitude2.push_back(15);

    SulcalRegistration reg;
    reg.open(species1(), species2(), corr);
    reg.setTexture({25}, {126});
    try {
        reg.run();
        FAIL() << "expected DimensionMismatch";
    } catch (const RegistrationError& e) {
        EXPECT_EQ(ErrorCode::DimensionMismatch, e.code());
        EXPECT_NE(std::string::npos, std::string(e.what()).find("latitude"));
    }
    EXPECT_THROW(reg.texture(AxisKind::Longitude), std::logic_error);
}

TEST(SulcalRegistrationTest, TextureLengthsMustAgree) {
    SulcalRegistration reg;
    EXPECT_THROW(reg.setTexture({1, 2, 3}, {1, 2}), RegistrationError);
    EXPECT_THROW(reg.run(), std::logic_error);
}

TEST(SulcalRegistrationTest, ReportsProgressAndBandWarnings) {
    SpeciesModel model1 = species1();
    model1.band.min = 20;

    RecordingObserver observer;
    SulcalRegistration reg;
    reg.setObserver(&observer);
    reg.open(model1, species2(), correspondence());
    reg.setTexture({25}, {126});
    reg.run();

    ASSERT_EQ(1u, observer.warnings.size());
    EXPECT_NE(std::string::npos, observer.warnings[0].find("[20, 150]"));
    ASSERT_FALSE(observer.stages.empty());
    EXPECT_EQ("Spherical Projection", observer.stages[0]);
    EXPECT_EQ("Processing: latitude", observer.stages.back());
    EXPECT_EQ((int)observer.stages.size(), observer.timings);
}

TEST(SulcalRegistrationTest, FilesEndToEnd) {
    const std::string dir = ::testing::TempDir();
    const std::string model1 = dir + "model_Lmacaque.txt";
    const std::string model2 = dir + "model_Lchimpanzee.txt";
    const std::string corr = dir + "macaque_chimpanzee_Corr.txt";
    const std::string texLon = dir + "chimpanzee_Lwhite_lon.txt";
    const std::string texLat = dir + "chimpanzee_Lwhite_lat.txt";
    const std::string outLon = dir + "macaque_Lwhite_lon_tochimpanzee.txt";
    const std::string outLat = dir + "macaque_Lwhite_lat_tochimpanzee.txt";

    {
        std::ofstream out(model1.c_str());
        out << "dimRect: 360 50\n"
            << "longitude: 1 10 1\n"
            << "longitude: 2 40 2\n"
            << "latitude: 1 35 5\n"
            << "latitude: 2 45 6\n";
    }
    {
        std::ofstream out(model2.c_str());
        out << "dimRect: 360 80\n"
            << "longitude: 10 90 12\n"
            << "longitude: 11 30 11\n"
            << "latitude: 10 40 15\n"
            << "latitude: 11 60 16\n";
    }
    {
        std::ofstream out(corr.c_str());
        out << "longitude1: 1 2\n"
            << "longitude2: 11 12\n"
            << "latitude1: 5 6\n"
            << "latitude2: 15 16\n";
    }
    TextureMap::save(texLon.c_str(), {60, 15, 90, 100});
    TextureMap::save(texLat.c_str(), {105, 90, 120, 10});

    SulcalRegistration reg;
    reg.setThreads(2);
    reg.open(model1.c_str(), model2.c_str(), corr.c_str());
    reg.openTexture(texLon.c_str(), texLat.c_str());
    reg.run();
    reg.saveTexture(outLon.c_str(), outLat.c_str());

    std::vector<double> lon = TextureMap::load(outLon.c_str());
    std::vector<double> lat = TextureMap::load(outLat.c_str());
    ASSERT_EQ(4u, lon.size());
    ASSERT_EQ(4u, lat.size());
    EXPECT_NEAR(25.0, lon[0], 1e-6);
    EXPECT_NEAR(5.0, lon[1], 1e-6);
    EXPECT_NEAR(40.0, lon[2], 1e-6);
    EXPECT_NEAR(45.0, lon[3], 1e-6);
    EXPECT_NEAR(126.0, lat[0], 1e-6);
    EXPECT_NEAR(10.0 * 114 / 90, lat[3], 1e-6);

    const std::string files[] = {model1, model2, corr, texLon, texLat, outLon, outLat};
    for (const std::string& f : files)
        std::remove(f.c_str());
}

TEST(SulcalRegistrationTest, MeshVertexCountMustMatchTextures) {
    const std::string mesh = ::testing::TempDir() + "tetrahedron.vtk";
    {
        std::ofstream out(mesh.c_str());
        out << "# vtk DataFile Version 3.0\n"
            << "tetrahedron\n"
            << "ASCII\n"
            << "DATASET POLYDATA\n"
            << "POINTS 4 float\n"
            << "0 0 0\n1 0 0\n0 1 0\n0 0 1\n"
            << "POLYGONS 4 16\n"
            << "3 0 2 1\n3 0 1 3\n3 0 3 2\n3 1 2 3\n";
    }

    SulcalRegistration reg;
    reg.setTexture({10, 20, 30, 40}, {90, 90, 90, 90});
    EXPECT_NO_THROW(reg.checkMesh(mesh.c_str()));

    reg.setTexture({10, 20, 30}, {90, 90, 90});
    try {
        reg.checkMesh(mesh.c_str());
        FAIL() << "expected DimensionMismatch";
    } catch (const RegistrationError& e) {
        EXPECT_EQ(ErrorCode::DimensionMismatch, e.code());
        EXPECT_NE(std::string::npos, std::string(e.what()).find("4 vertices"));
    }
    std::remove(mesh.c_str());
}
