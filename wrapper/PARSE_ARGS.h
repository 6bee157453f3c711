#include <cstring>
#include <vector>
#include "CLI11.hpp"

std::string species1;
std::string species2;
std::string side;
std::string inputDir = ".";
std::string outputDir = ".";
std::string mesh;
std::string firstSegment = "origin";
std::string direction = "2to1";
int nThreads = 0;

void PARSE_ARGS(int argc, char **argv)
{
    
    std::string desc("Sulcal Registration between Primate Species "
					 SR_VERSION "\n"
					 "Warps longitude/latitude textures of one species onto the sulcal model of another\n"
					 "using a piecewise affine correction anchored at corresponding sulcal axes.\n"
					 );

    CLI::App app(desc);

	app.add_option("species1", species1, "Specify the first species (reference frame by default)")->required()->group("Inputs");
	app.add_option("species2", species2, "Specify the second species (textures by default)")->required()->group("Inputs");
	app.add_option("side", side, "Specify the hemisphere side prefix, e.g. L or R")->required()->group("Inputs");
	app.add_option("-i,--inputDir", inputDir, "Specify the directory of models, correspondence table and textures", true)->check(CLI::ExistingDirectory)->group("Inputs");
	app.add_option("-m,--mesh", mesh, "Specify the hemisphere mesh of the texture species to check vertex counts")->check(CLI::ExistingFile)->group("Inputs");

	app.add_option("-o,--outputDir", outputDir, "Specify the directory of the output textures", true)->check(CLI::ExistingDirectory)->group("Outputs");

	app.add_option("--firstSegment", firstSegment, "Specify the transform below the first anchor: origin (line through the origin) or extend (first interval)", true)->check(CLI::IsMember({"origin", "extend"}))->group("Transform parameters");
	app.add_option("--direction", direction, "Specify the warp direction: 2to1 (species2 textures to species1 frame) or 1to2", true)->check(CLI::IsMember({"2to1", "1to2"}))->group("Transform parameters");

	app.add_option("--nThreads", nThreads, "Specify the number of OpenMP threads")->check(CLI::NonNegativeNumber)->group("Multi-threading");

	try
	{
		app.parse(argc, argv);
	}
	catch (const CLI::ParseError &e)
	{
		exit(app.exit(e));
	}
}
