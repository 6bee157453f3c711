#include <cstdlib>
#include <iostream>
#include "SulcalRegistration.h"
#include "PARSE_ARGS.h"

using std::cout;
using std::endl;

class ConsoleProgress: public ProgressObserver
{
public:
	void stage(const std::string &name) { cout << "- " << name << endl; }
	void done(double elapse) { cout << elapse << " sec elapsed" << endl; }
	void warning(const std::string &msg) { cout << "Warning: " << msg << endl; }
};

int main(int argc, char *argv[])
{
	PARSE_ARGS(argc, argv);

	// the texture species is warped into the frame of the other one
	bool forward = (direction == "1to2");
	const std::string &source = forward ? species1: species2;
	const std::string &target = forward ? species2: species1;

	std::string model1 = inputDir + "/model_" + side + species1 + ".txt";
	std::string model2 = inputDir + "/model_" + side + species2 + ".txt";
	std::string corr = inputDir + "/" + species1 + "_" + species2 + "_Corr.txt";
	std::string texLon = inputDir + "/" + source + "_" + side + "white_lon.txt";
	std::string texLat = inputDir + "/" + source + "_" + side + "white_lat.txt";
	std::string outLon = outputDir + "/" + target + "_" + side + "white_lon_to" + source + ".txt";
	std::string outLat = outputDir + "/" + target + "_" + side + "white_lat_to" + source + ".txt";

	ConsoleProgress progress;
	SulcalRegistration reg;
	reg.setObserver(&progress);
	reg.setFirstSegmentPolicy(firstSegment == "extend" ? FirstSegmentPolicy::ExtendFirstInterval: FirstSegmentPolicy::OriginAnchored);
	reg.setDirection(forward ? WarpDirection::Species1ToSpecies2: WarpDirection::Species2ToSpecies1);
	reg.setThreads(nThreads);

	try
	{
		reg.open(model1.c_str(), model2.c_str(), corr.c_str());
		reg.openTexture(texLon.c_str(), texLat.c_str());
		if (!mesh.empty()) reg.checkMesh(mesh.c_str());
		reg.run();
		reg.saveTexture(outLon.c_str(), outLat.c_str());
	}
	catch (const std::exception &e)
	{
		cout << "Fatal error: " << e.what() << endl;
		return EXIT_FAILURE;
	}
	cout << "done" << endl;

	return EXIT_SUCCESS;
}
