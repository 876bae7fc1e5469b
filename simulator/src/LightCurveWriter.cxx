/*
 * LightCurveWriter.cxx
 *
 *  Created on: 12 Sep 2025
 */

#include <fstream>
#include <iomanip>
#include <iostream>

#include "boost/filesystem.hpp"

#include "LightCurveWriter.hxx"

using namespace std;

void LightCurveWriter::initialize(const ModuleParams & params) {

	m_writeTransmissionProfiles = params.GetAsBool("writeTransmissionProfiles");

}

void LightCurveWriter::doBegin(Data * data) {

	boost::filesystem::create_directories(data->getOutputDirectory()+"/light_curves");
	if (m_writeTransmissionProfiles) boost::filesystem::create_directories(data->getOutputDirectory()+"/profiles");

}

string LightCurveWriter::lightCurveFilename(const Data * data, const string & name) {
	return data->getOutputDirectory()+"/light_curves/"+name+"_lightCurve.txt";
}

string LightCurveWriter::profileFilename(const Data * data, const string & name) {
	return data->getOutputDirectory()+"/profiles/"+name+"_profile.txt";
}

void LightCurveWriter::doEnd(Data * data) const {

	cout << endl << "======================== Light curve summary =============================" << endl << endl;
	cout << left << setw(24) << "name" << setw(14) << "baseline" << setw(14) << "min flux"
		 << setw(14) << "t(min) [s]" << setw(14) << "max flux" << endl;

	const vector<LightCurve> & lightCurves = data->getLightCurves();
	for (vector<LightCurve>::const_iterator it = lightCurves.begin(); it != lightCurves.end(); ++it) {
		writeLightCurve(*it,lightCurveFilename(data,it->getName()));
		cout << left << setw(24) << it->getName() << setprecision(6) << setw(14) << it->getBaseline() << setw(14) << it->getMinimumFlux()
			 << setw(14) << it->getTimeOfMinimum() << setw(14) << it->getMaximumFlux() << endl;
	}
	cout << right;

	if (m_writeTransmissionProfiles) {
		const vector<Occulter*> & occulters = data->getOcculters();
		for (vector<Occulter*>::const_iterator it = occulters.begin(); it != occulters.end(); ++it) {
			if ((*it)->getType() == Occulter::ring) writeTransmissionProfile(**it,profileFilename(data,(*it)->getName()));
		}
	}

	cout << endl << "Light curves written to " << data->getOutputDirectory() << "/light_curves" << endl;

}

void LightCurveWriter::writeLightCurve(const LightCurve & lightCurve, const string & filename) const {

	ofstream lightCurve_file(filename, ios::out);
	if (!lightCurve_file.good()) throw runtime_error("Error in LightCurveWriter::writeLightCurve: Error opening file "+filename);

	const PhysicalScale & scale = lightCurve.getPhysicalScale();
	lightCurve_file << "# name: " << lightCurve.getName() << endl;
	lightCurve_file << setprecision(10);
	lightCurve_file << "# wavelength (microns): " << scale.getWavelength() << endl;
	lightCurve_file << "# distance (km): " << scale.getDistance() << endl;
	lightCurve_file << "# number of points: " << scale.getNumberOfPoints() << endl;
	lightCurve_file << "# field of view (km): " << scale.getFieldOfView() << endl;
	lightCurve_file << "# grid size (km): " << scale.getGridSize() << endl;
	lightCurve_file << "# event velocity (km/s): " << lightCurve.getEventVelocity() << endl;
	lightCurve_file << "# baseline: " << lightCurve.getBaseline() << endl;
	lightCurve_file << "# time_s normalizedFlux" << endl;

	const vector<double> & times = lightCurve.getTimes();
	const vector<double> & fluxes = lightCurve.getFluxes();
	for (unsigned i=0; i<times.size(); i++) lightCurve_file << times[i] << " " << fluxes[i] << endl;

	lightCurve_file.close();

}

void LightCurveWriter::writeTransmissionProfile(const Occulter & occulter, const string & filename) const {

	ofstream profile_file(filename, ios::out);
	if (!profile_file.good()) throw runtime_error("Error in LightCurveWriter::writeTransmissionProfile: Error opening file "+filename);

	const TransmissionProfile & profile = occulter.getTransmissionProfile();
	profile_file << "# name: " << occulter.getName() << endl;
	profile_file << "# ring width (km): " << occulter.getRingWidth() << endl;
	profile_file << "# offset_km opticalDepth transmission" << endl;
	profile_file << setprecision(10);
	for (unsigned i=0; i<profile.getRadialOffsets().size(); i++) {
		profile_file << profile.getRadialOffsets()[i] << " " << profile.getOpticalDepths()[i] << " " << profile.getTransmissions()[i] << endl;
	}

	profile_file.close();

}
