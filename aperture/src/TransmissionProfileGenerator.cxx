/*
 * TransmissionProfileGenerator.cxx
 *
 *  Created on: 9 Sep 2025
 */

#include <iostream>

#include "TransmissionProfileGenerator.hxx"

using namespace std;

void TransmissionProfileGenerator::initialize(const ModuleParams & params) {

	m_profileName = params.GetAsString("profileName");
	string profileShape = params.GetAsString("profileShape");
	m_ringWidth = params.GetAsDouble("ringWidth");

	if (!(m_ringWidth > 0.)) {
		throw runtime_error("Error in TransmissionProfileGenerator::initialize: ringWidth must be positive for profile "+m_profileName);
	}

	TransmissionProfile * profile;
	if (profileShape == "table") {
		string profileFilename = params.GetAsString("profileFilename");
		profile = new TransmissionProfile(TransmissionProfile::readFromFile(profileFilename));
		if (profile->getMinimumOffset() > -0.5*m_ringWidth || profile->getMaximumOffset() < 0.5*m_ringWidth) {
			string range = "["+to_string(profile->getMinimumOffset())+","+to_string(profile->getMaximumOffset())+"]";
			delete profile;
			throw runtime_error("Error in TransmissionProfileGenerator::initialize: radial range "+range+" km of "+profileFilename+
								" does not cover the ring width of "+to_string(m_ringWidth)+" km");
		}
	} else {
		int nRadialSteps = params.GetAsInt("numberOfRadialSteps");
		double opticalDepth = params.GetAsDouble("opticalDepth");
		if (nRadialSteps < 2) {
			throw runtime_error("Error in TransmissionProfileGenerator::initialize: numberOfRadialSteps must be at least 2 for profile "+m_profileName);
		}
		if (profileShape == "flat") {
			profile = new TransmissionProfile(TransmissionProfile::flat(m_ringWidth,nRadialSteps,opticalDepth));
		} else if (profileShape == "centralPeak") {
			profile = new TransmissionProfile(TransmissionProfile::centralPeak(m_ringWidth,nRadialSteps,opticalDepth));
		} else if (profileShape == "edgePeak") {
			profile = new TransmissionProfile(TransmissionProfile::edgePeak(m_ringWidth,nRadialSteps,opticalDepth));
		} else {
			throw runtime_error("Error in TransmissionProfileGenerator::initialize: profileShape must be flat, centralPeak, edgePeak or table. Value is "+profileShape);
		}
	}
	delete m_profile;
	m_profile = profile;

	cout << "Ring " << m_profileIndex << " (" << m_profileName << "): " << profileShape << " profile, width " << m_ringWidth << " km, "
		 << m_profile->getRadialOffsets().size() << " radial samples" << endl;

}

void TransmissionProfileGenerator::doBegin(Data * data) {

	if (m_profile == nullptr) throw runtime_error("Error in TransmissionProfileGenerator::doBegin: module "+m_name+" has not been initialized");
	data->addOcculter(new Occulter(m_profileName,m_ringWidth,*m_profile));

}
