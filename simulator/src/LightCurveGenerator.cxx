/*
 * LightCurveGenerator.cxx
 *
 *  Created on: 11 Sep 2025
 */

#include <iostream>

#include "LightCurveGenerator.hxx"

using namespace std;

void LightCurveGenerator::initialize(const ModuleParams & params) {

	int extractionRow = params.GetAsInt("extractionRow");
	int baselineStart = params.GetAsInt("baselineStart");
	int baselineEnd = params.GetAsInt("baselineEnd");
	double eventVelocity = params.GetAsDouble("eventVelocity");

	delete m_extractor;
	m_extractor = new LightCurveExtractor(extractionRow,baselineStart,baselineEnd,eventVelocity);

	cout << "Extraction row                           :" << (extractionRow<0 ? string("centre") : to_string(extractionRow)) << endl;
	cout << "Baseline window                          :[" << baselineStart << "," << baselineEnd << ")" << endl;
	cout << "Event velocity (km/s)                    :" << eventVelocity << endl;

}

void LightCurveGenerator::process(Data * data, int occulterIndex) const {

	if (m_extractor == nullptr) throw runtime_error("Error in LightCurveGenerator::process: module has not been initialized");

	ObserverField * field = data->getObserverField();
	if (field == nullptr) {
		throw runtime_error("Error in LightCurveGenerator::process: no observer field available. ObserverFieldGenerator must run before LightCurveGenerator");
	}

	LightCurve lightCurve = m_extractor->extractAndNormalize(*field,data->getOcculter(occulterIndex)->getName());
	data->appendLightCurve(lightCurve);

	cout << "Light curve for " << lightCurve.getName() << ": baseline " << lightCurve.getBaseline()
		 << ", minimum flux " << lightCurve.getMinimumFlux() << " at t=" << lightCurve.getTimeOfMinimum() << " s"
		 << ", maximum flux " << lightCurve.getMaximumFlux() << endl;

}
