/*
 * ObserverFieldGenerator.cxx
 *
 *  Created on: 10 Sep 2025
 */

#include <ctime>
#include <iostream>

#include "ObserverFieldGenerator.hxx"

using namespace std;

void ObserverFieldGenerator::initialize(const ModuleParams & params) {

	double imaginaryTolerance = DiffractionPropagator::kDefaultImaginaryTolerance;
	if (params.HasParam("imaginaryTolerance")) {
		imaginaryTolerance = params.GetAsDouble("imaginaryTolerance");
	} else {
		cerr << "Warning: imaginaryTolerance parameter not found in configuration file, using default value " << imaginaryTolerance << endl;
	}

	delete m_propagator;
	m_propagator = new DiffractionPropagator(imaginaryTolerance);

}

void ObserverFieldGenerator::process(Data * data, int occulterIndex) const {

	if (m_propagator == nullptr) throw runtime_error("Error in ObserverFieldGenerator::process: module has not been initialized");

	const Aperture * aperture = data->getAperture();
	if (aperture == nullptr) {
		throw runtime_error("Error in ObserverFieldGenerator::process: no aperture available. ApertureGenerator must run before ObserverFieldGenerator");
	}

	clock_t startTime = clock();
	ObserverField * field = new ObserverField(m_propagator->propagate(*aperture));
	data->setObserverField(field);

	string occulterName = data->getOcculter(occulterIndex)->getName();
	cout << "Observer field for " << occulterName << " computed in " << double(clock() - startTime)/CLOCKS_PER_SEC << " seconds" << endl;

	if (m_propagator->hasNumericWarning(*field)) {
		cerr << "ObserverFieldGenerator: [W] WARNING: residual imaginary fraction " << field->getResidualImaginary()
			 << " of the squared field for " << occulterName << " exceeds the tolerance " << m_propagator->getImaginaryTolerance()
			 << ". The real part is used." << endl;
	}

}
