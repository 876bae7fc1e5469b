/*
 * ApertureGenerator.cxx
 *
 *  Created on: 9 Sep 2025
 */

#include <iomanip>
#include <iostream>

#include "ApertureGenerator.hxx"

using namespace std;

void ApertureGenerator::initialize(const ModuleParams & params) {

	double wavelength = params.GetAsDouble("wavelength");
	double distance = params.GetAsDouble("distance");
	int numberOfPoints = params.GetAsInt("numberOfPoints");

	delete m_builder;
	m_builder = new ApertureBuilder(wavelength,distance,numberOfPoints);

	const PhysicalScale & scale = m_builder->getPhysicalScale();
	cout << "Wavelength (microns)                     :" << scale.getWavelength() << endl;
	cout << "Distance (km)                            :" << scale.getDistance() << endl;
	cout << "Number of points                         :" << scale.getNumberOfPoints() << endl;

}

void ApertureGenerator::process(Data * data, int occulterIndex) const {

	if (m_builder == nullptr) throw runtime_error("Error in ApertureGenerator::process: module has not been initialized");

	const Occulter * occulter = data->getOcculter(occulterIndex);
	Aperture * aperture;
	if (occulter->getType() == Occulter::ring) {
		aperture = new Aperture(m_builder->buildRingAperture(occulter->getRingWidth(),occulter->getTransmissionProfile().asFunction()));
	} else {
		aperture = new Aperture(m_builder->buildSolidBodyAperture(occulter->getSemiAxisX(),occulter->getSemiAxisY()));
	}
	data->setAperture(aperture);

	cout << "Aperture for " << occulter->getName() << ": field of view " << setprecision(6) << aperture->getFieldOfView()
		 << " km, grid size " << aperture->getGridSize() << " km, blocked fraction " << aperture->blockedFraction() << endl;

}
