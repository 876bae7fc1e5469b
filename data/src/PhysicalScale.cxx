/*
 * PhysicalScale.cxx
 *
 *  Created on: 2 Sep 2025
 */

#include <cmath>
#include <stdexcept>
#include <string>

#include "PhysicalScale.hxx"

using namespace std;

constexpr double PhysicalScale::kMicronsToKm;

PhysicalScale::PhysicalScale(double wavelength, double distance, int numberOfPoints) :
		m_wavelength(wavelength), m_distance(distance), m_numberOfPoints(numberOfPoints) {

	if (!(wavelength > 0.)) throw invalid_argument("Error in PhysicalScale: wavelength must be positive. Input value is "+to_string(wavelength));
	if (!(distance > 0.)) throw invalid_argument("Error in PhysicalScale: distance must be positive. Input value is "+to_string(distance));
	if (numberOfPoints < 1) throw invalid_argument("Error in PhysicalScale: number of points must be positive. Input value is "+to_string(numberOfPoints));

	m_gridSize = sqrt(getWavelengthKm() * m_distance / m_numberOfPoints);
	m_fieldOfView = m_gridSize * m_numberOfPoints;

}
