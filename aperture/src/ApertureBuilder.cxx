/*
 * ApertureBuilder.cxx
 *
 *  Created on: 8 Sep 2025
 */

#include <cmath>
#include <stdexcept>
#include <string>

#include "data/include/OccultationErrors.hxx"
#include "ApertureBuilder.hxx"

using namespace std;

namespace {

	/// @brief Returns the number of points if it is positive and even, otherwise throws ShapeError
	int checkNumberOfPoints(int numberOfPoints) {
		if (numberOfPoints < 2 || numberOfPoints%2 != 0) {
			throw ShapeError("Error in ApertureBuilder: number of points must be a positive even integer. Input value is "+to_string(numberOfPoints));
		}
		return numberOfPoints;
	}

}

ApertureBuilder::ApertureBuilder(double wavelength, double distance, int numberOfPoints) :
		m_scale(wavelength,distance,checkNumberOfPoints(numberOfPoints)) {}

vector<double> ApertureBuilder::offsets() const {

	int npts = m_scale.getNumberOfPoints();
	vector<double> x(npts);
	for (int i=0; i<npts; i++) x[i] = m_scale.getOffset(i);
	return x;

}

Eigen::ArrayXXd ApertureBuilder::columnOffsetGrid() const {

	vector<double> x = offsets();
	int npts = x.size();
	Eigen::ArrayXXd grid(npts,npts);
	for (int iy=0; iy<npts; iy++) {
		for (int ix=0; ix<npts; ix++) grid(iy,ix) = x[ix];
	}
	return grid;

}

Aperture ApertureBuilder::buildRingAperture(double ringWidth, const TransmissionFunction & transmission) const {

	if (!(ringWidth > 0.)) throw invalid_argument("Error in ApertureBuilder::buildRingAperture: ring width must be positive. Input value is "+to_string(ringWidth));
	if (!transmission) throw invalid_argument("Error in ApertureBuilder::buildRingAperture: transmission function is empty");

	double halfWidth = 0.5*ringWidth;
	Eigen::ArrayXXd grid = columnOffsetGrid();

	Aperture aperture(m_scale);
	for (int iy=0; iy<grid.rows(); iy++) {
		for (int ix=0; ix<grid.cols(); ix++) {
			double offset = grid(iy,ix);
			if (fabs(offset) > halfWidth) continue;
			double value = transmission(offset);
			if (!std::isfinite(value) || value < 0. || value > 1.) {
				throw range_error("Error in ApertureBuilder::buildRingAperture: transmission at offset "+to_string(offset)+
								  " km must be finite and in the range [0,1]. Value is "+to_string(value));
			}
			aperture.setTransmission(iy,ix,value);
		}
	}

	return aperture;

}

Aperture ApertureBuilder::buildSolidBodyAperture(double semiAxisX, double semiAxisY) const {

	if (!(semiAxisX > 0.) || !(semiAxisY > 0.)) {
		throw invalid_argument("Error in ApertureBuilder::buildSolidBodyAperture: semi-axes must be positive. Input values are "+
							   to_string(semiAxisX)+", "+to_string(semiAxisY));
	}

	vector<double> x = offsets();
	int npts = x.size();

	Aperture aperture(m_scale);
	for (int iy=0; iy<npts; iy++) {
		double yTerm = pow(x[iy]/semiAxisY,2);
		for (int ix=0; ix<npts; ix++) {
			if (pow(x[ix]/semiAxisX,2) + yTerm < 1.) aperture.setTransmission(iy,ix,0.);
		}
	}

	return aperture;

}

Aperture buildRingAperture(double wavelength, double distance, int numberOfPoints,
						   double ringWidth, const TransmissionFunction & transmission) {

	ApertureBuilder builder(wavelength,distance,numberOfPoints);
	return builder.buildRingAperture(ringWidth,transmission);

}
