/*
 * DiffractionPropagator.cxx
 *
 *  Created on: 10 Sep 2025
 */

#include <cmath>
#include <complex>
#include <string>
#include <vector>

#include <unsupported/Eigen/FFT>

#include "data/include/OccultationErrors.hxx"
#include "DiffractionPropagator.hxx"

using namespace std;

constexpr double DiffractionPropagator::kDefaultImaginaryTolerance;

DiffractionPropagator::DiffractionPropagator(double imaginaryTolerance) : m_imaginaryTolerance(imaginaryTolerance) {

	if (!(imaginaryTolerance >= 0.)) {
		throw invalid_argument("Error in DiffractionPropagator: imaginary tolerance must be non-negative. Input value is "+to_string(imaginaryTolerance));
	}

}

Eigen::ArrayXXcd DiffractionPropagator::quadraticPhaseTerm(int numberOfPoints) {

	int n2 = numberOfPoints/2;
	long period = 2L*numberOfPoints;

	Eigen::ArrayXXcd eTerm(numberOfPoints,numberOfPoints);
	for (int iy=0; iy<numberOfPoints; iy++) {
		long y = iy - n2;
		for (int ix=0; ix<numberOfPoints; ix++) {
			long x = ix - n2;
			//exp(i*pi*k/npts) has period 2*npts in k, so reduce y^2+x^2 exactly before forming the phase
			long k = (y*y + x*x) % period;
			eTerm(iy,ix) = polar(1.,M_PI*k/numberOfPoints);
		}
	}

	return eTerm;

}

Eigen::ArrayXXcd DiffractionPropagator::forwardTransform2D(const Eigen::ArrayXXcd & input) {

	Eigen::FFT<double> fft;
	Eigen::ArrayXXcd output(input.rows(),input.cols());

	//Transform each row
	vector<complex<double> > in(input.cols()), out;
	for (int iy=0; iy<input.rows(); iy++) {
		for (int ix=0; ix<input.cols(); ix++) in[ix] = input(iy,ix);
		fft.fwd(out,in);
		for (int ix=0; ix<input.cols(); ix++) output(iy,ix) = out[ix];
	}

	//Transform each column of the row transforms
	in.resize(input.rows());
	for (int ix=0; ix<input.cols(); ix++) {
		for (int iy=0; iy<input.rows(); iy++) in[iy] = output(iy,ix);
		fft.fwd(out,in);
		for (int iy=0; iy<input.rows(); iy++) output(iy,ix) = out[iy];
	}

	return output;

}

Eigen::ArrayXXd DiffractionPropagator::cyclicShift(const Eigen::ArrayXXd & input, int n) {

	int rows = input.rows();
	int cols = input.cols();
	Eigen::ArrayXXd output(rows,cols);
	for (int iy=0; iy<rows; iy++) {
		for (int ix=0; ix<cols; ix++) output((iy+n)%rows,(ix+n)%cols) = input(iy,ix);
	}
	return output;

}

ObserverField DiffractionPropagator::propagate(const Aperture & aperture) const {

	int npts = aperture.getNumberOfRows();
	if (aperture.getNumberOfColumns() != npts) {
		throw ShapeError("Error in DiffractionPropagator::propagate: aperture must be square. Dimensions are "+
						 to_string(npts)+" x "+to_string(aperture.getNumberOfColumns()));
	}
	if (npts < 2 || npts%2 != 0) {
		throw ShapeError("Error in DiffractionPropagator::propagate: aperture side length must be a positive even integer. Value is "+to_string(npts));
	}
	if (npts != aperture.getPhysicalScale().getNumberOfPoints()) {
		throw ShapeError("Error in DiffractionPropagator::propagate: aperture side length "+to_string(npts)+
						 " does not match the number of points of its physical scale ("+to_string(aperture.getPhysicalScale().getNumberOfPoints())+")");
	}

	Eigen::ArrayXXcd modifiedAperture = aperture.getTransmissionArray() * quadraticPhaseTerm(npts);
	Eigen::ArrayXXcd transform = forwardTransform2D(modifiedAperture);
	Eigen::ArrayXXcd squared = transform * transform.conjugate();

	//Keep the real part, recording the largest residual imaginary fraction
	Eigen::ArrayXXd intensity = squared.real();
	double residualImaginary = 0.;
	for (int iy=0; iy<npts; iy++) {
		for (int ix=0; ix<npts; ix++) {
			double im = fabs(squared(iy,ix).imag());
			if (im == 0.) continue;
			double re = fabs(squared(iy,ix).real());
			double ratio = (re > 0.) ? im/re : HUGE_VAL;
			if (ratio > residualImaginary) residualImaginary = ratio;
		}
	}

	return ObserverField(cyclicShift(intensity,npts/2),aperture.getPhysicalScale(),residualImaginary);

}

ObserverField propagate(const Aperture & aperture) {

	DiffractionPropagator propagator;
	return propagator.propagate(aperture);

}
