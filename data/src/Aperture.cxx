/*
 * Aperture.cxx
 *
 *  Created on: 2 Sep 2025
 */

#include "Aperture.hxx"

Aperture::Aperture(const PhysicalScale & scale) :
		m_transmission(Eigen::ArrayXXcd::Ones(scale.getNumberOfPoints(),scale.getNumberOfPoints())),
		m_scale(scale) {}

double Aperture::maxImaginary() const {
	if (m_transmission.size() == 0) return 0.;
	return m_transmission.imag().abs().maxCoeff();
}

double Aperture::blockedFraction() const {
	if (m_transmission.size() == 0) return 0.;
	return (1. - m_transmission.abs2()).mean();
}
