/*
 * DiffractionPropagator.hxx
 *
 *  Created on: 10 Sep 2025
 */

////////////////////////////////////////////////////////////////////////
/// @brief Propagation of a plane wavefront through an aperture to the
///        observer's plane in the Fresnel approximation
///
/// Implements the method of Trester (1999), in which the Fresnel-Kirchhoff
/// integral reduces to a single 2D discrete Fourier transform of the
/// aperture multiplied by a quadratic phase term:
///		1. eTerm(y,x) = exp(i*pi/npts*(y^2+x^2)) for integer offsets y,x in
///		   [-npts/2,npts/2-1] from the centre of the array
///		2. M = aperture * eTerm (elementwise)
///		3. F = unnormalized forward 2D DFT of M
///		4. intensity = Re(F * conj(F))
///		5. cyclic shift of npts/2 along both axes, so that the on-axis
///		   point lies at (npts/2,npts/2)
///
/// The wavelength and distance enter only through the grid size of the
/// aperture, which has already been fixed by npts. The absolute scale of
/// the intensity is arbitrary.
///
////////////////////////////////////////////////////////////////////////

#ifndef _DIFFRACTION_PROPAGATOR_HXX_
#define _DIFFRACTION_PROPAGATOR_HXX_

#include <Eigen/Dense>

#include "data/include/Aperture.hxx"
#include "data/include/ObserverField.hxx"

class DiffractionPropagator {
public:

	static constexpr double kDefaultImaginaryTolerance = 1.E-12; ///< Default tolerance on the residual imaginary fraction of the intensity

	/** *************************************************************************
	 *  @brief Constructor
	 *
	 *  @param [in] imaginaryTolerance  Largest ratio |Im|/|Re| of F*conj(F) which
	 *  								is not reported as a numeric warning
	 */
	DiffractionPropagator(double imaginaryTolerance=kDefaultImaginaryTolerance);
	virtual ~DiffractionPropagator() {};

	/** *************************************************************************
	 *  @brief Computes the observer plane intensity of the aperture
	 *
	 *  @param [in] aperture  Square aperture with an even number of samples on a side
	 *  @return the recentred intensity, with the residual imaginary fraction
	 *  		recorded. Throws ShapeError if the aperture is not square or its
	 *  		side length is not even.
	 */
	ObserverField propagate(const Aperture & aperture) const;

	/// @brief Returns true if the residual imaginary fraction of the field exceeds the tolerance
	bool hasNumericWarning(const ObserverField & field) const {return field.getResidualImaginary() > m_imaginaryTolerance;}

	/// @brief Returns the tolerance on the residual imaginary fraction
	double getImaginaryTolerance() const {return m_imaginaryTolerance;}

	/// @brief Returns the npts x npts quadratic phase term exp(i*pi/npts*(y^2+x^2))
	static Eigen::ArrayXXcd quadraticPhaseTerm(int numberOfPoints);

	/// @brief Returns the unnormalized forward 2D DFT of the input, computed as 1D transforms of the rows followed by the columns
	static Eigen::ArrayXXcd forwardTransform2D(const Eigen::ArrayXXcd & input);

	/// @brief Returns a copy of the input cyclically shifted by n rows and n columns, i.e. out((iy+n)%rows,(ix+n)%cols) = in(iy,ix)
	static Eigen::ArrayXXd cyclicShift(const Eigen::ArrayXXd & input, int n);

private:
	double m_imaginaryTolerance; ///< Tolerance on the residual imaginary fraction
};

/** *************************************************************************
 *  @brief Computes the observer plane intensity of the aperture using the
 *  	   default imaginary tolerance
 */
ObserverField propagate(const Aperture & aperture);

#endif /* _DIFFRACTION_PROPAGATOR_HXX_ */
