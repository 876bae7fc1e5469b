/*
 * Aperture.hxx
 *
 *  Created on: 2 Sep 2025
 */

////////////////////////////////////////////////////////////////////////
/// @brief 2D complex transmission mask of the occulting geometry
///
/// Values are 1 for full transmission and 0 for fully opaque. The array
/// is indexed (iy,ix), where ix is the column index along which the
/// ring's radial offset varies. The sample with index npts/2 on each
/// axis lies at zero offset. The physical scale of the samples is carried
/// alongside the values so that downstream processing never re-derives
/// it from the wavelength and distance.
///
////////////////////////////////////////////////////////////////////////

#ifndef _APERTURE_HXX_
#define _APERTURE_HXX_

#include <complex>

#include <Eigen/Dense>

#include "PhysicalScale.hxx"

class Aperture {
public:

	/** *************************************************************************
	 *  @brief Constructor for a fully transmissive npts x npts aperture, where
	 *  	   npts is taken from the physical scale
	 *
	 *  @param [in] scale  Physical scale of the samples
	 */
	Aperture(const PhysicalScale & scale);

	/** *************************************************************************
	 *  @brief Constructor from an array of transmission values. The shape of
	 *  	   the array is validated by the consumer, not here.
	 *
	 *  @param [in] transmission  Complex transmission values indexed (iy,ix)
	 *  @param [in] scale  Physical scale of the samples
	 */
	Aperture(const Eigen::ArrayXXcd & transmission, const PhysicalScale & scale) :
		m_transmission(transmission), m_scale(scale) {};

	virtual ~Aperture() {};

	/// @brief Returns the transmission for the sample at row iy, column ix
	std::complex<double> getTransmission(int iy, int ix) const {return m_transmission(iy,ix);}

	/// @brief Assigns the transmission for the sample at row iy, column ix
	void setTransmission(int iy, int ix, std::complex<double> value) {m_transmission(iy,ix) = value;}

	/// @brief Returns the array of transmission values
	const Eigen::ArrayXXcd & getTransmissionArray() const {return m_transmission;}

	/// @brief Returns the number of rows
	int getNumberOfRows() const {return m_transmission.rows();}

	/// @brief Returns the number of columns
	int getNumberOfColumns() const {return m_transmission.cols();}

	/// @brief Returns the physical scale of the samples
	const PhysicalScale & getPhysicalScale() const {return m_scale;}

	/// @brief Returns the field of view (km)
	double getFieldOfView() const {return m_scale.getFieldOfView();}

	/// @brief Returns the grid size (km)
	double getGridSize() const {return m_scale.getGridSize();}

	/// @brief Returns the largest absolute imaginary part of any sample
	double maxImaginary() const;

	/// @brief Returns the fraction of the aperture area which is blocked, i.e. the mean of 1-|t|^2
	double blockedFraction() const;

private:
	Eigen::ArrayXXcd m_transmission; ///< Transmission values indexed (iy,ix)
	PhysicalScale m_scale; ///< Physical scale of the samples
};

#endif /* _APERTURE_HXX_ */
