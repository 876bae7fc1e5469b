/*
 * ApertureBuilder.hxx
 *
 *  Created on: 8 Sep 2025
 */

#ifndef _APERTURE_BUILDER_HXX_
#define _APERTURE_BUILDER_HXX_

#include <vector>

#include <Eigen/Dense>

#include "data/include/Aperture.hxx"
#include "data/include/PhysicalScale.hxx"
#include "data/include/TransmissionProfile.hxx"

/** *************************************************************************
 *  @brief Builds physically scaled apertures for an occulting object
 *
 *  	   The wavelength, distance and number of points fix the grid size
 *  	   and field of view of the aperture (see PhysicalScale). The sample
 *  	   with index i on either axis lies at offset (i-npts/2)*gridSize
 *  	   from the centre of the aperture.
 *
 *  	   A ring aperture is built as an explicit elementwise map over a 2D
 *  	   grid of column offsets, in which every row is identical. The ring
 *  	   therefore runs along the y axis and the transmission of each sample
 *  	   depends only on its x offset.
 */
class ApertureBuilder {
public:

	/** *************************************************************************
	 *  @brief Constructor
	 *
	 *  @param [in] wavelength  Wavelength in microns (must be positive)
	 *  @param [in] distance  Distance from the observer to the occulting object in km (must be positive)
	 *  @param [in] numberOfPoints  Number of samples on a side of the aperture (must be positive and even)
	 */
	ApertureBuilder(double wavelength, double distance, int numberOfPoints);
	virtual ~ApertureBuilder() {};

	/// @brief Returns the physical scale of the apertures
	const PhysicalScale & getPhysicalScale() const {return m_scale;}

	/// @brief Returns the offset (km) of each sample from the centre, i.e. (i-npts/2)*gridSize
	std::vector<double> offsets() const;

	/// @brief Returns the npts x npts grid of column offsets (km), every row of which equals offsets()
	Eigen::ArrayXXd columnOffsetGrid() const;

	/** *************************************************************************
	 *  @brief Builds the aperture of a ring segment
	 *
	 *  	   Samples with |offset| <= ringWidth/2 take the value of the
	 *  	   transmission function at their offset. All other samples are 1.
	 *
	 *  @param [in] ringWidth  Radial width of the ring (km, must be positive)
	 *  @param [in] transmission  Transmitted fraction as a function of signed
	 *  						  radial offset from the ring midline (km). It must
	 *  						  be defined over [-ringWidth/2,+ringWidth/2].
	 *  @return the aperture. A DomainError thrown by the transmission function
	 *  		is propagated unchanged. A returned value which is not finite or
	 *  		lies outside [0,1] throws std::range_error.
	 */
	Aperture buildRingAperture(double ringWidth, const TransmissionFunction & transmission) const;

	/** *************************************************************************
	 *  @brief Builds the aperture of an opaque elliptical body centred in the
	 *  	   aperture: 0 where (x/a)^2+(y/b)^2 < 1, 1 elsewhere
	 *
	 *  @param [in] semiAxisX  Semi-axis a along x (km, must be positive)
	 *  @param [in] semiAxisY  Semi-axis b along y (km, must be positive)
	 */
	Aperture buildSolidBodyAperture(double semiAxisX, double semiAxisY) const;

private:
	PhysicalScale m_scale; ///< Physical scale of the apertures
};

/** *************************************************************************
 *  @brief Builds the aperture of a ring segment. Convenience wrapper around
 *  	   ApertureBuilder::buildRingAperture. The field of view and grid size
 *  	   are available from the returned aperture.
 *
 *  @param [in] wavelength  Wavelength in microns
 *  @param [in] distance  Distance from the observer to the ring in km
 *  @param [in] numberOfPoints  Number of samples on a side of the aperture
 *  @param [in] ringWidth  Radial width of the ring (km)
 *  @param [in] transmission  Transmitted fraction as a function of signed radial offset (km)
 */
Aperture buildRingAperture(double wavelength, double distance, int numberOfPoints,
						   double ringWidth, const TransmissionFunction & transmission);

#endif /* _APERTURE_BUILDER_HXX_ */
