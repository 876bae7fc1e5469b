/*
 * PhysicalScale.hxx
 *
 *  Created on: 2 Sep 2025
 */

////////////////////////////////////////////////////////////////////////
/// @brief Physical sampling of the aperture and observer planes
///
/// The grid size and field of view are fixed jointly by the wavelength,
/// the distance to the occulting object and the number of samples on a
/// side of the array:
///		gridSize    = sqrt(lambda*D/npts)
///		fieldOfView = sqrt(lambda*D*npts) = gridSize*npts
/// so changing npts changes both the resolution and the extent. Neither
/// quantity can be set independently.
///
////////////////////////////////////////////////////////////////////////

#ifndef _PHYSICAL_SCALE_HXX_
#define _PHYSICAL_SCALE_HXX_

class PhysicalScale {
public:

	static constexpr double kMicronsToKm = 1.E-9; ///< Conversion factor from microns to km

	/** *************************************************************************
	 *  @brief Constructor
	 *
	 *  @param [in] wavelength  Wavelength in microns
	 *  @param [in] distance  Distance from the observer to the occulting object (km)
	 *  @param [in] numberOfPoints  Number of samples on a side of the array
	 */
	PhysicalScale(double wavelength, double distance, int numberOfPoints);
	virtual ~PhysicalScale() {};

	/// @brief Returns the wavelength in microns
	double getWavelength() const {return m_wavelength;}

	/// @brief Returns the wavelength in km
	double getWavelengthKm() const {return m_wavelength*kMicronsToKm;}

	/// @brief Returns the distance from the observer to the occulting object (km)
	double getDistance() const {return m_distance;}

	/// @brief Returns the number of samples on a side of the array
	int getNumberOfPoints() const {return m_numberOfPoints;}

	/// @brief Returns the physical spacing between adjacent samples (km)
	double getGridSize() const {return m_gridSize;}

	/// @brief Returns the physical extent spanned by the array (km)
	double getFieldOfView() const {return m_fieldOfView;}

	/** *************************************************************************
	 *  @brief Returns the signed offset (km) from the array centre of the
	 *  	   sample with the specified index, i.e. (index-npts/2)*gridSize
	 */
	double getOffset(int index) const {return (index - m_numberOfPoints/2) * m_gridSize;}

private:
	double m_wavelength; ///< Wavelength in microns
	double m_distance; ///< Distance to the occulting object in km
	int m_numberOfPoints; ///< Number of samples on a side of the array
	double m_gridSize; ///< Physical spacing between samples in km
	double m_fieldOfView; ///< Physical extent of the array in km
};

#endif /* _PHYSICAL_SCALE_HXX_ */
