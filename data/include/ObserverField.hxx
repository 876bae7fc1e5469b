/*
 * ObserverField.hxx
 *
 *  Created on: 3 Sep 2025
 */

////////////////////////////////////////////////////////////////////////
/// @brief 2D intensity field in the observer's plane
///
/// Real, non-negative intensity |E|^2 indexed (iy,ix) with the on-axis
/// point at (npts/2,npts/2). The absolute scale is arbitrary until the
/// field has been normalized to an out-of-event baseline.
///
////////////////////////////////////////////////////////////////////////

#ifndef _OBSERVER_FIELD_HXX_
#define _OBSERVER_FIELD_HXX_

#include <vector>

#include <Eigen/Dense>

#include "PhysicalScale.hxx"

class ObserverField {
public:

	/** *************************************************************************
	 *  @brief Constructor
	 *
	 *  @param [in] intensity  Intensity values indexed (iy,ix)
	 *  @param [in] scale  Physical scale of the aperture from which the field was computed
	 *  @param [in] residualImaginary  Largest ratio |Im|/|Re| found when forming E*conj(E)
	 */
	ObserverField(const Eigen::ArrayXXd & intensity, const PhysicalScale & scale, double residualImaginary=0.) :
		m_intensity(intensity), m_scale(scale), m_residualImaginary(residualImaginary), m_normalization(1.) {};

	virtual ~ObserverField() {};

	/// @brief Returns the intensity at row iy, column ix
	double getIntensity(int iy, int ix) const {return m_intensity(iy,ix);}

	/// @brief Returns the intensity array
	const Eigen::ArrayXXd & getIntensityArray() const {return m_intensity;}

	/// @brief Returns a copy of the row with the specified index
	std::vector<double> getRow(int iy) const;

	/// @brief Returns the number of samples on a side of the field
	int getNumberOfPoints() const {return m_intensity.rows();}

	/// @brief Returns the index of the on-axis row and column
	int getCentreIndex() const {return getNumberOfPoints()/2;}

	/// @brief Returns the physical scale of the field
	const PhysicalScale & getPhysicalScale() const {return m_scale;}

	/// @brief Returns the largest ratio |Im|/|Re| found when forming the intensity
	double getResidualImaginary() const {return m_residualImaginary;}

	/** *************************************************************************
	 *  @brief Divides the full field by the specified baseline so that
	 *  	   unocculted flux reads 1.
	 *
	 *  @param [in] baseline  Out-of-event intensity (must be positive)
	 */
	void normalize(double baseline);

	/// @brief Returns the product of all baselines applied by normalize()
	double getNormalization() const {return m_normalization;}

private:
	Eigen::ArrayXXd m_intensity; ///< Intensity values indexed (iy,ix)
	PhysicalScale m_scale; ///< Physical scale of the samples
	double m_residualImaginary; ///< Largest ratio |Im|/|Re| found when forming the intensity
	double m_normalization; ///< Product of all baselines applied by normalize()
};

#endif /* _OBSERVER_FIELD_HXX_ */
