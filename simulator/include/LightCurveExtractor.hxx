/*
 * LightCurveExtractor.hxx
 *
 *  Created on: 11 Sep 2025
 */

#ifndef _LIGHT_CURVE_EXTRACTOR_HXX_
#define _LIGHT_CURVE_EXTRACTOR_HXX_

#include <string>
#include <vector>

#include "data/include/LightCurve.hxx"
#include "data/include/ObserverField.hxx"

/** *************************************************************************
 *  @brief Extracts a normalized light curve from one row of an observer
 *  	   field
 *
 *  	   The row runs perpendicular to the ring, along the track of the
 *  	   relative motion. The baseline is the median intensity of the row
 *  	   over the out-of-event window of samples [baselineStart,baselineEnd),
 *  	   which must be free of diffraction structure from the occulter.
 *  	   Sample i is assigned the time (i-npts/2)*gridSize/eventVelocity.
 */
class LightCurveExtractor {
public:

	/** *************************************************************************
	 *  @brief Constructor
	 *
	 *  @param [in] extractionRow  Index of the row to extract. A negative value
	 *  						   selects the centre row npts/2.
	 *  @param [in] baselineStart  Index of the first sample of the baseline window
	 *  @param [in] baselineEnd  Index one beyond the last sample of the baseline window
	 *  @param [in] eventVelocity  Relative transverse velocity (km/s, must be positive)
	 */
	LightCurveExtractor(int extractionRow, int baselineStart, int baselineEnd, double eventVelocity);
	virtual ~LightCurveExtractor() {};

	/// @brief Returns the index of the row extracted from a field with npts samples on a side
	int getExtractionRow(int numberOfPoints) const;

	/// @brief Returns the relative transverse velocity (km/s)
	double getEventVelocity() const {return m_eventVelocity;}

	/** *************************************************************************
	 *  @brief Returns the median of the values in the baseline window
	 *
	 *  @param [in] row  Intensity values along the extracted row
	 */
	double baseline(const std::vector<double> & row) const;

	/// @brief Returns the time (s) of each sample of a row with the specified physical scale
	std::vector<double> timeAxis(const PhysicalScale & scale) const;

	/** *************************************************************************
	 *  @brief Extracts the light curve without modifying the field
	 *
	 *  @param [in] field  Observer plane intensity
	 *  @param [in] name  Name of the occulter, used to label the light curve
	 */
	LightCurve extract(const ObserverField & field, std::string name) const;

	/** *************************************************************************
	 *  @brief Extracts the light curve and divides the full field by the same
	 *  	   baseline, so that the unocculted intensity of the field reads 1
	 *
	 *  @param [in] field  Observer plane intensity
	 *  @param [in] name  Name of the occulter, used to label the light curve
	 */
	LightCurve extractAndNormalize(ObserverField & field, std::string name) const;

private:
	int m_extractionRow; ///< Index of the row to extract (negative for the centre row)
	int m_baselineStart; ///< Index of the first sample of the baseline window
	int m_baselineEnd; ///< Index one beyond the last sample of the baseline window
	double m_eventVelocity; ///< Relative transverse velocity (km/s)
};

#endif /* _LIGHT_CURVE_EXTRACTOR_HXX_ */
