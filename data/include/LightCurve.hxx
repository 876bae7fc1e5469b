/*
 * LightCurve.hxx
 *
 *  Created on: 4 Sep 2025
 */

////////////////////////////////////////////////////////////////////////
/// @brief Normalized occultation light curve
///
/// Ordered sequence of (time, normalized flux) pairs extracted from one
/// row of an ObserverField. Time zero corresponds to the on-axis sample.
/// The baseline used for the normalization and the physical scale and
/// event velocity used to derive the time axis are kept for output.
///
////////////////////////////////////////////////////////////////////////

#ifndef _LIGHT_CURVE_HXX_
#define _LIGHT_CURVE_HXX_

#include <string>
#include <vector>

#include "boost/math/tools/stats.hpp"

#include "PhysicalScale.hxx"

class LightCurve {
public:

	/** *************************************************************************
	 *  @brief Constructor
	 *
	 *  @param [in] name  Name of the occulter from which the light curve was generated
	 *  @param [in] times  Time of each sample relative to the on-axis sample (s)
	 *  @param [in] fluxes  Normalized flux of each sample
	 *  @param [in] baseline  Intensity by which the extracted row was divided
	 *  @param [in] scale  Physical scale of the observer field
	 *  @param [in] eventVelocity  Relative transverse velocity (km/s)
	 */
	LightCurve(std::string name, const std::vector<double> & times, const std::vector<double> & fluxes,
			   double baseline, const PhysicalScale & scale, double eventVelocity);
	virtual ~LightCurve() {};

	/// @brief Returns the name of the occulter from which the light curve was generated
	std::string getName() const {return m_name;}

	/// @brief Returns the time of each sample (s)
	const std::vector<double> & getTimes() const {return m_times;}

	/// @brief Returns the normalized flux of each sample
	const std::vector<double> & getFluxes() const {return m_fluxes;}

	/// @brief Returns the number of samples
	unsigned size() const {return m_fluxes.size();}

	/// @brief Returns the intensity by which the extracted row was divided
	double getBaseline() const {return m_baseline;}

	/// @brief Returns the physical scale of the observer field
	const PhysicalScale & getPhysicalScale() const {return m_scale;}

	/// @brief Returns the relative transverse velocity (km/s)
	double getEventVelocity() const {return m_eventVelocity;}

	/// @brief Returns the time step between adjacent samples (s)
	double getTimeStep() const {return m_scale.getGridSize()/m_eventVelocity;}

	/// @brief Returns the minimum normalized flux
	double getMinimumFlux() const {return m_fluxStats.min();}

	/// @brief Returns the maximum normalized flux
	double getMaximumFlux() const {return m_fluxStats.max();}

	/// @brief Returns the time of the sample with the minimum flux (s). The earliest is returned in case of a tie.
	double getTimeOfMinimum() const;

	/** *************************************************************************
	 *  @brief Returns the statistics of the flux over the window of samples
	 *  	   [first,last)
	 *
	 *  @param [in] first  Index of the first sample in the window
	 *  @param [in] last  Index one beyond the last sample in the window
	 */
	boost::math::tools::stats<double> getFluxStatistics(unsigned first, unsigned last) const;

	/// @brief Returns the mean normalized flux over the window of samples [first,last)
	double getMeanFlux(unsigned first, unsigned last) const {return getFluxStatistics(first,last).mean();}

	/// @brief Returns the sample standard deviation of the normalized flux over the window of samples [first,last)
	double getFluxStandardDeviation(unsigned first, unsigned last) const;

private:
	std::string m_name; ///< Name of the occulter
	std::vector<double> m_times; ///< Time of each sample (s)
	std::vector<double> m_fluxes; ///< Normalized flux of each sample
	double m_baseline; ///< Intensity by which the extracted row was divided
	PhysicalScale m_scale; ///< Physical scale of the observer field
	double m_eventVelocity; ///< Relative transverse velocity (km/s)
	boost::math::tools::stats<double> m_fluxStats; ///< Statistics over all samples
};

#endif /* _LIGHT_CURVE_HXX_ */
