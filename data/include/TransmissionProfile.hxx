/*
 * TransmissionProfile.hxx
 *
 *  Created on: 2 Sep 2025
 */

////////////////////////////////////////////////////////////////////////
/// @brief Radial transmission profile of a ring
///
/// The profile is defined by an ordered table of optical depths as a
/// function of signed radial offset (km) from the ring's midline. The
/// transmitted fraction exp(-tau) is linearly interpolated between the
/// tabulated offsets. The profile is only defined within the tabulated
/// range: evaluation outside it throws DomainError. Callers must therefore
/// tabulate the full in-ring offset range implied by the ring width.
///
/// Factory methods are provided for the flat and parabolic profiles and
/// for a profile read from a text file.
///
////////////////////////////////////////////////////////////////////////

#ifndef _TRANSMISSION_PROFILE_HXX_
#define _TRANSMISSION_PROFILE_HXX_

#include <functional>
#include <string>
#include <vector>

/// @brief Function mapping signed radial offset (km) from the ring midline to transmitted light fraction
typedef std::function<double(double)> TransmissionFunction;

class TransmissionProfile {
public:

	/** *************************************************************************
	 *  @brief Constructor from tabulated optical depths
	 *
	 *  @param [in] radialOffset  Strictly increasing signed radial offsets from the
	 *  						  ring midline (km). At least two values are required.
	 *  @param [in] opticalDepth  Non-negative optical depth at each radial offset
	 */
	TransmissionProfile(const std::vector<double> & radialOffset, const std::vector<double> & opticalDepth);
	virtual ~TransmissionProfile() {};

	/** *************************************************************************
	 *  @brief Returns the transmitted fraction at the specified radial offset
	 *
	 *  @param [in] offset  Signed radial offset from the ring midline (km)
	 *  @return interpolated value of exp(-tau)
	 */
	double operator()(double offset) const {return transmission(offset);}

	/// @brief Returns the transmitted fraction at the specified radial offset (km)
	double transmission(double offset) const;

	/// @brief Returns a TransmissionFunction wrapping a copy of the profile
	TransmissionFunction asFunction() const;

	/// @brief Returns the lowest tabulated radial offset (km)
	double getMinimumOffset() const {return m_radialOffset.front();}

	/// @brief Returns the highest tabulated radial offset (km)
	double getMaximumOffset() const {return m_radialOffset.back();}

	/// @brief Returns true if the specified radial offset lies within the tabulated range
	bool inDomain(double offset) const {return offset >= getMinimumOffset() && offset <= getMaximumOffset();}

	/// @brief Returns the tabulated radial offsets (km)
	const std::vector<double> & getRadialOffsets() const {return m_radialOffset;}

	/// @brief Returns the tabulated optical depths
	const std::vector<double> & getOpticalDepths() const {return m_opticalDepth;}

	/// @brief Returns the tabulated transmitted fractions exp(-tau)
	const std::vector<double> & getTransmissions() const {return m_transmission;}

	/** *************************************************************************
	 *  @brief Returns a profile with constant optical depth across the ring
	 *
	 *  @param [in] ringWidth  Width of the ring (km)
	 *  @param [in] nRadialSteps  Number of evenly spaced samples from -ringWidth/2 to +ringWidth/2
	 *  @param [in] opticalDepth  Optical depth
	 */
	static TransmissionProfile flat(double ringWidth, unsigned nRadialSteps, double opticalDepth);

	/** *************************************************************************
	 *  @brief Returns a parabolic profile, peaked at the midline and tapering
	 *  	   to zero optical depth at the ring edges
	 *
	 *  @param [in] ringWidth  Width of the ring (km)
	 *  @param [in] nRadialSteps  Number of evenly spaced samples from -ringWidth/2 to +ringWidth/2
	 *  @param [in] peakOpticalDepth  Optical depth at the midline
	 */
	static TransmissionProfile centralPeak(double ringWidth, unsigned nRadialSteps, double peakOpticalDepth);

	/** *************************************************************************
	 *  @brief Returns a parabolic profile, peaked at the ring edges with zero
	 *  	   optical depth at the midline
	 *
	 *  @param [in] ringWidth  Width of the ring (km)
	 *  @param [in] nRadialSteps  Number of evenly spaced samples from -ringWidth/2 to +ringWidth/2
	 *  @param [in] peakOpticalDepth  Optical depth at the ring edges
	 */
	static TransmissionProfile edgePeak(double ringWidth, unsigned nRadialSteps, double peakOpticalDepth);

	/** *************************************************************************
	 *  @brief Reads a profile from a text file containing one whitespace
	 *  	   separated (radial offset in km, optical depth) pair per line.
	 *  	   Lines starting with # are ignored.
	 *
	 *  @param [in] filename  Name of the file
	 */
	static TransmissionProfile readFromFile(const std::string & filename);

	/// @brief Returns nRadialSteps evenly spaced radial offsets from -ringWidth/2 to +ringWidth/2 inclusive
	static std::vector<double> radialSamples(double ringWidth, unsigned nRadialSteps);

private:

	/// @brief Parabola in offset^2 scaled to tauAtEdge at the ring edges and tauAtMidline at the sample nearest the midline
	static TransmissionProfile parabolic(double ringWidth, unsigned nRadialSteps, double tauAtEdge, double tauAtMidline);

	std::vector<double> m_radialOffset; ///< Tabulated radial offsets (km)
	std::vector<double> m_opticalDepth; ///< Tabulated optical depths
	std::vector<double> m_transmission; ///< exp(-tau) for each tabulated optical depth
};

#endif /* _TRANSMISSION_PROFILE_HXX_ */
