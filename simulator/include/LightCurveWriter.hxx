/*
 * LightCurveWriter.hxx
 *
 *  Created on: 12 Sep 2025
 */

#ifndef _LIGHT_CURVE_WRITER_HXX_
#define _LIGHT_CURVE_WRITER_HXX_

#include "simulator/include/Module.hxx"

/** *************************************************************************
 *  @brief This module writes the light curves to text files and prints a
 *  	   summary of each.
 *
 *  For each light curve, <outputDirectory>/light_curves/<name>_lightCurve.txt
 *  contains header lines starting with # followed by one line per sample
 *  with the time in seconds and the normalized flux. Optionally the radial
 *  transmission profile of each ring is written to
 *  <outputDirectory>/profiles/<name>_profile.txt.
 */
class LightCurveWriter: public Module {
public:
	LightCurveWriter() : Module("LightCurveWriter",end), m_writeTransmissionProfiles(false) {};
	virtual ~LightCurveWriter() {};

	void initialize(const ModuleParams & params);
	void doBegin(Data * data);
	void doEnd(Data * data) const;

	/// @brief Returns the name of the file to which the light curve with the specified name is written
	static std::string lightCurveFilename(const Data * data, const std::string & name);

	/// @brief Returns the name of the file to which the profile of the ring with the specified name is written
	static std::string profileFilename(const Data * data, const std::string & name);

private:

	/** *************************************************************************
	 *  @brief Writes a light curve to file
	 *
	 *  @param [in] lightCurve  The light curve
	 *  @param [in] filename  Name of the output file
	 */
	void writeLightCurve(const LightCurve & lightCurve, const std::string & filename) const;

	/** *************************************************************************
	 *  @brief Writes the radial profile of a ring to file
	 *
	 *  @param [in] occulter  The ring
	 *  @param [in] filename  Name of the output file
	 */
	void writeTransmissionProfile(const Occulter & occulter, const std::string & filename) const;

	bool m_writeTransmissionProfiles; ///< Flag to indicate whether the radial profiles of the rings should be written
};

#endif /* _LIGHT_CURVE_WRITER_HXX_ */
