/*
 * TransmissionProfileGenerator.hxx
 *
 *  Created on: 9 Sep 2025
 */

#ifndef _TRANSMISSION_PROFILE_GENERATOR_HXX_
#define _TRANSMISSION_PROFILE_GENERATOR_HXX_

#include "boost/lexical_cast.hpp"

#include "simulator/include/Module.hxx"

/** *************************************************************************
 *  @brief This module defines a ring occulter from its radial optical
 *  	   depth profile and adds it to the data.
 *
 *  The profile shape is one of:
 *  	- flat: constant optical depth across the ring
 *  	- centralPeak: parabolic, with the configured optical depth at the
 *  	  ring midline tapering to zero at the edges
 *  	- edgePeak: parabolic, with the configured optical depth at the ring
 *  	  edges and zero at the midline
 *  	- table: (radial offset, optical depth) pairs read from a text file
 *
 *  One instance is created per ring, with the ring index appended to the
 *  module name as _profileN.
 */
class TransmissionProfileGenerator: public Module {
public:
	TransmissionProfileGenerator(unsigned profileIndex) :
		Module("TransmissionProfileGenerator_profile"+boost::lexical_cast<std::string>(profileIndex),begin),
		m_profileIndex(profileIndex), m_ringWidth(0.), m_profile(nullptr) {};
	virtual ~TransmissionProfileGenerator() {delete m_profile;}

	void initialize(const ModuleParams & params);
	void doBegin(Data * data);

	/// @brief Returns the transmission profile (null before initialize)
	const TransmissionProfile * getTransmissionProfile() const {return m_profile;}

private:
	TransmissionProfileGenerator(const TransmissionProfileGenerator &);
	TransmissionProfileGenerator & operator=(const TransmissionProfileGenerator &);

	unsigned m_profileIndex; ///< Index of the ring
	std::string m_profileName; ///< Name of the ring, used to label the output
	double m_ringWidth; ///< Radial width of the ring (km)
	TransmissionProfile * m_profile; ///< Radial transmission profile of the ring
};

#endif /* _TRANSMISSION_PROFILE_GENERATOR_HXX_ */
