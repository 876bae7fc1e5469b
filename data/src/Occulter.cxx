/*
 * Occulter.cxx
 *
 *  Created on: 4 Sep 2025
 */

#include <stdexcept>

#include "Occulter.hxx"

using namespace std;

const TransmissionProfile & Occulter::getTransmissionProfile() const {
	if (m_profile == nullptr) throw runtime_error("Error in Occulter::getTransmissionProfile: occulter "+m_name+" is not a ring");
	return *m_profile;
}
