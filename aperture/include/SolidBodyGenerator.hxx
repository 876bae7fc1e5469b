/*
 * SolidBodyGenerator.hxx
 *
 *  Created on: 9 Sep 2025
 */

#ifndef _SOLID_BODY_GENERATOR_HXX_
#define _SOLID_BODY_GENERATOR_HXX_

#include "simulator/include/Module.hxx"

/** *************************************************************************
 *  @brief This module defines an opaque elliptical body, centred on the
 *  	   line of sight, and adds it to the list of occulters
 */
class SolidBodyGenerator: public Module {
public:
	SolidBodyGenerator() : Module("SolidBodyGenerator",begin), m_semiAxisX(0.), m_semiAxisY(0.) {};
	virtual ~SolidBodyGenerator() {};

	void initialize(const ModuleParams & params);
	void doBegin(Data * data);

private:
	std::string m_bodyName; ///< Name of the body, used to label the output
	double m_semiAxisX; ///< Semi-axis along x (km)
	double m_semiAxisY; ///< Semi-axis along y (km)
};

#endif /* _SOLID_BODY_GENERATOR_HXX_ */
