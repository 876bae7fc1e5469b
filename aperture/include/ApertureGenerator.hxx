/*
 * ApertureGenerator.hxx
 *
 *  Created on: 9 Sep 2025
 */

#ifndef _APERTURE_GENERATOR_HXX_
#define _APERTURE_GENERATOR_HXX_

#include "simulator/include/Module.hxx"
#include "ApertureBuilder.hxx"

/** *************************************************************************
 *  @brief This module builds the aperture of the current occulter and
 *  	   stores it in the data, replacing the aperture of the previous
 *  	   occulter. The wavelength, distance and number of points are
 *  	   common to all occulters.
 */
class ApertureGenerator: public Module {
public:
	ApertureGenerator() : Module("ApertureGenerator",occulterLoop), m_builder(nullptr) {};
	virtual ~ApertureGenerator() {delete m_builder;}

	void initialize(const ModuleParams & params);
	void process(Data * data, int occulterIndex) const;

private:
	ApertureGenerator(const ApertureGenerator &);
	ApertureGenerator & operator=(const ApertureGenerator &);

	ApertureBuilder * m_builder; ///< Builder fixing the physical scale of the apertures
};

#endif /* _APERTURE_GENERATOR_HXX_ */
