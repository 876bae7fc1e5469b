/*
 * LightCurveGenerator.hxx
 *
 *  Created on: 11 Sep 2025
 */

#ifndef _LIGHT_CURVE_GENERATOR_HXX_
#define _LIGHT_CURVE_GENERATOR_HXX_

#include "simulator/include/Module.hxx"
#include "simulator/include/LightCurveExtractor.hxx"

/** *************************************************************************
 *  @brief This module extracts the normalized light curve of the current
 *  	   occulter from the observer field, normalizes the field to the
 *  	   same baseline, and appends the light curve to the data
 */
class LightCurveGenerator: public Module {
public:
	LightCurveGenerator() : Module("LightCurveGenerator",occulterLoop), m_extractor(nullptr) {};
	virtual ~LightCurveGenerator() {delete m_extractor;}

	void initialize(const ModuleParams & params);
	void process(Data * data, int occulterIndex) const;

private:
	LightCurveGenerator(const LightCurveGenerator &);
	LightCurveGenerator & operator=(const LightCurveGenerator &);

	LightCurveExtractor * m_extractor; ///< Extraction row, baseline window and event velocity
};

#endif /* _LIGHT_CURVE_GENERATOR_HXX_ */
