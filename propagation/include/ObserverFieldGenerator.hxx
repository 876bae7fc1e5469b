/*
 * ObserverFieldGenerator.hxx
 *
 *  Created on: 10 Sep 2025
 */

#ifndef _OBSERVER_FIELD_GENERATOR_HXX_
#define _OBSERVER_FIELD_GENERATOR_HXX_

#include "simulator/include/Module.hxx"
#include "DiffractionPropagator.hxx"

/** *************************************************************************
 *  @brief This module propagates the current aperture to the observer's
 *  	   plane and stores the resulting intensity in the data.
 *
 *  A residual imaginary component of the squared field above the
 *  configured tolerance is reported as a warning. Processing continues
 *  with the real part.
 */
class ObserverFieldGenerator: public Module {
public:
	ObserverFieldGenerator() : Module("ObserverFieldGenerator",occulterLoop), m_propagator(nullptr) {};
	virtual ~ObserverFieldGenerator() {delete m_propagator;}

	void initialize(const ModuleParams & params);
	void process(Data * data, int occulterIndex) const;

private:
	ObserverFieldGenerator(const ObserverFieldGenerator &);
	ObserverFieldGenerator & operator=(const ObserverFieldGenerator &);

	DiffractionPropagator * m_propagator; ///< Propagator configured with the imaginary tolerance
};

#endif /* _OBSERVER_FIELD_GENERATOR_HXX_ */
