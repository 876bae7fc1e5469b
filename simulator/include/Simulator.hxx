/*
 * Simulator.hxx
 *
 *  Created on: 12 Sep 2025
 */

////////////////////////////////////////////////////////////////////////
/// @brief This class is used to configure and run RingOccSim.
///
/// The configuration is passed to the Simulator constructor through a
/// SimulationParams instance, in turn constructed from the configuration
/// xml file. The following global parameters must be provided in the
/// configuration file:
///		1. modulesToRun (string): Comma separated list of the names
///								  of modules to be run
///		2. outputDirectory (string): Directory to which output files are written
///		3. A \<module\> parameter set for each module.  The name
///		   attribute must match:
///				(a) the name in modulesToRun
///				(b) the name mapping to module to the corresponding class
///					instantiation in ModuleRegistry::addModule(string name).
///		   Refer to the documentation of the relevant module(s) for module
///		   specific parameters.
///
/// Once the Simulator constructor has been called, RingOccSim is run by calling the
/// method Simulator::process().  Module::doBegin() is called for all modules,
/// in the order defined in modulesToRun, which defines the list of occulters.
/// Then, for each occulter, Module::process() is called for each module with
/// Module::Schedule=occulterLoop. Finally Module::doEnd() is called for all
/// modules.
///
/// Instantiation of the classes deriving from Module is performed in
/// ModuleRegistry::addModule(string name).  New modules classes thus need
/// to be instantiated there - see ModuleRegistry documentation for details.
///
////////////////////////////////////////////////////////////////////////

#ifndef _SIMULATOR_HXX_
#define _SIMULATOR_HXX_

#include <vector>

#include "Module.hxx"

class Simulator {
public:

	/////////////////////////////////////////////////////////////////////////////////
	/// @brief Constructor takes the configuration as input
	///
	/// @param [in] params:  Pointer to the configuration read in from the xml file
	Simulator(const ParamsPtr params);
	virtual ~Simulator();

	/// @brief Runs the Simulator by initializing and running all Modules
	void process();

	/// @brief Returns the list of modules in the ModuleRegistry
	std::vector<Module*> getModules() {return m_modules; }

	/// @brief Returns the data
	const Data * getData() const {return m_data;}

private:

	/// @brief Initializes the member instance of Data and the output directory
	void initialize();
	/// @brief Initializes all modules
	void initializeModules();
	/// @brief Runs the method Module::doBegin() for all modules
	void processBegin();
	/// @brief Loops over occulters and for each occulter runs the method Module::process()
	///        for all modules with Module::Schedule=occulterLoop
	void processOcculterLoop();
	/// @brief Runs the method Module::doEnd() for all modules
	void processEnd();

	const ParamsPtr m_params; ///< Configuration read in from the xml file
	std::vector<Module*> m_modules; ///< List of modules to be run
	Data * m_data; ///< Pointer to the Data
	bool m_modulesInitialized; ///< Flag to indicate whether or not modules have been initialized
};

#endif /* _SIMULATOR_HXX_ */
