/*
 * Module.hxx
 *
 *  Created on: 5 Sep 2025
 */

////////////////////////////////////////////////////////////////////////
/// @brief Base class for all RingOccSim modules.
///
/// Classes derived from Module should be instantiated in
/// ModuleRegistry::addModule(string name) where the argument is the name
/// of the module as it appears in the configuration xml file.
///
////////////////////////////////////////////////////////////////////////

#ifndef _MODULE_HXX_
#define _MODULE_HXX_

#include <string>

#include "simulator/include/SimulationParams.hxx"
#include "data/include/Data.hxx"

class Module {
public:

	/// @brief enum to define the scheduling of the module in Simulator::process()
	enum SCHEDULE{begin,        ///< module should run before the occulter loop
		          occulterLoop, ///< module should run for each occulter (default)
		          end           ///< module should run after the occulter loop
	};

	/////////////////////////////////////////////////////////////////////////////////
	/// @brief Constructor initializes module name and scheduling
	///
	/// @param [in] name:  String specifying the name of the module as it appears in the
	///                    configuration xml file
	/// @param [in] schedule:  enum (Module::SCHEDULE) with one of the following values:
	///                 - begin if the module should run before the occulter loop
	///                 - occulterLoop if the module should run for each occulter (default)
	///                 - end if the module should run after the occulter loop
	Module(std::string name,SCHEDULE schedule=occulterLoop) : m_name(name),m_schedule(schedule) {};

	virtual ~Module() {};

	////////////////////////////////////////////////////////////////////////////////
	/// @brief Initialize the module by reading in parameters from the configuration file
    ///
	/// @param [in] params:  Parameters of the module read in from the configuration xml file
	virtual void initialize(const ModuleParams & params) = 0;

	////////////////////////////////////////////////////////////////////////////////
	/// @brief Further module initialization with access to data initialized by other modules.
	///        Called after all modules have been initialized, in the order of modulesToRun
	///
	/// @param [in] data:  Pointer to the data
	virtual void doBegin(Data * data) {};

	////////////////////////////////////////////////////////////////////////////////
	/// @brief Processing of the data.  Called for each occulter if Module::Schedule
	///        is occulterLoop (default), otherwise not called.
	///
	/// @param [in] data:  Pointer to the data
	/// @param [in] occulterIndex:  Index of the current occulter in Data::getOcculters()
	virtual void process(Data * data, int occulterIndex) const {};

	////////////////////////////////////////////////////////////////////////////////
	/// @brief For processing of data after the occulter loop (output)
	///
	/// @param [in] data:  Pointer to the data
	virtual void doEnd(Data * data) const {};

	/// @brief Returns the name of the module
	std::string getName() const {return m_name;}

	/// @brief Returns the scheduling of the module in the processing sequence
	SCHEDULE schedule() const {return m_schedule;}

protected:
	std::string m_name; ///< Name of the module
	SCHEDULE m_schedule; ///< Scheduling of the module in the processing sequence
};

#endif /* _MODULE_HXX_ */
