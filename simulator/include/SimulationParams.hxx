/*
 * SimulationParams.hxx
 *
 *  Created on: 5 Sep 2025
 */

////////////////////////////////////////////////////////////////////////
/// @brief Configuration parameters for RingOccSim
///
/// The configuration is read from an xml file of the following form:
///
///		<RingOccSim>
///			<global>
///				<modulesToRun>ModuleA,ModuleB</modulesToRun>
///				<outputDirectory>output</outputDirectory>
///			</global>
///			<module name="ModuleA">
///				<parameterName>value</parameterName>
///			</module>
///		</RingOccSim>
///
/// The global parameters are accessed directly via the GetAs methods of
/// SimulationParams. The parameters of each module are accessed via the
/// ModuleParams returned by SimulationParams::Module(name), where name
/// matches the name attribute of the module element.
///
/// Requesting a parameter which is missing, or which cannot be converted
/// to the requested type, throws std::runtime_error.
///
////////////////////////////////////////////////////////////////////////

#ifndef _SIMULATION_PARAMS_HXX_
#define _SIMULATION_PARAMS_HXX_

#include <iostream>
#include <map>
#include <memory>
#include <string>

#include "boost/property_tree/ptree.hpp"

class ModuleParams {
public:

	/** *************************************************************************
	 *  @brief Constructor
	 *
	 *  @param [in] name  Name of the parameter set, used in error messages
	 *  @param [in] tree  Property tree containing one child per parameter
	 */
	ModuleParams(std::string name, const boost::property_tree::ptree & tree) : m_name(name), m_tree(tree) {};
	virtual ~ModuleParams() {};

	/// @brief Returns the name of the parameter set
	std::string getName() const {return m_name;}

	/// @brief Returns true if a parameter with the specified name is present
	bool HasParam(const std::string & paramName) const {return m_tree.count(paramName) > 0;}

	/// @brief Returns the value of the specified parameter as a double
	double GetAsDouble(const std::string & paramName) const {return get<double>(paramName,"double");}

	/// @brief Returns the value of the specified parameter as an int
	int GetAsInt(const std::string & paramName) const {return get<int>(paramName,"int");}

	/// @brief Returns the value of the specified parameter as a bool (true/false or 1/0)
	bool GetAsBool(const std::string & paramName) const {return get<bool>(paramName,"bool");}

	/// @brief Returns the value of the specified parameter as a string
	std::string GetAsString(const std::string & paramName) const {return get<std::string>(paramName,"string");}

private:
	template<typename T> T get(const std::string & paramName, const std::string & typeName) const;

	std::string m_name; ///< Name of the parameter set
	boost::property_tree::ptree m_tree; ///< Parameter values
};

class SimulationParams {
public:

	/** *************************************************************************
	 *  @brief Constructor from the property tree of a full configuration file
	 *
	 *  @param [in] tree  Property tree with a single RingOccSim root element
	 */
	SimulationParams(const boost::property_tree::ptree & tree);
	virtual ~SimulationParams() {};

	/// @brief Returns the value of the specified global parameter as a double
	double GetAsDouble(const std::string & paramName) const {return m_global.GetAsDouble(paramName);}

	/// @brief Returns the value of the specified global parameter as an int
	int GetAsInt(const std::string & paramName) const {return m_global.GetAsInt(paramName);}

	/// @brief Returns the value of the specified global parameter as a bool
	bool GetAsBool(const std::string & paramName) const {return m_global.GetAsBool(paramName);}

	/// @brief Returns the value of the specified global parameter as a string
	std::string GetAsString(const std::string & paramName) const {return m_global.GetAsString(paramName);}

	/// @brief Returns true if a parameter set exists for the specified module
	bool HasModule(const std::string & moduleName) const {return m_modules.count(moduleName) > 0;}

	/// @brief Returns the parameter set of the specified module. Throws if there is none.
	const ModuleParams & Module(const std::string & moduleName) const;

private:
	ModuleParams m_global; ///< Global parameters
	std::map<std::string,ModuleParams> m_modules; ///< Parameter set for each module, keyed by module name
};

typedef std::shared_ptr<const SimulationParams> ParamsPtr;

/** *************************************************************************
 *  @brief Reads the configuration from an xml stream
 *
 *  @param [in] xml  Input stream containing the configuration xml
 */
ParamsPtr readSimulationParams(std::istream & xml);

/** *************************************************************************
 *  @brief Reads the configuration from an xml file
 *
 *  @param [in] filename  Name of the configuration file
 */
ParamsPtr readSimulationParams(const std::string & filename);

/** *************************************************************************
 *  @brief Parses the command line and reads the configuration file it
 *  	   names via --conf (default conf/ringOccSim.xml)
 *
 *  @param [in] argc  Number of command line arguments
 *  @param [in] argv  Command line arguments
 *  @return the configuration, or a null pointer if only --help was requested
 */
ParamsPtr RingOccSimInit(int argc, char * argv []);

#endif /* _SIMULATION_PARAMS_HXX_ */
