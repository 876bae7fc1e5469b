/*
 * ModuleRegistry.hxx
 *
 *  Created on: 12 Sep 2025
 */

////////////////////////////////////////////////////////////////////////
/// @brief Builds the module pipeline of the ring occultation simulator
///		   from the global parameter modulesToRun
///
/// modulesToRun is split on commas, spaces, tabs and newlines, so the list
/// may be laid out one module per line in the xml file. Modules are created
/// in the order listed. The recognized names are
///		TransmissionProfileGenerator_profileN  (radial profile of ring N, schedule begin)
///		SolidBodyGenerator                     (elliptical occulter, schedule begin)
///		ApertureGenerator                      (aperture of each occulter, schedule occulterLoop)
///		ObserverFieldGenerator                 (Fresnel propagation, schedule occulterLoop)
///		LightCurveGenerator                    (light curve extraction, schedule occulterLoop)
///		LightCurveWriter                       (output files, schedule end)
///
/// TransmissionProfileGenerator requires the _profileN suffix, where N is a
/// non-negative integer matching the name attribute of its \<module\> element.
/// The suffix is rejected on every other module. An unrecognized name, a
/// missing suffix or a non-numeric index throws a runtime_error naming the
/// offending entry, and no module is added for it.
///
////////////////////////////////////////////////////////////////////////

#ifndef _MODULE_REGISTRY_HXX_
#define _MODULE_REGISTRY_HXX_

#include <vector>

#include "Module.hxx"

class ModuleRegistry {
public:
	ModuleRegistry() {};
	virtual ~ModuleRegistry() {};

	/// @brief Appends one module per entry of modulesToRun in params
	void instanciateModules(const ParamsPtr params);

	/// @brief Returns the modules in pipeline order. The caller (Simulator) deletes them.
	std::vector<Module*> getModules() {return m_modules;}

private:
	/// @brief Creates the module for one modulesToRun entry, splitting off any _profileN suffix
	void addModule(std::string name);

	std::vector<Module*> m_modules; ///< Modules in the order listed in modulesToRun
};

#endif /* _MODULE_REGISTRY_HXX_ */
