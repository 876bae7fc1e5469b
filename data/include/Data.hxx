/*
 * Data.hxx
 *
 *  Created on: 4 Sep 2025
 */

////////////////////////////////////////////////////////////////////////
/// @brief Data container for RingOccSim
///
/// A pointer to the data is passed as input argument to Module::process().
/// In this way all processing modules have access to all the data
/// available at the point where Module::process() is called.
///
/// The data consists of the following components, for which accessor
/// methods are provided:
///		1. vector<Occulter*>: The occulting objects to be simulated, added
///						   by the profile and solid body generator modules
///		2. Aperture: The aperture of the occulter currently being processed
///						   (null until set by ApertureGenerator)
///		3. ObserverField: The observer plane intensity for the current
///						   aperture (null until set by ObserverFieldGenerator)
///		4. vector<LightCurve>: The light curves generated so far, one per
///						   processed occulter
///
/// Only one aperture and one observer field are held at a time. Setting a
/// new one deletes the previous one, so that memory use does not grow with
/// the number of occulters.
///
////////////////////////////////////////////////////////////////////////

#ifndef _DATA_HXX_
#define _DATA_HXX_

#include <string>
#include <vector>

#include "Aperture.hxx"
#include "LightCurve.hxx"
#include "ObserverField.hxx"
#include "Occulter.hxx"

class Data {
public:

	/** *************************************************************************
	 *  @brief Constructor
	 *
	 *  @param [in] outputDirectory  Directory to which output files are written
	 *  @param [in] modulesToRun  Comma separated list of the modules to be run
	 */
	Data(std::string outputDirectory, std::string modulesToRun="");
	virtual ~Data();

	/// @brief Returns the directory to which output files are written
	std::string getOutputDirectory() const {return m_outputDirectory;}

	/// @brief Returns true if the specified module is in the list of modules to be run
	bool moduleIsActive(std::string moduleName) const;

	/// @brief Adds an occulter to the list. Data takes ownership.
	void addOcculter(Occulter * occulter);

	/// @brief Returns the list of occulters
	const std::vector<Occulter*> & getOcculters() const {return m_occulters;}

	/// @brief Returns the occulter with the specified index
	const Occulter * getOcculter(int index) const;

	/// @brief Sets the current aperture, deleting the previous one. Data takes ownership.
	void setAperture(Aperture * aperture);

	/// @brief Returns the current aperture (null if not yet set)
	const Aperture * getAperture() const {return m_aperture;}

	/// @brief Sets the current observer field, deleting the previous one. Data takes ownership.
	void setObserverField(ObserverField * field);

	/// @brief Returns the current observer field (null if not yet set)
	ObserverField * getObserverField() const {return m_observerField;}

	/// @brief Appends a light curve to the list
	void appendLightCurve(const LightCurve & lightCurve) {m_lightCurves.push_back(lightCurve);}

	/// @brief Returns the list of light curves
	const std::vector<LightCurve> & getLightCurves() const {return m_lightCurves;}

private:
	Data(const Data &);
	Data & operator=(const Data &);

	std::string m_outputDirectory; ///< Directory to which output files are written
	std::string m_modulesToRun; ///< Comma separated list of the modules to be run
	std::vector<Occulter*> m_occulters; ///< List of occulters
	Aperture * m_aperture; ///< Aperture of the occulter currently being processed
	ObserverField * m_observerField; ///< Observer plane intensity for the current aperture
	std::vector<LightCurve> m_lightCurves; ///< Light curves generated so far
};

#endif /* _DATA_HXX_ */
