/*
 * Occulter.hxx
 *
 *  Created on: 4 Sep 2025
 */

////////////////////////////////////////////////////////////////////////
/// @brief Description of an occulting object
///
/// An occulter is either a ring segment, described by its radial width
/// and transmission profile, or an opaque solid body, described by the
/// semi-axes of its elliptical outline.
///
////////////////////////////////////////////////////////////////////////

#ifndef _OCCULTER_HXX_
#define _OCCULTER_HXX_

#include <string>

#include "TransmissionProfile.hxx"

class Occulter {
public:

	/// @brief enum to define the type of occulting object
	enum OcculterType{ring,     ///< ring segment with a radial transmission profile
					  solidBody ///< opaque elliptical body
	};

	/** *************************************************************************
	 *  @brief Constructor for a ring segment
	 *
	 *  @param [in] name  Name of the occulter
	 *  @param [in] ringWidth  Radial width of the ring (km)
	 *  @param [in] profile  Radial transmission profile of the ring
	 */
	Occulter(std::string name, double ringWidth, const TransmissionProfile & profile) :
		m_name(name), m_type(ring), m_ringWidth(ringWidth), m_semiAxisX(0.), m_semiAxisY(0.),
		m_profile(new TransmissionProfile(profile)) {};

	/** *************************************************************************
	 *  @brief Constructor for a solid body
	 *
	 *  @param [in] name  Name of the occulter
	 *  @param [in] semiAxisX  Semi-axis of the body along the x direction (km)
	 *  @param [in] semiAxisY  Semi-axis of the body along the y direction (km)
	 */
	Occulter(std::string name, double semiAxisX, double semiAxisY) :
		m_name(name), m_type(solidBody), m_ringWidth(0.), m_semiAxisX(semiAxisX), m_semiAxisY(semiAxisY),
		m_profile(nullptr) {};

	virtual ~Occulter() {delete m_profile;}

	/// @brief Returns the name of the occulter
	std::string getName() const {return m_name;}

	/// @brief Returns the type of the occulter
	OcculterType getType() const {return m_type;}

	/// @brief Returns the radial width of the ring (km)
	double getRingWidth() const {return m_ringWidth;}

	/// @brief Returns the semi-axis of the body along the x direction (km)
	double getSemiAxisX() const {return m_semiAxisX;}

	/// @brief Returns the semi-axis of the body along the y direction (km)
	double getSemiAxisY() const {return m_semiAxisY;}

	/// @brief Returns the radial transmission profile. Throws if the occulter is not a ring.
	const TransmissionProfile & getTransmissionProfile() const;

private:
	Occulter(const Occulter &);
	Occulter & operator=(const Occulter &);

	std::string m_name; ///< Name of the occulter
	OcculterType m_type; ///< Type of the occulter
	double m_ringWidth; ///< Radial width of the ring (km)
	double m_semiAxisX; ///< Semi-axis of the body along the x direction (km)
	double m_semiAxisY; ///< Semi-axis of the body along the y direction (km)
	TransmissionProfile * m_profile; ///< Radial transmission profile (ring only)
};

#endif /* _OCCULTER_HXX_ */
