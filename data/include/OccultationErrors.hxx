/*
 * OccultationErrors.hxx
 *
 *  Created on: 2 Sep 2025
 */

////////////////////////////////////////////////////////////////////////
/// @brief Exception types for precondition violations in the aperture
///        construction and diffraction propagation
///
/// Both are thrown at the boundary of the component whose precondition
/// is violated and are never clamped or silently corrected.
///
////////////////////////////////////////////////////////////////////////

#ifndef _OCCULTATION_ERRORS_HXX_
#define _OCCULTATION_ERRORS_HXX_

#include <stdexcept>
#include <string>

/// @brief Thrown when a transmission profile is evaluated outside its tabulated radial range
class DomainError: public std::domain_error {
public:
	explicit DomainError(const std::string & message) : std::domain_error(message) {};
};

/// @brief Thrown when an aperture is not square or its side length is not a positive even integer
class ShapeError: public std::invalid_argument {
public:
	explicit ShapeError(const std::string & message) : std::invalid_argument(message) {};
};

#endif /* _OCCULTATION_ERRORS_HXX_ */
