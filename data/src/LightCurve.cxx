/*
 * LightCurve.cxx
 *
 *  Created on: 4 Sep 2025
 */

#include <cmath>
#include <stdexcept>

#include "LightCurve.hxx"

using namespace std;

LightCurve::LightCurve(string name, const vector<double> & times, const vector<double> & fluxes,
					   double baseline, const PhysicalScale & scale, double eventVelocity) :
		m_name(name), m_times(times), m_fluxes(fluxes), m_baseline(baseline), m_scale(scale), m_eventVelocity(eventVelocity) {

	if (m_times.size() != m_fluxes.size()) {
		throw invalid_argument("Error in LightCurve: number of times ("+to_string(m_times.size())+
							   ") does not match number of fluxes ("+to_string(m_fluxes.size())+")");
	}
	if (m_fluxes.empty()) throw invalid_argument("Error in LightCurve: light curve "+m_name+" is empty");

	for (unsigned i=0; i<m_fluxes.size(); i++) m_fluxStats.add(m_fluxes[i]);

}

double LightCurve::getTimeOfMinimum() const {

	unsigned iMin = 0;
	for (unsigned i=1; i<m_fluxes.size(); i++) {
		if (m_fluxes[i] < m_fluxes[iMin]) iMin = i;
	}
	return m_times[iMin];

}

boost::math::tools::stats<double> LightCurve::getFluxStatistics(unsigned first, unsigned last) const {

	if (first >= last || last > m_fluxes.size()) {
		throw runtime_error("Error in LightCurve::getFluxStatistics: invalid window ["+to_string(first)+","+to_string(last)+
							") for light curve with "+to_string(m_fluxes.size())+" samples");
	}

	boost::math::tools::stats<double> fluxStats;
	for (unsigned i=first; i<last; i++) fluxStats.add(m_fluxes[i]);
	return fluxStats;

}

double LightCurve::getFluxStandardDeviation(unsigned first, unsigned last) const {

	boost::math::tools::stats<double> fluxStats = getFluxStatistics(first,last);
	if (fluxStats.count() < 2) return 0.;
	return sqrt(fluxStats.variance1());

}
