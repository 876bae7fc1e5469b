/*
 * ObserverField.cxx
 *
 *  Created on: 3 Sep 2025
 */

#include <stdexcept>
#include <string>

#include "ObserverField.hxx"

using namespace std;

vector<double> ObserverField::getRow(int iy) const {

	if (iy < 0 || iy >= m_intensity.rows()) {
		throw runtime_error("Error in ObserverField::getRow: row index "+to_string(iy)+" out of range [0,"+to_string(m_intensity.rows())+")");
	}

	vector<double> row(m_intensity.cols());
	for (int ix=0; ix<m_intensity.cols(); ix++) row[ix] = m_intensity(iy,ix);
	return row;

}

void ObserverField::normalize(double baseline) {

	if (!(baseline > 0.)) throw runtime_error("Error in ObserverField::normalize: baseline must be positive. Value is "+to_string(baseline));

	m_intensity /= baseline;
	m_normalization *= baseline;

}
