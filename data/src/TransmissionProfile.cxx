/*
 * TransmissionProfile.cxx
 *
 *  Created on: 2 Sep 2025
 */

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

#include "OccultationErrors.hxx"
#include "TransmissionProfile.hxx"

using namespace std;

TransmissionProfile::TransmissionProfile(const vector<double> & radialOffset, const vector<double> & opticalDepth) :
		m_radialOffset(radialOffset), m_opticalDepth(opticalDepth) {

	if (m_radialOffset.size() != m_opticalDepth.size()) {
		throw invalid_argument("Error in TransmissionProfile: number of radial offsets ("+to_string(m_radialOffset.size())+
							   ") does not match number of optical depths ("+to_string(m_opticalDepth.size())+")");
	}
	if (m_radialOffset.size() < 2) throw invalid_argument("Error in TransmissionProfile: at least two radial samples are required");

	for (unsigned i=0; i<m_radialOffset.size(); i++) {
		if (!std::isfinite(m_radialOffset[i])) throw invalid_argument("Error in TransmissionProfile: radial offsets must be finite");
		if (i>0 && !(m_radialOffset[i] > m_radialOffset[i-1])) {
			throw invalid_argument("Error in TransmissionProfile: radial offsets must be strictly increasing. Offset "+
								   to_string(m_radialOffset[i])+" follows "+to_string(m_radialOffset[i-1]));
		}
		if (!(m_opticalDepth[i] >= 0.) || !std::isfinite(m_opticalDepth[i])) {
			throw invalid_argument("Error in TransmissionProfile: optical depth must be finite and non-negative. Value at offset "+
								   to_string(m_radialOffset[i])+" is "+to_string(m_opticalDepth[i]));
		}
		m_transmission.push_back(exp(-m_opticalDepth[i]));
	}

}

double TransmissionProfile::transmission(double offset) const {

	if (!inDomain(offset)) {
		throw DomainError("Error in TransmissionProfile::transmission: radial offset "+to_string(offset)+" km is outside the profile range ["+
						  to_string(getMinimumOffset())+","+to_string(getMaximumOffset())+"] km");
	}

	//Index of the first tabulated offset above the requested offset
	unsigned i = upper_bound(m_radialOffset.begin(),m_radialOffset.end(),offset) - m_radialOffset.begin();
	if (i == m_radialOffset.size()) return m_transmission.back();

	double mu = (offset - m_radialOffset[i-1])/(m_radialOffset[i]-m_radialOffset[i-1]);
	return m_transmission[i-1]*(1.-mu) + m_transmission[i]*mu;

}

TransmissionFunction TransmissionProfile::asFunction() const {
	TransmissionProfile profile(*this);
	return [profile](double offset) {return profile.transmission(offset);};
}

vector<double> TransmissionProfile::radialSamples(double ringWidth, unsigned nRadialSteps) {

	if (!(ringWidth > 0.)) throw invalid_argument("Error in TransmissionProfile::radialSamples: ring width must be positive. Input value is "+to_string(ringWidth));
	if (nRadialSteps < 2) throw invalid_argument("Error in TransmissionProfile::radialSamples: at least two radial steps are required");

	double halfWidth = 0.5*ringWidth;
	double step = ringWidth/(nRadialSteps-1);
	vector<double> offsets(nRadialSteps);
	for (unsigned i=0; i<nRadialSteps; i++) offsets[i] = -halfWidth + i*step;
	//Pin the end point so that the profile covers the full ring width exactly
	offsets.back() = halfWidth;

	return offsets;

}

TransmissionProfile TransmissionProfile::flat(double ringWidth, unsigned nRadialSteps, double opticalDepth) {
	vector<double> offsets = radialSamples(ringWidth,nRadialSteps);
	return TransmissionProfile(offsets,vector<double>(offsets.size(),opticalDepth));
}

TransmissionProfile TransmissionProfile::centralPeak(double ringWidth, unsigned nRadialSteps, double peakOpticalDepth) {
	return parabolic(ringWidth,nRadialSteps,0.,peakOpticalDepth);
}

TransmissionProfile TransmissionProfile::edgePeak(double ringWidth, unsigned nRadialSteps, double peakOpticalDepth) {
	return parabolic(ringWidth,nRadialSteps,peakOpticalDepth,0.);
}

TransmissionProfile TransmissionProfile::parabolic(double ringWidth, unsigned nRadialSteps, double tauAtEdge, double tauAtMidline) {

	if (nRadialSteps < 3) throw invalid_argument("Error in TransmissionProfile::parabolic: at least three radial steps are required");
	vector<double> offsets = radialSamples(ringWidth,nRadialSteps);

	vector<double> parabola;
	for (unsigned i=0; i<offsets.size(); i++) parabola.push_back(offsets[i]*offsets[i]);
	double parabolaMax = *max_element(parabola.begin(),parabola.end());
	double parabolaMin = *min_element(parabola.begin(),parabola.end());

	//Linear map of the parabola onto the target optical depths: tau = slope*x^2 + intercept
	double slope = (tauAtEdge - tauAtMidline)/(parabolaMax - parabolaMin);
	double intercept = tauAtEdge - slope*parabolaMax;

	vector<double> opticalDepth;
	for (unsigned i=0; i<parabola.size(); i++) {
		//Guard against rounding below zero at the zero-depth end of the parabola
		opticalDepth.push_back(max(0.,slope*parabola[i] + intercept));
	}

	return TransmissionProfile(offsets,opticalDepth);

}

TransmissionProfile TransmissionProfile::readFromFile(const string & filename) {

	ifstream profile_in(filename, ios::in);
	if (!profile_in.good()) throw runtime_error("Error in TransmissionProfile::readFromFile: Error opening file "+filename);

	vector<double> offsets, opticalDepth;
	string line;
	unsigned lineNumber = 0;
	while (getline(profile_in, line)) {
		lineNumber++;
		size_t first = line.find_first_not_of(" \t\r");
		if (first == string::npos || line[first] == '#') continue;
		double offset, tau;
		stringstream ss(line);
		if (!(ss >> offset >> tau)) {
			throw runtime_error("Error in TransmissionProfile::readFromFile: Read invalid value from "+filename+" at line "+to_string(lineNumber));
		}
		offsets.push_back(offset);
		opticalDepth.push_back(tau);
	}
	profile_in.close();

	return TransmissionProfile(offsets,opticalDepth);

}
