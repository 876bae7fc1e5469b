/*
 * LightCurveExtractor.cxx
 *
 *  Created on: 11 Sep 2025
 */

#include <stdexcept>

#include "CommonTools.hxx"
#include "LightCurveExtractor.hxx"

using namespace std;

LightCurveExtractor::LightCurveExtractor(int extractionRow, int baselineStart, int baselineEnd, double eventVelocity) :
		m_extractionRow(extractionRow), m_baselineStart(baselineStart), m_baselineEnd(baselineEnd), m_eventVelocity(eventVelocity) {

	if (!(eventVelocity > 0.)) throw runtime_error("Error in LightCurveExtractor: event velocity must be positive. Input value is "+to_string(eventVelocity));
	if (baselineStart < 0 || baselineEnd <= baselineStart) {
		throw runtime_error("Error in LightCurveExtractor: baseline window ["+to_string(baselineStart)+","+to_string(baselineEnd)+") is empty or negative");
	}

}

int LightCurveExtractor::getExtractionRow(int numberOfPoints) const {

	int row = (m_extractionRow < 0) ? numberOfPoints/2 : m_extractionRow;
	if (row >= numberOfPoints) {
		throw runtime_error("Error in LightCurveExtractor: extraction row "+to_string(row)+" out of range [0,"+to_string(numberOfPoints)+")");
	}
	return row;

}

double LightCurveExtractor::baseline(const vector<double> & row) const {

	if (m_baselineEnd > static_cast<int>(row.size())) {
		throw runtime_error("Error in LightCurveExtractor::baseline: baseline window ["+to_string(m_baselineStart)+","+to_string(m_baselineEnd)+
							") exceeds the row length "+to_string(row.size()));
	}

	vector<double> window(row.begin()+m_baselineStart,row.begin()+m_baselineEnd);
	double baselineValue = CommonTools::median(window);
	if (!(baselineValue > 0.)) {
		throw runtime_error("Error in LightCurveExtractor::baseline: baseline must be positive. Value is "+to_string(baselineValue));
	}
	return baselineValue;

}

vector<double> LightCurveExtractor::timeAxis(const PhysicalScale & scale) const {

	int npts = scale.getNumberOfPoints();
	vector<double> times(npts);
	for (int i=0; i<npts; i++) times[i] = scale.getOffset(i)/m_eventVelocity;
	return times;

}

LightCurve LightCurveExtractor::extract(const ObserverField & field, string name) const {

	vector<double> row = field.getRow(getExtractionRow(field.getNumberOfPoints()));
	double baselineValue = baseline(row);
	for (unsigned i=0; i<row.size(); i++) row[i] /= baselineValue;

	return LightCurve(name,timeAxis(field.getPhysicalScale()),row,baselineValue,field.getPhysicalScale(),m_eventVelocity);

}

LightCurve LightCurveExtractor::extractAndNormalize(ObserverField & field, string name) const {

	LightCurve lightCurve = extract(field,name);
	field.normalize(lightCurve.getBaseline());
	return lightCurve;

}
