/*
 * Data.cxx
 *
 *  Created on: 4 Sep 2025
 */

#include <stdexcept>

#include "boost/tokenizer.hpp"

#include "Data.hxx"

using namespace std;

Data::Data(string outputDirectory, string modulesToRun) :
		m_outputDirectory(outputDirectory), m_modulesToRun(modulesToRun),
		m_aperture(nullptr), m_observerField(nullptr) {}

bool Data::moduleIsActive(string moduleName) const {

	typedef boost::tokenizer<boost::char_separator<char> > tokenizer;
	boost::char_separator<char> sep(", ");
	tokenizer tokens(m_modulesToRun, sep);
	for (tokenizer::iterator tok_iter = tokens.begin(); tok_iter != tokens.end(); ++tok_iter) {
		if (string(*tok_iter) == moduleName) return true;
	}
	return false;

}

void Data::addOcculter(Occulter * occulter) {

	for (vector<Occulter*>::const_iterator it = m_occulters.begin(); it!=m_occulters.end(); ++it) {
		if ((*it)->getName() == occulter->getName()) {
			string name = occulter->getName();
			delete occulter;
			throw runtime_error("Error in Data::addOcculter: an occulter with name "+name+" already exists");
		}
	}
	m_occulters.push_back(occulter);

}

const Occulter * Data::getOcculter(int index) const {

	if (index < 0 || index >= static_cast<int>(m_occulters.size())) {
		throw runtime_error("Error in Data::getOcculter: occulter index "+to_string(index)+" out of range [0,"+to_string(m_occulters.size())+")");
	}
	return m_occulters[index];

}

void Data::setAperture(Aperture * aperture) {

	if (m_aperture != aperture) delete m_aperture;
	m_aperture = aperture;

}

void Data::setObserverField(ObserverField * field) {

	if (m_observerField != field) delete m_observerField;
	m_observerField = field;

}

Data::~Data() {

	for (vector<Occulter*>::const_iterator it = m_occulters.begin(); it!=m_occulters.end(); ++it) delete (*it);
	delete m_aperture;
	delete m_observerField;

}
