/*
 * ModuleRegistry.cxx
 *
 *  Created on: 12 Sep 2025
 */

#include <iostream>

#include "boost/lexical_cast.hpp"
#include "boost/tokenizer.hpp"
#include "boost/token_iterator.hpp"
#include "boost/token_functions.hpp"

#include "aperture/include/TransmissionProfileGenerator.hxx"
#include "aperture/include/SolidBodyGenerator.hxx"
#include "aperture/include/ApertureGenerator.hxx"
#include "propagation/include/ObserverFieldGenerator.hxx"
#include "LightCurveGenerator.hxx"
#include "LightCurveWriter.hxx"
#include "ModuleRegistry.hxx"

using namespace std;

void ModuleRegistry::addModule(string name) {

	Module * module;

	unsigned profileIndex = 0;
	string fullName = name;
	if (name.find("_profile") != string::npos) {
		try {
			profileIndex = boost::lexical_cast<unsigned>(name.substr(name.find("_profile")+8));
		} catch (const boost::bad_lexical_cast & e) {
			throw runtime_error("Invalid profile index in module name: "+fullName);
		}
		name = name.substr(0,name.find("_profile"));
	}

	if (name == "TransmissionProfileGenerator") module = new TransmissionProfileGenerator(profileIndex);
	else if (name == "SolidBodyGenerator") module = new SolidBodyGenerator();
	else if (name == "ApertureGenerator") module = new ApertureGenerator();
	else if (name == "ObserverFieldGenerator") module = new ObserverFieldGenerator();
	else if (name == "LightCurveGenerator") module = new LightCurveGenerator();
	else if (name == "LightCurveWriter") module = new LightCurveWriter();
	else throw runtime_error("Module name not recognized: "+fullName);

	if (module->getName() != fullName) {
		delete module;
		throw runtime_error("Module name not recognized: "+fullName);
	}

	m_modules.push_back(module);

}

void ModuleRegistry::instanciateModules(const ParamsPtr params) {

	string modulesToRun = params->GetAsString("modulesToRun");
	cout << "The following modules will be run: " << modulesToRun << endl;

	typedef boost::tokenizer<boost::char_separator<char> > tokenizer;
	boost::char_separator<char> sep(", \t\n");
	tokenizer tokens(modulesToRun, sep);
	for (tokenizer::iterator tok_iter = tokens.begin(); tok_iter != tokens.end(); ++tok_iter) {
		addModule(string(*tok_iter));
	}

}
