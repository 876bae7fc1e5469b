/*
 * Simulator.cxx
 *
 *  Created on: 12 Sep 2025
 */

#include <iostream>
#include <vector>

#include "boost/filesystem.hpp"
#include "boost/date_time/posix_time/posix_time.hpp"

#include "ModuleRegistry.hxx"
#include "Simulator.hxx"

using namespace std;

Simulator::Simulator(const ParamsPtr params) :
		m_params(params),m_data(nullptr),m_modulesInitialized(false) {initialize();}


void Simulator::initialize() {

	if (!m_params) throw runtime_error("Error in Simulator::initialize: no configuration provided");

	cout << endl << "=========================================================================================================" << endl;
	cout << "|                                         Welcome to RingOccSim!                                        |" << endl;
	cout << "=========================================================================================================" << endl;

	string outputDirectory = m_params->GetAsString("outputDirectory");
	string modulesToRun = m_params->GetAsString("modulesToRun");

	string execution_start_time = boost::posix_time::to_iso_extended_string(boost::posix_time::second_clock::local_time());
	cout << "Simulation started at " << execution_start_time << endl;

	// Create the output directory
	if (!boost::filesystem::exists(outputDirectory)) boost::filesystem::create_directories(outputDirectory);
	cout << "Output directory                         :" << outputDirectory << endl;

	// Initialize the data
	m_data = new Data(outputDirectory,modulesToRun);

}

void Simulator::process() {

	//initialize all modules added to the simulator
	if (!m_modulesInitialized) initializeModules();

	//Loop over modules to define the occulters
	processBegin();
	//Loop over occulters, looping over modules which should run for each occulter
	processOcculterLoop();
	//Loop over modules which should run after the occulter loop
	processEnd();

}

void Simulator::initializeModules() {

    cout << endl << "=================== Module Initialization ========================" << endl << endl;

	// Instantiate required modules via ModuleRegistry and add them to m_modules
    ModuleRegistry moduleRegistry;
    moduleRegistry.instanciateModules(m_params);
    m_modules = moduleRegistry.getModules();

    // Call the Module::initialize() method for all instantiated modules
    for (vector<Module*>::const_iterator module = m_modules.begin(); module!=m_modules.end(); ++module) {
    	string moduleName = (*module)->getName();
		cout << endl << "Initializing module " << moduleName << endl;
    	(*module)->initialize(m_params->Module(moduleName));
    }
    m_modulesInitialized = true;

}

void Simulator::processBegin() {

	if (!m_modulesInitialized) initializeModules();

    cout << endl << "=================== Module pre-processing ========================" << endl << endl;

    for (vector<Module*>::const_iterator module = m_modules.begin(); module!=m_modules.end(); ++module) {
    	cout << "Processing doBegin for module " << (*module)->getName() << endl;
    	(*module)->doBegin(m_data);
    }

    if (m_data->getOcculters().empty()) {
    	cerr << "Warning: no occulters defined. Add TransmissionProfileGenerator_profileN or SolidBodyGenerator to modulesToRun" << endl;
    }

}

void Simulator::processOcculterLoop() {

	if (!m_modulesInitialized) initializeModules();

	//Check that there is at least one occulterLoop module
	bool modulesInLoop = false;
	for (vector<Module*>::const_iterator module = m_modules.begin(); module!=m_modules.end(); ++module) {
		if ((*module)->schedule()==Module::occulterLoop) {
			modulesInLoop = true;
			break;
		}
	}
	if (!modulesInLoop) return;

	//Loop over occulters
    cout << endl << "================================ Processing occulter loop ================================" << endl << endl;
	unsigned nOcculters = m_data->getOcculters().size();
	for (unsigned iOcculter=0; iOcculter<nOcculters; iOcculter++) {
		cout << endl << "occulter " << iOcculter+1 << " / " << nOcculters << ": " << m_data->getOcculter(iOcculter)->getName() << endl;

		//Loop over modules
		for (vector<Module*>::const_iterator module = m_modules.begin(); module!=m_modules.end(); ++module) {
	    	//Check that this module should run within the occulter loop
			if ((*module)->schedule()==Module::occulterLoop) {
    			(*module)->process(m_data,iOcculter);
    		}
    	}

    }

}

void Simulator::processEnd() {

	if (!m_modulesInitialized) initializeModules();

	//Loop over modules
    for (vector<Module*>::const_iterator module = m_modules.begin(); module!=m_modules.end(); ++module) {
		(*module)->doEnd(m_data);
    }

	string execution_end_time = boost::posix_time::to_iso_extended_string(boost::posix_time::second_clock::local_time());
	cout << endl << "Simulation completed at " << execution_end_time << endl;

}

Simulator::~Simulator() {

	//Clean up
	delete m_data;
    for (vector<Module*>::const_iterator module = m_modules.begin(); module!=m_modules.end(); ++module) delete (*module);

}
