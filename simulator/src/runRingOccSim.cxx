/*
 * runRingOccSim.cxx
 *
 *  Created on: 12 Sep 2025
 */

#include <iostream>

#include "Simulator.hxx"

using namespace std;

int main(int argc, char * argv [])
{
	try {

		//Read the user configuration from the file given by --conf (default conf/ringOccSim.xml)
		ParamsPtr params = RingOccSimInit(argc,argv);
		if (!params) return 0;

		//Create an instance of the Simulator and run it
		Simulator *simulator = new Simulator(params);
		simulator->process();
		delete simulator;

	} catch(std::exception& e) {
		cerr << "RingOccSim: [E] ERROR: " << e.what() << endl;
		return 1;
	}

    return  0;
}
