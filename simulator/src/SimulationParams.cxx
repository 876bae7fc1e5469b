/*
 * SimulationParams.cxx
 *
 *  Created on: 5 Sep 2025
 */

#include <fstream>
#include <stdexcept>

#include "boost/property_tree/xml_parser.hpp"
#include "boost/program_options.hpp"

#include "SimulationParams.hxx"

using namespace std;

template<typename T> T ModuleParams::get(const string & paramName, const string & typeName) const {

	try {
		return m_tree.get<T>(paramName);
	} catch (const boost::property_tree::ptree_bad_path & e) {
		throw runtime_error("Error in ModuleParams::GetAs"+typeName+": parameter "+paramName+" not found for "+m_name);
	} catch (const boost::property_tree::ptree_bad_data & e) {
		throw runtime_error("Error in ModuleParams::GetAs"+typeName+": value of parameter "+paramName+" for "+m_name+
							" cannot be converted to "+typeName+": "+m_tree.get<string>(paramName));
	}

}

template double ModuleParams::get<double>(const string &, const string &) const;
template int ModuleParams::get<int>(const string &, const string &) const;
template bool ModuleParams::get<bool>(const string &, const string &) const;
template string ModuleParams::get<string>(const string &, const string &) const;

SimulationParams::SimulationParams(const boost::property_tree::ptree & tree) :
		m_global("global parameters",boost::property_tree::ptree()) {

	boost::optional<const boost::property_tree::ptree &> root = tree.get_child_optional("RingOccSim");
	if (!root) throw runtime_error("Error in SimulationParams: configuration has no RingOccSim root element");

	for (boost::property_tree::ptree::const_iterator it = root->begin(); it != root->end(); ++it) {
		if (it->first == "global") {
			m_global = ModuleParams("global parameters",it->second);
		} else if (it->first == "module") {
			string moduleName = it->second.get<string>("<xmlattr>.name","");
			if (moduleName.empty()) throw runtime_error("Error in SimulationParams: module element without a name attribute");
			if (m_modules.count(moduleName) > 0) throw runtime_error("Error in SimulationParams: duplicate parameters for module "+moduleName);
			m_modules.insert(make_pair(moduleName,ModuleParams("module "+moduleName,it->second)));
		}
	}

}

const ModuleParams & SimulationParams::Module(const string & moduleName) const {

	map<string,ModuleParams>::const_iterator it = m_modules.find(moduleName);
	if (it == m_modules.end()) throw runtime_error("Error in SimulationParams::Module: no parameters found for module "+moduleName);
	return it->second;

}

ParamsPtr readSimulationParams(istream & xml) {

	boost::property_tree::ptree tree;
	try {
		boost::property_tree::read_xml(xml,tree,boost::property_tree::xml_parser::trim_whitespace);
	} catch (const boost::property_tree::xml_parser_error & e) {
		throw runtime_error("Error in readSimulationParams: "+string(e.what()));
	}
	return ParamsPtr(new SimulationParams(tree));

}

ParamsPtr readSimulationParams(const string & filename) {

	ifstream xml(filename, ios::in);
	if (!xml.good()) throw runtime_error("Error in readSimulationParams: Error opening configuration file "+filename);
	cout << "Reading configuration from " << filename << endl;
	return readSimulationParams(xml);

}

ParamsPtr RingOccSimInit(int argc, char * argv []) {

	namespace po = boost::program_options;

	string confFilename;
	po::options_description options("Allowed options");
	options.add_options()
		("help,h", "print this message")
		("conf,c", po::value<string>(&confFilename)->default_value("conf/ringOccSim.xml"), "configuration xml file");

	po::variables_map vm;
	try {
		po::store(po::parse_command_line(argc, argv, options), vm);
		po::notify(vm);
	} catch (const po::error & e) {
		throw runtime_error("Error in RingOccSimInit: "+string(e.what()));
	}

	if (vm.count("help")) {
		cout << options << endl;
		return ParamsPtr();
	}

	return readSimulationParams(confFilename);

}
