/*
 * SolidBodyGenerator.cxx
 *
 *  Created on: 9 Sep 2025
 */

#include <iostream>

#include "SolidBodyGenerator.hxx"

using namespace std;

void SolidBodyGenerator::initialize(const ModuleParams & params) {

	m_bodyName = params.GetAsString("bodyName");
	m_semiAxisX = params.GetAsDouble("semiAxisX");
	m_semiAxisY = params.GetAsDouble("semiAxisY");

	if (!(m_semiAxisX > 0.) || !(m_semiAxisY > 0.)) {
		throw runtime_error("Error in SolidBodyGenerator::initialize: semiAxisX and semiAxisY must be positive");
	}

	cout << "Solid body " << m_bodyName << ": semi-axes " << m_semiAxisX << " x " << m_semiAxisY << " km" << endl;

}

void SolidBodyGenerator::doBegin(Data * data) {

	data->addOcculter(new Occulter(m_bodyName,m_semiAxisX,m_semiAxisY));

}
