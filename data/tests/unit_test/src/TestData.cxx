#define BOOST_TEST_MODULE TestData
#include "boost/test/unit_test.hpp"
#include "boost/test/unit_test_suite.hpp"
#include "boost/test/unit_test_log.hpp"
#include "boost/test/test_tools.hpp"
#include "boost/test/detail/global_typedef.hpp"
#include "boost/filesystem.hpp"

#include <cmath>
#include <fstream>

#include "data/include/OccultationErrors.hxx"
#include "data/include/PhysicalScale.hxx"
#include "data/include/TransmissionProfile.hxx"
#include "data/include/Aperture.hxx"
#include "data/include/ObserverField.hxx"
#include "data/include/LightCurve.hxx"
#include "data/include/Data.hxx"

using namespace boost::unit_test;
using namespace std;

/// @brief unit test fixture
struct DataFixture {
	DataFixture() : m_distance(43.*1.5E8) {
		m_tmpDir = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("ringoccsim_data_%%%%%%%%");
		boost::filesystem::create_directories(m_tmpDir);
	}
	~DataFixture() {
		boost::filesystem::remove_all(m_tmpDir);
	}

	/// @brief Writes the specified lines to a file in the temporary directory and returns its name
	string writeFile(const string & filename, const vector<string> & lines) {
		string path = (m_tmpDir / filename).string();
		ofstream out(path.c_str());
		for (unsigned i=0; i<lines.size(); i++) out << lines[i] << endl;
		out.close();
		return path;
	}

	double m_distance; ///< Distance to the ring in km
	boost::filesystem::path m_tmpDir; ///< Temporary directory for profile tables
};

BOOST_FIXTURE_TEST_SUITE( TestData, DataFixture )

BOOST_AUTO_TEST_CASE( testPhysicalScale )
{
	PhysicalScale scale(0.5,m_distance,4096);

	BOOST_CHECK_CLOSE( scale.getWavelengthKm(), 0.5E-9, 1.E-10 );
	BOOST_CHECK_CLOSE( scale.getGridSize(), 0.028059820306356204, 1.E-8 );
	BOOST_CHECK_CLOSE( scale.getFieldOfView(), 114.93302397483501, 1.E-8 );
	BOOST_CHECK_CLOSE( scale.getFieldOfView()/scale.getGridSize(), 4096., 1.E-10 );
	BOOST_CHECK_EQUAL( scale.getOffset(2048), 0. );
	BOOST_CHECK_CLOSE( scale.getOffset(0), -2048.*scale.getGridSize(), 1.E-10 );
	BOOST_CHECK_CLOSE( scale.getOffset(4095), 2047.*scale.getGridSize(), 1.E-10 );

	//Quadrupling npts halves the grid size and doubles the field of view
	PhysicalScale finerScale(0.5,m_distance,4*4096);
	BOOST_CHECK_CLOSE( finerScale.getGridSize(), 0.5*scale.getGridSize(), 1.E-10 );
	BOOST_CHECK_CLOSE( finerScale.getFieldOfView(), 2.*scale.getFieldOfView(), 1.E-10 );

	BOOST_CHECK_THROW( PhysicalScale(0.,m_distance,4096), std::invalid_argument );
	BOOST_CHECK_THROW( PhysicalScale(0.5,-1.,4096), std::invalid_argument );
	BOOST_CHECK_THROW( PhysicalScale(0.5,m_distance,0), std::invalid_argument );
}

BOOST_AUTO_TEST_CASE( testFlatProfile )
{
	TransmissionProfile profile = TransmissionProfile::flat(46.,101,0.1);

	BOOST_CHECK_EQUAL( profile.getRadialOffsets().size(), 101u );
	BOOST_CHECK_EQUAL( profile.getMinimumOffset(), -23. );
	BOOST_CHECK_EQUAL( profile.getMaximumOffset(), 23. );
	BOOST_CHECK_CLOSE( profile(-23.), exp(-0.1), 1.E-10 );
	BOOST_CHECK_CLOSE( profile(0.123), exp(-0.1), 1.E-10 );
	BOOST_CHECK_CLOSE( profile(23.), exp(-0.1), 1.E-10 );

	BOOST_CHECK_THROW( profile(23.001), DomainError );
	BOOST_CHECK_THROW( profile(-23.001), DomainError );
	BOOST_CHECK( !profile.inDomain(30.) );
}

BOOST_AUTO_TEST_CASE( testParabolicProfiles )
{
	//Offsets -5,-4,...,5 km
	TransmissionProfile central = TransmissionProfile::centralPeak(10.,11,1.);
	BOOST_CHECK_CLOSE( central.getOpticalDepths()[5], 1., 1.E-10 );
	BOOST_CHECK_SMALL( central.getOpticalDepths()[0], 1.E-12 );
	BOOST_CHECK_SMALL( central.getOpticalDepths()[10], 1.E-12 );
	BOOST_CHECK_CLOSE( central.getOpticalDepths()[7], 0.84, 1.E-8 );
	BOOST_CHECK_CLOSE( central(0.), exp(-1.), 1.E-10 );
	BOOST_CHECK_CLOSE( central(5.), 1., 1.E-10 );

	//The transmitted fraction, not the optical depth, is interpolated
	BOOST_CHECK_CLOSE( central(0.5), 0.5*(exp(-1.)+exp(-0.96)), 1.E-10 );

	TransmissionProfile edge = TransmissionProfile::edgePeak(10.,11,1.);
	BOOST_CHECK_SMALL( edge.getOpticalDepths()[5], 1.E-12 );
	BOOST_CHECK_CLOSE( edge.getOpticalDepths()[0], 1., 1.E-10 );
	BOOST_CHECK_CLOSE( edge.getOpticalDepths()[8], 0.36, 1.E-8 );
	BOOST_CHECK_CLOSE( edge(-5.), exp(-1.), 1.E-10 );

	//Both profiles are even functions of the offset
	for (double x=0.; x<=5.; x+=0.37) {
		BOOST_CHECK_CLOSE( central(x), central(-x), 1.E-10 );
		BOOST_CHECK_CLOSE( edge(x), edge(-x), 1.E-10 );
	}

	BOOST_CHECK_THROW( TransmissionProfile::centralPeak(10.,2,1.), std::invalid_argument );
	BOOST_CHECK_THROW( TransmissionProfile::flat(0.,11,1.), std::invalid_argument );
	BOOST_CHECK_THROW( TransmissionProfile::flat(10.,1,1.), std::invalid_argument );
}

BOOST_AUTO_TEST_CASE( testProfileConstruction )
{
	vector<double> offsets = {-1.,0.,1.};

	BOOST_CHECK_THROW( TransmissionProfile(offsets,vector<double>{0.,1.}), std::invalid_argument );
	BOOST_CHECK_THROW( TransmissionProfile(vector<double>{0.},vector<double>{1.}), std::invalid_argument );
	BOOST_CHECK_THROW( TransmissionProfile(vector<double>{0.,-1.,1.},vector<double>{0.,0.,0.}), std::invalid_argument );
	BOOST_CHECK_THROW( TransmissionProfile(vector<double>{0.,0.,1.},vector<double>{0.,0.,0.}), std::invalid_argument );
	BOOST_CHECK_THROW( TransmissionProfile(offsets,vector<double>{0.,-0.1,0.}), std::invalid_argument );

	TransmissionProfile profile(offsets,vector<double>{0.,2.,0.});
	TransmissionFunction transmission = profile.asFunction();
	BOOST_CHECK_CLOSE( transmission(-0.25), 0.25*1.+0.75*exp(-2.), 1.E-10 );
	BOOST_CHECK_THROW( transmission(1.5), DomainError );
}

BOOST_AUTO_TEST_CASE( testProfileFromFile )
{
	vector<string> lines = {"# offset_km opticalDepth", "-2 0.0", "", "0   1.0", "  # midline above", "2\t0.0"};
	TransmissionProfile profile = TransmissionProfile::readFromFile(writeFile("profile.txt",lines));

	BOOST_CHECK_EQUAL( profile.getRadialOffsets().size(), 3u );
	BOOST_CHECK_CLOSE( profile(1.), 0.5*(exp(-1.)+1.), 1.E-10 );
	BOOST_CHECK_CLOSE( profile(-2.), 1., 1.E-10 );

	BOOST_CHECK_THROW( TransmissionProfile::readFromFile((m_tmpDir / "missing.txt").string()), std::runtime_error );
	BOOST_CHECK_THROW( TransmissionProfile::readFromFile(writeFile("bad.txt",{"-2 0.0","0 x"})), std::runtime_error );
	BOOST_CHECK_THROW( TransmissionProfile::readFromFile(writeFile("unsorted.txt",{"2 0.0","0 1.0"})), std::invalid_argument );
}

BOOST_AUTO_TEST_CASE( testAperture )
{
	PhysicalScale scale(2.,m_distance,8);
	Aperture aperture(scale);

	BOOST_CHECK_EQUAL( aperture.getNumberOfRows(), 8 );
	BOOST_CHECK_EQUAL( aperture.getNumberOfColumns(), 8 );
	BOOST_CHECK_EQUAL( aperture.getTransmission(3,5), complex<double>(1.,0.) );
	BOOST_CHECK_SMALL( aperture.blockedFraction(), 1.E-15 );
	BOOST_CHECK_EQUAL( aperture.maxImaginary(), 0. );
	BOOST_CHECK_CLOSE( aperture.getFieldOfView(), scale.getFieldOfView(), 1.E-12 );

	for (int iy=0; iy<8; iy++) aperture.setTransmission(iy,0,0.);
	BOOST_CHECK_CLOSE( aperture.blockedFraction(), 1./8., 1.E-10 );
}

BOOST_AUTO_TEST_CASE( testObserverField )
{
	PhysicalScale scale(2.,m_distance,4);
	ObserverField field(Eigen::ArrayXXd::Constant(4,4,2.),scale,1.E-14);

	BOOST_CHECK_EQUAL( field.getCentreIndex(), 2 );
	BOOST_CHECK_EQUAL( field.getResidualImaginary(), 1.E-14 );
	BOOST_CHECK_EQUAL( field.getRow(3).size(), 4u );
	BOOST_CHECK_THROW( field.getRow(4), std::runtime_error );
	BOOST_CHECK_THROW( field.getRow(-1), std::runtime_error );

	field.normalize(2.);
	BOOST_CHECK_CLOSE( field.getIntensity(1,3), 1., 1.E-12 );
	BOOST_CHECK_CLOSE( field.getNormalization(), 2., 1.E-12 );

	BOOST_CHECK_THROW( field.normalize(0.), std::runtime_error );
}

BOOST_AUTO_TEST_CASE( testLightCurve )
{
	PhysicalScale scale(2.,m_distance,4);
	vector<double> times = {-2.,-1.,0.,1.,2.};
	vector<double> fluxes = {1.,0.9,0.5,0.9,1.};
	LightCurve lightCurve("ring",times,fluxes,3.,scale,5.8);

	BOOST_CHECK_EQUAL( lightCurve.getName(), "ring" );
	BOOST_CHECK_EQUAL( lightCurve.size(), 5u );
	BOOST_CHECK_CLOSE( lightCurve.getMinimumFlux(), 0.5, 1.E-12 );
	BOOST_CHECK_CLOSE( lightCurve.getMaximumFlux(), 1., 1.E-12 );
	BOOST_CHECK_EQUAL( lightCurve.getTimeOfMinimum(), 0. );
	BOOST_CHECK_CLOSE( lightCurve.getMeanFlux(0,2), 0.95, 1.E-10 );
	BOOST_CHECK_CLOSE( lightCurve.getFluxStandardDeviation(0,2), sqrt(0.005), 1.E-8 );
	BOOST_CHECK_EQUAL( lightCurve.getFluxStandardDeviation(4,5), 0. );
	BOOST_CHECK_CLOSE( lightCurve.getTimeStep(), scale.getGridSize()/5.8, 1.E-12 );

	BOOST_CHECK_THROW( lightCurve.getFluxStatistics(3,3), std::runtime_error );
	BOOST_CHECK_THROW( lightCurve.getFluxStatistics(0,6), std::runtime_error );
	BOOST_CHECK_THROW( LightCurve("ring",times,vector<double>{1.},3.,scale,5.8), std::invalid_argument );
}

BOOST_AUTO_TEST_CASE( testData )
{
	Data data(m_tmpDir.string(),"TransmissionProfileGenerator_profile0, ApertureGenerator");

	BOOST_CHECK( data.moduleIsActive("ApertureGenerator") );
	BOOST_CHECK( !data.moduleIsActive("LightCurveWriter") );

	data.addOcculter(new Occulter("ringA",10.,TransmissionProfile::flat(10.,11,0.1)));
	data.addOcculter(new Occulter("body",5.,3.));
	BOOST_CHECK_EQUAL( data.getOcculters().size(), 2u );
	BOOST_CHECK_EQUAL( data.getOcculter(0)->getType(), Occulter::ring );
	BOOST_CHECK_CLOSE( data.getOcculter(0)->getTransmissionProfile()(0.), exp(-0.1), 1.E-10 );
	BOOST_CHECK_EQUAL( data.getOcculter(1)->getType(), Occulter::solidBody );
	BOOST_CHECK_THROW( data.getOcculter(1)->getTransmissionProfile(), std::runtime_error );
	BOOST_CHECK_THROW( data.getOcculter(2), std::runtime_error );
	BOOST_CHECK_THROW( data.addOcculter(new Occulter("ringA",3.,1.)), std::runtime_error );

	BOOST_CHECK( data.getAperture() == nullptr );
	PhysicalScale scale(2.,m_distance,4);
	data.setAperture(new Aperture(scale));
	data.setAperture(new Aperture(scale));
	BOOST_CHECK_EQUAL( data.getAperture()->getNumberOfRows(), 4 );

	data.setObserverField(new ObserverField(Eigen::ArrayXXd::Ones(4,4),scale));
	BOOST_CHECK_EQUAL( data.getObserverField()->getNumberOfPoints(), 4 );
}

BOOST_AUTO_TEST_SUITE_END()
