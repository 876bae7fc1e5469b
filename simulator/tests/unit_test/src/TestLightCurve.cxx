#define BOOST_TEST_MODULE TestLightCurve
#include "boost/test/unit_test.hpp"
#include "boost/test/unit_test_suite.hpp"
#include "boost/test/unit_test_log.hpp"
#include "boost/test/test_tools.hpp"
#include "boost/test/detail/global_typedef.hpp"

#include <cmath>

#include "simulator/include/CommonTools.hxx"
#include "simulator/include/LightCurveExtractor.hxx"

using namespace boost::unit_test;
using namespace std;

/// @brief unit test fixture
struct LightCurveFixture {
	LightCurveFixture() : m_scale(1.,43.*1.5E8,8), m_intensity(8,8) {
		for (int iy=0; iy<8; iy++) {
			for (int ix=0; ix<8; ix++) m_intensity(iy,ix) = (iy+1)*(ix+1);
		}
	}
	~LightCurveFixture() {}
	PhysicalScale m_scale; ///< 8 point physical scale at 1 micron
	Eigen::ArrayXXd m_intensity; ///< Intensity (iy+1)*(ix+1)
};

BOOST_FIXTURE_TEST_SUITE( TestLightCurve, LightCurveFixture )

BOOST_AUTO_TEST_CASE( testMedian )
{
	BOOST_CHECK_EQUAL( CommonTools::median(vector<double>{5.,1.,3.}), 3. );
	BOOST_CHECK_EQUAL( CommonTools::median(vector<double>{20.,5.,15.,10.}), 12.5 );
	BOOST_CHECK_EQUAL( CommonTools::median(vector<double>{7.}), 7. );
	BOOST_CHECK_EQUAL( CommonTools::median(vector<double>()), 0. );

	//Centre index 2, so only |v[3]-v[1]| contributes
	vector<double> values = {1.,3.,2.,5.};
	BOOST_CHECK_EQUAL( CommonTools::mirrorAsymmetry(values), 2. );
	BOOST_CHECK_EQUAL( CommonTools::mirrorAsymmetry(vector<double>{9.,4.,1.,0.,1.,4.}), 0. );
	//The argument is not reordered
	CommonTools::median(values);
	BOOST_CHECK_EQUAL( values[1], 3. );
}

BOOST_AUTO_TEST_CASE( testExtraction )
{
	ObserverField field(m_intensity,m_scale);
	LightCurveExtractor extractor(-1,0,4,2.);

	BOOST_CHECK_EQUAL( extractor.getExtractionRow(8), 4 );
	//Centre row is 5*(ix+1), the median of 5,10,15,20 is 12.5
	BOOST_CHECK_CLOSE( extractor.baseline(field.getRow(4)), 12.5, 1.E-10 );

	LightCurve lightCurve = extractor.extract(field,"test");
	BOOST_CHECK_EQUAL( lightCurve.getName(), "test" );
	BOOST_REQUIRE_EQUAL( lightCurve.size(), 8u );
	BOOST_CHECK_CLOSE( lightCurve.getBaseline(), 12.5, 1.E-10 );
	for (unsigned i=0; i<8; i++) {
		BOOST_CHECK_CLOSE( lightCurve.getFluxes()[i], 5.*(i+1)/12.5, 1.E-10 );
		BOOST_CHECK_CLOSE( lightCurve.getTimes()[i]+1., (int(i)-4)*m_scale.getGridSize()/2.+1., 1.E-10 );
	}
	BOOST_CHECK_EQUAL( lightCurve.getTimes()[4], 0. );
	BOOST_CHECK_CLOSE( lightCurve.getTimeStep(), m_scale.getGridSize()/2., 1.E-10 );
	BOOST_CHECK_CLOSE( lightCurve.getMinimumFlux(), 0.4, 1.E-10 );
	BOOST_CHECK_CLOSE( lightCurve.getMaximumFlux(), 3.2, 1.E-10 );
	BOOST_CHECK_CLOSE( lightCurve.getTimeOfMinimum(), -4.*m_scale.getGridSize()/2., 1.E-10 );
	BOOST_CHECK_CLOSE( lightCurve.getMeanFlux(0,4), 1., 1.E-10 );

	//Extraction does not modify the field
	BOOST_CHECK_EQUAL( field.getIntensity(4,0), 5. );

	//Explicit row
	LightCurveExtractor rowExtractor(0,0,4,2.);
	LightCurve rowLightCurve = rowExtractor.extract(field,"row0");
	BOOST_CHECK_CLOSE( rowLightCurve.getBaseline(), 2.5, 1.E-10 );
	BOOST_CHECK_CLOSE( rowLightCurve.getFluxes()[7], 8./2.5, 1.E-10 );
}

BOOST_AUTO_TEST_CASE( testNormalization )
{
	ObserverField field(m_intensity,m_scale);
	LightCurveExtractor extractor(-1,0,4,2.);

	LightCurve first = extractor.extractAndNormalize(field,"test");
	BOOST_CHECK_CLOSE( field.getIntensity(4,0), 0.4, 1.E-10 );
	BOOST_CHECK_CLOSE( field.getNormalization(), 12.5, 1.E-10 );

	//Normalizing a normalized field leaves it unchanged
	LightCurve second = extractor.extractAndNormalize(field,"test");
	BOOST_CHECK_CLOSE( second.getBaseline(), 1., 1.E-10 );
	BOOST_CHECK_CLOSE( field.getNormalization(), 12.5, 1.E-10 );
	for (unsigned i=0; i<8; i++) BOOST_CHECK_CLOSE( second.getFluxes()[i], first.getFluxes()[i], 1.E-10 );
}

BOOST_AUTO_TEST_CASE( testTimeAxis )
{
	LightCurveExtractor extractor(-1,0,30,5.8);
	PhysicalScale scale(2.,43.*1.5E8,256);
	vector<double> times = extractor.timeAxis(scale);

	BOOST_REQUIRE_EQUAL( times.size(), 256u );
	BOOST_CHECK_EQUAL( times[128], 0. );
	BOOST_CHECK_CLOSE( times[0], -128.*0.22447856245084963/5.8, 1.E-8 );
	BOOST_CHECK_CLOSE( times[255]-times[254], 0.22447856245084963/5.8, 1.E-8 );
	for (unsigned i=1; i<times.size(); i++) BOOST_REQUIRE( times[i] > times[i-1] );
}

BOOST_AUTO_TEST_CASE( testFluxStatistics )
{
	PhysicalScale scale(1.,43.*1.5E8,4);
	LightCurve lightCurve("stats",{-1.,-0.5,0.,0.5},{1.,0.5,0.5,2.},10.,scale,1.);

	BOOST_CHECK_CLOSE( lightCurve.getMeanFlux(0,4), 1., 1.E-10 );
	BOOST_CHECK_CLOSE( lightCurve.getFluxStandardDeviation(0,4), sqrt(1.5/3.), 1.E-10 );
	BOOST_CHECK_EQUAL( lightCurve.getFluxStandardDeviation(0,1), 0. );
	//Earliest sample of a tie
	BOOST_CHECK_EQUAL( lightCurve.getTimeOfMinimum(), -0.5 );

	BOOST_CHECK_THROW( lightCurve.getFluxStatistics(2,2), std::runtime_error );
	BOOST_CHECK_THROW( lightCurve.getFluxStatistics(0,5), std::runtime_error );
	BOOST_CHECK_THROW( LightCurve("bad",{0.,1.},{1.},1.,scale,1.), std::invalid_argument );
}

BOOST_AUTO_TEST_CASE( testErrors )
{
	BOOST_CHECK_THROW( LightCurveExtractor(-1,0,4,0.), std::runtime_error );
	BOOST_CHECK_THROW( LightCurveExtractor(-1,-1,4,1.), std::runtime_error );
	BOOST_CHECK_THROW( LightCurveExtractor(-1,4,4,1.), std::runtime_error );

	ObserverField field(m_intensity,m_scale);
	BOOST_CHECK_THROW( LightCurveExtractor(8,0,4,1.).extract(field,"test"), std::runtime_error );
	BOOST_CHECK_THROW( LightCurveExtractor(-1,0,9,1.).extract(field,"test"), std::runtime_error );

	//Non-positive baseline
	ObserverField dark(Eigen::ArrayXXd::Zero(8,8),m_scale);
	LightCurveExtractor extractor(-1,0,4,1.);
	BOOST_CHECK_THROW( extractor.extractAndNormalize(dark,"dark"), std::runtime_error );
	BOOST_CHECK_EQUAL( dark.getNormalization(), 1. );
	BOOST_CHECK_THROW( dark.normalize(0.), std::runtime_error );
}

BOOST_AUTO_TEST_SUITE_END()
