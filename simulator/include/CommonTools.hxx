/*
 * CommonTools.hxx
 *
 *  Created on: 11 Sep 2025
 */

#include <vector>
#include <cmath>
#include <algorithm>

#ifndef SIMULATOR_INCLUDE_COMMONTOOLS_HXX_
#define SIMULATOR_INCLUDE_COMMONTOOLS_HXX_

namespace CommonTools {

	/** *************************************************************************
	 *  @brief Returns the median value of a vector
	 *
	 *  @param [in] values  Vector of values for which the median is to be
	 *  					calculated. The vector is taken by value so that
	 *  					the caller's ordering is preserved.
	 */
	template<typename T> double median(std::vector<T> values) {

		unsigned size = values.size();
		if (size==0) return 0;
		std::sort(values.begin(),values.end());

		if (size%2 == 0) {
			return (values[(size/2)-1] + values[size/2])/2.;
		} else {
			return values[size/2];
		}

	}

	/** *************************************************************************
	 *  @brief Returns the maximum absolute difference between the values on
	 *  	   either side of the centre index npts/2 of a vector, i.e. the
	 *  	   largest |v[n2+k]-v[n2-k]| for k=1..n2-1
	 *
	 *  @param [in] values  Vector with an even number of values
	 */
	template<typename T> double mirrorAsymmetry(const std::vector<T> & values) {

		int n2 = values.size()/2;
		double asymmetry = 0.;
		for (int k=1; k<n2; k++) asymmetry = std::max(asymmetry,double(std::fabs(values[n2+k]-values[n2-k])));
		return asymmetry;

	}

}

#endif /* SIMULATOR_INCLUDE_COMMONTOOLS_HXX_ */
