#include <esg/distributions.hpp>

#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>

#include <stdexcept>
#include <string>

namespace esg {

double normal_quantile(double variate) {
    if (!(variate > 0.0 && variate < 1.0)) {
        throw std::domain_error("variate must lie in the open interval (0,1), got " + std::to_string(variate));
    }
    static const boost::math::normal_distribution<double> standard_normal(0.0, 1.0);
    return boost::math::quantile(standard_normal, variate);
}

double normal_cdf(double x) {
    static const boost::math::normal_distribution<double> standard_normal(0.0, 1.0);
    return boost::math::cdf(standard_normal, x);
}

double student_t_cdf(double x, double degrees_of_freedom) {
    const boost::math::students_t_distribution<double> student(degrees_of_freedom);
    return boost::math::cdf(student, x);
}

} // namespace esg
