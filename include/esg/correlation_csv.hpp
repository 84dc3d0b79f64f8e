#pragma once

#include <string>

#include <Eigen/Dense>

namespace esg {

// Reads a square numeric matrix; a leading row of non-numeric labels is skipped.
bool load_correlation_csv(const std::string& path, Eigen::MatrixXd& correlation);

} // namespace esg
