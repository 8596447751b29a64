#pragma once
#include <Eigen/Dense>
#include <cstdint>

namespace xraylc {
	using Real   = double;
	using Count  = std::int64_t;
	using Vector = Eigen::VectorXd;
} // namespace xraylc
