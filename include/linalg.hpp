#pragma once

#include <Eigen/Dense>

// Velocity triangle in the blade section plane: x = tangential, y = axial
using Vec2 = Eigen::Vector2d;
using Mat = Eigen::MatrixXd;
