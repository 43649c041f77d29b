#pragma once

#include <complex>
// This header defines the floating point types used throughout this library

using fp64 = double;
using cx64 = std::complex<fp64>;
