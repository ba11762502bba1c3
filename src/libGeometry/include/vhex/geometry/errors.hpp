#pragma once

#include <stdexcept>

namespace vhex::geometry {

//! The tessellation could not be generated from the given parameters.
//! Callers may retry with fewer sites, a smaller separation or a larger region.
class GenerationError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

} // namespace vhex::geometry
