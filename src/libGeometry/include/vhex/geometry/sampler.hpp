#pragma once

#include "vhex/geometry/point.hpp"
#include "vhex/geometry/region.hpp"

#include <cstddef>
#include <random>

namespace vhex::geometry {

//! Parameters of the rejection sampler.
struct SamplerOptions {
	double minSeparationFactor{0.5};    //!< Minimum pairwise distance relative to sqrt(area / count).
	std::size_t maxAttemptsPerSeed{200}; //!< Candidate budget per requested point.
};

//! Minimum pairwise distance the sampler enforces for count points in region.
double minSeparation(const Region& region, std::size_t count, const SamplerOptions& options);

//! Sample count points uniformly in region, rejecting candidates closer than minSeparation to an accepted point.
//! \throws GenerationError when the total budget of count * maxAttemptsPerSeed candidates runs out.
std::vector<Point> samplePoints(const Region& region, std::size_t count, const SamplerOptions& options, std::mt19937_64& rng);

} // namespace vhex::geometry
