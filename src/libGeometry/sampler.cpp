#include "vhex/geometry/sampler.hpp"

#include "Logging.hpp"
#include "vhex/geometry/errors.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace vhex::geometry {

double minSeparation(const Region& region, const std::size_t count, const SamplerOptions& options) {
	if (count == 0u) {
		return 0.0;
	}
	return options.minSeparationFactor * std::sqrt(region.area() / static_cast<double>(count));
}

std::vector<Point> samplePoints(const Region& region, const std::size_t count, const SamplerOptions& options, std::mt19937_64& rng) {
	std::vector<Point> points;
	if (count > points.max_size() || (options.maxAttemptsPerSeed != 0u && count > std::numeric_limits<std::size_t>::max() / options.maxAttemptsPerSeed)) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Sampler] Refused to place {} points with {} attempts each.", count, options.maxAttemptsPerSeed));
		throw GenerationError(std::format("Cannot sample {} points: the attempt budget does not fit.", count));
	}

	const auto separation = minSeparation(region, count, options);
	const auto minSquared = separation * separation;
	const auto budget     = count * options.maxAttemptsPerSeed;

	points.reserve(count);

	std::size_t attempts = 0;
	while (points.size() < count) {
		if (attempts == budget) {
			Logger().Log(Logging::LogLevel::Error, std::format("[Sampler] Placed only {} of {} points after {} attempts (separation {}).",
			                                                   points.size(), count, attempts, separation));
			throw GenerationError(std::format("Could not place {} points with separation {} within {} attempts.", count, separation, budget));
		}
		++attempts;

		const auto candidate = region.sample(rng);
		const bool tooClose  = std::any_of(points.begin(), points.end(), [&](const Point& p) { return squaredDistance(p, candidate) < minSquared; });
		if (!tooClose) {
			points.push_back(candidate);
		}
	}

	return points;
}

} // namespace vhex::geometry
