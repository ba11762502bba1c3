#pragma once

#include "vhex/core/types.hpp"
#include "vhex/geometry/region.hpp"
#include "vhex/geometry/sampler.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace vhex {

//! Parameters of a new game.
struct GameConfig {
	std::size_t seedCount{30u};                                           //!< Number of territories.
	geometry::RegionShape regionShape{geometry::RegionShape::Rectangle}; //!< Unit square or disc of diameter 1.
	std::optional<uint64_t> randomSeed{};                                 //!< Drawn from std::random_device when empty.
	double minSeparationFactor{0.5};                                      //!< See geometry::SamplerOptions.
	std::size_t maxAttemptsPerSeed{200u};                                 //!< See geometry::SamplerOptions.
	std::size_t discSegments{64u};                                        //!< Boundary resolution of the disc.
	Player firstPlayer{Player::A};
};

//! Playing area for the configured shape. Both shapes fit the unit square.
geometry::Region makeRegion(const GameConfig& config);

geometry::SamplerOptions samplerOptions(const GameConfig& config);

//! Parse a JSON config. Missing keys keep their defaults. Returns empty on invalid input.
std::optional<GameConfig> configFromJson(const std::string& text);

//! Serialize a config to JSON.
std::string toJson(const GameConfig& config);

//! Read and parse a JSON config file. Returns empty if the file cannot be read or parsed.
std::optional<GameConfig> loadConfig(const std::filesystem::path& path);

} // namespace vhex
