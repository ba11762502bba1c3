#include "vhex/core/gameConfig.hpp"

#include "Logging.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <sstream>

namespace vhex {

using nlohmann::json;

static constexpr char KEY_SEED_COUNT[]     = "seedCount";
static constexpr char KEY_REGION_SHAPE[]   = "regionShape";
static constexpr char KEY_RANDOM_SEED[]    = "randomSeed";
static constexpr char KEY_MIN_SEPARATION[] = "minSeparationFactor";
static constexpr char KEY_MAX_ATTEMPTS[]   = "maxAttemptsPerSeed";
static constexpr char KEY_DISC_SEGMENTS[]  = "discSegments";
static constexpr char KEY_FIRST_PLAYER[]   = "firstPlayer";

geometry::Region makeRegion(const GameConfig& config) {
	switch (config.regionShape) {
	case geometry::RegionShape::Disc:
		return geometry::Region::disc({0.5, 0.5}, 0.5, config.discSegments);
	case geometry::RegionShape::Rectangle:
		break;
	}
	return geometry::Region::rectangle({0.0, 0.0}, {1.0, 1.0});
}

geometry::SamplerOptions samplerOptions(const GameConfig& config) {
	return {.minSeparationFactor = config.minSeparationFactor, .maxAttemptsPerSeed = config.maxAttemptsPerSeed};
}

static std::optional<geometry::RegionShape> shapeFromString(const std::string& value) {
	if (value == "rectangle") {
		return geometry::RegionShape::Rectangle;
	}
	if (value == "disc") {
		return geometry::RegionShape::Disc;
	}
	return {};
}

static std::optional<Player> playerFromString(const std::string& value) {
	if (value == "A") {
		return Player::A;
	}
	if (value == "B") {
		return Player::B;
	}
	return {};
}

//! Read an unsigned integer key into value. Missing keys keep the current value.
//! Negative or fractional numbers are rejected instead of wrapping around.
template <typename T>
static bool readUnsigned(const json& document, const char* key, T& value) {
	if (!document.contains(key)) {
		return true;
	}

	const auto& field = document.at(key);
	if (!field.is_number_unsigned()) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Config] '{}' must be a non negative integer, got {}.", key, field.dump()));
		return false;
	}
	value = field.get<T>();
	return true;
}

std::optional<GameConfig> configFromJson(const std::string& text) {
	const auto document = json::parse(text, nullptr, false);
	if (document.is_discarded() || !document.is_object()) {
		Logger().Log(Logging::LogLevel::Warning, "[Config] Config is not a JSON object.");
		return {};
	}

	GameConfig config{};
	try {
		if (!readUnsigned(document, KEY_SEED_COUNT, config.seedCount) || !readUnsigned(document, KEY_MAX_ATTEMPTS, config.maxAttemptsPerSeed) ||
		    !readUnsigned(document, KEY_DISC_SEGMENTS, config.discSegments)) {
			return {};
		}
		if (config.seedCount < 4u) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[Config] A board needs at least 4 territories, got {}.", config.seedCount));
			return {};
		}
		if (config.maxAttemptsPerSeed == 0u) {
			Logger().Log(Logging::LogLevel::Warning, "[Config] maxAttemptsPerSeed must be positive.");
			return {};
		}
		if (config.discSegments < 8u || config.discSegments % 4u != 0u) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[Config] discSegments must be a multiple of 4 and at least 8, got {}.", config.discSegments));
			return {};
		}

		config.minSeparationFactor = document.value(KEY_MIN_SEPARATION, config.minSeparationFactor);
		if (!(config.minSeparationFactor >= 0.0)) {
			Logger().Log(Logging::LogLevel::Warning, "[Config] minSeparationFactor must not be negative.");
			return {};
		}

		if (document.contains(KEY_RANDOM_SEED) && !document.at(KEY_RANDOM_SEED).is_null()) {
			uint64_t seed = 0;
			if (!readUnsigned(document, KEY_RANDOM_SEED, seed)) {
				return {};
			}
			config.randomSeed = seed;
		}

		if (document.contains(KEY_REGION_SHAPE)) {
			const auto shape = shapeFromString(document.at(KEY_REGION_SHAPE).get<std::string>());
			if (!shape) {
				Logger().Log(Logging::LogLevel::Warning, "[Config] Unknown region shape. Expected 'rectangle' or 'disc'.");
				return {};
			}
			config.regionShape = *shape;
		}

		if (document.contains(KEY_FIRST_PLAYER)) {
			const auto player = playerFromString(document.at(KEY_FIRST_PLAYER).get<std::string>());
			if (!player) {
				Logger().Log(Logging::LogLevel::Warning, "[Config] Unknown first player. Expected 'A' or 'B'.");
				return {};
			}
			config.firstPlayer = *player;
		}
	} catch (const json::exception& ex) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Config] Invalid config value: {}", ex.what()));
		return {};
	}

	return config;
}

std::string toJson(const GameConfig& config) {
	json document{
	        {KEY_SEED_COUNT, config.seedCount},
	        {KEY_REGION_SHAPE, config.regionShape == geometry::RegionShape::Disc ? "disc" : "rectangle"},
	        {KEY_MIN_SEPARATION, config.minSeparationFactor},
	        {KEY_MAX_ATTEMPTS, config.maxAttemptsPerSeed},
	        {KEY_DISC_SEGMENTS, config.discSegments},
	        {KEY_FIRST_PLAYER, config.firstPlayer == Player::A ? "A" : "B"},
	};
	if (config.randomSeed) {
		document[KEY_RANDOM_SEED] = *config.randomSeed;
	} else {
		document[KEY_RANDOM_SEED] = nullptr;
	}
	return document.dump();
}

std::optional<GameConfig> loadConfig(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Config] Could not open config file '{}'.", path.string()));
		return {};
	}

	std::stringstream buffer;
	buffer << file.rdbuf();
	return configFromJson(buffer.str());
}

} // namespace vhex
