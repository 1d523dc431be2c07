/**
 * @file runner_config.cpp
 * @brief Runner configuration from JSON.
 * @version 0.1
 *
 * The configuration is a single JSON object. Every key is optional
 * except "id", and unknown keys are rejected so that a misspelled
 * setting does not silently fall back to its default.
 *
**/
#include "runner_config.hpp"

#include "common_defs.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include <nlohmann/json.hpp>

namespace sandbox
{
template <typename It>
static void configure_runner(RunnerConfig& config, const It& obj)
{
	if (obj.key() == "id")
	{
		config.id_name = obj.value().template get<std::string>();
	}
	else if (obj.key() == "log_tags")
	{
		// null means no tags at all, which is not the same as ""
		if (obj.value().is_null())
			config.log_tags = std::nullopt;
		else
			config.log_tags = obj.value().template get<std::string>();
	}
	else if (obj.key() == "inherit_stdio")
	{
		config.inherit_stdio = obj.value();
	}
	else if (obj.key() == "guest_path")
	{
		config.guest_path = obj.value().template get<std::string>();
	}
	else if (obj.key() == "cache_path")
	{
		config.cache_path = obj.value().template get<std::string>();
	}
	else if (obj.key() == "logging")
	{
		config.runner_logging = obj.value();
	}
	else if (obj.key() == "force_recompile")
	{
		config.force_recompile = obj.value();
	}
	else if (obj.key() == "debug_info")
	{
		config.debug_info = obj.value();
	}
	else if (obj.key() == "max_wasm_stack")
	{
		config.max_wasm_stack = obj.value();
	}
	else if (obj.key() == "worker_nice")
	{
		config.worker_nice = obj.value();
	}
	else
	{
		throw ConfigurationError("Unknown runner configuration key: " + obj.key());
	}
}

RunnerConfig RunnerConfig::from_json(const std::string& json_text)
{
	RunnerConfig config;
	try {
		const auto j = nlohmann::json::parse(json_text, nullptr, true, true);
		if (UNLIKELY(!j.is_object()))
			throw ConfigurationError("Runner configuration must be a JSON object");

		for (auto it = j.begin(); it != j.end(); ++it) {
			configure_runner(config, it);
		}
	} catch (const nlohmann::json::exception& e) {
		throw ConfigurationError(
			std::string("Invalid runner configuration: ") + e.what());
	}
	config.validation();
	return config;
}

RunnerConfig RunnerConfig::from_file(const std::string& filename)
{
	std::vector<uint8_t> data;
	try {
		data = file_loader(filename);
	} catch (const std::exception& e) {
		throw ConfigurationError(e.what());
	}
	return from_json(std::string(data.begin(), data.end()));
}

void RunnerConfig::validation() const
{
	if (id_name.empty())
		throw ConfigurationError("Runner id must not be empty");
	if (guest_path.empty())
		throw ConfigurationError("Guest path must not be empty");
	if (cache_path.empty())
		throw ConfigurationError("Cache path must not be empty");
	if (guest_path == cache_path)
		throw ConfigurationError("Cache path would overwrite the guest binary: " + cache_path);
	if (max_wasm_stack == 0)
		throw ConfigurationError("Guest stack size must be non-zero");
}

} // sandbox
