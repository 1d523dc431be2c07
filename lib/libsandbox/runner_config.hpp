#pragma once
#include "settings.hpp"
#include <optional>
#include <string>

namespace sandbox
{
	struct RunnerConfig
	{
		/* Identifier handed to the guest on initialisation (mandatory) */
		std::string id_name;
		/* Opaque logging tags, absent unless configured */
		std::optional<std::string> log_tags;

		bool inherit_stdio = DEFAULT_INHERIT_STDIO;
		bool runner_logging = DEFAULT_RUNNER_LOGGING;
		bool force_recompile = false;

		std::string guest_path = DEFAULT_GUEST_PATH;
		std::string cache_path = DEFAULT_CACHE_PATH;

		/* Engine knobs */
		bool   debug_info = false;
		size_t max_wasm_stack = DEFAULT_MAX_WASM_STACK;
		int    worker_nice = GUEST_THREAD_NICE;

		void validation() const;

		static RunnerConfig from_json(const std::string& json_text);
		static RunnerConfig from_file(const std::string& filename);

		RunnerConfig() = default;
		RunnerConfig(std::string id, std::optional<std::string> tags = std::nullopt,
			bool inherit = DEFAULT_INHERIT_STDIO)
			: id_name{std::move(id)}, log_tags{std::move(tags)},
			  inherit_stdio{inherit} {}
	};
} // sandbox
