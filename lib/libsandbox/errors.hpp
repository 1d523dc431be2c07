#pragma once
#include <stdexcept>
#include <string>

namespace sandbox
{
	struct RunnerError : public std::runtime_error {
		using std::runtime_error::runtime_error;
	};

	/* Engine setup, linking or guest binary failures */
	struct ConfigurationError : public RunnerError {
		using RunnerError::RunnerError;
	};

	/* A message loop is already executing on this runner */
	struct AlreadyRunning : public RunnerError {
		AlreadyRunning() : RunnerError("run_msg_loop already running") {}
	};

	/* No initialised guest exists */
	struct NotStarted : public RunnerError {
		using RunnerError::RunnerError;
	};

	/* The guest trapped or reported an error from its message loop */
	struct GuestFault : public RunnerError {
		using RunnerError::RunnerError;
	};

	/* A capability handle failed. The message is already formatted as
	   "Type: message" and becomes the guest trap message. */
	struct CapabilityFailure : public RunnerError {
		using RunnerError::RunnerError;
	};

} // sandbox
