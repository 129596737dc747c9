#include "hermes/cli.hpp"
#include "hermes/admin.hpp"
#include "hermes/config.hpp"
#include "hermes/endpoint_registry.hpp"
#include "hermes/logging.hpp"
#include "hermes/web_server.hpp"
#include <CLI/CLI.hpp>
#include <iostream>
#include <thread>

namespace hermes::cli
{
	namespace
	{
		bool init_logging(const std::string &level_name, const std::string &format_name)
		{
			auto level = logging::parse_level(level_name);
			if (!level)
			{
				std::cerr << level.error().what() << std::endl;
				return false;
			}
			auto format = logging::parse_format(format_name);
			if (!format)
			{
				std::cerr << format.error().what() << std::endl;
				return false;
			}
			logging::init(*level, *format);
			return true;
		}
	} // namespace

	int run_server(int argc, char *argv[])
	{
		// Values from .env never override the real environment.
		auto dotenv = load_dotenv(".env");
		if (!dotenv)
			std::cerr << dotenv.error().what() << std::endl;

		CLI::App app{"Hermes webhook relay"};

		std::string config_path{"config.yml"};
		std::string log_level{"info"};
		std::string log_format{"pretty"};
		std::uint64_t request_timeout{30};
		bool tls_insecure{false};
		WebServerConfig wsc{};

		app.add_option("-c,--config", config_path, "Configuration file (.yml, .yaml, .toml or .json)")
			->envname("HERMES_CONFIG_PATH")
			->capture_default_str();
		app.add_option("--bind-address", wsc.bind_address, "Address to bind")
			->envname("HERMES_BIND_ADDRESS")
			->capture_default_str();
		app.add_option("-p,--port", wsc.port, "Port to listen on")
			->envname("HERMES_PORT")
			->capture_default_str();
		app.add_option("--log-level", log_level, "trace, debug, info, warn, error, critical or off")
			->envname("HERMES_LOG_LEVEL")
			->capture_default_str();
		app.add_option("--log-format", log_format, "pretty or json")
			->envname("HERMES_LOG_FORMAT")
			->check(CLI::IsMember({"pretty", "json"}))
			->capture_default_str();
		app.add_option("--request-timeout", request_timeout, "Inbound read and default outbound timeout in seconds")
			->envname("HERMES_REQUEST_TIMEOUT")
			->check(CLI::Range(std::uint64_t{1}, kMaxTimeoutSeconds))
			->capture_default_str();
		app.add_option("--max-concurrent-requests", wsc.max_concurrent_requests, "In-flight request cap (0 disables)")
			->envname("HERMES_MAX_CONCURRENT_REQUESTS")
			->capture_default_str();
		app.add_option("--health-check-enabled", wsc.health_check_enabled, "Serve /health and /ready")
			->envname("HERMES_HEALTH_CHECK_ENABLED")
			->capture_default_str();
		app.add_option("--threads", wsc.threads, "Worker threads")
			->envname("HERMES_THREADS")
			->check(CLI::PositiveNumber)
			->capture_default_str();
		app.add_flag("--tls-insecure", tls_insecure, "Skip certificate verification for https targets")
			->envname("HERMES_TLS_INSECURE");

		CLI11_PARSE(app, argc, argv);

		if (!init_logging(log_level, log_format))
			return 1;
		auto log = logging::category("server");

		wsc.request_timeout = std::chrono::seconds(request_timeout);
		wsc.verify_tls = !tls_insecure;

		auto cfg = ConfigLoader::load(config_path);
		if (!cfg)
		{
			log->critical("Failed to load configuration from {}: {}", config_path, cfg.error().what());
			return 1;
		}
		if (cfg->settings.enable_metrics)
			log->warn("enable_metrics is set but no metrics exporter is built in; ignoring");

		auto registry = EndpointRegistry::build(*cfg);
		if (!registry)
		{
			log->critical("{}", registry.error().what());
			return 1;
		}

		try
		{
			WebServer server(wsc, *registry);
			server.run();
		}
		catch (const std::exception &e)
		{
			log->critical("Server error: {}", e.what());
			return 1;
		}
		return 0;
	}

	int run_admin(int argc, char *argv[])
	{
		CLI::App app{"Administrative tools for Hermes"};
		app.require_subcommand(1);

		std::string config_path{"config.yml"};
		std::string endpoint;
		std::string payload;
		std::string log_level{"warn"};

		app.add_option("--log-level", log_level, "Log level")->capture_default_str();

		auto validate_cmd = app.add_subcommand("validate-config", "Validate configuration file");
		validate_cmd->add_option("-c,--config", config_path, "Path to configuration file")->capture_default_str();

		auto template_cmd = app.add_subcommand("test-template", "Test webhook template rendering");
		template_cmd->add_option("-c,--config", config_path, "Path to configuration file")->capture_default_str();
		template_cmd->add_option("-e,--endpoint", endpoint, "Endpoint to test")->required();
		template_cmd->add_option("-p,--payload", payload, "JSON payload to test with")->required();

		auto list_cmd = app.add_subcommand("list-endpoints", "List all registered endpoints");
		list_cmd->add_option("-c,--config", config_path, "Path to configuration file")->capture_default_str();

		CLI11_PARSE(app, argc, argv);

		if (!init_logging(log_level, "pretty"))
			return 1;

		auto cfg = ConfigLoader::load(config_path);
		if (!cfg)
		{
			std::cerr << "Error: " << cfg.error().what() << std::endl;
			return 1;
		}

		if (*validate_cmd)
		{
			auto valid = admin::validate_config(*cfg);
			if (!valid)
			{
				std::cerr << "Error: " << valid.error().what() << std::endl;
				return 1;
			}
			std::cout << "Configuration is valid (" << cfg->registers.size() << " registers)" << std::endl;
			return 0;
		}

		if (*template_cmd)
		{
			auto result = admin::test_template(*cfg, endpoint, payload);
			if (!result)
			{
				std::cerr << "Error: " << result.error().what() << std::endl;
				return 1;
			}
			std::cout << "Template rendered successfully:" << std::endl;
			std::cout << result->rendered << std::endl;
			if (result->json_error)
			{
				std::cerr << "Error: rendered output is not valid JSON: " << *result->json_error << std::endl;
				return 1;
			}
			std::cout << "Rendered output is valid JSON" << std::endl;
			return 0;
		}

		if (*list_cmd)
		{
			admin::list_endpoints(*cfg, std::cout);
			return 0;
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace hermes::cli
