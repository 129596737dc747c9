#include <catch2/catch_test_macros.hpp>
#include "hermes/config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace hermes;

namespace
{
    const char *kYaml = R"(
registers:
  - endpoint: /github
    method: POST
    target:
      url: http://localhost:8080/hook
      method: POST
      headers:
        Authorization: Bearer abc
        X-Count: 3
      timeout_seconds: 10
    template: '{"repo": "{{repository.name}}"}'
    retry_config:
      attempts: 4
      delay_ms: 250
      backoff_multiplier: 1.5
  - endpoint: /answer
    method: post
    target:
      url: https://example.com/x
      method: PUT
    template: '42'
settings:
  retry_attempts: 2
  retry_delay_ms: 100
  retry_backoff_multiplier: 3.0
  enable_metrics: true
)";

    const char *kToml = R"(
[[registers]]
endpoint = "/github"
method = "POST"
template = '{"repo": "{{repository.name}}"}'

[registers.target]
url = "http://localhost:8080/hook"
method = "POST"
timeout_seconds = 10

[registers.target.headers]
Authorization = "Bearer abc"
X-Count = 3

[registers.retry_config]
attempts = 4
delay_ms = 250
backoff_multiplier = 1.5

[[registers]]
endpoint = "/answer"
method = "post"
template = "42"

[registers.target]
url = "https://example.com/x"
method = "PUT"

[settings]
retry_attempts = 2
retry_delay_ms = 100
retry_backoff_multiplier = 3.0
enable_metrics = true
)";

    const char *kJson = R"({
  "registers": [
    {
      "endpoint": "/github",
      "method": "POST",
      "target": {
        "url": "http://localhost:8080/hook",
        "method": "POST",
        "headers": {"Authorization": "Bearer abc", "X-Count": 3},
        "timeout_seconds": 10
      },
      "template": "{\"repo\": \"{{repository.name}}\"}",
      "retry_config": {"attempts": 4, "delay_ms": 250, "backoff_multiplier": 1.5}
    },
    {
      "endpoint": "/answer",
      "method": "post",
      "target": {"url": "https://example.com/x", "method": "PUT"},
      "template": "42"
    }
  ],
  "settings": {
    "retry_attempts": 2,
    "retry_delay_ms": 100,
    "retry_backoff_multiplier": 3.0,
    "enable_metrics": true
  }
})";

    std::filesystem::path write_temp(const std::string &name, const std::string &content)
    {
        auto path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << content;
        return path;
    }
} // namespace

TEST_CASE("YAML config maps onto the schema", "[config]")
{
    auto cfg = ConfigLoader::from_string(kYaml, ConfigFormat::Yaml);
    REQUIRE(cfg);
    REQUIRE(cfg->registers.size() == 2);

    const auto &gh = cfg->registers[0];
    REQUIRE(gh.endpoint == "/github");
    REQUIRE(gh.target.url == "http://localhost:8080/hook");
    REQUIRE(gh.target.headers.at("Authorization") == "Bearer abc");
    REQUIRE(gh.target.headers.at("X-Count") == "3");
    REQUIRE(gh.target.timeout_seconds == 10u);
    REQUIRE(gh.template_source == R"({"repo": "{{repository.name}}"})");
    REQUIRE(gh.retry_config == RetryPolicy{4, 250, 1.5});

    REQUIRE(cfg->settings.retry_attempts == 2);
    REQUIRE(cfg->settings.retry_delay_ms == 100);
    REQUIRE(cfg->settings.retry_backoff_multiplier == 3.0);
    REQUIRE(cfg->settings.enable_metrics);
    REQUIRE_FALSE(cfg->settings.strict_templates);
}

TEST_CASE("Quoted YAML templates stay strings", "[config]")
{
    auto cfg = ConfigLoader::from_string(kYaml, ConfigFormat::Yaml);
    REQUIRE(cfg);
    REQUIRE(cfg->registers[1].template_source == "42");
}

TEST_CASE("YAML, TOML and JSON configs are equivalent", "[config]")
{
    auto yaml = ConfigLoader::from_string(kYaml, ConfigFormat::Yaml);
    auto toml = ConfigLoader::from_string(kToml, ConfigFormat::Toml);
    auto json = ConfigLoader::from_string(kJson, ConfigFormat::Json);
    REQUIRE(yaml);
    REQUIRE(toml);
    REQUIRE(json);

    REQUIRE(ConfigLoader::to_json(*yaml) == ConfigLoader::to_json(*json));
    REQUIRE(ConfigLoader::to_json(*toml) == ConfigLoader::to_json(*json));
}

TEST_CASE("Settings default when the section is absent", "[config]")
{
    auto cfg = ConfigLoader::from_string("registers: []\n", ConfigFormat::Yaml);
    REQUIRE(cfg);
    REQUIRE(cfg->registers.empty());
    REQUIRE(cfg->settings.retry_attempts == 3);
    REQUIRE(cfg->settings.retry_delay_ms == 1000);
    REQUIRE(cfg->settings.retry_backoff_multiplier == 2.0);
    REQUIRE_FALSE(cfg->settings.enable_metrics);
}

TEST_CASE("Schema errors name the register and field", "[config]")
{
    auto missing = ConfigLoader::from_string(R"({"registers":[{"endpoint":"/a","method":"POST","template":"{}"}]})",
                                             ConfigFormat::Json);
    REQUIRE_FALSE(missing);
    REQUIRE(missing.error().code == ErrorCode::ConfigError);
    REQUIRE(std::string(missing.error().what()) == "Register 0: missing required field 'target'");

    auto no_url = ConfigLoader::from_string(
        R"({"registers":[{"endpoint":"/a","method":"POST","template":"{}","target":{"method":"POST"}}]})",
        ConfigFormat::Json);
    REQUIRE_FALSE(no_url);
    REQUIRE(std::string(no_url.error().what()) == "Register 0.target: missing required field 'url'");

    auto bad_timeout = ConfigLoader::from_string(
        R"({"registers":[{"endpoint":"/a","method":"POST","template":"{}","target":{"url":"http://x","method":"POST","timeout_seconds":-1}}]})",
        ConfigFormat::Json);
    REQUIRE_FALSE(bad_timeout);

    auto zero_timeout = ConfigLoader::from_string(
        R"({"registers":[{"endpoint":"/a","method":"POST","template":"{}","target":{"url":"http://x","method":"POST","timeout_seconds":0}}]})",
        ConfigFormat::Json);
    REQUIRE_FALSE(zero_timeout);
    REQUIRE(zero_timeout.error().code == ErrorCode::ConfigError);
    REQUIRE(std::string(zero_timeout.error().what()) == "Register 0.target: timeout_seconds must be greater than zero");

    auto long_timeout = ConfigLoader::from_string(
        R"({"registers":[{"endpoint":"/a","method":"POST","template":"{}","target":{"url":"http://x","method":"POST","timeout_seconds":86400}}]})",
        ConfigFormat::Json);
    REQUIRE_FALSE(long_timeout);
    REQUIRE(std::string(long_timeout.error().what()) == "Register 0.target: timeout_seconds must not exceed 3600");

    auto no_registers = ConfigLoader::from_string(R"({"settings":{}})", ConfigFormat::Json);
    REQUIRE_FALSE(no_registers);
}

TEST_CASE("Syntax errors are ConfigErrors", "[config]")
{
    auto yaml = ConfigLoader::from_string("registers: [unclosed", ConfigFormat::Yaml);
    REQUIRE_FALSE(yaml);
    REQUIRE(yaml.error().code == ErrorCode::ConfigError);

    auto toml = ConfigLoader::from_string("registers = [", ConfigFormat::Toml);
    REQUIRE_FALSE(toml);
    REQUIRE(toml.error().code == ErrorCode::ConfigError);

    auto json = ConfigLoader::from_string("{", ConfigFormat::Json);
    REQUIRE_FALSE(json);
    REQUIRE(json.error().code == ErrorCode::ConfigError);
}

TEST_CASE("Format is chosen by extension", "[config]")
{
    REQUIRE(ConfigLoader::format_for_path("config.yml") == ConfigFormat::Yaml);
    REQUIRE(ConfigLoader::format_for_path("/etc/hermes/CONFIG.YAML") == ConfigFormat::Yaml);
    REQUIRE(ConfigLoader::format_for_path("relay.toml") == ConfigFormat::Toml);
    REQUIRE(ConfigLoader::format_for_path("relay.json") == ConfigFormat::Json);
    REQUIRE_FALSE(ConfigLoader::format_for_path("relay.ini"));
    REQUIRE_FALSE(ConfigLoader::format_for_path("relay"));
}

TEST_CASE("Load reads files from disk", "[config]")
{
    auto path = write_temp("hermes_test_config.yml", kYaml);
    auto cfg = ConfigLoader::load(path.string());
    std::filesystem::remove(path);
    REQUIRE(cfg);
    REQUIRE(cfg->registers.size() == 2);

    auto missing = ConfigLoader::load("/nonexistent/hermes.yml");
    REQUIRE_FALSE(missing);
    REQUIRE(missing.error().code == ErrorCode::ConfigError);
}

TEST_CASE("Validation accepts a well-formed config", "[config]")
{
    auto cfg = ConfigLoader::from_string(kYaml, ConfigFormat::Yaml);
    REQUIRE(cfg);
    REQUIRE(ConfigLoader::validate(*cfg));
}

TEST_CASE("Validation rejects bad registers", "[config]")
{
    auto base = ConfigLoader::from_string(kYaml, ConfigFormat::Yaml);
    REQUIRE(base);

    auto expect_invalid = [](const RelayConfig &cfg, const std::string &fragment)
    {
        auto res = ConfigLoader::validate(cfg);
        REQUIRE_FALSE(res);
        REQUIRE(res.error().code == ErrorCode::ValidationError);
        INFO(res.error().what());
        REQUIRE(std::string(res.error().what()).find(fragment) != std::string::npos);
    };

    auto cfg = *base;
    cfg.registers[0].endpoint = "github";
    expect_invalid(cfg, "endpoint must start with '/'");

    cfg = *base;
    cfg.registers[1].endpoint = "/github";
    expect_invalid(cfg, "duplicate endpoint '/github' (already defined by register 0)");

    cfg = *base;
    cfg.registers[0].method = "FETCH";
    expect_invalid(cfg, "invalid HTTP method 'FETCH'");

    cfg = *base;
    cfg.registers[0].target.url = "";
    expect_invalid(cfg, "target URL cannot be empty");

    cfg = *base;
    cfg.registers[0].target.url = "ftp://example.com";
    expect_invalid(cfg, "invalid target URL");

    cfg = *base;
    cfg.registers[0].target.method = "TRACE";
    expect_invalid(cfg, "invalid target method 'TRACE'");

    cfg = *base;
    cfg.registers[0].target.headers["Bad Header"] = "x";
    expect_invalid(cfg, "invalid header name");

    cfg = *base;
    cfg.registers[0].target.headers["X-Inject"] = "a\r\nb: c";
    expect_invalid(cfg, "contains a line break");

    cfg = *base;
    cfg.registers[0].target.timeout_seconds = 0;
    expect_invalid(cfg, "timeout_seconds must be greater than zero");

    cfg = *base;
    cfg.registers[0].target.timeout_seconds = kMaxTimeoutSeconds + 1;
    expect_invalid(cfg, "timeout_seconds must not exceed 3600");

    cfg = *base;
    cfg.registers[0].retry_config->attempts = 0;
    expect_invalid(cfg, "retry attempts must be at least 1");

    cfg = *base;
    cfg.registers[0].retry_config->backoff_multiplier = 0.5;
    expect_invalid(cfg, "backoff_multiplier must be >= 1.0");

    cfg = *base;
    cfg.settings.retry_backoff_multiplier = 0.0;
    expect_invalid(cfg, "retry_backoff_multiplier");
}

TEST_CASE("Supported methods are matched case-insensitively", "[config]")
{
    for (const std::string m : {"GET", "post", "Put", "DELETE", "patch"})
        REQUIRE(is_supported_method(m));
    for (const std::string m : {"HEAD", "OPTIONS", "", "GETX"})
        REQUIRE_FALSE(is_supported_method(m));
}

TEST_CASE("dotenv never overrides existing variables", "[config]")
{
    ::setenv("HERMES_TEST_PRESET", "from-env", 1);
    ::unsetenv("HERMES_TEST_NEW");
    ::unsetenv("HERMES_TEST_QUOTED");

    auto path = write_temp("hermes_test.env",
                           "# comment\n"
                           "HERMES_TEST_PRESET=from-file\n"
                           "export HERMES_TEST_NEW=fresh\n"
                           "HERMES_TEST_QUOTED=\"a b\"\n");
    auto applied = load_dotenv(path.string());
    std::filesystem::remove(path);

    REQUIRE(applied);
    REQUIRE(*applied == 2);
    REQUIRE(std::string(std::getenv("HERMES_TEST_PRESET")) == "from-env");
    REQUIRE(std::string(std::getenv("HERMES_TEST_NEW")) == "fresh");
    REQUIRE(std::string(std::getenv("HERMES_TEST_QUOTED")) == "a b");

    auto missing = load_dotenv("/nonexistent/.env");
    REQUIRE(missing);
    REQUIRE(*missing == 0);
}
