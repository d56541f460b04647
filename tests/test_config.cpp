#include "fdup/error.h"
#include "fdup/orchestrator/config.h"

#include <cassert>
#include <initializer_list>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using fdup::orchestrator::ImagerConfig;
using fdup::orchestrator::RunMode;

struct FakeEnvironment {
  std::map<std::string, std::string> values;

  fdup::orchestrator::EnvironmentLookup Lookup() const {
    return [this](std::string_view name) -> std::optional<std::string> {
      auto it = values.find(std::string(name));
      if (it == values.end()) {
        return std::nullopt;
      }
      return it->second;
    };
  }
};

ImagerConfig Parse(std::initializer_list<std::string_view> args, const FakeEnvironment& env = {}) {
  std::vector<std::string_view> list(args);
  return fdup::orchestrator::ParseImagerConfig(list, env.Lookup());
}

bool ParseFails(std::initializer_list<std::string_view> args, fdup::ErrorDomain domain) {
  try {
    Parse(args);
  } catch (const fdup::Error& err) {
    return err.domain == domain;
  }
  return false;
}

void TestArityDecidesMode() {
  assert(Parse({}).mode == RunMode::kList);
  assert(Parse({"/dev/sda"}).mode == RunMode::kList);

  const auto run = Parse({"/dev/sda", "my-forensic-bucket"});
  assert(run.mode == RunMode::kDuplicate);
  assert(run.source_device == "/dev/sda");
  assert(run.bucket == "my-forensic-bucket");

  assert(ParseFails({"a", "b", "c"}, fdup::ErrorDomain::Validation));
}

void TestDefaults() {
  const auto config = Parse({"/dev/sda", "bucket"});
  assert(!config.gpio_enabled);
  assert(config.gpio_tool == "gpio");
  assert(config.led_pin == 18);
  assert(config.blink_half_period == std::chrono::milliseconds(500));
  assert(config.block_size == 4 * 1024 * 1024);
  assert(config.pbkdf2_iterations == 10000);
  assert(config.log_file == "/var/log/fdup.log");
  assert((config.required_tools == std::vector<std::string>{"lsblk", "aws"}));
}

void TestFlags() {
  const auto listed = Parse({"--list", "/dev/sda", "bucket"});
  assert(listed.mode == RunMode::kList);

  const auto config = Parse({"--gpio", "--log-file=/tmp/x.log", "--block-size=1048576", "/dev/sdb", "b"});
  assert(config.gpio_enabled);
  assert(config.log_file == "/tmp/x.log");
  assert(config.block_size == 1048576);
  assert(config.mode == RunMode::kDuplicate);

  assert(Parse({"--help", "--bogus"}).mode == RunMode::kHelp);
  assert(ParseFails({"--bogus"}, fdup::ErrorDomain::Validation));
  assert(ParseFails({"--block-size=0"}, fdup::ErrorDomain::Config));
  assert(ParseFails({"--block-size=12abc"}, fdup::ErrorDomain::Config));
  assert(ParseFails({"--block-size=67108865"}, fdup::ErrorDomain::Config));
  assert(ParseFails({"--log-file="}, fdup::ErrorDomain::Config));
  assert(Parse({"--block-size=67108864"}).block_size == 64 * 1024 * 1024);

  const auto dashed = Parse({"--", "--weird-device", "bucket"});
  assert(dashed.source_device == "--weird-device");
}

void TestEnvironment() {
  FakeEnvironment env;
  env.values["GPIO_ENABLED"] = "true";
  env.values["FDUP_LOG_FILE"] = "/srv/log/imager.log";
  const auto config = Parse({"/dev/sda", "bucket"}, env);
  assert(config.gpio_enabled);
  assert(config.log_file == "/srv/log/imager.log");

  FakeEnvironment other;
  other.values["GPIO_ENABLED"] = "yes";
  assert(!Parse({}, other).gpio_enabled);

  const auto flag_wins = Parse({"--log-file=/tmp/flag.log"}, env);
  assert(flag_wins.log_file == "/tmp/flag.log");
}

void TestUsageMentionsKeyAndExample() {
  const auto text = fdup::orchestrator::UsageText("fdup");
  assert(text.find("ENCRYPTION_KEY") != std::string::npos);
  assert(text.find("fdup /dev/sda my-forensic-bucket") != std::string::npos);
  assert(text.find("--block-size") != std::string::npos);
}

}  // namespace

int main() {
  TestArityDecidesMode();
  TestDefaults();
  TestFlags();
  TestEnvironment();
  TestUsageMentionsKeyAndExample();
  std::cout << "config tests ok\n";
  return 0;
}
