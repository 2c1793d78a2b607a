#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "hero_registry_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

const char kHostSection[] = R"(host:
  token_program_id: "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA"
  system_program_id: "11111111111111111111111111111111"
  metadata_program_id: "metaqbxxUerdq28cj1RJV8D4S4HHHT8YZbYGFtwwQQS"
)";

bool Rejects(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)heroes::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestMinimalConfigGetsDefaults() {
  const auto yaml_path = WriteYaml("minimal", std::string(R"(program:
  program_id: "HeroRegistry1111111111111111111111111111111"
)") + kHostSection);

  auto config = heroes::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.program().authority_seed() == "hallofheros");
  assert(config.program().max_slots() == 20);
  assert(config.program().buy_strategy() == heroes::runtime::config::BUY_STRATEGY_TRANSFER);
  assert(config.program().retired_name() == "RETIRED");
  assert(config.program().retired_uri() == "retired://");
  assert(config.host().repository_account().empty());
  assert(!config.host().skip_signature_verification());
  assert(!config.host().enable_admin());
}

void TestQuotedDigitKeysStayStrings() {
  // an all-ones key would otherwise be read as a number
  const auto yaml_path = WriteYaml("quoted_digits", std::string(R"(program:
  program_id: "HeroRegistry1111111111111111111111111111111"
  max_slots: 8
  buy_strategy: BUY_STRATEGY_REISSUE
  retired_name: "GONE"
)") + kHostSection);

  auto config = heroes::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.host().system_program_id() == "11111111111111111111111111111111");
  assert(config.program().max_slots() == 8);
  assert(config.program().buy_strategy() == heroes::runtime::config::BUY_STRATEGY_REISSUE);
  assert(config.program().retired_name() == "GONE");
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field", std::string(R"(program:
  program_id: "HeroRegistry1111111111111111111111111111111"
unknown_field: 123
)") + kHostSection) &&
         "ConfigLoader must reject unknown fields.");
}

void TestMissingProgramIdIsRejected() {
  assert(Rejects("missing_program", R"(server:
  bind_address: "127.0.0.1:0"
)" + std::string(kHostSection)));
}

void TestMalformedKeyIsRejected() {
  assert(Rejects("malformed_key", std::string(R"(program:
  program_id: "not base58 0OIl"
)") + kHostSection));
}

void TestSlotLimitIsEnforced() {
  assert(Rejects("too_many_slots", std::string(R"(program:
  program_id: "HeroRegistry1111111111111111111111111111111"
  max_slots: 257
)") + kHostSection));
}

void TestOversizedSeedIsRejected() {
  assert(Rejects("long_seed", std::string(R"(program:
  program_id: "HeroRegistry1111111111111111111111111111111"
  authority_seed: "0123456789abcdef0123456789abcdef0"
)") + kHostSection));
}

} // namespace

int main() {
  TestMinimalConfigGetsDefaults();
  TestQuotedDigitKeysStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingProgramIdIsRejected();
  TestMalformedKeyIsRejected();
  TestSlotLimitIsEnforced();
  TestOversizedSeedIsRejected();

  std::cout << "hero_registry_unit_config_loader: pass\n";
  return 0;
}
