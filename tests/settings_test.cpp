#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"

#include <string>
#include <vector>

namespace {

using parcel::test::TempWorkspace;
using parcel::test::TestContext;

bool test_defaults(TestContext&) {
  SettingsManager settings;
  PARCEL_CHECK(settings.get<std::string>("command") == "repl");
  PARCEL_CHECK(settings.get<int>("transfer_port") == 7682);
  PARCEL_CHECK(settings.get<int>("discovery_port") == 7683);
  PARCEL_CHECK(settings.get<std::string>("multicast_group") == "239.255.42.99");
  PARCEL_CHECK(settings.get<int>("chunk_size") == 4 * 1024 * 1024);
  PARCEL_CHECK(settings.get<int>("transfer_timeout") == 300);
  PARCEL_CHECK(settings.get<std::string>("pull_mode") == "full");
  PARCEL_CHECK(settings.get<bool>("discovery"));
  PARCEL_CHECK(!settings.get<bool>("verbose"));
  PARCEL_CHECK(!settings.help_requested());
  PARCEL_CHECK(!settings.save_requested());
  PARCEL_CHECK(settings.keys().size() == SETTINGS_SPECIFICATION.size());
  PARCEL_CHECK_THROWS(settings.get<int>("no_such_setting"), std::runtime_error);
  return true;
}

bool test_set_and_validate(TestContext&) {
  SettingsManager settings;
  std::string error;

  PARCEL_CHECK(settings.set_from_string("port", "9000", error));
  PARCEL_CHECK(settings.get<int>("transfer_port") == 9000);
  PARCEL_CHECK(settings.set_from_string("TP", " 0 ", error));
  PARCEL_CHECK(settings.get<int>("transfer_port") == 0);

  PARCEL_CHECK(!settings.set_from_string("transfer_port", "70000", error));
  PARCEL_CHECK(error.find("between") != std::string::npos);
  PARCEL_CHECK(!settings.set_from_string("transfer_port", "12ab", error));
  PARCEL_CHECK(!settings.set_from_string("chunk_size", "512", error));
  PARCEL_CHECK(settings.get<int>("transfer_port") == 0);

  PARCEL_CHECK(settings.set_from_string("pull_mode", "chunked", error));
  PARCEL_CHECK(!settings.set_from_string("pull_mode", "sideways", error));
  PARCEL_CHECK(settings.get<std::string>("pull_mode") == "chunked");

  PARCEL_CHECK(settings.set_from_string("multicast", "off", error));
  PARCEL_CHECK(!settings.get<bool>("discovery"));
  PARCEL_CHECK(!settings.set_from_string("discovery", "maybe", error));
  PARCEL_CHECK(!settings.set_from_string("bogus", "1", error));
  PARCEL_CHECK(error == "unknown setting");

  settings.set("crypto_backend", "hmac-sha256");
  PARCEL_CHECK(settings.value_as_string("backend") == "<unknown>");
  PARCEL_CHECK(settings.value_as_string("crypto_backend") == "hmac-sha256");
  PARCEL_CHECK_THROWS(settings.set("crypto_backend", "rot13"), std::invalid_argument);
  PARCEL_CHECK_THROWS(settings.set("worker_threads", "four"), std::invalid_argument);

  settings.reset("tp");
  PARCEL_CHECK(settings.get<int>("transfer_port") == 7682);
  PARCEL_CHECK(settings.resolve_key("DN") == std::optional<std::string>("display_name"));
  PARCEL_CHECK(!settings.resolve_key("nope"));
  return true;
}

bool test_save_and_load(TestContext&) {
  TempWorkspace ws("settings_io");
  auto path = ws / ".config" / "settings.json";

  SettingsManager settings;
  settings.set_settings_path(path);
  settings.set("transfer_port", 9100);
  settings.set("display_name", "bench");
  settings.set("command", "serve");
  settings.set("data_dir", "/tmp/elsewhere");
  PARCEL_CHECK(settings.save());

  auto doc = nlohmann::json::parse(parcel::test::read_file(path));
  PARCEL_CHECK(doc.at("transfer_port") == 9100);
  PARCEL_CHECK(!doc.contains("command"));
  PARCEL_CHECK(!doc.contains("data_dir"));
  PARCEL_CHECK(!doc.contains("help"));

  SettingsManager reloaded;
  reloaded.set_settings_path(path);
  PARCEL_CHECK(reloaded.load());
  PARCEL_CHECK(reloaded.get<int>("transfer_port") == 9100);
  PARCEL_CHECK(reloaded.get<std::string>("display_name") == "bench");
  PARCEL_CHECK(reloaded.get<std::string>("command") == "repl");
  PARCEL_CHECK(reloaded.get<std::string>("data_dir") == ".parcel");

  parcel::test::write_file(path, R"({"transfer_port": 99999, "name": "aliased", "mystery": 1, "verbose": 1})");
  SettingsManager partial;
  PARCEL_CHECK(partial.load_from_file(path));
  PARCEL_CHECK(partial.get<int>("transfer_port") == 7682);
  PARCEL_CHECK(partial.get<std::string>("display_name") == "aliased");
  PARCEL_CHECK(partial.get<bool>("verbose"));

  parcel::test::write_file(path, "{ broken");
  SettingsManager broken;
  PARCEL_CHECK(!broken.load_from_file(path));
  PARCEL_CHECK(!broken.load_from_file(ws / "missing.json"));
  PARCEL_CHECK(!broken.load());
  return true;
}

bool test_command_line(TestContext&) {
  CommandLineParser parser;
  SettingsManager settings;
  parser.parse({"serve", "--port", "0", "--name=alpha", "-dp", "9999", "--verbose",
                "--discovery", "false", "--peer", "10.0.0.2:7682"}, settings);
  PARCEL_CHECK(settings.get<std::string>("command") == "serve");
  PARCEL_CHECK(settings.get<int>("transfer_port") == 0);
  PARCEL_CHECK(settings.get<std::string>("display_name") == "alpha");
  PARCEL_CHECK(settings.get<int>("discovery_port") == 9999);
  PARCEL_CHECK(settings.get<bool>("verbose"));
  PARCEL_CHECK(!settings.get<bool>("discovery"));
  PARCEL_CHECK(settings.get<std::string>("manual_peer") == "10.0.0.2:7682");

  SettingsManager flags;
  parser.parse({"--help", "--save"}, flags);
  PARCEL_CHECK(flags.help_requested());
  PARCEL_CHECK(flags.save_requested());

  SettingsManager fresh;
  PARCEL_CHECK_THROWS(parser.parse({"--frobnicate"}, fresh), std::invalid_argument);
  PARCEL_CHECK_THROWS(parser.parse({"--port"}, fresh), std::invalid_argument);
  PARCEL_CHECK_THROWS(parser.parse({"--port", "eighty"}, fresh), std::invalid_argument);
  PARCEL_CHECK_THROWS(parser.parse({"launch"}, fresh), std::invalid_argument);
  PARCEL_CHECK_THROWS(parser.parse({"repl", "extra"}, fresh), std::invalid_argument);

  std::vector<std::string> storage = {"parcel", "--pm", "chunked"};
  std::vector<char*> argv;
  for(auto& s : storage) argv.push_back(s.data());
  SettingsManager from_argv;
  parser.parse(static_cast<int>(argv.size()), argv.data(), from_argv);
  PARCEL_CHECK(from_argv.get<std::string>("pull_mode") == "chunked");
  return true;
}

bool test_bad_positional_spec(TestContext&) {
  PARCEL_CHECK_THROWS(CommandLineParser("parcel", SETTINGS_SPECIFICATION,
                                        nlohmann::json::array({{{"index", 0}, {"key", "nonexistent"}}})),
                      std::runtime_error);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<parcel::test::TestCase> tests = {
    {"defaults", test_defaults},
    {"set_and_validate", test_set_and_validate},
    {"save_and_load", test_save_and_load},
    {"command_line", test_command_line},
    {"bad_positional_spec", test_bad_positional_spec},
  };
  return parcel::test::run_test_cases("settings", tests, argc, argv);
}
