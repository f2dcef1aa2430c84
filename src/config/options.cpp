#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <procura/config/options.hpp>
#include <sstream>

namespace po = boost::program_options;

namespace procura::config {

std::variant<options, parse_error> parse_options(int argc,
                                                 const char* const argv[]) {
  auto parsed = options{};
  auto config_file = std::string{};

  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI style configuration file");

  auto engine = po::options_description{"Procura"};
  engine.add_options()(
      "db-path,d",
      po::value<std::string>(&parsed.db_path)->default_value(parsed.db_path),
      "RocksDB directory for the procurement store")(
      "grpc-address,g",
      po::value<std::string>(&parsed.grpc_address)
          ->default_value(parsed.grpc_address),
      "IP:Port for the procurement gRPC service")(
      "fallback-role",
      po::value<std::string>(&parsed.fallback_role)
          ->default_value(parsed.fallback_role),
      "Approver role that receives escalated orders")(
      "fiscal-year",
      po::value<uint16_t>(&parsed.fiscal_year)->default_value(0),
      "Only budgets for this fiscal year are reservable (0 = any)")(
      "log-level",
      po::value<std::string>(&parsed.log_level)
          ->default_value(parsed.log_level),
      "trace, debug, info, warn, error, critical or off")(
      "log-file",
      po::value<std::string>(&parsed.log_file)->default_value(parsed.log_file),
      "Log file written next to the console output");

  auto all = po::options_description{"procurad"};
  all.add(generic).add(engine);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, all), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        return parse_error{"cannot open config file '" + path + "'"};
      }
      // store() keeps the first value seen, so command line values win.
      po::store(po::parse_config_file(file, engine), vm);
      parsed.config_file = path;
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    return parse_error{ex.what()};
  }

  if (parsed.fallback_role.empty()) {
    return parse_error{"fallback-role must not be empty"};
  }
  if (spdlog::level::from_str(parsed.log_level) == spdlog::level::off &&
      parsed.log_level != "off") {
    return parse_error{"unknown log level '" + parsed.log_level + "'"};
  }

  if (vm.contains("help")) {
    parsed.help = true;
    auto usage = std::ostringstream{};
    usage << all;
    parsed.usage = usage.str();
  }
  return parsed;
}

}  // namespace procura::config
