#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <aegis/execution/engine.hpp>
#include <aegis/schema/primitives.hpp>
#include <iostream>
#include <memory>
#include <string>

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto query_path = std::string{};
  auto key_hex = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Aegis"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "aegis.db"),
      "RocksDB path of the account state database")(
      "log-level,l",
      boost::program_options::value<std::string>(&log_level)->default_value(
          "info"),
      "trace, debug, info, warn, error or critical")(
      "log-file,f",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "aegis.log"),
      "File the log is mirrored to")(
      "query,q", boost::program_options::value<std::string>(&query_path),
      "Query route, for example /account")(
      "key,k", boost::program_options::value<std::string>(&key_hex),
      "Hex encoded SCALE query key")(
      "stats,s", "Print the number of entries in each keyspace");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "aegis", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  auto key = aegis::schema::try_from_hex(key_hex);
  if (!key.has_value()) {
    spdlog::error("--key is not valid hex");
    spdlog::shutdown();
    return 1;
  }

  auto status = 0;
  {
    auto engine = aegis::execution::engine{
        aegis::execution::engine_config_t{.db_path = db_path}};

    if (vm.contains("stats")) {
      for (const auto& [keyspace, count] : engine.keyspace_sizes()) {
        std::cout << keyspace << " " << count << "\n";
      }
    }

    if (vm.contains("query")) {
      auto result = engine.query(
          query_path, aegis::schema::bytes_view_t{key->data(), key->size()});
      if (result.code != 0) {
        spdlog::error("Query {} failed: {} ({})", query_path, result.log,
                      result.code);
        status = 2;
      } else {
        std::cout << aegis::schema::to_hex(aegis::schema::bytes_view_t{
                         result.value.data(), result.value.size()})
                  << std::endl;
      }
    }
  }

  spdlog::shutdown();
  return status;
}
