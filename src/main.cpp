#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <keyward/lifecycle/controller.hpp>
#include <keyward/policy/evaluator.hpp>
#include <keyward/registry/registry.hpp>
#include <keyward/storage/rocksdb/storage.hpp>
#include <iostream>
#include <optional>
#include <string>

using namespace keyward::schema;

namespace {

std::string_view lifecycle_name(const session_key_state_t& state,
                                const timestamp_milliseconds_t now) {
  if (state.is_revoked) {
    return "revoked";
  }
  if (!state.is_active || keyward::policy::is_expired(state, now)) {
    return "expired";
  }
  return "active";
}

void print_session(const session_key_state_t& state,
                   const usage_statistics_t& stats,
                   const timestamp_milliseconds_t now) {
  const auto& config = state.config;
  std::cout << "session:      " << to_string(state.session_id) << '\n'
            << "principal:    " << to_string(state.principal) << '\n'
            << "signer:       " << to_string(state.identity.address) << '\n'
            << "state:        " << lifecycle_name(state, now) << '\n'
            << "created_at:   " << config.created_at << '\n'
            << "expires_at:   " << config.expiration_time << '\n'
            << "max_per_tx:   " << config.max_transaction_amount.str() << '\n'
            << "max_daily:    " << config.max_daily_amount.str() << '\n'
            << "max_tx_count: " << config.max_transaction_count << '\n'
            << "confirmation: " << std::boolalpha
            << config.require_user_confirmation << '\n'
            << "emergency:    " << config.emergency_revocation << '\n';
  for (const auto& contract : config.allowed_contracts) {
    std::cout << "contract:     " << to_string(contract) << '\n';
  }
  for (const auto& method : config.allowed_methods) {
    std::cout << "method:       " << method << '\n';
  }
  if (state.revoked_at.has_value()) {
    std::cout << "revoked_at:   " << *state.revoked_at << '\n'
              << "reason:       " << state.revoked_reason.value_or("") << '\n';
  }

  std::cout << "transactions: " << stats.total_count << '\n'
            << "total_amount: " << stats.total_amount.str() << '\n'
            << "average:      " << stats.average_amount.str() << '\n';
  if (stats.last_used.has_value()) {
    std::cout << "last_used:    " << *stats.last_used << '\n';
  }
  for (const auto& day : stats.per_day) {
    std::cout << "  " << day.date << ": " << day.count << " tx, "
              << day.amount.str() << '\n';
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("keyward.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "keyward", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);

  auto db_path = std::string{};
  auto command = std::string{};
  auto principal_hex = std::string{};
  auto session_hex = std::string{};
  auto reason = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Keyward"};
  description.add_options()("help,h", "Show the help message")(
      "db,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "keyward.db"),
      "Path to the session key store")(
      "command",
      boost::program_options::value<std::string>(&command),
      "list | show | revoke | emergency-revoke | cleanup | stats")(
      "principal,p", boost::program_options::value<std::string>(&principal_hex),
      "Owning wallet address (0x...)")(
      "session,s", boost::program_options::value<std::string>(&session_hex),
      "Session key id (0x...)")(
      "reason,r",
      boost::program_options::value<std::string>(&reason)->default_value(
          std::string{keyward::lifecycle::kDefaultRevocationReason}),
      "Revocation reason")("verbose,v", "Enable verbose output");
  auto positional = boost::program_options::positional_options_description{};
  positional.add("command", 1);

  try {
    boost::program_options::store(
        boost::program_options::command_line_parser(argc, argv)
            .options(description)
            .positional(positional)
            .run(),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << '\n' << description << std::endl;
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return command.empty() && !vm.contains("help") ? 1 : 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto parse_principal = [&]() -> std::optional<principal_t> {
    auto principal = try_make_address(principal_hex);
    if (!principal.has_value()) {
      std::cerr << "--principal must be a 20-byte hex address" << std::endl;
    }
    return principal;
  };
  auto parse_session = [&]() -> std::optional<session_id_t> {
    auto session = try_make_hash32(session_hex);
    if (!session.has_value()) {
      std::cerr << "--session must be a 32-byte hex id" << std::endl;
    }
    return session;
  };

  auto storage = keyward::storage::make_storage<
      keyward::storage::rocksdb_storage_tag>(db_path);
  auto registry = keyward::registry::registry{storage};
  auto lifecycle = keyward::lifecycle::controller{registry};

  auto exit_code = 0;
  if (command == "list") {
    if (auto principal = parse_principal()) {
      for (const auto& id : registry.list_active(*principal)) {
        std::cout << to_string(id) << std::endl;
      }
    } else {
      exit_code = 1;
    }
  } else if (command == "show") {
    auto session = parse_session();
    auto state = session ? registry.get(*session) : std::nullopt;
    auto stats =
        session ? registry.usage_statistics(*session) : std::nullopt;
    if (state.has_value() && stats.has_value()) {
      print_session(*state, *stats, registry.now());
    } else {
      std::cerr << "unknown session key" << std::endl;
      exit_code = 1;
    }
  } else if (command == "revoke") {
    auto session = parse_session();
    if (session && lifecycle.revoke(*session, reason)) {
      std::cout << "revoked " << to_string(*session) << std::endl;
    } else {
      std::cerr << "session key not revoked" << std::endl;
      exit_code = 1;
    }
  } else if (command == "emergency-revoke") {
    if (auto principal = parse_principal()) {
      std::cout << "revoked " << lifecycle.emergency_revoke(*principal, reason)
                << std::endl;
    } else {
      exit_code = 1;
    }
  } else if (command == "cleanup") {
    std::cout << "expired " << registry.cleanup_expired() << std::endl;
  } else if (command == "stats") {
    if (auto principal = parse_principal()) {
      auto stats = registry.principal_statistics(*principal);
      std::cout << "total:        " << stats.total << '\n'
                << "active:       " << stats.active << '\n'
                << "expired:      " << stats.expired << '\n'
                << "revoked:      " << stats.revoked << '\n'
                << "transactions: " << stats.total_transactions << '\n'
                << "amount:       " << stats.total_amount.str() << std::endl;
    } else {
      exit_code = 1;
    }
  } else {
    std::cerr << "unknown command: " << command << '\n'
              << description << std::endl;
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
