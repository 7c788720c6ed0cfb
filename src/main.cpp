#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <benefactor/config/options.hpp>
#include <benefactor/execution/engine.hpp>
#include <benefactor/tools/commands.hpp>
#include <benefactor/tools/logging.hpp>
#include <benefactor/tools/render.hpp>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

void usage(const po::options_description& description) {
  std::cout << "Usage: benefactor [options] <command> [args...]\n\n"
            << "Commands:\n"
            << "  register-charity NAME DESCRIPTION METADATA_REF\n"
            << "  verify-charity CHARITY\n"
            << "  set-token-support TOKEN [true|false]\n"
            << "  donate CHARITY TOKEN AMOUNT [MESSAGE]\n"
            << "  emergency-withdraw TO AMOUNT [TOKEN]\n"
            << "  transfer-credential CREDENTIAL_ID FROM TO\n"
            << "  show-charity CHARITY\n"
            << "  show-donation DONATION_ID\n"
            << "  list-donations charity|donor IDENTITY\n"
            << "  show-credential DONOR\n"
            << "  info\n\n"
            << description << std::endl;
}

int run_query(const benefactor::execution::engine& engine,
              const std::string& command,
              const std::vector<std::string>& arguments) {
  auto require = [&](const size_t count) {
    if (arguments.size() != count) {
      throw po::error(command + " expects " + std::to_string(count) +
                      " argument(s)");
    }
  };

  if (command == "info") {
    require(0);
    std::cout << benefactor::tools::to_json(
                     benefactor::tools::render(engine.info()))
              << std::endl;
    return 0;
  }
  if (command == "show-charity") {
    require(1);
    auto charity = engine.charity(
        benefactor::config::parse_identity("charity", arguments[0]));
    if (!charity) {
      spdlog::warn("Charity {} is not registered", arguments[0]);
      return 1;
    }
    std::cout << benefactor::tools::to_json(benefactor::tools::render(*charity))
              << std::endl;
    return 0;
  }
  if (command == "show-donation") {
    require(1);
    auto donation =
        engine.donation(benefactor::tools::parse_id(arguments[0]));
    if (!donation) {
      spdlog::warn("Donation {} not found", arguments[0]);
      return 1;
    }
    std::cout << benefactor::tools::to_json(
                     benefactor::tools::render(*donation))
              << std::endl;
    return 0;
  }
  if (command == "list-donations") {
    require(2);
    auto identity = benefactor::config::parse_identity("identity", arguments[1]);
    if (arguments[0] == "charity") {
      std::cout << benefactor::tools::to_json(benefactor::tools::render(
                       engine.charity_donation_ids(identity)))
                << std::endl;
      return 0;
    }
    if (arguments[0] == "donor") {
      std::cout << benefactor::tools::to_json(benefactor::tools::render(
                       engine.donor_donation_ids(identity)))
                << std::endl;
      return 0;
    }
    throw po::invalid_option_value(arguments[0]);
  }
  if (command == "show-credential") {
    require(1);
    auto donor = benefactor::config::parse_identity("donor", arguments[0]);
    auto credential = engine.credential(donor);
    if (!credential) {
      spdlog::warn("{} holds no credential", arguments[0]);
      return 1;
    }
    auto rendered = benefactor::tools::render(*credential);
    rendered["uri"] = engine.credential_uri(donor).value_or("");
    std::cout << benefactor::tools::to_json(rendered) << std::endl;
    return 0;
  }
  throw po::error("unknown command " + command);
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = benefactor::config::cli_options{};
  try {
    options = benefactor::config::parse_options(argc, argv);
  } catch (const po::error& ex) {
    std::cerr << "benefactor: " << ex.what() << std::endl;
    usage(benefactor::config::make_options_description());
    return 1;
  }
  if (options.help || options.command.empty()) {
    usage(benefactor::config::make_options_description());
    return options.help ? 0 : 1;
  }

  auto exit_code = 0;
  try {
    benefactor::tools::install_logger(options);
    auto custody = benefactor::config::require_custody(options);
    auto policy = benefactor::config::make_access_policy(options.policy);
    auto encoder = benefactor::execution::encoder_t{};
    auto storage = benefactor::storage::make_storage<
        benefactor::storage::rocksdb_storage_tag>(options.db_path);
    auto engine = benefactor::execution::engine{encoder, storage, policy,
                                                custody};
    // Settlement happens outside the ledger; the command line only records
    // what would be moved.
    engine.set_value_transfer(
        [](const benefactor::execution::transfer_request& request) {
          spdlog::info("Settlement requested: {} of {} from {} to {}",
                       benefactor::schema::to_string(request.amount),
                       request.token_id
                           ? benefactor::schema::to_hex(*request.token_id)
                           : std::string{"native"},
                       benefactor::schema::to_hex(request.from),
                       benefactor::schema::to_hex(request.to));
          return true;
        });

    if (benefactor::tools::is_mutating_command(options.command)) {
      auto tx = benefactor::schema::transaction_t{};
      tx.signer = options.signer;
      tx.co_signers = options.co_signers;
      tx.payload = benefactor::tools::build_payload(options.command,
                                                    options.arguments);
      auto result = engine.execute(tx);
      std::cout << benefactor::tools::to_json(
                       benefactor::tools::render(result))
                << std::endl;
      exit_code = result.ok() ? 0 : 2;
    } else {
      exit_code = run_query(engine, options.command, options.arguments);
    }
  } catch (const po::error& ex) {
    spdlog::error("{}", ex.what());
    exit_code = 1;
  } catch (const std::exception& ex) {
    spdlog::error("benefactor failed: {}", ex.what());
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
