#include <benefactor/config/options.hpp>
#include <benefactor/schema/privileged_action.hpp>

#include <spdlog/spdlog.h>
#include <fstream>
#include <set>
#include <utility>

namespace po = boost::program_options;

namespace benefactor::config {

namespace {

std::vector<benefactor::schema::account_id_t> parse_identities(
    const std::string& option,
    const std::vector<std::string>& values) {
  auto identities = std::vector<benefactor::schema::account_id_t>{};
  identities.reserve(values.size());
  for (const auto& value : values) {
    identities.push_back(parse_identity(option, value));
  }
  return identities;
}

}  // namespace

po::options_description make_options_description() {
  auto general = po::options_description{"General"};
  general.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable debug logging")(
      "config,c", po::value<std::string>(), "INI file with option defaults")(
      "db,d", po::value<std::string>()->default_value("benefactor.db"),
      "RocksDB directory")(
      "log-file", po::value<std::string>()->default_value("benefactor.log"),
      "Log file path")("custody", po::value<std::string>(),
                       "Identity holding funds for emergency withdrawals")(
      "signer,s", po::value<std::string>(), "Transaction signer identity")(
      "co-signer", po::value<std::vector<std::string>>()->composing(),
      "Additional approver identity (repeatable)");

  auto policy = po::options_description{"Access policy"};
  policy.add_options()(
      "policy", po::value<std::string>()->default_value("single-owner"),
      "single-owner | multisig | roles")(
      "owner", po::value<std::string>(), "Owner identity for single-owner")(
      "multisig-member", po::value<std::vector<std::string>>()->composing(),
      "Multisig member identity (repeatable)")(
      "multisig-threshold", po::value<uint32_t>()->default_value(1),
      "Distinct members required for a privileged action")(
      "role", po::value<std::vector<std::string>>()->composing(),
      "Grant as action=identity (repeatable)");

  auto hidden = po::options_description{"Command"};
  hidden.add_options()("command", po::value<std::string>(), "Command")(
      "args", po::value<std::vector<std::string>>(), "Command arguments");

  auto description = po::options_description{"Benefactor"};
  description.add(general).add(policy).add(hidden);
  return description;
}

benefactor::schema::account_id_t parse_identity(const std::string& option,
                                                const std::string& value) {
  auto identity = benefactor::schema::try_make_hash32(value);
  if (!identity) {
    throw po::invalid_option_value(option + "=" + value);
  }
  return *identity;
}

cli_options parse_options(const int argc, const char* const argv[]) {
  auto description = make_options_description();
  auto positional = po::positional_options_description{};
  positional.add("command", 1).add("args", -1);

  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(description)
                .positional(positional)
                .run(),
            vm);
  if (vm.contains("config")) {
    auto path = vm["config"].as<std::string>();
    auto file = std::ifstream{path};
    if (!file) {
      throw po::error("cannot open config file " + path);
    }
    po::store(po::parse_config_file(file, description), vm);
  }
  po::notify(vm);

  auto options = cli_options{};
  options.help = vm.contains("help");
  options.verbose = vm.contains("verbose");
  options.db_path = vm["db"].as<std::string>();
  options.log_file = vm["log-file"].as<std::string>();
  if (vm.contains("custody")) {
    options.custody =
        parse_identity("custody", vm["custody"].as<std::string>());
  }
  if (vm.contains("signer")) {
    options.signer = parse_identity("signer", vm["signer"].as<std::string>());
  }
  if (vm.contains("co-signer")) {
    options.co_signers = parse_identities(
        "co-signer", vm["co-signer"].as<std::vector<std::string>>());
  }

  options.policy.kind = vm["policy"].as<std::string>();
  if (vm.contains("owner")) {
    options.policy.owner = vm["owner"].as<std::string>();
  }
  if (vm.contains("multisig-member")) {
    options.policy.multisig_members =
        vm["multisig-member"].as<std::vector<std::string>>();
  }
  options.policy.multisig_threshold = vm["multisig-threshold"].as<uint32_t>();
  if (vm.contains("role")) {
    options.policy.roles = vm["role"].as<std::vector<std::string>>();
  }

  if (vm.contains("command")) {
    options.command = vm["command"].as<std::string>();
  }
  if (vm.contains("args")) {
    options.arguments = vm["args"].as<std::vector<std::string>>();
  }
  return options;
}

benefactor::schema::account_id_t require_custody(const cli_options& options) {
  if (benefactor::schema::is_null(options.custody)) {
    throw po::required_option("custody");
  }
  return options.custody;
}

std::shared_ptr<const benefactor::execution::access_policy> make_access_policy(
    const policy_options& options) {
  if (options.kind == "single-owner") {
    if (options.owner.empty()) {
      throw po::required_option("owner");
    }
    return std::make_shared<const benefactor::execution::single_owner_policy>(
        parse_identity("owner", options.owner));
  }

  if (options.kind == "multisig") {
    auto members =
        parse_identities("multisig-member", options.multisig_members);
    auto distinct =
        std::set<benefactor::schema::account_id_t>{std::begin(members),
                                                   std::end(members)};
    distinct.erase(benefactor::schema::make_zero_hash());
    if (options.multisig_threshold == 0 ||
        options.multisig_threshold > distinct.size()) {
      throw po::error("multisig-threshold must be between 1 and the number "
                      "of distinct members");
    }
    return std::make_shared<const benefactor::execution::multisig_policy>(
        std::move(members), options.multisig_threshold);
  }

  if (options.kind == "roles") {
    auto grants = benefactor::execution::role_based_policy::grants_t{};
    for (const auto& role : options.roles) {
      auto separator = role.find('=');
      if (separator == std::string::npos) {
        throw po::invalid_option_value("role=" + role);
      }
      auto action = benefactor::schema::try_from_string<
          benefactor::schema::privileged_action_t>(role.substr(0, separator));
      if (!action) {
        throw po::invalid_option_value("role=" + role);
      }
      grants[*action].insert(
          parse_identity("role", role.substr(separator + 1)));
    }
    if (grants.empty()) {
      spdlog::warn("Role policy without grants; privileged actions disabled");
    }
    return std::make_shared<const benefactor::execution::role_based_policy>(
        std::move(grants));
  }

  throw po::invalid_option_value("policy=" + options.kind);
}

}  // namespace benefactor::config
