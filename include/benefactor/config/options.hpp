#pragma once

#include <benefactor/execution/access_policy.hpp>
#include <benefactor/schema/primitives.hpp>
#include <boost/program_options.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace benefactor::config {

struct policy_options final {
  std::string kind{"single-owner"};  // single-owner | multisig | roles
  std::string owner;
  std::vector<std::string> multisig_members;
  uint32_t multisig_threshold{1};
  std::vector<std::string> roles;  // action=hex
};

struct cli_options final {
  bool help{};
  bool verbose{};
  std::string db_path{"benefactor.db"};
  std::string log_file{"benefactor.log"};
  benefactor::schema::account_id_t custody{};
  benefactor::schema::account_id_t signer{};
  std::vector<benefactor::schema::account_id_t> co_signers;
  policy_options policy;
  std::string command;
  std::vector<std::string> arguments;
};

boost::program_options::options_description make_options_description();

/// Parse the command line, then the `--config` file when given. Values on the
/// command line win. Throws boost::program_options::error on bad input.
cli_options parse_options(int argc, const char* const argv[]);

/// Identity option value: 64 hex characters, optional 0x prefix.
benefactor::schema::account_id_t parse_identity(const std::string& option,
                                                const std::string& value);

/// The configured custody identity. Throws
/// boost::program_options::required_option when it is missing or null.
benefactor::schema::account_id_t require_custody(const cli_options& options);

/// Build the configured policy. Throws boost::program_options::error when the
/// policy options are inconsistent.
std::shared_ptr<const benefactor::execution::access_policy> make_access_policy(
    const policy_options& options);

}  // namespace benefactor::config
