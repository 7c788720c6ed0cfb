#include <benefactor/blake3/hash.hpp>
#include <benefactor/common/critical.hpp>
#include <benefactor/execution/charity_registry.hpp>
#include <benefactor/execution/credential_descriptor.hpp>
#include <benefactor/execution/credential_issuer.hpp>
#include <benefactor/execution/donation_ledger.hpp>
#include <benefactor/execution/engine.hpp>
#include <benefactor/execution/token_registry.hpp>
#include <benefactor/schema/event_type.hpp>
#include <benefactor/schema/key/engine_keys.hpp>
#include <benefactor/schema/query_error_code.hpp>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

using namespace benefactor::schema;

namespace {

constexpr auto kExecuteCodespace = std::string_view{"benefactor.execute"};
constexpr auto kQueryCodespace = std::string_view{"benefactor.query"};

std::string_view payload_name(const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const register_charity_t&) -> std::string_view {
            return "register_charity";
          },
          [](const verify_charity_t&) -> std::string_view {
            return "verify_charity";
          },
          [](const set_token_support_t&) -> std::string_view {
            return "set_token_support";
          },
          [](const donate_t&) -> std::string_view { return "donate"; },
          [](const emergency_withdraw_t&) -> std::string_view {
            return "emergency_withdraw";
          },
          [](const transfer_credential_t&) -> std::string_view {
            return "transfer_credential";
          }},
      payload);
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       std::string info) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{kExecuteCodespace};
  return result;
}

transaction_result_t make_error_result(const std::error_code& error,
                                       std::string info) {
  if (error.category() != transaction_error_category()) {
    benefactor::common::critical("unexpected error category");
  }
  return make_error_result(static_cast<transaction_error_code>(error.value()),
                           std::move(info));
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                const uint64_t sequence) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.sequence = sequence;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

std::optional<account_id_t> decode_account_key(const bytes_view_t& key) {
  if (key.size() != std::tuple_size_v<account_id_t>) {
    return std::nullopt;
  }
  auto account = account_id_t{};
  std::copy(std::begin(key), std::end(key), std::begin(account));
  return account;
}

}  // namespace

namespace benefactor::execution {

template <typename Fn>
auto engine::read(Fn&& fn) const {
  auto lock = std::scoped_lock{mutex_};
  auto overlay = state_overlay{encoder_, storage_};
  auto events = std::vector<transaction_event_t>{};
  auto context = execution_context{.state = overlay, .events = events};
  return fn(context);
}

engine::engine(encoder_t& encoder,
               storage_t& storage,
               std::shared_ptr<const access_policy> policy,
               account_id_t custody)
    : encoder_{encoder},
      storage_{storage},
      policy_{std::move(policy)},
      custody_{custody},
      clock_{system_clock_milliseconds} {
  if (!policy_) {
    benefactor::common::critical("engine requires an access policy");
  }
  if (is_null(custody_)) {
    benefactor::common::critical("engine requires a custody identity");
  }
  auto lock = std::scoped_lock{mutex_};
  if (auto committed = storage_.load_committed_state()) {
    last_sequence_ = committed->sequence;
    state_root_ = committed->state_root;
  }
  spdlog::info("Donation engine ready at sequence {} with {} policy",
               last_sequence_, policy_->name());
}

transaction_result_t engine::execute(const transaction_t& tx) {
  auto lock = std::scoped_lock{mutex_};
  auto guard = reentrancy_guard{reentrancy_};
  if (!guard.acquired()) {
    spdlog::warn("Rejected nested {} while a transaction is executing",
                 payload_name(tx.payload));
    return make_error_result(transaction_error_code::reentrant_call,
                             "nested call during execution");
  }
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "expected version 1");
  }
  if (is_null(tx.signer)) {
    return make_error_result(transaction_error_code::invalid_address,
                             "signer is the null identity");
  }

  auto overlay = state_overlay{encoder_, storage_};
  auto events = std::vector<transaction_event_t>{};
  auto context =
      execution_context{.state = overlay, .events = events, .now = clock_()};

  // The primitive may replace itself through set_value_transfer while it runs,
  // so the transaction holds its own copy.
  auto transfer = value_transfer_;
  auto output = apply(tx, context, transfer);
  if (!output) {
    spdlog::warn("Rejected {} from {}: {}", payload_name(tx.payload),
                 to_hex(tx.signer), output.error().message());
    return make_error_result(output.error(),
                             std::string{payload_name(tx.payload)});
  }

  auto sequence = last_sequence_ + 1;
  auto tx_bytes = encoder_.encode(tx);
  auto state_root = benefactor::blake3::fold_state_root(
      state_root_, sequence, bytes_view_t{tx_bytes.data(), tx_bytes.size()});
  overlay.put(key::make_history_key(sequence),
              history_entry_t{.sequence = sequence,
                              .applied_at = context.now,
                              .state_root = state_root,
                              .tx = std::move(tx_bytes)});
  storage_.commit(overlay.entries(),
                  benefactor::storage::committed_state{
                      .sequence = sequence, .state_root = state_root});
  last_sequence_ = sequence;
  state_root_ = state_root;

  auto result = transaction_result_t{};
  result.data = std::move(output).value();
  result.info = std::string{payload_name(tx.payload)} + " applied";
  result.codespace = std::string{kExecuteCodespace};
  result.sequence = sequence;
  result.events = std::move(events);
  spdlog::info("Applied {} from {} at sequence {}", payload_name(tx.payload),
               to_hex(tx.signer), sequence);
  return result;
}

transaction_result_t engine::execute(const bytes_view_t& raw_tx) {
  if (raw_tx.empty()) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "empty transaction");
  }
  auto tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    spdlog::warn("Rejected undecodable transaction of {} bytes",
                 raw_tx.size());
    return make_error_result(transaction_error_code::invalid_transaction,
                             "transaction bytes do not decode");
  }
  return execute(*tx);
}

result_t<bytes_t> engine::apply(const transaction_t& tx,
                                execution_context& context,
                                const value_transfer_t& transfer) {
  return std::visit(
      overloaded{
          [&](const register_charity_t& payload) -> result_t<bytes_t> {
            auto registered =
                charity_registry{context}.register_charity(tx.signer, payload);
            if (!registered) {
              return outcome::failure(registered.error());
            }
            return encoder_.encode(registered.value().charity_id);
          },
          [&](const verify_charity_t& payload) -> result_t<bytes_t> {
            auto allowed =
                authorize(privileged_action_t::verify_charity, tx);
            if (!allowed) {
              return outcome::failure(allowed.error());
            }
            auto verified =
                charity_registry{context}.verify_charity(payload.charity_id);
            if (!verified) {
              return outcome::failure(verified.error());
            }
            return bytes_t{};
          },
          [&](const set_token_support_t& payload) -> result_t<bytes_t> {
            auto allowed =
                authorize(privileged_action_t::set_token_support, tx);
            if (!allowed) {
              return outcome::failure(allowed.error());
            }
            auto updated = token_registry{context}.set_support(
                payload.token_id, payload.supported);
            if (!updated) {
              return outcome::failure(updated.error());
            }
            return bytes_t{};
          },
          [&](const donate_t& payload) -> result_t<bytes_t> {
            auto donated = donation_ledger{context}.donate(tx.signer, payload,
                                                           transfer);
            if (!donated) {
              return outcome::failure(donated.error());
            }
            return encoder_.encode(donated.value());
          },
          [&](const emergency_withdraw_t& payload) -> result_t<bytes_t> {
            auto allowed =
                authorize(privileged_action_t::emergency_withdraw, tx);
            if (!allowed) {
              return outcome::failure(allowed.error());
            }
            auto withdrawn = emergency_withdraw(payload, context, transfer);
            if (!withdrawn) {
              return outcome::failure(withdrawn.error());
            }
            return bytes_t{};
          },
          [&](const transfer_credential_t& payload) -> result_t<bytes_t> {
            // Mint and burn are internal; only owner-to-owner moves arrive
            // here, and those are always refused.
            if (is_null(payload.from) || is_null(payload.to)) {
              return fail(transaction_error_code::invalid_address);
            }
            auto changed = credential_issuer{context}.attempt_ownership_change(
                payload.from, payload.to, payload.credential_id);
            if (!changed) {
              return outcome::failure(changed.error());
            }
            return bytes_t{};
          }},
      tx.payload);
}

result_t<void> engine::authorize(const privileged_action_t action,
                                 const transaction_t& tx) const {
  if (!policy_->authorize(action, tx.signer, tx.co_signers)) {
    spdlog::warn("{} policy denied {} to {}", policy_->name(),
                 to_string(action), to_hex(tx.signer));
    return fail(transaction_error_code::authorization_denied);
  }
  return outcome::success();
}

result_t<void> engine::emergency_withdraw(
    const emergency_withdraw_t& payload,
    execution_context& context,
    const value_transfer_t& transfer) {
  if (is_null(payload.to)) {
    return fail(transaction_error_code::invalid_address);
  }
  if (payload.token_id && is_null(*payload.token_id)) {
    return fail(transaction_error_code::invalid_address);
  }
  if (payload.amount == 0) {
    return fail(transaction_error_code::invalid_amount);
  }
  auto moved = request_transfer(transfer,
                                transfer_request{.token_id = payload.token_id,
                                                 .from = custody_,
                                                 .to = payload.to,
                                                 .amount = payload.amount});
  if (!moved) {
    return fail(transaction_error_code::transfer_failed);
  }

  auto token = payload.token_id ? to_hex(*payload.token_id)
                                : std::string{"native"};
  context.events.push_back(make_event(
      event_type_t::emergency_withdrawal,
      {{.key = "token_id", .value = token},
       {.key = "to", .value = to_hex(payload.to), .index = true},
       {.key = "amount",
        .value = benefactor::schema::to_string(payload.amount)}}));
  spdlog::warn("Emergency withdrawal of {} {} to {}",
               benefactor::schema::to_string(payload.amount), token,
               to_hex(payload.to));
  return outcome::success();
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& key) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(key);
  result.sequence = last_sequence_;
  result.codespace = std::string{kQueryCodespace};

  if (path == "/engine/info") {
    result.value = encoder_.encode(info());
    return result;
  }

  if (path == "/donation") {
    auto donation_id = std::optional<donation_id_t>{};
    if (key.size() == sizeof(donation_id_t)) {
      donation_id = encoder_.try_decode<donation_id_t>(key);
    }
    if (!donation_id) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE u64 donation id", key,
                              last_sequence_);
    }
    auto record = donation(*donation_id);
    if (!record) {
      return make_query_error(query_error_code::not_found,
                              "donation not found", key, last_sequence_);
    }
    result.value = encoder_.encode(*record);
    return result;
  }

  if (path != "/charity" && path != "/donations/charity" &&
      path != "/donations/donor" && path != "/token/supported" &&
      path != "/credential/id" && path != "/credential/metadata") {
    return make_query_error(query_error_code::unsupported_path,
                            "unsupported query path", key, last_sequence_);
  }

  auto account = decode_account_key(key);
  if (!account) {
    return make_query_error(query_error_code::invalid_key,
                            "expected 32 byte identity", key, last_sequence_);
  }

  if (path == "/charity") {
    auto stored = charity(*account);
    if (!stored) {
      return make_query_error(query_error_code::not_found,
                              "charity not registered", key, last_sequence_);
    }
    result.value = encoder_.encode(*stored);
  } else if (path == "/donations/charity") {
    result.value = encoder_.encode(charity_donation_ids(*account));
  } else if (path == "/donations/donor") {
    result.value = encoder_.encode(donor_donation_ids(*account));
  } else if (path == "/token/supported") {
    result.value = encoder_.encode(is_token_supported(*account));
  } else if (path == "/credential/id") {
    result.value = encoder_.encode(credential_id(*account));
  } else {
    auto stored = credential(*account);
    if (!stored) {
      return make_query_error(query_error_code::credential_missing,
                              "donor holds no credential", key,
                              last_sequence_);
    }
    result.value = encoder_.encode(*stored);
  }
  return result;
}

std::optional<charity_state_t> engine::charity(
    const account_id_t& charity_id) const {
  return read([&](execution_context& context) {
    return charity_registry{context}.charity(charity_id);
  });
}

amount_t engine::contribution(const account_id_t& charity_id,
                              const account_id_t& donor) const {
  return read([&](execution_context& context) {
    return charity_registry{context}.contribution(charity_id, donor);
  });
}

std::optional<donation_record_t> engine::donation(
    const donation_id_t donation_id) const {
  return read([&](execution_context& context) {
    return donation_ledger{context}.donation(donation_id);
  });
}

std::vector<donation_id_t> engine::charity_donation_ids(
    const account_id_t& charity_id) const {
  return read([&](execution_context& context) {
    return donation_ledger{context}.charity_donation_ids(charity_id);
  });
}

std::vector<donation_id_t> engine::donor_donation_ids(
    const account_id_t& donor) const {
  return read([&](execution_context& context) {
    return donation_ledger{context}.donor_donation_ids(donor);
  });
}

bool engine::is_token_supported(const token_id_t& token_id) const {
  return read([&](execution_context& context) {
    return token_registry{context}.is_supported(token_id);
  });
}

std::optional<credential_id_t> engine::credential_id(
    const account_id_t& donor) const {
  return read([&](execution_context& context) {
    return credential_issuer{context}.credential_id(donor);
  });
}

std::optional<credential_state_t> engine::credential(
    const account_id_t& donor) const {
  return read([&](execution_context& context) {
    return credential_issuer{context}.credential(donor);
  });
}

std::optional<std::string> engine::credential_uri(
    const account_id_t& donor) const {
  auto stored = credential(donor);
  if (!stored) {
    return std::nullopt;
  }
  return make_credential_uri(*stored);
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_sequence = last_sequence_;
  result.state_root = state_root_;
  return result;
}

std::vector<history_entry_t> engine::history(const uint64_t from_sequence,
                                             const uint64_t to_sequence) const {
  auto lock = std::scoped_lock{mutex_};
  auto entries = std::vector<history_entry_t>{};
  auto first = std::max<uint64_t>(from_sequence, 1);
  auto last = std::min(to_sequence, last_sequence_);
  for (auto sequence = first; sequence <= last; ++sequence) {
    auto history_key = key::make_history_key(sequence);
    auto entry = storage_.get<encoder_t, history_entry_t>(
        encoder_, bytes_view_t{history_key.data(), history_key.size()});
    if (!entry) {
      spdlog::error("History entry {} missing below head {}", sequence,
                    last_sequence_);
      benefactor::common::critical("history is not contiguous");
    }
    entries.push_back(std::move(*entry));
  }
  return entries;
}

void engine::set_value_transfer(value_transfer_t transfer) {
  auto lock = std::scoped_lock{mutex_};
  value_transfer_ = std::move(transfer);
}

void engine::set_clock(clock_source_t clock) {
  auto lock = std::scoped_lock{mutex_};
  if (!clock) {
    benefactor::common::critical("engine clock cannot be empty");
  }
  clock_ = std::move(clock);
}

}  // namespace benefactor::execution
