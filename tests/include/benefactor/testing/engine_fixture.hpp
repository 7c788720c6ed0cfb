#pragma once

#include <benefactor/execution/access_policy.hpp>
#include <benefactor/execution/engine.hpp>
#include <benefactor/schema/primitives.hpp>
#include <benefactor/schema/transaction.hpp>
#include <benefactor/storage/rocksdb/storage.hpp>
#include <benefactor/testing/common.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace benefactor::testing {

/// Engine over a throwaway RocksDB directory with a controllable clock and a
/// transfer primitive that records every request.
class engine_fixture final {
 public:
  static constexpr benefactor::schema::timestamp_milliseconds_t kStartTime =
      1'700'000'000'000;

  explicit engine_fixture(
      const std::string_view db_prefix,
      std::shared_ptr<const benefactor::execution::access_policy> policy =
          nullptr)
      : db_path_{make_db_path(db_prefix)},
        owner_{make_account(0xA0)},
        custody_{make_account(0xC0)},
        policy_{policy ? std::move(policy)
                       : std::make_shared<const benefactor::execution::
                                              single_owner_policy>(owner_)},
        storage_{benefactor::storage::make_storage<
            benefactor::storage::rocksdb_storage_tag>(db_path_)} {
    open_engine();
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() {
    engine_.reset();
    storage_.database.reset();
    remove_path(db_path_);
  }

  benefactor::execution::engine& engine() { return *engine_; }
  benefactor::execution::encoder_t& encoder() { return encoder_; }
  benefactor::execution::storage_t& storage() { return storage_; }

  const benefactor::schema::account_id_t& owner() const { return owner_; }
  const benefactor::schema::account_id_t& custody() const { return custody_; }

  /// Every request the transfer primitive saw, accepted or not.
  const std::vector<benefactor::execution::transfer_request>& transfers()
      const {
    return transfers_;
  }

  /// Replace the transfer behaviour; the request is still recorded.
  void on_transfer(
      std::function<bool(const benefactor::execution::transfer_request&)>
          handler) {
    transfer_handler_ = std::move(handler);
  }

  void set_time(const benefactor::schema::timestamp_milliseconds_t now) {
    now_ = now;
  }

  /// Close and reopen the database and engine on the same directory.
  void reopen() {
    engine_.reset();
    storage_.database.reset();
    storage_ = benefactor::storage::make_storage<
        benefactor::storage::rocksdb_storage_tag>(db_path_);
    open_engine();
  }

  benefactor::schema::transaction_result_t submit(
      const benefactor::schema::account_id_t& signer,
      benefactor::schema::transaction_payload_t payload,
      std::vector<benefactor::schema::account_id_t> co_signers = {}) {
    auto tx = benefactor::schema::transaction_t{};
    tx.signer = signer;
    tx.co_signers = std::move(co_signers);
    tx.payload = std::move(payload);
    return engine_->execute(tx);
  }

  benefactor::schema::transaction_result_t register_charity(
      const benefactor::schema::account_id_t& charity,
      const std::string& name) {
    return submit(charity,
                  benefactor::schema::register_charity_t{
                      .name = name,
                      .description = name + " description",
                      .metadata_ref = "ipfs://" + name});
  }

  benefactor::schema::transaction_result_t verify_charity(
      const benefactor::schema::account_id_t& charity) {
    return submit(owner_,
                  benefactor::schema::verify_charity_t{.charity_id = charity});
  }

  benefactor::schema::transaction_result_t support_token(
      const benefactor::schema::token_id_t& token,
      const bool supported = true) {
    return submit(owner_, benefactor::schema::set_token_support_t{
                              .token_id = token, .supported = supported});
  }

  benefactor::schema::transaction_result_t donate(
      const benefactor::schema::account_id_t& donor,
      const benefactor::schema::account_id_t& charity,
      const benefactor::schema::token_id_t& token,
      const benefactor::schema::amount_t& amount,
      const std::string& message = {}) {
    return submit(donor, benefactor::schema::donate_t{.charity_id = charity,
                                                      .token_id = token,
                                                      .amount = amount,
                                                      .message = message});
  }

 private:
  void open_engine() {
    engine_ = std::make_unique<benefactor::execution::engine>(
        encoder_, storage_, policy_, custody_);
    engine_->set_clock([this] { return now_; });
    engine_->set_value_transfer(
        [this](const benefactor::execution::transfer_request& request) {
          transfers_.push_back(request);
          return transfer_handler_ ? transfer_handler_(request) : true;
        });
  }

  std::string db_path_;
  benefactor::schema::account_id_t owner_;
  benefactor::schema::account_id_t custody_;
  std::shared_ptr<const benefactor::execution::access_policy> policy_;
  benefactor::execution::encoder_t encoder_{};
  benefactor::execution::storage_t storage_;
  std::unique_ptr<benefactor::execution::engine> engine_;
  benefactor::schema::timestamp_milliseconds_t now_{kStartTime};
  std::vector<benefactor::execution::transfer_request> transfers_;
  std::function<bool(const benefactor::execution::transfer_request&)>
      transfer_handler_;
};

}  // namespace benefactor::testing
