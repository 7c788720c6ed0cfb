#pragma once

#include <benefactor/schema/primitives.hpp>
#include <benefactor/schema/privileged_action.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string_view>
#include <vector>

namespace benefactor::execution {

/// Authorization strategy for privileged actions, chosen when the engine is
/// constructed. Non-privileged operations never consult the policy.
class access_policy {
 public:
  virtual ~access_policy() = default;

  /// True when `signer`, together with the declared `co_signers`, may perform
  /// `action`.
  virtual bool authorize(
      benefactor::schema::privileged_action_t action,
      const benefactor::schema::account_id_t& signer,
      const std::vector<benefactor::schema::account_id_t>& co_signers)
      const = 0;

  virtual std::string_view name() const = 0;
};

/// One controlling identity may perform every privileged action.
class single_owner_policy final : public access_policy {
 public:
  explicit single_owner_policy(benefactor::schema::account_id_t owner);

  bool authorize(benefactor::schema::privileged_action_t action,
                 const benefactor::schema::account_id_t& signer,
                 const std::vector<benefactor::schema::account_id_t>&
                     co_signers) const override;
  std::string_view name() const override { return "single-owner"; }

  const benefactor::schema::account_id_t& owner() const { return owner_; }

 private:
  benefactor::schema::account_id_t owner_;
};

/// At least `threshold` distinct members among signer and co-signers.
class multisig_policy final : public access_policy {
 public:
  multisig_policy(std::vector<benefactor::schema::account_id_t> members,
                  uint32_t threshold);

  bool authorize(benefactor::schema::privileged_action_t action,
                 const benefactor::schema::account_id_t& signer,
                 const std::vector<benefactor::schema::account_id_t>&
                     co_signers) const override;
  std::string_view name() const override { return "multisig"; }

  uint32_t threshold() const { return threshold_; }

 private:
  std::set<benefactor::schema::account_id_t> members_;
  uint32_t threshold_;
};

/// Per-action grants; the signer alone must hold the grant for the action.
class role_based_policy final : public access_policy {
 public:
  using grants_t = std::map<benefactor::schema::privileged_action_t,
                            std::set<benefactor::schema::account_id_t>>;

  explicit role_based_policy(grants_t grants);

  bool authorize(benefactor::schema::privileged_action_t action,
                 const benefactor::schema::account_id_t& signer,
                 const std::vector<benefactor::schema::account_id_t>&
                     co_signers) const override;
  std::string_view name() const override { return "roles"; }

 private:
  grants_t grants_;
};

}  // namespace benefactor::execution
