#include <benefactor/common/critical.hpp>
#include <benefactor/execution/access_policy.hpp>

#include <spdlog/spdlog.h>
#include <utility>

namespace benefactor::execution {

single_owner_policy::single_owner_policy(
    benefactor::schema::account_id_t owner)
    : owner_{owner} {
  if (benefactor::schema::is_null(owner_)) {
    benefactor::common::critical("single-owner policy requires an owner");
  }
}

bool single_owner_policy::authorize(
    const benefactor::schema::privileged_action_t,
    const benefactor::schema::account_id_t& signer,
    const std::vector<benefactor::schema::account_id_t>&) const {
  return signer == owner_;
}

multisig_policy::multisig_policy(
    std::vector<benefactor::schema::account_id_t> members,
    const uint32_t threshold)
    : members_{std::begin(members), std::end(members)}, threshold_{threshold} {
  members_.erase(benefactor::schema::make_zero_hash());
  if (threshold_ == 0 || threshold_ > members_.size()) {
    spdlog::error("multisig threshold {} invalid for {} member(s)", threshold_,
                  members_.size());
    benefactor::common::critical("invalid multisig policy");
  }
}

bool multisig_policy::authorize(
    const benefactor::schema::privileged_action_t,
    const benefactor::schema::account_id_t& signer,
    const std::vector<benefactor::schema::account_id_t>& co_signers) const {
  auto approvals = std::set<benefactor::schema::account_id_t>{};
  if (members_.contains(signer)) {
    approvals.insert(signer);
  }
  for (const auto& co_signer : co_signers) {
    if (members_.contains(co_signer)) {
      approvals.insert(co_signer);
    }
  }
  return approvals.size() >= threshold_;
}

role_based_policy::role_based_policy(grants_t grants)
    : grants_{std::move(grants)} {}

bool role_based_policy::authorize(
    const benefactor::schema::privileged_action_t action,
    const benefactor::schema::account_id_t& signer,
    const std::vector<benefactor::schema::account_id_t>&) const {
  auto grant = grants_.find(action);
  return grant != std::end(grants_) && grant->second.contains(signer);
}

}  // namespace benefactor::execution
