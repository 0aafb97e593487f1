#include <escrow/execution/events.hpp>

#include <string>

using namespace escrow::schema;

namespace {

transaction_event_attribute_t attribute(std::string key,
                                        std::string value,
                                        const bool index = false) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

transaction_event_attribute_t job_attribute(const job_id_t job_id) {
  return attribute("job_id", std::to_string(job_id), true);
}

}  // namespace

namespace escrow::execution {

transaction_event_t make_job_posted_event(const job_id_t job_id,
                                          const account_id_t& client,
                                          const amount_t& amount) {
  return transaction_event_t{
      .type = event_type_t::job_posted,
      .attributes = {job_attribute(job_id),
                     attribute("client", to_hex(client), true),
                     attribute("amount", amount.str())}};
}

transaction_event_t make_job_updated_event(const job_id_t job_id) {
  return transaction_event_t{.type = event_type_t::job_updated,
                             .attributes = {job_attribute(job_id)}};
}

transaction_event_t make_job_cancelled_event(const job_id_t job_id,
                                             const amount_t& refund_amount) {
  return transaction_event_t{
      .type = event_type_t::job_cancelled,
      .attributes = {job_attribute(job_id),
                     attribute("refund_amount", refund_amount.str())}};
}

transaction_event_t make_work_submitted_event(const job_id_t job_id,
                                              const account_id_t& freelancer,
                                              const std::string_view proof_hash) {
  return transaction_event_t{
      .type = event_type_t::work_submitted,
      .attributes = {job_attribute(job_id),
                     attribute("freelancer", to_hex(freelancer), true),
                     attribute("proof_hash", std::string{proof_hash})}};
}

transaction_event_t make_payment_released_event(
    const job_id_t job_id,
    const amount_t& amount,
    const account_id_t& freelancer) {
  return transaction_event_t{
      .type = event_type_t::payment_released,
      .attributes = {job_attribute(job_id), attribute("amount", amount.str()),
                     attribute("freelancer", to_hex(freelancer), true)}};
}

transaction_event_t make_work_rejected_event(const job_id_t job_id) {
  return transaction_event_t{.type = event_type_t::work_rejected,
                             .attributes = {job_attribute(job_id)}};
}

transaction_event_t make_role_changed_event(const bool granted,
                                            const account_id_t& account,
                                            const role_id_t role,
                                            const account_id_t& sender) {
  return transaction_event_t{
      .type = granted ? event_type_t::role_granted : event_type_t::role_revoked,
      .attributes = {attribute("account", to_hex(account), true),
                     attribute("role", std::string{to_string(role)}),
                     attribute("sender", to_hex(sender))}};
}

}  // namespace escrow::execution
