#pragma once

#include <escrow/schema/primitives.hpp>
#include <escrow/schema/role_id.hpp>
#include <escrow/schema/transaction_event.hpp>
#include <string_view>

// Audit event constructors. Job ids and amounts render as decimal strings,
// accounts as lowercase hex.
namespace escrow::execution {

escrow::schema::transaction_event_t make_job_posted_event(
    escrow::schema::job_id_t job_id,
    const escrow::schema::account_id_t& client,
    const escrow::schema::amount_t& amount);

escrow::schema::transaction_event_t make_job_updated_event(
    escrow::schema::job_id_t job_id);

escrow::schema::transaction_event_t make_job_cancelled_event(
    escrow::schema::job_id_t job_id,
    const escrow::schema::amount_t& refund_amount);

escrow::schema::transaction_event_t make_work_submitted_event(
    escrow::schema::job_id_t job_id,
    const escrow::schema::account_id_t& freelancer,
    std::string_view proof_hash);

escrow::schema::transaction_event_t make_payment_released_event(
    escrow::schema::job_id_t job_id,
    const escrow::schema::amount_t& amount,
    const escrow::schema::account_id_t& freelancer);

escrow::schema::transaction_event_t make_work_rejected_event(
    escrow::schema::job_id_t job_id);

escrow::schema::transaction_event_t make_role_changed_event(
    bool granted,
    const escrow::schema::account_id_t& account,
    escrow::schema::role_id_t role,
    const escrow::schema::account_id_t& sender);

}  // namespace escrow::execution
