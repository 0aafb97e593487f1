#pragma once

#include <escrow/schema/primitives.hpp>
#include <functional>

namespace escrow::execution {

/// External value transfer primitive. Moves `amount` out of escrow custody to
/// `recipient` and reports whether the transfer happened. It may call back
/// into the engine before returning.
using transfer_handler_t =
    std::function<bool(const escrow::schema::account_id_t& recipient,
                       const escrow::schema::amount_t& amount)>;

}  // namespace escrow::execution
