#include "tinybook/book/price_encoder.hpp"

#include <string>

#include "tinybook/core/errors.hpp"

namespace tinybook::book {

using core::ErrorCode;
using core::ProtocolError;

std::vector<u64> encode_price(Role role, u64 price, PriceDomain domain) {
  if (price >= domain) {
    throw ProtocolError(ErrorCode::PriceOutOfRange,
                        std::string(role_name(role)) + " price " + std::to_string(price) +
                            " outside [0, " + std::to_string(domain) + ")");
  }
  std::vector<u64> v(static_cast<size_t>(domain), 0);
  for (u64 i = 0; i < domain; ++i) {
    const bool on = (role == Role::Ask) ? (i >= price) : (i <= price);
    v[static_cast<size_t>(i)] = on ? 1u : 0u;
  }
  return v;
}

}  // namespace tinybook::book
