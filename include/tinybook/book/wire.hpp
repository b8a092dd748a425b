#pragma once

#include "tinybook/book/types.hpp"
#include "tinybook/core/types.hpp"

#include <cstddef>

namespace tinybook::book::wire {

// Little-endian message layouts for the transport layer. Every message starts
// with a 4-byte tag; decoders throw std::runtime_error on a bad tag, a
// truncated buffer or trailing bytes.
core::Bytes encode(const RequestToken& t);
core::Bytes encode(const MaskSet& m);
core::Bytes encode(const MaskedOrder& o);
core::Bytes encode(const OutcomeShare& s);

// Encoded length of each message, without building it.
size_t encoded_size(const MaskSet& m);
size_t encoded_size(const MaskedOrder& o);
size_t encoded_size(const OutcomeShare& s);

RequestToken decode_request_token(const core::Bytes& buf);
MaskSet decode_mask_set(const core::Bytes& buf);
MaskedOrder decode_masked_order(const core::Bytes& buf);
OutcomeShare decode_outcome_share(const core::Bytes& buf);

}  // namespace tinybook::book::wire
