#pragma once

#include <aegis/schema/primitives.hpp>

namespace aegis::crypto {

/// True when the linked OpenSSL provides both ed25519 and secp256k1.
bool available();

/// Verify `signature` by `signer` over `message`.
///
/// Named signers are ledger references without a key and never verify.
bool verify_signature(const aegis::schema::bytes_view_t& message,
                      const aegis::schema::signer_id_t& signer,
                      const aegis::schema::signature_t& signature);

}  // namespace aegis::crypto
