#pragma once

#include <aegis/schema/primitives.hpp>
#include <functional>

namespace aegis::execution {

using signature_verifier_t =
    std::function<bool(const aegis::schema::bytes_view_t& message,
                       const aegis::schema::signer_id_t& signer,
                       const aegis::schema::signature_t& signature)>;

}  // namespace aegis::execution
