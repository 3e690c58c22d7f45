#pragma once

#include <cairn/schema/primitives.hpp>
#include <functional>

namespace cairn::execution {

using signature_verifier_t =
    std::function<bool(const cairn::schema::bytes_view_t& message,
                       const cairn::schema::signer_id_t& signer,
                       const cairn::schema::signature_t& signature)>;

}  // namespace cairn::execution
