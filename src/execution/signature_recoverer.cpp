#include <relay/crypto/secp256k1.hpp>
#include <relay/execution/signature_recoverer.hpp>

namespace relay::execution {

signature_recoverer_t make_secp256k1_recoverer() {
  return [](const relay::schema::hash32_t& signed_digest,
            const relay::schema::signature_t& signature) {
    return relay::crypto::recover_address(signed_digest, signature);
  };
}

}  // namespace relay::execution
