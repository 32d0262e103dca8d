#ifndef SOLANA_IDS_HPP
#define SOLANA_IDS_HPP

namespace Solana { class Pubkey; }

/* Well-known program addresses.  */
namespace Solana { namespace ids {

Pubkey const& system_program();
Pubkey const& bpf_loader_upgradeable();
Pubkey const& bpf_loader();
Pubkey const& bpf_loader_deprecated();
/* Default attestation registry.  */
Pubkey const& attestation_registry();

}}

#endif /* !defined(SOLANA_IDS_HPP) */
