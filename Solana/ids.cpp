#include"Solana/Pubkey.hpp"
#include"Solana/ids.hpp"

namespace Solana { namespace ids {

Pubkey const& system_program() {
	static auto const id = Pubkey("11111111111111111111111111111111");
	return id;
}
Pubkey const& bpf_loader_upgradeable() {
	static auto const id = Pubkey("BPFLoaderUpgradeab1e11111111111111111111111");
	return id;
}
Pubkey const& bpf_loader() {
	static auto const id = Pubkey("BPFLoader2111111111111111111111111111111111");
	return id;
}
Pubkey const& bpf_loader_deprecated() {
	static auto const id = Pubkey("BPFLoader1111111111111111111111111111111111");
	return id;
}
Pubkey const& attestation_registry() {
	static auto const id = Pubkey("GUMa5Xx1rFriiP2vsj8vkn7zqL1nNDGJ9dBdXedpeMng");
	return id;
}

}}
