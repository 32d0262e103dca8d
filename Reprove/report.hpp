#ifndef REPROVE_REPORT_HPP
#define REPROVE_REPORT_HPP

#include"Json/Out.hpp"
#include<string>

namespace Build { struct Artifact; }
namespace Remote { struct Job; }
namespace Reprove { struct VerifyReport; }
namespace Solana { struct OnChainProgram; }

namespace Reprove {

/* JSON renderings of the results printed on stdout.  */
Json::Out artifact_to_json( Build::Artifact const& artifact
			  , std::string const& installed_path = ""
			  );
Json::Out program_to_json(Solana::OnChainProgram const& program);
Json::Out verify_report_to_json(VerifyReport const& report);

/** Reprove::exit_code
 *
 * @brief the process exit code for a verification:
 * 0 if verified (and attested, if asked), 2 on a
 * mismatch, 1 on any operational error.
 */
int exit_code(VerifyReport const& report);
/* The exit code for a remote job followed to its
 * end: the outcome the worker reports, 1 if the job
 * failed, 4 if we stopped waiting.  */
int exit_code(Remote::Job const& job);

}

#endif /* !defined(REPROVE_REPORT_HPP) */
