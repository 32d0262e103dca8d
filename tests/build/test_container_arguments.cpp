#undef NDEBUG
#include"Build/Builder.hpp"
#include"Build/OutputDir.hpp"
#include"Build/Target.hpp"
#include<assert.h>

int main() {
	/* log_tail.  */
	assert(Build::log_tail("", 3) == "");
	assert(Build::log_tail("a\nb\nc\nd\n", 2) == "c\nd");
	assert(Build::log_tail("a\nb\nc\nd", 2) == "c\nd");
	assert(Build::log_tail("a\nb\n", 5) == "a\nb");
	assert(Build::log_tail("only", 1) == "only");

	/* Fixed command line, flags in key order.  */
	auto target = Build::Target( "1.18.26", "https://example.com/r.git"
				   , "", "programs/foo", "foo"
				   , { {"features", "mainnet"}
				     , {"all-features", ""}
				     }
				   );
	auto args = Build::Builder::container_arguments( "reprove-x"
						       , "/src", "/out-host"
						       , "img:1", target
						       );
	auto expected = std::vector<std::string>
	{ "run", "--rm"
	, "--name", "reprove-x"
	, "-v", "/src:/build:ro"
	, "-v", "/out-host:/out"
	, "-w", "/build/programs/foo"
	, "-e", "LC_ALL=C"
	, "-e", "LANG=C"
	, "-e", "TZ=UTC"
	, "-e", "SOURCE_DATE_EPOCH=0"
	, "-e", "CARGO_INCREMENTAL=0"
	, "-e", "CARGO_TERM_COLOR=never"
	, "-e", "CARGO_TARGET_DIR=/out/target"
	, "img:1"
	, "cargo", "build-sbf"
	, "--sbf-out-dir", "/out/deploy"
	, "--", "--locked"
	, "--all-features"
	, "--features", "mainnet"
	};
	assert(args == expected);

	/* Same inputs, same arguments.  */
	assert(args == Build::Builder::container_arguments( "reprove-x"
							  , "/src", "/out-host"
							  , "img:1", target
							  ));

	/* The working directory mounts by its absolute path.  */
	auto here = Build::absolute_path(".");
	auto cwd_args = Build::Builder::container_arguments( "reprove-x"
							   , here, "/out-host"
							   , "img:1", target
							   );
	assert(here[0] == '/');
	assert(cwd_args[5] == here + ":/build:ro");
	assert(cwd_args[5].find(".:") != 0);

	return 0;
}
