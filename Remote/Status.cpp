#include"Remote/Status.hpp"

namespace Remote {

char const* status_name(Status s) {
	switch (s) {
	case Queued: return "queued";
	case Building: return "building";
	case Verifying: return "verifying";
	case Succeeded: return "succeeded";
	case Failed: return "failed";
	case TimedOut: return "timed_out";
	case Unknown: return "unknown";
	}
	return "unknown";
}

Status parse_status(std::string const& s) {
	if (s == "queued")
		return Queued;
	if (s == "building")
		return Building;
	if (s == "verifying")
		return Verifying;
	if (s == "succeeded")
		return Succeeded;
	if (s == "failed")
		return Failed;
	/* Only the local side times out.  */
	return Unknown;
}

}
