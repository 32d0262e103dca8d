#ifndef REMOTE_JOBSTORE_HPP
#define REMOTE_JOBSTORE_HPP

#include"Sqlite3/Db.hpp"
#include<memory>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Remote { struct Job; }

namespace Remote {

/** class Remote::JobStore
 *
 * @brief local mirror of submitted jobs.
 *
 * @desc A job whose stored status is terminal is
 * never modified again.
 * Local `TimedOut` snapshots are not stored; the
 * last status reported by the worker is kept.
 */
class JobStore {
private:
	Sqlite3::Db db;

public:
	JobStore() =delete;
	explicit
	JobStore(Sqlite3::Db db_) : db(std::move(db_)) { }

	/* Create the tables if needed.  */
	Ev::Io<void> init();

	/* Record a freshly submitted job.  */
	Ev::Io<void> add(Job job);

	/* Store a polled snapshot, unless the stored
	 * one is already terminal.  Jobs not yet in the
	 * store are added.  */
	Ev::Io<void> update(Job job);

	/* nullptr if the job is not in the store.  */
	Ev::Io<std::shared_ptr<Job>> get(std::string const& job_id);

	/* All jobs, oldest submission first.  */
	Ev::Io<std::vector<Job>> list();
};

}

#endif /* !defined(REMOTE_JOBSTORE_HPP) */
