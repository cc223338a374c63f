/* Copyright (C) 2026 fvprep Authors
 *
 * This file is part of fvprep.
 *
 * fvprep is free software; you can redistribute it and/or modify it under the
 * terms of the GNU General Public License as published by the Free Software
 * Foundation; either version 3 of the License, or (at your option) any later
 * version.
 *
 * fvprep is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more
 * details.
 *
 * You should have received a copy of the GNU General Public License
 * along with fvprep; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA  02110-1301  USA
 */

#include <algorithm>

#include <dirent.h>
#include <sys/stat.h>

#include "fvprep/sst/SSTBatch.hh"
#include "fvprep/sst/SSTSnapshot.hh"
#include "fvprep/mesh/Domain.hh"
#include "fvprep/util/Logger.hh"
#include "fvprep/util/calendar.hh"
#include "fvprep/util/error_handling.hh"
#include "fvprep/util/fvprep_utilities.hh"

namespace fvprep {
namespace sst {

namespace {

//! Ranks `0, ..., size - 1` of a communicator, used to process files in parallel.
class WorkerPool {
public:
  WorkerPool(MPI_Comm com, int pool_size)
    : m_pool(MPI_COMM_NULL), m_size(0) {
    int rank = 0, size = 0;
    MPI_Comm_rank(com, &rank);
    MPI_Comm_size(com, &size);

    m_size = (pool_size <= 0 or pool_size > size) ? size : pool_size;

    int color = rank < m_size ? 0 : MPI_UNDEFINED;
    int err = MPI_Comm_split(com, color, rank, &m_pool);
    FVPREP_C_CHK(err, MPI_SUCCESS, "MPI_Comm_split");
  }

  ~WorkerPool() {
    if (m_pool != MPI_COMM_NULL) {
      MPI_Comm_free(&m_pool);
    }
  }

  //! True if the calling rank is a worker.
  bool member() const {
    return m_pool != MPI_COMM_NULL;
  }

  //! Rank within the pool (equal to the rank in the parent communicator).
  int rank() const {
    int result = -1;
    if (member()) {
      MPI_Comm_rank(m_pool, &result);
    }
    return result;
  }

  int size() const {
    return m_size;
  }

  //! Rank processing the task number `task`.
  int owner(unsigned int task) const {
    return task % m_size;
  }
private:
  MPI_Comm m_pool;
  int m_size;

  WorkerPool(const WorkerPool &);
  WorkerPool & operator=(const WorkerPool &);
};

//! Outcome of processing one file.
enum Status {SUCCESS = 0, FAILURE = 1};

struct Outcome {
  Outcome() : status(SUCCESS) {}

  int status;
  std::string message;
  Snapshot snapshot;
};

std::string describe(const RuntimeError &e) {
  std::string result = e.what();
  for (const auto &c : e.context()) {
    result += "; while " + c;
  }
  return result;
}

Outcome process(const std::string &filename, const Domain &domain,
                InterpolationType type, units::System::Ptr sys) {
  Outcome result;
  try {
    result.snapshot = read_snapshot(filename, domain.lon(), domain.lat(), type, sys);
  } catch (RuntimeError &e) {
    result.status  = FAILURE;
    result.message = describe(e);
  } catch (std::exception &e) {
    result.status  = FAILURE;
    result.message = e.what();
  }
  return result;
}

std::string year_directory(const std::string &sst_dir, int year) {
  return sst_dir + "/" + fvprep::printf("%d", year);
}

enum DiscoveryStatus {DISCOVERY_OK = 0, DISCOVERY_CONFIGURATION = 1, DISCOVERY_DATA = 2,
                      DISCOVERY_OTHER = 3};

std::vector<std::string> discover(const std::string &sst_dir, int year) {
  if (year < 1) {
    throw RuntimeError::formatted(FVPREP_ERROR_LOCATION, "invalid year: %d", year);
  }

  auto previous_dir = year_directory(sst_dir, year - 1);
  auto current_dir  = year_directory(sst_dir, year);
  auto next_dir     = year_directory(sst_dir, year + 1);

  auto previous = list_directory(previous_dir);
  auto current  = list_directory(current_dir);
  auto next     = list_directory(next_dir);

  if (previous.empty()) {
    throw ConfigurationError::formatted(FVPREP_ERROR_LOCATION,
                                        "no SST files in '%s' (year %d needs the last"
                                        " snapshot of the previous year)",
                                        previous_dir.c_str(), year);
  }

  if (next.empty()) {
    throw ConfigurationError::formatted(FVPREP_ERROR_LOCATION,
                                        "no SST files in '%s' (year %d needs the first"
                                        " snapshot of the next year)",
                                        next_dir.c_str(), year);
  }

  if (current.empty()) {
    throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, current_dir,
                                     "no SST snapshots in '%s'", current_dir.c_str());
  }

  std::vector<std::string> result;
  result.push_back(previous.back());
  result.insert(result.end(), current.begin(), current.end());
  result.push_back(next.front());

  return result;
}

} // end of anonymous namespace

std::vector<std::string> list_directory(const std::string &directory) {
  DIR *dir = opendir(directory.c_str());
  if (dir == NULL) {
    throw ConfigurationError::formatted(FVPREP_ERROR_LOCATION,
                                        "SST directory '%s' does not exist or cannot be read",
                                        directory.c_str());
  }

  std::vector<std::string> result;
  struct dirent *entry = NULL;
  while ((entry = readdir(dir)) != NULL) {
    std::string name = entry->d_name;

    if (name.empty() or starts_with(name, ".")) {
      continue;
    }

    std::string path = directory + "/" + name;

    struct stat info;
    if (stat(path.c_str(), &info) == 0 and S_ISREG(info.st_mode)) {
      result.push_back(path);
    }
  }
  closedir(dir);

  std::sort(result.begin(), result.end());

  return result;
}

struct SSTBatch::Impl {
  Impl(MPI_Comm c, std::shared_ptr<const Domain> d, const SSTOptions &o,
       const Logger &l, units::System::Ptr s)
    : com(c), domain(d), options(o), log(l), sys(s), state(COLLECTING_FILES) {
    // empty
  }

  MPI_Comm com;
  std::shared_ptr<const Domain> domain;
  SSTOptions options;
  const Logger &log;
  units::System::Ptr sys;

  State state;
  std::vector<std::string> files;
  std::vector<Result> results;
  SSTSeries series;
};

SSTBatch::SSTBatch(MPI_Comm com, std::shared_ptr<const Domain> domain,
                   const SSTOptions &options, const Logger &log,
                   units::System::Ptr unit_system)
  : m_impl(new Impl(com, domain, options, log, unit_system)) {

  if (not domain) {
    delete m_impl;
    throw RuntimeError(FVPREP_ERROR_LOCATION, "SSTBatch requires a mesh");
  }
}

SSTBatch::~SSTBatch() {
  delete m_impl;
}

SSTBatch::State SSTBatch::state() const {
  return m_impl->state;
}

const std::vector<std::string>& SSTBatch::files() const {
  return m_impl->files;
}

const std::vector<SSTBatch::Result>& SSTBatch::results() const {
  return m_impl->results;
}

const SSTSeries& SSTBatch::series() const {
  return m_impl->series;
}

void SSTBatch::expect(State state, const char *operation) const {
  if (m_impl->state != state) {
    const char *names[] = {"collecting files", "interpolating", "aligning",
                           "writing", "closed", "failed"};
    throw RuntimeError::formatted(FVPREP_ERROR_LOCATION,
                                  "cannot %s: the SST batch is in the '%s' state"
                                  " (expected '%s')",
                                  operation, names[m_impl->state], names[state]);
  }
}

const std::vector<std::string>& SSTBatch::collect_files(const std::string &sst_dir, int year) {
  expect(COLLECTING_FILES, "collect files");

  int rank = 0;
  MPI_Comm_rank(m_impl->com, &rank);

  std::vector<std::string> files;
  int status = DISCOVERY_OK;
  std::string message, location;

  if (rank == 0) {
    try {
      files = discover(sst_dir, year);
    } catch (ConfigurationError &e) {
      status  = DISCOVERY_CONFIGURATION;
      message = e.what();
    } catch (DataSourceError &e) {
      status   = DISCOVERY_DATA;
      message  = e.what();
      location = e.filenames().empty() ? "" : e.filenames()[0];
    } catch (RuntimeError &e) {
      status  = DISCOVERY_OTHER;
      message = e.what();
    } catch (std::exception &e) {
      status  = DISCOVERY_OTHER;
      message = e.what();
    }
  }

  MPI_Bcast(&status, 1, MPI_INT, 0, m_impl->com);
  broadcast(m_impl->com, 0, message);
  broadcast(m_impl->com, 0, location);

  if (status != DISCOVERY_OK) {
    m_impl->state = FAILED;

    if (status == DISCOVERY_CONFIGURATION) {
      throw ConfigurationError(FVPREP_ERROR_LOCATION, message);
    }
    if (status == DISCOVERY_DATA) {
      throw DataSourceError(FVPREP_ERROR_LOCATION, {location}, message);
    }
    throw RuntimeError(FVPREP_ERROR_LOCATION, message);
  }

  unsigned int n_files = files.size();
  MPI_Bcast(&n_files, 1, MPI_UNSIGNED, 0, m_impl->com);
  files.resize(n_files);
  for (auto &f : files) {
    broadcast(m_impl->com, 0, f);
  }

  m_impl->files = files;
  m_impl->state = INTERPOLATING;

  m_impl->log.message(2, "* Found %d SST files for %d in '%s'\n",
                      (int)n_files, year, sst_dir.c_str());
  for (const auto &f : files) {
    m_impl->log.message(3, "  %s\n", f.c_str());
  }

  return m_impl->files;
}

void SSTBatch::interpolate_serial(std::vector<Result> &results,
                                  std::vector<std::string> &failures) {
  const auto &files = m_impl->files;

  for (unsigned int k = 0; k < files.size(); ++k) {
    auto outcome = process(files[k], *m_impl->domain, m_impl->options.interpolation,
                           m_impl->sys);

    if (outcome.status == SUCCESS) {
      Result r;
      r.index    = k;
      r.filename = files[k];
      r.times    = outcome.snapshot.times;
      r.values   = outcome.snapshot.values;
      results.push_back(r);
    } else {
      failures.push_back(files[k] + ": " + outcome.message);
    }

    m_impl->log.message(3, ".");
  }
}

void SSTBatch::interpolate_parallel(std::vector<Result> &results,
                                    std::vector<std::string> &failures) {
  const auto &files = m_impl->files;
  const unsigned int N = files.size();

  WorkerPool pool(m_impl->com, m_impl->options.pool_size);

  m_impl->log.message(3, "  using %d worker rank(s)\n", pool.size());

  // process files assigned to this rank
  std::vector<Outcome> local(N);
  if (pool.member()) {
    for (unsigned int k = pool.rank(); k < N; k += pool.size()) {
      local[k] = process(files[k], *m_impl->domain, m_impl->options.interpolation,
                         m_impl->sys);
    }
  }

  // collect results in the input order
  for (unsigned int k = 0; k < N; ++k) {
    int owner = pool.owner(k);

    Outcome &outcome = local[k];
    MPI_Bcast(&outcome.status, 1, MPI_INT, owner, m_impl->com);

    if (outcome.status == SUCCESS) {
      broadcast(m_impl->com, owner, outcome.snapshot.times);
      broadcast(m_impl->com, owner, outcome.snapshot.values);

      Result r;
      r.index    = k;
      r.filename = files[k];
      r.times    = outcome.snapshot.times;
      r.values   = outcome.snapshot.values;
      results.push_back(r);
    } else {
      broadcast(m_impl->com, owner, outcome.message);
      failures.push_back(files[k] + ": " + outcome.message);
    }

    m_impl->log.message(3, ".");
  }
}

void SSTBatch::interpolate() {
  expect(INTERPOLATING, "interpolate");

  const auto &files = m_impl->files;

  m_impl->log.message(3, "To do:\n%s\n", std::string(files.size(), '|').c_str());

  std::vector<Result> results;
  std::vector<std::string> failures;

  try {
    if (m_impl->options.serial) {
      interpolate_serial(results, failures);
    } else {
      interpolate_parallel(results, failures);
    }
  } catch (...) {
    m_impl->state = FAILED;
    m_impl->results = results;
    throw;
  }

  m_impl->log.message(3, "\n");

  m_impl->results = results;

  if (not failures.empty()) {
    m_impl->state = FAILED;

    std::vector<std::string> failed_files;
    for (const auto &f : files) {
      bool succeeded = false;
      for (const auto &r : results) {
        if (r.filename == f) {
          succeeded = true;
          break;
        }
      }
      if (not succeeded) {
        failed_files.push_back(f);
      }
    }

    m_impl->log.error("FVPREP ERROR: failed to process %d of %d SST files\n",
                      (int)failures.size(), (int)files.size());

    throw DataSourceError(FVPREP_ERROR_LOCATION, failed_files,
                          fvprep::printf("failed to process %d SST file(s):\n",
                                         (int)failures.size()) +
                          join(failures, "\n"));
  }

  m_impl->state = ALIGNING;
}

const SSTSeries& SSTBatch::align() {
  expect(ALIGNING, "align time stamps");

  SSTSeries result;
  std::string previous_file;

  try {
    for (const auto &r : m_impl->results) {
      if (r.times.empty()) {
        throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, r.filename,
                                         "'%s' has no time stamps", r.filename.c_str());
      }

      double t = r.times[0] + midday_offset;

      if (not result.times.empty() and not (t > result.times.back())) {
        auto current  = calendar::format_iso(m_impl->sys, t);
        auto previous = calendar::format_iso(m_impl->sys, result.times.back());
        throw DataSourceError::formatted(FVPREP_ERROR_LOCATION, r.filename,
                                         "time stamps are not increasing: '%s' (%s) follows"
                                         " '%s' (%s)",
                                         r.filename.c_str(), current.c_str(),
                                         previous_file.c_str(), previous.c_str());
      }

      result.times.push_back(t);
      result.values.push_back(r.values);
      previous_file = r.filename;
    }
  } catch (RuntimeError &e) {
    m_impl->state = FAILED;
    e.add_context("aligning SST time stamps");
    throw;
  }

  m_impl->series = result;
  m_impl->state  = WRITING;

  return m_impl->series;
}

void SSTBatch::write(const std::string &filename, const ForcingFileOptions &options) {
  expect(WRITING, "write the SST forcing file");

  try {
    write_sstgrd(m_impl->com, filename, *m_impl->domain, m_impl->series, m_impl->sys,
                 options, m_impl->log);
  } catch (...) {
    m_impl->state = FAILED;
    throw;
  }

  m_impl->state = CLOSED;
}

SSTSeries interp_sst_assimilation(MPI_Comm com, std::shared_ptr<const Domain> domain,
                                  const std::string &sst_dir, int year,
                                  const SSTOptions &options, const Logger &log) {
  auto sys = std::make_shared<units::System>();

  SSTBatch batch(com, domain, options, log, sys);

  batch.collect_files(sst_dir, year);
  batch.interpolate();

  return batch.align();
}

} // end of namespace sst
} // end of namespace fvprep
