#pragma once

#include <kunai/git.hpp>
#include <kunai/prefetch.hpp>
#include <kunai/result.hpp>
#include <kunai/source.hpp>
#include <kunai/updater.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace kunai {

struct UpdateOptions {
    std::vector<std::string> names;   // empty = every source
    bool refetch = false;             // ignore latestCheckedVersion
    bool force = false;               // update pinned sources too
    bool pin = false;                 // only set pinned = true
    bool unpin = false;               // only set pinned = false
};

struct VersionDiff {
    std::string old_version;
    std::string new_version;
};

enum class UpdateOutcome {
    VersionUpdated,
    HashUpdated,
    PinChanged,
    UpToDate,
    Skipped,          // pinned
    Failed            // recoverable error, isolated to the source
};

const char* outcome_name(UpdateOutcome outcome);

struct SourceFailure {
    std::string name;
    KunaiError error;
};

struct UpdateReport {
    std::size_t updated = 0;
    std::size_t up_to_date = 0;
    std::size_t skipped = 0;
    std::size_t errors = 0;
    bool changed = false;             // some field of some source differs

    std::map<std::string, UpdateOutcome> outcomes;
    std::map<std::string, VersionDiff> diffs;   // version and hash-only updates
    std::vector<SourceFailure> failures;

    // "2 updated, 5 up to date, 1 skipped, 0 failed"
    std::string summary() const;

    // {"name": {"old": "...", "new": "..."}, ...}
    std::string diff_json() const;
};

// Batch reconciliation of a SourceMap against the remote state.
//
// Per-source recoverable errors are recorded in the report and the run goes
// on. Systemic errors (a collaborator that cannot be run or answers outside
// its contract, a broken artifact URL template, failed ref listing) abort the
// run: the error is returned and the caller's map is left exactly as it was.
class Reconciler {
public:
    Reconciler(RefLister& refs, ArtifactHasher& hasher)
        : resolver_(refs), hasher_(hasher) {}

    Result<UpdateReport> run(SourceMap& map, const UpdateOptions& options);

private:
    Result<UpdateOutcome> reconcile_source(const std::string& name, Source& source,
                                           const UpdateOptions& options,
                                           UpdateReport& report);

    VersionResolver resolver_;
    ArtifactHasher& hasher_;
};

} // namespace kunai
