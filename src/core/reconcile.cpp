#include <kunai/reconcile.hpp>
#include <kunai/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>

namespace kunai {

const char* outcome_name(UpdateOutcome outcome) {
    switch (outcome) {
        case UpdateOutcome::VersionUpdated: return "updated";
        case UpdateOutcome::HashUpdated:    return "hash updated";
        case UpdateOutcome::PinChanged:     return "pin changed";
        case UpdateOutcome::UpToDate:       return "up to date";
        case UpdateOutcome::Skipped:        return "skipped";
        case UpdateOutcome::Failed:         return "failed";
    }
    return "unknown";
}

std::string UpdateReport::summary() const {
    return std::to_string(updated) + " updated, " +
           std::to_string(up_to_date) + " up to date, " +
           std::to_string(skipped) + " skipped, " +
           std::to_string(errors) + " failed";
}

std::string UpdateReport::diff_json() const {
    nlohmann::ordered_json doc = nlohmann::ordered_json::object();
    for (const auto& [name, diff] : diffs) {
        doc[name] = {{"old", diff.old_version}, {"new", diff.new_version}};
    }
    return doc.dump(2);
}

static KunaiError for_source(const std::string& name, KunaiError e) {
    e.message = "source '" + name + "': " + e.message;
    return e;
}

// Hash errors that mean the whole batch is unreliable
static bool is_systemic_hash_error(const KunaiError& e) {
    return e.code == KunaiError::Spawn || e.code == KunaiError::MalformedResponse;
}

// ---------------------------------------------------------------------------
// run()
// ---------------------------------------------------------------------------

Result<UpdateReport> Reconciler::run(SourceMap& map, const UpdateOptions& options) {
    if (options.pin && options.unpin) {
        return KunaiError{KunaiError::InvalidArg,
            "--pin and --unpin are mutually exclusive"};
    }

    std::vector<std::string> missing;
    for (const auto& name : options.names) {
        if (!map.find(name)) missing.push_back(name);
    }
    if (!missing.empty()) {
        std::string list;
        for (const auto& n : missing) {
            if (!list.empty()) list += ", ";
            list += "'" + n + "'";
        }
        return KunaiError{KunaiError::NotFound,
            "no source named " + list + " in the source file"};
    }

    // Work on a copy so an aborted run leaves the caller's map untouched
    SourceMap working = map;
    UpdateReport report;

    for (auto& [name, source] : working.sources) {
        if (!options.names.empty() &&
            std::find(options.names.begin(), options.names.end(), name) ==
                options.names.end()) {
            continue;
        }

        const Source before = source;
        log::SourceScope scope(name);
        auto outcome = reconcile_source(name, source, options, report);
        if (outcome.is_err()) {
            log::error("aborting update; no changes were written");
            return std::move(outcome).error();
        }

        report.outcomes[name] = outcome.value();
        switch (outcome.value()) {
            case UpdateOutcome::VersionUpdated:
            case UpdateOutcome::HashUpdated:
            case UpdateOutcome::PinChanged:
                ++report.updated;
                break;
            case UpdateOutcome::UpToDate:
                ++report.up_to_date;
                break;
            case UpdateOutcome::Skipped:
                ++report.skipped;
                break;
            case UpdateOutcome::Failed:
                ++report.errors;
                break;
        }

        if (source != before) report.changed = true;
    }

    if (report.changed) map = std::move(working);
    return Result<UpdateReport>::ok(std::move(report));
}

// ---------------------------------------------------------------------------
// reconcile_source()
// ---------------------------------------------------------------------------

Result<UpdateOutcome> Reconciler::reconcile_source(const std::string& name,
                                                   Source& source,
                                                   const UpdateOptions& options,
                                                   UpdateReport& report) {
    // Pinning is exclusive with version resolution in one invocation
    if (options.pin || options.unpin) {
        bool want = options.pin;
        if (source.pinned == want) {
            log::debug("already %s", want ? "pinned" : "unpinned");
            return Result<UpdateOutcome>::ok(UpdateOutcome::UpToDate);
        }
        source.pinned = want;
        log::info("%s", want ? "pinned" : "unpinned");
        return Result<UpdateOutcome>::ok(UpdateOutcome::PinChanged);
    }

    if (source.pinned && !options.force) {
        log::debug("pinned, skipping");
        return Result<UpdateOutcome>::ok(UpdateOutcome::Skipped);
    }

    auto candidate = resolver_.latest_version(source);
    if (candidate.is_err()) {
        if (is_recoverable_resolve_error(candidate.error())) {
            log::error("%s", candidate.error().message.c_str());
            report.failures.push_back({name, std::move(candidate).error()});
            return Result<UpdateOutcome>::ok(UpdateOutcome::Failed);
        }
        return for_source(name, std::move(candidate).error());
    }
    const std::string& latest = candidate.value();

    if (!is_static(source.update_scheme) && !options.refetch &&
        source.latest_checked_version == latest) {
        log::debug("%s is up to date", latest.c_str());
        return Result<UpdateOutcome>::ok(UpdateOutcome::UpToDate);
    }

    auto url = source.full_url(latest);
    if (url.is_err()) return for_source(name, std::move(url).error());

    log::debug("prefetching %s", url.value().str().c_str());
    auto hash = hasher_.fetch_hash(url.value(), source.unpack);
    if (hash.is_err()) {
        const KunaiError& e = hash.error();
        if (is_systemic_hash_error(e)) {
            return for_source(name, std::move(hash).error());
        }
        if (e.code == KunaiError::PrefetchFailed) {
            // Remember the unusable candidate so it is not retried every run
            source.latest_checked_version = latest;
        }
        log::error("%s", e.message.c_str());
        report.failures.push_back({name, std::move(hash).error()});
        return Result<UpdateOutcome>::ok(UpdateOutcome::Failed);
    }

    const std::string old_version = source.version;
    const bool version_changed = source.version != latest;
    const bool hash_changed = source.hash != hash.value();

    source.latest_checked_version = latest;

    if (version_changed) {
        source.version = latest;
        source.hash = std::move(hash).value();
        report.diffs[name] = VersionDiff{old_version, latest};
        log::info("%s -> %s", old_version.c_str(), latest.c_str());
        return Result<UpdateOutcome>::ok(UpdateOutcome::VersionUpdated);
    }

    if (hash_changed) {
        source.hash = std::move(hash).value();
        report.diffs[name] = VersionDiff{old_version, latest};
        log::info("hash of %s changed", latest.c_str());
        return Result<UpdateOutcome>::ok(UpdateOutcome::HashUpdated);
    }

    log::debug("%s is up to date", latest.c_str());
    return Result<UpdateOutcome>::ok(UpdateOutcome::UpToDate);
}

} // namespace kunai
