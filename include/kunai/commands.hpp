#pragma once

#include <kunai/add.hpp>
#include <kunai/edit.hpp>
#include <kunai/git.hpp>
#include <kunai/prefetch.hpp>
#include <kunai/reconcile.hpp>
#include <kunai/result.hpp>

#include <string>
#include <vector>

namespace kunai {

// What a lockfile command operates on. The collaborators are only used by
// the commands that talk to remotes (add, update).
struct CommandContext {
    std::string source_file;
    RefLister& refs;
    ArtifactHasher& hasher;
};

// Each command loads the lockfile, runs one engine and persists the result.
// Nothing is written when the engine fails.

// Create an empty lockfile; refuses to overwrite an existing one
Status run_init(const std::string& source_file);

// Returns the name the source was added under
Result<std::string> run_add(const CommandContext& ctx, const AddOptions& options);

// The lockfile is rewritten only when some source changed
Result<UpdateReport> run_update(const CommandContext& ctx, const UpdateOptions& options);

Status run_delete(const std::string& source_file, const std::vector<std::string>& names);

Status run_edit(const std::string& source_file, const std::string& name,
                EditKey key, const std::string& value);

} // namespace kunai
