#include <kunai/commands.hpp>
#include <kunai/log.hpp>

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace kunai {

Status run_init(const std::string& source_file) {
    std::error_code ec;
    if (fs::exists(source_file, ec)) {
        return KunaiError{KunaiError::IO,
            "lockfile already exists: " + source_file,
            "delete it first or pass a different --source-file"};
    }
    if (ec) {
        return KunaiError{KunaiError::IO,
            "cannot check " + source_file + ": " + ec.message()};
    }

    KUNAI_TRY(SourceMap{}.save(source_file));
    log::info("created %s", source_file.c_str());
    return ok_status();
}

Result<std::string> run_add(const CommandContext& ctx, const AddOptions& options) {
    auto map = SourceMap::load(ctx.source_file);
    if (map.is_err()) return std::move(map).error();

    auto name = add_source(map.value(), options, ctx.refs, ctx.hasher);
    if (name.is_err()) return name;

    KUNAI_TRY(map.value().save(ctx.source_file));

    const Source* added = map.value().find(name.value());
    log::info("added '%s' at version %s", name.value().c_str(),
              added ? added->version.c_str() : "?");
    return name;
}

Result<UpdateReport> run_update(const CommandContext& ctx, const UpdateOptions& options) {
    auto map = SourceMap::load(ctx.source_file);
    if (map.is_err()) return std::move(map).error();

    Reconciler reconciler(ctx.refs, ctx.hasher);
    auto report = reconciler.run(map.value(), options);
    if (report.is_err()) return report;

    if (report.value().changed) {
        KUNAI_TRY(map.value().save(ctx.source_file));
        log::debug("wrote %s", ctx.source_file.c_str());
    } else {
        log::debug("%s unchanged", ctx.source_file.c_str());
    }

    log::info("%s", report.value().summary().c_str());
    return report;
}

Status run_delete(const std::string& source_file, const std::vector<std::string>& names) {
    auto map = SourceMap::load(source_file);
    if (map.is_err()) return std::move(map).error();

    KUNAI_TRY(remove_sources(map.value(), names));
    KUNAI_TRY(map.value().save(source_file));

    for (const auto& name : names) {
        log::info("deleted '%s'", name.c_str());
    }
    return ok_status();
}

Status run_edit(const std::string& source_file, const std::string& name,
                EditKey key, const std::string& value) {
    auto map = SourceMap::load(source_file);
    if (map.is_err()) return std::move(map).error();

    KUNAI_TRY(edit_source(map.value(), name, key, value));
    KUNAI_TRY(map.value().save(source_file));

    log::info("set %s of '%s'", edit_key_name(key), name.c_str());
    if (affects_hash(key)) {
        log::warn("the stored hash of '%s' may no longer match its artifact; "
                  "run `kunai update --refetch %s`",
                  name.c_str(), name.c_str());
    }
    return ok_status();
}

} // namespace kunai
